/**
 * @file structured_log.h
 * @brief Structured logging on top of spdlog
 *
 * Builds one-line events either as JSON objects or as "key=value" text,
 * so replication incidents can be grepped or shipped to a log pipeline
 * without changing call sites.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace binlogsync::utils {

/**
 * @brief Output format for structured events
 */
enum class LogFormat : uint8_t {
  JSON,
  TEXT,
};

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("binlog_error")
 *   .Field("type", "connection_lost")
 *   .Field("file", position.file)
 *   .Field("position", position.position)
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set the process-wide output format
   */
  static void SetFormat(LogFormat format) { FormatSlot().store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return FormatSlot().load(std::memory_order_relaxed); }

  /**
   * @brief Parse "json" or "text" (anything else selects TEXT)
   */
  static LogFormat ParseFormat(std::string_view value) { return value == "json" ? LogFormat::JSON : LogFormat::TEXT; }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddQuoted(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddQuoted(key, value); }

  StructuredLog& Field(const std::string& key, std::string_view value) { return AddQuoted(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    return AddRaw(key, oss.str());
  }

  StructuredLog& Field(const std::string& key, bool value) { return AddRaw(key, value ? "true" : "false"); }

  /**
   * @brief Human-readable message attached to the event
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Debug() { spdlog::debug("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Error() { spdlog::error("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the event in the current format
   */
  [[nodiscard]] std::string Build() const { return GetFormat() == LogFormat::JSON ? BuildJson() : BuildText(); }

 private:
  struct FieldEntry {
    std::string key;
    std::string value;
    bool quoted;
  };

  std::string event_;
  std::string message_;
  std::vector<FieldEntry> fields_;

  static std::atomic<LogFormat>& FormatSlot() {
    static std::atomic<LogFormat> format{LogFormat::JSON};
    return format;
  }

  StructuredLog& AddQuoted(const std::string& key, std::string value) {
    fields_.push_back({key, std::move(value), true});
    return *this;
  }

  StructuredLog& AddRaw(const std::string& key, std::string value) {
    fields_.push_back({key, std::move(value), false});
    return *this;
  }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";
    bool first = true;
    auto separator = [&]() {
      if (!first) {
        json << ",";
      }
      first = false;
    };

    if (!event_.empty()) {
      separator();
      json << R"("event":")" << Escape(event_) << R"(")";
    }
    if (!message_.empty()) {
      separator();
      json << R"("message":")" << Escape(message_) << R"(")";
    }
    for (const auto& field : fields_) {
      separator();
      json << "\"" << Escape(field.key) << "\":";
      if (field.quoted) {
        json << "\"" << Escape(field.value) << "\"";
      } else {
        json << field.value;
      }
    }
    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << (event_.empty() ? "event" : event_);
    for (const auto& field : fields_) {
      text << " " << field.key << "=";
      if (field.quoted && field.value.find_first_of(" \t\"=") != std::string::npos) {
        text << "\"" << Escape(field.value) << "\"";
      } else {
        text << field.value;
      }
    }
    if (!message_.empty()) {
      text << ": " << message_;
    }
    return text.str();
  }

  static std::string Escape(const std::string& str) {
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr) << std::dec;
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

inline void LogMySQLConnectionError(const std::string& host, int port, const std::string& error_msg) {
  StructuredLog()
      .Event("mysql_connection_error")
      .Field("host", host)
      .Field("port", static_cast<int64_t>(port))
      .Field("error", error_msg)
      .Error();
}

inline void LogMySQLQueryError(const std::string& query, const std::string& error_msg) {
  // Keep long information_schema queries from flooding the log
  constexpr size_t kMaxQueryLogLength = 200;

  StructuredLog()
      .Event("mysql_query_error")
      .Field("query", query.substr(0, kMaxQueryLogLength))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a replication stream failure with the position it happened at
 */
inline void LogBinlogError(const std::string& error_type, const std::string& file, uint64_t position,
                           const std::string& error_msg) {
  StructuredLog()
      .Event("binlog_error")
      .Field("type", error_type)
      .Field("file", file)
      .Field("position", position)
      .Field("error", error_msg)
      .Error();
}

inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

}  // namespace binlogsync::utils
