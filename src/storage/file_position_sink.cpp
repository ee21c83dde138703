/**
 * @file file_position_sink.cpp
 * @brief File-backed position sink
 */

#include "storage/file_position_sink.h"

#include <spdlog/spdlog.h>

#include <cstdio>  // for std::rename
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "utils/structured_log.h"

namespace binlogsync::storage {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

FilePositionSink::FilePositionSink(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

utils::Expected<std::filesystem::path, utils::Error> FilePositionSink::PathFor(const std::string& key) const {
  if (key.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Position sink key must not be empty"));
  }
  std::filesystem::path relative(key);
  if (relative.is_absolute()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Position sink key must be relative", key));
  }
  for (const auto& part : relative) {
    if (part == "..") {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Position sink key must not contain '..'", key));
    }
  }
  return base_dir_ / relative;
}

utils::Expected<void, utils::Error> FilePositionSink::Set(const std::string& key, const std::string& value) {
  if (value.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Cannot persist an empty value", key));
  }
  auto target = PathFor(key);
  if (!target) {
    return MakeUnexpected(target.error());
  }

  std::scoped_lock lock(mutex_);
  const std::filesystem::path& path = *target;
  std::filesystem::path temp_path = path;
  temp_path += ".tmp";

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      utils::LogStorageError("create_directories", path.parent_path().string(), ec.message());
      return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError, "Failed to create directory: " + ec.message(),
                                      path.parent_path().string()));
    }
  }

  {
    std::ofstream temp_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!temp_file.is_open()) {
      utils::LogStorageError("open", temp_path.string(), "cannot open for writing");
      return MakeUnexpected(
          MakeError(ErrorCode::kStorageWriteError, "Failed to open temporary file", temp_path.string()));
    }
    temp_file.write(value.data(), static_cast<std::streamsize>(value.size()));
    temp_file.flush();
    if (!temp_file.good()) {
      temp_file.close();
      std::filesystem::remove(temp_path, ec);
      utils::LogStorageError("write", temp_path.string(), "short write");
      return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError, "Failed to write temporary file",
                                      temp_path.string()));
    }
  }

  if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
    std::filesystem::remove(temp_path, ec);
    utils::LogStorageError("rename", path.string(), "rename from temporary file failed");
    return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError, "Failed to rename temporary file", path.string()));
  }

  spdlog::debug("Persisted {} ({} bytes)", key, value.size());
  return {};
}

utils::Expected<std::optional<std::string>, utils::Error> FilePositionSink::Get(const std::string& key) {
  auto target = PathFor(key);
  if (!target) {
    return MakeUnexpected(target.error());
  }

  std::scoped_lock lock(mutex_);
  std::error_code ec;
  if (!std::filesystem::exists(*target, ec)) {
    if (ec) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "Failed to stat: " + ec.message(),
                                      target->string()));
    }
    return std::optional<std::string>{};
  }

  std::ifstream file(*target, std::ios::binary);
  if (!file.is_open()) {
    utils::LogStorageError("open", target->string(), "cannot open for reading");
    return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "Failed to open file", target->string()));
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "Failed to read file", target->string()));
  }
  return std::optional<std::string>(contents.str());
}

}  // namespace binlogsync::storage
