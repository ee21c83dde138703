/**
 * @file dsn.cpp
 * @brief MySQL data source name parsing implementation
 */

#include "mysql/dsn.h"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "utils/string_utils.h"

namespace binlogsync::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr uint16_t kDefaultPort = 3306;
constexpr const char* kDefaultHost = "127.0.0.1";

utils::Expected<void, utils::Error> ParseParams(std::string_view query, Dsn& dsn) {
  if (query.empty()) {
    return {};
  }
  for (const auto& pair : utils::Split(query, '&')) {
    if (pair.empty()) {
      continue;
    }
    size_t eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "invalid DSN parameter: " + pair));
    }
    auto value = utils::PercentDecode(std::string_view(pair).substr(eq + 1));
    if (!value) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "invalid escape in DSN parameter: " + pair));
    }
    dsn.params.emplace_back(pair.substr(0, eq), std::move(*value));
  }
  return {};
}

}  // namespace

utils::Expected<Dsn, utils::Error> Dsn::Parse(std::string_view text) {
  Dsn dsn;

  // The database separator is the last '/', since passwords may contain '/'
  size_t slash = text.rfind('/');
  if (slash == std::string_view::npos) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMySQLInvalidDsn, "invalid DSN: missing the slash separating the database name"));
  }

  std::string_view head = text.substr(0, slash);
  std::string_view tail = text.substr(slash + 1);

  // Credentials end at the last '@' before the address
  size_t at = head.rfind('@');
  std::string_view net_part = head;
  if (at != std::string_view::npos) {
    std::string_view credentials = head.substr(0, at);
    net_part = head.substr(at + 1);
    size_t colon = credentials.find(':');
    if (colon == std::string_view::npos) {
      dsn.user = std::string(credentials);
    } else {
      dsn.user = std::string(credentials.substr(0, colon));
      dsn.password = std::string(credentials.substr(colon + 1));
    }
  }

  if (!net_part.empty()) {
    size_t open = net_part.find('(');
    if (open == std::string_view::npos) {
      dsn.protocol = std::string(net_part);
    } else {
      if (net_part.back() != ')') {
        return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn,
                                        "invalid DSN: network address not terminated (missing closing brace)"));
      }
      dsn.protocol = std::string(net_part.substr(0, open));
      dsn.address = std::string(net_part.substr(open + 1, net_part.size() - open - 2));
    }
  }
  if (dsn.protocol != "tcp" && dsn.protocol != "unix") {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "unsupported DSN protocol: " + dsn.protocol));
  }
  if (dsn.address.empty()) {
    dsn.address = dsn.protocol == "unix" ? "/tmp/mysql.sock" : std::string(kDefaultHost) + ":3306";
  }

  size_t question = tail.find('?');
  std::string_view db_part = tail.substr(0, question);
  auto database = utils::PercentDecode(db_part);
  if (!database) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "invalid escape in DSN database name"));
  }
  dsn.database = std::move(*database);

  if (question != std::string_view::npos) {
    if (auto parsed = ParseParams(tail.substr(question + 1), dsn); !parsed) {
      return MakeUnexpected(parsed.error());
    }
  }

  if (dsn.protocol == "tcp" && dsn.address.find(':') != std::string::npos) {
    std::string_view port = std::string_view(dsn.address).substr(dsn.address.rfind(':') + 1);
    auto value = utils::ParseUint64(port);
    if (!value || *value == 0 || *value > std::numeric_limits<uint16_t>::max()) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "invalid port in DSN address: " + dsn.address));
    }
  }

  return dsn;
}

std::string Dsn::Format() const {
  std::string out;
  if (!user.empty() || !password.empty()) {
    out += user;
    if (!password.empty()) {
      out += ":" + password;
    }
    out += "@";
  }
  out += protocol;
  if (!address.empty()) {
    out += "(" + address + ")";
  }
  out += "/" + utils::PercentEncode(database);

  char separator = '?';
  for (const auto& [name, value] : params) {
    out += separator;
    out += name + "=" + utils::PercentEncode(value);
    separator = '&';
  }
  return out;
}

std::optional<std::string> Dsn::TakeParam(std::string_view name) {
  for (auto it = params.begin(); it != params.end(); ++it) {
    if (it->first == name) {
      std::string value = std::move(it->second);
      params.erase(it);
      return value;
    }
  }
  return std::nullopt;
}

std::optional<std::string> Dsn::GetParam(std::string_view name) const {
  for (const auto& [key, value] : params) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::string Dsn::Host() const {
  if (IsUnixSocket()) {
    return "localhost";
  }
  size_t colon = address.rfind(':');
  std::string host = colon == std::string::npos ? address : address.substr(0, colon);
  // Bracketed IPv6 literal
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return host.empty() ? kDefaultHost : host;
}

uint16_t Dsn::Port() const {
  if (IsUnixSocket()) {
    return 0;
  }
  size_t colon = address.rfind(':');
  if (colon == std::string::npos || address.back() == ']') {
    return kDefaultPort;
  }
  auto value = utils::ParseUint64(std::string_view(address).substr(colon + 1));
  if (!value || *value > std::numeric_limits<uint16_t>::max()) {
    return kDefaultPort;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<std::chrono::milliseconds> ParseDuration(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (text == "0") {
    return std::chrono::milliseconds(0);
  }

  double total_ms = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t start = pos;
    while (pos < text.size() && ((text[pos] >= '0' && text[pos] <= '9') || text[pos] == '.')) {
      ++pos;
    }
    if (start == pos) {
      return std::nullopt;
    }
    double number = 0;
    try {
      number = std::stod(std::string(text.substr(start, pos - start)));
    } catch (const std::exception&) {
      return std::nullopt;
    }

    size_t unit_start = pos;
    while (pos < text.size() && !((text[pos] >= '0' && text[pos] <= '9') || text[pos] == '.')) {
      ++pos;
    }
    std::string_view unit = text.substr(unit_start, pos - unit_start);
    // NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)
    if (unit == "ms") {
      total_ms += number;
    } else if (unit == "s") {
      total_ms += number * 1000;
    } else if (unit == "m") {
      total_ms += number * 60 * 1000;
    } else if (unit == "h") {
      total_ms += number * 3600 * 1000;
    } else if (unit == "us" || unit == "µs") {
      total_ms += number / 1000;
    } else if (unit == "ns") {
      total_ms += number / 1000000;
    } else {
      return std::nullopt;
    }
    // NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)
  }
  return std::chrono::milliseconds(static_cast<int64_t>(total_ms));
}

}  // namespace binlogsync::mysql
