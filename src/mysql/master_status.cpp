/**
 * @file master_status.cpp
 * @brief Replication coordinates encoding
 */

#include "mysql/master_status.h"

#include "utils/constants.h"
#include "utils/string_utils.h"

namespace binlogsync::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

void MasterStatus::WriteTo(std::string& out) const {
  out += file;
  out += ';';
  out += std::to_string(position);
  if (!executed_gtid_set.empty()) {
    out += ';';
    out += executed_gtid_set;
  }
}

std::string MasterStatus::ToString() const {
  std::string out;
  WriteTo(out);
  return out;
}

utils::Expected<MasterStatus, utils::Error> MasterStatus::Parse(std::string_view text) {
  std::string trimmed = utils::Trim(text);
  if (trimmed.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageInvalidFormat, "empty master status"));
  }

  size_t first = trimmed.find(';');
  if (first == std::string::npos || first == 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageInvalidFormat, "master status must be 'file;position': " + trimmed));
  }

  MasterStatus status;
  status.file = trimmed.substr(0, first);

  size_t second = trimmed.find(';', first + 1);
  std::string_view position_text = std::string_view(trimmed).substr(
      first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
  auto position = utils::ParseUint64(position_text);
  if (!position) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageInvalidFormat, "invalid binlog position: " + std::string(position_text)));
  }
  if (*position < constants::kMinBinlogPosition) {
    return MakeUnexpected(MakeError(ErrorCode::kOutOfRange,
                                    "binlog position must be at least 4, got " + std::to_string(*position)));
  }
  status.position = *position;

  if (second != std::string::npos) {
    status.executed_gtid_set = trimmed.substr(second + 1);
  }
  return status;
}

}  // namespace binlogsync::mysql
