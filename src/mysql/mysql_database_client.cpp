/**
 * @file mysql_database_client.cpp
 * @brief DatabaseClient backed by a libmysqlclient connection pool
 */

#include "mysql/mysql_database_client.h"

#include <spdlog/spdlog.h>

#include <vector>

#include "mysql/dsn.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace binlogsync::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Column positions of a result set, looked up by name
 */
class ResultColumns {
 public:
  explicit ResultColumns(MYSQL_RES* result) {
    unsigned int count = mysql_num_fields(result);
    MYSQL_FIELD* fields = mysql_fetch_fields(result);
    names_.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
      names_.emplace_back(fields[i].name);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
  }

  [[nodiscard]] int Find(const std::string& name) const {
    for (size_t i = 0; i < names_.size(); ++i) {
      if (utils::EqualsIgnoreCase(names_[i], name)) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

 private:
  std::vector<std::string> names_;
};

std::string CellText(MYSQL_ROW row, int index) {
  if (index < 0 || row[index] == nullptr) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return {};
  }
  return row[index];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

}  // namespace

MySQLDatabaseClient::MySQLDatabaseClient(Connection::Config config, size_t pool_size)
    : pool_(std::move(config), pool_size) {}

MySQLDatabaseClient::~MySQLDatabaseClient() {
  pool_.Close();
}

utils::Expected<std::shared_ptr<DatabaseClient>, utils::Error> MySQLDatabaseClient::FromDsn(const std::string& dsn,
                                                                                            size_t pool_size) {
  auto parsed = Dsn::Parse(dsn);
  if (!parsed) {
    return MakeUnexpected(parsed.error());
  }
  auto config = Connection::ConfigFromDsn(*parsed);
  if (!config) {
    return MakeUnexpected(config.error());
  }
  return std::shared_ptr<DatabaseClient>(std::make_shared<MySQLDatabaseClient>(std::move(*config), pool_size));
}

utils::Expected<ConnectionPool::Lease, utils::Error> MySQLDatabaseClient::AcquireLease() {
  if (closed_.load()) {
    return MakeUnexpected(MakeError(ErrorCode::kCancelled, "database client is closed"));
  }
  return pool_.Acquire();
}

utils::Expected<MySQLResult, utils::Error> MySQLDatabaseClient::Query(ConnectionPool::Lease& lease,
                                                                      const std::string& query) {
  auto result = lease->Execute(query);
  if (!result && result.error().code() == ErrorCode::kMySQLDisconnected) {
    lease.MarkBroken();
  }
  return result;
}

utils::Expected<void, utils::Error> MySQLDatabaseClient::Ping() {
  auto lease = AcquireLease();
  if (!lease) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, lease.error().message(), "ping"));
  }
  auto pinged = (*lease)->Ping();
  if (!pinged) {
    lease->MarkBroken();
    return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, pinged.error().message(), "ping"));
  }
  return {};
}

utils::Expected<MasterStatus, utils::Error> MySQLDatabaseClient::GetMasterStatus() {
  auto lease = AcquireLease();
  if (!lease) {
    return MakeUnexpected(lease.error());
  }

  auto result = Query(*lease, "SHOW BINARY LOG STATUS");
  if (!result) {
    spdlog::debug("SHOW BINARY LOG STATUS failed, trying SHOW MASTER STATUS");
    result = Query(*lease, "SHOW MASTER STATUS");
  }
  if (!result) {
    return MakeUnexpected(result.error());
  }
  if (!*result) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError, "master status returned no result set"));
  }

  ResultColumns columns(result->get());
  MYSQL_ROW row = mysql_fetch_row(result->get());
  if (row == nullptr) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMySQLReplicationError, "master status is empty; is binary logging enabled?"));
  }

  MasterStatus status;
  status.file = CellText(row, columns.Find("File"));
  auto position = utils::ParseUint64(CellText(row, columns.Find("Position")));
  if (status.file.empty() || !position) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError, "master status lacks File/Position"));
  }
  status.position = *position;
  status.executed_gtid_set = CellText(row, columns.Find("Executed_Gtid_Set"));

  spdlog::debug("Server binlog position {}:{}", status.file, status.position);
  return status;
}

utils::Expected<std::string, utils::Error> MySQLDatabaseClient::GetGlobalVariable(const std::string& name) {
  auto lease = AcquireLease();
  if (!lease) {
    return MakeUnexpected(lease.error());
  }
  auto result = Query(*lease, "SHOW GLOBAL VARIABLES LIKE '" + utils::EscapeSqlString(name) + "'");
  if (!result) {
    return MakeUnexpected(result.error());
  }
  if (!*result) {
    return std::string();
  }
  MYSQL_ROW row = mysql_fetch_row(result->get());
  if (row == nullptr || mysql_num_fields(result->get()) < 2) {
    return std::string();
  }
  return CellText(row, 1);
}

utils::Expected<TableSchema, utils::Error> MySQLDatabaseClient::LoadTableSchema(const std::string& schema,
                                                                                const std::string& table) {
  auto lease = AcquireLease();
  if (!lease) {
    return MakeUnexpected(lease.error());
  }

  const std::string where =
      " WHERE TABLE_SCHEMA = '" + utils::EscapeSqlString(schema) + "' AND TABLE_NAME = '" +
      utils::EscapeSqlString(table) + "'";

  TableSchema result;
  result.schema = schema;
  result.name = table;

  {
    auto type_result = Query(*lease, "SELECT TABLE_TYPE FROM information_schema.TABLES" + where);
    if (!type_result) {
      return MakeUnexpected(type_result.error());
    }
    MYSQL_ROW row = *type_result ? mysql_fetch_row(type_result->get()) : nullptr;
    if (row == nullptr) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLTableNotFound, "table not found: " + schema + "." + table));
    }
    result.is_view = CellText(row, 0) == "VIEW";
  }

  {
    auto columns_result = Query(*lease,
                                "SELECT COLUMN_NAME, DATA_TYPE, COLUMN_TYPE, IS_NULLABLE, COLUMN_KEY, EXTRA, "
                                "ORDINAL_POSITION FROM information_schema.COLUMNS" +
                                    where + " ORDER BY ORDINAL_POSITION");
    if (!columns_result) {
      return MakeUnexpected(columns_result.error());
    }
    if (*columns_result) {
      MYSQL_ROW row = nullptr;
      while ((row = mysql_fetch_row(columns_result->get())) != nullptr) {
        ColumnInfo column;
        column.name = CellText(row, 0);
        column.data_type = utils::ToLower(CellText(row, 1));
        column.column_type = utils::ToLower(CellText(row, 2));
        column.nullable = CellText(row, 3) == "YES";
        column.key = CellText(row, 4);
        column.extra = CellText(row, 5);
        column.is_unsigned = column.column_type.find("unsigned") != std::string::npos;
        column.position = static_cast<uint32_t>(utils::ParseUint64(CellText(row, 6)).value_or(0));
        result.columns.push_back(std::move(column));
      }
    }
  }
  if (result.columns.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidSchema, "table has no columns: " + schema + "." + table));
  }

  const std::string show_create = std::string(result.is_view ? "SHOW CREATE VIEW " : "SHOW CREATE TABLE ") +
                                  utils::QuoteIdentifier(schema) + "." + utils::QuoteIdentifier(table);
  auto create_result = Query(*lease, show_create);
  if (create_result && *create_result) {
    MYSQL_ROW row = mysql_fetch_row(create_result->get());
    if (row != nullptr && mysql_num_fields(create_result->get()) >= 2) {
      result.create_statement = CellText(row, 1);
    }
  } else if (!create_result) {
    spdlog::debug("{} failed: {}", show_create, create_result.error().message());
  }

  utils::StructuredLog()
      .Event("table_schema_loaded")
      .Field("table", result.QualifiedName())
      .Field("columns", static_cast<uint64_t>(result.columns.size()))
      .Field("view", result.is_view)
      .Debug();
  return result;
}

utils::Expected<void, utils::Error> MySQLDatabaseClient::Execute(const std::string& statement) {
  auto lease = AcquireLease();
  if (!lease) {
    return MakeUnexpected(lease.error());
  }
  auto result = Query(*lease, statement);
  if (!result) {
    return MakeUnexpected(result.error());
  }
  return {};
}

utils::Expected<void, utils::Error> MySQLDatabaseClient::Close() {
  if (closed_.exchange(true)) {
    return {};
  }
  pool_.Close();
  spdlog::debug("MySQL database client closed");
  return {};
}

}  // namespace binlogsync::mysql
