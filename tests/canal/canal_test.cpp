/**
 * @file canal_test.cpp
 * @brief Replication client tests against an in-memory server and stream
 */

#include "canal/canal.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <thread>
#include <vector>

#include "fake_replication.h"

using namespace binlogsync::canal;
using namespace binlogsync::canal::testing;
using binlogsync::mysql::BinlogStreamConfig;
using binlogsync::mysql::ColumnType;
using binlogsync::mysql::Dsn;
using binlogsync::mysql::Flavor;
using binlogsync::mysql::MasterStatus;
using binlogsync::mysql::RowsEventKind;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr const char* kDsn = "root:secret@tcp(127.0.0.1:3306)/shop";

Expected<void, Error> Ok() {
  return {};
}

}  // namespace

class CanalTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_->AddTable(MakeUsersSchema());
    users_map_ = MakeTableMap(42, "shop", "users", {ColumnType::LONG, ColumnType::VARCHAR});
  }

  CanalOptions Options() {
    CanalOptions options;
    options.database = db_;
    options.stream_factory = [this](const BinlogStreamConfig& config)
        -> Expected<std::unique_ptr<binlogsync::mysql::IBinlogStream>, Error> {
      stream_config_ = config;
      return std::unique_ptr<binlogsync::mysql::IBinlogStream>(std::make_unique<FakeStream>(stream_));
    };
    options.position_sink = sink_;
    options.save_interval = std::chrono::milliseconds(0);
    options.clock = FakeClock::Bind(clock_);
    return options;
  }

  std::unique_ptr<Canal> CreateCanal(const std::string& dsn = kDsn) { return CreateCanal(dsn, Options()); }

  std::unique_ptr<Canal> CreateCanal(const std::string& dsn, CanalOptions options) {
    auto canal = Canal::Create(dsn, std::move(options));
    if (!canal) {
      ADD_FAILURE() << canal.error().to_string();
      return nullptr;
    }
    return std::move(*canal);
  }

  std::shared_ptr<RecordingHandler> AddRecorder(Canal& canal, const std::string& name) {
    auto handler = std::make_shared<RecordingHandler>(name, journal_mutex_, journal_);
    EXPECT_TRUE(canal.RegisterRowsEventHandler(handler));
    return handler;
  }

  std::vector<RecordedCall> Journal() {
    std::scoped_lock lock(*journal_mutex_);
    return *journal_;
  }

  std::shared_ptr<FakeDatabaseClient> db_ = std::make_shared<FakeDatabaseClient>();
  std::shared_ptr<FakeStreamState> stream_ = std::make_shared<FakeStreamState>();
  std::shared_ptr<MemorySink> sink_ = std::make_shared<MemorySink>();
  std::shared_ptr<FakeClock> clock_ = std::make_shared<FakeClock>();
  std::optional<BinlogStreamConfig> stream_config_;
  std::shared_ptr<const binlogsync::mysql::TableMapEvent> users_map_;
  std::shared_ptr<std::mutex> journal_mutex_ = std::make_shared<std::mutex>();
  std::shared_ptr<RecordingHandler::Journal> journal_ = std::make_shared<RecordingHandler::Journal>();
};

// Setup

TEST_F(CanalTest, CreateStartsFromServerStatus) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);

  EXPECT_EQ(canal->State(), CanalState::kConnected);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 154, ""}));
  EXPECT_EQ(stream_->OpenedAt(), (MasterStatus{"bin.000001", 154, ""}));
  EXPECT_EQ(canal->Database(), "shop");
  EXPECT_EQ(db_->MasterStatusCalls(), 1);
  ASSERT_TRUE(stream_config_.has_value());
  EXPECT_EQ(stream_config_->server_id, 100u);
  EXPECT_EQ(stream_config_->host, "127.0.0.1");
  EXPECT_EQ(stream_config_->port, 3306);
  EXPECT_EQ(stream_config_->user, "root");
  EXPECT_EQ(stream_config_->password, "secret");
}

TEST_F(CanalTest, DsnReplicationParametersAreConsumed) {
  auto canal = CreateCanal("root:secret@tcp(127.0.0.1:3306)/mydb?BinlogSlaveId=101&BinlogStartFile=bin.000005");
  ASSERT_NE(canal, nullptr);

  EXPECT_EQ(canal->Params().slave_id, 101u);
  EXPECT_EQ(canal->ConnectorDsn().find("BinlogSlaveId"), std::string::npos);
  EXPECT_EQ(canal->ConnectorDsn().find("BinlogStartFile"), std::string::npos);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000005", 4, ""}));
  EXPECT_EQ(db_->MasterStatusCalls(), 0);
  ASSERT_TRUE(stream_config_.has_value());
  EXPECT_EQ(stream_config_->server_id, 101u);
}

TEST_F(CanalTest, ConnectorDsnKeepsOrdinaryParameters) {
  CanalOptions options = Options();
  options.database.reset();
  std::string factory_dsn;
  options.database_factory = [this, &factory_dsn](const std::string& dsn, size_t /*pool_size*/)
      -> Expected<std::shared_ptr<binlogsync::mysql::DatabaseClient>, Error> {
    factory_dsn = dsn;
    return std::shared_ptr<binlogsync::mysql::DatabaseClient>(db_);
  };

  auto canal = CreateCanal("root@tcp(db:3306)/shop?timeout=5s&BinlogStartPosition=900&flavor=MariaDB", options);
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(factory_dsn, "root@tcp(db:3306)/shop?timeout=5s");
  EXPECT_EQ(canal->ConnectorDsn(), factory_dsn);
  EXPECT_EQ(canal->Params().flavor, Flavor::kMariaDB);
  EXPECT_EQ(stream_config_->flavor, Flavor::kMariaDB);
  EXPECT_EQ(stream_config_->connect_timeout, 5u);
}

TEST_F(CanalTest, StartPositionWithoutFileOverridesOffset) {
  auto canal = CreateCanal("root@tcp(127.0.0.1:3306)/shop?BinlogStartPosition=1000");
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 1000, ""}));
}

TEST_F(CanalTest, StartPositionBelowHeaderIsIgnored) {
  auto canal = CreateCanal("root@tcp(127.0.0.1:3306)/shop?BinlogStartFile=bin.000003&BinlogStartPosition=2");
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000003", 4, ""}));
}

TEST_F(CanalTest, InvalidSlaveIdIsRejected) {
  for (const char* dsn : {"root@tcp(h:3306)/shop?BinlogSlaveId=0", "root@tcp(h:3306)/shop?BinlogSlaveId=abc",
                          "root@tcp(h:3306)/shop?BinlogSlaveId=4294967296"}) {
    auto canal = Canal::Create(dsn, Options());
    ASSERT_FALSE(canal) << dsn;
    EXPECT_EQ(canal.error().code(), ErrorCode::kInvalidArgument) << dsn;
  }
}

TEST_F(CanalTest, MalformedDsnIsInvalidArgument) {
  auto canal = Canal::Create("root@tcp(localhost:3306", Options());
  ASSERT_FALSE(canal);
  EXPECT_EQ(canal.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(CanalTest, PingFailureIsConnectionFailure) {
  db_->SetPingError(MakeError(ErrorCode::kMySQLDisconnected, "server has gone away"));
  auto canal = Canal::Create(kDsn, Options());
  ASSERT_FALSE(canal);
  EXPECT_EQ(canal.error().code(), ErrorCode::kMySQLConnectionFailed);
  EXPECT_EQ(stream_->OpenCount(), 0);
}

TEST_F(CanalTest, RequiresRowBasedLogging) {
  db_->SetVariable("binlog_format", "STATEMENT");
  auto canal = Canal::Create(kDsn, Options());
  ASSERT_FALSE(canal);
  EXPECT_EQ(canal.error().code(), ErrorCode::kNotSupported);

  db_->SetVariable("binlog_format", "row");
  EXPECT_TRUE(Canal::Create(kDsn, Options()));
}

TEST_F(CanalTest, RowImageCheck) {
  db_->SetVariable("binlog_row_image", "MINIMAL");
  CanalOptions options = Options();
  options.check_row_image = "FULL";
  auto mismatch = Canal::Create(kDsn, options);
  ASSERT_FALSE(mismatch);
  EXPECT_EQ(mismatch.error().code(), ErrorCode::kNotSupported);

  options = Options();
  options.check_row_image = "minimal";
  EXPECT_TRUE(Canal::Create(kDsn, options));

  // Servers that predate binlog_row_image report nothing
  db_->SetVariable("binlog_row_image", "");
  options = Options();
  options.check_row_image = "FULL";
  EXPECT_TRUE(Canal::Create(kDsn, options));
}

TEST_F(CanalTest, RowImageCheckSkippedForMariaDb) {
  db_->SetVariable("binlog_row_image", "MINIMAL");
  auto canal = CreateCanal("root@tcp(127.0.0.1:3306)/shop?flavor=mariadb");
  ASSERT_NE(canal, nullptr);
  EXPECT_TRUE(canal->CheckBinlogRowImage("FULL"));
}

TEST_F(CanalTest, StreamOpenFailureIsReturned) {
  stream_->open_error = MakeError(ErrorCode::kMySQLReplicationError, "Could not find first log file name");
  auto canal = Canal::Create(kDsn, Options());
  ASSERT_FALSE(canal);
  EXPECT_EQ(canal.error().code(), ErrorCode::kMySQLReplicationError);
}

TEST_F(CanalTest, ResumesFromPersistedPosition) {
  ASSERT_TRUE(sink_->Set(kPositionKey, "bin.000009;777"));
  CanalOptions options = Options();
  options.resume_from_sink = true;

  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000009", 777, ""}));
  EXPECT_EQ(db_->MasterStatusCalls(), 0);
}

TEST_F(CanalTest, PersistedPositionIgnoredUnlessRequested) {
  ASSERT_TRUE(sink_->Set(kPositionKey, "bin.000009;777"));
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 154, ""}));
}

TEST_F(CanalTest, ExplicitStartFileWinsOverPersistedPosition) {
  ASSERT_TRUE(sink_->Set(kPositionKey, "bin.000009;777"));
  CanalOptions options = Options();
  options.resume_from_sink = true;
  auto canal = CreateCanal("root@tcp(127.0.0.1:3306)/shop?BinlogStartFile=bin.000002&BinlogStartPosition=120", options);
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000002", 120, ""}));
}

TEST_F(CanalTest, CorruptPersistedPositionFallsBackToServer) {
  ASSERT_TRUE(sink_->Set(kPositionKey, "not-a-position"));
  CanalOptions options = Options();
  options.resume_from_sink = true;
  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 154, ""}));
}

// Lifecycle

TEST_F(CanalTest, StartTwiceIsRejected) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());
  EXPECT_EQ(canal->State(), CanalState::kStreaming);
  EXPECT_TRUE(canal->IsRunning());

  auto again = canal->Start();
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().code(), ErrorCode::kAlreadyExists);
  EXPECT_TRUE(canal->Close());
}

TEST_F(CanalTest, StartAfterCloseIsCancelled) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(canal->State(), CanalState::kClosed);

  auto started = canal->Start();
  ASSERT_FALSE(started);
  EXPECT_EQ(started.error().code(), ErrorCode::kCancelled);
}

TEST_F(CanalTest, ConcurrentCloseIsSafe) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());
  ASSERT_TRUE(stream_->WaitIdle());

  std::vector<std::future<bool>> closers;
  for (int i = 0; i < 4; ++i) {
    closers.push_back(std::async(std::launch::async, [&canal]() { return static_cast<bool>(canal->Close()); }));
  }
  for (auto& closer : closers) {
    EXPECT_TRUE(closer.get());
  }
  EXPECT_EQ(canal->State(), CanalState::kClosed);
  EXPECT_FALSE(canal->IsRunning());
  EXPECT_FALSE(canal->TerminationError().has_value());
  EXPECT_EQ(stream_->CloseCount(), 1);
  EXPECT_TRUE(canal->Close());
  EXPECT_EQ(stream_->CloseCount(), 1);
}

TEST_F(CanalTest, CloseLeavesSharedDatabaseOpen) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(db_->CloseCalls(), 0);
}

TEST_F(CanalTest, CloseReleasesOwnedDatabase) {
  CanalOptions options = Options();
  options.database.reset();
  options.database_factory = [this](const std::string& /*dsn*/, size_t pool_size)
      -> Expected<std::shared_ptr<binlogsync::mysql::DatabaseClient>, Error> {
    EXPECT_EQ(pool_size, 4u);
    return std::shared_ptr<binlogsync::mysql::DatabaseClient>(db_);
  };
  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(db_->CloseCalls(), 1);
}

TEST_F(CanalTest, FailedCreateReleasesOwnedDatabase) {
  db_->SetVariable("binlog_format", "MIXED");
  CanalOptions options = Options();
  options.database.reset();
  options.database_factory = [this](const std::string& /*dsn*/, size_t /*pool_size*/)
      -> Expected<std::shared_ptr<binlogsync::mysql::DatabaseClient>, Error> {
    return std::shared_ptr<binlogsync::mysql::DatabaseClient>(db_);
  };
  ASSERT_FALSE(Canal::Create(kDsn, options));
  EXPECT_EQ(db_->CloseCalls(), 1);
}

TEST_F(CanalTest, CloseFlushesThrottledPosition) {
  CanalOptions options = Options();
  options.save_interval = std::chrono::milliseconds(60000);
  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeXidEvent(1, 300));
  stream_->Push(MakeXidEvent(2, 400));
  ASSERT_TRUE(stream_->WaitIdle());
  EXPECT_EQ(sink_->WriteCount(), 1u);

  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(sink_->History().back(), "bin.000001;400");
}

// Event handling

TEST_F(CanalTest, HandlersRunInRegistrationOrder) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "first");
  AddRecorder(*canal, "second");
  EXPECT_EQ(canal->HandlerCount(), 2u);
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("1"), std::string("alice")}}, 300));
  stream_->Push(MakeXidEvent(9, 331));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 4u);
  EXPECT_EQ(journal[0].handler, "first");
  EXPECT_EQ(journal[0].action, "insert");
  EXPECT_EQ(journal[0].table, "shop.users");
  EXPECT_EQ(journal[1].handler, "second");
  EXPECT_EQ(journal[1].action, "insert");
  EXPECT_EQ(journal[2].handler, "first");
  EXPECT_EQ(journal[2].action, "complete");
  EXPECT_EQ(journal[3].handler, "second");
  EXPECT_EQ(journal[3].action, "complete");
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 331, ""}));
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, RowActionsMapFromEventKinds) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  Row before = {std::string("1"), std::string("alice")};
  Row after = {std::string("1"), std::string("alicia")};
  stream_->Push(MakeRowsEvent(RowsEventKind::kUpdate, users_map_, {before, after}, 300));
  stream_->Push(MakeRowsEvent(RowsEventKind::kDelete, users_map_, {after}, 350));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 2u);
  EXPECT_EQ(journal[0].action, "update");
  ASSERT_EQ(journal[0].rows.size(), 2u);
  EXPECT_EQ(journal[0].rows[1][1], "alicia");
  EXPECT_EQ(journal[1].action, "delete");
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, UnsignedColumnsAreReinterpreted) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("-1"), std::nullopt}}, 300));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 1u);
  EXPECT_EQ(journal[0].rows[0][0], "4294967295");
  EXPECT_FALSE(journal[0].rows[0][1].has_value());
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, HandlerErrorHaltsWithoutAdvancing) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  auto failing = AddRecorder(*canal, "failing");
  failing->FailWith(MakeError(ErrorCode::kIOError, "downstream unavailable"));
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeXidEvent(1, 250));
  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("1"), std::string("a")}}, 300));
  stream_->Push(MakeXidEvent(2, 331));

  ASSERT_TRUE(canal->WaitForTermination(std::chrono::milliseconds(2000)));
  EXPECT_FALSE(canal->IsRunning());
  auto error = canal->TerminationError();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), ErrorCode::kIOError);
  EXPECT_EQ(error->context(), "handler=failing stage=insert");
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 250, ""}));

  // The worker closes the session on its way out
  EXPECT_EQ(canal->State(), CanalState::kClosed);
  EXPECT_EQ(stream_->CloseCount(), 1);
  EXPECT_EQ(sink_->History().back(), "bin.000001;250");
  auto restarted = canal->Start();
  ASSERT_FALSE(restarted);
  EXPECT_EQ(restarted.error().code(), ErrorCode::kCancelled);

  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(stream_->CloseCount(), 1);
}

TEST_F(CanalTest, StreamFailureClosesSession) {
  CanalOptions options = Options();
  options.database.reset();
  options.database_factory = [this](const std::string& /*dsn*/, size_t /*pool_size*/)
      -> Expected<std::shared_ptr<binlogsync::mysql::DatabaseClient>, Error> {
    return std::shared_ptr<binlogsync::mysql::DatabaseClient>(db_);
  };
  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());

  stream_->PushError(MakeError(ErrorCode::kMySQLDisconnected, "Lost connection to MySQL server"));
  ASSERT_TRUE(canal->WaitForTermination(std::chrono::milliseconds(2000)));
  auto error = canal->TerminationError();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), ErrorCode::kMySQLDisconnected);
  EXPECT_EQ(canal->State(), CanalState::kClosed);
  EXPECT_EQ(stream_->CloseCount(), 1);
  EXPECT_EQ(db_->CloseCalls(), 1);

  auto restarted = canal->Start();
  ASSERT_FALSE(restarted);
  EXPECT_EQ(restarted.error().code(), ErrorCode::kCancelled);
  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(stream_->CloseCount(), 1);
  EXPECT_EQ(db_->CloseCalls(), 1);
}

TEST_F(CanalTest, HandlerMayCloseTheCanal) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  auto closer = std::make_shared<NiceMock<MockRowsEventHandler>>();
  ON_CALL(*closer, Name()).WillByDefault(Return("closer"));
  Canal* raw = canal.get();
  std::optional<bool> closed_in_handler;
  EXPECT_CALL(*closer, Do(RowsAction::kInsert, _, _))
      .WillOnce(::testing::Invoke([raw, &closed_in_handler](RowsAction /*action*/,
                                                            const binlogsync::mysql::TableSchema& /*table*/,
                                                            const std::vector<Row>& /*rows*/) {
        closed_in_handler = static_cast<bool>(raw->Close());
        return Ok();
      }));
  EXPECT_CALL(*closer, Complete()).Times(0);
  ASSERT_TRUE(canal->RegisterRowsEventHandler(closer));
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("1"), std::string("a")}}, 300));
  stream_->Push(MakeXidEvent(1, 331));

  ASSERT_TRUE(canal->WaitForTermination(std::chrono::milliseconds(2000)));
  ASSERT_TRUE(closed_in_handler.has_value());
  EXPECT_TRUE(*closed_in_handler);
  EXPECT_FALSE(canal->TerminationError().has_value());
  EXPECT_EQ(canal->State(), CanalState::kClosed);
  EXPECT_EQ(canal->SyncedPosition().position, 300u);
  EXPECT_EQ(stream_->CloseCount(), 1);

  ASSERT_TRUE(canal->Close());
  EXPECT_EQ(stream_->CloseCount(), 1);
}

TEST_F(CanalTest, FailureInsideTransactionResumesAtTransactionStart) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  auto flaky = std::make_shared<NiceMock<MockRowsEventHandler>>();
  ON_CALL(*flaky, Name()).WillByDefault(Return("flaky"));
  EXPECT_CALL(*flaky, Do(RowsAction::kInsert, _, _))
      .WillOnce(Return(Ok()))
      .WillOnce(Return(Expected<void, Error>(
          MakeUnexpected(MakeError(ErrorCode::kIOError, "downstream unavailable")))));
  ASSERT_TRUE(canal->RegisterRowsEventHandler(flaky));
  ASSERT_TRUE(canal->Start());

  auto first = MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("1"), std::string("a")}}, 380);
  auto second = MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("2"), std::string("b")}}, 440);
  stream_->Push(MakeXidEvent(1, 250));
  stream_->Push(MakeQueryEvent("shop", "BEGIN", 320));
  stream_->Push(first);
  stream_->Push(second);

  ASSERT_TRUE(canal->WaitForTermination(std::chrono::milliseconds(2000)));
  ASSERT_TRUE(canal->TerminationError().has_value());
  EXPECT_EQ(canal->SyncedPosition().position, 380u);
  EXPECT_EQ(sink_->History().back(), "bin.000001;250");
  canal.reset();
  EXPECT_EQ(sink_->History().back(), "bin.000001;250");

  // The next session starts before BEGIN, so the table map comes again
  CanalOptions options = Options();
  options.resume_from_sink = true;
  auto resumed = CreateCanal(kDsn, options);
  ASSERT_NE(resumed, nullptr);
  EXPECT_EQ(stream_->OpenedAt(), (MasterStatus{"bin.000001", 250, ""}));
  AddRecorder(*resumed, "recorder");
  ASSERT_TRUE(resumed->Start());

  stream_->Push(MakeQueryEvent("shop", "BEGIN", 320));
  stream_->Push(first);
  stream_->Push(second);
  stream_->Push(MakeXidEvent(2, 471));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 3u);
  EXPECT_EQ(journal[0].rows[0][0], "1");
  EXPECT_EQ(journal[1].rows[0][0], "2");
  EXPECT_EQ(journal[2].action, "complete");
  EXPECT_EQ(sink_->History().back(), "bin.000001;471");
  ASSERT_TRUE(resumed->Close());
}

TEST_F(CanalTest, PositionNeverMovesBackwardsWithinFile) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeQueryEvent("shop", "BEGIN", 200));
  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("1"), std::string("a")}}, 260));
  stream_->Push(MakeXidEvent(1, 291));
  stream_->Push(MakeHeartbeatEvent(0));
  stream_->Push(MakeQueryEvent("shop", "BEGIN", 356));
  stream_->Push(MakeXidEvent(2, 387));
  ASSERT_TRUE(stream_->WaitIdle());

  // Events inside BEGIN...XID only move the in-memory position
  auto history = sink_->History();
  ASSERT_EQ(history.size(), 2u);
  uint64_t last = 0;
  for (const auto& entry : history) {
    auto parsed = MasterStatus::Parse(entry);
    ASSERT_TRUE(parsed) << entry;
    EXPECT_EQ(parsed->file, "bin.000001");
    EXPECT_GE(parsed->position, last);
    last = parsed->position;
  }
  EXPECT_EQ(last, 387u);
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, HeartbeatDoesNotMovePosition) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeHeartbeatEvent(99999));
  ASSERT_TRUE(stream_->WaitIdle());
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000001", 154, ""}));
  EXPECT_EQ(sink_->WriteCount(), 0u);
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, RotateSwitchesFile) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeXidEvent(1, 9000));
  stream_->Push(MakeRotateEvent("bin.000002", 4, 9047));
  ASSERT_TRUE(stream_->WaitIdle());
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000002", 4, ""}));

  stream_->Push(MakeXidEvent(2, 219));
  ASSERT_TRUE(stream_->WaitIdle());
  EXPECT_EQ(canal->SyncedPosition(), (MasterStatus{"bin.000002", 219, ""}));
  EXPECT_EQ(sink_->History().back(), "bin.000002;219");
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, PositionSavesAreThrottled) {
  CanalOptions options = Options();
  options.save_interval = std::chrono::milliseconds(1000);
  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeXidEvent(1, 200));
  stream_->Push(MakeXidEvent(2, 300));
  stream_->Push(MakeXidEvent(3, 400));
  ASSERT_TRUE(stream_->WaitIdle());
  EXPECT_EQ(sink_->WriteCount(), 1u);
  EXPECT_EQ(canal->SyncedPosition().position, 400u);

  clock_->Advance(std::chrono::milliseconds(1000));
  stream_->Push(MakeXidEvent(4, 500));
  ASSERT_TRUE(stream_->WaitIdle());
  EXPECT_EQ(sink_->WriteCount(), 2u);
  EXPECT_EQ(sink_->History().back(), "bin.000001;500");
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, CommitQueryCompletesTransaction) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeQueryEvent("shop", "BEGIN", 200));
  stream_->Push(MakeQueryEvent("shop", " commit ", 260));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 1u);
  EXPECT_EQ(journal[0].action, "complete");
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, OtherSchemasAreSkippedButAdvancePosition) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  auto other = MakeTableMap(77, "billing", "invoices", {ColumnType::LONG});
  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, other, {{std::string("5")}}, 480));
  ASSERT_TRUE(stream_->WaitIdle());

  EXPECT_TRUE(Journal().empty());
  EXPECT_EQ(db_->LoadCalls(), 0);
  EXPECT_EQ(canal->SyncedPosition().position, 480u);
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, OtherSchemasAreQualifiedWhenIncluded) {
  db_->AddTable(MakeUsersSchema("archive"));
  CanalOptions options = Options();
  options.include_schema_only = false;
  auto canal = CreateCanal(kDsn, options);
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  auto archive = MakeTableMap(43, "archive", "users", {ColumnType::LONG, ColumnType::VARCHAR});
  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, archive, {{std::string("2"), std::string("bob")}}, 500));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 1u);
  EXPECT_EQ(journal[0].table, "archive.users");
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, WithoutDatabaseEveryTableIsQualified) {
  auto canal = CreateCanal("root:secret@tcp(127.0.0.1:3306)/");
  ASSERT_NE(canal, nullptr);
  EXPECT_EQ(canal->Database(), "");
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, users_map_, {{std::string("1"), std::string("alice")}}, 300));
  ASSERT_TRUE(stream_->WaitIdle());

  auto journal = Journal();
  ASSERT_EQ(journal.size(), 1u);
  EXPECT_EQ(journal[0].table, "shop.users");
  EXPECT_TRUE(canal->FindTable("shop.users"));
  EXPECT_EQ(db_->LoadCalls(), 1);

  auto unqualified = canal->FindTable("users");
  ASSERT_FALSE(unqualified);
  EXPECT_EQ(unqualified.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(db_->LoadCalls(), 1);
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, UnresolvableTableIsDropped) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  AddRecorder(*canal, "recorder");
  ASSERT_TRUE(canal->Start());

  auto ghost = MakeTableMap(90, "shop", "ghost", {ColumnType::LONG});
  stream_->Push(MakeRowsEvent(RowsEventKind::kWrite, ghost, {{std::string("1")}}, 610));
  stream_->Push(MakeXidEvent(1, 641));
  ASSERT_TRUE(stream_->WaitIdle());

  EXPECT_TRUE(canal->IsRunning());
  auto journal = Journal();
  ASSERT_EQ(journal.size(), 1u);
  EXPECT_EQ(journal[0].action, "complete");
  EXPECT_EQ(canal->SyncedPosition().position, 641u);
  ASSERT_TRUE(canal->Close());
}

// Table metadata

TEST_F(CanalTest, ConcurrentLookupsShareOneLoad) {
  db_->SetLoadDelay(std::chrono::milliseconds(100));
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);

  std::vector<std::future<Expected<TablePtr, Error>>> lookups;
  for (int i = 0; i < 8; ++i) {
    lookups.push_back(std::async(std::launch::async, [&canal]() { return canal->FindTable("users"); }));
  }
  TablePtr first;
  for (auto& lookup : lookups) {
    auto table = lookup.get();
    ASSERT_TRUE(table) << table.error().to_string();
    EXPECT_EQ((*table)->name, "users");
    if (!first) {
      first = *table;
    }
    EXPECT_EQ(table->get(), first.get());
  }
  EXPECT_EQ(db_->LoadCalls(), 1);
}

TEST_F(CanalTest, FindTableAcceptsQualifiedNames) {
  db_->AddTable(MakeUsersSchema("archive"));
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);

  auto local = canal->FindTable("users");
  ASSERT_TRUE(local);
  EXPECT_EQ((*local)->schema, "shop");
  auto qualified = canal->FindTable("archive.users");
  ASSERT_TRUE(qualified);
  EXPECT_EQ((*qualified)->schema, "archive");

  auto missing = canal->FindTable("nope");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kMySQLTableNotFound);
}

TEST_F(CanalTest, AlterTableInvalidatesCache) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->FindTable("users"));
  ASSERT_TRUE(canal->FindTable("users"));
  EXPECT_EQ(db_->LoadCalls(), 1);
  ASSERT_TRUE(canal->Start());

  stream_->Push(MakeQueryEvent("shop", "ALTER TABLE users ADD COLUMN age INT", 700));
  ASSERT_TRUE(stream_->WaitIdle());

  ASSERT_TRUE(canal->FindTable("users"));
  EXPECT_EQ(db_->LoadCalls(), 2);
  EXPECT_EQ(canal->SyncedPosition().position, 700u);

  stream_->Push(MakeQueryEvent("", "ALTER TABLE `shop`.`users` ADD COLUMN x INT", 760));
  ASSERT_TRUE(stream_->WaitIdle());
  ASSERT_TRUE(canal->FindTable("users"));
  EXPECT_EQ(db_->LoadCalls(), 3);
  ASSERT_TRUE(canal->Close());
}

TEST_F(CanalTest, ManualCacheClearing) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);
  ASSERT_TRUE(canal->FindTable("users"));
  canal->ClearTableCache("users");
  ASSERT_TRUE(canal->FindTable("users"));
  canal->ClearAllTableCache();
  ASSERT_TRUE(canal->FindTable("users"));
  EXPECT_EQ(db_->LoadCalls(), 3);
}

TEST_F(CanalTest, MatchAlterTable) {
  auto canal = CreateCanal();
  ASSERT_NE(canal, nullptr);

  auto plain = canal->MatchAlterTable("ALTER TABLE users ADD x INT");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->schema, "");
  EXPECT_EQ(plain->table, "users");

  auto quoted = canal->MatchAlterTable("alter table `shop`.`orders` drop column note");
  ASSERT_TRUE(quoted.has_value());
  EXPECT_EQ(quoted->schema, "shop");
  EXPECT_EQ(quoted->table, "orders");

  auto dotted = canal->MatchAlterTable("ALTER TABLE billing.invoices RENAME COLUMN a TO b");
  ASSERT_TRUE(dotted.has_value());
  EXPECT_EQ(dotted->schema, "billing");
  EXPECT_EQ(dotted->table, "invoices");

  EXPECT_FALSE(canal->MatchAlterTable("CREATE TABLE t (id INT)").has_value());
  EXPECT_FALSE(canal->MatchAlterTable("INSERT INTO users VALUES (1)").has_value());
}

TEST(ExtractReplicationParamsTest, DefaultsWhenAbsent) {
  auto dsn = Dsn::Parse("root@tcp(h:3306)/shop?charset=utf8mb4");
  ASSERT_TRUE(dsn);
  auto params = ExtractReplicationParams(*dsn);
  ASSERT_TRUE(params);
  EXPECT_FALSE(params->start_file.has_value());
  EXPECT_FALSE(params->start_position.has_value());
  EXPECT_EQ(params->slave_id, 100u);
  EXPECT_EQ(params->flavor, Flavor::kMySQL);
  EXPECT_EQ(dsn->params.size(), 1u);
}

TEST(ExtractReplicationParamsTest, UnknownFlavorFallsBackToMySql) {
  auto dsn = Dsn::Parse("root@tcp(h:3306)/shop?flavor=percona&BinlogStartFile=");
  ASSERT_TRUE(dsn);
  auto params = ExtractReplicationParams(*dsn);
  ASSERT_TRUE(params);
  EXPECT_EQ(params->flavor, Flavor::kMySQL);
  EXPECT_FALSE(params->start_file.has_value());
  EXPECT_TRUE(dsn->params.empty());
}
