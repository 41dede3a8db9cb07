#include "bta/table_admin.hpp"
#include <bta/detail/mocked_grpc_interceptor.hpp>

#include <gmock/gmock.h>

#include <functional>
#include <mutex>

namespace bta {
namespace detail {
struct base_completion_queue_test_only {
  /// Drop the callbacks of the operations the tests never completed, they hold the calls and the queue.
  static void discard_pending(base_completion_queue& q) {
    base_completion_queue::pending_ops_type pending;
    {
      std::lock_guard<std::mutex> lock(q.mu_);
      pending.swap(q.pending_ops_);
    }
    for (auto& kv : pending) {
      kv.second->callback = nullptr;
    }
  }
};
} // namespace detail
} // namespace bta

namespace {
using namespace std::chrono_literals;
using namespace bta::detail;
using completion_queue_type = bta::completion_queue<mocked_grpc_interceptor>;
using admin_type = bta::table_admin<completion_queue_type>;

/**
 * Capture the attempts made through a mocked completion queue.
 *
 * If @c server is set the attempts are completed as soon as they are posted, otherwise the tests complete them.
 */
class table_admin_test : public ::testing::Test {
protected:
  void SetUp() override {
    queue = std::make_shared<completion_queue_type>();
    using ::testing::_;
    using ::testing::Invoke;
    auto& mock = *queue->interceptor().shared_mock;
    EXPECT_CALL(mock, async_rpc(_)).WillRepeatedly(Invoke([this](std::shared_ptr<async_unary_op> op) {
      attempts.push_back(op);
      if (server) {
        server(op);
      }
    }));
    EXPECT_CALL(mock, make_deadline_timer(_)).WillRepeatedly(Invoke([this](std::shared_ptr<base_async_op> op) {
      auto timer = std::dynamic_pointer_cast<deadline_timer>(op);
      ASSERT_TRUE((bool)timer);
      timers.push_back(timer);
    }));
    EXPECT_CALL(mock, try_cancel(_)).WillRepeatedly(Invoke([this](std::shared_ptr<async_unary_op> op) {
      cancelled.push_back(op);
    }));
  }

  void TearDown() override {
    base_completion_queue_test_only::discard_pending(*queue);
  }

  admin_type make_admin() {
    auto retry = bta::retry_options(10ms, 100ms, 2.0, 3).with_jitter_fraction(0.0);
    return admin_type(
        queue, std::shared_ptr<grpc::GenericStub>(),
        bta::table_admin_options("test-project", "test-instance", retry, bta::call_metadata{{"x-goog-test", "1"}}));
  }

  template <typename Request>
  static Request request_of(std::shared_ptr<async_unary_op> const& op) {
    // ... deserializing consumes the buffer ...
    grpc::ByteBuffer copy(op->request);
    Request request;
    EXPECT_TRUE(grpc::SerializationTraits<Request>::Deserialize(&copy, &request).ok());
    return request;
  }

  template <typename Response>
  static void reply(std::shared_ptr<async_unary_op> const& op, Response const& response) {
    bool own = false;
    ASSERT_TRUE(grpc::SerializationTraits<Response>::Serialize(response, &op->response, &own).ok());
    op->status = grpc::Status::OK;
    op->callback(*op, true);
  }

  static void fail(std::shared_ptr<async_unary_op> const& op, grpc::StatusCode code) {
    op->status = grpc::Status(code, "injected failure");
    op->callback(*op, true);
  }

  static bta::admin::Table make_table(std::string const& id, std::vector<std::string> const& families) {
    bta::admin::Table table;
    table.set_name("projects/test-project/instances/test-instance/tables/" + id);
    for (auto const& f : families) {
      (*table.mutable_column_families())[f];
    }
    return table;
  }

  std::shared_ptr<completion_queue_type> queue;
  std::function<void(std::shared_ptr<async_unary_op>)> server;
  std::vector<std::shared_ptr<async_unary_op>> attempts;
  std::vector<std::shared_ptr<deadline_timer>> timers;
  std::vector<std::shared_ptr<async_unary_op>> cancelled;
};
} // anonymous namespace

/**
 * @test Verify that create_table() sends the right request, retries transient failures, and translates the response.
 */
TEST_F(table_admin_test, create_table) {
  auto admin = make_admin();
  auto f = admin.async_create_table(bta::table_spec{"t0", {{"fam", 2}}});
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/CreateTable");
  EXPECT_EQ(attempts[0]->attempt.metadata.count("x-goog-test"), 1UL);
  auto request = request_of<bta::admin::CreateTableRequest>(attempts[0]);
  EXPECT_EQ(request.parent(), "projects/test-project/instances/test-instance");
  EXPECT_EQ(request.table_id(), "t0");
  EXPECT_EQ(request.table().column_families().at("fam").gc_rule().max_num_versions(), 2);

  fail(attempts[0], grpc::StatusCode::UNAVAILABLE);
  ASSERT_EQ(timers.size(), 1UL);
  EXPECT_FALSE(f.is_ready());
  timers[0]->callback(*timers[0], true);
  ASSERT_EQ(attempts.size(), 2UL);
  // ... every attempt sends the same request ...
  EXPECT_EQ(request_of<bta::admin::CreateTableRequest>(attempts[1]).table_id(), "t0");

  reply(attempts[1], make_table("t0", {"fam"}));
  ASSERT_TRUE(f.is_ready());
  EXPECT_EQ(f.get(), (bta::table_info{"t0", {"fam"}}));
}

/**
 * @test Verify that get_table() and list_tables() translate the table names to ids.
 */
TEST_F(table_admin_test, get_and_list) {
  auto admin = make_admin();
  auto f = admin.async_get_table("t1");
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/GetTable");
  auto get = request_of<bta::admin::GetTableRequest>(attempts[0]);
  EXPECT_EQ(get.name(), "projects/test-project/instances/test-instance/tables/t1");
  reply(attempts[0], make_table("t1", {"b", "a"}));
  EXPECT_EQ(f.get(), (bta::table_info{"t1", {"a", "b"}}));

  auto g = admin.async_list_tables();
  ASSERT_EQ(attempts.size(), 2UL);
  EXPECT_EQ(attempts[1]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/ListTables");
  auto list = request_of<bta::admin::ListTablesRequest>(attempts[1]);
  EXPECT_EQ(list.parent(), "projects/test-project/instances/test-instance");
  bta::admin::ListTablesResponse response;
  *response.add_tables() = make_table("t1", {});
  *response.add_tables() = make_table("t2", {});
  reply(attempts[1], response);
  EXPECT_THAT(g.get(), ::testing::ElementsAre("t1", "t2"));
}

/**
 * @test Verify the operations that return no data, using the blocking variants.
 */
TEST_F(table_admin_test, blocking_operations) {
  auto admin = make_admin();
  server = [](std::shared_ptr<async_unary_op> op) { reply(op, google::protobuf::Empty()); };

  admin.delete_table("t0");
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/DeleteTable");
  EXPECT_EQ(
      request_of<bta::admin::DeleteTableRequest>(attempts[0]).name(),
      "projects/test-project/instances/test-instance/tables/t0");

  admin.drop_row_range("t0", "user/");
  ASSERT_EQ(attempts.size(), 2UL);
  EXPECT_EQ(attempts[1]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/DropRowRange");
  EXPECT_EQ(request_of<bta::admin::DropRowRangeRequest>(attempts[1]).row_key_prefix(), "user/");

  admin.drop_all_rows("t0");
  ASSERT_EQ(attempts.size(), 3UL);
  EXPECT_TRUE(request_of<bta::admin::DropRowRangeRequest>(attempts[2]).delete_all_data_from_table());

  server = [](std::shared_ptr<async_unary_op> op) { reply(op, make_table("t0", {"new"})); };
  auto info = admin.modify_column_families(
      "t0", {bta::column_family_modification::create("new", 1), bta::column_family_modification::drop("old")});
  EXPECT_EQ(info, (bta::table_info{"t0", {"new"}}));
  ASSERT_EQ(attempts.size(), 4UL);
  EXPECT_EQ(attempts[3]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/ModifyColumnFamilies");
  EXPECT_EQ(request_of<bta::admin::ModifyColumnFamiliesRequest>(attempts[3]).modifications_size(), 2);

  EXPECT_TRUE(timers.empty());
}

/**
 * @test Verify that errors reach the caller as bta::rpc_error exceptions.
 */
TEST_F(table_admin_test, errors) {
  auto admin = make_admin();
  server = [](std::shared_ptr<async_unary_op> op) { fail(op, grpc::StatusCode::NOT_FOUND); };
  try {
    admin.get_table("missing");
    FAIL() << "expected an exception";
  } catch (bta::rpc_error const& ex) {
    EXPECT_EQ(ex.kind(), bta::error_kind::permanent_failure);
    EXPECT_EQ(ex.status_code(), grpc::StatusCode::NOT_FOUND);
  }
  EXPECT_EQ(attempts.size(), 1UL);

  // ... responses naming tables in other instances are rejected ...
  server = [](std::shared_ptr<async_unary_op> op) {
    bta::admin::Table table;
    table.set_name("projects/other/instances/test-instance/tables/t0");
    reply(op, table);
  };
  EXPECT_THROW(admin.get_table("t0"), std::invalid_argument);
}

/**
 * @test Verify that invalid arguments are rejected before any RPC is made.
 */
TEST_F(table_admin_test, invalid_arguments) {
  auto admin = make_admin();
  EXPECT_THROW(admin.async_get_table(""), std::invalid_argument);
  EXPECT_THROW(admin.async_delete_table("a/b"), std::invalid_argument);
  EXPECT_THROW(admin.async_create_table(bta::table_spec{"t0", {{"fam", -1}}}), std::invalid_argument);
  EXPECT_THROW(admin.async_modify_column_families("t0", {}), std::invalid_argument);
  EXPECT_TRUE(attempts.empty());

  EXPECT_THROW(
      admin_type(std::shared_ptr<completion_queue_type>(), std::shared_ptr<grpc::GenericStub>(), admin.options()),
      std::logic_error);
}

/**
 * @test Verify that cancelling the future cancels the call in flight.
 */
TEST_F(table_admin_test, cancel) {
  auto admin = make_admin();
  auto f = admin.async_list_tables();
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_TRUE(f.cancel());
  ASSERT_EQ(cancelled.size(), 1UL);
  EXPECT_EQ(cancelled[0], attempts[0]);
  try {
    f.get();
    FAIL() << "expected an exception";
  } catch (bta::rpc_error const& ex) {
    EXPECT_EQ(ex.kind(), bta::error_kind::cancelled);
  }

  // ... the late completion is discarded ...
  fail(attempts[0], grpc::StatusCode::CANCELLED);
  EXPECT_TRUE(timers.empty());
  EXPECT_EQ(attempts.size(), 1UL);
}

/**
 * @test Verify that snapshot_table() sends the table, cluster and ttl, and returns the long-running operation.
 */
TEST_F(table_admin_test, snapshot_table) {
  auto admin = make_admin();
  auto f = admin.async_snapshot_table("t0", "c0", "s0", 7200s, "nightly");
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/SnapshotTable");
  auto request = request_of<bta::admin::SnapshotTableRequest>(attempts[0]);
  EXPECT_EQ(request.name(), "projects/test-project/instances/test-instance/tables/t0");
  EXPECT_EQ(request.cluster(), "projects/test-project/instances/test-instance/clusters/c0");
  EXPECT_EQ(request.snapshot_id(), "s0");
  EXPECT_EQ(request.ttl().seconds(), 7200);
  EXPECT_EQ(request.description(), "nightly");

  bta::admin::Operation operation;
  operation.set_name("operations/snapshot-0");
  reply(attempts[0], operation);
  auto info = f.get();
  EXPECT_EQ(info.name, "operations/snapshot-0");
  EXPECT_FALSE(info.done);

  EXPECT_THROW(admin.async_snapshot_table("t0", "c0", "s0", -1s, ""), std::invalid_argument);
  EXPECT_EQ(attempts.size(), 1UL);
}

/**
 * @test Verify get_snapshot(), list_snapshots() and delete_snapshot() using the blocking variants.
 */
TEST_F(table_admin_test, snapshots) {
  auto admin = make_admin();
  bta::admin::Snapshot snapshot;
  snapshot.set_name("projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");
  snapshot.mutable_source_table()->set_name("projects/test-project/instances/test-instance/tables/t0");
  snapshot.set_data_size_bytes(512);
  snapshot.set_state(bta::admin::Snapshot::READY);

  server = [snapshot](std::shared_ptr<async_unary_op> op) { reply(op, snapshot); };
  EXPECT_EQ(admin.get_snapshot("c0", "s0"), (bta::snapshot_info{"c0", "s0", "t0", 512, "", true}));
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/GetSnapshot");
  EXPECT_EQ(
      request_of<bta::admin::GetSnapshotRequest>(attempts[0]).name(),
      "projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");

  server = [snapshot](std::shared_ptr<async_unary_op> op) {
    bta::admin::ListSnapshotsResponse response;
    *response.add_snapshots() = snapshot;
    reply(op, response);
  };
  auto list = admin.list_snapshots("-");
  ASSERT_EQ(list.size(), 1UL);
  EXPECT_EQ(list[0].snapshot_id, "s0");
  ASSERT_EQ(attempts.size(), 2UL);
  EXPECT_EQ(attempts[1]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/ListSnapshots");
  EXPECT_EQ(
      request_of<bta::admin::ListSnapshotsRequest>(attempts[1]).parent(),
      "projects/test-project/instances/test-instance/clusters/-");

  server = [](std::shared_ptr<async_unary_op> op) { reply(op, google::protobuf::Empty()); };
  admin.delete_snapshot("c0", "s0");
  ASSERT_EQ(attempts.size(), 3UL);
  EXPECT_EQ(attempts[2]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/DeleteSnapshot");
  EXPECT_EQ(
      request_of<bta::admin::DeleteSnapshotRequest>(attempts[2]).name(),
      "projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");

  // ... snapshots from other instances are rejected ...
  server = [](std::shared_ptr<async_unary_op> op) {
    bta::admin::Snapshot other;
    other.set_name("projects/other/instances/test-instance/clusters/c0/snapshots/s0");
    reply(op, other);
  };
  EXPECT_THROW(admin.get_snapshot("c0", "s0"), std::invalid_argument);
}

/**
 * @test Verify that create_table_from_snapshot() retries transient failures and reports a failed operation.
 */
TEST_F(table_admin_test, create_table_from_snapshot) {
  auto admin = make_admin();
  auto f = admin.async_create_table_from_snapshot("restored", "c0", "s0");
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/google.bigtable.admin.v2.BigtableTableAdmin/CreateTableFromSnapshot");
  auto request = request_of<bta::admin::CreateTableFromSnapshotRequest>(attempts[0]);
  EXPECT_EQ(request.parent(), "projects/test-project/instances/test-instance");
  EXPECT_EQ(request.table_id(), "restored");
  EXPECT_EQ(request.source_snapshot(), "projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");

  fail(attempts[0], grpc::StatusCode::UNAVAILABLE);
  ASSERT_EQ(timers.size(), 1UL);
  timers[0]->callback(*timers[0], true);
  ASSERT_EQ(attempts.size(), 2UL);

  bta::admin::Operation operation;
  operation.set_name("operations/restore-0");
  operation.set_done(true);
  operation.mutable_error()->set_code(9);
  operation.mutable_error()->set_message("snapshot not ready");
  reply(attempts[1], operation);
  auto info = f.get();
  EXPECT_TRUE(info.done);
  EXPECT_EQ(info.error_code, 9);
  EXPECT_EQ(info.error_message, "snapshot not ready");
}
