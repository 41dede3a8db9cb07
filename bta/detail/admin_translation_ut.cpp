#include "bta/detail/admin_translation.hpp"

#include <gmock/gmock.h>

using namespace bta::detail;

namespace {
bta::table_admin_options test_options() {
  return bta::table_admin_options("test-project", "test-instance");
}
} // anonymous namespace

/**
 * @test Verify that create table requests carry the parent, the id and the column families.
 */
TEST(admin_translation, create_table) {
  auto options = test_options();
  auto request = make_create_table_request(options, bta::table_spec{"t0", {{"fam", 3}, {"other", 0}}});
  EXPECT_EQ(request.parent(), "projects/test-project/instances/test-instance");
  EXPECT_EQ(request.table_id(), "t0");
  ASSERT_EQ(request.table().column_families_size(), 2);
  auto const& families = request.table().column_families();
  ASSERT_TRUE(families.at("fam").has_gc_rule());
  EXPECT_EQ(families.at("fam").gc_rule().max_num_versions(), 3);
  EXPECT_FALSE(families.at("other").has_gc_rule());

  EXPECT_THROW(make_create_table_request(options, bta::table_spec{"", {}}), std::invalid_argument);
  EXPECT_THROW(make_create_table_request(options, bta::table_spec{"t0", {{"fam", -1}}}), std::invalid_argument);
  EXPECT_THROW(make_create_table_request(options, bta::table_spec{"t0", {{"", 1}}}), std::invalid_argument);
}

/**
 * @test Verify the requests that only name a table or the instance.
 */
TEST(admin_translation, simple_requests) {
  auto options = test_options();
  auto get = make_get_table_request(options, "t1");
  EXPECT_EQ(get.name(), "projects/test-project/instances/test-instance/tables/t1");
  EXPECT_EQ(get.view(), bta::admin::Table::SCHEMA_VIEW);

  auto list = make_list_tables_request(options);
  EXPECT_EQ(list.parent(), "projects/test-project/instances/test-instance");
  EXPECT_EQ(list.view(), bta::admin::Table::NAME_ONLY);
  EXPECT_TRUE(list.page_token().empty());

  auto del = make_delete_table_request(options, "t2");
  EXPECT_EQ(del.name(), "projects/test-project/instances/test-instance/tables/t2");

  EXPECT_THROW(make_get_table_request(options, ""), std::invalid_argument);
  EXPECT_THROW(make_delete_table_request(options, "a/b"), std::invalid_argument);
}

/**
 * @test Verify that an empty prefix drops all the rows.
 */
TEST(admin_translation, drop_row_range) {
  auto options = test_options();
  auto prefix = make_drop_row_range_request(options, "t0", "user/");
  EXPECT_EQ(prefix.name(), "projects/test-project/instances/test-instance/tables/t0");
  EXPECT_EQ(prefix.target_case(), bta::admin::DropRowRangeRequest::kRowKeyPrefix);
  EXPECT_EQ(prefix.row_key_prefix(), "user/");

  auto all = make_drop_row_range_request(options, "t0", "");
  EXPECT_EQ(all.target_case(), bta::admin::DropRowRangeRequest::kDeleteAllDataFromTable);
  EXPECT_TRUE(all.delete_all_data_from_table());
}

/**
 * @test Verify that column family modifications are translated in order.
 */
TEST(admin_translation, modify_column_families) {
  using bta::column_family_modification;
  auto options = test_options();
  auto request = make_modify_column_families_request(
      options, "t0", {column_family_modification::create("new", 2), column_family_modification::update("old", 5),
                      column_family_modification::drop("gone")});
  EXPECT_EQ(request.name(), "projects/test-project/instances/test-instance/tables/t0");
  ASSERT_EQ(request.modifications_size(), 3);
  EXPECT_EQ(request.modifications(0).id(), "new");
  ASSERT_TRUE(request.modifications(0).has_create());
  EXPECT_EQ(request.modifications(0).create().gc_rule().max_num_versions(), 2);
  EXPECT_EQ(request.modifications(1).id(), "old");
  ASSERT_TRUE(request.modifications(1).has_update());
  EXPECT_EQ(request.modifications(1).update().gc_rule().max_num_versions(), 5);
  EXPECT_EQ(request.modifications(2).id(), "gone");
  EXPECT_TRUE(request.modifications(2).drop());

  EXPECT_THROW(make_modify_column_families_request(options, "t0", {}), std::invalid_argument);
  EXPECT_THROW(
      make_modify_column_families_request(options, "t0", {column_family_modification::update("old", -2)}),
      std::invalid_argument);
}

/**
 * @test Verify that responses are converted back to table ids.
 */
TEST(admin_translation, responses) {
  auto options = test_options();
  bta::admin::Table table;
  table.set_name("projects/test-project/instances/test-instance/tables/t0");
  (*table.mutable_column_families())["zeta"];
  (*table.mutable_column_families())["alpha"];
  auto info = to_table_info(options, table);
  EXPECT_EQ(info.table_id, "t0");
  EXPECT_THAT(info.column_families, ::testing::ElementsAre("alpha", "zeta"));

  bta::admin::ListTablesResponse response;
  response.add_tables()->set_name("projects/test-project/instances/test-instance/tables/t1");
  response.add_tables()->set_name("projects/test-project/instances/test-instance/tables/t2");
  EXPECT_THAT(to_table_ids(options, response), ::testing::ElementsAre("t1", "t2"));

  response.add_tables()->set_name("projects/other/instances/test-instance/tables/t3");
  EXPECT_THROW(to_table_ids(options, response), std::invalid_argument);
}

/**
 * @test Verify the snapshot requests.
 */
TEST(admin_translation, snapshot_requests) {
  using namespace std::chrono_literals;
  auto options = test_options();
  auto snapshot = make_snapshot_table_request(options, "t0", "c0", "s0", 3600s, "hourly");
  EXPECT_EQ(snapshot.name(), "projects/test-project/instances/test-instance/tables/t0");
  EXPECT_EQ(snapshot.cluster(), "projects/test-project/instances/test-instance/clusters/c0");
  EXPECT_EQ(snapshot.snapshot_id(), "s0");
  ASSERT_TRUE(snapshot.has_ttl());
  EXPECT_EQ(snapshot.ttl().seconds(), 3600);
  EXPECT_EQ(snapshot.description(), "hourly");
  EXPECT_FALSE(make_snapshot_table_request(options, "t0", "c0", "s0", 0s, "").has_ttl());
  EXPECT_THROW(make_snapshot_table_request(options, "t0", "c0", "s0", -1s, ""), std::invalid_argument);
  EXPECT_THROW(make_snapshot_table_request(options, "t0", "c0", "", 0s, ""), std::invalid_argument);

  EXPECT_EQ(
      make_get_snapshot_request(options, "c0", "s0").name(),
      "projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");
  EXPECT_EQ(
      make_delete_snapshot_request(options, "c0", "s0").name(),
      "projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");
  EXPECT_EQ(
      make_list_snapshots_request(options, "-").parent(), "projects/test-project/instances/test-instance/clusters/-");

  auto create = make_create_table_from_snapshot_request(options, "restored", "c0", "s0");
  EXPECT_EQ(create.parent(), "projects/test-project/instances/test-instance");
  EXPECT_EQ(create.table_id(), "restored");
  EXPECT_EQ(create.source_snapshot(), "projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");
  EXPECT_THROW(make_create_table_from_snapshot_request(options, "", "c0", "s0"), std::invalid_argument);
}

/**
 * @test Verify that snapshots and operations are converted to the caller-side types.
 */
TEST(admin_translation, snapshot_responses) {
  auto options = test_options();
  bta::admin::Snapshot snapshot;
  snapshot.set_name("projects/test-project/instances/test-instance/clusters/c0/snapshots/s0");
  snapshot.mutable_source_table()->set_name("projects/test-project/instances/test-instance/tables/t0");
  snapshot.set_data_size_bytes(4096);
  snapshot.set_description("daily");
  snapshot.set_state(bta::admin::Snapshot::READY);
  EXPECT_EQ(to_snapshot_info(options, snapshot), (bta::snapshot_info{"c0", "s0", "t0", 4096, "daily", true}));

  bta::admin::ListSnapshotsResponse response;
  *response.add_snapshots() = snapshot;
  auto& creating = *response.add_snapshots();
  creating.set_name("projects/test-project/instances/test-instance/clusters/c1/snapshots/s1");
  creating.set_state(bta::admin::Snapshot::CREATING);
  auto infos = to_snapshot_infos(options, response);
  ASSERT_EQ(infos.size(), 2UL);
  EXPECT_EQ(infos[1], (bta::snapshot_info{"c1", "s1", "", 0, "", false}));

  bta::admin::Operation operation;
  operation.set_name("operations/op0");
  auto pending = to_operation_info(operation);
  EXPECT_EQ(pending.name, "operations/op0");
  EXPECT_FALSE(pending.done);
  EXPECT_EQ(pending.error_code, 0);

  operation.set_done(true);
  operation.mutable_error()->set_code(9);
  operation.mutable_error()->set_message("failed precondition");
  auto failed = to_operation_info(operation);
  EXPECT_TRUE(failed.done);
  EXPECT_EQ(failed.error_code, 9);
  EXPECT_EQ(failed.error_message, "failed precondition");
}
