#include "bta/table_admin_options.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that table_admin_options computes the resource names.
 */
TEST(table_admin_options, names) {
  bta::table_admin_options options("my-project", "my-instance");
  EXPECT_EQ(options.project_id(), "my-project");
  EXPECT_EQ(options.instance_id(), "my-instance");
  EXPECT_EQ(options.instance_name(), "projects/my-project/instances/my-instance");
  EXPECT_EQ(options.table_name("t0"), "projects/my-project/instances/my-instance/tables/t0");
  EXPECT_EQ(options.table_id("projects/my-project/instances/my-instance/tables/t0"), "t0");
}

/**
 * @test Verify that invalid ids and names are rejected.
 */
TEST(table_admin_options, validation) {
  EXPECT_THROW(bta::table_admin_options("", "my-instance"), std::invalid_argument);
  EXPECT_THROW(bta::table_admin_options("my-project", ""), std::invalid_argument);
  EXPECT_THROW(bta::table_admin_options("my/project", "my-instance"), std::invalid_argument);

  bta::table_admin_options options("my-project", "my-instance");
  EXPECT_THROW(options.table_name(""), std::invalid_argument);
  EXPECT_THROW(options.table_name("a/b"), std::invalid_argument);
  EXPECT_THROW(options.table_id("projects/other/instances/my-instance/tables/t0"), std::invalid_argument);
  EXPECT_THROW(options.table_id("projects/my-project/instances/my-instance/tables/"), std::invalid_argument);
  EXPECT_THROW(options.table_id("t0"), std::invalid_argument);
}

/**
 * @test Verify the modified copies.
 */
TEST(table_admin_options, modified_copies) {
  bta::table_admin_options options("my-project", "my-instance");
  auto modified = options.with_retry(bta::retry_options().with_max_attempts(3))
                      .with_metadata(bta::call_metadata{{"x-test", "value"}});
  EXPECT_EQ(options.retry().max_attempts(), bta::retry_options::default_max_attempts);
  EXPECT_TRUE(options.metadata().empty());
  EXPECT_EQ(modified.retry().max_attempts(), 3);
  EXPECT_EQ(modified.metadata().size(), 1UL);
  EXPECT_EQ(modified.instance_name(), options.instance_name());
}

/**
 * @test Verify the cluster and snapshot resource names.
 */
TEST(table_admin_options, snapshot_names) {
  bta::table_admin_options options("my-project", "my-instance");
  EXPECT_EQ(options.cluster_name("c0"), "projects/my-project/instances/my-instance/clusters/c0");
  EXPECT_EQ(options.cluster_name("-"), "projects/my-project/instances/my-instance/clusters/-");
  EXPECT_EQ(options.snapshot_name("c0", "s0"), "projects/my-project/instances/my-instance/clusters/c0/snapshots/s0");

  auto ids = options.parse_snapshot_name("projects/my-project/instances/my-instance/clusters/c1/snapshots/s1");
  EXPECT_EQ(ids.first, "c1");
  EXPECT_EQ(ids.second, "s1");

  EXPECT_THROW(options.cluster_name(""), std::invalid_argument);
  EXPECT_THROW(options.snapshot_name("c0", ""), std::invalid_argument);
  EXPECT_THROW(options.snapshot_name("c0", "a/b"), std::invalid_argument);
  EXPECT_THROW(
      options.parse_snapshot_name("projects/other/instances/my-instance/clusters/c1/snapshots/s1"),
      std::invalid_argument);
  EXPECT_THROW(
      options.parse_snapshot_name("projects/my-project/instances/my-instance/clusters/c1/snapshots/"),
      std::invalid_argument);
  EXPECT_THROW(
      options.parse_snapshot_name("projects/my-project/instances/my-instance/clusters//snapshots/s1"),
      std::invalid_argument);
  EXPECT_THROW(
      options.parse_snapshot_name("projects/my-project/instances/my-instance/clusters/c1/tables/t1"),
      std::invalid_argument);
}
