#ifndef bta_table_admin_hpp
#define bta_table_admin_hpp
//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.

#include <bta/completion_queue.hpp>
#include <bta/detail/admin_translation.hpp>
#include <bta/detail/future_bridge.hpp>
#include <bta/detail/retrying_unary_call.hpp>
#include <bta/future.hpp>
#include <bta/table_admin_options.hpp>
#include <bta/table_model.hpp>

#include <google/protobuf/empty.pb.h>
#include <grpc++/generic/generic_stub.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace bta {

/**
 * Administer the tables in one instance.
 *
 * Each member function translates its arguments into a request, makes exactly one retrying unary call (see
 * bta::detail::retrying_unary_call), and translates the response.  The object holds no state beyond its
 * configuration, it is safe to use from multiple threads.
 *
 * The asynchronous variants return a bta::future<>, cancelling it cancels the call.  The blocking variants wait for
 * the result and raise the error, typically a bta::rpc_error, as an exception.  Invalid arguments raise
 * std::invalid_argument before any RPC is made.
 *
 * @tparam completion_queue_type the queue where the calls are posted, mocked in the tests.
 */
template <typename completion_queue_type = completion_queue<>>
class table_admin {
public:
  table_admin(
      std::shared_ptr<completion_queue_type> queue, std::shared_ptr<grpc::GenericStub> stub,
      table_admin_options options)
      : queue_(std::move(queue))
      , stub_(std::move(stub))
      , options_(std::move(options)) {
    BTA_ASSERT_THROW(queue_);
  }

  table_admin_options const& options() const {
    return options_;
  }

  /// Create a table, the future is satisfied with the table as reported by the server.
  future<table_info> async_create_table(table_spec const& spec) {
    return as_table_info(make_call<admin::Table>("CreateTable", detail::make_create_table_request(options_, spec)));
  }
  table_info create_table(table_spec const& spec) {
    return async_create_table(spec).get();
  }

  /// Fetch the schema of a table.
  future<table_info> async_get_table(std::string const& table_id) {
    return as_table_info(make_call<admin::Table>("GetTable", detail::make_get_table_request(options_, table_id)));
  }
  table_info get_table(std::string const& table_id) {
    return async_get_table(table_id).get();
  }

  /// List the ids of the tables in the instance.
  future<std::vector<std::string>> async_list_tables() {
    auto options = options_;
    return detail::transform(
        make_call<admin::ListTablesResponse>("ListTables", detail::make_list_tables_request(options_)),
        [options](admin::ListTablesResponse const& r) { return detail::to_table_ids(options, r); });
  }
  std::vector<std::string> list_tables() {
    return async_list_tables().get();
  }

  future<google::protobuf::Empty> async_delete_table(std::string const& table_id) {
    return make_call<google::protobuf::Empty>("DeleteTable", detail::make_delete_table_request(options_, table_id));
  }
  void delete_table(std::string const& table_id) {
    async_delete_table(table_id).get();
  }

  /**
   * Delete the rows whose key starts with @a row_key_prefix.
   *
   * An empty prefix deletes all the rows in the table.
   */
  future<google::protobuf::Empty> async_drop_row_range(std::string const& table_id, std::string const& row_key_prefix) {
    return make_call<google::protobuf::Empty>(
        "DropRowRange", detail::make_drop_row_range_request(options_, table_id, row_key_prefix));
  }
  void drop_row_range(std::string const& table_id, std::string const& row_key_prefix) {
    async_drop_row_range(table_id, row_key_prefix).get();
  }

  future<google::protobuf::Empty> async_drop_all_rows(std::string const& table_id) {
    return async_drop_row_range(table_id, std::string());
  }
  void drop_all_rows(std::string const& table_id) {
    async_drop_all_rows(table_id).get();
  }

  /// Apply the modifications, in order, the future is satisfied with the resulting table.
  future<table_info> async_modify_column_families(
      std::string const& table_id, std::vector<column_family_modification> const& modifications) {
    return as_table_info(make_call<admin::Table>(
        "ModifyColumnFamilies", detail::make_modify_column_families_request(options_, table_id, modifications)));
  }
  table_info modify_column_families(
      std::string const& table_id, std::vector<column_family_modification> const& modifications) {
    return async_modify_column_families(table_id, modifications).get();
  }

  /**
   * Start a snapshot of a table in a cluster.
   *
   * The snapshot is created in the background, the future is satisfied with the long running operation.
   *
   * @param ttl how long the snapshot is kept, zero uses the server default.
   */
  future<operation_info> async_snapshot_table(
      std::string const& table_id, std::string const& cluster_id, std::string const& snapshot_id,
      std::chrono::seconds ttl, std::string const& description) {
    return as_operation_info(make_call<admin::Operation>(
        "SnapshotTable",
        detail::make_snapshot_table_request(options_, table_id, cluster_id, snapshot_id, ttl, description)));
  }
  operation_info snapshot_table(
      std::string const& table_id, std::string const& cluster_id, std::string const& snapshot_id,
      std::chrono::seconds ttl, std::string const& description) {
    return async_snapshot_table(table_id, cluster_id, snapshot_id, ttl, description).get();
  }

  future<snapshot_info> async_get_snapshot(std::string const& cluster_id, std::string const& snapshot_id) {
    auto options = options_;
    return detail::transform(
        make_call<admin::Snapshot>(
            "GetSnapshot", detail::make_get_snapshot_request(options_, cluster_id, snapshot_id)),
        [options](admin::Snapshot const& s) { return detail::to_snapshot_info(options, s); });
  }
  snapshot_info get_snapshot(std::string const& cluster_id, std::string const& snapshot_id) {
    return async_get_snapshot(cluster_id, snapshot_id).get();
  }

  /// List the snapshots in a cluster, or in all the clusters of the instance if @a cluster_id is "-".
  future<std::vector<snapshot_info>> async_list_snapshots(std::string const& cluster_id) {
    auto options = options_;
    return detail::transform(
        make_call<admin::ListSnapshotsResponse>(
            "ListSnapshots", detail::make_list_snapshots_request(options_, cluster_id)),
        [options](admin::ListSnapshotsResponse const& r) { return detail::to_snapshot_infos(options, r); });
  }
  std::vector<snapshot_info> list_snapshots(std::string const& cluster_id) {
    return async_list_snapshots(cluster_id).get();
  }

  future<google::protobuf::Empty> async_delete_snapshot(std::string const& cluster_id, std::string const& snapshot_id) {
    return make_call<google::protobuf::Empty>(
        "DeleteSnapshot", detail::make_delete_snapshot_request(options_, cluster_id, snapshot_id));
  }
  void delete_snapshot(std::string const& cluster_id, std::string const& snapshot_id) {
    async_delete_snapshot(cluster_id, snapshot_id).get();
  }

  /// Start creating a table from a snapshot, the future is satisfied with the long running operation.
  future<operation_info> async_create_table_from_snapshot(
      std::string const& table_id, std::string const& cluster_id, std::string const& snapshot_id) {
    return as_operation_info(make_call<admin::Operation>(
        "CreateTableFromSnapshot",
        detail::make_create_table_from_snapshot_request(options_, table_id, cluster_id, snapshot_id)));
  }
  operation_info create_table_from_snapshot(
      std::string const& table_id, std::string const& cluster_id, std::string const& snapshot_id) {
    return async_create_table_from_snapshot(table_id, cluster_id, snapshot_id).get();
  }

  /// The prefix for all the RPC names.
  static constexpr char const* service_name() {
    return "/google.bigtable.admin.v2.BigtableTableAdmin/";
  }

private:
  template <typename Response, typename Request>
  future<Response> make_call(char const* rpc, Request request) {
    using call_type = detail::retrying_unary_call<Request, Response, completion_queue_type>;
    auto call = call_type::create(
        queue_, stub_, std::string(service_name()) + rpc, std::move(request), options_.retry(), options_.metadata());
    return detail::to_caller_future(call->start());
  }

  future<table_info> as_table_info(future<admin::Table> f) {
    auto options = options_;
    return detail::transform(
        std::move(f), [options](admin::Table const& t) { return detail::to_table_info(options, t); });
  }

  static future<operation_info> as_operation_info(future<admin::Operation> f) {
    return detail::transform(std::move(f), [](admin::Operation const& op) { return detail::to_operation_info(op); });
  }

private:
  std::shared_ptr<completion_queue_type> queue_;
  std::shared_ptr<grpc::GenericStub> stub_;
  table_admin_options options_;
};

} // namespace bta

#endif // bta_table_admin_hpp
