#ifndef bta_detail_admin_translation_hpp
#define bta_detail_admin_translation_hpp
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

#include <bta/admin/admin.pb.h>
#include <bta/table_admin_options.hpp>
#include <bta/table_model.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace bta {
namespace detail {

/**
 * @name Convert between the bta::table_admin types and the admin protos.
 *
 * Table ids are expanded to full resource names in the requests, and the resource names in the responses are converted
 * back to table ids.  Invalid arguments raise std::invalid_argument before any request is created.
 */
//@{
admin::CreateTableRequest make_create_table_request(table_admin_options const& options, table_spec const& spec);
admin::GetTableRequest make_get_table_request(table_admin_options const& options, std::string const& table_id);
admin::ListTablesRequest make_list_tables_request(table_admin_options const& options);
admin::DeleteTableRequest make_delete_table_request(table_admin_options const& options, std::string const& table_id);

/// An empty @a row_key_prefix drops all the rows in the table.
admin::DropRowRangeRequest make_drop_row_range_request(
    table_admin_options const& options, std::string const& table_id, std::string const& row_key_prefix);

admin::ModifyColumnFamiliesRequest make_modify_column_families_request(
    table_admin_options const& options, std::string const& table_id,
    std::vector<column_family_modification> const& modifications);

/// A @a ttl of zero leaves the expiration to the server.
admin::SnapshotTableRequest make_snapshot_table_request(
    table_admin_options const& options, std::string const& table_id, std::string const& cluster_id,
    std::string const& snapshot_id, std::chrono::seconds ttl, std::string const& description);
admin::GetSnapshotRequest make_get_snapshot_request(
    table_admin_options const& options, std::string const& cluster_id, std::string const& snapshot_id);
admin::ListSnapshotsRequest make_list_snapshots_request(
    table_admin_options const& options, std::string const& cluster_id);
admin::DeleteSnapshotRequest make_delete_snapshot_request(
    table_admin_options const& options, std::string const& cluster_id, std::string const& snapshot_id);
admin::CreateTableFromSnapshotRequest make_create_table_from_snapshot_request(
    table_admin_options const& options, std::string const& table_id, std::string const& cluster_id,
    std::string const& snapshot_id);

table_info to_table_info(table_admin_options const& options, admin::Table const& table);
std::vector<std::string> to_table_ids(table_admin_options const& options, admin::ListTablesResponse const& response);
snapshot_info to_snapshot_info(table_admin_options const& options, admin::Snapshot const& snapshot);
std::vector<snapshot_info> to_snapshot_infos(
    table_admin_options const& options, admin::ListSnapshotsResponse const& response);
operation_info to_operation_info(admin::Operation const& operation);
//@}

} // namespace detail
} // namespace bta

#endif // bta_detail_admin_translation_hpp
