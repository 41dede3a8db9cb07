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
#include "bta/detail/admin_translation.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {
void set_max_versions(bta::admin::ColumnFamily& family, std::string const& name, int max_versions) {
  if (max_versions < 0) {
    std::ostringstream os;
    os << "invalid max_versions (" << max_versions << ") for column family <" << name << ">";
    throw std::invalid_argument(os.str());
  }
  if (max_versions > 0) {
    family.mutable_gc_rule()->set_max_num_versions(max_versions);
  }
}

void validate_family_name(std::string const& name) {
  if (name.empty()) {
    throw std::invalid_argument("column family names cannot be empty");
  }
}
} // anonymous namespace

namespace bta {
namespace detail {

admin::CreateTableRequest make_create_table_request(table_admin_options const& options, table_spec const& spec) {
  admin::CreateTableRequest request;
  // ... validates the table id ...
  options.table_name(spec.table_id);
  request.set_parent(options.instance_name());
  request.set_table_id(spec.table_id);
  auto& families = *request.mutable_table()->mutable_column_families();
  for (auto const& kv : spec.column_families) {
    validate_family_name(kv.first);
    set_max_versions(families[kv.first], kv.first, kv.second);
  }
  return request;
}

admin::GetTableRequest make_get_table_request(table_admin_options const& options, std::string const& table_id) {
  admin::GetTableRequest request;
  request.set_name(options.table_name(table_id));
  request.set_view(admin::Table::SCHEMA_VIEW);
  return request;
}

admin::ListTablesRequest make_list_tables_request(table_admin_options const& options) {
  admin::ListTablesRequest request;
  request.set_parent(options.instance_name());
  request.set_view(admin::Table::NAME_ONLY);
  return request;
}

admin::DeleteTableRequest make_delete_table_request(table_admin_options const& options, std::string const& table_id) {
  admin::DeleteTableRequest request;
  request.set_name(options.table_name(table_id));
  return request;
}

admin::DropRowRangeRequest make_drop_row_range_request(
    table_admin_options const& options, std::string const& table_id, std::string const& row_key_prefix) {
  admin::DropRowRangeRequest request;
  request.set_name(options.table_name(table_id));
  if (row_key_prefix.empty()) {
    request.set_delete_all_data_from_table(true);
  } else {
    request.set_row_key_prefix(row_key_prefix);
  }
  return request;
}

admin::ModifyColumnFamiliesRequest make_modify_column_families_request(
    table_admin_options const& options, std::string const& table_id,
    std::vector<column_family_modification> const& modifications) {
  if (modifications.empty()) {
    throw std::invalid_argument("make_modify_column_families_request() - empty list of modifications");
  }
  admin::ModifyColumnFamiliesRequest request;
  request.set_name(options.table_name(table_id));
  for (auto const& m : modifications) {
    validate_family_name(m.family);
    auto& mod = *request.add_modifications();
    mod.set_id(m.family);
    switch (m.what) {
    case column_family_modification::action::create:
      set_max_versions(*mod.mutable_create(), m.family, m.max_versions);
      break;
    case column_family_modification::action::update:
      set_max_versions(*mod.mutable_update(), m.family, m.max_versions);
      break;
    case column_family_modification::action::drop:
      mod.set_drop(true);
      break;
    }
  }
  return request;
}

admin::SnapshotTableRequest make_snapshot_table_request(
    table_admin_options const& options, std::string const& table_id, std::string const& cluster_id,
    std::string const& snapshot_id, std::chrono::seconds ttl, std::string const& description) {
  if (ttl.count() < 0) {
    std::ostringstream os;
    os << "make_snapshot_table_request() - negative ttl (" << ttl.count() << "s) for snapshot <" << snapshot_id << ">";
    throw std::invalid_argument(os.str());
  }
  admin::SnapshotTableRequest request;
  request.set_name(options.table_name(table_id));
  request.set_cluster(options.cluster_name(cluster_id));
  // ... validates the snapshot id ...
  options.snapshot_name(cluster_id, snapshot_id);
  request.set_snapshot_id(snapshot_id);
  if (ttl.count() > 0) {
    request.mutable_ttl()->set_seconds(ttl.count());
  }
  request.set_description(description);
  return request;
}

admin::GetSnapshotRequest make_get_snapshot_request(
    table_admin_options const& options, std::string const& cluster_id, std::string const& snapshot_id) {
  admin::GetSnapshotRequest request;
  request.set_name(options.snapshot_name(cluster_id, snapshot_id));
  return request;
}

admin::ListSnapshotsRequest make_list_snapshots_request(
    table_admin_options const& options, std::string const& cluster_id) {
  admin::ListSnapshotsRequest request;
  request.set_parent(options.cluster_name(cluster_id));
  return request;
}

admin::DeleteSnapshotRequest make_delete_snapshot_request(
    table_admin_options const& options, std::string const& cluster_id, std::string const& snapshot_id) {
  admin::DeleteSnapshotRequest request;
  request.set_name(options.snapshot_name(cluster_id, snapshot_id));
  return request;
}

admin::CreateTableFromSnapshotRequest make_create_table_from_snapshot_request(
    table_admin_options const& options, std::string const& table_id, std::string const& cluster_id,
    std::string const& snapshot_id) {
  admin::CreateTableFromSnapshotRequest request;
  // ... validates the table id ...
  options.table_name(table_id);
  request.set_parent(options.instance_name());
  request.set_table_id(table_id);
  request.set_source_snapshot(options.snapshot_name(cluster_id, snapshot_id));
  return request;
}

table_info to_table_info(table_admin_options const& options, admin::Table const& table) {
  table_info info;
  info.table_id = options.table_id(table.name());
  for (auto const& kv : table.column_families()) {
    info.column_families.push_back(kv.first);
  }
  // ... protobuf maps have no defined iteration order ...
  std::sort(info.column_families.begin(), info.column_families.end());
  return info;
}

std::vector<std::string> to_table_ids(table_admin_options const& options, admin::ListTablesResponse const& response) {
  std::vector<std::string> ids;
  ids.reserve(response.tables_size());
  for (auto const& table : response.tables()) {
    ids.push_back(options.table_id(table.name()));
  }
  return ids;
}

snapshot_info to_snapshot_info(table_admin_options const& options, admin::Snapshot const& snapshot) {
  auto ids = options.parse_snapshot_name(snapshot.name());
  snapshot_info info;
  info.cluster_id = std::move(ids.first);
  info.snapshot_id = std::move(ids.second);
  if (snapshot.has_source_table() and not snapshot.source_table().name().empty()) {
    info.source_table_id = options.table_id(snapshot.source_table().name());
  }
  info.data_size_bytes = snapshot.data_size_bytes();
  info.description = snapshot.description();
  info.ready = snapshot.state() == admin::Snapshot::READY;
  return info;
}

std::vector<snapshot_info> to_snapshot_infos(
    table_admin_options const& options, admin::ListSnapshotsResponse const& response) {
  std::vector<snapshot_info> snapshots;
  snapshots.reserve(response.snapshots_size());
  for (auto const& s : response.snapshots()) {
    snapshots.push_back(to_snapshot_info(options, s));
  }
  return snapshots;
}

operation_info to_operation_info(admin::Operation const& operation) {
  operation_info info{operation.name(), operation.done(), 0, std::string()};
  if (operation.has_error()) {
    info.error_code = operation.error().code();
    info.error_message = operation.error().message();
  }
  return info;
}

} // namespace detail
} // namespace bta
