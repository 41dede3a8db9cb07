#ifndef bta_table_admin_options_hpp
#define bta_table_admin_options_hpp
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

#include <bta/retry_options.hpp>

#include <string>
#include <utility>

namespace bta {

/**
 * Configure a bta::table_admin.
 *
 * Identifies the instance that owns the tables, and how the calls are made.  Table ids are relative to the instance,
 * the full resource names are:
 *
 * @code
 * projects/{project_id}/instances/{instance_id}
 * projects/{project_id}/instances/{instance_id}/tables/{table_id}
 * @endcode
 */
class table_admin_options {
public:
  /**
   * Constructor.
   *
   * @throws std::invalid_argument if the project or instance ids are empty or contain a '/'.
   */
  table_admin_options(
      std::string project_id, std::string instance_id, retry_options retry = retry_options(),
      call_metadata metadata = call_metadata());

  std::string const& project_id() const {
    return project_id_;
  }
  std::string const& instance_id() const {
    return instance_id_;
  }
  retry_options const& retry() const {
    return retry_;
  }
  call_metadata const& metadata() const {
    return metadata_;
  }

  /// The resource name of the instance.
  std::string const& instance_name() const {
    return instance_name_;
  }

  /**
   * The resource name of a table.
   *
   * @throws std::invalid_argument if @a table_id is empty or contains a '/'.
   */
  std::string table_name(std::string const& table_id) const;

  /**
   * Extract the table id from the resource name of a table in this instance.
   *
   * @throws std::invalid_argument if @a table_name does not name a table in this instance.
   */
  std::string table_id(std::string const& table_name) const;

  /**
   * The resource name of a cluster in this instance.
   *
   * The cluster id "-" names all the clusters, which is only valid when listing snapshots.
   *
   * @throws std::invalid_argument if @a cluster_id is empty or contains a '/'.
   */
  std::string cluster_name(std::string const& cluster_id) const;

  /// The resource name of a snapshot.
  std::string snapshot_name(std::string const& cluster_id, std::string const& snapshot_id) const;

  /**
   * Split the resource name of a snapshot into its cluster and snapshot ids.
   *
   * @throws std::invalid_argument if @a snapshot_name does not name a snapshot in this instance.
   */
  std::pair<std::string, std::string> parse_snapshot_name(std::string const& snapshot_name) const;

  table_admin_options with_retry(retry_options retry) const;
  table_admin_options with_metadata(call_metadata metadata) const;

private:
  std::string project_id_;
  std::string instance_id_;
  retry_options retry_;
  call_metadata metadata_;
  std::string instance_name_;
};

} // namespace bta

#endif // bta_table_admin_options_hpp
