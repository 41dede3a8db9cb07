#ifndef bta_table_model_hpp
#define bta_table_model_hpp
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

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace bta {

/// Describe a table to create.
struct table_spec {
  std::string table_id;
  /// The column families to create, and the maximum number of versions (0 means no garbage collection rule).
  std::map<std::string, int> column_families;
};

/// What the server reports about a table.
struct table_info {
  std::string table_id;
  /// The column families, in the order the server returns them (sorted by name).
  std::vector<std::string> column_families;
};

/// A change to the column families of a table.
struct column_family_modification {
  enum class action { create, update, drop };

  action what;
  std::string family;
  int max_versions;

  static column_family_modification create(std::string family, int max_versions = 0) {
    return column_family_modification{action::create, std::move(family), max_versions};
  }
  static column_family_modification update(std::string family, int max_versions) {
    return column_family_modification{action::update, std::move(family), max_versions};
  }
  static column_family_modification drop(std::string family) {
    return column_family_modification{action::drop, std::move(family), 0};
  }
};

/// What the server reports about a snapshot.
struct snapshot_info {
  std::string cluster_id;
  std::string snapshot_id;
  /// Empty if the server did not report the source table.
  std::string source_table_id;
  std::int64_t data_size_bytes;
  std::string description;
  bool ready;
};

/**
 * A long running operation started by the server.
 *
 * Snapshotting a table and creating a table from a snapshot complete in the background, the server returns the
 * operation to poll for completion.
 */
struct operation_info {
  std::string name;
  bool done;
  /// The status code and message of a failed operation, 0 and empty otherwise.
  int error_code;
  std::string error_message;
};

bool operator==(table_info const& lhs, table_info const& rhs);
inline bool operator!=(table_info const& lhs, table_info const& rhs) {
  return not(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, table_spec const& x);
std::ostream& operator<<(std::ostream& os, table_info const& x);
bool operator==(snapshot_info const& lhs, snapshot_info const& rhs);
inline bool operator!=(snapshot_info const& lhs, snapshot_info const& rhs) {
  return not(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, snapshot_info const& x);
std::ostream& operator<<(std::ostream& os, operation_info const& x);
std::ostream& operator<<(std::ostream& os, column_family_modification::action x);
std::ostream& operator<<(std::ostream& os, column_family_modification const& x);

} // namespace bta

#endif // bta_table_model_hpp
