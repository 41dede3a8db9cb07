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
#include "bta/table_model.hpp"

#include <iostream>

namespace bta {

bool operator==(table_info const& lhs, table_info const& rhs) {
  return lhs.table_id == rhs.table_id and lhs.column_families == rhs.column_families;
}

std::ostream& operator<<(std::ostream& os, table_spec const& x) {
  os << "table_id=" << x.table_id << ", column_families={";
  char const* sep = "";
  for (auto const& kv : x.column_families) {
    os << sep << kv.first << ":" << kv.second;
    sep = ", ";
  }
  return os << "}";
}

std::ostream& operator<<(std::ostream& os, table_info const& x) {
  os << "table_id=" << x.table_id << ", column_families={";
  char const* sep = "";
  for (auto const& name : x.column_families) {
    os << sep << name;
    sep = ", ";
  }
  return os << "}";
}

bool operator==(snapshot_info const& lhs, snapshot_info const& rhs) {
  return lhs.cluster_id == rhs.cluster_id and lhs.snapshot_id == rhs.snapshot_id
      and lhs.source_table_id == rhs.source_table_id and lhs.data_size_bytes == rhs.data_size_bytes
      and lhs.description == rhs.description and lhs.ready == rhs.ready;
}

std::ostream& operator<<(std::ostream& os, snapshot_info const& x) {
  return os << "cluster_id=" << x.cluster_id << ", snapshot_id=" << x.snapshot_id
            << ", source_table_id=" << x.source_table_id << ", data_size_bytes=" << x.data_size_bytes
            << ", description=" << x.description << ", ready=" << std::boolalpha << x.ready;
}

std::ostream& operator<<(std::ostream& os, operation_info const& x) {
  os << "name=" << x.name << ", done=" << std::boolalpha << x.done;
  if (x.error_code != 0) {
    os << ", error=" << x.error_code << " " << x.error_message;
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, column_family_modification::action x) {
  switch (x) {
  case column_family_modification::action::create:
    return os << "create";
  case column_family_modification::action::update:
    return os << "update";
  case column_family_modification::action::drop:
    return os << "drop";
  }
  return os << "[invalid action]";
}

std::ostream& operator<<(std::ostream& os, column_family_modification const& x) {
  os << x.what << " " << x.family;
  if (x.what != column_family_modification::action::drop) {
    os << " max_versions=" << x.max_versions;
  }
  return os;
}

} // namespace bta
