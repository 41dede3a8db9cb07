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
#include "bta/table_admin_options.hpp"

#include <sstream>
#include <stdexcept>

namespace {
void validate_id(char const* what, std::string const& id) {
  if (id.empty() or id.find('/') != std::string::npos) {
    std::ostringstream os;
    os << "table_admin_options - invalid " << what << " <" << id << ">, must be non-empty and cannot contain '/'";
    throw std::invalid_argument(os.str());
  }
}
} // anonymous namespace

namespace bta {

table_admin_options::table_admin_options(
    std::string project_id, std::string instance_id, retry_options retry, call_metadata metadata)
    : project_id_(std::move(project_id))
    , instance_id_(std::move(instance_id))
    , retry_(std::move(retry))
    , metadata_(std::move(metadata))
    , instance_name_() {
  validate_id("project_id", project_id_);
  validate_id("instance_id", instance_id_);
  instance_name_ = "projects/" + project_id_ + "/instances/" + instance_id_;
}

std::string table_admin_options::table_name(std::string const& table_id) const {
  validate_id("table_id", table_id);
  return instance_name_ + "/tables/" + table_id;
}

std::string table_admin_options::table_id(std::string const& table_name) const {
  std::string const prefix = instance_name_ + "/tables/";
  if (table_name.compare(0, prefix.size(), prefix) != 0 or table_name.size() == prefix.size()) {
    std::ostringstream os;
    os << "table_admin_options::table_id() - <" << table_name << "> is not a table in " << instance_name_;
    throw std::invalid_argument(os.str());
  }
  return table_name.substr(prefix.size());
}

std::string table_admin_options::cluster_name(std::string const& cluster_id) const {
  validate_id("cluster_id", cluster_id);
  return instance_name_ + "/clusters/" + cluster_id;
}

std::string table_admin_options::snapshot_name(std::string const& cluster_id, std::string const& snapshot_id) const {
  validate_id("snapshot_id", snapshot_id);
  return cluster_name(cluster_id) + "/snapshots/" + snapshot_id;
}

std::pair<std::string, std::string> table_admin_options::parse_snapshot_name(std::string const& snapshot_name) const {
  std::string const prefix = instance_name_ + "/clusters/";
  auto invalid = [&snapshot_name, this]() {
    std::ostringstream os;
    os << "table_admin_options::parse_snapshot_name() - <" << snapshot_name << "> is not a snapshot in "
       << instance_name_;
    return std::invalid_argument(os.str());
  };
  if (snapshot_name.compare(0, prefix.size(), prefix) != 0) {
    throw invalid();
  }
  auto const separator = std::string("/snapshots/");
  auto pos = snapshot_name.find(separator, prefix.size());
  if (pos == std::string::npos or pos == prefix.size()) {
    throw invalid();
  }
  auto cluster_id = snapshot_name.substr(prefix.size(), pos - prefix.size());
  auto snapshot_id = snapshot_name.substr(pos + separator.size());
  if (cluster_id.find('/') != std::string::npos or snapshot_id.empty() or snapshot_id.find('/') != std::string::npos) {
    throw invalid();
  }
  return {cluster_id, snapshot_id};
}

table_admin_options table_admin_options::with_retry(retry_options retry) const {
  table_admin_options tmp(*this);
  tmp.retry_ = std::move(retry);
  return tmp;
}

table_admin_options table_admin_options::with_metadata(call_metadata metadata) const {
  table_admin_options tmp(*this);
  tmp.metadata_ = std::move(metadata);
  return tmp;
}

} // namespace bta
