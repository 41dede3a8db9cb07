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
#include "bta/status_code.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {
struct code_name {
  grpc::StatusCode code;
  char const* name;
};

code_name const known_codes[] = {
    {grpc::StatusCode::OK, "OK"},
    {grpc::StatusCode::CANCELLED, "CANCELLED"},
    {grpc::StatusCode::UNKNOWN, "UNKNOWN"},
    {grpc::StatusCode::INVALID_ARGUMENT, "INVALID_ARGUMENT"},
    {grpc::StatusCode::DEADLINE_EXCEEDED, "DEADLINE_EXCEEDED"},
    {grpc::StatusCode::NOT_FOUND, "NOT_FOUND"},
    {grpc::StatusCode::ALREADY_EXISTS, "ALREADY_EXISTS"},
    {grpc::StatusCode::PERMISSION_DENIED, "PERMISSION_DENIED"},
    {grpc::StatusCode::RESOURCE_EXHAUSTED, "RESOURCE_EXHAUSTED"},
    {grpc::StatusCode::FAILED_PRECONDITION, "FAILED_PRECONDITION"},
    {grpc::StatusCode::ABORTED, "ABORTED"},
    {grpc::StatusCode::OUT_OF_RANGE, "OUT_OF_RANGE"},
    {grpc::StatusCode::UNIMPLEMENTED, "UNIMPLEMENTED"},
    {grpc::StatusCode::INTERNAL, "INTERNAL"},
    {grpc::StatusCode::UNAVAILABLE, "UNAVAILABLE"},
    {grpc::StatusCode::DATA_LOSS, "DATA_LOSS"},
    {grpc::StatusCode::UNAUTHENTICATED, "UNAUTHENTICATED"},
};

std::string trim(std::string const& s) {
  auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return b < e ? std::string(b, e) : std::string();
}
} // anonymous namespace

namespace bta {

std::string status_code_name(grpc::StatusCode code) {
  for (auto const& k : known_codes) {
    if (k.code == code) {
      return k.name;
    }
  }
  return "UNKNOWN_STATUS_CODE(" + std::to_string(int(code)) + ")";
}

grpc::StatusCode parse_status_code(std::string const& name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
  for (auto const& k : known_codes) {
    if (upper == k.name) {
      return k.code;
    }
  }
  throw std::invalid_argument("parse_status_code() - unknown status code name <" + name + ">");
}

std::set<grpc::StatusCode> parse_status_code_list(std::string const& list) {
  std::set<grpc::StatusCode> codes;
  if (trim(list).empty()) {
    return codes;
  }
  std::istringstream is(list);
  std::string element;
  while (std::getline(is, element, ',')) {
    auto name = trim(element);
    if (name.empty()) {
      throw std::invalid_argument("parse_status_code_list() - empty element in <" + list + ">");
    }
    codes.insert(parse_status_code(name));
  }
  return codes;
}

} // namespace bta
