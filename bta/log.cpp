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
#include "bta/log.hpp"

namespace {
std::once_flag log_initialized;
} // anonymous namespace

namespace bta {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  // ... messages arrive from the completion queue threads, take a snapshot of the sinks and release the lock before
  // calling them, a sink may be slow ...
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // Special case, very common and avoid copying the message ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto const& s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

logger<false>::logger(severity s, char const* func, char const* file, int l, log& sink)
    : os_()
    , sev_(s)
    , lineno_(0)
    , closed_(sev_ < sink.min_severity()) {
  if (closed_) {
    return;
  }
  function_ = func;
  filename_ = file;
  lineno_ = l;
  os_ << "[" << sev_ << "] ";
}

void logger<false>::write_to(log& sink) {
  closed_ = true;
  os_ << " in " << function_ << "(" << filename_ << ":" << lineno_ << ")";
  sink.write(sev_, os_.str());
}

} // namespace bta
