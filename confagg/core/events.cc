// Copyright 2025 Ant Group Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "confagg/core/events.h"

#include "google/protobuf/util/json_util.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

namespace confagg {

size_t MemoryEventSink::Count(LedgerEvent::EventCase event_case) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t cnt = 0;
  for (const auto& event : events_) {
    if (event.event_case() == event_case) {
      cnt++;
    }
  }
  return cnt;
}

std::string EventToJson(const LedgerEvent& event) {
  google::protobuf::util::JsonPrintOptions json_print_options;
  json_print_options.preserve_proto_field_names = true;

  std::string event_json;
  YACL_ENFORCE(google::protobuf::util::MessageToJsonString(event, &event_json,
                                                           json_print_options)
                   .ok());
  return event_json;
}

void LoggingEventSink::Emit(const LedgerEvent& event) {
  SPDLOG_INFO("event: {}", EventToJson(event));
}

JsonLinesEventSink::JsonLinesEventSink(const std::filesystem::path& path) {
  out_.open(path, std::ios::out | std::ios::app);
  YACL_ENFORCE(out_.is_open(), "couldn't open event log {}", path.string());
}

void JsonLinesEventSink::Emit(const LedgerEvent& event) {
  std::string line = EventToJson(event);
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
}

}  // namespace confagg
