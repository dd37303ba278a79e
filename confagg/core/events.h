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

#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "confagg/proto/ledger.pb.h"

namespace confagg {

class IEventSink {
 public:
  virtual ~IEventSink() = default;

  virtual void Emit(const LedgerEvent& event) = 0;
};

class MemoryEventSink : public IEventSink {
 public:
  void Emit(const LedgerEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<LedgerEvent> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  size_t Count(LedgerEvent::EventCase event_case) const;

 private:
  mutable std::mutex mutex_;
  std::vector<LedgerEvent> events_;
};

class LoggingEventSink : public IEventSink {
 public:
  void Emit(const LedgerEvent& event) override;
};

// One JSON object per line.
class JsonLinesEventSink : public IEventSink {
 public:
  explicit JsonLinesEventSink(const std::filesystem::path& path);

  void Emit(const LedgerEvent& event) override;

 private:
  std::mutex mutex_;
  std::ofstream out_;
};

// Forwards to every child sink in order.
class FanoutEventSink : public IEventSink {
 public:
  explicit FanoutEventSink(std::vector<std::shared_ptr<IEventSink>> sinks)
      : sinks_(std::move(sinks)) {}

  void Emit(const LedgerEvent& event) override {
    for (const auto& sink : sinks_) {
      sink->Emit(event);
    }
  }

 private:
  std::vector<std::shared_ptr<IEventSink>> sinks_;
};

std::string EventToJson(const LedgerEvent& event);

}  // namespace confagg
