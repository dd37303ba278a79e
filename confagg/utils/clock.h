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

#include <atomic>
#include <cstdint>

namespace confagg {

// Source of wall-clock seconds for cooldowns and request expiry.
class IClock {
 public:
  virtual ~IClock() = default;

  // Seconds since the unix epoch.
  virtual int64_t NowSeconds() const = 0;
};

class SystemClock : public IClock {
 public:
  int64_t NowSeconds() const override;
};

class ManualClock : public IClock {
 public:
  explicit ManualClock(int64_t start = 0) : now_(start) {}

  int64_t NowSeconds() const override { return now_.load(); }

  void Set(int64_t now) { now_.store(now); }

  void Advance(int64_t seconds) { now_.fetch_add(seconds); }

 private:
  std::atomic<int64_t> now_;
};

}  // namespace confagg
