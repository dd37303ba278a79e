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

#include "confagg/utils/logging.h"

#include <map>

#include "boost/algorithm/string.hpp"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

namespace confagg {

void SetLogLevel(const std::string& level) {
  static const std::map<std::string, spdlog::level::level_enum> kLogLevelMap = {
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
      {"err", spdlog::level::err},     {"critical", spdlog::level::critical},
      {"off", spdlog::level::off}};
  static const std::string kDefaultLogLevel = "info";

  std::string normalized_level = boost::algorithm::to_lower_copy(level);
  if (normalized_level.empty()) {
    normalized_level = kDefaultLogLevel;
  }

  auto level_iter = kLogLevelMap.find(normalized_level);
  YACL_ENFORCE(level_iter != kLogLevelMap.end(),
               "unsupported logging level: {}", level);
  spdlog::set_level(level_iter->second);
  spdlog::flush_on(level_iter->second);
}

}  // namespace confagg
