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

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "google/protobuf/util/json_util.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

#include "confagg/launch.h"
#include "confagg/version.h"

#include "confagg/proto/ledger.pb.h"

DEFINE_string(config, "", "file path of launch config in JSON format.");
DEFINE_string(json, "", "config in JSON format.");

std::string GenerateVersion() {
  return fmt::format("v{}.{}.{}{}", CONFAGG_VERSION_MAJOR,
                     CONFAGG_VERSION_MINOR, CONFAGG_VERSION_PATCH,
                     CONFAGG_DEV_IDENTIFIER);
}

int main(int argc, char* argv[]) {
  gflags::SetVersionString(GenerateVersion());
  gflags::AllowCommandLineReparsing();
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  SPDLOG_INFO("confagg payroll ledger {}", GenerateVersion());

  std::string config_json;
  if (!FLAGS_json.empty()) {
    config_json = FLAGS_json;
  } else {
    YACL_ENFORCE(std::filesystem::exists(FLAGS_config),
                 "Config file[{}] doesn't exist.", FLAGS_config);
    std::fstream json_config_file(FLAGS_config, std::ios::in);
    config_json.assign(std::istreambuf_iterator<char>(json_config_file),
                       std::istreambuf_iterator<char>());
  }

  confagg::LaunchConfig launch_config;
  google::protobuf::util::JsonParseOptions json_parse_options;
  json_parse_options.ignore_unknown_fields = false;
  auto status = google::protobuf::util::JsonStringToMessage(
      config_json, &launch_config, json_parse_options);
  YACL_ENFORCE(status.ok(), "Launch config JSON string couldn't be parsed: {}",
               config_json);

  confagg::AggregationReport report =
      confagg::RunAggregationRound(launch_config);

  google::protobuf::util::JsonPrintOptions json_print_options;
  json_print_options.preserve_proto_field_names = true;
  std::string report_json;
  YACL_ENFORCE(google::protobuf::util::MessageToJsonString(
                   report, &report_json, json_print_options)
                   .ok());

  SPDLOG_INFO("Report: {}", report_json);
  return 0;
}
