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

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/util/message_differencer.h"
#include "gtest/gtest.h"

namespace confagg {

namespace {

LedgerEvent MakeSubmitted(const std::string& identity) {
  LedgerEvent event;
  event.set_timestamp(1700000000);
  auto* submitted = event.mutable_contribution_submitted();
  submitted->set_identity(identity);
  submitted->set_provider("hr");
  submitted->set_batch_id(3);
  submitted->set_salary_handle("00ff");
  submitted->set_score_handle("ff00");
  return event;
}

TEST(EventsTest, JsonKeepsFieldNames) {
  std::string json = EventToJson(MakeSubmitted("alice"));
  EXPECT_NE(json.find("\"contribution_submitted\""), std::string::npos);
  EXPECT_NE(json.find("\"salary_handle\""), std::string::npos);
}

TEST(EventsTest, JsonLinesSink) {
  auto path = std::filesystem::temp_directory_path() /
              fmt::format("confagg_events_{}.jsonl",
                          ::testing::UnitTest::GetInstance()->random_seed());
  std::filesystem::remove(path);

  {
    JsonLinesEventSink sink(path);
    sink.Emit(MakeSubmitted("alice"));
    sink.Emit(MakeSubmitted("bob"));
  }

  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 2);

  LedgerEvent parsed;
  ASSERT_TRUE(
      google::protobuf::util::JsonStringToMessage(lines[1], &parsed).ok());
  EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(
      parsed, MakeSubmitted("bob")));

  std::filesystem::remove(path);
}

TEST(EventsTest, Fanout) {
  auto first = std::make_shared<MemoryEventSink>();
  auto second = std::make_shared<MemoryEventSink>();
  FanoutEventSink fanout({first, second, std::make_shared<LoggingEventSink>()});

  fanout.Emit(MakeSubmitted("alice"));
  EXPECT_EQ(first->Count(LedgerEvent::kContributionSubmitted), 1);
  EXPECT_EQ(second->events().size(), 1);
  EXPECT_EQ(second->Count(LedgerEvent::kBatchOpened), 0);
}

}  // namespace

}  // namespace confagg
