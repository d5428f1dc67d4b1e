// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "benchmark/benchmark.h"
#include "fasttdms/fasttdms.h"
#include "fasttdms/testing/segment_builder.h"

namespace {

// Fixed seed for reproducible random access benchmarks
constexpr uint32_t kRandomSeed = 42;

constexpr int kChannelCount = 8;
constexpr int kValuesPerSegment = 1024;

std::string ChannelName(int i) {
  return fasttdms::ChannelPathString("bench", "ch" + std::to_string(i));
}

/// @brief In-memory file of `segments` segments with kChannelCount channels
std::vector<uint8_t> BuildFile(int segments, bool interleaved) {
  std::vector<uint8_t> file;
  std::vector<int32_t> values(kValuesPerSegment);
  for (int s = 0; s < segments; ++s) {
    fasttdms::testing::SegmentBuilder builder;
    if (s == 0) {
      builder.NewObjectList().Interleaved(interleaved);
      for (int c = 0; c < kChannelCount; ++c) {
        builder.AddChannel(ChannelName(c), fasttdms::DataType::kI32,
                           kValuesPerSegment);
      }
    } else {
      builder.WithoutMetadata().Interleaved(interleaved);
    }

    for (int i = 0; i < kValuesPerSegment; ++i) {
      values[i] = s * kValuesPerSegment + i;
    }
    std::vector<uint8_t> raw;
    for (int c = 0; c < kChannelCount; ++c) {
      auto bytes = fasttdms::testing::EncodeValues(values,
                                                   fasttdms::ByteOrder::kLittle);
      raw.insert(raw.end(), bytes.begin(), bytes.end());
    }
    // Interleaved values are not checked here, only the byte volume matters
    builder.RawData(raw).AppendTo(file);
  }
  return file;
}

/// @brief Shared file fixture
///
/// state.range(0): segment count, state.range(1): 1 for interleaved
class TdmsFixture : public benchmark::Fixture {
 public:
  void SetUp(const ::benchmark::State& state) override {
    segments_ = static_cast<int>(state.range(0));
    auto file_or = fasttdms::TdmsFile::Open(std::make_shared<fasttdms::MemorySource>(
        BuildFile(segments_, state.range(1) != 0)));
    init_success_ = file_or.ok();
    if (init_success_) {
      file_ = std::move(file_or).value();
    }
  }

  void TearDown(const ::benchmark::State& state) override { file_.reset(); }

 protected:
  std::unique_ptr<fasttdms::TdmsFile> file_;
  bool init_success_{false};
  int segments_{0};
};

/// @brief Planning cost of random windows over two channels
BENCHMARK_DEFINE_F(TdmsFixture, PlanRandomWindow)

(benchmark::State& state) {
  if (!init_success_) {
    state.SkipWithError("Failed to open benchmark file");
    return;
  }

  const uint64_t total = static_cast<uint64_t>(segments_) * kValuesPerSegment;
  const uint64_t window = kValuesPerSegment * 4;
  std::mt19937 rng(kRandomSeed);
  std::uniform_int_distribution<uint64_t> start_dist(0, total - window);

  for (auto _ : state) {
    const uint64_t start = start_dist(rng);
    fasttdms::ReadQuery query{
        {ChannelName(0), fasttdms::ValueRange{.start = start, .count = window}},
        {ChannelName(3), fasttdms::ValueRange{.start = start, .count = window}}};
    auto plan = file_->Plan(query);
    benchmark::DoNotOptimize(plan);
  }
}

/// @brief Full read of one channel; state.range(2) is the thread limit
BENCHMARK_DEFINE_F(TdmsFixture, ReadChannel)

(benchmark::State& state) {
  if (!init_success_) {
    state.SkipWithError("Failed to open benchmark file");
    return;
  }

  auto plan = file_->Plan(
      fasttdms::ReadQuery{{ChannelName(5), fasttdms::ValueRange::All()}});
  if (!plan.ok()) {
    state.SkipWithError("Failed to plan read");
    return;
  }

  fasttdms::ExecuteOptions options;
  options.max_threads = static_cast<uint32_t>(state.range(2));

  for (auto _ : state) {
    auto result = file_->Execute(*plan, options);
    if (!result.ok()) {
      state.SkipWithError("Read failed");
      return;
    }
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() *
                          static_cast<int64_t>(plan->cost.total_bytes_to_read));
}

}  // namespace

BENCHMARK_REGISTER_F(TdmsFixture, PlanRandomWindow)
    ->Args({64, 0})
    ->Args({64, 1})
    ->Args({1024, 0});

BENCHMARK_REGISTER_F(TdmsFixture, ReadChannel)
    ->Args({256, 0, 1})
    ->Args({256, 0, 0})
    ->Args({256, 1, 1})
    ->Args({256, 1, 0})
    ->UseRealTime();

BENCHMARK_MAIN();
