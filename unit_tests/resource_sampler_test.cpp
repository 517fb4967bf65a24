/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "fleet/resource_sampler.hpp"
#include <gtest/gtest.h>

using namespace tfleet;

TEST(ResourceSamplerTest, ParsesAggregateCpuLine) {
  const std::string stat = "cpu  4705 356 584 3699176 23060 0 277 0 0 0\n"
                           "cpu0 1393 280 217 924829 5779 0 97 0 0 0\n"
                           "intr 114930548 113199788 3 0 5 263 0 4\n";
  auto times = ResourceSampler::parse_cpu_times(stat);
  ASSERT_TRUE(times.has_value());
  EXPECT_EQ(times->user, 4705u);
  EXPECT_EQ(times->idle, 3699176u);
  EXPECT_EQ(times->iowait, 23060u);
  EXPECT_EQ(times->softirq, 277u);
  EXPECT_EQ(times->idle_total(), 3699176u + 23060u);
}

TEST(ResourceSamplerTest, RejectsInputWithoutAggregateLine) {
  EXPECT_FALSE(ResourceSampler::parse_cpu_times("cpu0 1 2 3 4 5 6 7 8\n").has_value());
  EXPECT_FALSE(ResourceSampler::parse_cpu_times("").has_value());
  EXPECT_FALSE(ResourceSampler::parse_cpu_times("cpu 1 2 3\n").has_value());
}

TEST(ResourceSamplerTest, ParsesResidentSetSize) {
  const std::string status = "Name:\tfleet_worker\n"
                             "VmPeak:\t  300000 kB\n"
                             "VmRSS:\t   12345 kB\n"
                             "Threads:\t8\n";
  auto rss = ResourceSampler::parse_resident_bytes(status);
  ASSERT_TRUE(rss.has_value());
  EXPECT_EQ(*rss, 12345u * 1024u);

  EXPECT_FALSE(ResourceSampler::parse_resident_bytes("Name:\tx\n").has_value());
  EXPECT_FALSE(ResourceSampler::parse_resident_bytes("VmRSS:\tlots\n").has_value());
}

TEST(ResourceSamplerTest, CpuPercentFromTwoSamples) {
  CpuTimes before;
  before.user = 100;
  before.idle = 900;
  CpuTimes after = before;
  after.user += 30;
  after.system += 10;
  after.idle += 60;

  // 40 busy out of 100 elapsed ticks
  EXPECT_FLOAT_EQ(ResourceSampler::cpu_percent_between(before, after), 40.0f);
  EXPECT_FLOAT_EQ(ResourceSampler::cpu_percent_between(before, before), 0.0f);
  EXPECT_FLOAT_EQ(ResourceSampler::cpu_percent_between(after, before), 0.0f);
}

TEST(ResourceSamplerTest, SampleReportsOwnMemory) {
  ResourceSampler sampler;
  auto first = sampler.sample();
  EXPECT_GT(first.memory_used_bytes, 0u);
  EXPECT_FLOAT_EQ(first.cpu_percent, 0.0f);

  auto second = sampler.sample();
  EXPECT_GE(second.cpu_percent, 0.0f);
  EXPECT_LE(second.cpu_percent, 100.0f);
}
