/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tfleet {

struct CpuTimes {
  unsigned long long user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0,
                     steal = 0;

  unsigned long long idle_total() const { return idle + iowait; }
  unsigned long long busy_total() const { return user + nice + system + irq + softirq + steal; }
};

/**
 * @brief Host CPU utilization and process resident memory for heartbeats. CPU is the busy share
 * of the aggregate /proc/stat counters since the previous sample, so the first sample reports 0.
 */
class ResourceSampler {
public:
  ResourceSampler() = default;

  ResourceSnapshot sample();

  /**
   * @brief Parses the aggregate "cpu" line of a /proc/stat dump.
   */
  static std::optional<CpuTimes> parse_cpu_times(const std::string &proc_stat);

  /**
   * @brief VmRSS of a /proc/<pid>/status dump, in bytes.
   */
  static std::optional<uint64_t> parse_resident_bytes(const std::string &proc_status);

  static float cpu_percent_between(const CpuTimes &before, const CpuTimes &after);

private:
  std::mutex mutex_;
  std::optional<CpuTimes> previous_;
};

} // namespace tfleet
