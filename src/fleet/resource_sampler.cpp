/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/resource_sampler.hpp"

#include <fstream>
#include <sstream>

namespace tfleet {

namespace {

bool read_text_file(const char *path, std::string &out) {
  std::ifstream f(path);
  if (!f)
    return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

} // namespace

std::optional<CpuTimes> ResourceSampler::parse_cpu_times(const std::string &proc_stat) {
  std::istringstream iss(proc_stat);
  std::string cpu;
  iss >> cpu;
  if (cpu != "cpu") {
    return std::nullopt;
  }
  CpuTimes t;
  iss >> t.user >> t.nice >> t.system >> t.idle >> t.iowait >> t.irq >> t.softirq >> t.steal;
  if (iss.fail()) {
    return std::nullopt;
  }
  return t;
}

std::optional<uint64_t> ResourceSampler::parse_resident_bytes(const std::string &proc_status) {
  std::istringstream iss(proc_status);
  std::string line;
  while (std::getline(iss, line)) {
    if (line.rfind("VmRSS:", 0) != 0) {
      continue;
    }
    std::istringstream fields(line.substr(6));
    uint64_t kb = 0;
    if (!(fields >> kb)) {
      return std::nullopt;
    }
    return kb * 1024;
  }
  return std::nullopt;
}

float ResourceSampler::cpu_percent_between(const CpuTimes &before, const CpuTimes &after) {
  const auto total_before = before.idle_total() + before.busy_total();
  const auto total_after = after.idle_total() + after.busy_total();
  if (total_after <= total_before) {
    return 0.0f;
  }
  const double totald = double(total_after - total_before);
  const double idled = after.idle_total() >= before.idle_total()
                           ? double(after.idle_total() - before.idle_total())
                           : 0.0;
  double percent = 100.0 * (totald - idled) / totald;
  if (percent < 0.0)
    percent = 0.0;
  if (percent > 100.0)
    percent = 100.0;
  return static_cast<float>(percent);
}

ResourceSnapshot ResourceSampler::sample() {
  ResourceSnapshot snapshot;

  std::string text;
  if (read_text_file("/proc/stat", text)) {
    auto current = parse_cpu_times(text);
    if (current) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (previous_) {
        snapshot.cpu_percent = cpu_percent_between(*previous_, *current);
      }
      previous_ = current;
    }
  }

  if (read_text_file("/proc/self/status", text)) {
    snapshot.memory_used_bytes = parse_resident_bytes(text).value_or(0);
  }
  return snapshot;
}

} // namespace tfleet
