/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/config.hpp"
#include "fleet/coordinator_server.hpp"
#include "fleet/coordinator_service.hpp"
#include "fleet/error.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_shutdown_requested{false};
}

int main(int argc, char *argv[]) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
    std::cerr << "Example: " << argv[0] << " fleet.json" << std::endl;
    return 1;
  }

  tfleet::FleetConfig config;
  try {
    if (argc == 2) {
      config = tfleet::load_config(argv[1]);
    }
    tfleet::apply_env_overrides(config);
    tfleet::validate_config(config);
  } catch (const tfleet::FleetError &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Coordinator configuration:" << std::endl;
  std::cout << config.coordinator.to_json().dump(2) << std::endl;

  try {
    tfleet::CoordinatorService service(config.coordinator);
    tfleet::CoordinatorServer server(service, config.coordinator);

    std::signal(SIGINT, [](int) { g_shutdown_requested.store(true); });
    std::signal(SIGTERM, [](int) { g_shutdown_requested.store(true); });

    service.start();
    server.start();

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << '\n' << "Received interrupt signal, shutting down..." << std::endl;
    server.stop();
    service.stop();
  } catch (const std::exception &e) {
    std::cerr << "Coordinator failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
