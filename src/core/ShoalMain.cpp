/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/SettingsManager.hpp"
#include "managers/SimulationManager.hpp"
#include "simulation/SimulationTypes.hpp"
#include "utils/PayloadSerializer.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace ShoalEngine;

namespace {

const std::string APP_NAME{"Shoal Engine"};
const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

struct CommandLine {
  int ticks{10};
  std::string settingsPath{DEFAULT_SETTINGS_PATH};
  std::optional<std::string> mode;
  std::optional<int> agents;
};

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--ticks N] [--mode swarm|torus|hpp|dpp] [--agents N] [--settings PATH]\n";
}

std::optional<int> parseInt(std::string_view text) {
  int value = 0;
  auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << '\n';
      return std::nullopt;
    }
    const std::string_view value = argv[++i];

    if (arg == "--ticks" || arg == "--agents") {
      auto number = parseInt(value);
      if (!number) {
        std::cerr << "Expected an integer for " << arg << ", got '" << value << "'\n";
        return std::nullopt;
      }
      if (arg == "--ticks") {
        cmd.ticks = *number;
      } else {
        cmd.agents = *number;
      }
    } else if (arg == "--mode") {
      cmd.mode = std::string(value);
    } else if (arg == "--settings") {
      cmd.settingsPath = std::string(value);
    } else {
      std::cerr << "Unknown argument " << arg << '\n';
      return std::nullopt;
    }
  }
  if (cmd.ticks < 0) {
    std::cerr << "--ticks must not be negative\n";
    return std::nullopt;
  }
  return cmd;
}

// Streams cmd.ticks tick payloads of one simulation to stdout as JSON lines
int runSimulation(const CommandLine& cmd, const SimulationSettings& settings) {
  auto& manager = SimulationManager::Instance();
  const SimulationID id = manager.create(settings);
  auto simulation = manager.get(id);
  if (!simulation) {
    SHOAL_MAIN_CRITICAL("Simulation " + std::to_string(id) + " was not registered");
    return 1;
  }

  auto channel = simulation->registerSubscriber();
  if (!channel) {
    SHOAL_MAIN_CRITICAL("Could not subscribe to simulation " + std::to_string(id));
    manager.remove(id);
    return 1;
  }
  std::cout << PayloadSerializer::snapshotToJson(simulation->snapshot()).toString() << '\n';

  // Ten intervals, at least one second; the interval is bounded by validate()
  const auto timeout = std::chrono::milliseconds(std::max<long long>(
      1000, static_cast<long long>(static_cast<double>(settings.updateInterval) * 10000.0)));

  int exitCode = 0;
  int received = 0;
  while (received < cmd.ticks) {
    auto message = channel->pop(timeout);
    if (!message) {
      SHOAL_MAIN_ERROR("Timed out waiting for tick " + std::to_string(received + 1));
      exitCode = 1;
      break;
    }
    std::cout << PayloadSerializer::messageToJson(*message).toString() << '\n';
    if (message->isTerminal()) {
      exitCode = message->type == MessageType::Fault ? 1 : 0;
      break;
    }
    ++received;
  }

  // Removing while still subscribed delivers the shutdown marker to our channel
  manager.remove(id);

  // Skip ticks that arrived after the last counted one; print the shutdown
  while (auto message = channel->tryPop()) {
    if (message->isTerminal()) {
      std::cout << PayloadSerializer::messageToJson(*message).toString() << '\n';
    }
  }
  std::cout.flush();
  return exitCode;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  auto cmd = parseCommandLine(argc, argv);
  if (!cmd) {
    printUsage(argv[0]);
    return 2;
  }

  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile(cmd->settingsPath)) {
    SHOAL_MAIN_WARN("Failed to load " + cmd->settingsPath + " - using defaults");
  }
  Logger::SetLogDirectory(settingsManager.get<std::string>("logging", "directory", "logs"));
  Logger::SetMaxLogFiles(
      static_cast<size_t>(std::max(1, settingsManager.get<int>("logging", "max_files", 5))));

  if (cmd->mode) {
    settingsManager.set("simulation", "mode", *cmd->mode);
  }
  if (cmd->agents) {
    settingsManager.set("simulation", "num_agents", *cmd->agents);
  }

  SimulationSettings settings;
  try {
    settings = SimulationSettings::fromSettings(settingsManager);
  } catch (const InvalidConfigurationError& e) {
    SHOAL_MAIN_CRITICAL(e.what());
    std::cerr << e.what() << '\n';
    return 2;
  }

  SHOAL_MAIN_INFO("Initializing " + APP_NAME);
  auto& threadSystem = ThreadSystem::Instance();
  if (!threadSystem.init()) {
    THREADSYSTEM_CRITICAL("Failed to initialize thread system");
    return 1;
  }

  auto& manager = SimulationManager::Instance();
  manager.init();

  int exitCode = 0;
  try {
    exitCode = runSimulation(*cmd, settings);
  } catch (const std::exception& e) {
    SHOAL_MAIN_CRITICAL("Simulation run failed: " + std::string(e.what()));
    exitCode = 1;
  }

  SHOAL_MAIN_INFO(APP_NAME + " shutting down");
  manager.clean();
  threadSystem.clean();
  return exitCode;
}
