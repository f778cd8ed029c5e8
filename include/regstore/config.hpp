#pragma once

#include <regstore/store.hpp>

#include <string>
#include <vector>

namespace regstore {

/**
 * Tool configuration: store options plus logging.
 */
struct Config {
  Options store;
  std::string log_level = "info";

  // Positional arguments (command and operands) left over by LoadFromArgs.
  std::vector<std::string> command;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments. Positional arguments
   * are collected into command.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace regstore
