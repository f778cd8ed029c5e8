#include <regstore/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <regstore/version.hpp>

namespace regstore {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "regstore " << Version() << "\n"
            << "Usage: " << argv0 << " [options] <command> [args...]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --db-path <path>          Store path (default: ./regstore.db)\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nCommands:\n"
            << "  count <type>                          Number of records of type\n"
            << "  keys <type>                           Record keys of type\n"
            << "  dump <type> <key>                     Field layout of one record\n"
            << "  del <type> <key>...                   Delete records\n"
            << "  ns-init                               Create built-in namespaces\n"
            << "  ns-add <name> <owner> <token> [comment]\n"
            << "  ns-get <name>\n"
            << "  ns-list <owner>\n"
            << "  ns-token <name> <token>\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --db-path /data/regstore count service\n"
            << "  " << argv0 << " --config /etc/regstore/regstore.yaml ns-list polaris\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

int ParseInt(const std::string& key, const std::string& value) {
  try {
    return std::stoi(value);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
}

size_t ParseSize(const std::string& key, const std::string& value) {
  try {
    return static_cast<size_t>(std::stoull(value));
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid size for " + key + ": " + value);
  }
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("Malformed config line: " + line);
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "store") {
      if (key == "path") {
        config.store.path = value;
      } else if (key == "block_cache_bytes") {
        config.store.block_cache_bytes = ParseSize(key, value);
      } else if (key == "bloom_bits_per_key") {
        config.store.bloom_bits_per_key = ParseInt(key, value);
      } else if (key == "lock_timeout_ms") {
        config.store.lock_timeout_ms = ParseInt(key, value);
      } else if (key == "open_timeout_ms") {
        config.store.open_timeout_ms = ParseInt(key, value);
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "log_level") {
        config.log_level = value;
      } else if (key == "db_path") {
        config.store.path = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;
  std::string config_file;
  std::string db_path;
  std::string log_level;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      if (++i >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i];
    } else if (arg == "--db-path") {
      if (++i >= argc) {
        throw std::runtime_error("--db-path requires a path");
      }
      db_path = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        throw std::runtime_error("--log-level requires a level");
      }
      log_level = argv[i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      config.command.push_back(arg);
    }
  }

  // If a config file was specified, load it first then override with CLI args
  if (!config_file.empty()) {
    Config file_config = LoadFromFile(config_file);
    config.store = file_config.store;
    config.log_level = file_config.log_level;
  }
  if (!db_path.empty()) config.store.path = db_path;
  if (!log_level.empty()) config.log_level = log_level;

  return config;
}

void Config::Validate() const {
  if (store.path.empty()) {
    throw std::runtime_error("store path is required (use --db-path or config file)");
  }

  if (store.lock_timeout_ms <= 0) {
    throw std::runtime_error("Invalid lock_timeout_ms: " + std::to_string(store.lock_timeout_ms));
  }

  if (store.open_timeout_ms < 0) {
    throw std::runtime_error("Invalid open_timeout_ms: " + std::to_string(store.open_timeout_ms));
  }

  // Validate log level
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }
}

}  // namespace regstore
