#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sam3 {

struct Config {
  std::string sam_address{"127.0.0.1:7656"};
  // Zero waits forever.
  std::chrono::milliseconds connect_timeout{0};
  std::chrono::milliseconds io_timeout{0};
  std::string keys_file;
  std::vector<std::string> tunnel_options;  // I2CP KEY=VALUE pairs
  bool verbose{false};
};

Config defaultConfig();

// key=value lines, '#' comments. Falls back to defaults when the file is missing;
// malformed values are reported on stderr and skipped.
Config loadConfig(const std::string& path);

}  // namespace sam3
