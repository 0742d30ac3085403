#include "sam3/config.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace sam3 {
namespace {

bool readTextFile(const std::string& path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  out = std::move(s);
  return true;
}

std::string trim(std::string s) {
  auto is_ws = [](unsigned char c) { return std::isspace(c); };
  while (!s.empty() && is_ws(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && is_ws(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

std::chrono::milliseconds parseMillis(const std::string& val) {
  size_t used = 0;
  const long long ms = std::stoll(val, &used);
  if (used != val.size() || ms < 0) throw std::invalid_argument("expected a non-negative integer");
  return std::chrono::milliseconds(ms);
}

bool parseBool(const std::string& val) {
  if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
  if (val == "0" || val == "false" || val == "no" || val == "off") return false;
  throw std::invalid_argument("expected a boolean");
}

}  // namespace

Config defaultConfig() { return Config{}; }

Config loadConfig(const std::string& path) {
  Config cfg = defaultConfig();

  std::string raw;
  if (!readTextFile(path, raw)) {
    std::cerr << "config not found, using defaults: " << path << "\n";
    return cfg;
  }

  for (size_t i = 0; i < raw.size();) {
    size_t j = raw.find('\n', i);
    if (j == std::string::npos) j = raw.size();
    std::string line = trim(raw.substr(i, j - i));
    i = j + 1;
    if (line.empty() || line[0] == '#') continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));

    try {
      if (key == "sam_address") {
        if (val.empty()) throw std::invalid_argument("empty address");
        cfg.sam_address = val;
      } else if (key == "connect_timeout_ms") {
        cfg.connect_timeout = parseMillis(val);
      } else if (key == "io_timeout_ms") {
        cfg.io_timeout = parseMillis(val);
      } else if (key == "keys_file") {
        cfg.keys_file = val;
      } else if (key == "option") {
        // option=inbound.length=2
        if (val.find('=') == std::string::npos) throw std::invalid_argument("expected KEY=VALUE");
        cfg.tunnel_options.push_back(val);
      } else if (key == "verbose") {
        cfg.verbose = parseBool(val);
      } else {
        std::cerr << "unknown config key ignored: " << key << "\n";
      }
    } catch (const std::exception& e) {
      std::cerr << "config parse error for key=" << key << ": " << e.what() << "\n";
    }
  }

  return cfg;
}

}  // namespace sam3
