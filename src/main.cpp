#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sam3/config.hpp"
#include "sam3/control.hpp"
#include "sam3/errors.hpp"
#include "sam3/keys.hpp"
#include "sam3/options.hpp"

namespace sam3 {
namespace {

struct CliArgs {
  std::string configPath = "config/sam3.conf";
  std::string samAddress;
  std::string outPath;
  std::string keysPath;
  uint16_t port = 0;
  bool verbose = false;
  std::vector<std::string> positional;
};

void printUsage() {
  std::cerr << "usage: sam3ctl [--config FILE] [--sam HOST:PORT] [--verbose] COMMAND\n"
               "  keys [--out FILE]                      generate a destination\n"
               "  lookup NAME                            resolve a name\n"
               "  session STYLE ID [--keys FILE] [--port N]\n"
               "                                         hold a session until stdin closes\n";
}

CliArgs parseArgs(int argc, char** argv) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
      return argv[++i];
    };
    if (arg == "--config") {
      args.configPath = value();
    } else if (arg == "--sam") {
      args.samAddress = value();
    } else if (arg == "--out") {
      args.outPath = value();
    } else if (arg == "--keys") {
      args.keysPath = value();
    } else if (arg == "--port") {
      const int port = std::stoi(value());
      if (port < 0 || port > 65535) throw std::invalid_argument("port out of range");
      args.port = static_cast<uint16_t>(port);
    } else if (arg == "--verbose") {
      args.verbose = true;
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("unknown option " + arg);
    } else {
      args.positional.push_back(arg);
    }
  }
  if (args.positional.empty()) throw std::invalid_argument("missing command");
  return args;
}

// Key files are not validated on load, so a bad destination only shows up here.
std::string b32Name(const Address& addr) {
  try {
    return addr.base32();
  } catch (const std::invalid_argument& e) {
    throw Error(Errc::Parse, "undecodable destination: " + std::string(e.what()));
  }
}

int runKeys(Control& control, const CliArgs& args) {
  const Keys keys = control.newKeys();
  std::cout << keys.addr().base64() << "\n" << b32Name(keys.addr()) << "\n";
  if (!args.outPath.empty()) {
    storeKeys(keys, args.outPath);
    std::cout << "keys written to " << args.outPath << "\n";
  }
  return 0;
}

int runLookup(Control& control, const CliArgs& args) {
  if (args.positional.size() != 2) throw std::invalid_argument("lookup takes one NAME");
  std::cout << control.lookup(args.positional[1]).base64() << "\n";
  return 0;
}

int runSession(Control& control, const CliArgs& args, const Config& cfg) {
  if (args.positional.size() != 3) throw std::invalid_argument("session takes STYLE and ID");
  const auto style = parseStyle(args.positional[1]);
  if (!style) throw std::invalid_argument("unknown style " + args.positional[1]);
  const std::string& id = args.positional[2];

  const std::string keysPath = args.keysPath.empty() ? cfg.keys_file : args.keysPath;
  const Keys keys = keysPath.empty() ? control.newKeys() : loadKeys(keysPath);
  const std::vector<std::string>& tunnelOptions =
      cfg.tunnel_options.empty() ? options::kDefault : cfg.tunnel_options;

  Session session = [&]() {
    switch (*style) {
      case Style::Datagram:
        return control.newDatagramSession(id, keys, tunnelOptions, args.port);
      case Style::Raw:
        return control.newRawSession(id, keys, tunnelOptions, args.port);
      case Style::Stream:
        break;
    }
    return control.newStreamSession(id, keys, tunnelOptions);
  }();

  std::cout << "session " << session.id() << " (" << styleName(session.style())
            << ") up at " << b32Name(session.keys().addr()) << "\n";
  std::cout << "close standard input to tear it down" << std::endl;
  for (std::string line; std::getline(std::cin, line);) {
  }
  session.close();
  return 0;
}

}  // namespace
}  // namespace sam3

int main(int argc, char** argv) {
  sam3::CliArgs args;
  try {
    args = sam3::parseArgs(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "sam3ctl: " << e.what() << "\n";
    sam3::printUsage();
    return 2;
  }

  auto cfg = sam3::loadConfig(args.configPath);
  if (!args.samAddress.empty()) cfg.sam_address = args.samAddress;
  if (args.verbose) cfg.verbose = true;

  const std::string& command = args.positional[0];
  if (command != "keys" && command != "lookup" && command != "session") {
    std::cerr << "sam3ctl: unknown command " << command << "\n";
    sam3::printUsage();
    return 2;
  }

  try {
    sam3::Control control(cfg);
    if (command == "keys") return sam3::runKeys(control, args);
    if (command == "lookup") return sam3::runLookup(control, args);
    return sam3::runSession(control, args, cfg);
  } catch (const sam3::Error& e) {
    std::cerr << "sam3ctl: " << sam3::errcName(e.code()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "sam3ctl: " << e.what() << "\n";
    sam3::printUsage();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "sam3ctl: " << e.what() << "\n";
    return 1;
  }
}
