#pragma once

#include <string>
#include <vector>

// I2CP tunnel option presets for Control::newSession. Longer tunnels are more
// anonymous, more tunnels carry more traffic.
namespace sam3::options {

inline const std::vector<std::string> kDefault = {
    "inbound.length=3",         "outbound.length=3",         "inbound.lengthVariance=0",
    "outbound.lengthVariance=0", "inbound.backupQuantity=1",  "outbound.backupQuantity=1",
    "inbound.quantity=1",       "outbound.quantity=1"};

inline const std::vector<std::string> kSmall = {
    "inbound.length=3",         "outbound.length=3",         "inbound.lengthVariance=0",
    "outbound.lengthVariance=0", "inbound.backupQuantity=0",  "outbound.backupQuantity=0",
    "inbound.quantity=1",       "outbound.quantity=1"};

inline const std::vector<std::string> kMedium = {
    "inbound.length=3",         "outbound.length=3",         "inbound.lengthVariance=0",
    "outbound.lengthVariance=0", "inbound.backupQuantity=0",  "outbound.backupQuantity=0",
    "inbound.quantity=2",       "outbound.quantity=2"};

inline const std::vector<std::string> kLarge = {
    "inbound.length=3",         "outbound.length=3",         "inbound.lengthVariance=0",
    "outbound.lengthVariance=0", "inbound.backupQuantity=1",  "outbound.backupQuantity=1",
    "inbound.quantity=4",       "outbound.quantity=4"};

// Short tunnels, many of them: throughput over anonymity.
inline const std::vector<std::string> kWide = {
    "inbound.length=1",         "outbound.length=1",         "inbound.lengthVariance=1",
    "outbound.lengthVariance=1", "inbound.backupQuantity=2",  "outbound.backupQuantity=2",
    "inbound.quantity=3",       "outbound.quantity=3"};

inline const std::vector<std::string> kHumongous = {
    "inbound.length=3",         "outbound.length=3",         "inbound.lengthVariance=1",
    "outbound.lengthVariance=1", "inbound.backupQuantity=3",  "outbound.backupQuantity=3",
    "inbound.quantity=6",       "outbound.quantity=6"};

}  // namespace sam3::options
