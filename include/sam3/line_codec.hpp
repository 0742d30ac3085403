#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sam3/keys.hpp"

namespace sam3 {

enum class Style { Stream, Datagram, Raw };

const char* styleName(Style style);
std::optional<Style> parseStyle(std::string_view name);

struct SessionRequest {
  Style style{Style::Stream};
  std::string id;
  Keys keys;
  std::vector<std::string> options;  // KEY=VALUE, sent as OPTION=KEY=VALUE
  std::vector<std::string> extras;   // appended verbatim
};

constexpr std::string_view kHelloOk = "HELLO REPLY RESULT=OK VERSION=3.0\n";
constexpr std::string_view kHelloNoVersion = "HELLO REPLY RESULT=NOVERSION\n";
constexpr std::string_view kNamingReplyHeader = "NAMING REPLY ";
constexpr std::string_view kSessionOk = "SESSION STATUS RESULT=OK DESTINATION=";
constexpr std::string_view kSessionDuplicatedId = "SESSION STATUS RESULT=DUPLICATED_ID\n";
constexpr std::string_view kSessionDuplicatedDest = "SESSION STATUS RESULT=DUPLICATED_DEST\n";
constexpr std::string_view kSessionInvalidKey = "SESSION STATUS RESULT=INVALID_KEY\n";
constexpr std::string_view kSessionI2pError = "SESSION STATUS RESULT=I2P_ERROR MESSAGE=";

// Whitespace-separated tokens of reply, ignoring its first `skip` bytes.
std::vector<std::string> tokenize(std::string_view reply, size_t skip = 0);

std::string encodeHello();
std::string encodeDestGenerate();
// Throws std::invalid_argument when name is empty or contains whitespace.
std::string encodeNamingLookup(std::string_view name);
// Throws std::invalid_argument when the request cannot be written as one command line.
std::string encodeSessionCreate(const SessionRequest& req);

enum class HelloResult { Ok, NoVersion, Unrecognized };

HelloResult decodeHelloReply(std::string_view reply);

bool decodeDestReply(std::string_view reply, Keys& out, std::string& err);

struct NamingReplyWire {
  std::optional<Address> value;
  std::string error;  // accumulated failure text when value is empty
};

// Returns false only when the reply does not follow the NAMING REPLY grammar.
bool decodeNamingReply(std::string_view reply, std::string_view name, NamingReplyWire& out,
                       std::string& err);

enum class SessionStatus { Ok, DuplicatedId, DuplicatedDest, InvalidKey, I2pError, Unrecognized };

struct SessionStatusWire {
  SessionStatus status{SessionStatus::Unrecognized};
  // Ok: echoed destination. I2pError: bridge message. Unrecognized: raw reply.
  std::string detail;
};

SessionStatusWire decodeSessionStatus(std::string_view reply);

}  // namespace sam3
