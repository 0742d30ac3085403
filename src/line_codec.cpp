#include "sam3/line_codec.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace sam3 {
namespace {

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool hasSpace(std::string_view s) {
  for (char c : s) {
    if (isSpace(c)) return true;
  }
  return false;
}

bool startsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string_view stripNewline(std::string_view s) {
  if (!s.empty() && s.back() == '\n') s.remove_suffix(1);
  return s;
}

void requireToken(std::string_view value, const char* what) {
  if (value.empty() || hasSpace(value)) {
    throw std::invalid_argument(std::string(what) +
                                " must be a non-empty token without whitespace");
  }
}

enum class NamingAction { Skip, InvalidKey, KeyNotFound, Message, Value };

struct NamingRule {
  std::string_view token;
  bool prefix;
  NamingAction action;
};

constexpr NamingRule kNamingRules[] = {
    {"RESULT=OK", false, NamingAction::Skip},
    {"RESULT=INVALID_KEY", false, NamingAction::InvalidKey},
    {"RESULT=KEY_NOT_FOUND", false, NamingAction::KeyNotFound},
    {"VALUE=", true, NamingAction::Value},
    {"MESSAGE=", true, NamingAction::Message},
};

}  // namespace

const char* styleName(Style style) {
  switch (style) {
    case Style::Stream:
      return "STREAM";
    case Style::Datagram:
      return "DATAGRAM";
    case Style::Raw:
      return "RAW";
  }
  return "STREAM";
}

std::optional<Style> parseStyle(std::string_view name) {
  std::string upper(name);
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (upper == "STREAM") return Style::Stream;
  if (upper == "DATAGRAM") return Style::Datagram;
  if (upper == "RAW") return Style::Raw;
  return std::nullopt;
}

std::vector<std::string> tokenize(std::string_view reply, size_t skip) {
  std::vector<std::string> tokens;
  if (skip >= reply.size()) return tokens;
  reply.remove_prefix(skip);
  size_t i = 0;
  while (i < reply.size()) {
    while (i < reply.size() && isSpace(reply[i])) ++i;
    size_t j = i;
    while (j < reply.size() && !isSpace(reply[j])) ++j;
    if (j > i) tokens.emplace_back(reply.substr(i, j - i));
    i = j;
  }
  return tokens;
}

std::string encodeHello() { return "HELLO VERSION MIN=3.0 MAX=3.0\n"; }

std::string encodeDestGenerate() { return "DEST GENERATE\n"; }

std::string encodeNamingLookup(std::string_view name) {
  requireToken(name, "name");
  std::string out = "NAMING LOOKUP NAME=";
  out.append(name);
  out.push_back('\n');
  return out;
}

std::string encodeSessionCreate(const SessionRequest& req) {
  requireToken(req.id, "session id");
  requireToken(req.keys.toString(), "destination");

  std::string out = "SESSION CREATE STYLE=";
  out += styleName(req.style);
  out += " ID=" + req.id;
  out += " DESTINATION=" + req.keys.toString();
  for (const auto& opt : req.options) {
    requireToken(opt, "option");
    if (opt.find('=') == std::string::npos) {
      throw std::invalid_argument("option must be KEY=VALUE: " + opt);
    }
    out += " OPTION=" + opt;
  }
  for (const auto& extra : req.extras) {
    requireToken(extra, "extra argument");
    out += " " + extra;
  }
  out.push_back('\n');
  return out;
}

HelloResult decodeHelloReply(std::string_view reply) {
  if (reply == kHelloOk) return HelloResult::Ok;
  if (reply == kHelloNoVersion) return HelloResult::NoVersion;
  return HelloResult::Unrecognized;
}

bool decodeDestReply(std::string_view reply, Keys& out, std::string& err) {
  std::string pub;
  std::string priv;
  for (const auto& token : tokenize(reply)) {
    if (token == "DEST" || token == "REPLY") {
      continue;
    } else if (startsWith(token, "PUB=")) {
      pub = token.substr(4);
    } else if (startsWith(token, "PRIV=")) {
      priv = token.substr(5);
    } else {
      err = "failed to parse keys: unexpected token " + token;
      return false;
    }
  }
  if (pub.empty() || priv.empty()) {
    err = pub.empty() ? "failed to parse keys: missing PUB="
                      : "failed to parse keys: missing PRIV=";
    return false;
  }
  out = Keys(Address(std::move(pub)), std::move(priv));
  return true;
}

bool decodeNamingReply(std::string_view reply, std::string_view name, NamingReplyWire& out,
                       std::string& err) {
  if (reply.size() <= kNamingReplyHeader.size() || !startsWith(reply, kNamingReplyHeader)) {
    err = "failed to parse lookup reply";
    return false;
  }
  const std::string nameEcho = "NAME=" + std::string(name);

  out.value.reset();
  out.error.clear();
  for (const auto& token : tokenize(reply, kNamingReplyHeader.size())) {
    if (token == nameEcho) continue;

    const NamingRule* rule = nullptr;
    for (const auto& candidate : kNamingRules) {
      if (candidate.prefix ? startsWith(token, candidate.token) : token == candidate.token) {
        rule = &candidate;
        break;
      }
    }
    if (rule == nullptr) {
      err = "failed to parse lookup reply";
      return false;
    }

    switch (rule->action) {
      case NamingAction::Skip:
        break;
      case NamingAction::InvalidKey:
        out.error += "Invalid key.";
        break;
      case NamingAction::KeyNotFound:
        out.error += "Unable to resolve ";
        out.error.append(name);
        break;
      case NamingAction::Message:
        out.error += " " + token.substr(rule->token.size());
        break;
      case NamingAction::Value:
        out.value = Address(token.substr(rule->token.size()));
        return true;
    }
  }
  return true;
}

SessionStatusWire decodeSessionStatus(std::string_view reply) {
  if (startsWith(reply, kSessionOk)) {
    return {SessionStatus::Ok, std::string(stripNewline(reply.substr(kSessionOk.size())))};
  }
  if (reply == kSessionDuplicatedId) return {SessionStatus::DuplicatedId, {}};
  if (reply == kSessionDuplicatedDest) return {SessionStatus::DuplicatedDest, {}};
  if (reply == kSessionInvalidKey) return {SessionStatus::InvalidKey, {}};
  if (startsWith(reply, kSessionI2pError)) {
    return {SessionStatus::I2pError,
            std::string(stripNewline(reply.substr(kSessionI2pError.size())))};
  }
  return {SessionStatus::Unrecognized, std::string(reply)};
}

}  // namespace sam3
