#include "sam3/line_codec.hpp"
#include "sam3/options.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace sam3;

TEST_CASE("tokenize splits on any whitespace", "[codec][tokenize]")
{
  REQUIRE(tokenize("DEST REPLY  PUB=a\tPRIV=b\n") ==
          std::vector<std::string>{"DEST", "REPLY", "PUB=a", "PRIV=b"});
  REQUIRE(tokenize("   \n").empty());
  REQUIRE(tokenize("NAMING REPLY RESULT=OK", 13) == std::vector<std::string>{"RESULT=OK"});
  REQUIRE(tokenize("short", 13).empty());
}

TEST_CASE("fixed commands", "[codec][encode]")
{
  REQUIRE(encodeHello() == "HELLO VERSION MIN=3.0 MAX=3.0\n");
  REQUIRE(encodeDestGenerate() == "DEST GENERATE\n");
  REQUIRE(encodeNamingLookup("zzz.i2p") == "NAMING LOOKUP NAME=zzz.i2p\n");
  REQUIRE_THROWS_AS(encodeNamingLookup(""), std::invalid_argument);
  REQUIRE_THROWS_AS(encodeNamingLookup("two words"), std::invalid_argument);
}

TEST_CASE("session create lists options then extras in order", "[codec][encode]")
{
  SessionRequest req;
  req.style = Style::Datagram;
  req.id = "tun0";
  req.keys = Keys(Address("PUBKEY"), "PUBKEYPRIVKEY");
  req.options = {"inbound.length=1", "outbound.length=2", "inbound.length=1"};
  req.extras = {"PORT=7655", "HOST=127.0.0.1"};

  REQUIRE(encodeSessionCreate(req) ==
          "SESSION CREATE STYLE=DATAGRAM ID=tun0 DESTINATION=PUBKEYPRIVKEY "
          "OPTION=inbound.length=1 OPTION=outbound.length=2 OPTION=inbound.length=1 "
          "PORT=7655 HOST=127.0.0.1\n");

  req.options.clear();
  req.extras.clear();
  req.style = Style::Raw;
  REQUIRE(encodeSessionCreate(req) ==
          "SESSION CREATE STYLE=RAW ID=tun0 DESTINATION=PUBKEYPRIVKEY\n");
}

TEST_CASE("session create rejects requests that do not fit one line", "[codec][encode]")
{
  SessionRequest req;
  req.id = "tun0";
  req.keys = Keys(Address("P"), "PP");

  SECTION("empty id")
  {
    req.id.clear();
    REQUIRE_THROWS_AS(encodeSessionCreate(req), std::invalid_argument);
  }
  SECTION("id with a space")
  {
    req.id = "my tunnel";
    REQUIRE_THROWS_AS(encodeSessionCreate(req), std::invalid_argument);
  }
  SECTION("option without a value")
  {
    req.options = {"inbound.length"};
    REQUIRE_THROWS_AS(encodeSessionCreate(req), std::invalid_argument);
  }
  SECTION("extra with a newline")
  {
    req.extras = {"PORT=1\nDEST"};
    REQUIRE_THROWS_AS(encodeSessionCreate(req), std::invalid_argument);
  }
  SECTION("no keys")
  {
    req.keys = Keys();
    REQUIRE_THROWS_AS(encodeSessionCreate(req), std::invalid_argument);
  }
}

TEST_CASE("tunnel presets are valid options", "[codec][encode]")
{
  auto preset = GENERATE(as<std::vector<std::string>>{}, options::kDefault, options::kSmall,
                         options::kMedium, options::kLarge, options::kWide, options::kHumongous);
  SessionRequest req;
  req.id = "preset";
  req.keys = Keys(Address("P"), "PP");
  req.options = preset;
  const std::string line = encodeSessionCreate(req);
  REQUIRE(tokenize(line).size() == 5 + preset.size());
}

TEST_CASE("style names", "[codec][style]")
{
  REQUIRE(std::string(styleName(Style::Stream)) == "STREAM");
  REQUIRE(parseStyle("datagram") == Style::Datagram);
  REQUIRE(parseStyle("RAW") == Style::Raw);
  REQUIRE_FALSE(parseStyle("SOCKET").has_value());
}

TEST_CASE("hello replies", "[codec][hello]")
{
  REQUIRE(decodeHelloReply("HELLO REPLY RESULT=OK VERSION=3.0\n") == HelloResult::Ok);
  REQUIRE(decodeHelloReply("HELLO REPLY RESULT=NOVERSION\n") == HelloResult::NoVersion);

  auto other = GENERATE(as<std::string>{}, "", "\n", "HELLO REPLY RESULT=OK VERSION=3.1\n",
                        "HELLO REPLY RESULT=OK VERSION=3.0",
                        "HELLO REPLY RESULT=OK VERSION=3.0\n\n",
                        "hello reply result=ok version=3.0\n", "HELLO REPLY RESULT=I2P_ERROR\n",
                        std::string("HELLO\0REPLY\n", 12));
  REQUIRE(decodeHelloReply(other) == HelloResult::Unrecognized);
}

TEST_CASE("dest reply", "[codec][dest]")
{
  Keys keys;
  std::string err;

  SECTION("PUB before PRIV")
  {
    REQUIRE(decodeDestReply("DEST REPLY PUB=abc PRIV=xyz\n", keys, err));
    REQUIRE(keys.addr().base64() == "abc");
    REQUIRE(keys.privateKey() == "xyz");
  }
  SECTION("PRIV before PUB")
  {
    REQUIRE(decodeDestReply("DEST REPLY PRIV=xyz PUB=abc\n", keys, err));
    REQUIRE(keys.addr().base64() == "abc");
    REQUIRE(keys.toString() == "xyz");
  }
  SECTION("unknown token")
  {
    REQUIRE_FALSE(decodeDestReply("DEST REPLY PUB=abc FOO=bar\n", keys, err));
    REQUIRE(err.find("FOO=bar") != std::string::npos);
  }
  SECTION("missing PRIV")
  {
    REQUIRE_FALSE(decodeDestReply("DEST REPLY PUB=abc\n", keys, err));
    REQUIRE(err.find("PRIV") != std::string::npos);
  }
  SECTION("missing PUB")
  {
    REQUIRE_FALSE(decodeDestReply("DEST REPLY PRIV=xyz\n", keys, err));
  }
}

TEST_CASE("naming reply", "[codec][naming]")
{
  NamingReplyWire wire;
  std::string err;

  SECTION("resolved")
  {
    REQUIRE(decodeNamingReply("NAMING REPLY RESULT=OK NAME=foo.i2p VALUE=AAAA\n", "foo.i2p", wire,
                              err));
    REQUIRE(wire.value == Address("AAAA"));
  }
  SECTION("VALUE wins over earlier errors and stops the scan")
  {
    REQUIRE(decodeNamingReply(
        "NAMING REPLY RESULT=INVALID_KEY MESSAGE=odd VALUE=BBBB GARBAGE\n", "foo.i2p", wire, err));
    REQUIRE(wire.value == Address("BBBB"));
  }
  SECTION("not found")
  {
    REQUIRE(decodeNamingReply("NAMING REPLY RESULT=KEY_NOT_FOUND NAME=nonexistent.i2p\n",
                              "nonexistent.i2p", wire, err));
    REQUIRE_FALSE(wire.value.has_value());
    REQUIRE(wire.error.find("Unable to resolve nonexistent.i2p") != std::string::npos);
  }
  SECTION("errors accumulate in order")
  {
    REQUIRE(decodeNamingReply("NAMING REPLY RESULT=INVALID_KEY MESSAGE=bad MESSAGE=key\n", "x",
                              wire, err));
    REQUIRE(wire.error == "Invalid key. bad key");
  }
  SECTION("no result at all")
  {
    REQUIRE(decodeNamingReply("NAMING REPLY RESULT=OK\n", "x", wire, err));
    REQUIRE_FALSE(wire.value.has_value());
    REQUIRE(wire.error.empty());
  }
  SECTION("echo of another name")
  {
    REQUIRE_FALSE(decodeNamingReply("NAMING REPLY NAME=other.i2p VALUE=AAAA\n", "foo.i2p", wire,
                                    err));
    REQUIRE(err == "failed to parse lookup reply");
  }
  SECTION("unknown token")
  {
    REQUIRE_FALSE(decodeNamingReply("NAMING REPLY RESULT=OK FOO\n", "x", wire, err));
  }
  SECTION("wrong or short header")
  {
    REQUIRE_FALSE(decodeNamingReply("NAMING REPLY ", "x", wire, err));
    REQUIRE_FALSE(decodeNamingReply("NAMING", "x", wire, err));
    REQUIRE_FALSE(decodeNamingReply("DEST REPLY RESULT=OK VALUE=AAAA\n", "x", wire, err));
  }
}

TEST_CASE("session status literals map to exactly one outcome", "[codec][session]")
{
  using Row = std::tuple<std::string, SessionStatus, std::string>;
  auto row = GENERATE(table<std::string, SessionStatus, std::string>({
      Row{"SESSION STATUS RESULT=OK DESTINATION=KEYS\n", SessionStatus::Ok, "KEYS"},
      Row{"SESSION STATUS RESULT=DUPLICATED_ID\n", SessionStatus::DuplicatedId, ""},
      Row{"SESSION STATUS RESULT=DUPLICATED_DEST\n", SessionStatus::DuplicatedDest, ""},
      Row{"SESSION STATUS RESULT=INVALID_KEY\n", SessionStatus::InvalidKey, ""},
      Row{"SESSION STATUS RESULT=I2P_ERROR MESSAGE=tunnel build failed\n", SessionStatus::I2pError,
          "tunnel build failed"},
      Row{"SESSION STATUS RESULT=DUPLICATED_ID EXTRA\n", SessionStatus::Unrecognized,
          "SESSION STATUS RESULT=DUPLICATED_ID EXTRA\n"},
      Row{"SESSION STATUS RESULT=INVALID_KEY", SessionStatus::Unrecognized,
          "SESSION STATUS RESULT=INVALID_KEY"},
      Row{"SESSION STATUS RESULT=INVALID_ID\n", SessionStatus::Unrecognized,
          "SESSION STATUS RESULT=INVALID_ID\n"},
      Row{"", SessionStatus::Unrecognized, ""},
  }));

  const auto wire = decodeSessionStatus(std::get<0>(row));
  REQUIRE(wire.status == std::get<1>(row));
  REQUIRE(wire.detail == std::get<2>(row));
}
