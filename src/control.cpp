#include "sam3/control.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "sam3/errors.hpp"

namespace sam3 {

void handshake(Connection& conn) {
  conn.send(encodeHello());
  const std::string reply = conn.readReply(kHelloReplyMax);
  switch (decodeHelloReply(reply)) {
    case HelloResult::Ok:
      return;
    case HelloResult::NoVersion:
      throw Error(Errc::UnsupportedVersion, "SAM bridge does not support SAMv3");
    case HelloResult::Unrecognized:
      break;
  }
  throw Error(Errc::Protocol, reply);
}

Control::Control(Config config) : config_(std::move(config)) {
  conn_ = openConnection();
  if (config_.verbose) std::cerr << "[sam3] connected to " << config_.sam_address << "\n";
}

std::unique_ptr<Connection> Control::openConnection() const {
  auto conn =
      std::make_unique<Connection>(Timeouts{config_.connect_timeout, config_.io_timeout});
  conn->connect(config_.sam_address);
  handshake(*conn);
  return conn;
}

Connection& Control::conn() {
  if (!conn_ || !conn_->isOpen()) {
    throw Error(Errc::Transport, "control connection to " + config_.sam_address + " is closed");
  }
  return *conn_;
}

void Control::close() {
  if (conn_) conn_->close();
}

Keys Control::newKeys() {
  conn().send(encodeDestGenerate());
  const std::string reply = conn().readReply(kDestReplyMax);

  Keys keys;
  std::string err;
  if (!decodeDestReply(reply, keys, err)) throw Error(Errc::Parse, err);
  try {
    keys.addr().toBytes();
  } catch (const std::invalid_argument& e) {
    throw Error(Errc::Parse, "SAM bridge returned an undecodable destination: " +
                                 std::string(e.what()));
  }
  if (config_.verbose) {
    std::cerr << "[sam3] generated " << keys.addr().base64().substr(0, 16) << "...\n";
  }
  return keys;
}

Address Control::lookup(std::string_view name) {
  conn().send(encodeNamingLookup(name));
  const std::string reply = conn().readReply(kNamingReplyMax);

  NamingReplyWire wire;
  std::string err;
  if (!decodeNamingReply(reply, name, wire, err)) throw Error(Errc::Parse, err);
  if (!wire.value) throw Error(Errc::LookupFailed, wire.error);
  return *wire.value;
}

Session Control::newSession(const SessionRequest& req) {
  // Encoding validates the request before anything is dialed.
  const std::string command = encodeSessionCreate(req);

  // The control connection stays reserved for queries; the tunnel gets its own.
  std::unique_ptr<Connection> tunnel = openConnection();
  tunnel->sendBounded(command, kMaxWriteAttempts);
  const std::string reply = tunnel->readReply(kSessionReplyMax);

  auto reject = [&](Errc code, const std::string& message) {
    tunnel->close();
    if (config_.verbose) {
      std::cerr << "[sam3] session " << req.id << " rejected: " << message << "\n";
    }
    return Error(code, message);
  };

  const SessionStatusWire status = decodeSessionStatus(reply);
  switch (status.status) {
    case SessionStatus::Ok:
      if (status.detail != req.keys.toString()) {
        throw reject(Errc::Integrity,
                     "SAM bridge created a tunnel with different keys than requested");
      }
      if (config_.verbose) {
        std::cerr << "[sam3] session " << req.id << " (" << styleName(req.style) << ") created\n";
      }
      return Session(req.id, req.style, req.keys, std::move(tunnel));
    case SessionStatus::DuplicatedId:
      throw reject(Errc::DuplicateSessionId, "duplicate session id: " + req.id);
    case SessionStatus::DuplicatedDest:
      throw reject(Errc::DuplicateDestination, "duplicate destination");
    case SessionStatus::InvalidKey:
      throw reject(Errc::InvalidKey, "invalid key");
    case SessionStatus::I2pError:
      throw reject(Errc::Remote, "I2P error " + status.detail);
    case SessionStatus::Unrecognized:
      break;
  }
  throw reject(Errc::Parse, "unable to parse SAMv3 reply: " + status.detail);
}

Session Control::newSession(Style style, const std::string& id, const Keys& keys,
                            const std::vector<std::string>& options,
                            const std::vector<std::string>& extras) {
  SessionRequest req;
  req.style = style;
  req.id = id;
  req.keys = keys;
  req.options = options;
  req.extras = extras;
  return newSession(req);
}

Session Control::newStreamSession(const std::string& id, const Keys& keys,
                                  const std::vector<std::string>& options) {
  return newSession(Style::Stream, id, keys, options);
}

Session Control::newDatagramSession(const std::string& id, const Keys& keys,
                                    const std::vector<std::string>& options, uint16_t udpPort) {
  return newSession(Style::Datagram, id, keys, options, {"PORT=" + std::to_string(udpPort)});
}

Session Control::newRawSession(const std::string& id, const Keys& keys,
                               const std::vector<std::string>& options, uint16_t udpPort) {
  return newSession(Style::Raw, id, keys, options, {"PORT=" + std::to_string(udpPort)});
}

}  // namespace sam3
