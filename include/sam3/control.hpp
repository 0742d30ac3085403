#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sam3/config.hpp"
#include "sam3/connection.hpp"
#include "sam3/keys.hpp"
#include "sam3/line_codec.hpp"
#include "sam3/session.hpp"

namespace sam3 {

constexpr size_t kHelloReplyMax = 256;
constexpr size_t kDestReplyMax = 8192;
constexpr size_t kNamingReplyMax = 4096;
constexpr size_t kSessionReplyMax = 4096;
constexpr int kMaxWriteAttempts = 15;

// Sends HELLO on an open connection and checks the bridge speaks SAM 3.0.
void handshake(Connection& conn);

// Control connection to a SAM bridge. Construction dials config.sam_address and
// performs the handshake. Calls must not overlap.
//
// Session creation uses a separate connection, so the control connection stays
// usable for key generation and lookups afterwards.
class Control {
 public:
  explicit Control(Config config);

  Control(Control&&) = default;
  Control& operator=(Control&&) = default;

  const std::string& endpoint() const { return config_.sam_address; }

  Keys newKeys();
  Address lookup(std::string_view name);

  Session newSession(const SessionRequest& req);
  Session newSession(Style style, const std::string& id, const Keys& keys,
                     const std::vector<std::string>& options = {},
                     const std::vector<std::string>& extras = {});
  Session newStreamSession(const std::string& id, const Keys& keys,
                           const std::vector<std::string>& options = {});
  // Datagrams are forwarded to udpPort on the host that created the session.
  Session newDatagramSession(const std::string& id, const Keys& keys,
                             const std::vector<std::string>& options, uint16_t udpPort);
  Session newRawSession(const std::string& id, const Keys& keys,
                        const std::vector<std::string>& options, uint16_t udpPort);

  // Does not affect sessions already created.
  void close();

 private:
  Connection& conn();
  std::unique_ptr<Connection> openConnection() const;

  Config config_;
  std::unique_ptr<Connection> conn_;
};

}  // namespace sam3
