#pragma once

#include <memory>
#include <string>
#include <utility>

#include "sam3/connection.hpp"
#include "sam3/keys.hpp"
#include "sam3/line_codec.hpp"

namespace sam3 {

// A tunnel the bridge confirmed. The bridge keeps the tunnel alive for as long
// as the owned connection stays open.
class Session {
 public:
  Session(std::string id, Style style, Keys keys, std::unique_ptr<Connection> conn);

  const std::string& id() const { return id_; }
  Style style() const { return style_; }
  const Keys& keys() const { return keys_; }

  // Throws std::logic_error once the connection was released.
  Connection& connection();
  // Hands the connection to the caller; the session no longer closes it.
  std::unique_ptr<Connection> release() { return std::move(conn_); }

  bool isOpen() const { return conn_ && conn_->isOpen(); }
  void close();

 private:
  std::string id_;
  Style style_;
  Keys keys_;
  std::unique_ptr<Connection> conn_;
};

}  // namespace sam3
