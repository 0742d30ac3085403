#include "sam3/session.hpp"

#include <stdexcept>
#include <utility>

namespace sam3 {

Session::Session(std::string id, Style style, Keys keys, std::unique_ptr<Connection> conn)
    : id_(std::move(id)), style_(style), keys_(std::move(keys)), conn_(std::move(conn)) {}

Connection& Session::connection() {
  if (!conn_) throw std::logic_error("session connection was released: " + id_);
  return *conn_;
}

void Session::close() {
  if (conn_) conn_->close();
}

}  // namespace sam3
