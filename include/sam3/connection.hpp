#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace sam3 {

struct Timeouts {
  // Zero waits forever.
  std::chrono::milliseconds connect{0};
  std::chrono::milliseconds io{0};
};

// Blocking TCP connection to a SAM bridge. Each operation runs one asynchronous
// step on a private io_context and waits for it, so a deadline can cancel it.
// Failures throw sam3::Error with Errc::Transport.
class Connection {
 public:
  explicit Connection(Timeouts timeouts = {});
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // endpoint is "host:port" or "[v6-address]:port".
  void connect(const std::string& endpoint);

  void send(const std::string& line);
  // Resumes after partial writes; at most maxAttempts write calls.
  void sendBounded(std::string_view data, int maxAttempts);
  // One '\n'-terminated reply, newline included. Throws Errc::Protocol when the
  // line exceeds maxBytes.
  std::string readReply(size_t maxBytes);

  void close();
  bool isOpen() const { return socket_.is_open(); }

  boost::asio::ip::tcp::socket& socket() { return socket_; }
  // Bytes received after the last reply line.
  const std::string& pending() const { return pending_; }

 private:
  bool run(std::chrono::milliseconds timeout);

  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::string pending_;
  Timeouts timeouts_;
};

bool splitEndpoint(const std::string& endpoint, std::string& host, std::string& port);

}  // namespace sam3
