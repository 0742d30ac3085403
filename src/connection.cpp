#include "sam3/connection.hpp"

#include <algorithm>
#include <utility>

#include "sam3/errors.hpp"
#include "sam3/framing.hpp"

namespace sam3 {

bool splitEndpoint(const std::string& endpoint, std::string& host, std::string& port) {
  const auto colon = endpoint.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) return false;
  host = endpoint.substr(0, colon);
  port = endpoint.substr(colon + 1);
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']') return false;
    host = host.substr(1, host.size() - 2);
  }
  return std::all_of(port.begin(), port.end(), [](char c) { return c >= '0' && c <= '9'; });
}

Connection::Connection(Timeouts timeouts) : socket_(io_), timeouts_(timeouts) {}

Connection::~Connection() { close(); }

bool Connection::run(std::chrono::milliseconds timeout) {
  io_.restart();
  if (timeout.count() <= 0) {
    io_.run();
    return true;
  }
  io_.run_for(timeout);
  if (io_.stopped()) return true;
  // Deadline hit: closing cancels the outstanding operation.
  boost::system::error_code ignored;
  socket_.close(ignored);
  io_.run();
  return false;
}

void Connection::connect(const std::string& endpoint) {
  std::string host;
  std::string port;
  if (!splitEndpoint(endpoint, host, port)) {
    throw Error(Errc::Transport, "invalid SAM address: " + endpoint);
  }

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_);
  const auto endpoints = resolver.resolve(host, port, ec);
  if (ec) throw Error(Errc::Transport, "unable to resolve " + endpoint + ": " + ec.message(), ec);

  ec = boost::asio::error::would_block;
  boost::asio::async_connect(
      socket_, endpoints,
      [&ec](const boost::system::error_code& result, const boost::asio::ip::tcp::endpoint&) {
        ec = result;
      });
  if (!run(timeouts_.connect)) ec = boost::asio::error::timed_out;
  if (ec) {
    close();
    throw Error(Errc::Transport, "unable to connect to SAM at " + endpoint + ": " + ec.message(),
                ec);
  }
}

void Connection::send(const std::string& line) {
  boost::system::error_code ec = boost::asio::error::would_block;
  asyncWriteLine(socket_, line, [&ec](const boost::system::error_code& result) { ec = result; });
  if (!run(timeouts_.io)) ec = boost::asio::error::timed_out;
  if (ec) throw Error(Errc::Transport, "writing to SAM failed: " + ec.message(), ec);
}

void Connection::sendBounded(std::string_view data, int maxAttempts) {
  boost::system::error_code ec;
  auto writeSome = [this](std::string_view rest, boost::system::error_code& writeEc) {
    size_t written = 0;
    writeEc = boost::asio::error::would_block;
    socket_.async_write_some(boost::asio::buffer(rest.data(), rest.size()),
                             [&](const boost::system::error_code& result, std::size_t n) {
                               writeEc = result;
                               written = n;
                             });
    if (!run(timeouts_.io)) writeEc = boost::asio::error::timed_out;
    return written;
  };

  switch (writeBounded(data, maxAttempts, writeSome, ec)) {
    case WriteStatus::Complete:
      return;
    case WriteStatus::Failed:
      throw Error(Errc::Transport, "writing to SAM failed: " + ec.message(), ec);
    case WriteStatus::AttemptsExhausted:
      throw Error(Errc::Transport, "writing to SAM failed");
  }
}

std::string Connection::readReply(size_t maxBytes) {
  boost::system::error_code ec = boost::asio::error::would_block;
  std::string reply;
  asyncReadLine(socket_, pending_, std::max(maxBytes, pending_.size()),
                [&](const boost::system::error_code& result, std::string line) {
                  ec = result;
                  reply = std::move(line);
                });
  if (!run(timeouts_.io)) ec = boost::asio::error::timed_out;

  if (ec) {
    // The rest of a failed reply is still in flight; nothing after it can be framed.
    close();
    pending_.clear();
  }
  if (ec == boost::asio::error::not_found) {
    throw Error(Errc::Protocol, "SAM reply exceeds " + std::to_string(maxBytes) + " bytes");
  }
  if (ec == boost::asio::error::eof) {
    throw Error(Errc::Transport, "connection closed by SAM bridge", ec);
  }
  if (ec) throw Error(Errc::Transport, "reading from SAM failed: " + ec.message(), ec);
  return reply;
}

void Connection::close() {
  if (!socket_.is_open()) return;
  boost::system::error_code ignored;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

}  // namespace sam3
