#include "sam3/framing.hpp"

#include <memory>
#include <utility>

namespace sam3 {

void asyncReadLine(boost::asio::ip::tcp::socket& socket, std::string& pending, size_t maxBytes,
                   std::function<void(const boost::system::error_code&, std::string)> cb) {
  boost::asio::async_read_until(
      socket, boost::asio::dynamic_buffer(pending, maxBytes), '\n',
      [&pending, cb = std::move(cb)](const boost::system::error_code& ec, std::size_t n) mutable {
        if (ec) return cb(ec, {});
        std::string line = pending.substr(0, n);
        pending.erase(0, n);
        cb(ec, std::move(line));
      });
}

void asyncWriteLine(boost::asio::ip::tcp::socket& socket, std::string line,
                    std::function<void(const boost::system::error_code&)> cb) {
  auto out = std::make_shared<std::string>(std::move(line));
  boost::asio::async_write(socket, boost::asio::buffer(*out),
                           [out, cb = std::move(cb)](const boost::system::error_code& ec,
                                                    std::size_t) mutable { cb(ec); });
}

}  // namespace sam3
