#pragma once

#include <boost/asio.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace sam3 {

// Replies are single lines terminated by '\n'. Bytes received past the newline
// stay in `pending` for the next read on the same socket. A line longer than
// maxBytes completes with boost::asio::error::not_found.
void asyncReadLine(boost::asio::ip::tcp::socket& socket, std::string& pending, size_t maxBytes,
                   std::function<void(const boost::system::error_code&, std::string)> cb);

void asyncWriteLine(boost::asio::ip::tcp::socket& socket, std::string line,
                    std::function<void(const boost::system::error_code&)> cb);

enum class WriteStatus { Complete, Failed, AttemptsExhausted };

// Writes data through repeated calls of
//   size_t writeSome(std::string_view rest, boost::system::error_code& ec)
// resuming after partial writes, giving up after maxAttempts calls.
template <typename WriteSome>
WriteStatus writeBounded(std::string_view data, int maxAttempts, WriteSome&& writeSome,
                         boost::system::error_code& ec) {
  size_t written = 0;
  for (int attempt = 0; written < data.size(); ++attempt) {
    if (attempt == maxAttempts) return WriteStatus::AttemptsExhausted;
    const size_t n = writeSome(data.substr(written), ec);
    if (ec) return WriteStatus::Failed;
    written += n;
  }
  return WriteStatus::Complete;
}

}  // namespace sam3
