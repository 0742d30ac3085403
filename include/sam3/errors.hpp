#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

namespace sam3 {

enum class Errc {
  Transport,
  UnsupportedVersion,
  Protocol,
  Parse,
  DuplicateSessionId,
  DuplicateDestination,
  InvalidKey,
  Remote,
  Integrity,
  LookupFailed,
};

const char* errcName(Errc code);

// Every failure reported by the bridge client. Transport failures also keep the
// socket-level error that caused them.
class Error : public std::runtime_error {
 public:
  Error(Errc code, const std::string& message);
  Error(Errc code, const std::string& message, boost::system::error_code cause);

  Errc code() const noexcept { return code_; }
  const boost::system::error_code& cause() const noexcept { return cause_; }

 private:
  Errc code_;
  boost::system::error_code cause_;
};

}  // namespace sam3
