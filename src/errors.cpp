#include "sam3/errors.hpp"

namespace sam3 {

const char* errcName(Errc code) {
  switch (code) {
    case Errc::Transport:
      return "transport error";
    case Errc::UnsupportedVersion:
      return "unsupported version";
    case Errc::Protocol:
      return "protocol error";
    case Errc::Parse:
      return "parse error";
    case Errc::DuplicateSessionId:
      return "duplicate session id";
    case Errc::DuplicateDestination:
      return "duplicate destination";
    case Errc::InvalidKey:
      return "invalid key";
    case Errc::Remote:
      return "I2P error";
    case Errc::Integrity:
      return "integrity error";
    case Errc::LookupFailed:
      return "lookup failed";
  }
  return "unknown error";
}

Error::Error(Errc code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

Error::Error(Errc code, const std::string& message, boost::system::error_code cause)
    : std::runtime_error(message), code_(code), cause_(cause) {}

}  // namespace sam3
