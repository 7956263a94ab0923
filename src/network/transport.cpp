// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/transport.hpp"

namespace nearlink {
namespace network {

const char *SessionStateName(SessionState state) {
  switch (state) {
  case SessionState::NOT_CONNECTED:
    return "not connected";
  case SessionState::CONNECTING:
    return "connecting";
  case SessionState::CONNECTED:
    return "connected";
  }
  return "unknown";
}

const char *TransportErrorName(TransportError error) {
  switch (error) {
  case TransportError::NO_PEERS:
    return "no peers";
  case TransportError::NOT_CONNECTED:
    return "not connected";
  case TransportError::PAYLOAD_TOO_LARGE:
    return "payload too large";
  case TransportError::SESSION_CLOSED:
    return "session closed";
  case TransportError::IO_FAILURE:
    return "i/o failure";
  }
  return "unknown";
}

std::string SendResult::ToString() const {
  if (!error_) {
    return "ok";
  }
  if (message_.empty()) {
    return TransportErrorName(*error_);
  }
  return std::string(TransportErrorName(*error_)) + ": " + message_;
}

} // namespace network
} // namespace nearlink
