// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace nearlink {
namespace network {

// Display names longer than this are rejected (same limit as the
// platform peer identifiers this library interoperates with)
constexpr size_t MAX_DISPLAY_NAME_BYTES = 63;

/**
 * PeerID - transport-level identity of one process on the mesh
 *
 * token        opaque, stable, unique per process instance (hex string for
 *              identities generated here; any non-empty string is accepted
 *              from the wire)
 * display_name human-readable label shown to users
 *
 * Equality and hashing use the token only: two advertisements with the same
 * token and a different display name are the same peer.
 */
class PeerID {
public:
  PeerID() = default;
  PeerID(std::string token, std::string display_name);

  // Fresh identity with a random 128-bit token
  static PeerID Generate(const std::string &display_name);

  const std::string &token() const { return token_; }
  const std::string &display_name() const { return display_name_; }

  // Non-empty token and a display name of 1..MAX_DISPLAY_NAME_BYTES bytes
  bool IsValid() const;

  // "name#1a2b3c4d" for logs
  std::string ToString() const;

  bool operator==(const PeerID &other) const { return token_ == other.token_; }
  bool operator!=(const PeerID &other) const { return !(*this == other); }

  struct Hasher {
    size_t operator()(const PeerID &id) const noexcept {
      return std::hash<std::string>{}(id.token_);
    }
  };

private:
  std::string token_;
  std::string display_name_;
};

} // namespace network
} // namespace nearlink
