// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/peer_id.hpp"
#include "util/string_parsing.hpp"
#include <random>
#include <vector>

namespace nearlink {
namespace network {

namespace {
constexpr size_t TOKEN_BYTES = 16;
constexpr size_t SHORT_TOKEN_CHARS = 8;
} // namespace

PeerID::PeerID(std::string token, std::string display_name)
    : token_(std::move(token)), display_name_(std::move(display_name)) {}

PeerID PeerID::Generate(const std::string &display_name) {
  std::random_device rd;
  std::vector<uint8_t> bytes(TOKEN_BYTES);
  for (auto &b : bytes) {
    b = static_cast<uint8_t>(rd() & 0xFF);
  }
  return PeerID(util::HexEncode(bytes), display_name);
}

bool PeerID::IsValid() const {
  return !token_.empty() && !display_name_.empty() &&
         display_name_.size() <= MAX_DISPLAY_NAME_BYTES;
}

std::string PeerID::ToString() const {
  return display_name_ + "#" + token_.substr(0, SHORT_TOKEN_CHARS);
}

} // namespace network
} // namespace nearlink
