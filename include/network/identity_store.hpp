// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_id.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace nearlink {
namespace network {

/**
 * Local identity persistence
 *
 * File format (JSON, written atomically with 0600 permissions):
 *   {"version": 1, "display_name": "...", "token": "..."}
 *
 * The token survives restarts so remote peers see the same PeerID for the
 * same process identity. Changing the display name mints a new identity.
 */

// Returns std::nullopt if the file is missing, unparsable or invalid
std::optional<PeerID> LoadIdentity(const std::filesystem::path &path);

// Returns false on write failure
bool SaveIdentity(const PeerID &id, const std::filesystem::path &path);

/**
 * Reuse the stored identity if its display name matches, otherwise generate
 * and store a fresh one. An empty path disables persistence. A failed save is
 * logged and the generated identity is still returned.
 */
PeerID FetchOrCreateIdentity(const std::string &display_name,
                             const std::filesystem::path &path);

} // namespace network
} // namespace nearlink
