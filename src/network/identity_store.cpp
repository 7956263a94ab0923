// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/identity_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace nearlink {
namespace network {

namespace {
constexpr int IDENTITY_FILE_VERSION = 1;
} // namespace

std::optional<PeerID> LoadIdentity(const std::filesystem::path &path) {
  using json = nlohmann::json;

  auto contents = util::read_file_string(path);
  if (!contents) {
    LOG_NET_DEBUG("No identity file found at {}", path.string());
    return std::nullopt;
  }

  try {
    json root = json::parse(*contents);

    if (!root.is_object() || !root.contains("version") ||
        !root["version"].is_number_integer() ||
        root["version"].get<int>() != IDENTITY_FILE_VERSION) {
      LOG_NET_WARN("Unsupported identity file version in {}", path.string());
      return std::nullopt;
    }

    if (!root.contains("display_name") || !root["display_name"].is_string() ||
        !root.contains("token") || !root["token"].is_string()) {
      LOG_NET_WARN("Identity file {} is missing fields", path.string());
      return std::nullopt;
    }

    PeerID id(root["token"].get<std::string>(),
              root["display_name"].get<std::string>());
    if (!id.IsValid()) {
      LOG_NET_WARN("Identity file {} holds an invalid identity", path.string());
      return std::nullopt;
    }
    return id;

  } catch (const json::exception &e) {
    LOG_NET_WARN("Failed to parse identity file {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

bool SaveIdentity(const PeerID &id, const std::filesystem::path &path) {
  using json = nlohmann::json;

  json root;
  root["version"] = IDENTITY_FILE_VERSION;
  root["display_name"] = id.display_name();
  root["token"] = id.token();

  if (path.has_parent_path() && !util::ensure_directory(path.parent_path())) {
    LOG_NET_ERROR("Failed to create directory for {}", path.string());
    return false;
  }

  std::string text;
  try {
    text = root.dump(2);
  } catch (const json::exception &e) {
    LOG_NET_ERROR("Cannot serialize identity {}: {}", id.ToString(), e.what());
    return false;
  }

  // Owner-only: the token is this process's stable identity
  if (!util::atomic_write_file(path, text, 0600)) {
    LOG_NET_ERROR("Failed to save identity to {}", path.string());
    return false;
  }
  return true;
}

PeerID FetchOrCreateIdentity(const std::string &display_name,
                             const std::filesystem::path &path) {
  if (!path.empty()) {
    if (auto stored = LoadIdentity(path)) {
      if (stored->display_name() == display_name) {
        LOG_NET_DEBUG("Reusing stored identity {}", stored->ToString());
        return *stored;
      }
      LOG_NET_INFO("Display name changed from '{}' to '{}', generating new identity",
                   stored->display_name(), display_name);
    }
  }

  PeerID fresh = PeerID::Generate(display_name);
  LOG_NET_INFO("Generated identity {}", fresh.ToString());

  if (!path.empty() && !SaveIdentity(fresh, path)) {
    LOG_NET_WARN("Identity {} will not persist across restarts", fresh.ToString());
  }
  return fresh;
}

} // namespace network
} // namespace nearlink
