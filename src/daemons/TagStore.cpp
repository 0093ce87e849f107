/* @file TagStore.cpp
 * @brief JSON file tag map
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <system_error>

// Hearo headers
#include "core/PeerError.hpp"
#include "daemons/TagStore.hpp"

using namespace hearo::daemons;
using hearo::core::FailureClass;
using hearo::core::PeerError;
namespace fs = std::filesystem;

JsonTagStore::JsonTagStore(std::string path) : path_(std::move(path)) {}

void JsonTagStore::ensureLoaded() {
  if (loaded_)
    return;

  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    doc_ = { { "tags", nlohmann::json::object() } };
    loaded_ = true;
    return;
  }

  std::ifstream in(path_);
  if (!in)
    throw PeerError(FailureClass::ResourceUnavailable, "TAG_STORE_UNAVAILABLE",
                    "cannot open " + path_);

  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw PeerError(FailureClass::ResourceUnavailable, "TAG_STORE_CORRUPT",
                    path_ + " is not a JSON object");
  if (!doc.contains("tags"))
    doc["tags"] = nlohmann::json::object();
  if (!doc["tags"].is_object())
    throw PeerError(FailureClass::ResourceUnavailable, "TAG_STORE_CORRUPT",
                    path_ + ": \"tags\" must be an object");

  doc_ = std::move(doc);
  loaded_ = true;
}

std::optional<TagEntry> JsonTagStore::lookup(const std::string& uid) {
  ensureLoaded();

  const auto& tags = doc_["tags"];
  const auto it = tags.find(uid);
  if (it == tags.end() || !it->is_object())
    return std::nullopt;

  TagEntry e;
  e.playlistUri = it->value("playlist_uri", "");
  e.lastTrackUri = it->value("last_track_uri", "");
  e.lastPosMs = it->value("last_pos_ms", std::int64_t{ 0 });
  if (e.playlistUri.empty() && e.lastTrackUri.empty())
    return std::nullopt;
  return e;
}

void JsonTagStore::saveProgress(const std::string& uid, const std::string& trackUri,
                                std::int64_t posMs) {
  ensureLoaded();

  auto& tags = doc_["tags"];
  const auto it = tags.find(uid);
  if (it == tags.end() || !it->is_object())
    return;

  (*it)["last_track_uri"] = trackUri;
  (*it)["last_pos_ms"] = posMs < 0 ? 0 : posMs;
  persist();
}

void JsonTagStore::persist() {
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw PeerError(FailureClass::Transient, "TAG_STORE_WRITE_FAILED", "cannot write " + tmp);
    out << doc_.dump(2) << '\n';
    if (!out.flush())
      throw PeerError(FailureClass::Transient, "TAG_STORE_WRITE_FAILED", "short write " + tmp);
  }

  std::error_code ec;
  fs::rename(tmp, path_, ec);
  if (ec)
    throw PeerError(FailureClass::Transient, "TAG_STORE_WRITE_FAILED",
                    "rename " + tmp + ": " + ec.message());
}
