#pragma once
/** @file  TagStore.hpp
 *  @brief Tag uid -> media mapping with resume position, and its JSON-file store.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hearo::daemons {

  struct TagEntry {
    std::string playlistUri{};
    std::string lastTrackUri{};
    std::int64_t lastPosMs{ 0 };
  };

  /**
 * @class TagStore
 * @brief Failures throw core::PeerError.
 */
  class TagStore {
  public:
    virtual ~TagStore() = default;

    virtual std::optional<TagEntry> lookup(const std::string& uid) = 0;

    /// Remember where playback of \p uid got to. Unknown uids are ignored.
    virtual void saveProgress(const std::string& uid, const std::string& trackUri,
                              std::int64_t posMs) = 0;
  };

  /**
 * @class JsonTagStore
 * @brief `{"tags": {"<UID>": {"playlist_uri", "last_track_uri", "last_pos_ms"}}}`
 *
 *  * Loaded lazily on first use; a missing file is an empty map.
 *  * Writes go to `<path>.tmp` and are renamed over the original.
 */
  class JsonTagStore : public TagStore {
  public:
    explicit JsonTagStore(std::string path);

    std::optional<TagEntry> lookup(const std::string& uid) override;
    void saveProgress(const std::string& uid, const std::string& trackUri,
                      std::int64_t posMs) override;

    const std::string& path() const { return path_; }

  private:
    void ensureLoaded();
    void persist();

    std::string path_;
    nlohmann::json doc_;
    bool loaded_{ false };
  };

} // namespace hearo::daemons
