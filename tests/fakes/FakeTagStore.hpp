#pragma once
/** @file  FakeTagStore.hpp
 *  @brief In-memory TagStore.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <map>
#include <optional>
#include <string>

#include "core/PeerError.hpp"
#include "daemons/TagStore.hpp"

namespace hearo {
  namespace test {

    class FakeTagStore : public daemons::TagStore {
    public:
      std::map<std::string, daemons::TagEntry> tags;
      bool lookupFails = false;
      int saves = 0;

      std::optional<daemons::TagEntry> lookup(const std::string& uid) override {
        if (lookupFails)
          throw core::PeerError(core::FailureClass::ResourceUnavailable, "TAG_STORE_CORRUPT",
                                "tags.json is not a JSON object");
        auto it = tags.find(uid);
        if (it == tags.end())
          return std::nullopt;
        return it->second;
      }

      void saveProgress(const std::string& uid, const std::string& trackUri,
                        std::int64_t posMs) override {
        auto it = tags.find(uid);
        if (it == tags.end())
          return;
        ++saves;
        it->second.lastTrackUri = trackUri;
        it->second.lastPosMs = posMs;
      }
    };

  } // namespace test
} // namespace hearo
