#pragma once
/** @file  RecordingPublisher.hpp
 *  @brief EventPublisher that keeps what it was asked to publish.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Endpoint.hpp"
#include "core/EventPublisher.hpp"
#include "core/Logger.hpp"
#include "protocols/EnvelopeFactory.hpp"

#include "FakeBus.hpp"

namespace hearo {
  namespace test {

    class RecordingPublisher : public core::EventPublisher {
    public:
      struct Published {
        std::string name;
        nlohmann::json payload;
      };

      RecordingPublisher(core::Endpoint& endpoint, protocols::EnvelopeFactory& factory)
          : core::EventPublisher(endpoint, factory, {}) {}

      void publish(std::string_view name,
                   nlohmann::json payload = nlohmann::json::object()) override {
        published.push_back({ std::string(name), std::move(payload) });
      }

      std::size_t count(std::string_view name) const {
        std::size_t n = 0;
        for (const auto& p : published)
          n += p.name == name ? 1 : 0;
        return n;
      }

      /// Most recent event called \p name, nullptr if none.
      const Published* last(std::string_view name) const {
        for (auto it = published.rbegin(); it != published.rend(); ++it)
          if (it->name == name)
            return &*it;
        return nullptr;
      }

      std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& p : published)
          out.push_back(p.name);
        return out;
      }

      std::vector<Published> published;
    };

    /// Silent logger, fake endpoint and factory backing one RecordingPublisher.
    struct PublisherHarness {
      core::Logger log{ "test", core::LogLevel::None };
      std::shared_ptr<FakeBus> bus = std::make_shared<FakeBus>();
      core::Endpoint endpoint{ log, std::make_unique<FakeDatagramChannel>(bus) };
      protocols::EnvelopeFactory factory{ "test", [] { return std::int64_t{ 1000 }; } };
      RecordingPublisher events{ endpoint, factory };
    };

  } // namespace test
} // namespace hearo
