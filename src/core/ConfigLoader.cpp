/* @file ConfigLoader.cpp
 * @brief JSON file -> nlohmann::json
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Hearo headers
#include "core/ConfigLoader.hpp"

using namespace hearo::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

bool ConfigLoader::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

nlohmann::json ConfigLoader::load() const {
  if (!exists())
    return nlohmann::json::object();

  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  nlohmann::json j = nlohmann::json::parse(in, nullptr, false, true);
  if (j.is_discarded())
    throw std::runtime_error("[ConfigLoader] " + path_ + " is not valid JSON");
  if (!j.is_object())
    throw std::runtime_error("[ConfigLoader] " + path_ + ": top level must be an object");
  return j;
}
