/* @file ButtonGPIO.cpp
 * @brief GPIO level -> classifier glue
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "io/ButtonGPIO.hpp"

using namespace hearo::io;

ButtonGPIO::ButtonGPIO(std::string name, std::unique_ptr<GPIOInput> line, ClassifierConfig cfg)
    : name_(std::move(name)), line_(std::move(line)), classifier_(cfg) {
  classifier_.registerCallback([this](const InteractionEvent& ev) {
    if (cbButton_)
      cbButton_(name_, ev);
  });
}

bool ButtonGPIO::poll(std::chrono::milliseconds now) {
  auto level = line_->readLevel();
  classifier_.update(level.value_or(false), now);
  return level.has_value();
}
