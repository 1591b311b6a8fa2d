#include "../include/keys/drill_factory.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "../drills/degree.hpp"
#include "../drills/mode.hpp"
#include "debug_log.hpp"

namespace keys {

DrillFactory& DrillFactory::instance() {
  static DrillFactory factory;
  return factory;
}

void DrillFactory::register_drill(PracticeType type, Creator create) {
  if (!create) {
    throw std::invalid_argument("DrillFactory: empty creator for " + to_string(type));
  }
  registry_[type] = std::move(create);
}

std::unique_ptr<DrillModule> DrillFactory::create_module(PracticeType type) const {
  auto it = registry_.find(type);
  if (it == registry_.end()) {
    throw std::runtime_error("DrillFactory: no drill registered for " + to_string(type));
  }
  auto module = it->second();
  if (!module) {
    throw std::runtime_error("DrillFactory: creator returned null for " + to_string(type));
  }
  return module;
}

std::unique_ptr<DrillModule> DrillFactory::create(const PracticeConfig& config) const {
  auto module = create_module(config.practice_type);
  module->configure(config);
  session_debug("drill ready: " + to_string(config.practice_type));
  return module;
}

std::vector<std::string> DrillFactory::families() const {
  std::vector<std::string> names;
  names.reserve(registry_.size());
  for (const auto& entry : registry_) {
    names.push_back(to_string(entry.first));
  }
  std::sort(names.begin(), names.end());
  return names;
}

void register_builtin_drills(DrillFactory& factory) {
  factory.register_drill(PracticeType::ScaleDegree,
                         []() { return std::make_unique<ScaleDegreeDrill>(); });
  factory.register_drill(PracticeType::Mode, []() { return std::make_unique<ModeDrill>(); });
}

} // namespace keys
