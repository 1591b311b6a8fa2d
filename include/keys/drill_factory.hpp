#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"
#include "../../drills/drill.hpp"

namespace keys {

// Maps each practice type onto the drill that generates its rounds.
class DrillFactory {
public:
  using Creator = std::function<std::unique_ptr<DrillModule>()>;

  static DrillFactory& instance();

  // Replaces any drill already registered for `type`.
  void register_drill(PracticeType type, Creator create);

  bool has_drill(PracticeType type) const { return registry_.count(type) > 0; }

  std::unique_ptr<DrillModule> create_module(PracticeType type) const;

  // Builds and configures the module serving `config.practice_type`.
  std::unique_ptr<DrillModule> create(const PracticeConfig& config) const;

  // Registered practice types by their configuration names, sorted.
  std::vector<std::string> families() const;

private:
  std::map<PracticeType, Creator> registry_;
};

void register_builtin_drills(DrillFactory& factory);

} // namespace keys
