/* @file StageRegistry.cpp
 * @brief name -> creator lookup for stages
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// Ember headers
#include "core/StageRegistry.hpp"
#include "stages/Stage.hpp"

using namespace ember::core;

bool StageRegistry::registerStage(const std::string& name, Creator maker) {
  if (!maker)
    return false;
  return creators_.emplace(name, std::move(maker)).second;
}

bool StageRegistry::contains(const std::string& name) const {
  return creators_.find(name) != creators_.end();
}

std::vector<std::string> StageRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

std::unique_ptr<ember::stages::Stage> StageRegistry::create(const std::string& name, Logger& log,
                                                            const std::filesystem::path& root) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[StageRegistry] unknown stage: " + name);
  return it->second(log, root);
}
