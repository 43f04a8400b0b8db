#pragma once
/** @file  StageRegistry.hpp
 *  @brief Runtime registry that maps stage names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ember::stages {
  class Stage;
}

namespace ember::core {

  class Logger;

  /**
 * @class StageRegistry
 * @brief Register & instantiate stage objects by string key.
 *
 *  * Keeps the Engine decoupled from concrete stages.
 *  * Creators receive the logger and the filesystem root to operate on.
 */
  class StageRegistry {
  public:
    using Creator = std::function<std::unique_ptr<stages::Stage>(Logger&,
                                                                 const std::filesystem::path&)>;

    /// Register a stage under \p name.  Returns false on duplicate or empty creator.
    bool registerStage(const std::string& name, Creator maker);

    bool contains(const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<stages::Stage> create(const std::string& name, Logger& log,
                                          const std::filesystem::path& root) const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace ember::core
