#pragma once
/** @file  Stage.hpp
 *  @brief Abstract base class for everything that applies a config to the host.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace ember::config { // forward decl only
  struct Config;
} // namespace ember::config

namespace ember::stages {

  /**
 * @class Stage
 * @brief Common polymorphic interface that every concrete stage
 *        (e.g. disks, files) must implement.
 *
 *  * Runs synchronously on the caller’s thread.
 *  * Built by core::StageRegistry with the engine's logger and root path.
 */
  class Stage {
  public:
    virtual ~Stage() = default;

    /**
     * @brief Apply the parts of @p cfg this stage owns.
     * @returns false if any of it could not be applied.
     */
    virtual bool run(const config::Config& cfg) = 0;
  };

} // namespace ember::stages
