#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Reads the JSON documents the replay harness is driven by.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace divewatch::core {

  /**
 * @class ConfigLoader
 * @brief Opens one JSON file (monitor config, site catalog or replay track) and parses it.
 *
 *  * Every `load()` goes back to disk; nothing is cached between calls.
 *  * Only the top-level shape is checked here, field validation belongs to
 *    parseMonitorConfig / JsonSiteCatalog::parse.
 */
  class ConfigLoader {
  public:
    /// Accepted top-level JSON types.
    enum class Shape { Any, Object, ObjectOrArray };

    explicit ConfigLoader(std::string path, Shape shape = Shape::Any);

    /// @throws std::runtime_error when the file is missing, malformed or of the wrong shape.
    nlohmann::json load() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
    Shape shape_;
  };

} // namespace divewatch::core
