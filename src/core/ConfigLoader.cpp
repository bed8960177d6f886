/* @file ConfigLoader.cpp
 * @brief reads and parses a JSON document, throwing on any failure
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// divewatch headers
#include "core/ConfigLoader.hpp"

using namespace divewatch::core;

ConfigLoader::ConfigLoader(std::string path, Shape shape) : path_(std::move(path)), shape_(shape) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }

  switch (shape_) {
  case Shape::Object:
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + ": expected a JSON object");
    break;
  case Shape::ObjectOrArray:
    if (!doc.is_object() && !doc.is_array())
      throw std::runtime_error("[ConfigLoader] " + path_ + ": expected a JSON object or array");
    break;
  case Shape::Any:
    break;
  }
  return doc;
}
