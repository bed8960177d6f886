/* @file PersistentStore.cpp
 * @brief JSON mirror for the small amount of state we keep across restarts
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// divewatch headers
#include "core/PersistentStore.hpp"

using namespace divewatch::core;

PersistentStore::PersistentStore(std::string backingFile) : path_(std::move(backingFile)) {}

void PersistentStore::load() {
  if (path_.empty())
    return;

  std::ifstream in(path_);
  if (!in)
    return; // first run: nothing persisted yet

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[PersistentStore] corrupt state file " + path_ + ": " + e.what());
  }
  if (!j.is_object())
    throw std::runtime_error("[PersistentStore] state file " + path_ + " is not an object");

  std::lock_guard<std::mutex> lock(mtx_);
  values_.clear();
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it->is_string())
      values_[it.key()] = it->get<std::string>();
  }
}

void PersistentStore::set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mtx_);
  values_[key] = value;
  persistLocked();
}

std::optional<std::string> PersistentStore::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = values_.find(key);
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

void PersistentStore::erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (values_.erase(key) > 0)
    persistLocked();
}

void PersistentStore::persistLocked() const {
  if (path_.empty())
    return;

  nlohmann::json j = nlohmann::json::object();
  for (const auto& [k, v] : values_)
    j[k] = v;

  // write-then-rename so a crash never leaves a half-written file
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      std::cerr << "[PersistentStore] cannot write " << tmp << '\n';
      return;
    }
    out << j.dump(2) << '\n';
    if (!out) {
      std::cerr << "[PersistentStore] short write to " << tmp << '\n';
      return;
    }
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0)
    std::cerr << "[PersistentStore] rename " << tmp << " -> " << path_ << " failed\n";
}
