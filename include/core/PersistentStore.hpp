#pragma once
/** @file  PersistentStore.hpp
 *  @brief Thread-safe key/value state that survives process restarts.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace divewatch {
  namespace core {

    /** @class PersistentStore
 *  @brief Lock-protected map of <namespaced key → string>, optionally mirrored to JSON.
 *
 *  * In-memory only when constructed without a path (tests, replay).
 *  * With a path, every `set()`/`erase()` rewrites the file; `load()` reads it back.
 *  * Keys are namespaced ("divewatch.location.permissionPhase") to avoid clashes.
 */
    class PersistentStore {

    public:
      PersistentStore() = default;
      explicit PersistentStore(std::string backingFile);
      ~PersistentStore() = default;

      /// Reads the backing file if it exists. Throws `std::runtime_error` on corrupt JSON.
      void load();

      /// Atomically writes \p value under \p key (and persists it).
      void set(const std::string& key, const std::string& value);

      /// std::nullopt if the key was never written.
      std::optional<std::string> get(const std::string& key) const;

      void erase(const std::string& key);

    private:
      void persistLocked() const;

      std::string path_{};
      mutable std::mutex mtx_;
      std::unordered_map<std::string, std::string> values_;
    };

  } // namespace core
} // namespace divewatch
