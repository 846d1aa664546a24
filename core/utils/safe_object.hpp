/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace qbridge {

  // clang-format off
  /**
   * Object guarded by a mutex. Readers share the lock, writers own it.
   * @tparam T object type
   * @code
   *  SafeObject<std::map<Id, Entry>> entries;
   *  auto found = entries.sharedAccess([&](const auto &map) {
   *    return map.contains(id);
   *  });
   *  entries.exclusiveAccess([&](auto &map) { map.erase(id); });
   * @endcode
   */
  // clang-format on
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace qbridge
