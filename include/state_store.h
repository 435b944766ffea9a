// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file state_store.h
 * @brief Publication point for the composite connectivity snapshot
 *
 * @threading Any thread may publish or read. Snapshots are immutable
 *            once published; readers hold a shared_ptr to a const object
 *            and never see a partially written state.
 * @gotchas   Listeners run on the publishing thread (scheduler or
 *            geolocation worker). They must not call publish()/modify()
 *            themselves; reading snapshot() is fine.
 */

#pragma once

#include "geolocation.h"
#include "interface_resolver.h"
#include "system_status.h"
#include "vpn_controller.h"
#include "wifi_backend.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "hv/json.hpp"

namespace raspap {

using json = nlohmann::json;

/**
 * @brief Everything the presentation layer needs for one redraw
 */
struct CompositeState {
    InterfaceRoles roles;
    WifiState wifi;
    VpnState vpn;
    std::optional<GeoLocation> geo; ///< Last good lookup; absent until one succeeds
    SystemStatus system;
    uint64_t sequence = 0; ///< 0 only for the empty initial state
    std::chrono::system_clock::time_point updated_at{};
};

using StateListener = std::function<void(std::shared_ptr<const CompositeState>)>;
using ListenerId = uint64_t;
constexpr ListenerId INVALID_LISTENER_ID = 0;

class StateStore {
  public:
    StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /**
     * @brief Current snapshot; never null
     */
    std::shared_ptr<const CompositeState> snapshot() const;

    /**
     * @brief Replace the snapshot wholesale
     *
     * Assigns the next sequence number and the publication time, then
     * notifies listeners.
     *
     * @return Sequence number of the published snapshot
     */
    uint64_t publish(CompositeState state);

    /**
     * @brief Publish a copy of the current snapshot with one change applied
     *
     * Serialized with publish(), so a concurrent full publish is never lost.
     */
    uint64_t modify(const std::function<void(CompositeState&)>& change);

    ListenerId subscribe(StateListener listener);
    bool unsubscribe(ListenerId id);

  private:
    std::mutex publish_mutex_; ///< Serializes writers and notification
    mutable std::mutex state_mutex_;
    std::shared_ptr<const CompositeState> current_;
    uint64_t next_sequence_ = 1;

    std::mutex listeners_mutex_;
    std::map<ListenerId, StateListener> listeners_;
    std::atomic<ListenerId> next_listener_id_{1};

    uint64_t publish_locked(CompositeState state);
};

// ============================================================================
// JSON form (used by --once and by presentation-layer clients)
// ============================================================================

json to_json(const InterfaceRoles& roles);
json to_json(const WifiState& wifi);
json to_json(const VpnState& vpn);
json to_json(const GeoLocation& geo);
json to_json(const SystemStatus& system);
json to_json(const CompositeState& state);

} // namespace raspap
