/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IASSET_LOADER_HPP
#define IASSET_LOADER_HPP

#include <functional>
#include <ostream>
#include <string>

namespace RiverForge {

enum class AssetState { Ready, Pending, Failed };

inline std::ostream& operator<<(std::ostream& os, AssetState state) {
    switch (state) {
        case AssetState::Ready: return os << "Ready";
        case AssetState::Pending: return os << "Pending";
        case AssetState::Failed: return os << "Failed";
    }
    return os << "Unknown";
}

/**
 * @brief Result of an ensureLoaded request
 *
 * A ready or failed handle is settled. A pending handle re-polls its loader
 * every time state() is called, so a waiting chunk can be skipped cheaply
 * until the load resolves.
 */
class AssetHandle {
public:
    static AssetHandle ready() { return AssetHandle(AssetState::Ready); }
    static AssetHandle failed() { return AssetHandle(AssetState::Failed); }
    static AssetHandle pending(std::function<AssetState()> poll) {
        AssetHandle handle(AssetState::Pending);
        handle.m_poll = std::move(poll);
        return handle;
    }

    AssetState state() const {
        if (m_state == AssetState::Pending && m_poll) {
            return m_poll();
        }
        return m_state;
    }

    bool isPending() const { return state() == AssetState::Pending; }

private:
    explicit AssetHandle(AssetState state) : m_state(state) {}

    AssetState m_state;
    std::function<AssetState()> m_poll;
};

class IAssetLoader {
public:
    virtual ~IAssetLoader() = default;

    /**
     * @brief Start loading an asset if it is not resident yet
     * @param assetId asset identifier (e.g. "lsystem-tree", "rock")
     * @return settled handle if resident or failed, pending handle otherwise
     */
    virtual AssetHandle ensureLoaded(const std::string& assetId) = 0;
};

} // namespace RiverForge

#endif // IASSET_LOADER_HPP
