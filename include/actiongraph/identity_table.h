#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <utility>

namespace actiongraph {

/// Maps semantically distinct keys to dense sequential ids.
///
/// Ids start at kFirstId and grow by one per new key; 0 is never handed out
/// so callers can use it as "unset". The table is not synchronized; the
/// owning InterningCache serializes every call.
///
/// Precondition: a key must not change after it has been inserted. Mutating
/// a key alters its hash and makes later lookups undefined.
template <typename K, typename Hash = absl::Hash<K>, typename Eq = std::equal_to<K>>
class IdentityTable {
public:
    static constexpr uint32_t kFirstId = 1;

    struct Assignment {
        uint32_t id;
        bool isNew;
    };

    /// Returns the id already recorded for key, or records key under the
    /// next id.
    Assignment getOrAssign(const K& key) {
        auto [it, inserted] = index_.try_emplace(key, nextId_);
        if (!inserted) return {it->second, false};
        return {nextId_++, true};
    }

    /// Undo the most recent assignment. Used when materializing the value
    /// for a freshly assigned key failed.
    void retract(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end() || it->second + 1 != nextId_) {
            throw std::logic_error("IdentityTable::retract: key is not the latest assignment");
        }
        index_.erase(it);
        --nextId_;
    }

    /// Read-only probe; returns 0 if the key was never assigned.
    uint32_t find(const K& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? 0 : it->second;
    }

    size_t size() const { return index_.size(); }
    uint32_t lastId() const { return nextId_ - 1; }

private:
    absl::flat_hash_map<K, uint32_t, Hash, Eq> index_;
    uint32_t nextId_ = kFirstId;
};

} // namespace actiongraph
