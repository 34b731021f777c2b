#pragma once

#include <tabula/core/value.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <vector>

namespace tabula::runtime {

/// Tuple of canonicalized values identifying one bucket.
struct GroupKey {
    std::vector<Value> values;

    auto operator==(const GroupKey&) const -> bool = default;
};

struct GroupKeyHash {
    auto operator()(const GroupKey& key) const noexcept -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        ValueHash hasher;
        for (const auto& value : key.values) {
            hash_combine(hasher(value));
        }
        return seed;
    }
};

struct GroupKeyEq {
    auto operator()(const GroupKey& a, const GroupKey& b) const -> bool {
        return a.values == b.values;
    }
};

/// Dense ids for distinct keys, assigned in first-seen order.
class GroupIndex {
   public:
    /// Id of `key`, allocating the next id when it has not been seen.
    /// `key` must already be canonical (see canonicalize()).
    [[nodiscard]] auto intern(GroupKey key) -> std::size_t {
        const std::size_t next = ids_.size();
        return ids_.try_emplace(std::move(key), next).first->second;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return ids_.size(); }

    void reserve(std::size_t n) { ids_.reserve(n); }

   private:
    robin_hood::unordered_flat_map<GroupKey, std::size_t, GroupKeyHash, GroupKeyEq> ids_;
};

/// Canonical key built from `record`'s values for `columns` (absent columns read as null).
template <typename RecordT, typename Columns>
[[nodiscard]] auto make_group_key(const RecordT& record, const Columns& columns) -> GroupKey {
    GroupKey key;
    key.values.reserve(std::size(columns));
    for (const auto& column : columns) {
        key.values.push_back(canonicalize(record.get(column)));
    }
    return key;
}

}  // namespace tabula::runtime
