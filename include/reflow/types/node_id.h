#ifndef REFLOW_NODE_ID_H
#define REFLOW_NODE_ID_H

#include <ankerl/unordered_dense.h>
#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

namespace reflow {
    /**
     * A generational index into one of the runtime's slot arenas.
     *
     * The slot is reused once the entry it referred to is removed, but the generation is bumped on every removal,
     * so a stale index never resolves to the new occupant of its slot. Indices are trivially copyable and carry no
     * ownership.
     */
    template<typename Tag>
    struct GenerationalIndex {
        static constexpr std::uint32_t NULL_SLOT = std::numeric_limits<std::uint32_t>::max();

        std::uint32_t slot{NULL_SLOT};
        std::uint32_t generation{0};

        [[nodiscard]] constexpr bool is_null() const noexcept { return slot == NULL_SLOT; }

        [[nodiscard]] constexpr std::uint64_t packed() const noexcept {
            return (static_cast<std::uint64_t>(generation) << 32) | slot;
        }

        constexpr auto operator<=>(const GenerationalIndex &) const = default;
    };

    struct node_tag;
    struct scope_tag;
    struct stored_value_tag;

    using NodeId = GenerationalIndex<node_tag>;
    using ScopeId = GenerationalIndex<scope_tag>;
    using StoredValueId = GenerationalIndex<stored_value_tag>;
} // namespace reflow

template<typename Tag>
struct ankerl::unordered_dense::hash<reflow::GenerationalIndex<Tag>> {
    using is_avalanching = void;

    [[nodiscard]] auto operator()(const reflow::GenerationalIndex<Tag> &id) const noexcept -> std::uint64_t {
        return ankerl::unordered_dense::hash<std::uint64_t>{}(id.packed());
    }
};

namespace std {
    template<typename Tag>
    struct hash<reflow::GenerationalIndex<Tag>> {
        size_t operator()(const reflow::GenerationalIndex<Tag> &id) const noexcept {
            return std::hash<std::uint64_t>{}(id.packed());
        }
    };
} // namespace std

template<typename Tag>
struct fmt::formatter<reflow::GenerationalIndex<Tag>> : fmt::formatter<std::string_view> {
    auto format(const reflow::GenerationalIndex<Tag> &id, format_context &ctx) const {
        if (id.is_null()) { return fmt::format_to(ctx.out(), "null"); }
        return fmt::format_to(ctx.out(), "{}v{}", id.slot, id.generation);
    }
};

#endif  // REFLOW_NODE_ID_H
