#ifndef REFLOW_SLOT_ARENA_H
#define REFLOW_SLOT_ARENA_H

#include <reflow/types/node_id.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace reflow {
    /**
     * Generational slot storage.
     *
     * insert() hands out a {slot, generation} key, remove() bumps the slot's generation and puts the slot on the free
     * list. Lookups compare generations, so keys of removed entries never resolve again even after their slot has
     * been reused. A slot whose generation cannot be bumped any further is retired instead of reused. Pointers
     * returned by get() are invalidated by the next insert().
     */
    template<typename Key, typename T>
    class SlotArena {
    public:
        using generation_type = decltype(Key::generation);

        Key insert(T value) {
            std::uint32_t slot;
            if (!_free.empty()) {
                slot = _free.back();
                _free.pop_back();
            } else {
                slot = static_cast<std::uint32_t>(_slots.size());
                _slots.emplace_back();
            }
            auto &entry = _slots[slot];
            entry.value.emplace(std::move(value));
            ++_size;
            return Key{slot, entry.generation};
        }

        [[nodiscard]] T *get(Key key) noexcept {
            if (key.is_null() || key.slot >= _slots.size()) { return nullptr; }
            auto &entry = _slots[key.slot];
            if (entry.generation != key.generation || !entry.value.has_value()) { return nullptr; }
            return &*entry.value;
        }

        [[nodiscard]] const T *get(Key key) const noexcept {
            return const_cast<SlotArena *>(this)->get(key);
        }

        [[nodiscard]] bool contains(Key key) const noexcept { return get(key) != nullptr; }

        std::optional<T> remove(Key key) {
            if (get(key) == nullptr) { return std::nullopt; }
            auto &entry = _slots[key.slot];
            std::optional<T> removed{std::move(entry.value)};
            entry.value.reset();
            --_size;
            if (entry.generation == std::numeric_limits<generation_type>::max()) { return removed; }
            ++entry.generation;
            _free.push_back(key.slot);
            return removed;
        }

        [[nodiscard]] std::size_t size() const noexcept { return _size; }

        [[nodiscard]] bool empty() const noexcept { return _size == 0; }

        [[nodiscard]] std::size_t capacity() const noexcept { return _slots.size(); }

        template<typename Fn>
        void for_each(Fn &&fn) {
            for (std::uint32_t slot = 0; slot < _slots.size(); ++slot) {
                auto &entry = _slots[slot];
                if (entry.value.has_value()) { fn(Key{slot, entry.generation}, *entry.value); }
            }
        }

    private:
        struct Entry {
            generation_type generation{0};
            std::optional<T> value;
        };

        std::vector<Entry> _slots;
        std::vector<std::uint32_t> _free;
        std::size_t _size{0};
    };
} // namespace reflow

#endif  // REFLOW_SLOT_ARENA_H
