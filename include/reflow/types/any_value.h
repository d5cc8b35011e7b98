#ifndef REFLOW_ANY_VALUE_H
#define REFLOW_ANY_VALUE_H

#include <reflow/reflow_export.h>
#include <reflow/util/errors.h>

#include <concepts>
#include <cstddef>
#include <cstring>
#include <new>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace reflow
{
    // Small buffer size defaults: large enough to keep a std::string or a std::vector inline
    inline constexpr std::size_t REFLOW_VALUE_SBO   = 4 * sizeof(void *);
    inline constexpr std::size_t REFLOW_VALUE_ALIGN = alignof(std::max_align_t);

    /**
     * AnyValue - type-erased storage for the payload of a reactive node.
     *
     * Values that fit the inline buffer are stored in place, larger values are heap allocated. The per-type vtable
     * carries copy / move / destroy and, when the contained type supports it, equality. Values without an
     * operator== can still be stored, but has_equality() is false and equals() throws.
     */
    template <std::size_t SBO = REFLOW_VALUE_SBO, std::size_t Align = REFLOW_VALUE_ALIGN>
    class BasicAnyValue
    {
    public:
        BasicAnyValue() noexcept : vtable_(nullptr), using_heap_(false) {}

        BasicAnyValue(const BasicAnyValue &other) : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->copy(*this, other);
        }

        BasicAnyValue(BasicAnyValue &&other) noexcept : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->move(*this, other);
        }

        BasicAnyValue &operator=(const BasicAnyValue &other) {
            if (this != &other) {
                reset();
                if (other.vtable_) other.vtable_->copy(*this, other);
            }
            return *this;
        }

        BasicAnyValue &operator=(BasicAnyValue &&other) noexcept {
            if (this != &other) {
                reset();
                if (other.vtable_) other.vtable_->move(*this, other);
            }
            return *this;
        }

        ~BasicAnyValue() { reset(); }

        template <class T, class... Args>
        [[nodiscard]] static BasicAnyValue make(Args &&... args) {
            BasicAnyValue v;
            v.template emplace<T>(std::forward<Args>(args)...);
            return v;
        }

        void reset() noexcept {
            if (vtable_) vtable_->destroy(*this);
            vtable_     = nullptr;
            using_heap_ = false;
        }

        [[nodiscard]] bool has_value() const noexcept { return vtable_ != nullptr; }

        [[nodiscard]] const std::type_info &type() const noexcept {
            return has_value() ? *vtable_->type : typeid(void);
        }

        [[nodiscard]] bool has_equality() const noexcept { return vtable_ && vtable_->equals != nullptr; }

        template <class T, class... Args>
        T &emplace(Args &&... args) {
            reset();
            constexpr std::size_t t_align = alignof(T);
            constexpr std::size_t t_size  = sizeof(T);
            // SBO strategy: inline if size fits AND alignment requirement is satisfied
            if constexpr (t_size <= SBO && t_align <= Align && std::is_nothrow_move_constructible_v<T>) {
                new(storage_ptr()) T(std::forward<Args>(args)...);
                using_heap_ = false;
            } else {
                T *p = new T(std::forward<Args>(args)...);
                std::memcpy(storage_, &p, sizeof(T *));
                using_heap_ = true;
            }
            vtable_ = &vtable_for<T>();
            return *reinterpret_cast<T *>(get_ptr());
        }

        template <class T>
        T *get_if() noexcept {
            if (!vtable_ || *vtable_->type != typeid(T)) return nullptr;
            return reinterpret_cast<T *>(get_ptr());
        }

        template <class T>
        const T *get_if() const noexcept {
            if (!vtable_ || *vtable_->type != typeid(T)) return nullptr;
            return reinterpret_cast<const T *>(get_ptr());
        }

        template <class T>
        T &as() {
            if (T *p = get_if<T>()) return *p;
            throw_error<bad_expected_type<T>>(type().name());
        }

        template <class T>
        const T &as() const {
            if (const T *p = get_if<T>()) return *p;
            throw_error<bad_expected_type<T>>(type().name());
        }

        // Swap helper (safe byte-wise swap of the inline buffer and metadata, inline values are nothrow movable)
        void swap(BasicAnyValue &other) noexcept {
            BasicAnyValue tmp{std::move(other)};
            other = std::move(*this);
            *this = std::move(tmp);
        }

        /**
         * Value equality: empty equals empty, different types are never equal.
         * Throws if the contained type has no operator==.
         */
        [[nodiscard]] bool equals(const BasicAnyValue &other) const {
            if (!vtable_ && !other.vtable_) return true;
            if (!vtable_ || !other.vtable_) return false;
            if (*vtable_->type != *other.vtable_->type) return false;
            if (!vtable_->equals) {
                throw_error<std::logic_error>("AnyValue: operator== not supported for contained type {}",
                                              vtable_->type->name());
            }
            return vtable_->equals(*this, other);
        }

        friend bool operator==(const BasicAnyValue &a, const BasicAnyValue &b) { return a.equals(b); }

        friend bool operator!=(const BasicAnyValue &a, const BasicAnyValue &b) { return !a.equals(b); }

    private:
        struct VTable
        {
            const std::type_info *type;
            void (*copy)(BasicAnyValue &, const BasicAnyValue &);
            void (*move)(BasicAnyValue &, BasicAnyValue &) noexcept;
            void (*destroy)(BasicAnyValue &) noexcept;
            bool (*equals)(const BasicAnyValue &, const BasicAnyValue &);
        };

        template <class T>
        static const T *typed_ptr(const BasicAnyValue &v) noexcept {
            return v.using_heap_ ? *reinterpret_cast<T * const *>(v.storage_)
                                 : reinterpret_cast<const T *>(v.storage_ptr());
        }

        template <class T>
        static const VTable &vtable_for() {
            static const VTable vt{
                &typeid(T),
                // copy
                [](BasicAnyValue &dst, const BasicAnyValue &src) {
                    if constexpr (std::is_copy_constructible_v<T>) {
                        if (src.using_heap_) {
                            T *np = new T(*typed_ptr<T>(src));
                            std::memcpy(dst.storage_, &np, sizeof(T *));
                            dst.using_heap_ = true;
                        } else {
                            new(dst.storage_ptr()) T(*typed_ptr<T>(src));
                            dst.using_heap_ = false;
                        }
                        dst.vtable_ = &vtable_for<T>();
                    } else {
                        throw_error<std::logic_error>("AnyValue: copy not supported for contained type {}",
                                                      typeid(T).name());
                    }
                },
                // move
                [](BasicAnyValue &dst, BasicAnyValue &src) noexcept {
                    if (src.using_heap_) {
                        auto *sp = *reinterpret_cast<T **>(src.storage_);
                        std::memcpy(dst.storage_, &sp, sizeof(T *));
                        dst.using_heap_ = true;
                        *reinterpret_cast<T **>(src.storage_) = nullptr;
                    } else {
                        if constexpr (std::is_nothrow_move_constructible_v<T>) {
                            new(dst.storage_ptr()) T(std::move(*reinterpret_cast<T *>(src.storage_ptr())));
                            reinterpret_cast<T *>(src.storage_ptr())->~T();
                        }
                        dst.using_heap_ = false;
                    }
                    dst.vtable_     = &vtable_for<T>();
                    src.vtable_     = nullptr;
                    src.using_heap_ = false;
                },
                // destroy
                [](BasicAnyValue &self) noexcept {
                    if (!self.vtable_) return;
                    if (self.using_heap_) {
                        auto *p = *reinterpret_cast<T **>(self.storage_);
                        delete p;
                        *reinterpret_cast<T **>(self.storage_) = nullptr;
                    } else { reinterpret_cast<T *>(self.storage_ptr())->~T(); }
                },
                // equals, only when the type provides operator==
                equals_for<T>()
            };
            return vt;
        }

        template <class T>
        static constexpr auto equals_for() -> bool (*)(const BasicAnyValue &, const BasicAnyValue &) {
            if constexpr (std::equality_comparable<T>) {
                return [](const BasicAnyValue &a, const BasicAnyValue &b) -> bool {
                    return static_cast<bool>(*typed_ptr<T>(a) == *typed_ptr<T>(b));
                };
            } else {
                return nullptr;
            }
        }

        void *                    storage_ptr() noexcept { return static_cast<void *>(storage_); }
        [[nodiscard]] const void *storage_ptr() const noexcept { return static_cast<const void *>(storage_); }

        void *get_ptr() noexcept {
            if (using_heap_) return static_cast<void *>(*reinterpret_cast<void **>(storage_));
            return storage_ptr();
        }

        [[nodiscard]] const void *get_ptr() const noexcept {
            if (using_heap_) return static_cast<const void *>(*reinterpret_cast<void * const *>(storage_));
            return storage_ptr();
        }

        const VTable *               vtable_;
        bool                         using_heap_;
        alignas(Align) unsigned char storage_[SBO];
    };

    using AnyValue = BasicAnyValue<>;
} // namespace reflow

#endif  // REFLOW_ANY_VALUE_H
