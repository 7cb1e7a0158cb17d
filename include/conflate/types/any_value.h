#ifndef CONFLATE_TYPES_ANY_VALUE_H
#define CONFLATE_TYPES_ANY_VALUE_H

#include <conflate/conflate_export.h>
#include <conflate/util/errors.h>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <new>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace conflate
{
    // Small buffer sized to hold a std::string inline, the largest scalar producers usually push
    inline constexpr std::size_t CONFLATE_VALUE_SBO   = sizeof(std::string);
    inline constexpr std::size_t CONFLATE_VALUE_ALIGN = alignof(std::max_align_t);

    struct CONFLATE_EXPORT TypeId
    {
        const std::type_info *info{};
    };

    CONFLATE_EXPORT bool operator==(TypeId a, TypeId b);

    /// Demangled name of the type, "<empty>" for an empty TypeId.
    CONFLATE_EXPORT std::string type_name(TypeId id);

    namespace detail
    {
        [[noreturn]] CONFLATE_EXPORT void throw_not_ordered(TypeId lhs, TypeId rhs);
        [[noreturn]] CONFLATE_EXPORT void throw_not_numeric(TypeId type);
        [[noreturn]] CONFLATE_EXPORT void throw_bad_access(TypeId held, TypeId requested, std::source_location loc);

        /**
         * Producers push raw scalars; they are normalised so that values from the same stream share a type.
         * All signed and unsigned integers become int64_t, floating point becomes double and anything
         * convertible to a string_view becomes std::string.
         */
        template <typename T>
        struct normalised
        {
            using type = std::decay_t<T>;
        };

        template <typename T>
            requires(std::is_integral_v<std::decay_t<T>> && !std::is_same_v<std::decay_t<T>, bool>)
        struct normalised<T>
        {
            using type = std::int64_t;
        };

        template <typename T>
            requires std::is_floating_point_v<std::decay_t<T>>
        struct normalised<T>
        {
            using type = double;
        };

        template <typename T>
            requires(!std::is_arithmetic_v<std::decay_t<T>> && std::is_convertible_v<T, std::string_view>)
        struct normalised<T>
        {
            using type = std::string;
        };

        template <typename T>
        using normalised_t = typename normalised<T>::type;
    }  // namespace detail

    /**
     * @brief Type-erased scalar used by conflators that accept loosely typed streams.
     *
     * Small values are held inline, larger ones on the heap. Operations that a policy relies on are
     * dispatched through a per-type vtable:
     *
     * - equality: type + value, different types compare unequal unless both are numeric
     * - ordering: numbers order by value whatever their type, otherwise throws type_mismatch when the
     *   types differ or the type has no operator<
     * - numeric conversion: throws type_mismatch for non-arithmetic types
     *
     * Numbers compare and hash through their double form, so 1 and 1.0 are the same key. Equality
     * and hashing are consistent so values can be used as keys and in frequency counters.
     */
    template <std::size_t SBO = CONFLATE_VALUE_SBO, std::size_t Align = CONFLATE_VALUE_ALIGN>
    class AnyValue
    {
    public:
        AnyValue() noexcept : vtable_(nullptr), using_heap_(false) {}

        template <typename T>
            requires(!std::is_same_v<std::remove_cvref_t<T>, AnyValue>)
        AnyValue(T &&value) : vtable_(nullptr), using_heap_(false) {  // NOLINT(google-explicit-constructor)
            emplace<detail::normalised_t<T>>(std::forward<T>(value));
        }

        AnyValue(const AnyValue &other) : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->copy(*this, other);
        }

        AnyValue(AnyValue &&other) noexcept : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->move(*this, other);
        }

        AnyValue &operator=(const AnyValue &other) {
            if (this != &other) {
                AnyValue tmp(other);
                reset();
                if (tmp.vtable_) tmp.vtable_->move(*this, tmp);
            }
            return *this;
        }

        AnyValue &operator=(AnyValue &&other) noexcept {
            if (this != &other) {
                reset();
                if (other.vtable_) other.vtable_->move(*this, other);
            }
            return *this;
        }

        ~AnyValue() { reset(); }

        void reset() noexcept {
            if (vtable_) vtable_->destroy(*this);
            vtable_     = nullptr;
            using_heap_ = false;
        }

        [[nodiscard]] bool   has_value() const noexcept { return vtable_ != nullptr; }
        [[nodiscard]] TypeId type() const noexcept { return has_value() ? vtable_->type : TypeId{}; }

        template <class T, class... Args>
        T &emplace(Args &&...args) {
            reset();
            if constexpr (sizeof(T) <= SBO && alignof(T) <= Align) {
                new (storage_ptr()) T(std::forward<Args>(args)...);
                using_heap_ = false;
            } else {
                T *p = new T(std::forward<Args>(args)...);
                std::memcpy(storage_, &p, sizeof(T *));
                using_heap_ = true;
            }
            vtable_ = &vtable_for<T>();
            return *static_cast<T *>(get_ptr());
        }

        template <class T>
        [[nodiscard]] const T *get_if() const noexcept {
            if (!vtable_ || vtable_->type.info != &typeid(T)) return nullptr;
            return static_cast<const T *>(get_ptr());
        }

        template <class T>
        [[nodiscard]] T *get_if() noexcept {
            if (!vtable_ || vtable_->type.info != &typeid(T)) return nullptr;
            return static_cast<T *>(get_ptr());
        }

        /// Typed access, throws type_mismatch (naming the caller's location) when the held type is not T.
        template <class T>
        [[nodiscard]] const T &as(std::source_location loc = std::source_location::current()) const {
            if (const T *p = get_if<T>()) return *p;
            detail::throw_bad_access(type(), TypeId{&typeid(T)}, loc);
        }

        [[nodiscard]] bool is_numeric() const noexcept { return vtable_ && vtable_->to_double != nullptr; }

        /// Numeric view of the value, throws type_mismatch for non-arithmetic (or empty) values.
        [[nodiscard]] double to_double() const {
            if (!is_numeric()) detail::throw_not_numeric(type());
            return vtable_->to_double(*this);
        }

        [[nodiscard]] std::size_t hash_code() const noexcept {
            if (!vtable_) return 0;
            if (is_numeric()) return std::hash<double>{}(vtable_->to_double(*this));
            return vtable_->hash(*this);
        }

        [[nodiscard]] std::string to_string() const { return vtable_ ? vtable_->format(*this) : std::string("None"); }

        [[nodiscard]] bool is_inline() const noexcept { return vtable_ && !using_heap_; }

        template <typename T, typename Visitor>
        bool visit_as(Visitor &&visitor) const {
            if (const T *p = get_if<T>()) {
                std::forward<Visitor>(visitor)(*p);
                return true;
            }
            return false;
        }

        friend bool operator==(const AnyValue &a, const AnyValue &b) noexcept {
            if (!a.vtable_ && !b.vtable_) return true;
            if (!a.vtable_ || !b.vtable_) return false;
            if (a.vtable_->type.info != b.vtable_->type.info) {
                return a.is_numeric() && b.is_numeric() && a.vtable_->to_double(a) == b.vtable_->to_double(b);
            }
            return a.vtable_->equals(a, b);
        }

        friend bool operator!=(const AnyValue &a, const AnyValue &b) noexcept { return !(a == b); }

        // Ordering is defined between two numbers, or two values of the same orderable type.
        friend bool operator<(const AnyValue &a, const AnyValue &b) {
            if (a.is_numeric() && b.is_numeric() && a.vtable_->type.info != b.vtable_->type.info) {
                return a.vtable_->to_double(a) < b.vtable_->to_double(b);
            }
            if (!a.vtable_ || !b.vtable_ || a.vtable_->type.info != b.vtable_->type.info || !a.vtable_->less) {
                detail::throw_not_ordered(a.type(), b.type());
            }
            return a.vtable_->less(a, b);
        }

    private:
        struct VTable
        {
            TypeId type;
            void (*copy)(AnyValue &, const AnyValue &);
            void (*move)(AnyValue &, AnyValue &) noexcept;
            void (*destroy)(AnyValue &) noexcept;
            std::size_t (*hash)(const AnyValue &) noexcept;
            bool (*equals)(const AnyValue &, const AnyValue &) noexcept;
            bool (*less)(const AnyValue &, const AnyValue &);  // nullptr when T has no operator<
            double (*to_double)(const AnyValue &) noexcept;     // nullptr when T is not arithmetic
            std::string (*format)(const AnyValue &);
        };

        template <class T>
        static const T &ref(const AnyValue &v) noexcept {
            return *static_cast<const T *>(v.get_ptr());
        }

        template <class T>
        static const VTable &vtable_for() {
            static const VTable vt{
                TypeId{&typeid(T)},
                // copy
                [](AnyValue &dst, const AnyValue &src) {
                    if (src.using_heap_) {
                        T *np = new T(ref<T>(src));
                        std::memcpy(dst.storage_, &np, sizeof(T *));
                        dst.using_heap_ = true;
                    } else {
                        new (dst.storage_ptr()) T(ref<T>(src));
                        dst.using_heap_ = false;
                    }
                    dst.vtable_ = &vtable_for<T>();
                },
                // move
                [](AnyValue &dst, AnyValue &src) noexcept {
                    if (src.using_heap_) {
                        std::memcpy(dst.storage_, src.storage_, sizeof(T *));
                        dst.using_heap_ = true;
                    } else {
                        new (dst.storage_ptr()) T(std::move(*static_cast<T *>(src.storage_ptr())));
                        dst.using_heap_ = false;
                        static_cast<T *>(src.storage_ptr())->~T();
                    }
                    dst.vtable_     = &vtable_for<T>();
                    src.vtable_     = nullptr;
                    src.using_heap_ = false;
                },
                // destroy
                [](AnyValue &self) noexcept {
                    if (self.using_heap_) {
                        delete static_cast<T *>(self.get_ptr());
                    } else {
                        static_cast<T *>(self.storage_ptr())->~T();
                    }
                },
                // hash
                [](const AnyValue &self) noexcept -> std::size_t {
                    if constexpr (requires(const T &x) { { std::hash<T>{}(x) } -> std::convertible_to<std::size_t>; }) {
                        return std::hash<T>{}(ref<T>(self));
                    } else {
                        // Falls back to the type only: equal values still hash equal.
                        return std::hash<const void *>{}(self.vtable_->type.info);
                    }
                },
                // equals
                [](const AnyValue &a, const AnyValue &b) noexcept -> bool {
                    if constexpr (requires(const T &x, const T &y) { { x == y } -> std::convertible_to<bool>; }) {
                        return ref<T>(a) == ref<T>(b);
                    } else {
                        return a.get_ptr() == b.get_ptr();
                    }
                },
                // less
                []() -> bool (*)(const AnyValue &, const AnyValue &) {
                    if constexpr (requires(const T &x, const T &y) { { x < y } -> std::convertible_to<bool>; }) {
                        return [](const AnyValue &a, const AnyValue &b) -> bool { return ref<T>(a) < ref<T>(b); };
                    } else {
                        return nullptr;
                    }
                }(),
                // to_double
                []() -> double (*)(const AnyValue &) noexcept {
                    if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
                        return [](const AnyValue &v) noexcept -> double { return static_cast<double>(ref<T>(v)); };
                    } else {
                        return nullptr;
                    }
                }(),
                // format
                [](const AnyValue &v) -> std::string {
                    if constexpr (std::is_same_v<T, std::string>) {
                        return fmt::format("'{}'", ref<T>(v));
                    } else if constexpr (fmt::is_formattable<T>::value) {
                        return fmt::format("{}", ref<T>(v));
                    } else {
                        return fmt::format("<{}>", type_name(v.type()));
                    }
                }
            };
            return vt;
        }

        void                     *storage_ptr() noexcept { return static_cast<void *>(storage_); }
        [[nodiscard]] const void *storage_ptr() const noexcept { return static_cast<const void *>(storage_); }

        void *get_ptr() noexcept {
            if (using_heap_) return *reinterpret_cast<void **>(storage_);
            return storage_ptr();
        }

        [[nodiscard]] const void *get_ptr() const noexcept {
            if (using_heap_) return *reinterpret_cast<void *const *>(storage_);
            return storage_ptr();
        }

        const VTable                *vtable_;
        bool                         using_heap_;
        alignas(Align) unsigned char storage_[SBO];
    };

    template <std::size_t SBO, std::size_t Align>
    std::string to_string(const AnyValue<SBO, Align> &v) {
        return v.to_string();
    }
}  // namespace conflate

namespace std
{
    template <std::size_t SBO, std::size_t Align>
    struct hash<conflate::AnyValue<SBO, Align>>
    {
        size_t operator()(const conflate::AnyValue<SBO, Align> &v) const noexcept { return v.hash_code(); }
    };
}  // namespace std

template <std::size_t SBO, std::size_t Align>
struct fmt::formatter<conflate::AnyValue<SBO, Align>> : fmt::formatter<std::string_view>
{
    auto format(const conflate::AnyValue<SBO, Align> &v, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(v.to_string(), ctx);
    }
};

#endif  // CONFLATE_TYPES_ANY_VALUE_H
