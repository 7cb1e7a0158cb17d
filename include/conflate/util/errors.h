#ifndef CONFLATE_UTIL_ERRORS
#define CONFLATE_UTIL_ERRORS

#include <conflate/conflate_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace conflate {

    /**
     * The failure classes a conflated container can report. Every error is local to the call that raised it,
     * the container is left exactly as it was before the call.
     */
    enum class ErrorKind {
        KeyNotDirty,   ///< read of a key that is not marked dirty in the current interval
        KeyNotFound,   ///< erase of a key that is absent or clean
        TypeMismatch,  ///< a policy received a value it cannot combine with the stored state
    };

    CONFLATE_EXPORT std::string_view to_string(ErrorKind kind) noexcept;

    struct CONFLATE_EXPORT conflation_error : std::runtime_error {
        conflation_error(ErrorKind kind, const std::string &msg);

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    struct CONFLATE_EXPORT key_not_dirty : conflation_error {
        explicit key_not_dirty(const std::string &msg) : conflation_error(ErrorKind::KeyNotDirty, msg) {}
    };

    struct CONFLATE_EXPORT key_not_found : conflation_error {
        explicit key_not_found(const std::string &msg) : conflation_error(ErrorKind::KeyNotFound, msg) {}
    };

    struct CONFLATE_EXPORT type_mismatch : conflation_error {
        explicit type_mismatch(const std::string &msg) : conflation_error(ErrorKind::TypeMismatch, msg) {}
    };

    // Overload (I) - takes error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace conflate

#endif // CONFLATE_UTIL_ERRORS
