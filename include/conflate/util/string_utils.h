#ifndef CONFLATE_UTIL_STRING_UTILS_H
#define CONFLATE_UTIL_STRING_UTILS_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <typeinfo>

namespace conflate {

    /**
     * Best effort rendering used in error messages and traces. Types fmt cannot format are shown by their
     * (mangled) type name rather than failing to compile, keys and values only need to be hashable.
     */
    template<typename T>
    std::string to_display_string(const T &value) {
        if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("{}", value);
        } else {
            return fmt::format("<{}>", typeid(T).name());
        }
    }

} // namespace conflate

#endif  // CONFLATE_UTIL_STRING_UTILS_H
