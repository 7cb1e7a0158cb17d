#pragma once

#include <conflate/conflate_export.h>

#include <fmt/format.h>

#include <cstddef>
#include <string>

namespace conflate {

/// Observability snapshot of a container, see ConflatedContainer::describe().
struct CONFLATE_EXPORT ContainerSummary {
    std::string name;
    std::size_t dirty_count{0};
    std::size_t total_entries{0};

    friend bool operator==(const ContainerSummary&, const ContainerSummary&) = default;
};

/// Renders "<name dirty:N entries:M>".
CONFLATE_EXPORT std::string to_string(const ContainerSummary& summary);

} // namespace conflate

template<>
struct fmt::formatter<conflate::ContainerSummary> : fmt::formatter<std::string_view> {
    auto format(const conflate::ContainerSummary& v, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(conflate::to_string(v), ctx);
    }
};
