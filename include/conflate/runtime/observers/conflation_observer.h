#ifndef CONFLATE_CONFLATION_OBSERVER_H
#define CONFLATE_CONFLATION_OBSERVER_H

#include <conflate/types/container_summary.h>

#include <cstddef>
#include <string_view>

namespace conflate {

    // ConflationObserver - externally managed, a container only keeps a raw pointer to it.
    // Events are reported after the container state has been committed; a failed operation
    // reports nothing.
    struct ConflationObserver {
        using ptr = ConflationObserver*;

        virtual ~ConflationObserver() = default;

        virtual void on_after_set(const ContainerSummary &, std::string_view /*key*/) {
        };

        virtual void on_after_erase(const ContainerSummary &, std::string_view /*key*/) {
        };

        virtual void on_after_reset(const ContainerSummary &, std::size_t /*released*/) {
        };

        virtual void on_after_clear(const ContainerSummary &) {
        };
    };

} // namespace conflate

#endif // CONFLATE_CONFLATION_OBSERVER_H
