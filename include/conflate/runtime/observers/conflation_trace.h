#pragma once

#include <conflate/conflate_export.h>
#include <conflate/runtime/observers/conflation_observer.h>

#include <optional>
#include <string>

namespace conflate {

    /**
     * @brief Logs out the operations performed on the containers it observes.
     *
     * One line per event, e.g. "[MeanConflator] set key=AAPL dirty:1 entries:1". Per-key events are
     * voluminous on a busy producer; restrict them with the flags or the filter when only the interval
     * boundaries are of interest.
     */
    class CONFLATE_EXPORT ConflationTrace : public ConflationObserver {
    public:
        /**
         * @brief Construct a new Conflation Trace object
         *
         * @param filter Used to restrict which containers are reported (substring match on the name)
         * @param set Log set events
         * @param erase Log erase events
         * @param reset Log reset events
         * @param clear Log clear events
         */
        explicit ConflationTrace(const std::optional<std::string>& filter = std::nullopt,
                                 bool set = true, bool erase = true, bool reset = true, bool clear = true);

        void on_after_set(const ContainerSummary& summary, std::string_view key) override;
        void on_after_erase(const ContainerSummary& summary, std::string_view key) override;
        void on_after_reset(const ContainerSummary& summary, std::size_t released) override;
        void on_after_clear(const ContainerSummary& summary) override;

        // Static configuration
        static void set_use_stderr(bool value);

    private:
        std::optional<std::string> _filter;
        bool _set;
        bool _erase;
        bool _reset;
        bool _clear;

        static bool _use_stderr;

        void _print(const ContainerSummary& summary, const std::string& msg) const;
        bool _should_log(const ContainerSummary& summary) const;
    };

} // namespace conflate
