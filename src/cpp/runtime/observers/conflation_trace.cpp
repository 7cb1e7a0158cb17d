#include <conflate/runtime/observers/conflation_trace.h>

#include <fmt/format.h>

#include <cstdio>

namespace conflate {

    bool ConflationTrace::_use_stderr = true;

    ConflationTrace::ConflationTrace(const std::optional<std::string>& filter,
                                     bool set, bool erase, bool reset, bool clear)
        : _filter(filter), _set(set), _erase(erase), _reset(reset), _clear(clear) {
    }

    void ConflationTrace::set_use_stderr(bool value) {
        _use_stderr = value;
    }

    void ConflationTrace::_print(const ContainerSummary& summary, const std::string& msg) const {
        fmt::print(_use_stderr ? stderr : stdout, "[{}] {} dirty:{} entries:{}\n",
                   summary.name, msg, summary.dirty_count, summary.total_entries);
    }

    bool ConflationTrace::_should_log(const ContainerSummary& summary) const {
        if (!_filter.has_value()) {
            return true;
        }
        return summary.name.find(_filter.value()) != std::string::npos;
    }

    void ConflationTrace::on_after_set(const ContainerSummary& summary, std::string_view key) {
        if (_set && _should_log(summary)) {
            _print(summary, fmt::format("set key={}", key));
        }
    }

    void ConflationTrace::on_after_erase(const ContainerSummary& summary, std::string_view key) {
        if (_erase && _should_log(summary)) {
            _print(summary, fmt::format("erase key={}", key));
        }
    }

    void ConflationTrace::on_after_reset(const ContainerSummary& summary, std::size_t released) {
        if (_reset && _should_log(summary)) {
            _print(summary, fmt::format("reset released:{}", released));
        }
    }

    void ConflationTrace::on_after_clear(const ContainerSummary& summary) {
        if (_clear && _should_log(summary)) {
            _print(summary, "clear");
        }
    }

} // namespace conflate
