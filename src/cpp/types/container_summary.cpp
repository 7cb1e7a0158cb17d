#include <conflate/types/container_summary.h>

namespace conflate {

    std::string to_string(const ContainerSummary &summary) {
        return fmt::format("<{} dirty:{} entries:{}>", summary.name, summary.dirty_count, summary.total_entries);
    }

} // namespace conflate
