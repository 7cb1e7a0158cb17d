#include <conflate/util/errors.h>

namespace conflate {

    std::string_view to_string(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::KeyNotDirty: return "KeyNotDirty";
            case ErrorKind::KeyNotFound: return "KeyNotFound";
            case ErrorKind::TypeMismatch: return "TypeMismatch";
        }
        return "Unknown";
    }

    conflation_error::conflation_error(ErrorKind kind, const std::string &msg)
        : std::runtime_error(fmt::format("[{}] {}", to_string(kind), msg)), kind_(kind) {}

} // namespace conflate
