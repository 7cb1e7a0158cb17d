#include <conflate/types/any_value.h>

#include <cxxabi.h>

#include <cstdlib>
#include <memory>

namespace conflate
{

    bool operator==(TypeId a, TypeId b) {
        if (a.info == b.info) return true;
        if (!a.info || !b.info) return false;
        return *a.info == *b.info;
    }

    std::string type_name(TypeId id) {
        if (!id.info) return "<empty>";
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> demangled{
            abi::__cxa_demangle(id.info->name(), nullptr, nullptr, &status), &std::free};
        if (status == 0 && demangled) return demangled.get();
        return id.info->name();
    }

    namespace detail
    {
        void throw_not_ordered(TypeId lhs, TypeId rhs) {
            if (lhs == rhs) {
                throw_error<type_mismatch>("values of type '{}' are not orderable", type_name(lhs));
            }
            throw_error<type_mismatch>("cannot order '{}' against '{}'", type_name(lhs), type_name(rhs));
        }

        void throw_not_numeric(TypeId type) {
            throw_error<type_mismatch>("expected a numeric value, got '{}'", type_name(type));
        }

        void throw_bad_access(TypeId held, TypeId requested, std::source_location loc) {
            const std::string msg = fmt::format("value holds '{}', requested '{}'", type_name(held), type_name(requested));
            throw_error<type_mismatch>(std::string_view{msg}, loc);
        }
    }  // namespace detail

}  // namespace conflate
