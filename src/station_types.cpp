#include "qlink/station_types.hpp"

namespace qlink {

struct TypeEntry {
    const char* code;
    const char* category;
};

static const TypeEntry kTypes[] = {
    {"0", "Lightbulb"},
    {"1", "Switch"},
};

static constexpr const char* QL_DEFAULT_CATEGORY = "Outlet";

const char* accessory_category(const std::string& type_code) {
    for (const auto& t : kTypes)
        if (type_code == t.code) return t.category;
    return QL_DEFAULT_CATEGORY;
}

} // namespace qlink
