// ============================================================================
// topology.cpp - implementation for qlink/topology.hpp
// ============================================================================

#include "qlink/topology.hpp"

#include <cctype>

namespace qlink {

const char* strategy_name(Strategy s) {
    return s == Strategy::Nested ? "nested" : "flat";
}

bool strategy_from_string(const std::string& value, Strategy& out) {
    std::string v;
    for (char c : value) v.push_back((char)std::tolower((unsigned char)c));
    if (v == "flat")   { out = Strategy::Flat;   return true; }
    if (v == "nested") { out = Strategy::Nested; return true; }
    return false;
}

std::size_t Topology::station_count() const {
    std::size_t n = 0;
    for (const auto& m : masters) {
        n += m.stations.size();
        for (const auto& mod : m.modules) n += mod.stations.size();
    }
    return n;
}

std::size_t Topology::warning_count() const {
    std::size_t n = warnings.size();
    for (const auto& m : masters) {
        n += m.warnings.size();
        for (const auto& mod : m.modules) n += mod.warnings.size();
    }
    return n;
}

std::vector<Topology::ScopedWarning> Topology::all_warnings() const {
    std::vector<ScopedWarning> out;
    for (const auto& w : warnings) out.push_back({"run", w});

    for (const auto& m : masters) {
        const std::string ms = str(m.address);
        for (const auto& w : m.warnings) out.push_back({"master:" + ms, w});
        for (const auto& mod : m.modules) {
            for (const auto& w : mod.warnings)
                out.push_back({"module:" + ms + "/" + str(mod.address), w});
        }
    }
    return out;
}

} // namespace qlink
