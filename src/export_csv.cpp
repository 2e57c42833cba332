// ============================================================================
// export_csv.cpp - CSV writer, format selection and file output
// JSON writers live in export_json.cpp. Tests: tests/test_exporters.cpp.
// ============================================================================

#include "qlink/exporters.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace qlink {

const char* format_name(ExportFormat f) {
    switch (f) {
        case ExportFormat::Csv:         return "csv";
        case ExportFormat::Accessories: return "accessories";
        case ExportFormat::Json:        return "json";
    }
    return "csv";
}

bool format_from_string(const std::string& value, ExportFormat& out) {
    if (value == "csv")         { out = ExportFormat::Csv;         return true; }
    if (value == "accessories") { out = ExportFormat::Accessories; return true; }
    if (value == "json")        { out = ExportFormat::Json;        return true; }
    return false;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';     // double embedded quotes
        out += c;
    }
    out += '"';
    return out;
}

static void station_cells(std::ostream& os, const Station& st) {
    os << ',' << csv_escape(str(st.station))
       << ',' << csv_escape(str(st.type))
       << ',' << csv_escape(str(st.config))
       << ',' << csv_escape(str(st.version))
       << ',' << csv_escape(str(st.flag))
       << ',' << csv_escape(str(st.serial)) << '\n';
}

// ---------------------------------------------------------------------------
// write_csv()
// -----------
// The Master column is the master the station was enumerated under, not
// field 0 of its VQS line; the two agree on a healthy bus.
// ---------------------------------------------------------------------------
void write_csv(std::ostream& os, const Topology& topo) {
    const bool nested = topo.strategy == Strategy::Nested;

    os << "Master";
    if (nested) os << ",Module";
    os << ",Station,Station Type,Config,Version,Flag,Serial Number\n";

    for (const auto& m : topo.masters) {
        const std::string master = csv_escape(str(m.address));
        if (nested) {
            for (const auto& mod : m.modules) {
                const std::string module = csv_escape(str(mod.address));
                for (const auto& st : mod.stations) {
                    os << master << ',' << module;
                    station_cells(os, st);
                }
            }
        } else {
            for (const auto& st : m.stations) {
                os << master;
                station_cells(os, st);
            }
        }
    }
}

void export_topology(std::ostream& os, const Topology& topo, ExportFormat f) {
    switch (f) {
        case ExportFormat::Csv:         write_csv(os, topo);           break;
        case ExportFormat::Accessories: write_accessories(os, topo);   break;
        case ExportFormat::Json:        write_topology_json(os, topo); break;
    }
}

bool write_output_file(const std::string& path, const std::string& content, std::string& err) {
    if (path.empty() || path == "-") {
        std::cout << content;
        std::cout.flush();
        if (!std::cout) { err = "stdout write failed"; return false; }
        return true;
    }

    std::error_code ec;
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) { err = "mkdir " + p.parent_path().string() + ": " + ec.message(); return false; }
    }

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) { err = "cannot open " + tmp.string(); return false; }
        out << content;
        out.flush();
        if (!out) {
            err = "write failed: " + tmp.string();
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        err = "rename " + tmp.string() + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

} // namespace qlink
