// ============================================================================
// export_json.cpp - accessory list and topology tree as JSON
// ============================================================================

#include "qlink/exporters.hpp"
#include "qlink/station_types.hpp"

#include <nlohmann/json.hpp>

using ojson = nlohmann::ordered_json;

namespace qlink {

static ojson accessory(const std::string& master, const Station& st) {
    const std::string category = accessory_category(str(st.type));

    ojson on;
    on["type"]  = "On";
    on["value"] = false;

    ojson service;
    service["type"]            = category;
    service["characteristics"] = ojson::array({on});

    ojson a;
    a["name"]         = "Vantage Station " + str(st.station);
    a["manufacturer"] = "Vantage Controls";
    a["model"]        = "Qlink " + str(st.version);
    a["serialNumber"] = str(st.serial);
    a["master"]       = master;
    a["station"]      = str(st.station);
    a["type"]         = category;
    a["services"]     = ojson::array({service});
    return a;
}

static ojson station_json(const Station& st) {
    ojson j;
    j["master"]  = str(st.master);
    j["station"] = str(st.station);
    j["type"]    = str(st.type);
    j["config"]  = str(st.config);
    j["version"] = str(st.version);
    j["flag"]    = str(st.flag);
    j["serial"]  = str(st.serial);
    return j;
}

static ojson error_json(const Error& e) {
    ojson j;
    j["kind"]   = kind_name(e.kind);
    j["reason"] = e.reason;
    if (e.kind == ErrorKind::CountMismatch) {
        j["expected"] = e.expected;
        j["actual"]   = e.actual;
    }
    if (!e.detail.empty()) j["detail"] = e.detail;
    return j;
}

static ojson errors_json(const std::vector<Error>& v) {
    ojson a = ojson::array();
    for (const auto& e : v) a.push_back(error_json(e));
    return a;
}

void write_accessories(std::ostream& os, const Topology& topo) {
    ojson list = ojson::array();
    for (const auto& m : topo.masters) {
        const std::string master = str(m.address);
        for (const auto& st : m.stations) list.push_back(accessory(master, st));
        for (const auto& mod : m.modules)
            for (const auto& st : mod.stations) list.push_back(accessory(master, st));
    }
    os << list.dump(2) << '\n';
}

void write_topology_json(std::ostream& os, const Topology& topo) {
    ojson root;
    root["strategy"] = strategy_name(topo.strategy);

    ojson masters = ojson::array();
    for (const auto& m : topo.masters) {
        ojson jm;
        jm["address"] = str(m.address);
        if (topo.strategy == Strategy::Nested) {
            ojson mods = ojson::array();
            for (const auto& mod : m.modules) {
                ojson jmod;
                jmod["address"] = str(mod.address);
                ojson sts = ojson::array();
                for (const auto& st : mod.stations) sts.push_back(station_json(st));
                jmod["stations"] = sts;
                jmod["warnings"] = errors_json(mod.warnings);
                mods.push_back(jmod);
            }
            jm["modules"] = mods;
        } else {
            ojson sts = ojson::array();
            for (const auto& st : m.stations) sts.push_back(station_json(st));
            jm["stations"] = sts;
        }
        jm["warnings"] = errors_json(m.warnings);
        masters.push_back(jm);
    }
    root["masters"]  = masters;
    root["warnings"] = errors_json(topo.warnings);
    root["stationCount"] = topo.station_count();

    os << root.dump(2) << '\n';
}

} // namespace qlink
