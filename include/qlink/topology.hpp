#pragma once
/**
 * @page ql-topology Topology Model
 * @file topology.hpp
 * @brief Masters, modules and stations as reassembled from VQM/VQP/VQS replies.
 *
 * @details
 * SHAPES
 * ------
 * Two enumeration strategies produce two tree shapes that live side by side:
 *   - Flat:   Master -> Station            (VQM, then VQS <master>)
 *   - Nested: Master -> Module -> Station  (VQM, VQP <master>, VQS <module>)
 *
 * A Master built by the flat strategy fills `stations` and leaves `modules`
 * empty; the nested strategy does the opposite. The Topology records which
 * strategy built it so exporters pick the right column layout.
 *
 * FIXED-WIDTH RECORDS
 * -------------------
 * Station attributes are short bus tokens. They are stored in ETL
 * fixed-capacity strings (QL_ADDR_MAX / QL_FIELD_MAX) so one record has a known
 * footprint. A token that does not fit is a format error for that line, never a
 * silent truncation; use assign_field() to enforce this.
 *
 * WARNINGS
 * --------
 * Non-fatal errors are stored where they happened: on the Master, on the Module,
 * or (for the master list itself) on the Topology. Exporters ignore them; the
 * CLI prints them and the JSON dump carries them.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "etl/string.h"
#include "qlink/errors.hpp"

namespace qlink {

static constexpr std::size_t QL_ADDR_MAX  = 16;  ///< master/module/station address token
static constexpr std::size_t QL_FIELD_MAX = 32;  ///< type/config/version/flag/serial token

using AddrStr  = etl::string<QL_ADDR_MAX>;
using FieldStr = etl::string<QL_FIELD_MAX>;

/// Copy @p src into @p dst; false (dst cleared) if it exceeds the capacity.
template <std::size_t N>
bool assign_field(etl::string<N>& dst, const std::string& src) {
    dst.clear();
    if (src.size() > N) return false;
    dst.assign(src.c_str(), src.size());
    return true;
}

inline std::string str(const AddrStr& s)  { return std::string(s.c_str(), s.size()); }
inline std::string str(const FieldStr& s) { return std::string(s.c_str(), s.size()); }

/// One 7-field VQS record, fields in wire order.
struct Station {
    AddrStr  master;   ///< field 0: master address as reported on the line
    AddrStr  station;  ///< field 1
    FieldStr type;     ///< field 2: station type code
    FieldStr config;   ///< field 3
    FieldStr version;  ///< field 4: firmware version
    FieldStr flag;     ///< field 5: bit flag, kept verbatim ("0"/"1")
    FieldStr serial;   ///< field 6: serial number

    bool flag_set() const { return !flag.empty() && flag[0] != '0'; }
};

struct Module {
    AddrStr              address;
    std::vector<Station> stations;
    std::vector<Error>   warnings;
};

struct Master {
    AddrStr              address;
    std::vector<Module>  modules;    ///< nested strategy only
    std::vector<Station> stations;   ///< flat strategy only
    std::vector<Error>   warnings;
};

enum class Strategy : uint8_t { Flat, Nested };

const char* strategy_name(Strategy s);
bool        strategy_from_string(const std::string& value, Strategy& out);

struct Topology {
    Strategy            strategy{Strategy::Flat};
    std::vector<Master> masters;
    std::vector<Error>  warnings;   ///< run-level (master list) issues

    std::size_t station_count() const;

    /// Run-level plus every master and module warning.
    std::size_t warning_count() const;

    /// Flattened "scope -> error" view, in tree order, for reporting.
    struct ScopedWarning {
        std::string scope;   ///< "run", "master:M1", "module:M1/P2"
        Error       error;
    };
    std::vector<ScopedWarning> all_warnings() const;
};

} // namespace qlink
