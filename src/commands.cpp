#include "qlink/commands.hpp"   // builders and command constants

namespace qlink {

// Verb + single space + address; matches what the bus expects for VQP/VQS.
static inline std::string with_arg(const char* verb, const std::string& arg) {
    std::string s(verb);
    s += ' ';
    s += arg;
    return s;
}

std::string make_query_masters() {
    return QL_CMD_MASTERS;
}

std::string make_query_modules(const std::string& master) {
    return with_arg(QL_CMD_MODULES, master);
}

std::string make_query_stations(const std::string& address) {
    return with_arg(QL_CMD_STATIONS, address);
}

bool is_valid_command(const std::string& command) {
    bool has_text = false;
    for (char c : command) {
        if (c == '\r' || c == '\n') return false;   // would split into two bus commands
        if (c != ' ' && c != '\t') has_text = true;
    }
    return has_text;
}

} // namespace qlink
