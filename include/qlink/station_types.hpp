#pragma once
/**
 * @file station_types.hpp
 * @brief Station type code -> accessory service category.
 *
 *   "0" -> "Lightbulb"
 *   "1" -> "Switch"
 *   anything else -> "Outlet"
 */

#include <string>

namespace qlink {

const char* accessory_category(const std::string& type_code);

} // namespace qlink
