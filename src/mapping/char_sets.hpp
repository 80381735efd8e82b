#pragma once

#include <string>

namespace cascii {

namespace CharSet {

const std::string DEFAULT = " .'`^,:;Il!i><~+_-?][}{1)(|/tfjrxnuvczXYUJCLQ0OZmwqpdbkhao*#MW&8%B@$";
const std::string SHORT = " .:-=+*#%@";
const std::string BLOCKY = " .:oO8@";

inline std::string get_set(const std::string& name) {
    if (name == "default") return DEFAULT;
    if (name == "short") return SHORT;
    if (name == "blocky") return BLOCKY;
    return "";
}

}

}
