#include "security/Flags.hpp"

namespace security {

std::string with_detail(const std::string& code, const std::string& detail) {
    return code + ": " + detail;
}

std::string flag_code(const std::string& flag) {
    const size_t colon = flag.find(':');
    if (colon == std::string::npos) return flag;
    return flag.substr(0, colon);
}

size_t count_flag(const std::vector<std::string>& flags, const std::string& code) {
    size_t n = 0;
    for (const auto& f : flags) {
        if (flag_code(f) == code) ++n;
    }
    return n;
}

}  // namespace security
