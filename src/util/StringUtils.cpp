#include "util/StringUtils.hpp"

namespace chuck {

namespace StringUtils {

std::string trim(const std::string& text) {
    static const char* ws = " \t\r\n\v\f";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

}

}
