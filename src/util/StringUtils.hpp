#pragma once

#include <string>
#include <vector>

namespace chuck {

namespace StringUtils {

/// Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF).
std::string trim(const std::string& text);

/// Join parts with a separator, e.g. {"a", "b"} + ", " -> "a, b".
std::string join(const std::vector<std::string>& parts, const std::string& sep);

/// True if text begins with prefix.
bool startsWith(const std::string& text, const std::string& prefix);

}

}

