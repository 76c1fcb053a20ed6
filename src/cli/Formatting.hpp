#pragma once

#include <ostream>

#include <nlohmann/json.hpp>

#include "cli/ICommand.hpp"

namespace chuck {

namespace Formatting {

/// Pretty-print with a 2-space indent, keeping non-ASCII characters as-is.
void printJson(std::ostream& out, const nlohmann::json& data);

void printJoke(std::ostream& out, const nlohmann::json& joke, const OutputOptions& opts);
void printCategories(std::ostream& out, const nlohmann::json& categories, const OutputOptions& opts);
void printSearchResults(std::ostream& out, const nlohmann::json& data, const OutputOptions& opts);

}

}

