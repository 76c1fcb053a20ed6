#include "core/Joke.hpp"

namespace chuck {

namespace {

std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<std::string> optionalStringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}

Joke Joke::fromJson(const nlohmann::json& data) {
    Joke joke;
    if (!data.is_object()) return joke;

    joke.id = stringField(data, "id");
    joke.value = stringField(data, "value");
    joke.url = optionalStringField(data, "url");
    joke.iconUrl = optionalStringField(data, "icon_url");

    auto cats = data.find("categories");
    if (cats != data.end() && cats->is_array()) {
        for (const auto& c : *cats) {
            if (c.is_string()) joke.categories.push_back(c.get<std::string>());
        }
    }
    return joke;
}

SearchResult SearchResult::fromJson(const nlohmann::json& data) {
    SearchResult out;
    if (!data.is_object()) return out;

    auto items = data.find("result");
    if (items != data.end() && items->is_array()) {
        out.result.reserve(items->size());
        for (const auto& item : *items) {
            out.result.push_back(Joke::fromJson(item));
        }
    }

    // total falls back to the number of parsed items
    auto total = data.find("total");
    if (total != data.end() && total->is_number_integer()) {
        out.total = total->get<long long>();
    } else {
        out.total = static_cast<long long>(out.result.size());
    }
    return out;
}

}
