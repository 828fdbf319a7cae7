#include "waypoint/util/StringUtil.hpp"

#include <algorithm>
#include <cctype>

namespace waypoint::util {

std::string_view trim(std::string_view view) {
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front()))) {
        view.remove_prefix(1);
    }
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back()))) {
        view.remove_suffix(1);
    }
    return view;
}

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::vector<std::string> splitList(std::string_view text, char delimiter) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto token = trim(text.substr(start, end - start));
        if (!token.empty()) {
            tokens.emplace_back(token);
        }
        start = end + 1;
    }
    return tokens;
}

std::string replaceAll(std::string text, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace waypoint::util
