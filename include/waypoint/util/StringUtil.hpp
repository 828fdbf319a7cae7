#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace waypoint::util {

std::string_view trim(std::string_view view);
std::string toLower(std::string_view text);
// Splits on the delimiter; tokens are trimmed and empty tokens dropped.
std::vector<std::string> splitList(std::string_view text, char delimiter = ',');
std::string replaceAll(std::string text, std::string_view from, std::string_view to);

} // namespace waypoint::util
