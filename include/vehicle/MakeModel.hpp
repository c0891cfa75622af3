#pragma once
#include <string>
#include <vector>

namespace vehicle {

// Known manufacturer names, in match order.
const std::vector<std::string>& known_makes();

// "CHEVROLETIMPALA" -> "CHEVROLET IMPALA". Only the first known make that prefixes the
// (upper-cased) text with no space after it is split off; anything else is returned as-is.
std::string split_make_model(const std::string& text);

} // namespace vehicle
