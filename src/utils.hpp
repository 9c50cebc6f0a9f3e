#ifndef SHUTTLE_UTILS_HPP_
#define SHUTTLE_UTILS_HPP_

#include <string>
#include <string_view>

namespace shuttle::utils {

auto toLower(std::string_view view) -> std::string;
auto toUpper(std::string_view view) -> std::string;

// ASCII only, as used by header names
auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool;

auto trim(std::string_view view) -> std::string_view;

auto base64Encode(std::string_view view) -> std::string;

// application/x-www-form-urlencoded flavor: space becomes '+'
auto formUrlEncode(std::string_view view) -> std::string;

}  // namespace shuttle::utils

#endif  // SHUTTLE_UTILS_HPP_
