#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace shuttle::utils {

auto toLower(std::string_view view) -> std::string
{
    std::string result{view};
    std::transform(std::begin(result), std::end(result),
                   std::begin(result),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto toUpper(std::string_view view) -> std::string
{
    std::string result{view};
    std::transform(std::begin(result), std::end(result),
                   std::begin(result),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool
{
    return lhs.size() == rhs.size()
        && std::equal(std::begin(lhs), std::end(lhs), std::begin(rhs),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

auto trim(std::string_view view) -> std::string_view
{
    auto const isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };

    while (!view.empty() && isSpace(view.front())) {
        view.remove_prefix(1);
    }
    while (!view.empty() && isSpace(view.back())) {
        view.remove_suffix(1);
    }
    return view;
}

auto base64Encode(std::string_view view) -> std::string
{
    auto const *BASE64_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    auto const BASE64_PAD = '=';

    std::string result;
    result.reserve((view.size() + 2) / 3 * 4);

    for (size_t offset = 0; offset < view.size(); offset += 3) {
        auto const remaining = view.size() - offset;

        uint32_t block = static_cast<uint8_t>(view[offset]) << 16;
        if (remaining > 1) {
            block |= static_cast<uint8_t>(view[offset + 1]) << 8;
        }
        if (remaining > 2) {
            block |= static_cast<uint8_t>(view[offset + 2]);
        }

        result += BASE64_ALPHABET[(block >> 18) & 0x3F];
        result += BASE64_ALPHABET[(block >> 12) & 0x3F];
        result += remaining > 1 ? BASE64_ALPHABET[(block >> 6) & 0x3F] : BASE64_PAD;
        result += remaining > 2 ? BASE64_ALPHABET[block & 0x3F] : BASE64_PAD;
    }

    return result;
}

auto formUrlEncode(std::string_view view) -> std::string
{
    auto const *HEX_DIGITS = "0123456789ABCDEF";

    std::string result;
    result.reserve(view.size());

    for (auto const c : view) {
        auto const byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~') {
            result += c;
        } else if (c == ' ') {
            result += '+';
        } else {
            result += '%';
            result += HEX_DIGITS[byte >> 4];
            result += HEX_DIGITS[byte & 0x0F];
        }
    }
    return result;
}

}  // namespace shuttle::utils
