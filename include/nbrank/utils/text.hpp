#ifndef NBRANK_UTILS_TEXT_HPP
#define NBRANK_UTILS_TEXT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace nbrank {
namespace utils {

[[nodiscard]] constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

[[nodiscard]] inline std::string strip(std::string_view str) {
    std::size_t first = 0;
    std::size_t last = str.size();
    while(first < last && is_space(str[first])) ++first;
    while(last > first && is_space(str[last - 1])) --last;
    return std::string(str.substr(first, last - first));
}

[[nodiscard]] inline std::vector<std::string> split_whitespace(
    std::string_view str) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while(i < str.size()) {
        while(i < str.size() && is_space(str[i])) ++i;
        const std::size_t token_start = i;
        while(i < str.size() && !is_space(str[i])) ++i;
        if(i > token_start)
            tokens.emplace_back(str.substr(token_start, i - token_start));
    }
    return tokens;
}

// UTF-8 continuation bytes are 10xxxxxx
[[nodiscard]] constexpr bool is_utf8_lead(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
}

[[nodiscard]] inline std::size_t utf8_length(std::string_view str) noexcept {
    std::size_t length = 0;
    for(char c : str) length += is_utf8_lead(c);
    return length;
}

/**
 * @brief Splits a UTF-8 string into its code points, whitespace excluded.
 */
[[nodiscard]] inline std::vector<std::string_view> utf8_characters_no_space(
    std::string_view str) {
    std::vector<std::string_view> characters;
    std::size_t i = 0;
    while(i < str.size()) {
        std::size_t j = i + 1;
        while(j < str.size() && !is_utf8_lead(str[j])) ++j;
        if(!is_space(str[i])) characters.emplace_back(str.substr(i, j - i));
        i = j;
    }
    return characters;
}

}  // namespace utils
}  // namespace nbrank

#endif  // NBRANK_UTILS_TEXT_HPP
