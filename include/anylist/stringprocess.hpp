/**
 * @file stringprocess.hpp
 * @brief string helpers used by printer and console
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace anylist::mystr {

/**
 * @brief join a range of string with a middle string
 *
 * @param range range of std::string or std::string_view
 * @param middle string inserted between two items
 * @return std::string joined string
 */
template <std::ranges::input_range _Range>
inline std::string join(_Range &&range, std::string_view middle) {
    std::string result;
    bool first = true;
    for (auto &&item : range) {
        static_assert(std::is_same_v<std::string, std::remove_cvref_t<decltype(item)>> ||
                          std::is_same_v<std::string_view, std::remove_cvref_t<decltype(item)>>,
                      "join only support std::string and std::string_view");
        if (first) {
            first = false;
        } else {
            result += middle;
        }
        result += item;
    }
    return result;
}

/**
 * @brief split a string by a single char, empty pieces are dropped
 *
 * @attention returned views point into input string
 *
 * @param s input string
 * @param middle separator
 * @return std::vector<std::string_view> pieces in order
 */
inline std::vector<std::string_view> split(std::string_view s, char middle) {
    std::vector<std::string_view> ret;
    while (!s.empty()) {
        auto p = s.find(middle);
        auto piece = s.substr(0, p);
        if (!piece.empty()) {
            ret.push_back(piece);
        }
        if (p == std::string_view::npos) {
            break;
        }
        s.remove_prefix(p + 1);
    }
    return ret;
}

inline std::string_view removeSpaceView(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace anylist::mystr
