/**
 * @file parsevalue.hpp
 * @brief parse typed values from text
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 * @details Maps a type name such as "int32_t" to the C++ type and parses a value of it. Used by the
 * console to build List elements from commands.
 */
#pragma once

#include <charconv>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace anylist {

enum struct parseError {
    unknown_type,
    bad_value,
};

inline std::string_view describe(parseError err) {
    if (err == parseError::unknown_type)
        return "[unknown_type]";
    return "[bad_value]";
}

namespace helper {

    template <typename Ty, typename Func>
    inline std::expected<void, parseError> invokeOnType(Func &&func) {
        if constexpr (std::is_void_v<std::invoke_result_t<Func, std::type_identity<Ty>>>) {
            std::forward<Func>(func)(std::type_identity<Ty>{});
            return {};
        } else {
            return std::forward<Func>(func)(std::type_identity<Ty>{});
        }
    }

}

/**
 * @brief call func with std::type_identity of the type named by name
 *
 * @param type one of bool, int8_t, uint8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t, float,
 * double, string
 * @param func returns void or std::expected<void, parseError>
 * @return unknown_type if name is not known, otherwise result of func
 */
template <typename Func>
inline std::expected<void, parseError> visitTypeName(std::string_view type, Func &&func) {
    using namespace std::literals;
    if (type == "bool"sv)
        return helper::invokeOnType<bool>(std::forward<Func>(func));
    if (type == "int8_t"sv)
        return helper::invokeOnType<int8_t>(std::forward<Func>(func));
    if (type == "uint8_t"sv)
        return helper::invokeOnType<uint8_t>(std::forward<Func>(func));
    if (type == "int16_t"sv)
        return helper::invokeOnType<int16_t>(std::forward<Func>(func));
    if (type == "uint16_t"sv)
        return helper::invokeOnType<uint16_t>(std::forward<Func>(func));
    if (type == "int32_t"sv)
        return helper::invokeOnType<int32_t>(std::forward<Func>(func));
    if (type == "uint32_t"sv)
        return helper::invokeOnType<uint32_t>(std::forward<Func>(func));
    if (type == "int64_t"sv)
        return helper::invokeOnType<int64_t>(std::forward<Func>(func));
    if (type == "uint64_t"sv)
        return helper::invokeOnType<uint64_t>(std::forward<Func>(func));
    if (type == "float"sv)
        return helper::invokeOnType<float>(std::forward<Func>(func));
    if (type == "double"sv)
        return helper::invokeOnType<double>(std::forward<Func>(func));
    if (type == "string"sv || type == "std::string"sv)
        return helper::invokeOnType<std::string>(std::forward<Func>(func));
    return std::unexpected(parseError::unknown_type);
}

/**
 * @brief parse the whole text as a value of Ty
 *
 * @return bad_value if text is not entirely a Ty, or is out of its range
 */
template <typename Ty>
inline std::expected<Ty, parseError> parseValue(std::string_view text) {
    using namespace std::literals;
    if constexpr (std::is_same_v<Ty, std::string>) {
        return std::string{text};
    } else if constexpr (std::is_same_v<Ty, bool>) {
        if (text == "true"sv || text == "1"sv)
            return true;
        if (text == "false"sv || text == "0"sv)
            return false;
        return std::unexpected(parseError::bad_value);
    } else {
        static_assert(std::is_arithmetic_v<Ty>, "parseValue only support bool, numbers and std::string");
        Ty value{};
        auto first = text.data();
        auto last = text.data() + text.size();
        // from_chars rejects a leading '+', accept it like stoi does
        if (first != last && *first == '+') {
            ++first;
            if (first != last && (*first == '+' || *first == '-'))
                return std::unexpected(parseError::bad_value);
        }
        if (first == last) {
            return std::unexpected(parseError::bad_value);
        }
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::unexpected(parseError::bad_value);
        }
        return value;
    }
}

} // namespace anylist
