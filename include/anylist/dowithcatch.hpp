/**
 * @file dowithcatch.hpp
 * @brief turn exceptions thrown by a callable into an error string
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <concepts>
#include <exception>
#include <expected>
#include <string>
#include <type_traits>

namespace anylist {

/**
 * @brief call fun, a thrown std::exception becomes its what() text, anything else "[unhandled exception]"
 *
 */
template <std::invocable<> Func>
inline std::expected<std::invoke_result_t<Func>, std::string> doWithCatch(Func &&fun) noexcept {
    try {
        if constexpr (!std::is_same_v<void, std::invoke_result_t<Func>>) {
            return fun();
        } else {
            fun();
            return {};
        }
    } catch (std::exception &err) {
        return std::unexpected(err.what());
    } catch (...) {
        return std::unexpected("[unhandled exception]");
    }
}

} // namespace anylist
