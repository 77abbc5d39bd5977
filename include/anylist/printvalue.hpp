/**
 * @file printvalue.hpp
 * @brief value printer
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 * @details Textual representation of every value a List can hold, in several formations.
 */
#pragma once

#include <array>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <vector>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace anylist {

/**
 * @brief describe how values are turned into text
 *
 */
struct Formation {
    std::string_view name;
    std::string_view listOpen, listClose;
    std::string_view sequenceOpen, sequenceClose;
    std::string_view spliter;
    std::string_view stringOpen, stringClose;
    std::string_view trueLiteral, falseLiteral, noneLiteral;
    // prefix numbers, bools and sequences with their type, like int32_t(1)
    bool typedScalar;
};

inline constexpr Formation DefaultFormat{
    "default", "[", "]", "[", "]", ", ", "\"", "\"", "true", "false", "null", false,
};

inline constexpr Formation PythonFormat{
    "python", "[", "]", "[", "]", ", ", "'", "'", "True", "False", "None", false,
};

inline constexpr Formation CppFormat{
    "cpp", "anylist::List{", "}", "{", "}", ", ", "std::string(R\"(", ")\")", "true", "false", "std::nullopt", true,
};

inline const Formation *formationByName(std::string_view name) {
    for (auto f : {&DefaultFormat, &PythonFormat, &CppFormat}) {
        if (f->name == name) {
            return f;
        }
    }
    return nullptr;
}

namespace helper {

    template <typename Test, typename ...List>
    struct get_type_list_index;

    template <typename Test, typename ListStart, typename ...List>
    struct get_type_list_index<Test, ListStart, List...> {
        constexpr static inline std::size_t value = get_type_list_index<Test, List...>::value + 1;
    };

    template <typename Test, typename ...List>
    struct get_type_list_index<Test, Test, List...> {
        constexpr static inline std::size_t value = 0;
    };

    template <typename... Ty>
    struct NameTable {
        std::array<std::string_view, sizeof...(Ty)> table;
        template <typename T>
        constexpr static bool contains = (std::is_same_v<T, Ty> || ...);
        template <typename T>
        constexpr std::string_view getName() const {
            return table[get_type_list_index<T, Ty...>::value];
        }
    };

    using NumericalNameTable = NameTable<bool, int8_t, uint8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t, float, double>;

    inline constexpr NumericalNameTable numericalTypeNameTable{
        std::array<std::string_view, 11>{"bool", "int8_t", "uint8_t", "int16_t", "uint16_t", "int32_t", "uint32_t", "int64_t", "uint64_t", "float", "double"}
    };

    template <typename Ty>
    struct is_optional : std::false_type {};
    template <typename Ty>
    struct is_optional<std::optional<Ty>> : std::true_type {};

    template <typename Ty>
    struct is_vector : std::false_type {};
    template <typename Ty, typename Alloc>
    struct is_vector<std::vector<Ty, Alloc>> : std::true_type {};

    inline std::string demangle(const char *name) {
#if defined(__GNUG__)
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> real{abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                                         &std::free};
        if (status == 0 && real) {
            return real.get();
        }
#endif
        return name;
    }

}

template <typename Ty>
concept boolean = std::is_same_v<Ty, bool>;

// wchar_t and charN_t have neither to_chars nor operator<<, so they are left out
template <typename Ty>
concept numerical = std::is_floating_point_v<Ty> ||
                    (std::is_integral_v<Ty> && !boolean<Ty> && !std::is_same_v<Ty, char> &&
                     !std::is_same_v<Ty, wchar_t> && !std::is_same_v<Ty, char8_t> &&
                     !std::is_same_v<Ty, char16_t> && !std::is_same_v<Ty, char32_t>);

template <typename Ty>
concept stringlike = std::is_same_v<Ty, std::string> || std::is_same_v<Ty, std::string_view>;

template <typename Ty>
concept sequence = std::ranges::input_range<const Ty> && !stringlike<Ty> &&
                   !std::is_same_v<std::remove_cvref_t<std::ranges::range_reference_t<const Ty>>, Ty>;

template <typename Ty>
concept streamable = requires(std::ostream &os, const Ty &v) { os << v; };

namespace helper {

    template <typename Ty>
    struct is_printable
        : std::bool_constant<boolean<Ty> || std::is_same_v<Ty, char> || numerical<Ty> || stringlike<Ty> ||
                             streamable<Ty>> {};

    template <sequence Ty>
    struct is_printable<Ty> : is_printable<std::remove_cvref_t<std::ranges::range_reference_t<const Ty>>> {};

    template <typename Ty>
    struct is_printable<std::optional<Ty>> : is_printable<Ty> {};

}

/**
 * @brief type with a textual representation, every value stored in a List must satisfy it
 *
 */
template <typename Ty>
concept printable = !std::is_reference_v<Ty> && !std::is_abstract_v<Ty> && helper::is_printable<std::remove_cv_t<Ty>>::value;

/**
 * @brief readable name of a type
 *
 * @return fixed width name for numerical types, std names for string, optional and vector, demangled
 * rtti name for others
 */
template <typename Ty>
inline std::string typeName() {
    if constexpr (helper::NumericalNameTable::contains<Ty>) {
        return std::string(helper::numericalTypeNameTable.getName<Ty>());
    } else if constexpr (std::is_same_v<Ty, std::string>) {
        return "std::string";
    } else if constexpr (std::is_same_v<Ty, std::string_view>) {
        return "std::string_view";
    } else if constexpr (helper::is_optional<Ty>::value) {
        return "std::optional<" + typeName<typename Ty::value_type>() + ">";
    } else if constexpr (helper::is_vector<Ty>::value) {
        return "std::vector<" + typeName<typename Ty::value_type>() + ">";
    } else {
        return helper::demangle(typeid(Ty).name());
    }
}

/**
 * @brief append textual representation of a value to out
 *
 * @param out target string
 * @param v value to print
 * @param f formation to use
 */
template <typename Ty>
    requires printable<Ty>
inline void printValue(std::string &out, const Ty &v, const Formation &f) {
    if constexpr (boolean<Ty>) {
        if (f.typedScalar) {
            out += "bool(";
            out += v ? f.trueLiteral : f.falseLiteral;
            out += ')';
        } else {
            out += v ? f.trueLiteral : f.falseLiteral;
        }
    } else if constexpr (std::is_same_v<Ty, char>) {
        out += '\'';
        out += v;
        out += '\'';
    } else if constexpr (numerical<Ty>) {
        std::array<char, 128> buffer;
        auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), v);
        std::string_view text{buffer.data(), static_cast<std::size_t>(end - buffer.data())};
        if (f.typedScalar) {
            out += typeName<Ty>();
            out += '(';
            out += text;
            out += ')';
        } else {
            out += text;
        }
    } else if constexpr (stringlike<Ty>) {
        out += f.stringOpen;
        out += v;
        out += f.stringClose;
    } else if constexpr (helper::is_optional<Ty>::value) {
        if (v) {
            printValue(out, *v, f);
        } else {
            out += f.noneLiteral;
        }
    } else if constexpr (sequence<Ty>) {
        if (f.typedScalar) {
            out += typeName<Ty>();
        }
        out += f.sequenceOpen;
        bool first = true;
        for (auto &&item : v) {
            if (first) {
                first = false;
            } else {
                out += f.spliter;
            }
            printValue(out, static_cast<const std::remove_cvref_t<decltype(item)> &>(item), f);
        }
        out += f.sequenceClose;
    } else {
        std::ostringstream os;
        os << v;
        out += std::move(os).str();
    }
}

template <typename Ty>
    requires printable<Ty>
inline std::string printToString(const Ty &v, const Formation &f = DefaultFormat) {
    std::string ret;
    printValue(ret, v, f);
    return ret;
}

} // namespace anylist
