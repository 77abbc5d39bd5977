/**
 * @file list.hpp
 * @brief heterogeneous list
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 * @details An ordered, growable sequence holding values of any printable type. Values are addressed
 * by position and read back only through their exact stored type.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <iterator>
#include <memory>
#include <ostream>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "anylist/element.hpp"
#include "anylist/printvalue.hpp"
#include "anylist/stringprocess.hpp"

namespace anylist {

struct IndexOutOfRange {
    std::size_t index;
    std::size_t length;

    std::string message() const {
        return "index " + std::to_string(index) + " out of range for list of length " + std::to_string(length);
    }
};

/**
 * @brief type actually stored for an inserted value, string literals and char pointers become std::string
 *
 */
template <typename Ty>
using stored_t = std::conditional_t<std::is_same_v<std::decay_t<Ty>, const char *> ||
                                        std::is_same_v<std::decay_t<Ty>, char *>,
                                    std::string, std::decay_t<Ty>>;

class List {
    using Storage = std::vector<std::unique_ptr<Element>>;

  public:
    class const_iterator {
      public:
        using iterator_concept = std::bidirectional_iterator_tag;
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type = Element;
        using difference_type = std::ptrdiff_t;
        using pointer = const Element *;
        using reference = const Element &;

        const_iterator() = default;

        reference operator*() const { return **it; }
        pointer operator->() const { return it->get(); }

        const_iterator &operator++() {
            ++it;
            return *this;
        }
        const_iterator operator++(int) {
            auto tmp = *this;
            ++it;
            return tmp;
        }
        const_iterator &operator--() {
            --it;
            return *this;
        }
        const_iterator operator--(int) {
            auto tmp = *this;
            --it;
            return tmp;
        }

        bool operator==(const const_iterator &) const = default;

      private:
        friend class List;
        explicit const_iterator(Storage::const_iterator it) : it(it) {}
        Storage::const_iterator it;
    };

    List() = default;
    List(List &&) noexcept = default;
    List &operator=(List &&) noexcept = default;
    List(const List &) = delete;
    List &operator=(const List &) = delete;

    /**
     * @brief append a value at the end, existing indices are not affected
     *
     * @attention the slot owns what the stored type owns: a std::string_view or a pointer is kept as is
     * and still refers to the caller's data, which must outlive the element
     */
    template <typename Ty>
        requires storable<stored_t<Ty>>
    void insert(Ty &&value) {
        items.push_back(makeSlot<stored_t<Ty>>(std::forward<Ty>(value)));
    }

    /**
     * @brief prepend a value as index 0, every existing element moves up by one
     *
     */
    template <typename Ty>
        requires storable<stored_t<Ty>>
    void insertAtBeginning(Ty &&value) {
        items.insert(items.begin(), makeSlot<stored_t<Ty>>(std::forward<Ty>(value)));
    }

    template <typename Ty, typename... Args>
        requires storable<Ty> && std::is_constructible_v<Ty, Args...>
    Ty &emplace(Args &&...args) {
        auto slot = std::make_unique<detail::Slot<Ty>>(std::in_place, std::forward<Args>(args)...);
        auto &ret = slot->value;
        items.push_back(std::move(slot));
        return ret;
    }

    template <typename Ty, typename... Args>
        requires storable<Ty> && std::is_constructible_v<Ty, Args...>
    Ty &emplaceAtBeginning(Args &&...args) {
        auto slot = std::make_unique<detail::Slot<Ty>>(std::in_place, std::forward<Args>(args)...);
        auto &ret = slot->value;
        items.insert(items.begin(), std::move(slot));
        return ret;
    }

    /**
     * @brief destroy the value at index and put a new one, of any type, in its place
     *
     * @param index position to replace, must be less than size()
     * @param value new value
     * @return IndexOutOfRange if index is invalid, list is untouched in that case
     */
    template <typename Ty>
        requires storable<stored_t<Ty>>
    std::expected<void, IndexOutOfRange> replace(std::size_t index, Ty &&value) {
        if (index >= items.size()) {
            return std::unexpected(IndexOutOfRange{index, items.size()});
        }
        items[index] = makeSlot<stored_t<Ty>>(std::forward<Ty>(value));
        return {};
    }

    /**
     * @brief get stored value by its exact type
     *
     * @attention out of range and type mismatch both give nullptr, check size() to tell them apart
     *
     * @return pointer to value, nullptr if absent
     */
    template <typename Ty>
    const Ty *get(std::size_t index) const noexcept {
        if (index >= items.size()) {
            return nullptr;
        }
        return std::as_const(*items[index]).template as<Ty>();
    }

    /**
     * @brief mutable version of get
     *
     * @attention pointer is valid until the slot is replaced or the list is cleared or destroyed, nothing
     * else may touch the list while it is in use
     */
    template <typename Ty>
    Ty *getMut(std::size_t index) noexcept {
        if (index >= items.size()) {
            return nullptr;
        }
        return items[index]->template as<Ty>();
    }

    const Element *at(std::size_t index) const noexcept {
        return index < items.size() ? items[index].get() : nullptr;
    }

    const_iterator begin() const noexcept { return const_iterator{items.cbegin()}; }
    const_iterator end() const noexcept { return const_iterator{items.cend()}; }

    /**
     * @brief lazy traversal in index order, each call starts a new one
     *
     */
    std::ranges::subrange<const_iterator> iter() const noexcept { return {begin(), end()}; }

    std::size_t size() const noexcept { return items.size(); }
    bool empty() const noexcept { return items.empty(); }

    void clear() noexcept { items.clear(); }

    std::string toString(const Formation &f = DefaultFormat) const {
        std::string ret{f.listOpen};
        ret += mystr::join(iter() | std::views::transform([&f](const Element &e) { return e.toString(f); }),
                           f.spliter);
        ret += f.listClose;
        return ret;
    }

  private:
    template <typename Ty, typename Arg>
    static std::unique_ptr<Element> makeSlot(Arg &&arg) {
        return std::make_unique<detail::Slot<Ty>>(std::in_place, std::forward<Arg>(arg));
    }

    Storage items;
};

inline std::ostream &operator<<(std::ostream &os, const List &list) { return os << list.toString(); }

} // namespace anylist
