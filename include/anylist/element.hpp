/**
 * @file element.hpp
 * @brief type erased element of a List
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "anylist/printvalue.hpp"

namespace anylist {

/**
 * @brief type a slot can hold, cv-qualified types are never stored so they never match
 *
 */
template <typename Ty>
concept storable = printable<Ty> && std::is_same_v<Ty, std::remove_cv_t<Ty>>;

/**
 * @brief one stored value with its runtime type, concrete type is only reachable through is/as
 *
 */
class Element {
  public:
    virtual ~Element() = default;

    virtual const std::type_info &type() const noexcept = 0;
    virtual std::string typeName() const = 0;
    virtual void print(std::string &out, const Formation &f) const = 0;

    std::string toString(const Formation &f = DefaultFormat) const {
        std::string ret;
        print(ret, f);
        return ret;
    }

    template <typename Ty>
    bool is() const noexcept {
        if constexpr (storable<Ty>) {
            return type() == typeid(Ty);
        } else {
            return false;
        }
    }

    /**
     * @brief downcast to stored value
     *
     * @tparam Ty exact stored type, no conversion is tried
     * @return pointer to stored value, nullptr if type mismatch
     */
    template <typename Ty>
    const Ty *as() const noexcept;
    template <typename Ty>
    Ty *as() noexcept;

  protected:
    Element() = default;
    Element(const Element &) = delete;
    Element &operator=(const Element &) = delete;
};

namespace detail {

template <storable Ty>
struct Slot final : public Element {
    template <typename... Args>
    explicit Slot(std::in_place_t, Args &&...args) : value(std::forward<Args>(args)...) {}

    const std::type_info &type() const noexcept override { return typeid(Ty); }
    std::string typeName() const override { return anylist::typeName<Ty>(); }
    void print(std::string &out, const Formation &f) const override { printValue(out, value, f); }

    Ty value;
};

} // namespace detail

template <typename Ty>
inline const Ty *Element::as() const noexcept {
    if constexpr (storable<Ty>) {
        if (auto slot = dynamic_cast<const detail::Slot<Ty> *>(this)) {
            return &slot->value;
        }
    }
    return nullptr;
}

template <typename Ty>
inline Ty *Element::as() noexcept {
    if constexpr (storable<Ty>) {
        if (auto slot = dynamic_cast<detail::Slot<Ty> *>(this)) {
            return &slot->value;
        }
    }
    return nullptr;
}

inline std::ostream &operator<<(std::ostream &os, const Element &e) { return os << e.toString(); }

} // namespace anylist
