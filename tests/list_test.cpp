#include <catch2/catch.hpp>

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "anylist/list.hpp"

using anylist::List;

namespace {

struct Counted {
    explicit Counted(int &alive) : alive(&alive) { ++alive; }
    Counted(Counted &&other) noexcept : alive(other.alive) { other.alive = nullptr; }
    ~Counted() {
        if (alive) {
            --*alive;
        }
    }
    friend std::ostream &operator<<(std::ostream &os, const Counted &) { return os << "counted"; }
    int *alive;
};

template <typename Ty>
concept emplaceable = requires(List &list) { list.emplace<Ty>(std::declval<int>()); };

std::vector<std::string> texts(const List &list) {
    std::vector<std::string> ret;
    for (auto &&e : list.iter()) {
        ret.push_back(e.toString());
    }
    return ret;
}

} // namespace

static_assert(std::ranges::bidirectional_range<decltype(std::declval<const List &>().iter())>);
static_assert(std::ranges::view<decltype(std::declval<const List &>().iter())>);
static_assert(!std::is_copy_constructible_v<List>);
static_assert(std::is_nothrow_move_constructible_v<List>);
static_assert(emplaceable<int32_t>);
static_assert(!emplaceable<const int32_t>);
static_assert(!emplaceable<volatile int32_t>);
static_assert(!anylist::storable<const std::string>);

TEST_CASE("new list is empty", "[list]") {
    List list;
    REQUIRE(list.size() == 0);
    REQUIRE(list.empty());
    REQUIRE(list.get<int>(0) == nullptr);
    REQUIRE(list.at(0) == nullptr);
    REQUIRE(list.iter().begin() == list.iter().end());
}

TEST_CASE("insert appends in order", "[list]") {
    List list;
    list.insert(1);
    list.insert(std::string("two"));
    list.insert(3.5);
    REQUIRE(list.size() == 3);
    REQUIRE(texts(list) == std::vector<std::string>{"1", "\"two\"", "3.5"});
    REQUIRE(*list.get<int>(0) == 1);
    REQUIRE(*list.get<std::string>(1) == "two");
    REQUIRE(*list.get<double>(2) == 3.5);
}

TEST_CASE("insertAtBeginning shifts existing elements", "[list]") {
    List list;
    list.insert(std::string("a"));
    list.insert(std::string("b"));
    list.insertAtBeginning(std::string("z"));
    REQUIRE(list.size() == 3);
    REQUIRE(texts(list) == std::vector<std::string>{"\"z\"", "\"a\"", "\"b\""});
    REQUIRE(*list.get<std::string>(0) == "z");
    REQUIRE(*list.get<std::string>(1) == "a");
    REQUIRE(*list.get<std::string>(2) == "b");
}

TEST_CASE("get only matches the exact stored type", "[list]") {
    List list;
    list.insert(int32_t{42});
    REQUIRE(list.get<int32_t>(0) != nullptr);
    REQUIRE(*list.get<int32_t>(0) == 42);
    REQUIRE(list.get<int64_t>(0) == nullptr);
    REQUIRE(list.get<double>(0) == nullptr);
    REQUIRE(list.get<uint32_t>(0) == nullptr);
    REQUIRE(list.get<const int32_t>(0) == nullptr);
    REQUIRE(list.get<int32_t>(1) == nullptr);

    SECTION("mutable access follows the same rule") {
        REQUIRE(list.getMut<int64_t>(0) == nullptr);
        REQUIRE(list.getMut<int32_t>(7) == nullptr);
        REQUIRE(list.getMut<int32_t>(0) != nullptr);
    }
}

TEST_CASE("string literals are stored as std::string", "[list]") {
    List list;
    list.insert("x");
    const char *p = "y";
    list.insertAtBeginning(p);
    REQUIRE(*list.get<std::string>(0) == "y");
    REQUIRE(*list.get<std::string>(1) == "x");
    REQUIRE(list.get<const char *>(1) == nullptr);
}

TEST_CASE("replace installs a value of any type", "[list]") {
    List list;
    list.insert(10);
    list.insert(20);
    list.insert(30);

    auto ans = list.replace(1, "x");
    REQUIRE(ans.has_value());
    REQUIRE(list.size() == 3);
    REQUIRE(list.get<int>(1) == nullptr);
    REQUIRE(*list.get<std::string>(1) == "x");
    REQUIRE(*list.get<int>(0) == 10);
    REQUIRE(*list.get<int>(2) == 30);

    REQUIRE(list.replace(1, 2.5).has_value());
    REQUIRE(list.get<std::string>(1) == nullptr);
    REQUIRE(*list.get<double>(1) == 2.5);
}

TEST_CASE("replace out of range fails without mutation", "[list]") {
    List list;
    list.insert(10);
    list.insert(20);
    list.insert(30);

    auto ans = list.replace(5, 1);
    REQUIRE_FALSE(ans.has_value());
    REQUIRE(ans.error().index == 5);
    REQUIRE(ans.error().length == 3);
    REQUIRE(ans.error().message() == "index 5 out of range for list of length 3");
    REQUIRE(list.size() == 3);
    REQUIRE(texts(list) == std::vector<std::string>{"10", "20", "30"});

    REQUIRE_FALSE(list.replace(3, 1).has_value());
    List empty;
    REQUIRE_FALSE(empty.replace(0, 1).has_value());
    REQUIRE(empty.empty());
}

TEST_CASE("getMut changes the value in place", "[list]") {
    List list;
    list.insert(int32_t{5});
    auto p = list.getMut<int32_t>(0);
    REQUIRE(p != nullptr);
    *p += 1;
    REQUIRE(*list.get<int32_t>(0) == 6);

    list.insert(std::vector<int>{1, 2});
    list.getMut<std::vector<int>>(1)->push_back(3);
    REQUIRE(list.at(1)->toString() == "[1, 2, 3]");
}

TEST_CASE("element address is stable while other slots change", "[list]") {
    List list;
    list.insert(1);
    const int *p = list.get<int>(0);
    for (int i = 0; i < 100; ++i) {
        list.insertAtBeginning(i);
        list.insert(i);
    }
    REQUIRE(list.get<int>(100) == p);
}

TEST_CASE("clear empties the list", "[list]") {
    List list;
    list.clear();
    REQUIRE(list.size() == 0);

    list.insert(1);
    list.insert(std::string("a"));
    list.clear();
    REQUIRE(list.size() == 0);
    REQUIRE(list.get<int>(0) == nullptr);
    REQUIRE(list.get<std::string>(1) == nullptr);
    REQUIRE_FALSE(list.replace(0, 1).has_value());

    list.clear();
    REQUIRE(list.empty());
}

TEST_CASE("size counts inserts and ignores replaces", "[list]") {
    List list;
    for (int i = 0; i < 10; ++i) {
        if (i % 2) {
            list.insert(i);
        } else {
            list.insertAtBeginning(std::to_string(i));
        }
        REQUIRE(list.size() == static_cast<std::size_t>(i + 1));
    }
    REQUIRE(list.replace(4, 'c').has_value());
    REQUIRE(list.size() == 10);
    list.clear();
    list.insert(true);
    REQUIRE(list.size() == 1);
}

TEST_CASE("values are destroyed on replace, clear and destruction", "[list]") {
    int alive = 0;
    {
        List list;
        list.emplace<Counted>(alive);
        list.emplace<Counted>(alive);
        list.emplaceAtBeginning<Counted>(alive);
        REQUIRE(alive == 3);

        REQUIRE(list.replace(0, 1).has_value());
        REQUIRE(alive == 2);

        REQUIRE_FALSE(list.replace(9, 1).has_value());
        REQUIRE(alive == 2);

        list.clear();
        REQUIRE(alive == 0);

        list.insert(Counted{alive});
        REQUIRE(alive == 1);
    }
    REQUIRE(alive == 0);
}

TEST_CASE("optional values print as none or value", "[list]") {
    List list;
    list.insert(std::optional<int>{});
    list.emplace<std::optional<std::string>>("x");
    REQUIRE(list.toString() == "[null, \"x\"]");
    REQUIRE(list.get<std::optional<int>>(0) != nullptr);
    REQUIRE_FALSE(list.get<std::optional<int>>(0)->has_value());

    List moved = std::move(list);
    REQUIRE(moved.size() == 2);
    REQUIRE(moved.get<std::optional<std::string>>(1)->value() == "x");
}

TEST_CASE("iteration is restartable", "[list]") {
    List list;
    list.insert(1);
    list.insert(std::string("a"));
    list.insert(false);

    auto first = list.iter();
    auto second = list.iter();
    auto it1 = first.begin();
    auto it2 = second.begin();
    ++it1;
    REQUIRE(it2->toString() == "1");
    REQUIRE(it1->toString() == "\"a\"");

    REQUIRE(texts(list) == texts(list));
    REQUIRE(std::ranges::distance(list.iter()) == 3);

    std::vector<std::string> backwards;
    for (auto it = list.end(); it != list.begin();) {
        --it;
        backwards.push_back(it->typeName());
    }
    REQUIRE(backwards == std::vector<std::string>{"bool", "std::string", "int32_t"});
}

TEST_CASE("elements expose type and downcast", "[list]") {
    List list;
    list.insert(uint8_t{7});
    list.insert(std::vector<std::string>{"a"});

    auto &e = *list.at(0);
    REQUIRE(e.is<uint8_t>());
    REQUIRE_FALSE(e.is<int8_t>());
    REQUIRE(e.type() == typeid(uint8_t));
    REQUIRE(e.typeName() == "uint8_t");
    REQUIRE(*e.as<uint8_t>() == 7);
    REQUIRE(e.as<int>() == nullptr);

    REQUIRE(list.at(1)->typeName() == "std::vector<std::string>");
    REQUIRE(list.at(1)->as<std::vector<std::string>>()->front() == "a");
    REQUIRE(list.at(2) == nullptr);
}

TEST_CASE("cv-qualified requests never match an element", "[list]") {
    List list;
    list.insert(int32_t{1});
    list.insert(std::string("s"));

    auto &e = *list.at(0);
    REQUIRE(e.is<int32_t>());
    REQUIRE_FALSE(e.is<const int32_t>());
    REQUIRE_FALSE(e.is<volatile int32_t>());
    REQUIRE(e.as<const int32_t>() == nullptr);
    REQUIRE(list.get<const int32_t>(0) == nullptr);
    REQUIRE(list.getMut<const int32_t>(0) == nullptr);

    REQUIRE_FALSE(list.at(1)->is<const std::string>());
    REQUIRE(list.get<const std::string>(1) == nullptr);

    for (auto &&elem : list.iter()) {
        REQUIRE(elem.is<const int32_t>() == (elem.as<const int32_t>() != nullptr));
    }
}

TEST_CASE("list prints in every formation", "[list]") {
    List list;
    list.insert(int32_t{42});
    list.insert("x");
    list.insert(true);

    REQUIRE(list.toString() == "[42, \"x\", true]");
    REQUIRE(list.toString(anylist::PythonFormat) == "[42, 'x', True]");
    REQUIRE(list.toString(anylist::CppFormat) == "anylist::List{int32_t(42), std::string(R\"(x)\"), bool(true)}");

    std::ostringstream os;
    os << list;
    REQUIRE(os.str() == "[42, \"x\", true]");
    REQUIRE(List{}.toString() == "[]");
}
