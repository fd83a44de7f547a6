#include <catch2/catch_test_macros.hpp>

#include "core/ObserverList.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace labflow;

TEST_CASE("ObserverList notifies in subscription order")
{
    ObserverList<int> list;
    std::vector<std::string> calls;
    list.add([&](int v) { calls.push_back("a" + std::to_string(v)); });
    list.add([&](int v) { calls.push_back("b" + std::to_string(v)); });

    list.notify(3);
    REQUIRE(calls == std::vector<std::string>{"a3", "b3"});
}

TEST_CASE("ObserverList ids are unique and removable once")
{
    ObserverList<> list;
    auto a = list.add([] {});
    auto b = list.add([] {});
    REQUIRE(a != 0);
    REQUIRE(a != b);
    REQUIRE(list.size() == 2);

    REQUIRE(list.remove(a));
    REQUIRE_FALSE(list.remove(a));
    REQUIRE_FALSE(list.contains(a));
    REQUIRE(list.contains(b));
}

TEST_CASE("ObserverList rejects empty callbacks")
{
    ObserverList<> list;
    REQUIRE(list.add(nullptr) == 0);
    REQUIRE(list.empty());
}

TEST_CASE("An observer removing a later observer prevents its call")
{
    ObserverList<> list;
    int laterCalls = 0;
    uint32_t later = 0;
    list.add([&] { list.remove(later); });
    later = list.add([&] { ++laterCalls; });

    list.notify();
    REQUIRE(laterCalls == 0);
}

TEST_CASE("An observer may remove itself while being notified")
{
    ObserverList<> list;
    int calls = 0;
    uint32_t self = 0;
    self = list.add([&] {
        ++calls;
        list.remove(self);
    });

    list.notify();
    list.notify();
    REQUIRE(calls == 1);
    REQUIRE(list.empty());
}

TEST_CASE("Observers added during notify are not called in that pass")
{
    ObserverList<> list;
    int added = 0;
    list.add([&] { list.add([&] { ++added; }); });

    list.notify();
    REQUIRE(added == 0);
    list.notify();
    REQUIRE(added == 1);
}

TEST_CASE("A throwing observer does not stop the others")
{
    ObserverList<const std::string&> list;
    std::string got;
    list.add([](const std::string&) { throw std::runtime_error("bad observer"); });
    list.add([&](const std::string& s) { got = s; });

    REQUIRE_NOTHROW(list.notify("hello"));
    REQUIRE(got == "hello");
}
