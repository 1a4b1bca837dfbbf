#include <catch2/catch_test_macros.hpp>

#include "store/store.hpp"
#include "helpers/test_support.hpp"

#include <string>
#include <thread>
#include <vector>

using test_support::TempDir;

TEST_CASE("Store get on a missing key is empty")
{
    TempDir dir;
    auto s = test_support::open_store(dir);

    auto v = s->get("nothing/here");
    REQUIRE(v.has_value());
    CHECK_FALSE(v->has_value());
}

TEST_CASE("Store put overwrites, insert does not")
{
    TempDir dir;
    auto s = test_support::open_store(dir);

    REQUIRE(s->put("k", "one").has_value());
    REQUIRE(s->put("k", "two").has_value());
    CHECK(s->get("k").value() == std::optional<std::string>("two"));

    auto first = s->insert("fresh", "a");
    REQUIRE(first.has_value());
    CHECK(*first);

    auto second = s->insert("fresh", "b");
    REQUIRE(second.has_value());
    CHECK_FALSE(*second);
    CHECK(s->get("fresh").value() == std::optional<std::string>("a"));
}

TEST_CASE("Store values are binary safe")
{
    TempDir dir;
    auto s = test_support::open_store(dir);
    std::string blob("a\0b\0c", 5);

    REQUIRE(s->put("bin", blob).has_value());
    auto v = s->get("bin");

    REQUIRE(v.has_value());
    REQUIRE(v->has_value());
    CHECK(**v == blob);
}

TEST_CASE("Store remove reports whether a row existed")
{
    TempDir dir;
    auto s = test_support::open_store(dir);
    REQUIRE(s->put("gone", "soon").has_value());

    CHECK(s->remove("gone").value());
    CHECK_FALSE(s->remove("gone").value());
    CHECK_FALSE(s->get("gone").value().has_value());
}

TEST_CASE("Store contents survive reopen")
{
    TempDir dir;
    {
        auto s = test_support::open_store(dir);
        REQUIRE(s->put("peer/id", "abc").has_value());
    }

    auto s = test_support::open_store(dir);
    CHECK(s->get("peer/id").value() == std::optional<std::string>("abc"));
    CHECK(s->path() == (dir.path / "store.db").string());
}

TEST_CASE("Store insert has one winner across threads")
{
    TempDir dir;
    auto s = test_support::open_store(dir);
    std::atomic<int> wins{0};

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&, i]
            {
                auto r = s->insert("race", std::to_string(i));
                if (r && *r)
                {
                    ++wins;
                }
            });
        }
    }

    CHECK(wins == 1);
    CHECK(s->get("race").value().has_value());
}

TEST_CASE("Store::open fails for a directory that does not exist")
{
    TempDir dir;
    auto s = store::Store::open((dir.path / "no" / "such" / "dir.db").string());

    REQUIRE_FALSE(s.has_value());
    CHECK_FALSE(s.error().empty());
}
