#include <rail/result.hh>

#include <nexus/test.hh>

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

// a result is built from one of its tracks, never from nothing
static_assert(!std::is_default_constructible_v<rail::result<int>>);
static_assert(std::is_constructible_v<rail::result<int>, rail::success<int>>);
static_assert(std::is_constructible_v<rail::result<int>, rail::failure>);
static_assert(!std::is_constructible_v<rail::result<int>, int>);
static_assert(!std::is_constructible_v<rail::result<int>, char const*>);

// payload conversion on the success track
static_assert(std::is_constructible_v<rail::result<std::string>, rail::success<char const*>>);
static_assert(!std::is_constructible_v<rail::result<int>, rail::success<std::string>>);

// move-only payloads make move-only results
static_assert(!std::is_copy_constructible_v<rail::result<std::unique_ptr<int>>>);
static_assert(std::is_nothrow_move_constructible_v<rail::result<std::unique_ptr<int>>>);

namespace
{
// move-only type for testing
struct move_only
{
    int value = 0;

    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
};

// tracks live instances to catch leaks and double destruction
struct counted
{
    static inline int alive = 0;

    int value = 0;

    explicit counted(int v) : value(v) { ++alive; }
    counted(counted const& rhs) : value(rhs.value) { ++alive; }
    counted(counted&& rhs) noexcept : value(rhs.value) { ++alive; }
    counted& operator=(counted const&) = default;
    counted& operator=(counted&&) noexcept = default;
    ~counted() { --alive; }
};

rail::result<int> parse_positive(int v)
{
    if (v > 0)
        return rail::success(v);
    return rail::failure("not positive");
}
} // namespace

TEST("result - success track")
{
    rail::result<std::string> const res = rail::success("Jim");

    CHECK(res.is_success());
    CHECK(!res.is_failure());

    REQUIRE(res.as_success() != nullptr);
    CHECK(res.as_success()->get() == "Jim");
    CHECK(res.as_failure() == nullptr);
    CHECK(res.value() == "Jim");
}

TEST("result - failure track")
{
    rail::result<std::string> const res = rail::failure("bad input");

    CHECK(res.is_failure());
    CHECK(!res.is_success());

    REQUIRE(res.as_failure() != nullptr);
    CHECK(res.as_failure()->message() == "bad input");
    CHECK(!res.as_failure()->has_cause());
    CHECK(res.as_success() == nullptr);
    CHECK(res.error().message() == "bad input");
}

TEST("result - exactly one view is present")
{
    for (auto v : {-2, -1, 0, 1, 2})
    {
        auto const res = parse_positive(v);
        CHECK((res.as_success() != nullptr) != (res.as_failure() != nullptr));
        CHECK(res.is_success() == (v > 0));
    }
}

TEST("result - empty-meaning payloads are still successes")
{
    SECTION("nullptr")
    {
        rail::result<int*> const res = rail::success<int*>(nullptr);
        CHECK(res.is_success());
        REQUIRE(res.as_success() != nullptr);
        CHECK(res.as_success()->get() == nullptr);
    }

    SECTION("empty optional")
    {
        rail::result<std::optional<int>> const res = rail::success(std::optional<int>());
        CHECK(res.is_success());
        CHECK(!res.value().has_value());
    }

    SECTION("empty string")
    {
        rail::result<std::string> const res = rail::success(std::string());
        CHECK(res.is_success());
        CHECK(res.value().empty());
    }
}

TEST("result - copy and move")
{
    SECTION("copy keeps track and payload")
    {
        rail::result<std::string> const a = rail::success("Jim");
        auto const b = a;
        CHECK(b.is_success());
        CHECK(b.value() == "Jim");
        CHECK(a.value() == "Jim");

        rail::result<std::string> const c = rail::failure("bad input");
        auto const d = c;
        CHECK(d.is_failure());
        CHECK(d.error() == c.error());
    }

    SECTION("move-only payload")
    {
        rail::result<move_only> a = rail::success(move_only(7));
        auto b = rail::move(a);
        CHECK(b.is_success());
        CHECK(b.value().value == 7);

        // the source stays on its track
        CHECK(a.is_success());
        CHECK(a.value().value == -1);
    }

    SECTION("unique_ptr payload")
    {
        rail::result<std::unique_ptr<int>> a = rail::success(std::make_unique<int>(5));
        auto const p = rail::move(a).value();
        REQUIRE(p != nullptr);
        CHECK(*p == 5);
    }

    SECTION("assignment switches tracks")
    {
        rail::result<std::string> res = rail::success("Jim");
        res = rail::result<std::string>(rail::failure("bad input"));
        CHECK(res.is_failure());
        CHECK(res.error().message() == "bad input");

        rail::result<std::string> const other = rail::success("Bob");
        res = other;
        CHECK(res.is_success());
        CHECK(res.value() == "Bob");
    }

    SECTION("self assignment")
    {
        rail::result<std::string> res = rail::success("Jim");
        auto const& alias = res;
        res = alias;
        CHECK(res.value() == "Jim");
    }

    SECTION("results live in containers")
    {
        std::vector<rail::result<int>> results;
        for (auto v : {2, -3, 4})
            results.push_back(parse_positive(v));

        REQUIRE(results.size() == 3);
        CHECK(results[0].value() == 2);
        CHECK(results[1].error().message() == "not positive");
        CHECK(results[2].value() == 4);
    }
}

TEST("result - payload lifetime")
{
    counted::alive = 0;

    {
        rail::result<counted> a = rail::success(counted(1));
        CHECK(counted::alive == 1);

        auto b = a;
        CHECK(counted::alive == 2);

        b = rail::result<counted>(rail::failure("gone"));
        CHECK(counted::alive == 1);

        b = a;
        CHECK(counted::alive == 2);
    }

    CHECK(counted::alive == 0);
}

TEST("result - value_or")
{
    CHECK(parse_positive(3).value_or(-1) == 3);
    CHECK(parse_positive(0).value_or(-1) == -1);

    rail::result<std::string> const res = rail::failure("bad input");
    CHECK(res.value_or("fallback") == "fallback");
}

TEST("result - equality")
{
    CHECK(parse_positive(3) == parse_positive(3));
    CHECK(parse_positive(3) != parse_positive(4));
    CHECK(parse_positive(3) != parse_positive(-3));

    // failures compare by message, cause and context
    auto const f = parse_positive(-1);
    auto const copy = f;
    CHECK(f == copy);
    CHECK(parse_positive(-1) == parse_positive(-2));

    rail::result<int> const with_context = f.error().with_context("while parsing");
    CHECK(f != with_context);
}

TEST("result - to_string")
{
    rail::result<std::string> const a = rail::success("2");
    CHECK(a.to_string() == "Success(\"2\")");

    rail::result<int> const b = rail::success(42);
    CHECK(b.to_string() == "Success(42)");

    // string payloads are escaped inside their quotes, failure messages are rendered raw
    rail::result<std::string> const quoted = rail::success("a\"b");
    CHECK(quoted.to_string() == "Success(\"a\\\"b\")");
    rail::result<std::string> const raw = rail::failure("a\"b");
    CHECK(raw.to_string() == "Failure(a\"b)");

    rail::result<std::string> const c = rail::failure("Could not get an odd value");
    CHECK(c.to_string() == "Failure(Could not get an odd value)");

    CHECK(rail::to_string(b) == b.to_string());
    CHECK(std::format("Seeing {} pass by", b) == "Seeing Success(42) pass by");
    CHECK(std::format("{}", c) == "Failure(Could not get an odd value)");
}
