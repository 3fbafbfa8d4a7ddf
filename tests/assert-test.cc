#include <rail/assert-handler.hh>
#include <rail/assert.hh>
#include <rail/failure.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
struct sentinel_exception
{
};
} // namespace

TEST("assert - failing check reports expression, message and location")
{
    std::optional<rail::impl::assertion_info> captured;
    int const test_line = __LINE__ + 11; // line of the RAIL_ASSERT_ALWAYS below

    {
        auto handler = rail::impl::scoped_assertion_handler(
            [&](rail::impl::assertion_info const& info)
            {
                captured = info;
                throw sentinel_exception{}; // skips the abort
            });
        try
        {
            RAIL_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "arithmetic is broken");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
}

TEST("assert - passing check does not evaluate the handler")
{
    auto handler_called = false;

    {
        auto handler = rail::impl::scoped_assertion_handler([&](rail::impl::assertion_info const&) { handler_called = true; });
        RAIL_ASSERT_ALWAYS(2 > 1, "never reported");
        RAIL_ASSERT(true, "never reported");
    }

    CHECK(!handler_called);
}

TEST("assert - handlers form a stack")
{
    std::vector<std::string> events;

    auto outer = rail::impl::scoped_assertion_handler(
        [&](rail::impl::assertion_info const& info)
        {
            events.push_back("outer: " + info.message);
            throw sentinel_exception{};
        });

    {
        auto inner = rail::impl::scoped_assertion_handler(
            [&](rail::impl::assertion_info const& info)
            {
                events.push_back("inner: " + info.message);
                throw sentinel_exception{};
            });

        try
        {
            (void)rail::failure(std::string());
        }
        catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    // inner is popped

    try
    {
        (void)rail::failure(rail::fault());
    }
    catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == "inner: failure message must not be empty");
    CHECK(events[1] == "outer: failure cause must reference an exception");
}

TEST("assert - contract checks stay active in every build")
{
    // RAIL_ASSERT_ALWAYS is used for argument contracts of failure and fault
    auto reported = 0;
    auto handler = rail::impl::scoped_assertion_handler(
        [&](rail::impl::assertion_info const&)
        {
            ++reported;
            throw sentinel_exception{};
        });

    for (auto i = 0; i < 3; ++i)
    {
        try
        {
            (void)rail::failure("");
        }
        catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    CHECK(reported == 3);
}
