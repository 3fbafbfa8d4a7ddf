#include <rail/assert-handler.hh>
#include <rail/fault.hh>

#include <nexus/test.hh>

#include <exception>
#include <stdexcept>
#include <string>

namespace
{
struct parse_error : std::runtime_error
{
    int column = 0;

    parse_error(std::string const& what, int col) : std::runtime_error(what), column(col) {}
};

template <class F>
rail::fault fault_of(F&& f)
{
    try
    {
        f();
    }
    catch (...)
    {
        return rail::fault::current();
    }
    return {};
}
} // namespace

TEST("fault - default is invalid")
{
    auto const f = rail::fault();
    CHECK(!f.is_valid());
    CHECK(f.exception() == nullptr);
    CHECK(f == rail::fault());
}

TEST("fault - describe")
{
    SECTION("std::exception")
    {
        auto const f = fault_of([] { throw std::invalid_argument("Could not get date"); });
        REQUIRE(f.is_valid());
        CHECK(f.describe() == "std::invalid_argument: Could not get date");
    }

    SECTION("exception outside of std::exception")
    {
        auto const f = fault_of([] { throw 42; });
        REQUIRE(f.is_valid());
        CHECK(f.describe() == "unknown exception of type int");
    }

    SECTION("user type")
    {
        auto const f = fault_of([] { throw parse_error("unexpected token", 7); });
        CHECK(f.describe().find("parse_error") != std::string::npos);
        CHECK(f.describe().ends_with(": unexpected token"));
    }
}

TEST("fault - type tests")
{
    auto const f = fault_of([] { throw parse_error("unexpected token", 7); });

    CHECK(f.is<parse_error>());

    // base classes match, unrelated types do not
    CHECK(f.is<std::runtime_error>());
    CHECK(f.is<std::exception>());
    CHECK(!f.is<std::logic_error>());
    CHECK(!f.is<int>());
}

TEST("fault - visit_as")
{
    auto const f = fault_of([] { throw parse_error("unexpected token", 7); });

    SECTION("matching type calls the visitor once")
    {
        auto calls = 0;
        auto column = -1;
        auto const visited = f.visit_as<parse_error>(
            [&](parse_error const& e)
            {
                ++calls;
                column = e.column;
            });

        CHECK(visited);
        CHECK(calls == 1);
        CHECK(column == 7);
    }

    SECTION("base class sees the same exception")
    {
        std::string what;
        CHECK(f.visit_as<std::exception>([&](std::exception const& e) { what = e.what(); }));
        CHECK(what == "unexpected token");
    }

    SECTION("other types do not call the visitor")
    {
        auto called = false;
        CHECK(!f.visit_as<std::logic_error>([&](std::logic_error const&) { called = true; }));
        CHECK(!f.visit_as<int>([&](int) { called = true; }));
        CHECK(!called);
    }

    SECTION("exceptions of the visitor propagate")
    {
        auto propagated = false;
        try
        {
            f.visit_as<parse_error>([](parse_error const&) { throw std::domain_error("from visitor"); });
        }
        catch (std::domain_error const& e)
        {
            propagated = std::string(e.what()) == "from visitor";
        }
        CHECK(propagated);

        // the stored exception is unaffected
        CHECK(f.is<parse_error>());
    }
}

TEST("fault - predecessor chain")
{
    auto const f = fault_of(
        []
        {
            try
            {
                try
                {
                    throw std::out_of_range("index 12");
                }
                catch (...)
                {
                    std::throw_with_nested(std::invalid_argument("bad row"));
                }
            }
            catch (...)
            {
                std::throw_with_nested(std::runtime_error("could not load table"));
            }
        });

    REQUIRE(f.has_predecessor());
    auto const p1 = f.predecessor();
    REQUIRE(p1.is<std::invalid_argument>());
    REQUIRE(p1.has_predecessor());
    auto const p2 = p1.predecessor();
    CHECK(p2.is<std::out_of_range>());
    CHECK(!p2.has_predecessor());

    // predecessors outlive the fault they were read from
    auto detached = rail::fault();
    {
        auto const copy = f;
        detached = copy.predecessor().predecessor();
    }
    REQUIRE(detached.is_valid());
    CHECK(detached == p2);
    CHECK(detached.describe() == "std::out_of_range: index 12");

    auto const chain = f.describe_chain();
    auto const pos_table = chain.find("could not load table");
    auto const pos_row = chain.find("\n  caused by: ");
    auto const pos_index = chain.find("index 12");
    REQUIRE(pos_table != std::string::npos);
    REQUIRE(pos_row != std::string::npos);
    REQUIRE(pos_index != std::string::npos);
    CHECK(pos_table < pos_row);
    CHECK(pos_row < pos_index);
}

TEST("fault - plain exception has no predecessor")
{
    auto const f = fault_of([] { throw std::runtime_error("single"); });
    CHECK(!f.has_predecessor());
    CHECK(!f.predecessor().is_valid());
    CHECK(f.describe_chain() == f.describe());
}

TEST("fault - identity and rethrow")
{
    auto const a = fault_of([] { throw std::runtime_error("same text"); });
    auto const b = fault_of([] { throw std::runtime_error("same text"); });
    auto const a_copy = a;

    CHECK(a == a_copy);
    CHECK(a != b);

    auto rethrown = false;
    try
    {
        a.rethrow();
    }
    catch (std::runtime_error const& e)
    {
        rethrown = std::string(e.what()) == "same text";
    }
    CHECK(rethrown);
}

TEST("fault - null exception is a contract violation")
{
    auto violated = false;
    {
        auto handler = rail::impl::scoped_assertion_handler([](rail::impl::assertion_info const&) { throw 0; });
        try
        {
            (void)rail::fault(std::exception_ptr());
        }
        catch (int)
        {
            violated = true;
        }
    }
    CHECK(violated);
}
