#include <rail/combinators.hh>
#include <rail/failure.hh>
#include <rail/pipeline.hh>
#include <rail/result.hh>

#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Walks through the typical uses of rail::result:
//   1. a call that can succeed or fail, inspected by hand
//   2. plain functions lifted into a chain and drained
//   3. a batch of random values validated and transformed on several threads

namespace
{
using date = std::chrono::sys_days;

std::string date_to_string(date d)
{
    auto const ymd = std::chrono::year_month_day(d);
    return std::format("{:04}-{:02}-{:02}", int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()));
}

date today() { return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()); }

rail::result<date> do_something_with_failure(bool should_succeed)
{
    if (should_succeed)
        return rail::success(today());
    return rail::failure("Got a failure");
}

void simple_succeed_or_fail()
{
    std::cout << "== simple succeed or fail\n";

    auto const ok = do_something_with_failure(true);
    if (auto const* s = ok.as_success())
        std::cout << std::format("Success: {}\n", date_to_string(s->get()));

    auto const bad = do_something_with_failure(false);
    if (auto const* f = bad.as_failure())
        std::cout << std::format("Failed: {}\n", f->message());
}

void series_of_functions()
{
    std::cout << "== series of functions\n";

    auto const date_as_string = rail::pipeline(rail::lift(
                                                   [](bool should_succeed)
                                                   {
                                                       if (!should_succeed)
                                                           throw std::invalid_argument("Could not get date");
                                                       return today();
                                                   }),
                                               rail::transform(date_to_string));

    auto const printer = rail::drain([](std::string const& s) { std::cout << std::format("Good: {}\n", s); },
                                     [](rail::failure const& f) { std::cout << std::format("Boom: {}\n", f.message()); });

    date_as_string(true) | printer;
    date_as_string(false) | printer;
}

void parallel_batch()
{
    std::cout << "== parallel batch\n";

    auto rng = std::mt19937_64(std::random_device()());
    auto dist = std::uniform_int_distribution<long>(0, 40000);

    std::vector<long> values;
    for (auto i = 0; i < 10; ++i)
        values.push_back(dist(rng));

    std::mutex cout_mutex;

    // only even values pass
    auto const validator = [](long v) -> rail::result<long>
    {
        if (v % 2 == 0)
            return rail::success(v);
        return rail::failure("Could not get an odd value");
    };

    auto const process = rail::pipeline(
        validator, //
        rail::transform([](long days) { return date(std::chrono::days(days)); }),
        rail::transform(date_to_string),
        rail::tap(
            [&](std::string const& s)
            {
                auto lock = std::lock_guard(cout_mutex);
                std::cout << std::format("Seeing Success({}) pass by\n", s);
            },
            [&](rail::failure const& f)
            {
                auto lock = std::lock_guard(cout_mutex);
                std::cout << std::format("Seeing Failure({}) pass by\n", f.message());
            }),
        rail::drain(
            [&](std::string const& s)
            {
                auto lock = std::lock_guard(cout_mutex);
                std::cout << std::format("Good: {}\n", s);
            },
            [&](rail::failure const& f)
            {
                auto lock = std::lock_guard(cout_mutex);
                std::cout << std::format("Boom: {}\n", f.message());
            }));

    {
        std::vector<std::jthread> workers;
        for (auto const v : values)
            workers.emplace_back([&process, v] { process(v); });
    } // joins
}
} // namespace

int main()
{
    simple_succeed_or_fail();
    series_of_functions();
    parallel_batch();
}
