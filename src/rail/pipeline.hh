#pragma once

#include <rail/combinators.hh>
#include <rail/fwd.hh>
#include <rail/result.hh>
#include <rail/utility.hh>

#include <concepts>
#include <functional>
#include <tuple>
#include <type_traits>

// =========================================================================================================
// Pipelines: left-to-right composition of stages
// =========================================================================================================
//
// A stage is any callable, usually built from the combinators in <rail/combinators.hh>.
// The first stage receives the pipeline arguments, every further stage the output of its predecessor.
//
//   auto const process = rail::pipeline(rail::lift(get_value),
//                                        rail::and_then(ensure_odd),
//                                        rail::transform(to_timestamp),
//                                        rail::tap(wiretap_ok, wiretap_fail));
//   process(17) | rail::drain(print_good, print_boom);
//
// Stages are stored by value and invoked as const, so one pipeline object may be called
// concurrently from several threads as long as the stages themselves are thread-safe.
// Pipelines never share a result between invocations: every call works on its own values.

namespace rail
{
namespace impl
{
template <class... Stages>
struct pipeline_fn
{
    static_assert(sizeof...(Stages) > 0, "a pipeline needs at least one stage");

    std::tuple<Stages...> stages;

    template <class... Args>
    decltype(auto) operator()(Args&&... args) const
    {
        return apply_from<0>(rail::forward<Args>(args)...);
    }

private:
    template <std::size_t I, class... Args>
    decltype(auto) apply_from(Args&&... args) const
    {
        if constexpr (I + 1 == sizeof...(Stages))
        {
            // the last stage result is returned as-is (including void for drain)
            return std::invoke(std::get<I>(stages), rail::forward<Args>(args)...);
        }
        else
        {
            return apply_from<I + 1>(std::invoke(std::get<I>(stages), rail::forward<Args>(args)...));
        }
    }
};
} // namespace impl

/// Composes stages left to right: pipeline(a, b, c)(x) == c(b(a(x))).
template <class... Stages>
[[nodiscard]] auto pipeline(Stages&&... stages)
{
    return impl::pipeline_fn<std::decay_t<Stages>...>{{rail::forward<Stages>(stages)...}};
}

/// Applies a stage to a result: res | stage == stage(res).
/// Only participates for rail::result on the left-hand side.
template <class R, class Stage>
    requires impl::any_result<R> && std::invocable<Stage const&, R&&>
decltype(auto) operator|(R&& res, Stage const& stage)
{
    return std::invoke(stage, rail::forward<R>(res));
}
} // namespace rail
