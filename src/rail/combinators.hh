#pragma once

#include <rail/failure.hh>
#include <rail/fwd.hh>
#include <rail/result.hh>
#include <rail/utility.hh>

#include <concepts>
#include <functional>
#include <type_traits>

// =========================================================================================================
// Combinators: lift ordinary functions onto the two tracks of rail::result
// =========================================================================================================
//
//   lift(f)                  - (args...) -> result<R>          exceptions of f become failures
//   transform(f)             - result<P> -> result<R>          f applied to the success value
//   and_then(f)              - result<P> -> result<R>          f returns a result itself (validators)
//   drain(on_ok, on_fail)    - result<P> -> void               terminal consumer, exactly one handler runs
//   merge(on_ok, on_fail)    - same as drain
//   tap(on_ok, on_fail)      - result<P> -> result<P>          like drain, but passes the result on
//
// All combinators return small callable objects that store the user function by value.
// They never modify the result they receive.
//
// Short-circuit:
//   transform/and_then hand a failure on unchanged (same message, cause, site and context)
//   and never call their function for it. Once a chain produced a failure, it stays a failure.
//
// Exceptions:
//   lift/transform/and_then catch everything their function throws (catch (...)) and return it as
//   rail::failure::from_current_exception(). Exceptions thrown by drain/tap handlers propagate:
//   handlers are outside of the pipeline.
//
// Usage (operator| is declared in <rail/pipeline.hh>):
//   auto parse_date = rail::lift([](std::string const& s) { return parse_iso_date(s); });
//   auto date_string = rail::transform([](date const& d) { return d.to_string(); });
//
//   date_string(parse_date("2024-02-30"))
//       | rail::drain([](std::string const& s) { std::cout << "Good: " << s << '\n'; },
//                     [](rail::failure const& f) { std::cout << "Boom: " << f.message() << '\n'; });
//
// Functions are invoked as const: mutable lambdas are not supported, capture state by reference instead.

namespace rail
{
namespace impl
{
template <class T>
struct is_result_t : std::false_type
{
};
template <class T>
struct is_result_t<rail::result<T>> : std::true_type
{
};

/// true for rail::result<T> (any cv/ref qualification)
template <class T>
concept any_result = is_result_t<std::remove_cvref_t<T>>::value;

template <class F, class... Args>
using lifted_t = rail::result<std::decay_t<std::invoke_result_t<F const&, Args...>>>;

template <class F>
struct lift_fn
{
    F func;

    template <class... Args>
        requires std::invocable<F const&, Args...>
    lifted_t<F, Args&&...> operator()(Args&&... args) const
    {
        using R = typename lifted_t<F, Args&&...>::value_type;

        try
        {
            return rail::success<R>(std::invoke(func, rail::forward<Args>(args)...));
        }
        catch (...)
        {
            return rail::failure::from_current_exception();
        }
    }
};

template <class F>
struct transform_fn
{
    F func;

    template <class P>
        requires std::invocable<F const&, P const&>
    lifted_t<F, P const&> operator()(rail::result<P> const& in) const
    {
        using R = typename lifted_t<F, P const&>::value_type;

        if (in.is_failure())
            return in.error();

        try
        {
            return rail::success<R>(std::invoke(func, in.value()));
        }
        catch (...)
        {
            return rail::failure::from_current_exception();
        }
    }

    template <class P>
        requires std::invocable<F const&, P&&>
    lifted_t<F, P&&> operator()(rail::result<P>&& in) const
    {
        using R = typename lifted_t<F, P&&>::value_type;

        if (in.is_failure())
            return rail::move(in).error();

        try
        {
            return rail::success<R>(std::invoke(func, rail::move(in).value()));
        }
        catch (...)
        {
            return rail::failure::from_current_exception();
        }
    }
};

template <class F>
struct and_then_fn
{
    F func;

    template <class P>
        requires std::invocable<F const&, P const&>
    std::remove_cvref_t<std::invoke_result_t<F const&, P const&>> operator()(rail::result<P> const& in) const
    {
        using out_t = std::remove_cvref_t<std::invoke_result_t<F const&, P const&>>;
        static_assert(any_result<out_t>, "and_then requires a function returning rail::result<R>, use transform otherwise");

        if (in.is_failure())
            return in.error();

        try
        {
            return std::invoke(func, in.value());
        }
        catch (...)
        {
            return rail::failure::from_current_exception();
        }
    }

    template <class P>
        requires std::invocable<F const&, P&&>
    std::remove_cvref_t<std::invoke_result_t<F const&, P&&>> operator()(rail::result<P>&& in) const
    {
        using out_t = std::remove_cvref_t<std::invoke_result_t<F const&, P&&>>;
        static_assert(any_result<out_t>, "and_then requires a function returning rail::result<R>, use transform otherwise");

        if (in.is_failure())
            return rail::move(in).error();

        try
        {
            return std::invoke(func, rail::move(in).value());
        }
        catch (...)
        {
            return rail::failure::from_current_exception();
        }
    }
};

template <class OnSuccess, class OnFailure>
struct drain_fn
{
    OnSuccess on_success;
    OnFailure on_failure;

    template <class P>
        requires std::invocable<OnSuccess const&, P const&> && std::invocable<OnFailure const&, rail::failure const&>
    void operator()(rail::result<P> const& in) const
    {
        if (in.is_success())
            std::invoke(on_success, in.value());
        else
            std::invoke(on_failure, in.error());
    }
};

template <class OnSuccess, class OnFailure>
struct tap_fn
{
    OnSuccess on_success;
    OnFailure on_failure;

    template <class P>
        requires std::invocable<OnSuccess const&, P const&> && std::invocable<OnFailure const&, rail::failure const&>
    rail::result<P> operator()(rail::result<P> const& in) const
    {
        observe(in);
        return in;
    }

    template <class P>
        requires std::invocable<OnSuccess const&, P const&> && std::invocable<OnFailure const&, rail::failure const&>
    rail::result<P> operator()(rail::result<P>&& in) const
    {
        observe(in);
        return rail::move(in);
    }

private:
    template <class P>
    void observe(rail::result<P> const& in) const
    {
        if (in.is_success())
            std::invoke(on_success, in.value());
        else
            std::invoke(on_failure, in.error());
    }
};
} // namespace impl

/// Turns f(args...) -> R into a function returning rail::result<R>.
/// Normal completion yields a success, any exception a failure caused by that exception.
/// f must return a value: result<void> does not exist.
template <class F>
[[nodiscard]] auto lift(F&& f)
{
    return impl::lift_fn<std::decay_t<F>>{rail::forward<F>(f)};
}

/// Turns f(P) -> R into a function result<P> -> result<R>.
/// Failures are passed on unchanged without calling f, exceptions of f become failures.
template <class F>
[[nodiscard]] auto transform(F&& f)
{
    return impl::transform_fn<std::decay_t<F>>{rail::forward<F>(f)};
}

/// Turns f(P) -> result<R> into a function result<P> -> result<R>.
/// Like transform, but the success value is f's result itself, so f can reject values.
template <class F>
[[nodiscard]] auto and_then(F&& f)
{
    return impl::and_then_fn<std::decay_t<F>>{rail::forward<F>(f)};
}

/// Terminal consumer: calls on_success(value) for successes and on_failure(failure) for failures.
/// Exactly one of the two handlers runs per call. Branches on the track, never on the value.
template <class OnSuccess, class OnFailure>
[[nodiscard]] auto drain(OnSuccess&& on_success, OnFailure&& on_failure)
{
    return impl::drain_fn<std::decay_t<OnSuccess>, std::decay_t<OnFailure>>{rail::forward<OnSuccess>(on_success),
                                                                           rail::forward<OnFailure>(on_failure)};
}

/// Alternative name for drain.
template <class OnSuccess, class OnFailure>
[[nodiscard]] auto merge(OnSuccess&& on_success, OnFailure&& on_failure)
{
    return rail::drain(rail::forward<OnSuccess>(on_success), rail::forward<OnFailure>(on_failure));
}

/// Inline observer ("wiretap"): same handler selection as drain, then returns the result unchanged.
template <class OnSuccess, class OnFailure>
[[nodiscard]] auto tap(OnSuccess&& on_success, OnFailure&& on_failure)
{
    return impl::tap_fn<std::decay_t<OnSuccess>, std::decay_t<OnFailure>>{rail::forward<OnSuccess>(on_success),
                                                                         rail::forward<OnFailure>(on_failure)};
}
} // namespace rail
