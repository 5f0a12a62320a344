#ifndef ERRORKIT_SAFE_EXEC_HPP
#define ERRORKIT_SAFE_EXEC_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "errorkit/error.hpp"
#include "errorkit/fault.hpp"

namespace errorkit {

    namespace detail {

        template <typename R>
        struct outcome_traits {
            static constexpr bool value = false;
        };

        template <typename... Ts>
        struct outcome_traits<std::tuple<Ts...>> {
            static constexpr bool value = [] {
                if constexpr (sizeof...(Ts) == 0) {
                    return false;
                } else {
                    return std::is_same_v<std::tuple_element_t<sizeof...(Ts) - 1, std::tuple<Ts...>>, MaybeError>;
                }
            }();
        };

        template <typename R>
        inline constexpr bool is_outcome_v = outcome_traits<R>::value;

        template <typename F>
        using result_of_t = std::remove_cvref_t<std::invoke_result_t<F>>;

        // Hands a set error slot to the handler and returns the typed slots.
        template <typename Result, typename Handler>
        auto consume_error(Result&& outcome, Handler& handler) {
            using Plain            = std::remove_cvref_t<Result>;
            constexpr auto n_slots = std::tuple_size_v<Plain> - 1;
            if (const auto& error = std::get<n_slots>(outcome)) {
                std::invoke(handler, *error);
            }
            return [&]<std::size_t... I>(std::index_sequence<I...>) {
                return std::tuple<std::tuple_element_t<I, Plain>...>(std::move(std::get<I>(outcome))...);
            }(std::make_index_sequence<n_slots>{});
        }

    } // namespace detail

    // Runs fn and turns any exception it throws into a captured-fault error.
    //
    // fn may return void, MaybeError or an Outcome<Ts...>. Whatever fn returns
    // normally is passed through untouched. When fn throws, the error slot
    // holds "panic occurred: <payload>\nStack trace:\n<stack>" and every typed
    // slot is value-initialised, so writes made before the throw never leak.
    template <std::invocable F>
    [[nodiscard]] auto safe_exec(F&& fn) {
        using Result = detail::result_of_t<F>;
        if constexpr (std::is_void_v<Result>) {
            try {
                std::invoke(std::forward<F>(fn));
                return MaybeError{};
            } catch (...) { return MaybeError{recover_current_exception()}; }
        } else if constexpr (std::is_same_v<Result, MaybeError>) {
            try {
                return MaybeError{std::invoke(std::forward<F>(fn))};
            } catch (...) { return MaybeError{recover_current_exception()}; }
        } else {
            static_assert(detail::is_outcome_v<Result>, "safe_exec expects void, MaybeError or Outcome<Ts...>");
            static_assert(std::is_default_constructible_v<Result>, "Outcome slots must be default constructible");
            try {
                return Result{std::invoke(std::forward<F>(fn))};
            } catch (...) {
                Result fault{};
                std::get<std::tuple_size_v<Result> - 1>(fault) = recover_current_exception();
                return fault;
            }
        }
    }

    template <std::invocable F>
    [[nodiscard]] MaybeError safe_exec0(F&& fn) {
        static_assert(std::is_void_v<detail::result_of_t<F>>, "safe_exec0 expects a computation without results");
        return safe_exec(std::forward<F>(fn));
    }

    template <typename T, std::invocable F>
    [[nodiscard]] Outcome<T> safe_exec1(F&& fn) {
        return safe_exec([&fn]() -> Outcome<T> { return std::invoke(std::forward<F>(fn)); });
    }

    template <typename T1, typename T2, std::invocable F>
    [[nodiscard]] Outcome<T1, T2> safe_exec2(F&& fn) {
        return safe_exec([&fn]() -> Outcome<T1, T2> { return std::invoke(std::forward<F>(fn)); });
    }

    template <typename T1, typename T2, typename T3, std::invocable F>
    [[nodiscard]] Outcome<T1, T2, T3> safe_exec3(F&& fn) {
        return safe_exec([&fn]() -> Outcome<T1, T2, T3> { return std::invoke(std::forward<F>(fn)); });
    }

    // Handler variants: the error goes to handler, never back to the caller.
    // handler runs outside the protected region.
    template <std::invocable F, std::invocable<const Error&> Handler>
    auto safe_exec_with_handler(F&& fn, Handler&& handler) {
        auto result = safe_exec(std::forward<F>(fn));
        if constexpr (std::is_same_v<decltype(result), MaybeError>) {
            if (result) {
                std::invoke(handler, *result);
            }
        } else {
            return detail::consume_error(std::move(result), handler);
        }
    }

    template <std::invocable F, std::invocable<const Error&> Handler>
    void safe_exec_with_handler0(F&& fn, Handler&& handler) {
        if (const auto error = safe_exec0(std::forward<F>(fn))) {
            std::invoke(handler, *error);
        }
    }

    template <typename T, std::invocable F, std::invocable<const Error&> Handler>
    T safe_exec_with_handler1(F&& fn, Handler&& handler) {
        return std::get<0>(detail::consume_error(safe_exec1<T>(std::forward<F>(fn)), handler));
    }

    template <typename T1, typename T2, std::invocable F, std::invocable<const Error&> Handler>
    std::tuple<T1, T2> safe_exec_with_handler2(F&& fn, Handler&& handler) {
        return detail::consume_error(safe_exec2<T1, T2>(std::forward<F>(fn)), handler);
    }

    template <typename T1, typename T2, typename T3, std::invocable F, std::invocable<const Error&> Handler>
    std::tuple<T1, T2, T3> safe_exec_with_handler3(F&& fn, Handler&& handler) {
        return detail::consume_error(safe_exec3<T1, T2, T3>(std::forward<F>(fn)), handler);
    }

} // namespace errorkit

#endif // ERRORKIT_SAFE_EXEC_HPP
