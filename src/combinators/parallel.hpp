/**
 * @file parallel.hpp
 * @brief Accumulating combine and short-circuiting traverse.
 *
 * combine examines every input and folds all failures into one Error in
 * input order. traverse stops at the first failure and never looks at the
 * remaining items.
 */

#pragma once

#include "core/error.hpp"
#include "core/result.hpp"

#include <functional>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace railway {

namespace detail {

/// Folds one input into the running error. Every step assigns the accumulator.
template <typename T>
void accumulate_failure(std::optional<Error>& accumulated, const Result<T>& result) {
    if (result.is_failure()) {
        accumulated = railway::combine(std::move(accumulated), result.error());
    }
}

/// N-ary combine without the tuple-growing overload in the candidate set.
template <typename... Ts>
Result<std::tuple<Ts...>> combine_all(Result<Ts>... results) {
    std::optional<Error> accumulated;
    (accumulate_failure(accumulated, results), ...);
    if (accumulated) return Result<std::tuple<Ts...>>(std::move(*accumulated));
    return Result<std::tuple<Ts...>>(std::tuple<Ts...>(std::move(results).value()...));
}

}  // namespace detail

// ─────────────────────────────────────────────
// combine
// ─────────────────────────────────────────────

/**
 * @brief Collects N results into one tuple, or all of their errors.
 *
 * Failures merge left-to-right by input position: Validation errors merge
 * field-wise, anything else lands in one flat Aggregate.
 */
template <typename... Ts>
    requires(sizeof...(Ts) > 0)
Result<std::tuple<Ts...>> combine(Result<Ts>... results) {
    return detail::combine_all(std::move(results)...);
}

/**
 * @brief Appends one more result to an already-combined tuple.
 *
 * Errors from both sides are kept, as with the N-ary form.
 */
template <typename... Ts, typename U>
Result<std::tuple<Ts..., U>> combine(Result<std::tuple<Ts...>> head, Result<U> tail) {
    using R = Result<std::tuple<Ts..., U>>;
    std::optional<Error> accumulated;
    detail::accumulate_failure(accumulated, head);
    detail::accumulate_failure(accumulated, tail);
    if (accumulated) return R(std::move(*accumulated));
    return R(std::tuple_cat(std::move(head).value(), std::tuple<U>(std::move(tail).value())));
}

// ─────────────────────────────────────────────
// traverse
// ─────────────────────────────────────────────

/**
 * @brief Maps every item through @p selector, in order, into one vector.
 *
 * Returns the first failure immediately; later items are never visited.
 */
template <std::ranges::input_range Range, typename F>
    requires std::is_invocable_v<F&, std::ranges::range_reference_t<Range>> &&
             detail::is_result_v<std::invoke_result_t<F&, std::ranges::range_reference_t<Range>>>
auto traverse(Range&& items, F&& selector) -> Result<std::vector<
    typename std::remove_cvref_t<
        std::invoke_result_t<F&, std::ranges::range_reference_t<Range>>>::value_type>> {
    using Item = std::remove_cvref_t<std::invoke_result_t<F&, std::ranges::range_reference_t<Range>>>;
    using Out = typename Item::value_type;

    std::vector<Out> values;
    if constexpr (std::ranges::sized_range<Range>) {
        values.reserve(std::ranges::size(items));
    }

    for (auto&& item : items) {
        Item result = std::invoke(selector, std::forward<decltype(item)>(item));
        if (result.is_failure()) return Result<std::vector<Out>>(std::move(result).error());
        values.push_back(std::move(result).value());
    }
    return Result<std::vector<Out>>(std::move(values));
}

}  // namespace railway
