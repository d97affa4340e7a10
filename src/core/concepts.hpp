/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for FleetMirror call plumbing.
 * @author Dimitris Kafetzis
 *
 * The retry, cache and batching wrappers are templates over the wrapped
 * call so a composed call site compiles to direct invocations.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>
#include <type_traits>

namespace fleet_mirror {

// ─────────────────────────────────────────────
// Result detection
// ─────────────────────────────────────────────

template <typename T>
struct is_result : std::false_type {};

template <typename T, typename E>
struct is_result<Result<T, E>> : std::true_type {};

template <typename T>
inline constexpr bool is_result_v = is_result<std::remove_cvref_t<T>>::value;

// ─────────────────────────────────────────────
// ResultProducer
// ─────────────────────────────────────────────

/**
 * @concept ResultProducer
 * @brief A nullary callable returning Result<T, Error>.
 *
 * Every unit of work handed to the retry orchestrator, the cache wrapper
 * or the batch executor has this shape.
 */
template <typename F>
concept ResultProducer = std::invocable<F> && is_result_v<std::invoke_result_t<F>>;

}  // namespace fleet_mirror
