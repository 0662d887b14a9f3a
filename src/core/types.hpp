/**
 * @file types.hpp
 * @brief Vocabulary types shared across the railway runtime.
 *
 * Unit stands in for "no value" on the success track so that every
 * combinator can be written once over Result<T>.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>

namespace railway {

// ─────────────────────────────────────────────
// Unit
// ─────────────────────────────────────────────

/**
 * @brief The single-valued type carried by Result<Unit>.
 */
struct Unit {
    friend constexpr bool operator==(Unit, Unit) noexcept { return true; }
};

inline std::ostream& operator<<(std::ostream& os, Unit) {
    return os << "()";
}

// ─────────────────────────────────────────────
// Time
// ─────────────────────────────────────────────

using Milliseconds = std::chrono::milliseconds;

}  // namespace railway
