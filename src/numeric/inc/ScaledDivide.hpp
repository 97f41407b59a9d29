#ifndef TICKRATE_NUMERIC_SCALED_DIVIDE_HPP
#define TICKRATE_NUMERIC_SCALED_DIVIDE_HPP
/**
 * @file ScaledDivide.hpp
 * @brief Overflow-safe (a * b) / divisor for 64-bit counters.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Large kernel counters (ticks, bytes, sectors) frequently need a unit change
 * such as ticks -> ms or bytes -> KiB. Multiplying first keeps precision but
 * can overflow 64 bits; dividing first loses precision. scaledDivide() does
 * the precise thing when the product fits and falls back to a split
 * computation when it does not.
 *
 * Degenerate inputs never fault:
 *  - divisor == 0 returns 0
 *  - a result that does not fit in 64 bits returns 0 (not saturated)
 */

#include <cstdint>

namespace tickrate {

namespace numeric {

/* ----------------------------- Constants ----------------------------- */

/// Largest representable counter value.
inline constexpr std::uint64_t U64_MAX = ~std::uint64_t{0};

/// Bytes per KiB.
inline constexpr std::uint64_t BYTES_PER_KIB = 1024;

/// Nanoseconds per millisecond.
inline constexpr std::uint64_t NANOS_PER_MILLI = 1'000'000;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Compute floor((a * b) / divisor) without 64-bit intermediate overflow.
 * @param a Multiplicand.
 * @param b Multiplier.
 * @param divisor Divisor.
 * @return Exact floor((a * b) / divisor) whenever that value fits in 64 bits,
 *         0 when divisor is 0 or q * b or the final sum overflows.
 * @note RT-safe: Pure computation, no allocation.
 *
 * Fast path: a * b fits (b == 0 or a <= U64_MAX / b).
 * Slow path: a = q * divisor + r, result = q * b + (r * b) / divisor, with
 * each product and the final sum checked before use. When r * b alone
 * overflows, (r * b) / divisor is taken from the 128-bit product.
 */
[[nodiscard]] std::uint64_t scaledDivide(std::uint64_t a, std::uint64_t b,
                                         std::uint64_t divisor) noexcept;

/**
 * @brief Convert KiB (as reported in /proc text, e.g. "8192 KB") to bytes.
 * @return Bytes, or 0 if the result does not fit in 64 bits.
 * @note RT-safe: Pure computation.
 */
[[nodiscard]] std::uint64_t kibToBytes(std::uint64_t kib) noexcept;

/**
 * @brief Convert a nanosecond duration to whole milliseconds.
 * @note RT-safe: Pure computation.
 */
[[nodiscard]] std::uint64_t nanosToMillis(std::uint64_t nanos) noexcept;

} // namespace numeric

} // namespace tickrate

#endif // TICKRATE_NUMERIC_SCALED_DIVIDE_HPP
