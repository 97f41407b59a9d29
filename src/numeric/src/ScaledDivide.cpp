/**
 * @file ScaledDivide.cpp
 * @brief Overflow-safe scaled division.
 */

#include "src/numeric/inc/ScaledDivide.hpp"

namespace tickrate {

namespace numeric {

namespace {

/// True if x * y would exceed U64_MAX.
inline bool mulOverflows(std::uint64_t x, std::uint64_t y) noexcept {
  return y != 0 && x > U64_MAX / y;
}

/// Full 128-bit product of x and y as (hi, lo) built from 32-bit halves.
inline void mulWide(std::uint64_t x, std::uint64_t y, std::uint64_t& hi,
                    std::uint64_t& lo) noexcept {
  constexpr std::uint64_t LOW_MASK = 0xFFFF'FFFFULL;

  const std::uint64_t X_LO = x & LOW_MASK;
  const std::uint64_t X_HI = x >> 32;
  const std::uint64_t Y_LO = y & LOW_MASK;
  const std::uint64_t Y_HI = y >> 32;

  const std::uint64_t LL = X_LO * Y_LO;
  const std::uint64_t LH = X_LO * Y_HI;
  const std::uint64_t HL = X_HI * Y_LO;
  const std::uint64_t HH = X_HI * Y_HI;

  const std::uint64_t MID = (LL >> 32) + (LH & LOW_MASK) + (HL & LOW_MASK);

  lo = (MID << 32) | (LL & LOW_MASK);
  hi = HH + (LH >> 32) + (HL >> 32) + (MID >> 32);
}

/**
 * floor((r * b) / divisor) for r < divisor.
 * The quotient is < b, so it always fits; computed by shift-subtract long
 * division over the 128-bit product.
 */
inline std::uint64_t mulDivRemainder(std::uint64_t r, std::uint64_t b,
                                     std::uint64_t divisor) noexcept {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  mulWide(r, b, hi, lo);

  std::uint64_t rem = 0;
  std::uint64_t quot = 0;
  for (int bit = 127; bit >= 0; --bit) {
    const std::uint64_t WORD = (bit >= 64) ? hi : lo;
    const std::uint64_t NEXT = (WORD >> (bit & 63)) & 1U;

    const bool CARRY = (rem >> 63) != 0;
    rem = (rem << 1) | NEXT;

    quot <<= 1;
    if (CARRY || rem >= divisor) {
      rem -= divisor;
      quot |= 1U;
    }
  }
  return quot;
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::uint64_t scaledDivide(std::uint64_t a, std::uint64_t b, std::uint64_t divisor) noexcept {
  if (divisor == 0) {
    return 0;
  }

  if (!mulOverflows(a, b)) {
    return (a * b) / divisor;
  }

  const std::uint64_t Q = a / divisor;
  const std::uint64_t R = a % divisor;

  if (mulOverflows(Q, b)) {
    return 0;
  }
  const std::uint64_t HIGH = Q * b;

  // R < divisor, so LOW < b always fits even when R * b does not
  const std::uint64_t LOW = mulOverflows(R, b) ? mulDivRemainder(R, b, divisor) : (R * b) / divisor;

  if (HIGH > U64_MAX - LOW) {
    return 0;
  }

  return HIGH + LOW;
}

std::uint64_t kibToBytes(std::uint64_t kib) noexcept { return scaledDivide(kib, BYTES_PER_KIB, 1); }

std::uint64_t nanosToMillis(std::uint64_t nanos) noexcept {
  return scaledDivide(nanos, 1, NANOS_PER_MILLI);
}

} // namespace numeric

} // namespace tickrate
