#pragma once

#include "farmstock/core/Types.h"

#include <string>

namespace farmstock::econ {

// Monetary amount in integer minor units (1/100 of the currency unit).
//
// Revenue is accumulated in this type so that summing many allocations, or
// re-running the optimizer, never drifts the way double sums do.
//
// Values saturate at +/- kMaxUnits, so adding or subtracting two amounts
// cannot overflow.
class Money {
public:
  static constexpr core::i64 kMinorPerUnit = 100;
  static constexpr core::i64 kMaxMinor = 100000000000000000; // 1e15 units
  static constexpr double kMaxUnits = 1e15;

  constexpr Money() = default;

  static constexpr Money fromMinor(core::i64 minor) { return Money(minor); }

  // Rounds to the nearest minor unit. Non-finite input yields zero,
  // out-of-range input saturates.
  static Money fromUnits(double units);

  // True when `units` is finite and representable without saturating.
  static bool fitsUnits(double units);

  constexpr core::i64 minor() const { return minor_; }
  double toUnits() const { return (double)minor_ / (double)kMinorPerUnit; }

  constexpr bool isZero() const { return minor_ == 0; }
  constexpr bool isNegative() const { return minor_ < 0; }

  constexpr Money operator+(Money o) const { return Money(minor_ + o.minor_); }
  constexpr Money operator-(Money o) const { return Money(minor_ - o.minor_); }
  Money& operator+=(Money o) { *this = *this + o; return *this; }
  Money& operator-=(Money o) { *this = *this - o; return *this; }

  constexpr bool operator==(Money o) const { return minor_ == o.minor_; }
  constexpr bool operator!=(Money o) const { return minor_ != o.minor_; }
  constexpr bool operator<(Money o) const { return minor_ < o.minor_; }
  constexpr bool operator<=(Money o) const { return minor_ <= o.minor_; }
  constexpr bool operator>(Money o) const { return minor_ > o.minor_; }
  constexpr bool operator>=(Money o) const { return minor_ >= o.minor_; }

  // "1 234 567.89" (space-grouped). decimals is 0 or 2.
  std::string format(int decimals = 2) const;

private:
  explicit constexpr Money(core::i64 minor)
    : minor_(minor > kMaxMinor ? kMaxMinor : (minor < -kMaxMinor ? -kMaxMinor : minor)) {}

  core::i64 minor_{0};
};

inline constexpr Money maxMoney(Money a, Money b) { return (a < b) ? b : a; }

// Value of `volumeL` liters at `pricePerThousand` per 1000 L, rounded to the
// minor unit and saturated like fromUnits().
Money revenueFor(double volumeL, double pricePerThousand);

// Liters that must be sold at `pricePerThousand` to earn `amount`.
// Returns 0 for a non-positive price or amount.
double volumeForRevenue(Money amount, double pricePerThousand);

} // namespace farmstock::econ
