#include "farmstock/econ/Money.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace farmstock::econ {

Money Money::fromUnits(double units) {
  if (!std::isfinite(units)) return Money{};
  const double clamped = std::clamp(units, -kMaxUnits, kMaxUnits);
  return Money((core::i64)std::llround(clamped * (double)kMinorPerUnit));
}

bool Money::fitsUnits(double units) {
  return std::isfinite(units) && std::abs(units) <= kMaxUnits;
}

std::string Money::format(int decimals) const {
  const bool neg = minor_ < 0;
  const core::u64 absMinor = neg ? (core::u64)(-(minor_ + 1)) + 1u : (core::u64)minor_;

  core::u64 whole = absMinor / (core::u64)kMinorPerUnit;
  core::u64 frac = absMinor % (core::u64)kMinorPerUnit;
  if (decimals <= 0) {
    if (frac * 2 >= (core::u64)kMinorPerUnit) ++whole;
    frac = 0;
  }

  const std::string digits = std::to_string(whole);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 4);
  if (neg && (whole != 0 || frac != 0)) out.push_back('-');
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) out.push_back(' ');
    out.push_back(digits[i]);
  }

  if (decimals > 0) {
    out.push_back('.');
    out.push_back((char)('0' + frac / 10));
    out.push_back((char)('0' + frac % 10));
  }
  return out;
}

Money revenueFor(double volumeL, double pricePerThousand) {
  if (!(volumeL > 0.0) || !(pricePerThousand > 0.0)) return Money{};
  // volume * price / 1000 units == volume * price / 10 minor units.
  const double minor = volumeL * pricePerThousand * (double)Money::kMinorPerUnit / 1000.0;
  if (!(minor < (double)Money::kMaxMinor)) return Money::fromMinor(Money::kMaxMinor);
  return Money::fromMinor((core::i64)std::llround(minor));
}

double volumeForRevenue(Money amount, double pricePerThousand) {
  if (amount.minor() <= 0 || !(pricePerThousand > 0.0)) return 0.0;
  return (double)amount.minor() * 1000.0 / ((double)Money::kMinorPerUnit * pricePerThousand);
}

} // namespace farmstock::econ
