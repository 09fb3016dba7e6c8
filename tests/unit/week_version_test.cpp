#include "internal/core/week_version.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using availability::bitmap::WeekBits;
using availability::core::ComputeWeekVersion;

void TestEmptyWeekHasStableToken() {
  const WeekBits empty{};
  const auto     first = ComputeWeekVersion(empty);
  assert(first.size() == 40);
  assert(first == ComputeWeekVersion(WeekBits{}));
  assert(first.find_first_not_of("0123456789abcdef") == std::string::npos);
}

void TestTokenDependsOnlyOnBits() {
  WeekBits a{};
  a[0].set(18);
  WeekBits b{};
  b[0].set(18);
  assert(ComputeWeekVersion(a) == ComputeWeekVersion(b));

  b[0].set(19);
  assert(ComputeWeekVersion(a) != ComputeWeekVersion(b));
}

void TestDayOrderMatters() {
  WeekBits monday{};
  monday[0].set(20);
  WeekBits tuesday{};
  tuesday[1].set(20);
  assert(ComputeWeekVersion(monday) != ComputeWeekVersion(tuesday));
}

} // namespace

int main() {
  TestEmptyWeekHasStableToken();
  TestTokenDependsOnlyOnBits();
  TestDayOrderMatters();

  std::cout << "availability_unit_week_version: pass\n";
  return 0;
}
