#include "internal/bitmap/bit_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using availability::bitmap::DayBits;
using availability::bitmap::Window;

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const availability::util::ValidationFailure&) {
    return true;
  }
  return false;
}

Window W(const std::string& start, const std::string& end) {
  return availability::bitmap::ParseWindow(start, end);
}

void TestParseAcceptsGridAlignedTimes() {
  assert(availability::bitmap::ParseTimeOfDay("09:00:00", false) == 540);
  assert(availability::bitmap::ParseTimeOfDay("09:30", false) == 570);
  assert(availability::bitmap::ParseTimeOfDay("00:00:00", false) == 0);
  assert(availability::bitmap::ParseTimeOfDay("24:00:00", true) == 1440);
}

void TestParseRejectsMalformedTimes() {
  assert(ThrowsValidation([] { availability::bitmap::ParseTimeOfDay("09:15:00", false); }));
  assert(ThrowsValidation([] { availability::bitmap::ParseTimeOfDay("09:00:30", false); }));
  assert(ThrowsValidation([] { availability::bitmap::ParseTimeOfDay("24:00:00", false); }));
  assert(ThrowsValidation([] { availability::bitmap::ParseTimeOfDay("24:30:00", true); }));
  assert(ThrowsValidation([] { availability::bitmap::ParseTimeOfDay("9:00", false); }));
  assert(ThrowsValidation([] { availability::bitmap::ParseTimeOfDay("ab:cd:ef", false); }));
}

void TestInvertedAndEmptyWindowsAreRejected() {
  assert(ThrowsValidation([] { W("12:00:00", "09:00:00"); }));
  assert(ThrowsValidation([] { W("09:00:00", "09:00:00"); }));
}

void TestEndOfDaySentinelMapsToFinalSlot() {
  const auto bits = availability::bitmap::WindowBits(W("23:30:00", "24:00:00"));
  assert(bits.count() == 1);
  assert(bits.test(47));
  assert(!bits.test(0));

  const auto decoded = availability::bitmap::Decode(bits);
  assert(decoded.size() == 1);
  assert(availability::bitmap::FormatTimeOfDay(decoded[0].end_minute) == "24:00:00");
}

void TestEncodeDecodeCoalescesTouchingWindows() {
  const auto bits    = availability::bitmap::Encode({W("09:00", "10:00"), W("10:00", "11:30"), W("14:00", "15:00")});
  const auto decoded = availability::bitmap::Decode(bits);
  assert(decoded.size() == 2);
  assert(availability::bitmap::FormatWindow(decoded[0]) == "09:00:00-11:30:00");
  assert(availability::bitmap::FormatWindow(decoded[1]) == "14:00:00-15:00:00");
  assert(availability::bitmap::Decode(DayBits{}).empty());
}

void TestEncodeRejectsOverlappingWindows() {
  assert(ThrowsValidation([] { availability::bitmap::Encode({W("09:00", "11:00"), W("10:30", "12:00")}); }));
}

void TestOverlapUnionClearCovers() {
  const auto morning   = availability::bitmap::WindowBits(W("09:00", "12:00"));
  const auto late      = availability::bitmap::WindowBits(W("11:30", "13:00"));
  const auto afternoon = availability::bitmap::WindowBits(W("13:00", "15:00"));

  assert(availability::bitmap::Overlaps(morning, late));
  assert(!availability::bitmap::Overlaps(morning, afternoon));

  const auto merged = availability::bitmap::Union(morning, afternoon);
  assert(merged.count() == morning.count() + afternoon.count());
  assert(availability::bitmap::Clear(merged, afternoon) == morning);

  assert(availability::bitmap::Covers(morning, availability::bitmap::WindowBits(W("09:30", "10:00"))));
  assert(!availability::bitmap::Covers(morning, availability::bitmap::WindowBits(W("11:30", "12:30"))));
}

void TestPackedLayoutIsMostSignificantBitFirst() {
  DayBits bits;
  bits.set(0);
  bits.set(9);
  bits.set(47);

  const auto packed = availability::bitmap::Pack(bits);
  assert(packed.size() == 6);
  assert(static_cast<unsigned char>(packed[0]) == 0x80);
  assert(static_cast<unsigned char>(packed[1]) == 0x40);
  assert(static_cast<unsigned char>(packed[5]) == 0x01);
  assert(availability::bitmap::Unpack(packed) == bits);

  bool threw = false;
  try {
    (void)availability::bitmap::Unpack(std::string(5, '\0'));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "Unpack must reject payloads that are not 6 bytes.");
}

} // namespace

int main() {
  TestParseAcceptsGridAlignedTimes();
  TestParseRejectsMalformedTimes();
  TestInvertedAndEmptyWindowsAreRejected();
  TestEndOfDaySentinelMapsToFinalSlot();
  TestEncodeDecodeCoalescesTouchingWindows();
  TestEncodeRejectsOverlappingWindows();
  TestOverlapUnionClearCovers();
  TestPackedLayoutIsMostSignificantBitFirst();

  std::cout << "availability_unit_bit_codec: pass\n";
  return 0;
}
