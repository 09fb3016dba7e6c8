#pragma once

#include <array>
#include <bitset>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace availability::bitmap {

/*
  Day bit vector codec.

  Layout (shared by every encode/decode/overlap path):
    - 48 half-hour slots cover 00:00-24:00.
    - Slot i covers minutes [30*i, 30*i + 30) and is DayBits bit i.
    - Packed form is 6 bytes; slot i lives in byte i/8 under mask
      0x80 >> (i % 8), most significant bit first. This is the storage
      and cache payload.

  Windows are half-open. An end of 24:00:00 is the end-of-day sentinel and
  maps to the final slot, never to slot 0 of the next day.
*/

inline constexpr int         kSlotMinutes   = 30;
inline constexpr int         kSlotsPerDay   = 48;
inline constexpr int         kMinutesPerDay = kSlotMinutes * kSlotsPerDay;
inline constexpr std::size_t kPackedBytes   = kSlotsPerDay / 8;

using DayBits = std::bitset<kSlotsPerDay>;

// Monday first.
using WeekBits = std::array<DayBits, 7>;

struct Window {
  int start_minute = 0;
  int end_minute   = 0;

  int StartSlot() const {
    return start_minute / kSlotMinutes;
  }
  int EndSlot() const {
    return end_minute / kSlotMinutes;
  }

  bool operator==(const Window&) const = default;
};

// "HH:MM" or "HH:MM:SS" on the half-hour grid. "24:00:00" only when
// allow_end_of_day. Throws util::ValidationFailure.
int         ParseTimeOfDay(std::string_view text, bool allow_end_of_day);
std::string FormatTimeOfDay(int minute_of_day);

// Parses and checks start < end. Throws util::ValidationFailure.
Window      ParseWindow(std::string_view start, std::string_view end);
std::string FormatWindow(const Window& window);

DayBits WindowBits(const Window& window);

// Windows must be aligned and pairwise disjoint. Throws util::ValidationFailure.
DayBits             Encode(const std::vector<Window>& windows);
std::vector<Window> Decode(const DayBits& bits);

// Sorted, with touching windows coalesced; the image of Decode(Encode(w)).
std::vector<Window> Normalize(std::vector<Window> windows);

bool    Overlaps(const DayBits& a, const DayBits& b);
DayBits Union(const DayBits& a, const DayBits& b);
DayBits Clear(const DayBits& bits, const DayBits& mask);
bool    Covers(const DayBits& bits, const DayBits& required);

std::string Pack(const DayBits& bits);
// Throws std::runtime_error on a payload of the wrong size.
DayBits Unpack(std::string_view packed);

} // namespace availability::bitmap
