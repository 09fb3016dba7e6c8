#include "bit_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace availability::bitmap {

using availability::util::ValidationFailure;

namespace {

int TwoDigits(std::string_view text, std::size_t pos) {
  const auto hi = static_cast<unsigned char>(text[pos]);
  const auto lo = static_cast<unsigned char>(text[pos + 1]);
  if (!std::isdigit(hi) || !std::isdigit(lo)) {
    return -1;
  }
  return (hi - '0') * 10 + (lo - '0');
}

void CheckRange(const Window& window) {
  if (window.start_minute < 0 || window.end_minute > kMinutesPerDay || window.start_minute % kSlotMinutes != 0 ||
      window.end_minute % kSlotMinutes != 0) {
    throw ValidationFailure("window " + FormatWindow(window) + " is not aligned to the 30-minute grid");
  }
  if (window.end_minute <= window.start_minute) {
    throw ValidationFailure("window " + FormatWindow(window) + " ends before it starts");
  }
}

} // namespace

int ParseTimeOfDay(std::string_view text, bool allow_end_of_day) {
  if ((text.size() != 5 && text.size() != 8) || text[2] != ':' || (text.size() == 8 && text[5] != ':')) {
    throw ValidationFailure("invalid time '" + std::string(text) + "': expected HH:MM:SS");
  }

  const int hours   = TwoDigits(text, 0);
  const int minutes = TwoDigits(text, 3);
  const int seconds = text.size() == 8 ? TwoDigits(text, 6) : 0;
  if (hours < 0 || minutes < 0 || seconds < 0 || minutes > 59 || seconds > 59) {
    throw ValidationFailure("invalid time '" + std::string(text) + "': expected HH:MM:SS");
  }

  if (hours == 24) {
    if (minutes != 0 || seconds != 0) {
      throw ValidationFailure("invalid time '" + std::string(text) + "': past end of day");
    }
    if (!allow_end_of_day) {
      throw ValidationFailure("24:00:00 is only valid as an end time");
    }
    return kMinutesPerDay;
  }
  if (hours > 23) {
    throw ValidationFailure("invalid time '" + std::string(text) + "': hour out of range");
  }
  if (seconds != 0 || minutes % kSlotMinutes != 0) {
    throw ValidationFailure("time '" + std::string(text) + "' is not aligned to the 30-minute grid");
  }
  return hours * 60 + minutes;
}

std::string FormatTimeOfDay(int minute_of_day) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:00", minute_of_day / 60, minute_of_day % 60);
  return buf;
}

Window ParseWindow(std::string_view start, std::string_view end) {
  Window window{ParseTimeOfDay(start, false), ParseTimeOfDay(end, true)};
  CheckRange(window);
  return window;
}

std::string FormatWindow(const Window& window) {
  return FormatTimeOfDay(window.start_minute) + "-" + FormatTimeOfDay(window.end_minute);
}

DayBits WindowBits(const Window& window) {
  CheckRange(window);
  DayBits bits;
  for (int slot = window.StartSlot(); slot < window.EndSlot(); ++slot) {
    bits.set(static_cast<std::size_t>(slot));
  }
  return bits;
}

DayBits Encode(const std::vector<Window>& windows) {
  DayBits bits;
  for (const auto& window : windows) {
    const auto window_bits = WindowBits(window);
    if (Overlaps(bits, window_bits)) {
      throw ValidationFailure("window " + FormatWindow(window) + " overlaps another window in the same day");
    }
    bits |= window_bits;
  }
  return bits;
}

std::vector<Window> Decode(const DayBits& bits) {
  std::vector<Window> windows;
  int                 slot = 0;
  while (slot < kSlotsPerDay) {
    if (!bits.test(static_cast<std::size_t>(slot))) {
      ++slot;
      continue;
    }
    const int run_start = slot;
    while (slot < kSlotsPerDay && bits.test(static_cast<std::size_t>(slot))) {
      ++slot;
    }
    windows.push_back(Window{run_start * kSlotMinutes, slot * kSlotMinutes});
  }
  return windows;
}

std::vector<Window> Normalize(std::vector<Window> windows) {
  std::sort(windows.begin(), windows.end(),
            [](const Window& a, const Window& b) { return a.start_minute < b.start_minute; });

  std::vector<Window> out;
  for (const auto& window : windows) {
    if (!out.empty() && out.back().end_minute >= window.start_minute) {
      out.back().end_minute = std::max(out.back().end_minute, window.end_minute);
      continue;
    }
    out.push_back(window);
  }
  return out;
}

bool Overlaps(const DayBits& a, const DayBits& b) {
  return (a & b).any();
}

DayBits Union(const DayBits& a, const DayBits& b) {
  return a | b;
}

DayBits Clear(const DayBits& bits, const DayBits& mask) {
  return bits & ~mask;
}

bool Covers(const DayBits& bits, const DayBits& required) {
  return (bits & required) == required;
}

std::string Pack(const DayBits& bits) {
  std::string packed(kPackedBytes, '\0');
  for (int slot = 0; slot < kSlotsPerDay; ++slot) {
    if (bits.test(static_cast<std::size_t>(slot))) {
      packed[static_cast<std::size_t>(slot / 8)] |= static_cast<char>(0x80u >> (slot % 8));
    }
  }
  return packed;
}

DayBits Unpack(std::string_view packed) {
  if (packed.size() != kPackedBytes) {
    throw std::runtime_error("corrupt day bit vector: expected " + std::to_string(kPackedBytes) + " bytes, got " +
                             std::to_string(packed.size()));
  }

  DayBits bits;
  for (int slot = 0; slot < kSlotsPerDay; ++slot) {
    const auto byte = static_cast<unsigned char>(packed[static_cast<std::size_t>(slot / 8)]);
    if (byte & (0x80u >> (slot % 8))) {
      bits.set(static_cast<std::size_t>(slot));
    }
  }
  return bits;
}

} // namespace availability::bitmap
