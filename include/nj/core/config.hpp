#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace nj { namespace config {

// Placeholder byte width for String/Object elements when nothing overrides it.
inline constexpr std::size_t kDefaultReferenceWidth = 16;

// Largest size a knob may take: widths are handed out as int64 byte counts.
inline constexpr std::size_t kMaxSize = std::size_t(std::numeric_limits<std::int64_t>::max());

// Parse an unsigned decimal env value. Unset, empty, non-numeric, zero or
// above kMaxSize yields `def`.
inline std::size_t parse_size(const char* s, std::size_t def) {
  if (!s || !*s) return def;
  std::size_t v = 0;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return def;
    const std::size_t digit = std::size_t(*p - '0');
    if (v > (kMaxSize - digit) / 10) return def;
    v = v * 10 + digit;
  }
  return v == 0 ? def : v;
}

// NJ_REFERENCE_WIDTH: bytes booked per String/Object element by the default
// size table. Read when that table is first built; later changes are ignored.
inline std::size_t reference_width_from_env() {
  return parse_size(std::getenv("NJ_REFERENCE_WIDTH"), kDefaultReferenceWidth);
}

}} // namespace nj::config
