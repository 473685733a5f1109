#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace abbadingo {

// The colour of a chess army.
enum class Colour : std::uint8_t { White = 0, Black = 1 };

constexpr Colour operator!(Colour colour) {
  return colour == Colour::White ? Colour::Black : Colour::White;
}

constexpr std::string_view to_string(Colour colour) {
  return colour == Colour::White ? "White" : "Black";
}

inline std::ostream& operator<<(std::ostream& os, Colour colour) {
  return os << to_string(colour);
}

} // namespace abbadingo
