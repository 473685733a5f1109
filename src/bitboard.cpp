#include "abbadingo/bitboard.hpp"

#include <sstream>

namespace abbadingo {

std::string BitBoard::to_string() const {
  std::ostringstream oss;
  oss << *this;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, BitBoard bitboard) {
  os << '{';
  bool first = true;
  while (!bitboard.is_empty()) {
    if (!first) {
      os << ", ";
    }
    os << bitboard.pop_first_active_cell();
    first = false;
  }
  return os << '}';
}

} // namespace abbadingo
