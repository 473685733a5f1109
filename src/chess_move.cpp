#include "abbadingo/chess_move.hpp"

#include <sstream>

namespace abbadingo {

std::string ChessMove::to_string() const {
  std::ostringstream oss;
  oss << *this;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, ChessMove move) {
  if (!move.is_valid()) {
    return os << "invalid move";
  }

  const auto taken = move.taken_piece();
  os << move.moved_piece() << ' ' << move.start_cell() << (taken.has_value() ? 'x' : '-')
     << move.destination_cell();
  if (taken.has_value()) {
    os << " (" << *taken << ')';
  }
  if (const auto promoted = move.promoted_piece()) {
    os << " =" << *promoted;
  }
  if (const auto en_passant = move.en_passant_cell()) {
    os << " ep:" << *en_passant;
  }
  return os;
}

} // namespace abbadingo
