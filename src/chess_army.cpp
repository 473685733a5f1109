// =============================================================================
// CONTROLLED CELLS AND CANDIDATE MOVES
// =============================================================================
//
// Control is computed per piece type and then combined:
//
// 1. FIXED REACH (king, knights, pawns)
//    The king uses the precomputed neighbour mask of its cell. Knights try the
//    eight (rank, file) jumps and drop the ones that leave the board. Pawns
//    control the two forward diagonals, forward depending on the colour.
//
// 2. RAY CASTING (bishops, rooks)
//    From each slider we step one cell at a time in each of its four
//    directions, marking every cell reached. A ray stops right after the first
//    busy cell (own piece or interference), which is still controlled: a
//    piece defends its friends and attacks its enemies.
//
// 3. QUEENS AS BISHOPS PLUS ROOKS
//    Queens have no geometry of their own. We relabel a copy of the army so
//    the queens sit in the bishop slot and the real bishops and rooks sit in
//    the pawn slot, where they still block rays but cast none. Bishop rays,
//    then the same cells moved into the rook slot for rook rays, give the
//    queen's eight directions with one sliding algorithm.
//
// Moves follow from control: a regular piece moves to any controlled cell not
// held by its own army. Pawns are the exception, since they capture on the
// diagonals but push straight ahead.
//
// =============================================================================

#include "abbadingo/chess_army.hpp"

#include <array>
#include <utility>

namespace abbadingo {

namespace {

constexpr std::size_t colour_index(Colour colour) {
  return static_cast<std::size_t>(colour);
}

// (delta_rank, delta_file) pairs.
using Step = std::pair<int, int>;

constexpr std::array<Step, 8> KNIGHT_JUMPS = {{
    {2, 1},
    {1, 2},
    {-1, 2},
    {-2, 1},
    {-2, -1},
    {-1, -2},
    {1, -2},
    {2, -1},
}};

constexpr std::array<Step, 4> BISHOP_DIRECTIONS = {{{1, 1}, {1, -1}, {-1, 1}, {-1, -1}}};

constexpr std::array<Step, 4> ROOK_DIRECTIONS = {{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};

constexpr std::array<Rank, 2> PAWN_START_RANKS = {Rank::R2, Rank::R7};
constexpr std::array<int, 2> PAWN_FORWARD = {1, -1};

BitBoard cast_ray(Cell from, Step direction, BitBoard busy_cells) {
  BitBoard ray;
  auto next = calc_cell_after_steps(from, direction.first, direction.second);
  while (next.has_value()) {
    ray.set_cell(*next);
    if (busy_cells.cell_is_active(*next)) {
      break;
    }
    next = calc_cell_after_steps(*next, direction.first, direction.second);
  }
  return ray;
}

BitBoard sliders_controlled_cells(BitBoard sliders, std::span<const Step> directions,
                                  BitBoard busy_cells) {
  BitBoard controlled;
  while (!sliders.is_empty()) {
    const Cell from = sliders.pop_first_active_cell();
    for (const auto& direction : directions) {
      controlled |= cast_ray(from, direction, busy_cells);
    }
  }
  return controlled;
}

} // namespace

ChessArmy ChessArmy::initial(Colour colour) noexcept {
  ChessArmy army(colour);

  switch (colour) {
  case Colour::White:
    army.place_pieces(ChessPiece::King, {Cell::E1});
    army.place_pieces(ChessPiece::Queen, {Cell::D1});
    army.place_pieces(ChessPiece::Bishop, {Cell::C1, Cell::F1});
    army.place_pieces(ChessPiece::Knight, {Cell::B1, Cell::G1});
    army.place_pieces(ChessPiece::Rook, {Cell::A1, Cell::H1});
    army.board(ChessPiece::Pawn).set_rank(Rank::R2);
    break;
  case Colour::Black:
    army.place_pieces(ChessPiece::King, {Cell::E8});
    army.place_pieces(ChessPiece::Queen, {Cell::D8});
    army.place_pieces(ChessPiece::Bishop, {Cell::C8, Cell::F8});
    army.place_pieces(ChessPiece::Knight, {Cell::B8, Cell::G8});
    army.place_pieces(ChessPiece::Rook, {Cell::A8, Cell::H8});
    army.board(ChessPiece::Pawn).set_rank(Rank::R7);
    break;
  }

  return army;
}

BitBoard ChessArmy::occupied_cells() const noexcept {
  BitBoard occupied;
  for (const auto& pieces : pieces_) {
    occupied |= pieces;
  }
  return occupied;
}

std::size_t ChessArmy::num_pieces() const noexcept {
  std::size_t count = 0;
  for (const auto& pieces : pieces_) {
    count += pieces.pop_count();
  }
  return count;
}

std::optional<ChessPiece> ChessArmy::piece_in_cell(Cell cell) const noexcept {
  for (const auto piece : ALL_CHESS_PIECES) {
    if (pieces(piece).cell_is_active(cell)) {
      return piece;
    }
  }
  return std::nullopt;
}

BitBoard ChessArmy::controlled_cells(BitBoard interference) const noexcept {
  BitBoard controlled;
  for (const auto piece : ALL_CHESS_PIECES) {
    controlled |= controlled_cells_by_piece_type(piece, interference);
  }
  return controlled;
}

BitBoard ChessArmy::controlled_cells_by_piece_type(ChessPiece piece,
                                                   BitBoard interference) const noexcept {
  switch (piece) {
  case ChessPiece::King:
    return king_controlled_cells();
  case ChessPiece::Queen:
    return queens_controlled_cells(interference);
  case ChessPiece::Bishop:
    return bishops_controlled_cells(interference);
  case ChessPiece::Knight:
    return knights_controlled_cells();
  case ChessPiece::Rook:
    return rooks_controlled_cells(interference);
  case ChessPiece::Pawn:
    return pawns_controlled_cells();
  }
  return BitBoard{};
}

BitBoard ChessArmy::pawn_controlled_cells(Cell cell, Colour colour) noexcept {
  const auto [west_diagonal, east_diagonal] =
      colour == Colour::White ? std::pair{nw(cell), ne(cell)} : std::pair{sw(cell), se(cell)};

  BitBoard controlled;
  if (west_diagonal.has_value()) {
    controlled.set_cell(*west_diagonal);
  }
  if (east_diagonal.has_value()) {
    controlled.set_cell(*east_diagonal);
  }
  return controlled;
}

BitBoard ChessArmy::king_controlled_cells() const noexcept {
  const auto king = pieces(ChessPiece::King).active_cell();
  if (!king.has_value()) {
    return BitBoard{};
  }
  return neighbours(*king);
}

BitBoard ChessArmy::pawns_controlled_cells() const noexcept {
  BitBoard controlled;
  BitBoard pawns = pieces(ChessPiece::Pawn);
  while (!pawns.is_empty()) {
    controlled |= pawn_controlled_cells(pawns.pop_first_active_cell(), colour_);
  }
  return controlled;
}

BitBoard ChessArmy::knights_controlled_cells() const noexcept {
  BitBoard controlled;
  BitBoard knights = pieces(ChessPiece::Knight);
  while (!knights.is_empty()) {
    const Cell from = knights.pop_first_active_cell();
    for (const auto& [delta_rank, delta_file] : KNIGHT_JUMPS) {
      if (const auto to = calc_cell_after_steps(from, delta_rank, delta_file)) {
        controlled.set_cell(*to);
      }
    }
  }
  return controlled;
}

BitBoard ChessArmy::bishops_controlled_cells(BitBoard interference) const noexcept {
  return sliders_controlled_cells(pieces(ChessPiece::Bishop), BISHOP_DIRECTIONS,
                                  occupied_cells() | interference);
}

BitBoard ChessArmy::rooks_controlled_cells(BitBoard interference) const noexcept {
  return sliders_controlled_cells(pieces(ChessPiece::Rook), ROOK_DIRECTIONS,
                                  occupied_cells() | interference);
}

BitBoard ChessArmy::queens_controlled_cells(BitBoard interference) const noexcept {
  // The relabelling keeps occupied_cells() unchanged, so every original piece
  // still blocks the rays.
  ChessArmy relabelled = *this;
  relabelled.board(ChessPiece::Pawn) |= pieces(ChessPiece::Bishop) | pieces(ChessPiece::Rook);
  relabelled.board(ChessPiece::Bishop) = pieces(ChessPiece::Queen);
  relabelled.board(ChessPiece::Queen).clear();
  BitBoard controlled = relabelled.bishops_controlled_cells(interference);

  relabelled.board(ChessPiece::Rook) = relabelled.pieces(ChessPiece::Bishop);
  relabelled.board(ChessPiece::Bishop).clear();
  controlled |= relabelled.rooks_controlled_cells(interference);
  return controlled;
}

BitBoard ChessArmy::possible_moves_for_piece_in_cell(ChessPiece piece, Cell cell,
                                                     BitBoard interference) const noexcept {
  switch (piece) {
  case ChessPiece::King:
    if (!pieces(ChessPiece::King).cell_is_active(cell)) {
      return BitBoard{};
    }
    return possible_moves_for_king();
  case ChessPiece::Pawn:
    return possible_moves_for_pawn_in_cell(cell, interference);
  case ChessPiece::Queen:
  case ChessPiece::Bishop:
  case ChessPiece::Knight:
  case ChessPiece::Rook:
    return possible_moves_for_regular_piece_in_cell(piece, cell, interference);
  }
  return BitBoard{};
}

BitBoard ChessArmy::possible_moves_for_king() const noexcept {
  const BitBoard occupied = occupied_cells();
  return (king_controlled_cells() | occupied) ^ occupied;
}

BitBoard ChessArmy::possible_moves_for_regular_piece_in_cell(
    ChessPiece piece, Cell cell, BitBoard interference) const noexcept {
  if (piece_in_cell(cell) != piece) {
    return BitBoard{};
  }

  // Leave the moving piece alone in its slot; its companions of the same type
  // become plain blockers in the pawn slot.
  const BitBoard moving{cell};
  ChessArmy single = *this;
  single.board(ChessPiece::Pawn) |= pieces(piece) ^ moving;
  single.board(piece) = moving;

  const BitBoard occupied = occupied_cells();
  return (single.controlled_cells_by_piece_type(piece, interference) | occupied) ^ occupied;
}

BitBoard ChessArmy::possible_moves_for_pawn_in_cell(Cell cell,
                                                    BitBoard interference) const noexcept {
  if (piece_in_cell(cell) != ChessPiece::Pawn) {
    return BitBoard{};
  }

  const BitBoard captures = pawn_controlled_cells(cell, colour_) & interference;
  const BitBoard busy_cells = occupied_cells() | interference;
  const int forward = PAWN_FORWARD[colour_index(colour_)];

  const auto one_ahead = calc_cell_after_steps(cell, forward, 0);
  if (!one_ahead.has_value() || busy_cells.cell_is_active(*one_ahead)) {
    return captures;
  }

  BitBoard pushes{*one_ahead};
  if (rank(cell) == PAWN_START_RANKS[colour_index(colour_)]) {
    const auto two_ahead = calc_cell_after_steps(*one_ahead, forward, 0);
    if (two_ahead.has_value() && !busy_cells.cell_is_active(*two_ahead)) {
      pushes.set_cell(*two_ahead);
    }
  }

  return pushes | captures;
}

std::ostream& operator<<(std::ostream& os, const ChessArmy& army) {
  os << army.colour() << " army {";
  bool first = true;
  for (const auto piece : ALL_CHESS_PIECES) {
    if (!first) {
      os << ", ";
    }
    os << piece << ": " << army.pieces(piece);
    first = false;
  }
  return os << '}';
}

} // namespace abbadingo
