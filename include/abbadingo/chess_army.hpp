#pragma once

// =============================================================================
// CHESS ARMY: Six Bitboards per Colour
// =============================================================================
//
// A ChessArmy holds the pieces of one colour as six bitboards, one per piece
// type (King, Queen, Bishop, Knight, Rook, Pawn):
//
//   - "Where are all the knights?"   -> pieces(ChessPiece::Knight), O(1)
//   - "Which cells do we occupy?"     -> OR of the six boards, O(1)
//   - "What stands on E4?"            -> test six bits in priority order
//
// The army does not know about the opposing army. Queries that depend on it
// take an "interference board": the cells occupied by the other side. Those
// cells stop sliding pieces but are still controlled (they can be captured).
//
// Invariants assumed but not enforced: at most one king, and no cell in two
// piece boards. place_pieces() does no checking; callers own that contract.
//
// =============================================================================

#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <span>

#include "abbadingo/bitboard.hpp"
#include "abbadingo/chess_piece.hpp"
#include "abbadingo/colour.hpp"
#include "abbadingo/coordinates.hpp"

namespace abbadingo {

class ChessArmy {
public:
  /// An army of the given colour with no pieces.
  explicit constexpr ChessArmy(Colour colour) noexcept : colour_{colour} {}

  /// An army deployed in the standard initial chess position.
  [[nodiscard]] static ChessArmy initial(Colour colour) noexcept;

  [[nodiscard]] constexpr Colour colour() const noexcept { return colour_; }

  [[nodiscard]] constexpr BitBoard pieces(ChessPiece piece) const noexcept {
    return pieces_[to_index(piece)];
  }

  void place_pieces(ChessPiece piece, std::initializer_list<Cell> cells) noexcept {
    pieces_[to_index(piece)].set_cells(cells);
  }
  void place_pieces(ChessPiece piece, std::span<const Cell> cells) noexcept {
    pieces_[to_index(piece)].set_cells(cells);
  }

  [[nodiscard]] BitBoard occupied_cells() const noexcept;

  [[nodiscard]] std::size_t num_pieces() const noexcept;

  /// Checks King, Queen, Bishop, Knight, Rook, Pawn in that order and returns
  /// the first piece type active in the cell.
  [[nodiscard]] std::optional<ChessPiece> piece_in_cell(Cell cell) const noexcept;

  // ---------------------------------------------------------------------------
  // Controlled cells
  // ---------------------------------------------------------------------------

  /// All the cells controlled by the whole army.
  [[nodiscard]] BitBoard controlled_cells(BitBoard interference) const noexcept;

  /// The cells controlled by every piece of one type. The king and the pawns
  /// reach a fixed distance, so they ignore the interference board.
  [[nodiscard]] BitBoard controlled_cells_by_piece_type(ChessPiece piece,
                                                        BitBoard interference) const noexcept;

  /// The cells a single pawn of the given colour controls from the given cell.
  [[nodiscard]] static BitBoard pawn_controlled_cells(Cell cell, Colour colour) noexcept;

  // ---------------------------------------------------------------------------
  // Candidate moves
  // ---------------------------------------------------------------------------

  /// The cells the piece in the given cell may move to. Returns an empty board
  /// when the cell does not hold a piece of the given type. King safety is not
  /// considered.
  [[nodiscard]] BitBoard possible_moves_for_piece_in_cell(ChessPiece piece, Cell cell,
                                                          BitBoard interference) const noexcept;

  friend constexpr bool operator==(const ChessArmy& lhs, const ChessArmy& rhs) noexcept = default;

private:
  [[nodiscard]] BitBoard king_controlled_cells() const noexcept;
  [[nodiscard]] BitBoard pawns_controlled_cells() const noexcept;
  [[nodiscard]] BitBoard knights_controlled_cells() const noexcept;
  [[nodiscard]] BitBoard bishops_controlled_cells(BitBoard interference) const noexcept;
  [[nodiscard]] BitBoard rooks_controlled_cells(BitBoard interference) const noexcept;
  [[nodiscard]] BitBoard queens_controlled_cells(BitBoard interference) const noexcept;

  [[nodiscard]] BitBoard possible_moves_for_king() const noexcept;
  [[nodiscard]] BitBoard possible_moves_for_pawn_in_cell(Cell cell,
                                                         BitBoard interference) const noexcept;
  [[nodiscard]] BitBoard possible_moves_for_regular_piece_in_cell(
      ChessPiece piece, Cell cell, BitBoard interference) const noexcept;

  BitBoard& board(ChessPiece piece) noexcept { return pieces_[to_index(piece)]; }

  Colour colour_;
  std::array<BitBoard, NUM_PIECE_TYPES> pieces_{};
};

// Prints the colour and the cells of each piece type, e.g.
// "White army {King: {e1}, Queen: {}, ...}".
std::ostream& operator<<(std::ostream& os, const ChessArmy& army);

} // namespace abbadingo
