#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "abbadingo/chess_piece.hpp"
#include "abbadingo/coordinates.hpp"

namespace abbadingo {

inline constexpr std::uint32_t EMPTY_CHESSMOVE = 0;
inline constexpr std::uint32_t INVALID_CHESSMOVE = 0x8000'0000;

/// A chess move packed in 32 bits:
///
///   bits  0..2   moved piece (ChessPiece value, King = 0 .. Pawn = 5)
///   bits  3..5   taken piece, 6 if nothing is taken
///   bits  6..8   promoted piece, 6 if there is no promotion
///   bits  9..11  unused
///   bits 12..17  start cell
///   bits 18..23  destination cell
///   bits 24..30  en-passant cell, 64 if none
///   bit  31      invalid move flag
///
/// Only the encoding lives here: nothing checks that the move is legal.
class ChessMove {
public:
  constexpr ChessMove() noexcept = default;

  explicit constexpr ChessMove(std::uint32_t raw) noexcept : raw_{raw} {}

  /// Encodes a move. A pawn leaving its starting rank with a two-rank push
  /// records the cell it passed over as the en-passant cell.
  constexpr ChessMove(ChessPiece moved_piece, Cell start_cell, Cell destination_cell,
                      std::optional<ChessPiece> taken_piece = std::nullopt,
                      std::optional<ChessPiece> promoted_piece = std::nullopt) noexcept {
    raw_ = static_cast<std::uint32_t>(moved_piece) & PIECE_MASK;
    raw_ |= encode_piece(taken_piece) << TAKEN_PIECE_OFFSET;
    raw_ |= encode_piece(promoted_piece) << PROMOTED_PIECE_OFFSET;
    raw_ |= (start_cell.index() & CELL_MASK) << START_CELL_OFFSET;
    raw_ |= (destination_cell.index() & CELL_MASK) << DESTINATION_CELL_OFFSET;

    const auto en_passant = moved_piece == ChessPiece::Pawn
                                ? compute_en_passant(start_cell, destination_cell)
                                : std::nullopt;
    raw_ |= (en_passant.has_value() ? en_passant->index() : NO_CELL) << EN_PASSANT_CELL_OFFSET;
  }

  [[nodiscard]] static constexpr ChessMove invalid() noexcept {
    return ChessMove(INVALID_CHESSMOVE);
  }

  [[nodiscard]] constexpr std::uint32_t raw() const noexcept { return raw_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept {
    return (raw_ & INVALID_CHESSMOVE) == 0;
  }

  [[nodiscard]] constexpr ChessPiece moved_piece() const noexcept {
    return static_cast<ChessPiece>(raw_ & PIECE_MASK);
  }

  [[nodiscard]] constexpr std::optional<ChessPiece> taken_piece() const noexcept {
    return decode_piece((raw_ >> TAKEN_PIECE_OFFSET) & PIECE_MASK);
  }

  [[nodiscard]] constexpr std::optional<ChessPiece> promoted_piece() const noexcept {
    return decode_piece((raw_ >> PROMOTED_PIECE_OFFSET) & PIECE_MASK);
  }

  [[nodiscard]] constexpr Cell start_cell() const noexcept {
    return *Cell::from_index(static_cast<int>((raw_ >> START_CELL_OFFSET) & CELL_MASK));
  }

  [[nodiscard]] constexpr Cell destination_cell() const noexcept {
    return *Cell::from_index(static_cast<int>((raw_ >> DESTINATION_CELL_OFFSET) & CELL_MASK));
  }

  [[nodiscard]] constexpr std::optional<Cell> en_passant_cell() const noexcept {
    return Cell::from_index(static_cast<int>((raw_ >> EN_PASSANT_CELL_OFFSET) & EN_PASSANT_MASK));
  }

  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(ChessMove lhs, ChessMove rhs) noexcept = default;

private:
  static constexpr std::uint32_t TAKEN_PIECE_OFFSET = 3;
  static constexpr std::uint32_t PROMOTED_PIECE_OFFSET = 6;
  static constexpr std::uint32_t START_CELL_OFFSET = 12;
  static constexpr std::uint32_t DESTINATION_CELL_OFFSET = 18;
  static constexpr std::uint32_t EN_PASSANT_CELL_OFFSET = 24;

  static constexpr std::uint32_t PIECE_MASK = 0x07;
  static constexpr std::uint32_t CELL_MASK = 0x3F;
  static constexpr std::uint32_t EN_PASSANT_MASK = 0x7F;

  static constexpr std::uint32_t NO_PIECE = 6;
  static constexpr std::uint32_t NO_CELL = 64;

  static constexpr std::uint32_t encode_piece(std::optional<ChessPiece> piece) noexcept {
    return piece.has_value() ? static_cast<std::uint32_t>(*piece) & PIECE_MASK : NO_PIECE;
  }

  static constexpr std::optional<ChessPiece> decode_piece(std::uint32_t bits) noexcept {
    if (bits >= NUM_PIECE_TYPES) {
      return std::nullopt;
    }
    return static_cast<ChessPiece>(bits);
  }

  static constexpr std::optional<Cell> compute_en_passant(Cell from, Cell to) noexcept {
    if (rank(from) == Rank::R2 && calc_cell_after_steps(from, 2, 0) == to) {
      return n(from);
    }
    if (rank(from) == Rank::R7 && calc_cell_after_steps(from, -2, 0) == to) {
      return s(from);
    }
    return std::nullopt;
  }

  std::uint32_t raw_{EMPTY_CHESSMOVE};
};

// "Pawn e2-e4 ep:e3", "Bishop a1xh8 (Queen)", "Pawn g2xh1 (Rook) =Knight".
std::ostream& operator<<(std::ostream& os, ChessMove move);

} // namespace abbadingo
