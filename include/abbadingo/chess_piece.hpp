#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace abbadingo {

/// The six chess piece types, from King to Pawn. The enumeration order is also
/// the lookup priority used by ChessArmy::piece_in_cell() and the value stored
/// in the piece fields of a ChessMove.
enum class ChessPiece : std::uint8_t {
  King,
  Queen,
  Bishop,
  Knight,
  Rook,
  Pawn,
};

inline constexpr std::size_t NUM_PIECE_TYPES = 6;

inline constexpr std::array<ChessPiece, NUM_PIECE_TYPES> ALL_CHESS_PIECES = {
    ChessPiece::King,   ChessPiece::Queen, ChessPiece::Bishop,
    ChessPiece::Knight, ChessPiece::Rook,  ChessPiece::Pawn,
};

constexpr std::size_t to_index(ChessPiece piece) noexcept {
  return static_cast<std::size_t>(piece);
}

// Queens, bishops, knights and rooks share the same move rule: every controlled
// cell that is not taken by a piece of their own army.
constexpr bool is_regular_piece(ChessPiece piece) noexcept {
  return piece != ChessPiece::King && piece != ChessPiece::Pawn;
}

/// Standard Algebraic Notation letter: 'K', 'Q', 'B', 'N', 'R', 'P'.
constexpr char to_char(ChessPiece piece) noexcept {
  switch (piece) {
  case ChessPiece::King:
    return 'K';
  case ChessPiece::Queen:
    return 'Q';
  case ChessPiece::Bishop:
    return 'B';
  case ChessPiece::Knight:
    return 'N';
  case ChessPiece::Rook:
    return 'R';
  case ChessPiece::Pawn:
    return 'P';
  }
  return '?';
}

constexpr std::string_view to_string(ChessPiece piece) noexcept {
  switch (piece) {
  case ChessPiece::King:
    return "King";
  case ChessPiece::Queen:
    return "Queen";
  case ChessPiece::Bishop:
    return "Bishop";
  case ChessPiece::Knight:
    return "Knight";
  case ChessPiece::Rook:
    return "Rook";
  case ChessPiece::Pawn:
    return "Pawn";
  }
  return "?";
}

inline std::ostream& operator<<(std::ostream& os, ChessPiece piece) {
  return os << to_string(piece);
}

/// Converts a SAN piece letter ("K", "Q", "B", "N" or "R") to its ChessPiece.
/// Pawns have no letter in SAN, so "P" is rejected like any other text.
/// Throws Error{IllegalConversionToChessPiece}.
ChessPiece parse_chess_piece(std::string_view text);

} // namespace abbadingo
