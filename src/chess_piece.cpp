#include "abbadingo/chess_piece.hpp"

#include "abbadingo/error.hpp"

namespace abbadingo {

ChessPiece parse_chess_piece(std::string_view text) {
  if (text == "K") {
    return ChessPiece::King;
  }
  if (text == "Q") {
    return ChessPiece::Queen;
  }
  if (text == "B") {
    return ChessPiece::Bishop;
  }
  if (text == "N") {
    return ChessPiece::Knight;
  }
  if (text == "R") {
    return ChessPiece::Rook;
  }
  throw Error(ErrorCode::IllegalConversionToChessPiece, text);
}

} // namespace abbadingo
