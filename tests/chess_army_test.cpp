#include <gtest/gtest.h>

#include <array>
#include <sstream>
#include <utility>

#include "abbadingo/bitboard.hpp"
#include "abbadingo/chess_army.hpp"

using namespace abbadingo;

namespace {

// Straightforward eight-direction slide, independent of the army code.
BitBoard queen_rays(Cell from, BitBoard busy_cells) {
  constexpr std::array<std::pair<int, int>, 8> directions = {
      {{1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}}};

  BitBoard rays;
  for (const auto& [delta_rank, delta_file] : directions) {
    for (int distance = 1; distance < 8; ++distance) {
      const auto to = calc_cell_after_steps(from, delta_rank * distance, delta_file * distance);
      if (!to.has_value()) {
        break;
      }
      rays.set_cell(*to);
      if (busy_cells.cell_is_active(*to)) {
        break;
      }
    }
  }
  return rays;
}

} // namespace

TEST(ChessArmy, NewArmyIsEmpty) {
  const ChessArmy army(Colour::Black);
  EXPECT_EQ(army.colour(), Colour::Black);
  EXPECT_EQ(army.num_pieces(), 0U);
  EXPECT_TRUE(army.occupied_cells().is_empty());
  for (const auto piece : ALL_CHESS_PIECES) {
    EXPECT_TRUE(army.pieces(piece).is_empty());
  }
}

TEST(ChessArmy, InitialWhiteDeployment) {
  const auto white = ChessArmy::initial(Colour::White);

  EXPECT_EQ(white.num_pieces(), 16U);
  EXPECT_EQ(white.occupied_cells().state(), 0x0000'0000'0000'FFFFull);
  EXPECT_EQ(white.pieces(ChessPiece::King), BitBoard({Cell::E1}));
  EXPECT_EQ(white.pieces(ChessPiece::Queen), BitBoard({Cell::D1}));
  EXPECT_EQ(white.pieces(ChessPiece::Bishop), BitBoard({Cell::C1, Cell::F1}));
  EXPECT_EQ(white.pieces(ChessPiece::Knight), BitBoard({Cell::B1, Cell::G1}));
  EXPECT_EQ(white.pieces(ChessPiece::Rook), BitBoard({Cell::A1, Cell::H1}));
  EXPECT_EQ(white.pieces(ChessPiece::Pawn).state(), RANK_MASKS[to_index(Rank::R2)]);
}

TEST(ChessArmy, InitialBlackDeployment) {
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(black.num_pieces(), 16U);
  EXPECT_EQ(black.occupied_cells().state(), 0xFFFF'0000'0000'0000ull);
  EXPECT_EQ(black.pieces(ChessPiece::King), BitBoard({Cell::E8}));
  EXPECT_EQ(black.pieces(ChessPiece::Queen), BitBoard({Cell::D8}));
  EXPECT_EQ(black.pieces(ChessPiece::Pawn).state(), RANK_MASKS[to_index(Rank::R7)]);
}

TEST(ChessArmy, PiecePlacementAccumulates) {
  ChessArmy army(Colour::White);
  army.place_pieces(ChessPiece::Knight, {Cell::B1});
  army.place_pieces(ChessPiece::Knight, {Cell::G1, Cell::B1});

  EXPECT_EQ(army.pieces(ChessPiece::Knight), BitBoard({Cell::B1, Cell::G1}));
  EXPECT_EQ(army.num_pieces(), 2U);
}

TEST(ChessArmy, PieceInCell) {
  const auto white = ChessArmy::initial(Colour::White);

  EXPECT_EQ(white.piece_in_cell(Cell::E1), ChessPiece::King);
  EXPECT_EQ(white.piece_in_cell(Cell::D1), ChessPiece::Queen);
  EXPECT_EQ(white.piece_in_cell(Cell::G1), ChessPiece::Knight);
  EXPECT_EQ(white.piece_in_cell(Cell::D2), ChessPiece::Pawn);
  EXPECT_FALSE(white.piece_in_cell(Cell::E4).has_value());
}

TEST(ChessArmy, EqualityComparesColourAndPieces) {
  EXPECT_NE(ChessArmy(Colour::White), ChessArmy(Colour::Black));

  ChessArmy first(Colour::White);
  first.place_pieces(ChessPiece::Rook, {Cell::A1, Cell::H1});
  first.place_pieces(ChessPiece::King, {Cell::E1});

  ChessArmy second(Colour::White);
  second.place_pieces(ChessPiece::King, {Cell::E1});
  second.place_pieces(ChessPiece::Rook, {Cell::H1});
  second.place_pieces(ChessPiece::Rook, {Cell::A1});

  EXPECT_EQ(first, second);

  second.place_pieces(ChessPiece::Pawn, {Cell::A2});
  EXPECT_NE(first, second);
}

TEST(ChessArmy, PrintsEveryPieceType) {
  ChessArmy army(Colour::White);
  army.place_pieces(ChessPiece::King, {Cell::E1});
  army.place_pieces(ChessPiece::Pawn, {Cell::A2, Cell::B3});

  std::ostringstream oss;
  oss << army;
  EXPECT_EQ(oss.str(), "White army {King: {e1}, Queen: {}, Bishop: {}, Knight: {}, Rook: {}, "
                       "Pawn: {a2, b3}}");
}

// -----------------------------------------------------------------------------
// Controlled cells in the initial position
// -----------------------------------------------------------------------------

TEST(ChessArmyControl, InitialKings) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::King, black.occupied_cells()),
            BitBoard({Cell::D1, Cell::F1, Cell::D2, Cell::E2, Cell::F2}));
  EXPECT_EQ(black.controlled_cells_by_piece_type(ChessPiece::King, white.occupied_cells()),
            BitBoard({Cell::D8, Cell::F8, Cell::D7, Cell::E7, Cell::F7}));
}

TEST(ChessArmyControl, InitialPawns) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::Pawn, black.occupied_cells()).state(),
            RANK_MASKS[to_index(Rank::R3)]);
  EXPECT_EQ(black.controlled_cells_by_piece_type(ChessPiece::Pawn, white.occupied_cells()).state(),
            RANK_MASKS[to_index(Rank::R6)]);
}

TEST(ChessArmyControl, InitialKnights) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::Knight, black.occupied_cells()),
            BitBoard({Cell::A3, Cell::C3, Cell::D2, Cell::E2, Cell::F3, Cell::H3}));
  EXPECT_EQ(black.controlled_cells_by_piece_type(ChessPiece::Knight, white.occupied_cells()),
            BitBoard({Cell::A6, Cell::C6, Cell::D7, Cell::E7, Cell::F6, Cell::H6}));
}

TEST(ChessArmyControl, InitialBishops) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::Bishop, black.occupied_cells()),
            BitBoard({Cell::B2, Cell::D2, Cell::E2, Cell::G2}));
  EXPECT_EQ(black.controlled_cells_by_piece_type(ChessPiece::Bishop, white.occupied_cells()),
            BitBoard({Cell::B7, Cell::D7, Cell::E7, Cell::G7}));
}

TEST(ChessArmyControl, InitialRooks) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::Rook, black.occupied_cells()),
            BitBoard({Cell::A2, Cell::B1, Cell::G1, Cell::H2}));
  EXPECT_EQ(black.controlled_cells_by_piece_type(ChessPiece::Rook, white.occupied_cells()),
            BitBoard({Cell::A7, Cell::B8, Cell::G8, Cell::H7}));
}

TEST(ChessArmyControl, InitialQueens) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::Queen, black.occupied_cells()),
            BitBoard({Cell::C1, Cell::C2, Cell::D2, Cell::E2, Cell::E1}));
  EXPECT_EQ(black.controlled_cells_by_piece_type(ChessPiece::Queen, white.occupied_cells()),
            BitBoard({Cell::C8, Cell::C7, Cell::D7, Cell::E7, Cell::E8}));
}

TEST(ChessArmyControl, InitialArmies) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);

  EXPECT_EQ(white.controlled_cells(black.occupied_cells()).state(), 0x0000'0000'00FF'FF7Eull);
  EXPECT_EQ(black.controlled_cells(black.occupied_cells()).state(), 0x7EFF'FF00'0000'0000ull);
}

// -----------------------------------------------------------------------------
// Single pieces
// -----------------------------------------------------------------------------

TEST(ChessArmyControl, SinglePawn) {
  EXPECT_EQ(ChessArmy::pawn_controlled_cells(Cell::E2, Colour::White),
            BitBoard({Cell::D3, Cell::F3}));
  EXPECT_EQ(ChessArmy::pawn_controlled_cells(Cell::H6, Colour::Black), BitBoard({Cell::G5}));
  EXPECT_EQ(ChessArmy::pawn_controlled_cells(Cell::A2, Colour::White), BitBoard({Cell::B3}));
  EXPECT_TRUE(ChessArmy::pawn_controlled_cells(Cell::E8, Colour::White).is_empty());
  EXPECT_TRUE(ChessArmy::pawn_controlled_cells(Cell::C1, Colour::Black).is_empty());
}

TEST(ChessArmyControl, NoKingControlsNothing) {
  ChessArmy army(Colour::White);
  army.place_pieces(ChessPiece::Pawn, {Cell::E2});
  EXPECT_TRUE(army.controlled_cells_by_piece_type(ChessPiece::King, BitBoard{}).is_empty());
}

TEST(ChessArmyControl, BlockedCellIsStillControlled) {
  ChessArmy white(Colour::White);
  white.place_pieces(ChessPiece::Rook, {Cell::A1});
  white.place_pieces(ChessPiece::Pawn, {Cell::A3});

  const BitBoard interference{Cell::C1};

  EXPECT_EQ(white.controlled_cells_by_piece_type(ChessPiece::Rook, interference),
            BitBoard({Cell::A2, Cell::A3, Cell::B1, Cell::C1}));
}

TEST(ChessArmyControl, QueenControlsLikeBishopAndRookTogether) {
  const BitBoard interference{Cell::B6, Cell::G7, Cell::F2};
  const std::initializer_list<Cell> blockers{Cell::D6, Cell::A4, Cell::F4, Cell::B2};

  ChessArmy with_queen(Colour::White);
  with_queen.place_pieces(ChessPiece::Queen, {Cell::D4});
  with_queen.place_pieces(ChessPiece::Pawn, blockers);

  ChessArmy with_bishop(Colour::White);
  with_bishop.place_pieces(ChessPiece::Bishop, {Cell::D4});
  with_bishop.place_pieces(ChessPiece::Pawn, blockers);

  ChessArmy with_rook(Colour::White);
  with_rook.place_pieces(ChessPiece::Rook, {Cell::D4});
  with_rook.place_pieces(ChessPiece::Pawn, blockers);

  EXPECT_EQ(with_queen.controlled_cells_by_piece_type(ChessPiece::Queen, interference),
            with_bishop.controlled_cells_by_piece_type(ChessPiece::Bishop, interference) |
                with_rook.controlled_cells_by_piece_type(ChessPiece::Rook, interference));
}

TEST(ChessArmyControl, QueenMatchesPlainRayCastingFromEveryCell) {
  const BitBoard interference{Cell::C6, Cell::F2, Cell::G5};

  for (int index = 0; index < static_cast<int>(NUM_CELLS); ++index) {
    const Cell cell = *Cell::from_index(index);

    ChessArmy army(Colour::Black);
    army.place_pieces(ChessPiece::Queen, {cell});
    army.place_pieces(ChessPiece::Bishop, {Cell::B3});
    army.place_pieces(ChessPiece::Rook, {Cell::E7});
    army.place_pieces(ChessPiece::Knight, {Cell::D4});

    const BitBoard busy_cells = army.occupied_cells() | interference;
    BitBoard expected;
    BitBoard queens = army.pieces(ChessPiece::Queen);
    while (!queens.is_empty()) {
      expected |= queen_rays(queens.pop_first_active_cell(), busy_cells);
    }

    EXPECT_EQ(army.controlled_cells_by_piece_type(ChessPiece::Queen, interference), expected)
        << "queen on " << cell;
  }
}

TEST(ChessArmyControl, OwnSlidersBlockTheQueen) {
  ChessArmy army(Colour::White);
  army.place_pieces(ChessPiece::Queen, {Cell::D1});
  army.place_pieces(ChessPiece::Bishop, {Cell::D3});
  army.place_pieces(ChessPiece::Rook, {Cell::F3});

  const BitBoard controlled = army.controlled_cells_by_piece_type(ChessPiece::Queen, BitBoard{});

  EXPECT_TRUE(controlled.cell_is_active(Cell::D3));
  EXPECT_FALSE(controlled.cell_is_active(Cell::D4));
  EXPECT_TRUE(controlled.cell_is_active(Cell::F3));
  EXPECT_FALSE(controlled.cell_is_active(Cell::G4));
  EXPECT_TRUE(controlled.cell_is_active(Cell::H1));
  EXPECT_TRUE(controlled.cell_is_active(Cell::A4));
}

TEST(ChessArmyControl, WholeArmyIsUnionOfPieceTypes) {
  const auto white = ChessArmy::initial(Colour::White);
  const auto black = ChessArmy::initial(Colour::Black);
  const BitBoard interference = black.occupied_cells();

  BitBoard expected;
  for (const auto piece : ALL_CHESS_PIECES) {
    expected |= white.controlled_cells_by_piece_type(piece, interference);
  }
  EXPECT_EQ(white.controlled_cells(interference), expected);
}
