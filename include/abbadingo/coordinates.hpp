#pragma once

// =============================================================================
// BOARD COORDINATES: Files, Ranks, Diagonals and Cells
// =============================================================================
//
// Every position on the 8x8 board is a Cell, identified by a linear index:
//
//   index = rank * 8 + file        (A1 = 0, H1 = 7, A2 = 8, ..., H8 = 63)
//
//        a   b   c   d   e   f   g   h
//     8  56  57  58  59  60  61  62  63
//     7  48  49  50  51  52  53  54  55
//     6  40  41  42  43  44  45  46  47
//     5  32  33  34  35  36  37  38  39
//     4  24  25  26  27  28  29  30  31
//     3  16  17  18  19  20  21  22  23
//     2   8   9  10  11  12  13  14  15
//     1   0   1   2   3   4   5   6   7
//
// Besides files (columns) and ranks (rows) the board has two families of
// 45-degree lines, each with 15 members:
//
//   - Diagonals run from bottom-left to top-right. Index = file - rank + 7,
//     so A8 alone is diagonal 0, A1..H8 is diagonal 7 and H1 alone is 14.
//   - Anti-diagonals run from top-left to bottom-right. Index = file + rank,
//     so A1 alone is anti-diagonal 0, A8..H1 is 7 and H8 alone is 14.
//
// Neighbour lookups are where naive index arithmetic goes wrong: H1 + 1 is A2,
// a cell on the opposite side of the board. Every directional step below is
// therefore computed on the (file, rank) pair and checked against the board
// edge, returning std::nullopt when the step would leave the board.
//
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace abbadingo {

inline constexpr std::size_t NUM_FILES = 8;
inline constexpr std::size_t NUM_RANKS = 8;
inline constexpr std::size_t NUM_CELLS = 64;
inline constexpr std::size_t NUM_DIAGONALS = 15;
inline constexpr std::size_t NUM_ANTI_DIAGONALS = 15;

enum class File : std::uint8_t { A, B, C, D, E, F, G, H };

enum class Rank : std::uint8_t { R1, R2, R3, R4, R5, R6, R7, R8 };

// Named after the two cells at the ends of each diagonal.
enum class Diagonal : std::uint8_t {
  A8A8,
  A7B8,
  A6C8,
  A5D8,
  A4E8,
  A3F8,
  A2G8,
  A1H8,
  B1H7,
  C1H6,
  D1H5,
  E1H4,
  F1H3,
  G1H2,
  H1H1,
};

enum class AntiDiagonal : std::uint8_t {
  A1A1,
  A2B1,
  A3C1,
  A4D1,
  A5E1,
  A6F1,
  A7G1,
  A8H1,
  B8H2,
  C8H3,
  D8H4,
  E8H5,
  F8H6,
  G8H7,
  H8H8,
};

constexpr std::uint8_t to_index(File f) noexcept {
  return static_cast<std::uint8_t>(f);
}
constexpr std::uint8_t to_index(Rank r) noexcept {
  return static_cast<std::uint8_t>(r);
}
constexpr std::uint8_t to_index(Diagonal d) noexcept {
  return static_cast<std::uint8_t>(d);
}
constexpr std::uint8_t to_index(AntiDiagonal d) noexcept {
  return static_cast<std::uint8_t>(d);
}

constexpr std::optional<File> file_from_index(int index) noexcept {
  if (index < 0 || index >= static_cast<int>(NUM_FILES)) {
    return std::nullopt;
  }
  return static_cast<File>(index);
}

constexpr std::optional<Rank> rank_from_index(int index) noexcept {
  if (index < 0 || index >= static_cast<int>(NUM_RANKS)) {
    return std::nullopt;
  }
  return static_cast<Rank>(index);
}

// 'a'..'h' (either case).
constexpr std::optional<File> file_from_char(char c) noexcept {
  if (c >= 'a' && c <= 'h') {
    return static_cast<File>(c - 'a');
  }
  if (c >= 'A' && c <= 'H') {
    return static_cast<File>(c - 'A');
  }
  return std::nullopt;
}

constexpr std::optional<Rank> rank_from_char(char c) noexcept {
  if (c < '1' || c > '8') {
    return std::nullopt;
  }
  return static_cast<Rank>(c - '1');
}

constexpr char to_char(File f) noexcept {
  return static_cast<char>('a' + to_index(f));
}

constexpr char to_char(Rank r) noexcept {
  return static_cast<char>('1' + to_index(r));
}

inline std::ostream& operator<<(std::ostream& os, File f) {
  return os << to_char(f);
}

inline std::ostream& operator<<(std::ostream& os, Rank r) {
  return os << to_char(r);
}

class Cell {
public:
  // Named cells for convenience.
  static const Cell A1;
  static const Cell B1;
  static const Cell C1;
  static const Cell D1;
  static const Cell E1;
  static const Cell F1;
  static const Cell G1;
  static const Cell H1;

  static const Cell A2;
  static const Cell B2;
  static const Cell C2;
  static const Cell D2;
  static const Cell E2;
  static const Cell F2;
  static const Cell G2;
  static const Cell H2;

  static const Cell A3;
  static const Cell B3;
  static const Cell C3;
  static const Cell D3;
  static const Cell E3;
  static const Cell F3;
  static const Cell G3;
  static const Cell H3;

  static const Cell A4;
  static const Cell B4;
  static const Cell C4;
  static const Cell D4;
  static const Cell E4;
  static const Cell F4;
  static const Cell G4;
  static const Cell H4;

  static const Cell A5;
  static const Cell B5;
  static const Cell C5;
  static const Cell D5;
  static const Cell E5;
  static const Cell F5;
  static const Cell G5;
  static const Cell H5;

  static const Cell A6;
  static const Cell B6;
  static const Cell C6;
  static const Cell D6;
  static const Cell E6;
  static const Cell F6;
  static const Cell G6;
  static const Cell H6;

  static const Cell A7;
  static const Cell B7;
  static const Cell C7;
  static const Cell D7;
  static const Cell E7;
  static const Cell F7;
  static const Cell G7;
  static const Cell H7;

  static const Cell A8;
  static const Cell B8;
  static const Cell C8;
  static const Cell D8;
  static const Cell E8;
  static const Cell F8;
  static const Cell G8;
  static const Cell H8;

  constexpr Cell() noexcept : index_(0) {}

  [[nodiscard]] static constexpr Cell from_file_and_rank(File f, Rank r) noexcept {
    return Cell(static_cast<std::uint8_t>((to_index(r) << 3) | to_index(f)));
  }

  /// Returns std::nullopt for indexes outside [0, 63].
  [[nodiscard]] static constexpr std::optional<Cell> from_index(int index) noexcept {
    if (index < 0 || index >= static_cast<int>(NUM_CELLS)) {
      return std::nullopt;
    }
    return Cell(static_cast<std::uint8_t>(index));
  }

  [[nodiscard]] constexpr std::uint8_t index() const noexcept { return index_; }

  /// Returns a 64-bit mask with only this cell's bit set.
  [[nodiscard]] constexpr std::uint64_t to_mask() const noexcept {
    return std::uint64_t{1} << index_;
  }

  [[nodiscard]] std::string to_string() const {
    const char file_char = static_cast<char>('a' + (index_ & 7u));
    const char rank_char = static_cast<char>('1' + (index_ >> 3));
    return std::string{file_char, rank_char};
  }

  /// Parses algebraic notation such as "e4". Returns std::nullopt on anything
  /// else; see parse_cell() for the throwing variant.
  [[nodiscard]] static std::optional<Cell> parse(std::string_view algebraic) noexcept {
    if (algebraic.size() != 2) {
      return std::nullopt;
    }

    const auto f = file_from_char(algebraic[0]);
    const auto r = rank_from_char(algebraic[1]);
    if (!f.has_value() || !r.has_value()) {
      return std::nullopt;
    }

    return from_file_and_rank(*f, *r);
  }

  friend constexpr bool operator==(Cell lhs, Cell rhs) noexcept {
    return lhs.index_ == rhs.index_;
  }
  friend constexpr bool operator!=(Cell lhs, Cell rhs) noexcept { return !(lhs == rhs); }

private:
  explicit constexpr Cell(std::uint8_t index) noexcept : index_(index) {}

  std::uint8_t index_;
};

inline std::ostream& operator<<(std::ostream& os, Cell cell) {
  return os << cell.to_string();
}

// -----------------------------------------------------------------------------
// Projections
// -----------------------------------------------------------------------------

constexpr File file(Cell cell) noexcept {
  return static_cast<File>(cell.index() & 7u);
}

constexpr Rank rank(Cell cell) noexcept {
  return static_cast<Rank>(cell.index() >> 3);
}

constexpr Cell to_cell(File f, Rank r) noexcept {
  return Cell::from_file_and_rank(f, r);
}

constexpr Diagonal diagonal(Cell cell) noexcept {
  return static_cast<Diagonal>(to_index(file(cell)) + 7 - to_index(rank(cell)));
}

constexpr AntiDiagonal anti_diagonal(Cell cell) noexcept {
  return static_cast<AntiDiagonal>(to_index(file(cell)) + to_index(rank(cell)));
}

// -----------------------------------------------------------------------------
// Adjacent files and ranks
// -----------------------------------------------------------------------------

constexpr std::optional<File> west(File f) noexcept {
  return file_from_index(to_index(f) - 1);
}

constexpr std::optional<File> east(File f) noexcept {
  return file_from_index(to_index(f) + 1);
}

constexpr std::optional<Rank> north(Rank r) noexcept {
  return rank_from_index(to_index(r) + 1);
}

constexpr std::optional<Rank> south(Rank r) noexcept {
  return rank_from_index(to_index(r) - 1);
}

// Throwing variants: Error{InvalidOperationOnFile} / Error{InvalidOperationOnRank}
// when the step would leave the board.
File step_west(File f);
File step_east(File f);
Rank step_north(Rank r);
Rank step_south(Rank r);

// -----------------------------------------------------------------------------
// Neighbour cells
// -----------------------------------------------------------------------------

/// Returns the cell reached by moving delta_rank ranks (positive towards rank 8)
/// and delta_file files (positive towards file H), or std::nullopt if either
/// coordinate falls outside the board.
constexpr std::optional<Cell> calc_cell_after_steps(Cell cell, int delta_rank,
                                                    int delta_file) noexcept {
  const auto f = file_from_index(to_index(file(cell)) + delta_file);
  const auto r = rank_from_index(to_index(rank(cell)) + delta_rank);
  if (!f.has_value() || !r.has_value()) {
    return std::nullopt;
  }
  return to_cell(*f, *r);
}

constexpr std::optional<Cell> n(Cell cell) noexcept {
  return calc_cell_after_steps(cell, 1, 0);
}
constexpr std::optional<Cell> s(Cell cell) noexcept {
  return calc_cell_after_steps(cell, -1, 0);
}
constexpr std::optional<Cell> e(Cell cell) noexcept {
  return calc_cell_after_steps(cell, 0, 1);
}
constexpr std::optional<Cell> w(Cell cell) noexcept {
  return calc_cell_after_steps(cell, 0, -1);
}
constexpr std::optional<Cell> ne(Cell cell) noexcept {
  return calc_cell_after_steps(cell, 1, 1);
}
constexpr std::optional<Cell> nw(Cell cell) noexcept {
  return calc_cell_after_steps(cell, 1, -1);
}
constexpr std::optional<Cell> se(Cell cell) noexcept {
  return calc_cell_after_steps(cell, -1, 1);
}
constexpr std::optional<Cell> sw(Cell cell) noexcept {
  return calc_cell_after_steps(cell, -1, -1);
}

// -----------------------------------------------------------------------------
// Throwing text conversions (Error{IllegalConversionTo...})
// -----------------------------------------------------------------------------

File parse_file(std::string_view text);
Rank parse_rank(std::string_view text);
Cell parse_cell(std::string_view text);

} // namespace abbadingo

// Inline definitions of named cells (indices 0..63).
inline constexpr abbadingo::Cell abbadingo::Cell::A1{0};
inline constexpr abbadingo::Cell abbadingo::Cell::B1{1};
inline constexpr abbadingo::Cell abbadingo::Cell::C1{2};
inline constexpr abbadingo::Cell abbadingo::Cell::D1{3};
inline constexpr abbadingo::Cell abbadingo::Cell::E1{4};
inline constexpr abbadingo::Cell abbadingo::Cell::F1{5};
inline constexpr abbadingo::Cell abbadingo::Cell::G1{6};
inline constexpr abbadingo::Cell abbadingo::Cell::H1{7};

inline constexpr abbadingo::Cell abbadingo::Cell::A2{8};
inline constexpr abbadingo::Cell abbadingo::Cell::B2{9};
inline constexpr abbadingo::Cell abbadingo::Cell::C2{10};
inline constexpr abbadingo::Cell abbadingo::Cell::D2{11};
inline constexpr abbadingo::Cell abbadingo::Cell::E2{12};
inline constexpr abbadingo::Cell abbadingo::Cell::F2{13};
inline constexpr abbadingo::Cell abbadingo::Cell::G2{14};
inline constexpr abbadingo::Cell abbadingo::Cell::H2{15};

inline constexpr abbadingo::Cell abbadingo::Cell::A3{16};
inline constexpr abbadingo::Cell abbadingo::Cell::B3{17};
inline constexpr abbadingo::Cell abbadingo::Cell::C3{18};
inline constexpr abbadingo::Cell abbadingo::Cell::D3{19};
inline constexpr abbadingo::Cell abbadingo::Cell::E3{20};
inline constexpr abbadingo::Cell abbadingo::Cell::F3{21};
inline constexpr abbadingo::Cell abbadingo::Cell::G3{22};
inline constexpr abbadingo::Cell abbadingo::Cell::H3{23};

inline constexpr abbadingo::Cell abbadingo::Cell::A4{24};
inline constexpr abbadingo::Cell abbadingo::Cell::B4{25};
inline constexpr abbadingo::Cell abbadingo::Cell::C4{26};
inline constexpr abbadingo::Cell abbadingo::Cell::D4{27};
inline constexpr abbadingo::Cell abbadingo::Cell::E4{28};
inline constexpr abbadingo::Cell abbadingo::Cell::F4{29};
inline constexpr abbadingo::Cell abbadingo::Cell::G4{30};
inline constexpr abbadingo::Cell abbadingo::Cell::H4{31};

inline constexpr abbadingo::Cell abbadingo::Cell::A5{32};
inline constexpr abbadingo::Cell abbadingo::Cell::B5{33};
inline constexpr abbadingo::Cell abbadingo::Cell::C5{34};
inline constexpr abbadingo::Cell abbadingo::Cell::D5{35};
inline constexpr abbadingo::Cell abbadingo::Cell::E5{36};
inline constexpr abbadingo::Cell abbadingo::Cell::F5{37};
inline constexpr abbadingo::Cell abbadingo::Cell::G5{38};
inline constexpr abbadingo::Cell abbadingo::Cell::H5{39};

inline constexpr abbadingo::Cell abbadingo::Cell::A6{40};
inline constexpr abbadingo::Cell abbadingo::Cell::B6{41};
inline constexpr abbadingo::Cell abbadingo::Cell::C6{42};
inline constexpr abbadingo::Cell abbadingo::Cell::D6{43};
inline constexpr abbadingo::Cell abbadingo::Cell::E6{44};
inline constexpr abbadingo::Cell abbadingo::Cell::F6{45};
inline constexpr abbadingo::Cell abbadingo::Cell::G6{46};
inline constexpr abbadingo::Cell abbadingo::Cell::H6{47};

inline constexpr abbadingo::Cell abbadingo::Cell::A7{48};
inline constexpr abbadingo::Cell abbadingo::Cell::B7{49};
inline constexpr abbadingo::Cell abbadingo::Cell::C7{50};
inline constexpr abbadingo::Cell abbadingo::Cell::D7{51};
inline constexpr abbadingo::Cell abbadingo::Cell::E7{52};
inline constexpr abbadingo::Cell abbadingo::Cell::F7{53};
inline constexpr abbadingo::Cell abbadingo::Cell::G7{54};
inline constexpr abbadingo::Cell abbadingo::Cell::H7{55};

inline constexpr abbadingo::Cell abbadingo::Cell::A8{56};
inline constexpr abbadingo::Cell abbadingo::Cell::B8{57};
inline constexpr abbadingo::Cell abbadingo::Cell::C8{58};
inline constexpr abbadingo::Cell abbadingo::Cell::D8{59};
inline constexpr abbadingo::Cell abbadingo::Cell::E8{60};
inline constexpr abbadingo::Cell abbadingo::Cell::F8{61};
inline constexpr abbadingo::Cell abbadingo::Cell::G8{62};
inline constexpr abbadingo::Cell abbadingo::Cell::H8{63};
