#pragma once

// =============================================================================
// BITBOARDS: One Bit per Cell
// =============================================================================
//
// A BitBoard is a 64-bit word where each bit represents one cell of the board:
//
//   - Bit 0 = cell A1, bit 7 = cell H1, bit 63 = cell H8
//   - A "1" bit means the cell is active (occupied, controlled, marked...)
//   - A "0" bit means it is not
//
// What "active" means is up to the user: the same type holds the cells where
// the white knights stand, the cells they control, or the cells a single
// knight may move to. Set algebra on whole boards is then one CPU instruction:
//
//   controlled | occupied          -> union
//   own_pieces & enemy_control     -> own pieces under attack
//   (moves | own) ^ own            -> moves without the cells of own pieces
//
// The masks for files, ranks, diagonals and anti-diagonals are computed at
// compile time from the coordinate formulas in coordinates.hpp and never
// change afterwards, so they can be read from any thread without locking.
//
// =============================================================================

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <span>
#include <string>

#include "abbadingo/coordinates.hpp"

namespace abbadingo {

using BitBoardState = std::uint64_t;

inline constexpr BitBoardState EMPTY_STATE = 0;

namespace detail {

constexpr std::array<BitBoardState, NUM_FILES> make_file_masks() {
  std::array<BitBoardState, NUM_FILES> masks{};
  for (std::uint8_t f = 0; f < NUM_FILES; ++f) {
    for (std::uint8_t r = 0; r < NUM_RANKS; ++r) {
      masks[f] |= to_cell(static_cast<File>(f), static_cast<Rank>(r)).to_mask();
    }
  }
  return masks;
}

constexpr std::array<BitBoardState, NUM_RANKS> make_rank_masks() {
  std::array<BitBoardState, NUM_RANKS> masks{};
  for (std::uint8_t f = 0; f < NUM_FILES; ++f) {
    for (std::uint8_t r = 0; r < NUM_RANKS; ++r) {
      masks[r] |= to_cell(static_cast<File>(f), static_cast<Rank>(r)).to_mask();
    }
  }
  return masks;
}

constexpr std::array<BitBoardState, NUM_DIAGONALS> make_diagonal_masks() {
  std::array<BitBoardState, NUM_DIAGONALS> masks{};
  for (std::uint8_t f = 0; f < NUM_FILES; ++f) {
    for (std::uint8_t r = 0; r < NUM_RANKS; ++r) {
      const Cell cell = to_cell(static_cast<File>(f), static_cast<Rank>(r));
      masks[to_index(diagonal(cell))] |= cell.to_mask();
    }
  }
  return masks;
}

constexpr std::array<BitBoardState, NUM_ANTI_DIAGONALS> make_anti_diagonal_masks() {
  std::array<BitBoardState, NUM_ANTI_DIAGONALS> masks{};
  for (std::uint8_t f = 0; f < NUM_FILES; ++f) {
    for (std::uint8_t r = 0; r < NUM_RANKS; ++r) {
      const Cell cell = to_cell(static_cast<File>(f), static_cast<Rank>(r));
      masks[to_index(anti_diagonal(cell))] |= cell.to_mask();
    }
  }
  return masks;
}

// The 3x3 block around each cell, without the cell itself. Built from the
// edge-checked directional steps, so A-file cells never reach the H-file.
constexpr std::array<BitBoardState, NUM_CELLS> make_neighbour_masks() {
  std::array<BitBoardState, NUM_CELLS> masks{};
  for (int index = 0; index < static_cast<int>(NUM_CELLS); ++index) {
    const Cell cell = *Cell::from_index(index);
    for (const auto neighbour : {n(cell), ne(cell), e(cell), se(cell), s(cell), sw(cell), w(cell),
                                 nw(cell)}) {
      if (neighbour.has_value()) {
        masks[cell.index()] |= neighbour->to_mask();
      }
    }
  }
  return masks;
}

} // namespace detail

// File masks: vertical columns A through H.
inline constexpr auto FILE_MASKS = detail::make_file_masks();

// Rank masks: horizontal rows 1 through 8.
inline constexpr auto RANK_MASKS = detail::make_rank_masks();

inline constexpr auto DIAGONAL_MASKS = detail::make_diagonal_masks();
inline constexpr auto ANTI_DIAGONAL_MASKS = detail::make_anti_diagonal_masks();
inline constexpr auto NEIGHBOUR_MASKS = detail::make_neighbour_masks();

static_assert(FILE_MASKS[0] == 0x0101'0101'0101'0101ull);
static_assert(RANK_MASKS[0] == 0x0000'0000'0000'00FFull);
static_assert(DIAGONAL_MASKS[to_index(Diagonal::A1H8)] == 0x8040'2010'0804'0201ull);
static_assert(ANTI_DIAGONAL_MASKS[to_index(AntiDiagonal::A8H1)] == 0x0102'0408'1020'4080ull);

class BitBoard {
public:
  constexpr BitBoard() noexcept = default;

  explicit constexpr BitBoard(BitBoardState state) noexcept : state_{state} {}

  constexpr BitBoard(std::initializer_list<Cell> cells) noexcept { set_cells(cells); }

  [[nodiscard]] static constexpr BitBoard from_cells(std::span<const Cell> cells) noexcept {
    BitBoard bitboard;
    bitboard.set_cells(cells);
    return bitboard;
  }

  [[nodiscard]] constexpr BitBoardState state() const noexcept { return state_; }

  [[nodiscard]] constexpr bool is_empty() const noexcept { return state_ == EMPTY_STATE; }

  constexpr void set_cell(Cell cell) noexcept { state_ |= cell.to_mask(); }
  constexpr void reset_cell(Cell cell) noexcept { state_ &= ~cell.to_mask(); }

  constexpr void set_cell_from_file_and_rank(File f, Rank r) noexcept { set_cell(to_cell(f, r)); }

  constexpr void set_rank(Rank r) noexcept { state_ |= RANK_MASKS[to_index(r)]; }
  constexpr void reset_rank(Rank r) noexcept { state_ &= ~RANK_MASKS[to_index(r)]; }

  constexpr void set_file(File f) noexcept { state_ |= FILE_MASKS[to_index(f)]; }
  constexpr void reset_file(File f) noexcept { state_ &= ~FILE_MASKS[to_index(f)]; }

  constexpr void set_diagonal(Diagonal d) noexcept { state_ |= DIAGONAL_MASKS[to_index(d)]; }
  constexpr void reset_diagonal(Diagonal d) noexcept { state_ &= ~DIAGONAL_MASKS[to_index(d)]; }

  constexpr void set_anti_diagonal(AntiDiagonal d) noexcept {
    state_ |= ANTI_DIAGONAL_MASKS[to_index(d)];
  }
  constexpr void reset_anti_diagonal(AntiDiagonal d) noexcept {
    state_ &= ~ANTI_DIAGONAL_MASKS[to_index(d)];
  }

  constexpr void set_cells(std::initializer_list<Cell> cells) noexcept {
    for (const auto cell : cells) {
      set_cell(cell);
    }
  }
  constexpr void set_cells(std::span<const Cell> cells) noexcept {
    for (const auto cell : cells) {
      set_cell(cell);
    }
  }

  constexpr void reset_cells(std::initializer_list<Cell> cells) noexcept {
    for (const auto cell : cells) {
      reset_cell(cell);
    }
  }
  constexpr void reset_cells(std::span<const Cell> cells) noexcept {
    for (const auto cell : cells) {
      reset_cell(cell);
    }
  }

  [[nodiscard]] constexpr bool cell_is_active(Cell cell) const noexcept {
    return (state_ & cell.to_mask()) != 0;
  }

  // Maps to a single POPCNT instruction where the CPU has one.
  [[nodiscard]] constexpr std::size_t pop_count() const noexcept {
    return static_cast<std::size_t>(std::popcount(state_));
  }

  constexpr void clear() noexcept { state_ = EMPTY_STATE; }

  /// Returns the active cell if it is the only one. Empty boards and boards
  /// with two or more active cells give std::nullopt.
  [[nodiscard]] constexpr std::optional<Cell> active_cell() const noexcept {
    if (!std::has_single_bit(state_)) {
      return std::nullopt;
    }
    return first_active_cell();
  }

  /// Returns the active cell with the lowest index.
  /// Precondition: !is_empty().
  [[nodiscard]] constexpr Cell first_active_cell() const noexcept {
    return *Cell::from_index(std::countr_zero(state_));
  }

  /// Removes and returns the active cell with the lowest index.
  /// Precondition: !is_empty().
  [[nodiscard]] constexpr Cell pop_first_active_cell() noexcept {
    const Cell cell = first_active_cell();
    state_ &= state_ - 1;
    return cell;
  }

  constexpr BitBoard& operator|=(BitBoard other) noexcept {
    state_ |= other.state_;
    return *this;
  }
  constexpr BitBoard& operator&=(BitBoard other) noexcept {
    state_ &= other.state_;
    return *this;
  }
  constexpr BitBoard& operator^=(BitBoard other) noexcept {
    state_ ^= other.state_;
    return *this;
  }

  friend constexpr BitBoard operator|(BitBoard lhs, BitBoard rhs) noexcept { return lhs |= rhs; }
  friend constexpr BitBoard operator&(BitBoard lhs, BitBoard rhs) noexcept { return lhs &= rhs; }
  friend constexpr BitBoard operator^(BitBoard lhs, BitBoard rhs) noexcept { return lhs ^= rhs; }

  friend constexpr bool operator==(BitBoard lhs, BitBoard rhs) noexcept = default;

  [[nodiscard]] std::string to_string() const;

private:
  BitBoardState state_{EMPTY_STATE};
};

/// The cells around the given one (at most eight, three in a corner).
[[nodiscard]] constexpr BitBoard neighbours(Cell cell) noexcept {
  return BitBoard(NEIGHBOUR_MASKS[cell.index()]);
}

// Prints the active cells, e.g. "{a1, e4, h8}".
std::ostream& operator<<(std::ostream& os, BitBoard bitboard);

} // namespace abbadingo
