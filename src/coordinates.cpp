#include "abbadingo/coordinates.hpp"

#include "abbadingo/error.hpp"

namespace abbadingo {

File step_west(File f) {
  const auto result = west(f);
  if (!result.has_value()) {
    throw Error(ErrorCode::InvalidOperationOnFile, std::string(1, to_char(f)));
  }
  return *result;
}

File step_east(File f) {
  const auto result = east(f);
  if (!result.has_value()) {
    throw Error(ErrorCode::InvalidOperationOnFile, std::string(1, to_char(f)));
  }
  return *result;
}

Rank step_north(Rank r) {
  const auto result = north(r);
  if (!result.has_value()) {
    throw Error(ErrorCode::InvalidOperationOnRank, std::string(1, to_char(r)));
  }
  return *result;
}

Rank step_south(Rank r) {
  const auto result = south(r);
  if (!result.has_value()) {
    throw Error(ErrorCode::InvalidOperationOnRank, std::string(1, to_char(r)));
  }
  return *result;
}

File parse_file(std::string_view text) {
  if (text.size() == 1) {
    if (const auto f = file_from_char(text.front())) {
      return *f;
    }
  }
  throw Error(ErrorCode::IllegalConversionToFile, text);
}

Rank parse_rank(std::string_view text) {
  if (text.size() == 1) {
    if (const auto r = rank_from_char(text.front())) {
      return *r;
    }
  }
  throw Error(ErrorCode::IllegalConversionToRank, text);
}

Cell parse_cell(std::string_view text) {
  const auto cell = Cell::parse(text);
  if (!cell.has_value()) {
    throw Error(ErrorCode::IllegalConversionToCell, text);
  }
  return *cell;
}

} // namespace abbadingo
