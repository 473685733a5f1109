#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace abbadingo {

enum class ErrorCode : std::uint8_t {
  // A step towards the west of file A or the east of file H was requested.
  InvalidOperationOnFile,
  // A step towards the south of rank 1 or the north of rank 8 was requested.
  InvalidOperationOnRank,
  IllegalConversionToFile,
  IllegalConversionToRank,
  IllegalConversionToCell,
  IllegalConversionToChessPiece,
};

[[nodiscard]] std::string_view describe(ErrorCode code) noexcept;

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  return os << describe(code);
}

/// Raised by the throwing conversions and checked steps. Board queries never
/// throw: geometric impossibility is reported as an empty std::optional and a
/// missing piece as an empty BitBoard.
class Error : public std::runtime_error {
public:
  explicit Error(ErrorCode code);
  Error(ErrorCode code, std::string_view input);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace abbadingo
