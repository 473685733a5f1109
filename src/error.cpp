#include "abbadingo/error.hpp"

namespace abbadingo {

namespace {

std::string make_message(ErrorCode code, std::string_view input) {
  std::string message{describe(code)};
  message += " '";
  message += input;
  message += "'";
  return message;
}

} // namespace

std::string_view describe(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::InvalidOperationOnFile:
    return "invalid operation on file";
  case ErrorCode::InvalidOperationOnRank:
    return "invalid operation on rank";
  case ErrorCode::IllegalConversionToFile:
    return "illegal conversion to file";
  case ErrorCode::IllegalConversionToRank:
    return "illegal conversion to rank";
  case ErrorCode::IllegalConversionToCell:
    return "illegal conversion to cell";
  case ErrorCode::IllegalConversionToChessPiece:
    return "illegal conversion to chess piece";
  }
  return "unknown error";
}

Error::Error(ErrorCode code) : std::runtime_error(std::string{describe(code)}), code_{code} {}

Error::Error(ErrorCode code, std::string_view input)
    : std::runtime_error(make_message(code, input)), code_{code} {}

} // namespace abbadingo
