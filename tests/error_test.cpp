#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "abbadingo/error.hpp"

using namespace abbadingo;

TEST(Error, MessageFromCodeAlone) {
  const Error error(ErrorCode::InvalidOperationOnRank);
  EXPECT_EQ(error.code(), ErrorCode::InvalidOperationOnRank);
  EXPECT_STREQ(error.what(), "invalid operation on rank");
}

TEST(Error, MessageQuotesOffendingInput) {
  const Error error(ErrorCode::IllegalConversionToFile, "q");
  EXPECT_EQ(error.code(), ErrorCode::IllegalConversionToFile);
  EXPECT_STREQ(error.what(), "illegal conversion to file 'q'");
}

TEST(Error, CaughtAsRuntimeError) {
  try {
    throw Error(ErrorCode::IllegalConversionToChessPiece, "P");
  } catch (const std::runtime_error& error) {
    EXPECT_STREQ(error.what(), "illegal conversion to chess piece 'P'");
  }
}

TEST(Error, EveryCodeHasADescription) {
  for (const auto code :
       {ErrorCode::InvalidOperationOnFile, ErrorCode::InvalidOperationOnRank,
        ErrorCode::IllegalConversionToFile, ErrorCode::IllegalConversionToRank,
        ErrorCode::IllegalConversionToCell, ErrorCode::IllegalConversionToChessPiece}) {
    EXPECT_FALSE(describe(code).empty());
    EXPECT_NE(describe(code), "unknown error");
  }

  std::ostringstream oss;
  oss << ErrorCode::IllegalConversionToCell;
  EXPECT_EQ(oss.str(), "illegal conversion to cell");
}
