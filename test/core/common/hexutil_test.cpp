/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace qbridge::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_Hex) {
  Buffer bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length in mixed case
 * @when unhex
 * @then result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020fF"));
  ASSERT_EQ(actual, (Buffer{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff}));
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then NOT_ENOUGH_INPUT is returned
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then NON_HEX_INPUT is returned
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given Hexencoded string with and without 0x prefix
 * @when unhexWith0x
 * @then only the prefixed one is decoded
 */
TEST(Common, Hexutil_UnhexWith0x) {
  EXPECT_OUTCOME_TRUE(actual, unhexWith0x("0x0aff"));
  ASSERT_EQ(actual, (Buffer{0x0a, 0xff}));
  EXPECT_EC(unhexWith0x("0aff"), UnhexError::MISSING_0X_PREFIX);
}
