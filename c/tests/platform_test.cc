// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <vector>

#include "gtest/gtest.h"
#include "../common/platform.h"

namespace safepix {

TEST(PlatformTest, BigEndianHelpers) {
  const uint8_t data[] = {0x12, 0x34, 0x56, 0x78};
  EXPECT_EQ(0x1234u, SAFEPIX_LOAD16BE(data));
  EXPECT_EQ(0x12345678u, SAFEPIX_LOAD32BE(data));
  uint8_t out[4];
  SAFEPIX_STORE32BE(out, 0xCAFEBABEu);
  EXPECT_EQ(0xCAFEBABEu, SAFEPIX_LOAD32BE(out));
}

TEST(PlatformTest, CheckPassesOnTrue) {
  int evaluated = 0;
  SAFEPIX_CHECK(++evaluated == 1);
  EXPECT_EQ(1, evaluated);
}

TEST(PlatformDeathTest, CheckFailureNamesCondition) {
  const int pages = 3;
  EXPECT_DEATH(SAFEPIX_CHECK(pages == 4), "check failed: pages == 4");
}

}  // namespace safepix
