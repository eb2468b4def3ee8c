#include <unity.h>

#include <cstdint>

#include "util/RNG.h"
#include "util/Smoother.h"

void test_xorshift_escapes_zero_state() {
  std::uint32_t state = 0;
  const std::uint32_t first = RNG::xorshift(state);
  TEST_ASSERT_NOT_EQUAL(0u, first);
  TEST_ASSERT_EQUAL_UINT32(first, state);
  TEST_ASSERT_NOT_EQUAL(first, RNG::xorshift(state));
}

void test_uniform01_stays_in_unit_interval() {
  std::uint32_t state = 0x5EEDu;
  for (int i = 0; i < 10000; ++i) {
    const float v = RNG::uniform01(state);
    TEST_ASSERT_TRUE(v >= 0.f);
    TEST_ASSERT_TRUE(v < 1.f);
  }
}

void test_mix_depends_on_both_words() {
  TEST_ASSERT_NOT_EQUAL(RNG::mix(1u, 2u), RNG::mix(1u, 3u));
  TEST_ASSERT_NOT_EQUAL(RNG::mix(1u, 2u), RNG::mix(4u, 2u));
  TEST_ASSERT_EQUAL_UINT32(RNG::mix(9u, 9u), RNG::mix(9u, 9u));
}

void test_smoother_and_peak_hold() {
  float z = 0.f;
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.3f, smooth(1.f, z, 0.3f));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.51f, smooth(1.f, z, 0.3f));

  float peak = 0.f;
  TEST_ASSERT_EQUAL_FLOAT(0.8f, peakHold(0.8f, peak, 0.5f));
  TEST_ASSERT_EQUAL_FLOAT(0.4f, peakHold(0.1f, peak, 0.5f));
  TEST_ASSERT_EQUAL_FLOAT(0.9f, peakHold(0.9f, peak, 0.5f));
}
