#include <unity.h>

void test_exchange_returns_initial_until_publish();
void test_exchange_reader_sees_latest_publish();
void test_exchange_unpublished_writes_stay_private();
void test_exchange_never_tears_across_threads();
void test_log_routes_formatted_messages_to_sink();
void test_log_truncates_long_messages();
void test_log_level_labels();
void test_xorshift_escapes_zero_state();
void test_uniform01_stays_in_unit_interval();
void test_mix_depends_on_both_words();
void test_smoother_and_peak_hold();

void setUp() {}
void tearDown() {}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_exchange_returns_initial_until_publish);
  RUN_TEST(test_exchange_reader_sees_latest_publish);
  RUN_TEST(test_exchange_unpublished_writes_stay_private);
  RUN_TEST(test_exchange_never_tears_across_threads);
  RUN_TEST(test_log_routes_formatted_messages_to_sink);
  RUN_TEST(test_log_truncates_long_messages);
  RUN_TEST(test_log_level_labels);
  RUN_TEST(test_xorshift_escapes_zero_state);
  RUN_TEST(test_uniform01_stays_in_unit_interval);
  RUN_TEST(test_mix_depends_on_both_words);
  RUN_TEST(test_smoother_and_peak_hold);
  return UNITY_END();
}
