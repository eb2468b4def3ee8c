#include <unity.h>

#include "util/Log.h"

void test_builder_copies_controls_and_audio_verbatim();
void test_builder_clamps_selection_indices();
void test_builder_delta_time_is_never_negative();
void test_builder_is_idempotent_without_reset();
void test_builder_reset_replaces_seed_exactly_once();
void test_clock_mixed_seed_source_never_repeats_previous();
void test_builder_tolerates_negative_and_nan_time();
void test_builder_is_deterministic_across_instances();
void test_glitch_hold_window_is_half_open();
void test_glitch_zero_hold_never_glitches();
void test_glitch_does_not_retrigger_while_holding();
void test_glitch_update_consults_policy_only_when_idle();
void test_glitch_reset_returns_to_idle();
void test_glitch_clock_step_back_rearms_policy();
void test_glitch_amount_zero_never_fires();
void test_glitch_policy_probability_is_monotonic();
void test_glitch_policy_replays_for_same_seed();
void test_palette_starts_empty();
void test_palette_rejects_more_than_six_and_keeps_previous();
void test_palette_zero_fills_unused_slots();
void test_palette_clear_drops_count();
void test_palette_rejects_null_colors();
void test_layout_matches_shader_offsets();
void test_pack_v1_keeps_shared_fields();
void test_pack_v2_carries_transients_and_glitch_timing();
void test_active_layout_matches_build_flag();
void test_audio_silence_reports_zero();
void test_audio_band_level_is_scaled_mean();
void test_audio_bands_track_their_range();
void test_audio_smoothing_and_peak_follow();

namespace {
void silentSink(flicker::log::Level, const char *, const char *, void *) {}
}  // namespace

void setUp() { flicker::log::setSink(&silentSink); }
void tearDown() { flicker::log::resetSink(); }

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_builder_copies_controls_and_audio_verbatim);
  RUN_TEST(test_builder_clamps_selection_indices);
  RUN_TEST(test_builder_delta_time_is_never_negative);
  RUN_TEST(test_builder_is_idempotent_without_reset);
  RUN_TEST(test_builder_reset_replaces_seed_exactly_once);
  RUN_TEST(test_clock_mixed_seed_source_never_repeats_previous);
  RUN_TEST(test_builder_tolerates_negative_and_nan_time);
  RUN_TEST(test_builder_is_deterministic_across_instances);
  RUN_TEST(test_glitch_hold_window_is_half_open);
  RUN_TEST(test_glitch_zero_hold_never_glitches);
  RUN_TEST(test_glitch_does_not_retrigger_while_holding);
  RUN_TEST(test_glitch_update_consults_policy_only_when_idle);
  RUN_TEST(test_glitch_reset_returns_to_idle);
  RUN_TEST(test_glitch_clock_step_back_rearms_policy);
  RUN_TEST(test_glitch_amount_zero_never_fires);
  RUN_TEST(test_glitch_policy_probability_is_monotonic);
  RUN_TEST(test_glitch_policy_replays_for_same_seed);
  RUN_TEST(test_palette_starts_empty);
  RUN_TEST(test_palette_rejects_more_than_six_and_keeps_previous);
  RUN_TEST(test_palette_zero_fills_unused_slots);
  RUN_TEST(test_palette_clear_drops_count);
  RUN_TEST(test_palette_rejects_null_colors);
  RUN_TEST(test_layout_matches_shader_offsets);
  RUN_TEST(test_pack_v1_keeps_shared_fields);
  RUN_TEST(test_pack_v2_carries_transients_and_glitch_timing);
  RUN_TEST(test_active_layout_matches_build_flag);
  RUN_TEST(test_audio_silence_reports_zero);
  RUN_TEST(test_audio_band_level_is_scaled_mean);
  RUN_TEST(test_audio_bands_track_their_range);
  RUN_TEST(test_audio_smoothing_and_peak_follow);
  return UNITY_END();
}
