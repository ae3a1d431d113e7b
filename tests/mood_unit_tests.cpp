#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "core/config.hpp"
#include "model/emotion.hpp"
#include "model/metric_sample.hpp"
#include "model/thresholds.hpp"
#include "mood/emotion_classifier.hpp"
#include "mood/metric_gate.hpp"
#include "mood/state_tracker.hpp"
#include "mood/stress_trend.hpp"

using tuxmood::core::ConfigError;
using tuxmood::core::validate_thresholds;
using tuxmood::model::emotion_state;
using tuxmood::model::field_bit;
using tuxmood::model::focus_mode;
using tuxmood::model::metric_field;
using tuxmood::model::metric_sample;
using tuxmood::model::raw_metrics;
using tuxmood::model::threshold_config;
using tuxmood::mood::EmotionClassifier;
using tuxmood::mood::MetricGate;
using tuxmood::mood::StateTracker;
using tuxmood::mood::StressTrend;

namespace {

bool almost_equal(float a, float b, float epsilon = 1e-4F) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

metric_sample make_sample(const float cpu, const float ram, const float net, const bool degraded = false) {
  metric_sample sample{};
  sample.cpu_pct = cpu;
  sample.ram_pct = ram;
  sample.net_kbps = net;
  sample.timestamp_ns = 0;
  sample.substituted = 0;
  sample.degraded = degraded;
  return sample;
}

int test_literal_scenarios() {
  const threshold_config thresholds{};
  const EmotionClassifier classifier(thresholds);

  struct Scenario {
    float cpu;
    float ram;
    float net;
    emotion_state expected;
  };
  const Scenario scenarios[] = {
      {15.0F, 25.0F, 10.0F, emotion_state::CALM},
      {45.0F, 50.0F, 200.0F, emotion_state::ACTIVE},
      {75.0F, 30.0F, 50.0F, emotion_state::BUSY},
      {80.0F, 80.0F, 600.0F, emotion_state::STRESSED},
      {95.0F, 40.0F, 100.0F, emotion_state::OVERLOADED},
  };

  for (const auto& scenario : scenarios) {
    const auto result = classifier.classify(make_sample(scenario.cpu, scenario.ram, scenario.net));
    if (result.state != scenario.expected) {
      std::cerr << "  cpu=" << scenario.cpu << " ram=" << scenario.ram << " net=" << scenario.net
                << " got=" << tuxmood::model::to_string(result.state) << '\n';
      return fail("test_literal_scenarios", "unexpected classification");
    }
  }

  if (!almost_equal(classifier.classify(make_sample(15.0F, 25.0F, 10.0F)).stress_score, 0.0F)) {
    return fail("test_literal_scenarios", "calm scenario should have zero stress");
  }

  // (95 - 20) / (90 - 20) saturates at 100.
  if (!almost_equal(classifier.classify(make_sample(95.0F, 40.0F, 100.0F)).stress_score, 100.0F)) {
    return fail("test_literal_scenarios", "overloaded cpu should saturate stress score");
  }

  // (75 - 20) / 70 = 0.7857
  if (!almost_equal(classifier.classify(make_sample(75.0F, 30.0F, 50.0F)).stress_score, 78.5714F, 1e-2F)) {
    return fail("test_literal_scenarios", "busy stress score should follow the worst metric");
  }

  return 0;
}

int test_classification_is_monotonic_per_metric() {
  const threshold_config thresholds{};

  std::size_t previous_state = 0;
  float previous_score = -1.0F;
  for (int cpu = 0; cpu <= 150; cpu += 5) {
    const auto result = tuxmood::mood::classify(make_sample(static_cast<float>(cpu), 40.0F, 100.0F), thresholds);
    if (result.stress_score < 0.0F || result.stress_score > 100.0F) {
      return fail("test_classification_is_monotonic_per_metric", "cpu sweep score out of range");
    }
    if (tuxmood::model::index_of(result.state) < previous_state || result.stress_score < previous_score) {
      return fail("test_classification_is_monotonic_per_metric", "raising cpu lowered severity");
    }
    previous_state = tuxmood::model::index_of(result.state);
    previous_score = result.stress_score;
  }

  previous_state = 0;
  previous_score = -1.0F;
  for (int ram = 0; ram <= 150; ram += 5) {
    const auto result = tuxmood::mood::classify(make_sample(30.0F, static_cast<float>(ram), 100.0F), thresholds);
    if (result.stress_score < 0.0F || result.stress_score > 100.0F) {
      return fail("test_classification_is_monotonic_per_metric", "ram sweep score out of range");
    }
    if (tuxmood::model::index_of(result.state) < previous_state || result.stress_score < previous_score) {
      return fail("test_classification_is_monotonic_per_metric", "raising ram lowered severity");
    }
    previous_state = tuxmood::model::index_of(result.state);
    previous_score = result.stress_score;
  }

  previous_state = 0;
  previous_score = -1.0F;
  for (int net = 0; net <= 4000; net += 100) {
    const auto result = tuxmood::mood::classify(make_sample(75.0F, 80.0F, static_cast<float>(net)), thresholds);
    if (result.stress_score < 0.0F || result.stress_score > 100.0F) {
      return fail("test_classification_is_monotonic_per_metric", "network sweep score out of range");
    }
    if (tuxmood::model::index_of(result.state) < previous_state || result.stress_score < previous_score) {
      return fail("test_classification_is_monotonic_per_metric", "raising network lowered severity");
    }
    previous_state = tuxmood::model::index_of(result.state);
    previous_score = result.stress_score;
  }

  const auto nan_result = tuxmood::mood::classify(
      make_sample(std::numeric_limits<float>::quiet_NaN(), 10.0F, 10.0F), thresholds);
  if (nan_result.state != emotion_state::CALM || !almost_equal(nan_result.stress_score, 0.0F)) {
    return fail("test_classification_is_monotonic_per_metric", "non-finite input should read as zero");
  }

  return 0;
}

int test_multiple_resources_threshold_is_configurable() {
  threshold_config thresholds{};
  thresholds.multiple_resources_threshold = 3;
  const EmotionClassifier classifier(thresholds);

  if (classifier.classify(make_sample(80.0F, 80.0F, 600.0F)).state != emotion_state::BUSY) {
    return fail("test_multiple_resources_threshold_is_configurable", "two high metrics should not stress at 3");
  }
  if (classifier.classify(make_sample(80.0F, 80.0F, 900.0F)).state != emotion_state::STRESSED) {
    return fail("test_multiple_resources_threshold_is_configurable", "three high metrics should stress at 3");
  }

  thresholds.multiple_resources_threshold = 1;
  if (classifier.classify(make_sample(75.0F, 30.0F, 50.0F)).state != emotion_state::STRESSED) {
    return fail("test_multiple_resources_threshold_is_configurable", "classifier should read updated thresholds");
  }

  return 0;
}

int test_focus_modes_use_their_own_ladder() {
  const threshold_config thresholds{};
  const EmotionClassifier classifier(thresholds);

  const auto cpu_only = classifier.classify(make_sample(10.0F, 95.0F, 3000.0F), focus_mode::CPU);
  if (cpu_only.state != emotion_state::CALM || !almost_equal(cpu_only.stress_score, 12.5F) ||
      cpu_only.stressors != 0) {
    return fail("test_focus_modes_use_their_own_ladder", "cpu mode should ignore ram and network");
  }

  struct Boundary {
    focus_mode mode;
    float value;
    emotion_state expected;
  };
  // Both ladder steps are inclusive.
  const Boundary boundaries[] = {
      {focus_mode::CPU, 29.9F, emotion_state::CALM},
      {focus_mode::CPU, 30.0F, emotion_state::BUSY},
      {focus_mode::CPU, 79.9F, emotion_state::BUSY},
      {focus_mode::CPU, 80.0F, emotion_state::STRESSED},
      {focus_mode::RAM, 39.9F, emotion_state::CALM},
      {focus_mode::RAM, 40.0F, emotion_state::BUSY},
      {focus_mode::RAM, 85.0F, emotion_state::STRESSED},
      {focus_mode::NETWORK, 99.9F, emotion_state::CALM},
      {focus_mode::NETWORK, 100.0F, emotion_state::BUSY},
      {focus_mode::NETWORK, 1000.0F, emotion_state::STRESSED},
  };
  for (const auto& boundary : boundaries) {
    const float cpu = boundary.mode == focus_mode::CPU ? boundary.value : 0.0F;
    const float ram = boundary.mode == focus_mode::RAM ? boundary.value : 0.0F;
    const float net = boundary.mode == focus_mode::NETWORK ? boundary.value : 0.0F;
    const auto result = classifier.classify(make_sample(cpu, ram, net), boundary.mode);
    if (result.state != boundary.expected) {
      std::cerr << "  mode=" << tuxmood::model::to_string(boundary.mode) << " value=" << boundary.value << '\n';
      return fail("test_focus_modes_use_their_own_ladder", "unexpected state at ladder boundary");
    }
  }

  const auto ram_top = classifier.classify(make_sample(99.0F, 100.0F, 3000.0F), focus_mode::RAM);
  if (ram_top.state != emotion_state::STRESSED || ram_top.stressors != field_bit(metric_field::RAM) ||
      !almost_equal(ram_top.stress_score, 100.0F)) {
    return fail("test_focus_modes_use_their_own_ladder", "saturated ram should be stressed at full score");
  }

  // The ladder has three steps: Active and Overloaded are never produced.
  for (const focus_mode mode : {focus_mode::CPU, focus_mode::RAM, focus_mode::NETWORK}) {
    for (float value = 0.0F; value <= 5000.0F; value += 12.5F) {
      const auto state = classifier.classify(make_sample(value, value, value), mode).state;
      if (state == emotion_state::ACTIVE || state == emotion_state::OVERLOADED) {
        return fail("test_focus_modes_use_their_own_ladder", "focus ladder should only yield calm, busy or stressed");
      }
    }
  }

  threshold_config custom{};
  custom.network_focus = {10.0F, 20.0F};
  const auto network_only = tuxmood::mood::classify(make_sample(99.0F, 99.0F, 20.0F), custom, focus_mode::NETWORK);
  if (network_only.state != emotion_state::STRESSED) {
    return fail("test_focus_modes_use_their_own_ladder", "configured focus thresholds should apply");
  }

  return 0;
}

int test_stressors_are_described() {
  const threshold_config thresholds{};
  const auto sample = make_sample(80.0F, 80.0F, 600.0F);
  const auto result = tuxmood::mood::classify(sample, thresholds);

  const std::uint8_t expected = field_bit(metric_field::CPU) | field_bit(metric_field::RAM);
  if (result.stressors != expected) {
    return fail("test_stressors_are_described", "cpu and ram should be flagged as stressors");
  }

  const std::string text = tuxmood::mood::describe_stressors(sample, result.stressors);
  if (text != "High CPU (80.0%), High RAM (80.0%)") {
    std::cerr << "  got '" << text << "'\n";
    return fail("test_stressors_are_described", "unexpected stressor description");
  }

  return 0;
}

int test_gate_substitutes_last_known_value() {
  MetricGate gate;

  raw_metrics raw{};
  raw.net_kbps = std::nullopt;
  raw.cpu_pct = 10.0F;
  raw.ram_pct = 20.0F;
  const auto cold = gate.admit(raw);
  if (!cold.degraded || !almost_equal(cold.net_kbps, 0.0F) || cold.substituted != field_bit(metric_field::NETWORK)) {
    return fail("test_gate_substitutes_last_known_value", "missing value without history should be zero");
  }

  raw.net_kbps = 100.0F;
  const auto good = gate.admit(raw);
  if (good.degraded || !almost_equal(good.net_kbps, 100.0F)) {
    return fail("test_gate_substitutes_last_known_value", "complete reading should pass through");
  }

  raw.cpu_pct = 15.0F;
  raw.ram_pct = 25.0F;
  raw.net_kbps = std::nullopt;
  const auto gap = gate.admit(raw);
  if (!gap.degraded || !almost_equal(gap.net_kbps, 100.0F)) {
    return fail("test_gate_substitutes_last_known_value", "missing network should reuse last known value");
  }
  if (gate.degraded_samples() != 2) {
    return fail("test_gate_substitutes_last_known_value", "degraded sample counter mismatch");
  }

  const threshold_config thresholds{};
  if (tuxmood::mood::classify(gap, thresholds).state != emotion_state::ACTIVE) {
    return fail("test_gate_substitutes_last_known_value", "substituted network should still classify");
  }

  raw.cpu_pct = 130.0F;
  raw.ram_pct = -5.0F;
  raw.net_kbps = std::numeric_limits<float>::infinity();
  const auto clamped = gate.admit(raw);
  if (!almost_equal(clamped.cpu_pct, 100.0F) || !almost_equal(clamped.ram_pct, 0.0F)) {
    return fail("test_gate_substitutes_last_known_value", "percentages should be clamped");
  }
  if (!almost_equal(clamped.net_kbps, 100.0F) || !clamped.degraded) {
    return fail("test_gate_substitutes_last_known_value", "non-finite network should be treated as missing");
  }

  return 0;
}

int test_stress_trend_skips_degraded_samples() {
  StressTrend trend(0.5F);

  const auto cold = trend.sample(make_sample(0.0F, 0.0F, 0.0F, true), 70.0F);
  if (!almost_equal(cold, 70.0F) || trend.seeded()) {
    return fail("test_stress_trend_skips_degraded_samples", "unseeded degraded sample should pass through");
  }

  if (!almost_equal(trend.sample(make_sample(0.0F, 0.0F, 0.0F), 40.0F), 40.0F) || !trend.seeded()) {
    return fail("test_stress_trend_skips_degraded_samples", "first good sample should seed the average");
  }
  if (!almost_equal(trend.sample(make_sample(0.0F, 0.0F, 0.0F), 80.0F), 60.0F)) {
    return fail("test_stress_trend_skips_degraded_samples", "average should blend with alpha");
  }
  if (!almost_equal(trend.sample(make_sample(0.0F, 0.0F, 0.0F, true), 100.0F), 60.0F)) {
    return fail("test_stress_trend_skips_degraded_samples", "degraded sample should hold the average");
  }
  if (!almost_equal(trend.sample(make_sample(0.0F, 0.0F, 0.0F), 20.0F), 40.0F)) {
    return fail("test_stress_trend_skips_degraded_samples", "average should resume after degraded sample");
  }

  return 0;
}

int test_tracker_requires_dwell() {
  StateTracker tracker(3);

  if (tracker.update(emotion_state::BUSY, 1).changed || tracker.update(emotion_state::BUSY, 2).changed) {
    return fail("test_tracker_requires_dwell", "busy should not commit before three cycles");
  }

  // Streak restarts when the candidate is interrupted.
  tracker.update(emotion_state::CALM, 3);
  if (tracker.state().candidate_streak != 0) {
    return fail("test_tracker_requires_dwell", "returning to committed state should reset streak");
  }

  tracker.update(emotion_state::BUSY, 4);
  tracker.update(emotion_state::BUSY, 5);
  const auto update = tracker.update(emotion_state::BUSY, 6);
  if (!update.changed || update.committed != emotion_state::BUSY || tracker.state().last_commit_ns != 6) {
    return fail("test_tracker_requires_dwell", "busy should commit on the third consecutive cycle");
  }

  return 0;
}

int test_tracker_toggling_never_commits() {
  StateTracker tracker(3);

  for (std::uint64_t cycle = 0; cycle < 40; ++cycle) {
    const emotion_state next = (cycle % 2 == 0) ? emotion_state::ACTIVE : emotion_state::STRESSED;
    if (tracker.update(next, cycle).changed) {
      return fail("test_tracker_toggling_never_commits", "alternating states should not commit");
    }
  }

  if (tracker.state().committed != emotion_state::CALM) {
    return fail("test_tracker_toggling_never_commits", "committed state should stay calm");
  }

  return 0;
}

int test_tracker_escalates_to_overloaded_immediately() {
  StateTracker tracker(5);

  tracker.update(emotion_state::ACTIVE, 1);
  const auto update = tracker.update(emotion_state::OVERLOADED, 2);
  if (!update.changed || update.committed != emotion_state::OVERLOADED) {
    return fail("test_tracker_escalates_to_overloaded_immediately", "overloaded should commit on first sight");
  }

  // Other escalations still wait for the dwell.
  StateTracker stressed_tracker(5);
  if (stressed_tracker.update(emotion_state::STRESSED, 1).changed) {
    return fail("test_tracker_escalates_to_overloaded_immediately", "stressed should wait for dwell");
  }

  return 0;
}

int test_tracker_damps_deescalation() {
  StateTracker tracker(3);
  tracker.update(emotion_state::OVERLOADED, 1);

  if (tracker.update(emotion_state::CALM, 2).changed || tracker.update(emotion_state::CALM, 3).changed) {
    return fail("test_tracker_damps_deescalation", "de-escalation should wait for dwell");
  }
  if (tracker.state().committed != emotion_state::OVERLOADED) {
    return fail("test_tracker_damps_deescalation", "overloaded should still be committed");
  }

  const auto update = tracker.update(emotion_state::CALM, 4);
  if (!update.changed || update.committed != emotion_state::CALM) {
    return fail("test_tracker_damps_deescalation", "calm should commit after dwell");
  }

  StateTracker zero_dwell(0);
  if (zero_dwell.dwell_cycles() != 1 || !zero_dwell.update(emotion_state::ACTIVE, 1).changed) {
    return fail("test_tracker_damps_deescalation", "zero dwell should behave as one");
  }

  return 0;
}

int test_threshold_validation() {
  try {
    validate_thresholds(threshold_config{});
  } catch (const ConfigError&) {
    return fail("test_threshold_validation", "default thresholds should be valid");
  }

  const auto expect_rejected = [](const threshold_config& thresholds) {
    try {
      validate_thresholds(thresholds);
    } catch (const ConfigError&) {
      return true;
    }
    return false;
  };

  threshold_config busy_above_high{};
  busy_above_high.cpu.busy = 80.0F;
  if (!expect_rejected(busy_above_high)) {
    return fail("test_threshold_validation", "busy above high should be rejected");
  }

  threshold_config collapsed{};
  collapsed.ram = {50.0F, 50.0F, 50.0F, 50.0F};
  if (!expect_rejected(collapsed)) {
    return fail("test_threshold_validation", "max equal to critical should be rejected");
  }

  threshold_config negative{};
  negative.network.max = -1.0F;
  if (!expect_rejected(negative)) {
    return fail("test_threshold_validation", "negative threshold should be rejected");
  }

  threshold_config inverted_ladder{};
  inverted_ladder.cpu_focus = {80.0F, 30.0F};
  if (!expect_rejected(inverted_ladder)) {
    return fail("test_threshold_validation", "focus idle above walk should be rejected");
  }

  threshold_config no_count{};
  no_count.multiple_resources_threshold = 0;
  if (!expect_rejected(no_count)) {
    return fail("test_threshold_validation", "zero resource count should be rejected");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_literal_scenarios(); rc != 0) return rc;
  if (int rc = test_classification_is_monotonic_per_metric(); rc != 0) return rc;
  if (int rc = test_multiple_resources_threshold_is_configurable(); rc != 0) return rc;
  if (int rc = test_focus_modes_use_their_own_ladder(); rc != 0) return rc;
  if (int rc = test_stressors_are_described(); rc != 0) return rc;
  if (int rc = test_gate_substitutes_last_known_value(); rc != 0) return rc;
  if (int rc = test_stress_trend_skips_degraded_samples(); rc != 0) return rc;
  if (int rc = test_tracker_requires_dwell(); rc != 0) return rc;
  if (int rc = test_tracker_toggling_never_commits(); rc != 0) return rc;
  if (int rc = test_tracker_escalates_to_overloaded_immediately(); rc != 0) return rc;
  if (int rc = test_tracker_damps_deescalation(); rc != 0) return rc;
  if (int rc = test_threshold_validation(); rc != 0) return rc;

  std::cout << "[PASS] mood unit tests\n";
  return 0;
}
