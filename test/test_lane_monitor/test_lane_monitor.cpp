/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   File    : Lane Monitor (Unit Test)                       *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/

// =============================
//  STANDARD INCLUDES
// =============================
#include <cstdint>

// =============================
//  UNITY FRAMEWORK
// =============================
#include <unity.h>

// =============================
//  UNIT UNDER TEST
// =============================
#include "../support/ScriptedDistanceSource.h"
#include "traffic/LaneMonitor.h"

static constexpr float kClearCm   = 100.0f;
static constexpr float kVehicleCm = 50.0f;

static ScriptedDistanceSource g_src;

static LaneConfig laneCfg(float widthCm) {
  LaneConfig c;
  c.laneWidthCm = widthCm;
  return c;
}

/* ENTER AT t, LEAVE AT t + blockingMs */
static void passVehicle(LaneMonitor& m, uint32_t t, uint32_t blockingMs) {
  g_src.set(kVehicleCm);
  m.update(t);
  g_src.set(kClearCm);
  m.update(t + blockingMs);
}

void setUp() {
  g_src = ScriptedDistanceSource(kClearCm);
}

void tearDown() {}

/**
 * @brief RISING EDGE: COUNT + PRESENCE + ENTRY TIME
 */
void test_rising_edge_counts_vehicle() {
  LaneMonitor m("A", g_src);
  g_src.set(kVehicleCm);
  m.update(1000);

  TEST_ASSERT_TRUE(m.vehiclePresent());
  TEST_ASSERT_TRUE(m.hasEntryTime());
  TEST_ASSERT_EQUAL_UINT32(1000, m.entryTimeMs());
  TEST_ASSERT_EQUAL_UINT32(1, m.vehicleCount());
}

/**
 * @brief STEADY PRESENCE ACROSS TICKS COUNTS ONCE
 */
void test_steady_presence_counts_once() {
  LaneMonitor m("A", g_src);
  g_src.set(kVehicleCm);
  for (uint32_t t = 100; t < 1000; t += 100)
    m.update(t);

  TEST_ASSERT_EQUAL_UINT32(1, m.vehicleCount());
  TEST_ASSERT_TRUE(m.hasEntryTime());
  TEST_ASSERT_EQUAL_UINT32(100, m.entryTimeMs());
}

/**
 * @brief FALLING EDGE CLEARS PRESENCE AND ENTRY TIME
 */
void test_falling_edge_clears_presence() {
  LaneMonitor m("A", g_src);
  passVehicle(m, 500, 1000);

  TEST_ASSERT_FALSE(m.vehiclePresent());
  TEST_ASSERT_FALSE(m.hasEntryTime());
  TEST_ASSERT_EQUAL_UINT32(1, m.vehicleCount());
}

/**
 * @brief DROP EQUAL TO THRESHOLD IS NOT A VEHICLE (STRICT >)
 */
void test_threshold_is_strict() {
  LaneMonitor m("A", g_src);
  g_src.set(kClearCm - DSC_THRESHOLD_CM);
  m.update(0);
  TEST_ASSERT_FALSE(m.vehiclePresent());

  g_src.set(kClearCm - DSC_THRESHOLD_CM - 0.5f);
  m.update(100);
  TEST_ASSERT_TRUE(m.vehiclePresent());
}

/**
 * @brief 4 CM IN 1 S = 0.144 KM/H -> BELOW BAND, DISCARDED
 */
void test_reference_width_one_second_is_discarded() {
  TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.144f, LaneMonitor::estimateSpeedKmh(4.0f, 1000));

  LaneMonitor m("A", g_src, laneCfg(4.0f));
  passVehicle(m, 0, 1000);

  TEST_ASSERT_EQUAL_UINT8(0, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(0.0f, m.getAverageSpeed());
  TEST_ASSERT_EQUAL_UINT32(1, m.vehicleCount());
}

/**
 * @brief EXACTLY 10.0 KM/H IS ACCEPTED (INCLUSIVE LOWER BOUND)
 */
void test_lower_bound_inclusive() {
  // 250 CM * 36 / 900 MS = 10.0 KM/H
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  passVehicle(m, 0, 900);

  TEST_ASSERT_EQUAL_UINT8(1, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(10.0f, m.getAverageSpeed());
}

/**
 * @brief 9.99 KM/H IS REJECTED
 */
void test_just_below_lower_bound_rejected() {
  // 333 CM * 36 / 1200 MS = 9.99 KM/H
  LaneMonitor m("A", g_src, laneCfg(333.0f));
  passVehicle(m, 0, 1200);

  TEST_ASSERT_EQUAL_UINT8(0, m.speedReadingCount());
}

/**
 * @brief 60 KM/H ACCEPTED, ABOVE IT REJECTED
 */
void test_upper_bound_inclusive() {
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  passVehicle(m, 0, 150);  // 60.0
  TEST_ASSERT_EQUAL_UINT8(1, m.speedReadingCount());

  passVehicle(m, 1000, 149);  // ~60.4
  TEST_ASSERT_EQUAL_UINT8(1, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(60.0f, m.getAverageSpeed());
}

/**
 * @brief ZERO BLOCKING DURATION PRODUCES NO ESTIMATE
 */
void test_zero_duration_discarded() {
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  passVehicle(m, 700, 0);

  TEST_ASSERT_FALSE(m.vehiclePresent());
  TEST_ASSERT_EQUAL_UINT8(0, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(0.0f, LaneMonitor::estimateSpeedKmh(250.0f, 0));
}

/**
 * @brief DEGENERATE LANE WIDTH SKIPS THE ESTIMATE
 */
void test_zero_lane_width_skips_estimate() {
  LaneMonitor m("A", g_src, laneCfg(0.0f));
  passVehicle(m, 0, 500);

  TEST_ASSERT_EQUAL_UINT32(1, m.vehicleCount());
  TEST_ASSERT_EQUAL_UINT8(0, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(0.0f, LaneMonitor::estimateSpeedKmh(-3.0f, 500));
}

/**
 * @brief FAILED READS NEVER FABRICATE A VEHICLE
 */
void test_sensor_failure_reads_not_present() {
  LaneMonitor m("A", g_src);
  g_src.setFail(true);
  for (uint32_t t = 0; t < 2000; t += 100)
    m.update(t);

  TEST_ASSERT_FALSE(m.vehiclePresent());
  TEST_ASSERT_EQUAL_UINT32(0, m.vehicleCount());
}

/**
 * @brief SENSOR LOST WHILE BLOCKED ACTS AS A FALLING EDGE
 */
void test_sensor_failure_mid_vehicle_ends_presence() {
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  g_src.set(kVehicleCm);
  m.update(0);
  g_src.setFail(true);
  m.update(900);

  TEST_ASSERT_FALSE(m.vehiclePresent());
  TEST_ASSERT_FALSE(m.hasEntryTime());
  TEST_ASSERT_EQUAL_UINT32(1, m.vehicleCount());
  TEST_ASSERT_EQUAL_UINT8(1, m.speedReadingCount());
}

/**
 * @brief sample() READS THE SENSOR BUT DOES NOT MUTATE LANE STATE
 */
void test_sample_has_no_side_effects() {
  LaneMonitor m("A", g_src);
  g_src.set(kVehicleCm);
  const DistanceSample s = m.sample();

  TEST_ASSERT_TRUE(s.valid);
  TEST_ASSERT_TRUE(m.isPresent(s));
  TEST_ASSERT_FALSE(m.vehiclePresent());
  TEST_ASSERT_EQUAL_UINT32(0, m.vehicleCount());
  TEST_ASSERT_EQUAL_UINT(1, g_src.reads());
}

/**
 * @brief RESET ZEROES COUNT, KEEPS SPEED HISTORY
 */
void test_reset_count_keeps_speed_history() {
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  passVehicle(m, 0, 900);
  passVehicle(m, 2000, 450);  // 20 KM/H

  m.resetCount();
  TEST_ASSERT_EQUAL_UINT32(0, m.vehicleCount());
  TEST_ASSERT_EQUAL_UINT8(2, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(15.0f, m.getAverageSpeed());
}

/**
 * @brief SPEED RING EVICTS THE OLDEST READING
 */
void test_speed_history_evicts_oldest() {
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  uint32_t    t = 0;
  for (int i = 0; i < DSC_SPEED_HISTORY; ++i, t += 2000)
    passVehicle(m, t, 900);  // 10 KM/H
  TEST_ASSERT_EQUAL_FLOAT(10.0f, m.getAverageSpeed());

  passVehicle(m, t, 150);  // 60 KM/H REPLACES ONE 10
  TEST_ASSERT_EQUAL_UINT8(DSC_SPEED_HISTORY, m.speedReadingCount());
  TEST_ASSERT_EQUAL_FLOAT(12.5f, m.getAverageSpeed());
}

/**
 * @brief getState() MIRRORS COUNT + AVERAGE SPEED
 */
void test_get_state() {
  LaneMonitor m("A", g_src, laneCfg(250.0f));
  passVehicle(m, 0, 300);  // 30 KM/H
  g_src.set(kVehicleCm);
  m.update(5000);

  const LaneState st = m.getState();
  TEST_ASSERT_EQUAL_UINT32(2, st.count);
  TEST_ASSERT_EQUAL_FLOAT(30.0f, st.speedKmh);
}

/**
 * @brief CALIBRATION: MEAN OF READINGS BECOMES THE BASELINE
 */
void test_calibrate_sets_mean_baseline() {
  LaneMonitor m("A", g_src);
  g_src.set(80.0f);
  TEST_ASSERT_TRUE(m.calibrate(10));
  TEST_ASSERT_EQUAL_FLOAT(80.0f, m.baseline());
  TEST_ASSERT_EQUAL_UINT(10, g_src.reads());

  // 80 - 70 = 10 < 15 -> STILL CLEAR AGAINST THE NEW BASELINE
  g_src.set(70.0f);
  m.update(0);
  TEST_ASSERT_FALSE(m.vehiclePresent());
}

/**
 * @brief CALIBRATION WITH NO VALID READING FALLS BACK TO DEFAULT
 */
void test_calibrate_failure_uses_default() {
  LaneMonitor m("A", g_src);
  g_src.set(80.0f);
  m.calibrate(5);
  g_src.setFail(true);

  TEST_ASSERT_FALSE(m.calibrate(5));
  TEST_ASSERT_EQUAL_FLOAT(DSC_DEFAULT_BASELINE_CM, m.baseline());
}

/**
 * @brief CALIBRATION READS ARE SPACED BY THE CONFIGURED GAP (NONE BEFORE THE FIRST)
 */
void test_calibrate_spaces_reads() {
  LaneMonitor m("A", g_src);
  g_src.set(80.0f);
  TEST_ASSERT_TRUE(m.calibrate(5));
  TEST_ASSERT_EQUAL_UINT(5, g_src.reads());
  TEST_ASSERT_EQUAL_UINT(4, g_src.settles());
  TEST_ASSERT_EQUAL_UINT32(4 * DSC_CALIBRATION_GAP_MS, g_src.settledMs());

  LaneConfig noGap;
  noGap.calibrationGapMs = 0;
  ScriptedDistanceSource quick(80.0f);
  LaneMonitor            fast("B", quick, noGap);
  TEST_ASSERT_TRUE(fast.calibrate(5));
  TEST_ASSERT_EQUAL_UINT(0, quick.settles());
}

/* =============================
 *  UNITY TEST RUNNER (MAIN)
 * ============================= */

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_rising_edge_counts_vehicle);
  RUN_TEST(test_steady_presence_counts_once);
  RUN_TEST(test_falling_edge_clears_presence);
  RUN_TEST(test_threshold_is_strict);
  RUN_TEST(test_reference_width_one_second_is_discarded);
  RUN_TEST(test_lower_bound_inclusive);
  RUN_TEST(test_just_below_lower_bound_rejected);
  RUN_TEST(test_upper_bound_inclusive);
  RUN_TEST(test_zero_duration_discarded);
  RUN_TEST(test_zero_lane_width_skips_estimate);
  RUN_TEST(test_sensor_failure_reads_not_present);
  RUN_TEST(test_sensor_failure_mid_vehicle_ends_presence);
  RUN_TEST(test_sample_has_no_side_effects);
  RUN_TEST(test_reset_count_keeps_speed_history);
  RUN_TEST(test_speed_history_evicts_oldest);
  RUN_TEST(test_get_state);
  RUN_TEST(test_calibrate_sets_mean_baseline);
  RUN_TEST(test_calibrate_failure_uses_default);
  RUN_TEST(test_calibrate_spaces_reads);
  return UNITY_END();
}
