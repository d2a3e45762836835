/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   File    : Build-Time Configuration                       *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <stdint.h>

/* =======================[ DEFAULT CONFIG (OVERRIDE VIA -D ...) ]=======================
 *  CONTROL LOOP:
 *    -DDSC_TICK_MS=100                  -> FIXED POLLING CADENCE
 *    -DDSC_AUTOSTART=1                  -> START CONTROL LOOP ON FIRST runOnce()
 *
 *  GREEN ALLOCATION (SECONDS):
 *    -DDSC_MIN_GREEN_S=10
 *    -DDSC_MAX_GREEN_S=30
 *    -DDSC_GREEN_PER_VEHICLE_S=2
 *
 *  IDLE FALLBACK:
 *    -DDSC_IDLE_TIMEOUT_MS=90000
 *
 *  LANE DETECTION (CENTIMETRES / KM/H):
 *    -DDSC_THRESHOLD_CM=15
 *    -DDSC_LANE_WIDTH_CM=4
 *    -DDSC_SPEED_MIN_KMH=10
 *    -DDSC_SPEED_MAX_KMH=60
 *    -DDSC_SPEED_HISTORY=20
 *    -DDSC_DEFAULT_BASELINE_CM=100
 *    -DDSC_CALIBRATION_SAMPLES=10
 *    -DDSC_CALIBRATION_GAP_MS=50
 *
 *  VL53L0X SENSORS (XSHUT -1 DISABLES ADDRESS SEQUENCING):
 *    -DDSC_TOF_ADDR_A=0x30  -DDSC_TOF_XSHUT_A_PIN=-1
 *    -DDSC_TOF_ADDR_B=0x31  -DDSC_TOF_XSHUT_B_PIN=-1
 *    A LANE LEFT AT THE FACTORY ADDRESS (0x29) IS BROUGHT UP LAST.
 *    -DDSC_TOF_TIMING_BUDGET_US=20000
 *
 *  REPORTING (MS):
 *    -DDSC_BROADCAST_PERIOD_MS=1000
 *    -DDSC_STATUS_PRINT_MS=1000
 * =====================================================================================*/

/* --- CONTROL LOOP --- */
#ifndef DSC_TICK_MS
  #define DSC_TICK_MS 100U
#endif
#ifndef DSC_AUTOSTART
  #define DSC_AUTOSTART 1
#endif

/* --- GREEN ALLOCATION --- */
#ifndef DSC_MIN_GREEN_S
  #define DSC_MIN_GREEN_S 10U
#endif
#ifndef DSC_MAX_GREEN_S
  #define DSC_MAX_GREEN_S 30U
#endif
#ifndef DSC_GREEN_PER_VEHICLE_S
  #define DSC_GREEN_PER_VEHICLE_S 2U
#endif

/* --- IDLE FALLBACK --- */
#ifndef DSC_IDLE_TIMEOUT_MS
  #define DSC_IDLE_TIMEOUT_MS 90000U
#endif

/* --- LANE DETECTION --- */
#ifndef DSC_THRESHOLD_CM
  #define DSC_THRESHOLD_CM 15.0f
#endif
#ifndef DSC_LANE_WIDTH_CM
  #define DSC_LANE_WIDTH_CM 4.0f
#endif
#ifndef DSC_SPEED_MIN_KMH
  #define DSC_SPEED_MIN_KMH 10.0f
#endif
#ifndef DSC_SPEED_MAX_KMH
  #define DSC_SPEED_MAX_KMH 60.0f
#endif
#ifndef DSC_SPEED_HISTORY
  #define DSC_SPEED_HISTORY 20
#endif
#ifndef DSC_DEFAULT_BASELINE_CM
  #define DSC_DEFAULT_BASELINE_CM 100.0f
#endif
#ifndef DSC_CALIBRATION_SAMPLES
  #define DSC_CALIBRATION_SAMPLES 10
#endif
#ifndef DSC_CALIBRATION_GAP_MS
  #define DSC_CALIBRATION_GAP_MS 50U
#endif

/* --- VL53L0X SENSORS --- */
#ifndef DSC_TOF_ADDR_A
  #define DSC_TOF_ADDR_A 0x30
#endif
#ifndef DSC_TOF_ADDR_B
  #define DSC_TOF_ADDR_B 0x31
#endif
#ifndef DSC_TOF_XSHUT_A_PIN
  #define DSC_TOF_XSHUT_A_PIN -1
#endif
#ifndef DSC_TOF_XSHUT_B_PIN
  #define DSC_TOF_XSHUT_B_PIN -1
#endif
#ifndef DSC_TOF_TIMING_BUDGET_US
  #define DSC_TOF_TIMING_BUDGET_US 20000UL
#endif

/* --- REPORTING --- */
#ifndef DSC_BROADCAST_PERIOD_MS
  #define DSC_BROADCAST_PERIOD_MS 1000U
#endif
#ifndef DSC_STATUS_PRINT_MS
  #define DSC_STATUS_PRINT_MS 1000U
#endif

/* ==========================[ RUNTIME CONFIG STRUCTS ]==========================
 *  FILLED FROM THE MACROS ABOVE; TESTS BUILD THEIR OWN.
 * ============================================================================*/
struct LaneConfig {
  float laneWidthCm        = DSC_LANE_WIDTH_CM;
  float thresholdCm        = DSC_THRESHOLD_CM;
  float minSpeedKmh        = DSC_SPEED_MIN_KMH;
  float maxSpeedKmh        = DSC_SPEED_MAX_KMH;
  float defaultBaselineCm  = DSC_DEFAULT_BASELINE_CM;

  uint32_t calibrationGapMs = DSC_CALIBRATION_GAP_MS;  // PAUSE BETWEEN BASELINE READS
};

struct ControllerConfig {
  uint32_t   minGreenS        = DSC_MIN_GREEN_S;
  uint32_t   maxGreenS        = DSC_MAX_GREEN_S;
  uint32_t   greenPerVehicleS = DSC_GREEN_PER_VEHICLE_S;
  uint32_t   idleTimeoutMs    = DSC_IDLE_TIMEOUT_MS;
  LaneConfig lane;
};
