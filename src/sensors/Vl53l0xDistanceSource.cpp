/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Library : VL53L0X Time-of-Flight Distance Source         *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/

#include "Vl53l0xDistanceSource.h"

#define LOG_TAG "dsc_tof"
#include "configuration.h"
#include "traffic/TrafficConfig.h"

#if DSC_TOF_LOG_LEVEL >= 1
  #define TOF_LOGI(...) LOG_INFO(__VA_ARGS__)
  #define TOF_LOGW(...) LOG_WARN(__VA_ARGS__)
#else
  #define TOF_LOGI(...)                                                                            \
    do {                                                                                           \
    } while (0)
  #define TOF_LOGW(...)                                                                            \
    do {                                                                                           \
    } while (0)
#endif
#if DSC_TOF_LOG_LEVEL >= 2
  #define TOF_LOGD(...) LOG_DEBUG(__VA_ARGS__)
#else
  #define TOF_LOGD(...)                                                                            \
    do {                                                                                           \
    } while (0)
#endif

/* VL53L0X RANGE STATUS 4 = PHASE FAIL (NOTHING IN RANGE / INVALID) */
static constexpr uint8_t kRangeStatusPhaseFail = 4;

Vl53l0xDistanceSource::Vl53l0xDistanceSource(const char* name, uint8_t i2cAddr, int16_t xshutPin)
    : name_(name), addr_(i2cAddr), xshutPin_(xshutPin) {}

void Vl53l0xDistanceSource::holdInReset() {
  if (xshutPin_ < 0)
    return;
  pinMode(xshutPin_, OUTPUT);
  digitalWrite(xshutPin_, LOW);
}

bool Vl53l0xDistanceSource::begin(TwoWire* i2c) {
  if (xshutPin_ >= 0) {
    digitalWrite(xshutPin_, HIGH);
    delay(10);  // BOOT TIME AFTER XSHUT RELEASE
  }

  if (!lox_.begin(addr_, false, i2c)) {
    TOF_LOGW("[TOF] %s (0x%02X) NOT DETECTED\n", name_, (unsigned) addr_);
    ready_ = false;
    return false;
  }

  lox_.setMeasurementTimingBudgetMicroSeconds(DSC_TOF_TIMING_BUDGET_US);
  TOF_LOGI("[TOF] %s (0x%02X) OK  budget=%lu us\n",
           name_,
           (unsigned) addr_,
           (unsigned long) DSC_TOF_TIMING_BUDGET_US);
  ready_ = true;
  return true;
}

bool Vl53l0xDistanceSource::read(float& distanceCm) {
  if (!ready_)
    return false;

  VL53L0X_RangingMeasurementData_t measure;
  if (lox_.rangingTest(&measure, false) != VL53L0X_ERROR_NONE) {
    TOF_LOGD("[TOF] %s RANGING ERROR\n", name_);
    return false;
  }
  if (measure.RangeStatus == kRangeStatusPhaseFail) {
    TOF_LOGD("[TOF] %s OUT OF RANGE\n", name_);
    return false;
  }

  distanceCm = measure.RangeMilliMeter / 10.0f;
  return true;
}
