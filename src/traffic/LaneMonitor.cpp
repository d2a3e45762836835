/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Module  : Lane Monitor                                   *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/

#include "LaneMonitor.h"

/**************************************************************
 *   LOGGING CONFIGURATION                                    *
 *   - DSC_LANE_LOG_LEVEL: [0=OFF, 1=INFO, 2=DEBUG]           *
 *   - LOG_TAG: "dsc_lane"                                    *
 **************************************************************/
#ifndef DSC_LANE_LOG_LEVEL
  #define DSC_LANE_LOG_LEVEL 1
#endif
#if DSC_LANE_LOG_LEVEL >= 1
  #define LOG_TAG "dsc_lane"
  #include "configuration.h"
  #define LANE_LOGI(...) LOG_INFO(__VA_ARGS__)
#else
  #define LANE_LOGI(...)                                                                           \
    do {                                                                                           \
    } while (0)
#endif
#if DSC_LANE_LOG_LEVEL >= 2
  #define LANE_LOGD(...) LOG_DEBUG(__VA_ARGS__)
#else
  #define LANE_LOGD(...)                                                                           \
    do {                                                                                           \
    } while (0)
#endif

/* 1 CM/MS = 10 M/S = 36 KM/H */
static constexpr float kCmPerMsToKmh = 36.0f;

LaneMonitor::LaneMonitor(const char* name, DistanceSource& source, const LaneConfig& cfg)
    : name_(name), source_(source), cfg_(cfg), baselineCm_(cfg.defaultBaselineCm) {}

DistanceSample LaneMonitor::sample() {
  DistanceSample s;
  s.valid = source_.read(s.distanceCm);
  if (!s.valid)
    LANE_LOGD("[%s] SENSOR READ FAILED (%s) -> NOT PRESENT\n", name_, source_.label());
  return s;
}

bool LaneMonitor::isPresent(const DistanceSample& s) const {
  if (!s.valid)
    return false;
  return (baselineCm_ - s.distanceCm) > cfg_.thresholdCm;
}

void LaneMonitor::applySample(const DistanceSample& s, uint32_t nowMs) {
  const bool present = isPresent(s);

  // RISING EDGE: VEHICLE ENTERED
  if (present && !vehiclePresent_) {
    entryMs_        = nowMs;
    hasEntry_       = true;
    vehiclePresent_ = true;
    vehicleCount_++;
    LANE_LOGI("[%s] VEHICLE #%lu DETECTED\n", name_, (unsigned long) vehicleCount_);
    return;
  }

  // FALLING EDGE: VEHICLE LEFT
  if (!present && vehiclePresent_) {
    if (hasEntry_) {
      const uint32_t blockingMs = nowMs - entryMs_;
      const float    kmh        = estimateSpeedKmh(cfg_.laneWidthCm, blockingMs);
      if (kmh > 0.0f && isPlausibleSpeed(kmh)) {
        recordSpeed_(kmh);
        LANE_LOGI("[%s] SPEED = %.1f KM/H\n", name_, (double) kmh);
      } else {
        LANE_LOGD("[%s] SPEED %.3f KM/H DISCARDED (blocked %lu ms)\n",
                  name_,
                  (double) kmh,
                  (unsigned long) blockingMs);
      }
    }
    vehiclePresent_ = false;
    hasEntry_       = false;
    entryMs_        = 0;
  }
}

float LaneMonitor::estimateSpeedKmh(float laneWidthCm, uint32_t blockingMs) {
  if (blockingMs == 0 || laneWidthCm <= 0.0f)
    return 0.0f;
  return laneWidthCm * kCmPerMsToKmh / (float) blockingMs;
}

bool LaneMonitor::isPlausibleSpeed(float kmh) const {
  return kmh >= cfg_.minSpeedKmh && kmh <= cfg_.maxSpeedKmh;
}

void LaneMonitor::recordSpeed_(float kmh) {
  speeds_[speedHead_] = kmh;
  speedHead_          = (uint8_t) ((speedHead_ + 1) % DSC_SPEED_HISTORY);
  if (speedCount_ < DSC_SPEED_HISTORY)
    speedCount_++;
}

float LaneMonitor::getAverageSpeed() const {
  if (speedCount_ == 0)
    return 0.0f;
  double sum = 0.0;
  for (uint8_t i = 0; i < speedCount_; ++i)
    sum += speeds_[i];
  return (float) (sum / speedCount_);
}

LaneState LaneMonitor::getState() const {
  LaneState st;
  st.count    = vehicleCount_;
  st.speedKmh = getAverageSpeed();
  return st;
}

void LaneMonitor::resetCount() {
  vehicleCount_ = 0;
}

bool LaneMonitor::measureBaseline(uint8_t samples, float& out) {
  double   sum   = 0.0;
  uint16_t valid = 0;
  for (uint8_t i = 0; i < samples; ++i) {
    if (i > 0 && cfg_.calibrationGapMs > 0)
      source_.settle(cfg_.calibrationGapMs);
    float cm = 0.0f;
    if (source_.read(cm)) {
      sum += cm;
      valid++;
    }
  }
  if (valid == 0)
    return false;
  out = (float) (sum / valid);
  return true;
}

bool LaneMonitor::calibrate(uint8_t samples) {
  float mean = 0.0f;
  if (!measureBaseline(samples, mean)) {
    baselineCm_ = cfg_.defaultBaselineCm;
    LANE_LOGI("[%s] CALIBRATION FAILED, USING DEFAULT %.1f CM\n", name_, (double) baselineCm_);
    return false;
  }
  baselineCm_ = mean;
  LANE_LOGI("[%s] CALIBRATED: %.1f CM\n", name_, (double) baselineCm_);
  return true;
}
