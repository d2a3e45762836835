/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Module  : Lane Monitor                                   *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <stdint.h>

#include "sensors/DistanceSource.h"
#include "traffic/IntersectionSnapshot.h"
#include "traffic/TrafficConfig.h"

/* ONE RAW READING, TAKEN OUTSIDE ANY LOCK */
struct DistanceSample {
  bool  valid      = false;
  float distanceCm = 0.0f;
};

/**
 * VEHICLE PRESENCE / COUNT / SPEED FOR ONE LANE.
 *
 * NOT THREAD-SAFE ON ITS OWN: THE OWNING SignalController SERIALIZES
 * ALL MUTATION AND READS UNDER ITS LOCK. sample() IS THE ONLY CALL
 * THAT TOUCHES THE SENSOR.
 */
class LaneMonitor {
public:
  LaneMonitor(const char* name, DistanceSource& source, const LaneConfig& cfg = LaneConfig());

  /* ---------- SENSOR SIDE (NO STATE MUTATION) ---------- */
  DistanceSample sample();

  /* ---------- STATE SIDE ---------- */
  void applySample(const DistanceSample& s, uint32_t nowMs);
  void update(uint32_t nowMs) {
    applySample(sample(), nowMs);
  }

  bool isPresent(const DistanceSample& s) const;

  float     getAverageSpeed() const;
  LaneState getState() const;
  void      resetCount();

  /**
   * RECOMPUTE THE BASELINE FROM CONSECUTIVE READINGS (LANE MUST BE CLEAR)
   *
   * @param samples  NUMBER OF READINGS TO AVERAGE
   * @return false IF NO READING SUCCEEDED (DEFAULT BASELINE APPLIED)
   */
  bool calibrate(uint8_t samples);

  /**
   * TAKE READINGS FOR A CALIBRATION WITHOUT APPLYING THEM
   *
   * @param out  MEAN OF THE VALID READINGS
   * @return false IF NO READING SUCCEEDED
   */
  bool measureBaseline(uint8_t samples, float& out);

  void setBaseline(float cm) {
    baselineCm_ = cm;
  }

  /* ---------- SPEED MODEL ---------- */
  static float estimateSpeedKmh(float laneWidthCm, uint32_t blockingMs);
  bool         isPlausibleSpeed(float kmh) const;

  /* ---------- ACCESSORS ---------- */
  const char* name() const {
    return name_;
  }
  float baseline() const {
    return baselineCm_;
  }
  uint32_t vehicleCount() const {
    return vehicleCount_;
  }
  bool vehiclePresent() const {
    return vehiclePresent_;
  }
  bool hasEntryTime() const {
    return hasEntry_;
  }
  uint32_t entryTimeMs() const {
    return entryMs_;
  }
  uint8_t speedReadingCount() const {
    return speedCount_;
  }

private:
  void recordSpeed_(float kmh);

  const char*     name_;
  DistanceSource& source_;
  LaneConfig      cfg_;

  float    baselineCm_;
  bool     vehiclePresent_ = false;
  bool     hasEntry_       = false;
  uint32_t entryMs_        = 0;
  uint32_t vehicleCount_   = 0;

  /* SPEED RING (OLDEST EVICTED) */
  float   speeds_[DSC_SPEED_HISTORY]{};
  uint8_t speedHead_  = 0;
  uint8_t speedCount_ = 0;
};
