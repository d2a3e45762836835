/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Library : Distance Source (Sensor Capability)            *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <stdint.h>

/**
 * DISTANCE CAPABILITY CONSUMED BY A LANE MONITOR.
 *
 * IMPLEMENTATIONS MUST RETURN WITHIN ONE CONTROL TICK AND MUST NOT
 * PROPAGATE DRIVER ERRORS: A FAILED READ RETURNS false.
 */
class DistanceSource {
public:
  virtual ~DistanceSource() = default;

  /**
   * READ ONE DISTANCE SAMPLE
   *
   * @param distanceCm  OUTPUT: DISTANCE IN CENTIMETRES (UNTOUCHED ON FAILURE)
   * @return true IF A VALID SAMPLE WAS PRODUCED
   */
  virtual bool read(float& distanceCm) = 0;

  /**
   * NAME USED IN LOG LINES
   */
  virtual const char* label() const = 0;

  /**
   * WAIT BETWEEN CONSECUTIVE CALIBRATION READS
   *
   * SOURCES WITHOUT A PHYSICAL SETTLING TIME KEEP THE DEFAULT NO-OP.
   */
  virtual void settle(uint32_t ms) {
    (void) ms;
  }
};

/**
 * SIMULATED SENSOR: ALWAYS REPORTS A FIXED BASELINE (EMPTY LANE).
 */
class FixedDistanceSource final : public DistanceSource {
public:
  explicit FixedDistanceSource(float baselineCm) : baselineCm_(baselineCm) {}

  bool read(float& distanceCm) override {
    distanceCm = baselineCm_;
    return true;
  }

  const char* label() const override {
    return "SIMULATED";
  }

private:
  float baselineCm_;
};
