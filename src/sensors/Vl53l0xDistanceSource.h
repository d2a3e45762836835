/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Library : VL53L0X Time-of-Flight Distance Source         *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <Adafruit_VL53L0X.h>
#include <Arduino.h>
#include <Wire.h>

#include "sensors/DistanceSource.h"

// ======= LOG GATE (0=OFF, 1=INFO, 2=DEBUG) =======
#ifndef DSC_TOF_LOG_LEVEL
  #define DSC_TOF_LOG_LEVEL 1
#endif

class Vl53l0xDistanceSource final : public DistanceSource {
public:
  /**
   * @param name       LOG LABEL ("SENSOR A")
   * @param i2cAddr    ADDRESS TO ASSIGN TO THIS SENSOR
   * @param xshutPin   XSHUT PIN FOR ADDRESS SEQUENCING (-1 DISABLES)
   */
  Vl53l0xDistanceSource(const char* name, uint8_t i2cAddr, int16_t xshutPin);

  /**
   * HOLD THE SENSOR IN RESET (ONLY WHEN AN XSHUT PIN IS WIRED)
   *
   * CALL ON EVERY SENSOR BEFORE THE FIRST begin() SO THAT EACH ONE
   * CAN BE WOKEN AND RE-ADDRESSED IN TURN.
   */
  void holdInReset();

  /**
   * WAKE, ADDRESS AND CONFIGURE THE SENSOR
   *
   * @param i2c  BUS THE SENSOR IS WIRED TO
   * @return true IF THE SENSOR ANSWERED
   */
  bool begin(TwoWire* i2c = &Wire);

  bool        read(float& distanceCm) override;
  const char* label() const override {
    return name_;
  }

  void settle(uint32_t ms) override {
    delay(ms);
  }

  bool ready() const {
    return ready_;
  }

private:
  Adafruit_VL53L0X lox_;
  const char*      name_;
  uint8_t          addr_;
  int16_t          xshutPin_;
  bool             ready_ = false;
};
