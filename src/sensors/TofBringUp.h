/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Library : VL53L0X Address Bring-Up Order                 *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <stdint.h>

#include "traffic/TrafficCommonEnums.h"

/* POWER-ON ADDRESS OF EVERY VL53L0X AFTER XSHUT RELEASE */
static constexpr uint8_t kTofFactoryAddr = 0x29;

/**
 * ORDER IN WHICH LANE SENSORS ARE RELEASED FROM RESET AND ADDRESSED
 *
 * begin() ALWAYS RUNS ITS DATA INIT AT 0x29 BEFORE MOVING THE SENSOR,
 * SO A LANE THAT STAYS AT 0x29 IS BROUGHT UP LAST, WHEN NO OTHER
 * SENSOR ON THE BUS STILL ANSWERS THERE.
 *
 * @param addrA  TARGET ADDRESS OF LANE A
 * @param addrB  TARGET ADDRESS OF LANE B
 * @param order  OUTPUT: LANES IN BRING-UP ORDER (UNTOUCHED ON FAILURE)
 * @return false IF BOTH LANES TARGET THE SAME ADDRESS
 */
static inline bool tofBringUpOrder(uint8_t addrA, uint8_t addrB, LaneId order[LANE_COUNT]) {
  if (addrA == addrB)
    return false;

  if (addrA == kTofFactoryAddr) {
    order[0] = LANE_B;
    order[1] = LANE_A;
  } else {
    order[0] = LANE_A;
    order[1] = LANE_B;
  }
  return true;
}
