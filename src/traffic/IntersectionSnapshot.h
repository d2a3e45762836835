/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   File    : Intersection Snapshot                          *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <stdint.h>

#include "traffic/TrafficCommonEnums.h"

/* PER-LANE DEMAND AS SEEN BY READERS */
struct LaneState {
  uint32_t count    = 0;
  float    speedKmh = 0.0f;  // ROLLING AVERAGE, 0 WHEN NO READINGS
};

/* CONSISTENT POINT-IN-TIME COPY OF THE CONTROLLER */
struct IntersectionSnapshot {
  LaneState   laneA;
  LaneState   laneB;
  SignalState signal      = SIG_RED;
  LaneId      currentLane = LANE_A;
  uint32_t    greenTimeS  = 0;  // LIVE ALLOTMENT OF THE GREEN LANE, 0 ON RED
  uint32_t    timestampMs = 0;  // TIME OF THE LAST COMPLETED TICK
};
