/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   File    : Common Enums (Signal / Lane)                   *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once
#include <stdint.h>

/* ===============================[ LANES ]=====================================
 *  LANE_A, LANE_B : THE TWO APPROACHES SERVED BY THE INTERSECTION
 *  (SHARED BY CONTROLLER, SNAPSHOT AND MESH COMMANDS)
 * ============================================================================*/
enum LaneId : uint8_t { LANE_A = 0, LANE_B, LANE_COUNT };

/* ===========================[ SIGNAL STATES ]=================================
 *  SIG_RED     : ALL RED (DEFAULT / SAFE)
 *  SIG_GREEN_A : LANE A HAS RIGHT-OF-WAY
 *  SIG_GREEN_B : LANE B HAS RIGHT-OF-WAY
 * ============================================================================*/
enum SignalState : uint8_t { SIG_RED = 0, SIG_GREEN_A, SIG_GREEN_B };

static inline const char* signalName(SignalState s) {
  switch (s) {
    case SIG_GREEN_A:
      return "GREEN_A";
    case SIG_GREEN_B:
      return "GREEN_B";
    case SIG_RED:
    default:
      return "RED";
  }
}

static inline char laneLetter(LaneId lane) {
  return (lane == LANE_B) ? 'B' : 'A';
}

static inline LaneId otherLane(LaneId lane) {
  return (lane == LANE_A) ? LANE_B : LANE_A;
}
