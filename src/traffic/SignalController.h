/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Module  : Signal Controller (Density Round-Robin)        *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <atomic>
#include <mutex>
#include <stdint.h>

#include "sensors/DistanceSource.h"
#include "traffic/IntersectionSnapshot.h"
#include "traffic/LaneMonitor.h"
#include "traffic/TrafficCommonEnums.h"
#include "traffic/TrafficConfig.h"

/**
 * TWO-LANE SIGNAL STATE MACHINE.
 *
 * tick() IS CALLED BY A SINGLE CONTROL THREAD AT A FIXED CADENCE; IT
 * SAMPLES BOTH SENSORS OUTSIDE THE LOCK AND APPLIES THE SAMPLES AND THE
 * TRANSITION UNDER IT. READERS ON ANY THREAD USE getCurrentState().
 *
 *   RED --(count>0 on eligible lane)--> GREEN_x --(elapsed>=green)--> RED
 *   ANY --(idle > idleTimeout)--> RED (HELD, NO LANE SWITCH, NO RESET)
 */
class SignalController {
public:
  SignalController(DistanceSource&         sourceA,
                   DistanceSource&         sourceB,
                   const ControllerConfig& cfg = ControllerConfig());

  SignalController(const SignalController&)            = delete;
  SignalController& operator=(const SignalController&) = delete;

  /* ---------- LIFECYCLE ---------- */
  /**
   * ARM THE CONTROL LOOP
   *
   * @param nowMs  START OF THE FIRST IDLE WINDOW AND SIGNAL PHASE
   * @return false IF ALREADY RUNNING (NO STATE TOUCHED)
   */
  bool start(uint32_t nowMs);

  /* COOPERATIVE: TAKES EFFECT AT THE NEXT TICK BOUNDARY */
  void stop();

  bool isRunning() const {
    return running_.load();
  }

  /**
   * ONE CONTROL STEP: SAMPLE, APPLY, EVALUATE
   *
   * @return false IF STOPPED (NOTHING SAMPLED OR APPLIED)
   */
  bool tick(uint32_t nowMs);

  /* ---------- POLICY ---------- */
  uint32_t greenTimeS(uint32_t count) const;

  /* ---------- READERS (ANY THREAD) ---------- */
  IntersectionSnapshot getCurrentState() const;
  SignalState          currentSignal() const;
  LaneId               currentLane() const;

  /* ---------- OPERATIONS ---------- */
  /**
   * RECALIBRATE ONE LANE'S BASELINE (CALL FROM THE CONTROL THREAD)
   *
   * @return false IF NO READING SUCCEEDED (DEFAULT BASELINE APPLIED)
   */
  bool calibrateLane(LaneId lane, uint8_t samples);

  float laneBaseline(LaneId lane) const;

private:
  LaneMonitor& lane_(LaneId id) {
    return (id == LANE_A) ? laneA_ : laneB_;
  }

  void evaluate_(uint32_t nowMs);
  void enterGreen_(LaneId lane, uint32_t nowMs);
  void endGreen_(LaneId lane);
  void forceIdleRed_();

  ControllerConfig cfg_;
  LaneMonitor      laneA_;
  LaneMonitor      laneB_;

  /* GUARDS EVERYTHING BELOW AND BOTH LANES' STATE */
  mutable std::mutex mutex_;
  std::atomic<bool>  running_{false};

  SignalState signal_         = SIG_RED;
  LaneId      currentLane_    = LANE_A;
  uint32_t    signalStartMs_  = 0;
  uint32_t    lastActivityMs_ = 0;
  uint32_t    lastTickMs_     = 0;
  bool        idleLogged_     = false;
};
