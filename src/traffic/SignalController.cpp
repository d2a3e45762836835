/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Module  : Signal Controller (Density Round-Robin)        *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/

#include "SignalController.h"

/**************************************************************
 *   LOGGING CONFIGURATION                                    *
 *   - DSC_CTRL_LOG_LEVEL: [0=OFF, 1=INFO, 2=DEBUG]           *
 *   - LOG_TAG: "dsc_signal"                                  *
 **************************************************************/
#ifndef DSC_CTRL_LOG_LEVEL
  #define DSC_CTRL_LOG_LEVEL 1
#endif
#if DSC_CTRL_LOG_LEVEL >= 1
  #define LOG_TAG "dsc_signal"
  #include "configuration.h"
  #define CTRL_LOGI(...) LOG_INFO(__VA_ARGS__)
#else
  #define CTRL_LOGI(...)                                                                           \
    do {                                                                                           \
    } while (0)
#endif
#if DSC_CTRL_LOG_LEVEL >= 2
  #define CTRL_LOGD(...) LOG_DEBUG(__VA_ARGS__)
#else
  #define CTRL_LOGD(...)                                                                           \
    do {                                                                                           \
    } while (0)
#endif

SignalController::SignalController(DistanceSource&         sourceA,
                                   DistanceSource&         sourceB,
                                   const ControllerConfig& cfg)
    : cfg_(cfg), laneA_("LANE A", sourceA, cfg.lane), laneB_("LANE B", sourceB, cfg.lane) {
  CTRL_LOGI("CONSTRUCTOR: green=%lu-%lus (+%lus/veh) idle=%lums\n",
            (unsigned long) cfg_.minGreenS,
            (unsigned long) cfg_.maxGreenS,
            (unsigned long) cfg_.greenPerVehicleS,
            (unsigned long) cfg_.idleTimeoutMs);
}

/* ================================== LIFECYCLE ================================== */
bool SignalController::start(uint32_t nowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_.load())
    return false;

  signalStartMs_  = nowMs;
  lastActivityMs_ = nowMs;
  lastTickMs_     = nowMs;
  idleLogged_     = false;
  running_.store(true);
  CTRL_LOGI("CONTROL LOOP STARTED (signal=%s lane=%c)\n",
            signalName(signal_),
            laneLetter(currentLane_));
  return true;
}

void SignalController::stop() {
  if (running_.exchange(false))
    CTRL_LOGI("CONTROL LOOP STOP REQUESTED\n");
}

/* ==================================== TICK ===================================== */
bool SignalController::tick(uint32_t nowMs) {
  if (!running_.load())
    return false;

  // SENSOR I/O FIRST, READERS ARE NOT BLOCKED BY IT
  const DistanceSample sa = laneA_.sample();
  const DistanceSample sb = laneB_.sample();

  std::lock_guard<std::mutex> lock(mutex_);
  laneA_.applySample(sa, nowMs);
  laneB_.applySample(sb, nowMs);
  evaluate_(nowMs);
  lastTickMs_ = nowMs;
  return true;
}

uint32_t SignalController::greenTimeS(uint32_t count) const {
  const uint64_t raw = (uint64_t) cfg_.minGreenS + (uint64_t) cfg_.greenPerVehicleS * count;
  if (raw > cfg_.maxGreenS)
    return cfg_.maxGreenS;
  if (raw < cfg_.minGreenS)
    return cfg_.minGreenS;
  return (uint32_t) raw;
}

/* ============================== STATE MACHINE (LOCKED) ============================== */
void SignalController::evaluate_(uint32_t nowMs) {
  // ACTIVITY IS STAMPED ON EVERY TICK WITH DEMAND, GREEN PHASES INCLUDED
  if (laneA_.vehicleCount() > 0 || laneB_.vehicleCount() > 0) {
    lastActivityMs_ = nowMs;
    idleLogged_     = false;
  }

  if ((uint32_t) (nowMs - lastActivityMs_) > cfg_.idleTimeoutMs) {
    forceIdleRed_();
    return;
  }

  switch (signal_) {
    case SIG_RED: {
      LaneMonitor& eligible = lane_(currentLane_);
      if (eligible.vehicleCount() > 0) {
        enterGreen_(currentLane_, nowMs);
      } else {
        CTRL_LOGD("%s EMPTY -> SWITCHING TO LANE %c\n",
                  eligible.name(),
                  laneLetter(otherLane(currentLane_)));
        currentLane_ = otherLane(currentLane_);
      }
      break;
    }

    case SIG_GREEN_A:
    case SIG_GREEN_B: {
      const LaneId   green   = (signal_ == SIG_GREEN_A) ? LANE_A : LANE_B;
      const uint32_t allotMs = greenTimeS(lane_(green).vehicleCount()) * 1000U;
      if ((uint32_t) (nowMs - signalStartMs_) >= allotMs)
        endGreen_(green);
      break;
    }
  }
}

void SignalController::enterGreen_(LaneId lane, uint32_t nowMs) {
  signal_        = (lane == LANE_A) ? SIG_GREEN_A : SIG_GREEN_B;
  signalStartMs_ = nowMs;
  CTRL_LOGI("LANE %c GREEN FOR %lus (count: %lu)\n",
            laneLetter(lane),
            (unsigned long) greenTimeS(lane_(lane).vehicleCount()),
            (unsigned long) lane_(lane).vehicleCount());
}

void SignalController::endGreen_(LaneId lane) {
  LaneMonitor& served = lane_(lane);
  CTRL_LOGI("LANE %c -> RED (served %lu vehicles)\n",
            laneLetter(lane),
            (unsigned long) served.vehicleCount());
  signal_      = SIG_RED;
  currentLane_ = otherLane(lane);
  served.resetCount();
}

void SignalController::forceIdleRed_() {
  if (signal_ != SIG_RED) {
    CTRL_LOGI("IDLE TIMEOUT -> ALL RED\n");
    signal_ = SIG_RED;
  } else if (!idleLogged_) {
    CTRL_LOGD("IDLE: HOLDING RED (lane=%c)\n", laneLetter(currentLane_));
  }
  idleLogged_ = true;
}

/* =================================== READERS =================================== */
IntersectionSnapshot SignalController::getCurrentState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  IntersectionSnapshot snap;
  snap.laneA       = laneA_.getState();
  snap.laneB       = laneB_.getState();
  snap.signal      = signal_;
  snap.currentLane = currentLane_;
  snap.timestampMs = lastTickMs_;
  if (signal_ == SIG_GREEN_A)
    snap.greenTimeS = greenTimeS(snap.laneA.count);
  else if (signal_ == SIG_GREEN_B)
    snap.greenTimeS = greenTimeS(snap.laneB.count);
  return snap;
}

SignalState SignalController::currentSignal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signal_;
}

LaneId SignalController::currentLane() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return currentLane_;
}

float SignalController::laneBaseline(LaneId lane) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return (lane == LANE_A) ? laneA_.baseline() : laneB_.baseline();
}

/* ================================= CALIBRATION ================================= */
bool SignalController::calibrateLane(LaneId lane, uint8_t samples) {
  LaneMonitor& target = lane_(lane);

  // READINGS OUTSIDE THE LOCK, ONLY THE NEW BASELINE IS PUBLISHED UNDER IT
  float      mean = 0.0f;
  const bool ok   = target.measureBaseline(samples, mean);

  std::lock_guard<std::mutex> lock(mutex_);
  target.setBaseline(ok ? mean : cfg_.lane.defaultBaselineCm);
  if (ok)
    CTRL_LOGI("%s CALIBRATED: %.1f CM (%u samples)\n",
              target.name(),
              (double) mean,
              (unsigned) samples);
  else
    CTRL_LOGI("%s CALIBRATION FAILED, USING DEFAULT\n", target.name());
  return ok;
}
