/****************************************************************
 *   Project : Density Traffic Light System                     *
 *   Module  : Intersection Control (Two-Lane, Density RR)      *
 *   Author  : Yeray Lois Sanchez                               *
 *   Email   : yerayloissanchez@gmail.com                       *
 ****************************************************************/
#pragma once

#include <Arduino.h>

#include <memory>

#include "concurrency/OSThread.h"
#include "mesh/SinglePortModule.h"
#include "mesh/generated/meshtastic/portnums.pb.h"
#include "sensors/DistanceSource.h"
#include "sensors/TofBringUp.h"
#include "sensors/Vl53l0xDistanceSource.h"
#include "traffic/IntersectionSnapshot.h"
#include "traffic/SignalController.h"
#include "traffic/TrafficConfig.h"
#include "traffic/TrafficJson.h"

/* ===========================[ MAIN CLASS ]====================================
 *  OSTHREAD  : FIXED-CADENCE CONTROL TICK (DSC_TICK_MS), SOLE WRITER
 *  MESH TX   : PERIODIC JSON SNAPSHOT ON PRIVATE_APP
 *  MESH RX   : OPERATOR COMMANDS (CAL / START / STOP)
 * ============================================================================*/
class IntersectionControlModule final : public SinglePortModule, public concurrency::OSThread {
public:
  static constexpr meshtastic_PortNum kPort = meshtastic_PortNum_PRIVATE_APP;

  IntersectionControlModule();

  /* OSTHREAD */
  int32_t runOnce() override;

  /* RX ON MESH (JSON-in-payload) */
  ProcessMessage     handleReceived(const meshtastic_MeshPacket&) override;
  meshtastic_PortNum getPortNum() const {
    return kPort;
  }

  /* ---------- LIFECYCLE ---------- */
  void start();
  void stop();

  /* SAFE FROM ANY TASK; ZEROED SNAPSHOT BEFORE FIRST runOnce() */
  IntersectionSnapshot getCurrentState() const;

private:
  /* ---------- INIT ---------- */
  void initOnce();
  void printHeaderOnce();

  /* ---------- PERIODIC ---------- */
  void serviceCalibration_();
  void sendSnapshot_();
  void printStatus_();

  /* ---------- STATE ---------- */
  bool ready_ = false;

  /* SENSORS: REAL TOF PER LANE, SIMULATED FALLBACK IF ABSENT */
  Vl53l0xDistanceSource tofA_;
  Vl53l0xDistanceSource tofB_;
  FixedDistanceSource   simA_;
  FixedDistanceSource   simB_;

  std::unique_ptr<SignalController> controller_;

  /* CALIBRATION REQUESTS FROM RX, SERVICED ON THE CONTROL THREAD */
  bool    calPending_[LANE_COUNT]{};
  uint8_t calSamples_[LANE_COUNT]{};

  /* TIMERS */
  uint32_t nextBroadcastAt_ = 0;
  uint32_t nextPrintAt_     = 0;
};

extern IntersectionControlModule* intersectionControlModule;
