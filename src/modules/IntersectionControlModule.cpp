/****************************************************************
 *   Project : Density Traffic Light System                     *
 *   Module  : Intersection Control (Two-Lane, Density RR)      *
 *   Author  : Yeray Lois Sanchez                               *
 *   Email   : yerayloissanchez@gmail.com                       *
 ****************************************************************/

#include "IntersectionControlModule.h"

#define LOG_TAG "intersection"
#include "configuration.h"
#include "mesh/MeshService.h"
#include <string.h>

/**************************************************************
 *   LOGGING CONFIGURATION                                    *
 *   - DSC_MODULE_LOG_LEVEL: [0=OFF, 1=INFO, 2=DEBUG]         *
 *                                                            *
 *   USE LOG_INFO() / LOG_DEBUG() / LOG_WARN() FOR LOGGING.   *
 **************************************************************/
#ifndef DSC_MODULE_LOG_LEVEL
  #define DSC_MODULE_LOG_LEVEL 1
#endif
#if DSC_MODULE_LOG_LEVEL >= 1
  #define ICM_LOGI(...) LOG_INFO(__VA_ARGS__)
  #define ICM_LOGW(...) LOG_WARN(__VA_ARGS__)
#else
  #define ICM_LOGI(...)                                                                            \
    do {                                                                                           \
    } while (0)
  #define ICM_LOGW(...)                                                                            \
    do {                                                                                           \
    } while (0)
#endif
#if DSC_MODULE_LOG_LEVEL >= 2
  #define ICM_LOGD(...) LOG_DEBUG(__VA_ARGS__)
#else
  #define ICM_LOGD(...)                                                                            \
    do {                                                                                           \
    } while (0)
#endif

/* ===============================[ MESHTASTIC EXTERNS ]========================= */
extern MeshService* service;
/* ============================================================================== */

IntersectionControlModule* intersectionControlModule;

static bool gPrintedHeader = false;

/* ================================== CONSTRUCTOR ================================== */
IntersectionControlModule::IntersectionControlModule()
    : SinglePortModule("intersection_ctrl", kPort)
    , concurrency::OSThread("Intersection")
    , tofA_("SENSOR A", DSC_TOF_ADDR_A, DSC_TOF_XSHUT_A_PIN)
    , tofB_("SENSOR B", DSC_TOF_ADDR_B, DSC_TOF_XSHUT_B_PIN)
    , simA_(DSC_DEFAULT_BASELINE_CM)
    , simB_(DSC_DEFAULT_BASELINE_CM) {
  ICM_LOGI("CONSTRUCTOR_IntersectionControlModule\n");
}

/* ================================ ONE-TIME INIT ================================= */
/**
 * - WAKE AND ADDRESS BOTH TOF SENSORS (XSHUT SEQUENCING WHEN WIRED).
 * - PICK REAL OR SIMULATED SOURCE PER LANE.
 * - BUILD THE CONTROLLER AND CALIBRATE LANES WITH A REAL SENSOR.
 * - START THE LOOP IF DSC_AUTOSTART.
 */
void IntersectionControlModule::initOnce() {
  tofA_.holdInReset();
  tofB_.holdInReset();
  delay(10);

  Vl53l0xDistanceSource* tof[LANE_COUNT] = {&tofA_, &tofB_};
  bool                   ok[LANE_COUNT]  = {false, false};
  LaneId                 order[LANE_COUNT];
  if (tofBringUpOrder(DSC_TOF_ADDR_A, DSC_TOF_ADDR_B, order)) {
    for (uint8_t i = 0; i < LANE_COUNT; ++i)
      ok[order[i]] = tof[order[i]]->begin(&Wire);
  } else {
    ICM_LOGW("SENSOR A AND B SHARE I2C ADDRESS 0x%02X -> NOT STARTED\n",
             (unsigned) DSC_TOF_ADDR_A);
  }

  const bool okA = ok[LANE_A];
  const bool okB = ok[LANE_B];
  if (!okA)
    ICM_LOGW("SENSOR A UNAVAILABLE -> SIMULATION MODE (baseline=%.0f cm)\n",
             (double) DSC_DEFAULT_BASELINE_CM);
  if (!okB)
    ICM_LOGW("SENSOR B UNAVAILABLE -> SIMULATION MODE (baseline=%.0f cm)\n",
             (double) DSC_DEFAULT_BASELINE_CM);

  DistanceSource& srcA = okA ? static_cast<DistanceSource&>(tofA_) : simA_;
  DistanceSource& srcB = okB ? static_cast<DistanceSource&>(tofB_) : simB_;
  controller_ = std::make_unique<SignalController>(srcA, srcB, ControllerConfig());

  if (okA)
    controller_->calibrateLane(LANE_A, DSC_CALIBRATION_SAMPLES);
  if (okB)
    controller_->calibrateLane(LANE_B, DSC_CALIBRATION_SAMPLES);

  printHeaderOnce();

  const uint32_t now = millis();
  nextBroadcastAt_   = now + DSC_BROADCAST_PERIOD_MS;
  nextPrintAt_       = now + DSC_STATUS_PRINT_MS;
  ready_             = true;

#if DSC_AUTOSTART
  controller_->start(now);
#endif
}

/**
 * PRINT A SINGLE STARTUP BANNER WITH EFFECTIVE CONFIGURATION.
 */
void IntersectionControlModule::printHeaderOnce() {
  if (gPrintedHeader)
    return;
  gPrintedHeader = true;

  ICM_LOGI("\n============== INTERSECTION CONTROLLER ==============\n");
  ICM_LOGI("LANE A: %s  baseline=%.1f cm\n",
           tofA_.ready() ? tofA_.label() : simA_.label(),
           (double) controller_->laneBaseline(LANE_A));
  ICM_LOGI("LANE B: %s  baseline=%.1f cm\n",
           tofB_.ready() ? tofB_.label() : simB_.label(),
           (double) controller_->laneBaseline(LANE_B));
  ICM_LOGI("GREEN: %u-%u s (+%u s/veh)  IDLE: %u ms  TICK: %u ms\n",
           (unsigned) DSC_MIN_GREEN_S,
           (unsigned) DSC_MAX_GREEN_S,
           (unsigned) DSC_GREEN_PER_VEHICLE_S,
           (unsigned) DSC_IDLE_TIMEOUT_MS,
           (unsigned) DSC_TICK_MS);
  ICM_LOGI("\n=====================================================\n");
}

/* =============================== COOPERATIVE LOOP =============================== */
int32_t IntersectionControlModule::runOnce() {
  if (!ready_)
    initOnce();

  // STOP REQUESTS TAKE EFFECT HERE, BETWEEN COMPLETE TICKS
  if (!controller_->isRunning()) {
    ICM_LOGI("CONTROL LOOP HALTED\n");
    return disable();
  }

  serviceCalibration_();

  const uint32_t now = millis();
  controller_->tick(now);

  if ((int32_t) (now - nextBroadcastAt_) >= 0) {
    sendSnapshot_();
    nextBroadcastAt_ = now + DSC_BROADCAST_PERIOD_MS;
  }
  if ((int32_t) (now - nextPrintAt_) >= 0) {
    printStatus_();
    nextPrintAt_ = now + DSC_STATUS_PRINT_MS;
  }

  return DSC_TICK_MS;
}

void IntersectionControlModule::serviceCalibration_() {
  for (uint8_t i = 0; i < LANE_COUNT; ++i) {
    if (!calPending_[i])
      continue;
    calPending_[i]  = false;
    const uint8_t n = calSamples_[i] ? calSamples_[i] : (uint8_t) DSC_CALIBRATION_SAMPLES;
    const bool ok   = controller_->calibrateLane((LaneId) i, n);
    ICM_LOGI("CALIBRATION LANE %c %s\n", laneLetter((LaneId) i), ok ? "OK" : "FAILED");
  }
}

/* ================================== LIFECYCLE =================================== */
void IntersectionControlModule::start() {
  if (!ready_)
    initOnce();
  if (controller_->start(millis())) {
    enabled = true;
    setIntervalFromNow(0);
  }
}

void IntersectionControlModule::stop() {
  if (controller_)
    controller_->stop();
}

IntersectionSnapshot IntersectionControlModule::getCurrentState() const {
  if (!controller_)
    return IntersectionSnapshot();
  return controller_->getCurrentState();
}

/* =================================== TX SNAPSHOT ================================== */
void IntersectionControlModule::sendSnapshot_() {
  const IntersectionSnapshot snap = controller_->getCurrentState();

  char         json[224];
  const size_t len = encodeSnapshotJson(snap, json, sizeof(json));
  if (len == 0) {
    ICM_LOGW("sendSnapshot_: ENCODE OVERFLOW\n");
    return;
  }

  meshtastic_MeshPacket* pkt = allocDataPacket();
  if (!pkt) {
    LOG_ERROR("sendSnapshot_: OOM\n");
    return;
  }

  pkt->to       = NODENUM_BROADCAST;
  pkt->want_ack = false;

  const size_t cap          = sizeof(pkt->decoded.payload.bytes);
  const size_t n            = (len < cap) ? len : cap;
  pkt->decoded.payload.size = n;
  memcpy(pkt->decoded.payload.bytes, json, n);

  service->sendToMesh(pkt);

  ICM_LOGD("snapshot_tx: %s\n", json);
}

void IntersectionControlModule::printStatus_() {
  const IntersectionSnapshot s = controller_->getCurrentState();
  ICM_LOGI("SIGNAL: %-8s | LANE A: %2lu veh, %5.1f km/h | LANE B: %2lu veh, %5.1f km/h\n",
           signalName(s.signal),
           (unsigned long) s.laneA.count,
           (double) s.laneA.speedKmh,
           (unsigned long) s.laneB.count,
           (double) s.laneB.speedKmh);
}

/* =============================== RX ON PRIVATE_APP =============================== */
ProcessMessage IntersectionControlModule::handleReceived(const meshtastic_MeshPacket& p) {
  if (p.which_payload_variant != meshtastic_MeshPacket_decoded_tag)
    return ProcessMessage::CONTINUE;
  if (p.decoded.portnum != kPort)
    return ProcessMessage::CONTINUE;

  const size_t n = p.decoded.payload.size;
  if (n == 0 || n >= sizeof(p.decoded.payload.bytes))
    return ProcessMessage::CONTINUE;

  char         buf[256];
  const size_t m = (n < sizeof(buf) - 1) ? n : sizeof(buf) - 1;
  memcpy(buf, p.decoded.payload.bytes, m);
  buf[m] = '\0';

  TrafficCommand cmd;
  if (!parseTrafficCommand(buf, cmd)) {
    ICM_LOGD("rx: IGNORED PAYLOAD %s\n", buf);
    return ProcessMessage::CONTINUE;
  }

  switch (cmd.type) {
    case CMD_CALIBRATE:
      calSamples_[cmd.lane] = cmd.samples;
      calPending_[cmd.lane] = true;
      ICM_LOGI("rx: CALIBRATION REQUESTED LANE %c (n=%u)\n",
               laneLetter(cmd.lane),
               (unsigned) cmd.samples);
      break;
    case CMD_START:
      ICM_LOGI("rx: START\n");
      start();
      break;
    case CMD_STOP:
      ICM_LOGI("rx: STOP\n");
      stop();
      break;
    case CMD_NONE:
    default:
      break;
  }

  return ProcessMessage::CONTINUE;
}
