/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Util    : Compact JSON (Snapshot TX / Command RX)        *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/
#pragma once

#include <stddef.h>
#include <stdint.h>

#include "traffic/IntersectionSnapshot.h"
#include "traffic/TrafficCommonEnums.h"

/* ==============================[ OPERATOR COMMANDS ]============================
 *  {"t":"CAL","lane":"A","n":10}  -> RECALIBRATE LANE (n OPTIONAL)
 *  {"t":"START"}                  -> ARM CONTROL LOOP
 *  {"t":"STOP"}                   -> COOPERATIVE STOP
 * ==============================================================================*/
enum CommandType : uint8_t { CMD_NONE = 0, CMD_CALIBRATE, CMD_START, CMD_STOP };

struct TrafficCommand {
  CommandType type    = CMD_NONE;
  LaneId      lane    = LANE_A;
  uint8_t     samples = 0;  // 0 = USE DSC_CALIBRATION_SAMPLES
};

/**
 * ENCODE A SNAPSHOT FOR THE DASHBOARD / MESH
 *
 * {"laneA":{"count":N,"speed":F},"laneB":{...},"signal":"RED","lane":"A",
 *  "green":S,"timestamp":T}
 *
 * @return BYTES WRITTEN (WITHOUT NUL), 0 IF THE BUFFER IS TOO SMALL
 */
size_t encodeSnapshotJson(const IntersectionSnapshot& snap, char* out, size_t outSz);

/**
 * PARSE ONE NUL-TERMINATED COMMAND PAYLOAD
 *
 * @return false FOR MALFORMED OR UNKNOWN PAYLOADS (out UNTOUCHED)
 */
bool parseTrafficCommand(const char* s, TrafficCommand& out);

/* ---------- LOW-LEVEL FIELD FINDERS (FLAT OBJECTS ONLY) ---------- */
bool jsonFindUInt(const char* s, const char* key, uint32_t& out);
bool jsonFindStr(const char* s, const char* key, char* out, size_t outSz);
