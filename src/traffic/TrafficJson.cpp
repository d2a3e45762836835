/**************************************************************
 *   Project : Density Traffic Light System                   *
 *   Util    : Compact JSON (Snapshot TX / Command RX)        *
 *   Author  : Yeray Lois Sanchez                             *
 *   Email   : yerayloissanchez@gmail.com                     *
 **************************************************************/

#include "TrafficJson.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

/* ================================ SNAPSHOT ENCODER =============================== */
size_t encodeSnapshotJson(const IntersectionSnapshot& snap, char* out, size_t outSz) {
  if (!out || outSz == 0)
    return 0;

  const char lane[2] = {laneLetter(snap.currentLane), '\0'};
  const int  n       = snprintf(out,
                         outSz,
                         "{\"laneA\":{\"count\":%lu,\"speed\":%.1f},"
                         "\"laneB\":{\"count\":%lu,\"speed\":%.1f},"
                         "\"signal\":\"%s\",\"lane\":\"%s\",\"green\":%lu,\"timestamp\":%lu}",
                         (unsigned long) snap.laneA.count,
                         (double) snap.laneA.speedKmh,
                         (unsigned long) snap.laneB.count,
                         (double) snap.laneB.speedKmh,
                         signalName(snap.signal),
                         lane,
                         (unsigned long) snap.greenTimeS,
                         (unsigned long) snap.timestampMs);
  if (n < 0 || (size_t) n >= outSz) {
    out[0] = '\0';
    return 0;
  }
  return (size_t) n;
}

/* ================================ FIELD FINDERS ================================== */
static const char* valueAfterKey_(const char* s, const char* key) {
  const char* p = strstr(s, key);
  if (!p)
    return nullptr;
  p = strchr(p + strlen(key), ':');
  if (!p)
    return nullptr;
  p++;
  while (*p == ' ')
    p++;
  return p;
}

bool jsonFindUInt(const char* s, const char* key, uint32_t& out) {
  const char* p = valueAfterKey_(s, key);
  if (!p || !isdigit((unsigned char) *p))
    return false;
  // CLAMP BEFORE NARROWING: OVERSIZED VALUES SATURATE INSTEAD OF WRAPPING
  const unsigned long v = strtoul(p, nullptr, 10);
  out                   = (v > 0xFFFFFFFFUL) ? 0xFFFFFFFFUL : (uint32_t) v;
  return true;
}

bool jsonFindStr(const char* s, const char* key, char* out, size_t outSz) {
  if (outSz == 0)
    return false;
  const char* p = valueAfterKey_(s, key);
  if (!p || *p != '\"')
    return false;
  p++;
  size_t i = 0;
  while (*p && *p != '\"' && i < outSz - 1)
    out[i++] = *p++;
  out[i] = '\0';
  return (*p == '\"');
}

/* ================================ COMMAND PARSER ================================= */
bool parseTrafficCommand(const char* s, TrafficCommand& out) {
  if (!s)
    return false;

  char type[8] = {0};
  if (!jsonFindStr(s, "\"t\"", type, sizeof(type)))
    return false;

  TrafficCommand cmd;
  if (strcmp(type, "START") == 0) {
    cmd.type = CMD_START;
  } else if (strcmp(type, "STOP") == 0) {
    cmd.type = CMD_STOP;
  } else if (strcmp(type, "CAL") == 0) {
    char lane[4] = {0};
    if (!jsonFindStr(s, "\"lane\"", lane, sizeof(lane)))
      return false;
    if (strcmp(lane, "A") == 0)
      cmd.lane = LANE_A;
    else if (strcmp(lane, "B") == 0)
      cmd.lane = LANE_B;
    else
      return false;

    uint32_t n = 0;
    if (jsonFindUInt(s, "\"n\"", n))
      cmd.samples = (n > 255U) ? 255U : (uint8_t) n;
    cmd.type = CMD_CALIBRATE;
  } else {
    return false;
  }

  out = cmd;
  return true;
}
