#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements the length-prefixed MessagePack protocol helpers.

  Notes:
  - Payload encode/decode uses ArduinoJson (MessagePack flavour) with
    fixed-size documents, so a hostile payload cannot grow the heap.
  - Decode never fails because of a missing or odd wheel value; those read
    as 0. Only a payload that is not a map (or not MessagePack) is rejected.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>

#include <cmath>

#include "Params.h"


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Convert directive string -> enum
static Directive parseDirective(const char* s) {
  if (!s) return Directive::UNKNOWN;
  if (strcmp(s, "restart") == 0)  return Directive::RESTART;
  if (strcmp(s, "shutdown") == 0) return Directive::SHUTDOWN;
  return Directive::UNKNOWN;
}

static const char* directiveName(Directive d) {
  switch (d) {
    case Directive::RESTART:  return "restart";
    case Directive::SHUTDOWN: return "shutdown";
    default:                  return nullptr;
  }
}

// Missing / non-numeric / non-finite -> 0, then clamp.
// Clamped as double: a float64 beyond float range still maps to +-1.
static float readWheel(JsonObject obj, const char* key) {
  const double v = obj[key] | 0.0;
  if (!std::isfinite(v)) return 0.0f;
  if (v > 1.0) return 1.0f;
  if (v < -1.0) return -1.0f;
  return (float)v;
}

static bool serializeFramed(const JsonDocument& doc, std::vector<uint8_t>& out) {
  const size_t need = measureMsgPack(doc);
  if (need == 0 || need > MAX_FRAME_BYTES) return false;

  std::vector<uint8_t> payload(need);
  if (serializeMsgPack(doc, payload.data(), payload.size()) != need) return false;

  out.clear();
  return protocol::appendFrame(payload.data(), payload.size(), out);
}


namespace protocol {

/*=============================================================================
  FRAMING
=============================================================================*/

uint32_t readFrameLength(const uint8_t* header) {
  return ((uint32_t)header[0] << 24) |
         ((uint32_t)header[1] << 16) |
         ((uint32_t)header[2] << 8)  |
         (uint32_t)header[3];
}

bool frameLengthValid(uint32_t len) {
  return len > 0 && len <= MAX_FRAME_BYTES;
}

bool appendFrame(const uint8_t* payload, size_t len, std::vector<uint8_t>& out) {
  if (len > MAX_FRAME_BYTES || !frameLengthValid((uint32_t)len)) return false;

  const uint32_t n = (uint32_t)len;
  out.reserve(out.size() + FRAME_HEADER_BYTES + len);
  out.push_back((uint8_t)(n >> 24));
  out.push_back((uint8_t)(n >> 16));
  out.push_back((uint8_t)(n >> 8));
  out.push_back((uint8_t)n);
  out.insert(out.end(), payload, payload + len);
  return true;
}


/*=============================================================================
  ENCODE
=============================================================================*/

bool encodeAck(int64_t cmd_id, std::vector<uint8_t>& out) {
  StaticJsonDocument<128> doc;
  doc["cmd_id"] = cmd_id;
  return serializeFramed(doc, out);
}

bool encodeCommand(const CommandFrame& cmd, std::vector<uint8_t>& out) {
  StaticJsonDocument<384> doc;

  if (cmd.directive != Directive::NONE) {
    const char* name = directiveName(cmd.directive);
    if (!name) return false;
    doc["command"] = name;
  } else {
    doc["lf"] = cmd.wheels.lf;
    doc["lr"] = cmd.wheels.lr;
    doc["rf"] = cmd.wheels.rf;
    doc["rr"] = cmd.wheels.rr;
  }

  if (cmd.has_cmd_id)
    doc["cmd_id"] = cmd.cmd_id;

  return serializeFramed(doc, out);
}


/*=============================================================================
  DECODE
=============================================================================*/

bool decodeCommand(const uint8_t* payload, size_t len, CommandFrame& out_cmd) {
  out_cmd = CommandFrame();   // reset everything
  if (!payload || len == 0) return false;

  StaticJsonDocument<PROTOCOL_DOC_BYTES> doc;

  if (deserializeMsgPack(doc, payload, len)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  JsonVariant id = obj["cmd_id"];
  if (id.is<int64_t>()) {
    out_cmd.cmd_id = id.as<int64_t>();
    out_cmd.has_cmd_id = true;
  }

  // Directive present: motion fields are not read
  if (obj.containsKey("command")) {
    out_cmd.directive = parseDirective(obj["command"].as<const char*>());
    out_cmd.valid = true;
    return true;
  }

  out_cmd.wheels.lf = readWheel(obj, "lf");
  out_cmd.wheels.lr = readWheel(obj, "lr");
  out_cmd.wheels.rf = readWheel(obj, "rf");
  out_cmd.wheels.rr = readWheel(obj, "rr");

  out_cmd.valid = true;
  return true;
}

}  // namespace protocol
