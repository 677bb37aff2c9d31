#pragma once
#include <cstddef>
#include <cstdint>

/*
  Params.h

  Purpose:
  Central location for controller constants and tunable parameters.

  Board:
  Linux single-board computer driving four DC motors through H-bridges.

  Convention:
  - Times: milliseconds (ms) unless explicitly noted
  - Wheel targets: normalized [-1.0, +1.0]
  - PWM duty: 16-bit counts (0..PWM_DUTY_MAX)
*/

/* ============================================================================
   MOTOR SHAPING
============================================================================ */

// |target| below this is treated as exactly zero (stick noise near center)
constexpr float MOTOR_DEADZONE = 0.02f;

// Smallest nonzero duty fraction; below this the gearmotors stall
constexpr float MOTOR_MIN_DUTY = 0.35f;

// Output resolution (duty_u16 style)
constexpr uint16_t PWM_DUTY_MAX = 65535;
constexpr uint32_t PWM_FREQUENCY_HZ = 1000;
constexpr uint32_t PWM_PERIOD_NS = 1000000000UL / PWM_FREQUENCY_HZ;

/* ============================================================================
   SAFETY
============================================================================ */

// Safety monitor polling interval
constexpr uint32_t SAFETY_POLL_MS = 100;

// Command age after which a stopped robot is forced into emergency stop
constexpr uint32_t SAFETY_STALE_MS = 2000;

// Hardware watchdog timeout (seconds, device granularity)
constexpr int WATCHDOG_TIMEOUT_S = 8;

/* ============================================================================
   NETWORK / PROTOCOL
============================================================================ */

constexpr uint16_t SERVER_PORT = 65432;
constexpr int SERVER_LISTEN_BACKLOG = 1;

// Bounded wait per server iteration
constexpr int SERVER_POLL_MS = 10;

// Client is dropped if it sends nothing for this long
constexpr uint32_t CLIENT_INACTIVITY_MS = 30000;

// Frame = 4-byte big-endian length + MessagePack payload
constexpr size_t FRAME_HEADER_BYTES = 4;
constexpr uint32_t MAX_FRAME_BYTES = 1024;

// ArduinoJson pool for one decoded payload (small flat maps only)
constexpr size_t PROTOCOL_DOC_BYTES = 512;

// recv() chunking; the per-tick cap keeps a flooding client from starving
// the watchdog feed
constexpr size_t RX_CHUNK_BYTES = 512;
constexpr int RX_MAX_CHUNKS_PER_TICK = 16;

// Time given to the ack to leave before a shutdown directive resets the board
constexpr uint32_t SHUTDOWN_ACK_DELAY_MS = 200;

// RX statistics line in the log
constexpr uint32_t STATS_LOG_INTERVAL_MS = 30000;
constexpr uint32_t DEBUG_NOTE_MS = 1500;          // RX debug note lifetime

/* ============================================================================
   NETWORK LINK BRING-UP
============================================================================ */

constexpr int LINK_MAX_RETRIES = 10;
constexpr uint32_t LINK_RETRY_DELAY_MS = 2000;

/* ============================================================================
   DEBUG / SAFETY FLAGS
============================================================================ */

constexpr bool ENABLE_WATCHDOG = true;
constexpr bool ENABLE_DEBUG_LOG = false;
