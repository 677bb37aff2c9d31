#pragma once
#include <cstdint>
#include <vector>

#include "comms/FrameDecoder.h"
#include "comms/Messages.h"
#include "control/DriveTrain.h"
#include "system/HardwareWatchdog.h"

/*
===============================================================================
  CommandServer.h
===============================================================================

  PURPOSE
  -------
  Robot-side TCP link to the operator console:

    - Non-blocking listening socket, one client at a time
    - Drain available bytes into a FrameDecoder
    - Decode command frames and apply them to the DriveTrain
    - Ack frames that carry a cmd_id
    - Drop the client after CLIENT_INACTIVITY_MS of silence
    - Feed the hardware watchdog every iteration, client or not

  IMPORTANT
  ---------
  Client faults (reset, EOF, recv/send errors, garbage frames) never leave
  this class: the client is closed and the server keeps listening. Only a
  fault on the listening socket is reported (LISTEN_FAULT) so the supervisor
  can rebuild the link.

  A second console connecting while one is active is refused (accepted and
  closed immediately).

===============================================================================
*/

enum class ServeResult : uint8_t {
  CONTINUE = 0,   // keep calling tick()
  RESTART,        // "restart" directive: caller re-enters listening
  SHUTDOWN,       // "shutdown" directive: caller resets the device
  LISTEN_FAULT,   // listening socket unusable
};

const char* serveResultName(ServeResult r);

class CommandServer {
public:
  struct Stats {
    uint32_t clients = 0;       // accepted sessions
    uint32_t refused = 0;       // connections refused while busy
    uint32_t ok = 0;            // payloads decoded
    uint32_t fail = 0;          // payloads that failed to decode
    uint32_t rejected = 0;      // headers with invalid length
    uint32_t acks = 0;          // acks sent
    uint32_t ack_fail = 0;      // acks that could not be sent
  };

  // port 0 binds an ephemeral port (see boundPort())
  CommandServer(uint16_t port, DriveTrain& drive, HardwareWatchdog& watchdog);
  ~CommandServer();

  CommandServer(const CommandServer&) = delete;
  CommandServer& operator=(const CommandServer&) = delete;

  // Open the listening socket. False (and logged) on failure.
  bool begin();

  // Close client and listening socket.
  void end();

  // One service iteration. Never blocks.
  ServeResult tick(uint32_t now_ms);

  // Loop: wait up to SERVER_POLL_MS for readiness, then tick(), until a
  // result other than CONTINUE.
  ServeResult serve();

  bool listening() const { return _listen_fd >= 0; }
  bool hasClient() const { return _client_fd >= 0; }
  uint16_t boundPort() const { return _bound_port; }

  const Stats& stats() const { return _stats; }
  const FrameDecoder& decoder() const { return _decoder; }

  // Short RX debug note (last RX event), nullptr once DEBUG_NOTE_MS old
  const char* debugNote(uint32_t now_ms) const;

private:
  bool acceptPending_(uint32_t now_ms);
  ServeResult drainClient_(uint32_t now_ms);
  ServeResult processFrames_(uint32_t now_ms);
  ServeResult handlePayload_(uint32_t now_ms);
  void sendAck_(const CommandFrame& cmd);
  void dropClient_(const char* reason);
  void waitReadable_(int timeout_ms);
  void logStats_(uint32_t now_ms);
  void note_(uint32_t now_ms, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

  uint16_t _port;
  uint16_t _bound_port = 0;

  DriveTrain& _drive;
  HardwareWatchdog& _watchdog;

  int _listen_fd = -1;
  int _client_fd = -1;

  // ConnectionBuffer: reset on every connect / disconnect
  FrameDecoder _decoder;
  std::vector<uint8_t> _payload;
  std::vector<uint8_t> _tx;

  uint32_t _last_rx_ms = 0;
  uint32_t _last_stats_ms = 0;

  char _note_buf[96];
  uint32_t _note_ms = 0;
  bool _has_note = false;

  Stats _stats;
};
