#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/*
===============================================================================
  FrameDecoder.h
===============================================================================

  PURPOSE
  -------
  Reassembles length-prefixed frames from a TCP byte stream:

    - push() appends whatever recv() returned
    - next() pops one complete payload at a time
    - AWAITING_HEADER (need 4 bytes) -> AWAITING_BODY (need N bytes)

  IMPORTANT
  ---------
  A header declaring a length outside (0, MAX_FRAME_BYTES] is dropped on the
  spot (only its 4 bytes are discarded) and parsing resumes at the following
  byte. The decoder never waits for, or buffers, an oversized body.

===============================================================================
*/

class FrameDecoder {
public:
  enum class Stage : uint8_t {
    AWAITING_HEADER = 0,
    AWAITING_BODY,
  };

  enum class Result : uint8_t {
    NEED_MORE = 0,   // no complete frame buffered
    FRAME,           // payload filled with one frame body
    REJECTED,        // invalid header dropped (see lastRejectedLength())
  };

  struct Stats {
    uint32_t frames = 0;          // complete payloads returned
    uint32_t rejected = 0;        // headers dropped for invalid length
    uint32_t max_len_seen = 0;    // largest accepted payload
  };

  FrameDecoder() = default;

  // Clear buffered bytes and return to AWAITING_HEADER. Stats are kept.
  void reset();

  void push(const uint8_t* data, size_t len);

  // Pops at most one frame (or one rejected header) per call.
  Result next(std::vector<uint8_t>& payload);

  Stage stage() const { return _stage; }

  // Declared length of the frame being assembled (0 in AWAITING_HEADER)
  uint32_t pendingLength() const { return _expected; }

  size_t buffered() const { return _buf.size(); }

  uint32_t lastRejectedLength() const { return _last_rejected; }

  const Stats& stats() const { return _stats; }

private:
  void consume_(size_t n);

  std::vector<uint8_t> _buf;

  Stage _stage = Stage::AWAITING_HEADER;
  uint32_t _expected = 0;
  uint32_t _last_rejected = 0;

  Stats _stats;
};
