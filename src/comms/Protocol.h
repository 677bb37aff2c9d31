#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the console <-> robot wire protocol.

  Wire format:
    [4-byte big-endian length][length bytes of MessagePack map]
    0 < length <= MAX_FRAME_BYTES
===============================================================================
*/

namespace protocol {

/*=============================================================================
  FRAMING
=============================================================================*/

// Reads the big-endian length prefix (header must hold FRAME_HEADER_BYTES)
uint32_t readFrameLength(const uint8_t* header);

// True if a declared payload length may be buffered
bool frameLengthValid(uint32_t len);

// Appends header + payload to out. Returns false if len is not a valid
// frame length (out is left untouched).
bool appendFrame(const uint8_t* payload, size_t len, std::vector<uint8_t>& out);


/*=============================================================================
  ENCODE
=============================================================================*/

// Ack frame {"cmd_id": id}. Replaces out.
bool encodeAck(int64_t cmd_id, std::vector<uint8_t>& out);

// Full command frame (console side of the contract). Replaces out.
bool encodeCommand(const CommandFrame& cmd, std::vector<uint8_t>& out);


/*=============================================================================
  DECODE
=============================================================================*/

/*
  Attempts to parse one command payload (frame body, no header).

  Returns:
    - true if decoded into out_cmd (and out_cmd.valid will be true)
    - false if the payload is not a MessagePack map or parsing failed
*/
bool decodeCommand(const uint8_t* payload, size_t len, CommandFrame& out_cmd);

}  // namespace protocol
