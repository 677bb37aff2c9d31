#include "comms/FrameDecoder.h"

#include "Params.h"
#include "comms/Protocol.h"

void FrameDecoder::reset() {
  _buf.clear();
  _stage = Stage::AWAITING_HEADER;
  _expected = 0;
}

void FrameDecoder::push(const uint8_t* data, size_t len) {
  if (!data || len == 0) return;
  _buf.insert(_buf.end(), data, data + len);
}

void FrameDecoder::consume_(size_t n) {
  if (n >= _buf.size()) {
    _buf.clear();
    return;
  }
  _buf.erase(_buf.begin(), _buf.begin() + (std::ptrdiff_t)n);
}

FrameDecoder::Result FrameDecoder::next(std::vector<uint8_t>& payload) {
  if (_stage == Stage::AWAITING_HEADER) {
    if (_buf.size() < FRAME_HEADER_BYTES) return Result::NEED_MORE;

    const uint32_t len = protocol::readFrameLength(_buf.data());
    consume_(FRAME_HEADER_BYTES);

    if (!protocol::frameLengthValid(len)) {
      _last_rejected = len;
      _stats.rejected++;
      return Result::REJECTED;
    }

    _expected = len;
    _stage = Stage::AWAITING_BODY;
  }

  if (_buf.size() < _expected) return Result::NEED_MORE;

  payload.assign(_buf.begin(), _buf.begin() + (std::ptrdiff_t)_expected);
  consume_(_expected);

  _stats.frames++;
  if (_expected > _stats.max_len_seen) _stats.max_len_seen = _expected;

  _expected = 0;
  _stage = Stage::AWAITING_HEADER;
  return Result::FRAME;
}
