#include "comms/CommandServer.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdarg.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Params.h"
#include "comms/Protocol.h"
#include "utils/Clock.h"
#include "utils/Log.h"

/*
===============================================================================
  CommandServer.cpp
===============================================================================

  Key behavior:
  - EAGAIN / EWOULDBLOCK is the normal "nothing yet" case and is silent
  - EOF, ECONNRESET and any other client error -> close client, keep serving
  - Invalid frame length -> header dropped, stream continues
  - Undecodable payload -> frame consumed, stream continues
===============================================================================
*/

static bool setNonBlocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

const char* serveResultName(ServeResult r) {
  switch (r) {
    case ServeResult::CONTINUE:     return "continue";
    case ServeResult::RESTART:      return "restart";
    case ServeResult::SHUTDOWN:     return "shutdown";
    case ServeResult::LISTEN_FAULT: return "listen fault";
  }
  return "?";
}

CommandServer::CommandServer(uint16_t port, DriveTrain& drive, HardwareWatchdog& watchdog)
: _port(port),
  _drive(drive),
  _watchdog(watchdog)
{
  _payload.reserve(MAX_FRAME_BYTES);
  memset(_note_buf, 0, sizeof(_note_buf));
}

CommandServer::~CommandServer() {
  end();
}

bool CommandServer::begin() {
  if (_listen_fd >= 0) return true;

  _listen_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (_listen_fd < 0) {
    LOG_ERROR("Link", "socket() failed: %s", strerror(errno));
    return false;
  }

  int opt = 1;
  if (setsockopt(_listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
    LOG_WARN("Link", "SO_REUSEADDR failed: %s", strerror(errno));
  }

  struct sockaddr_in addr = {};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(_port);

  if (::bind(_listen_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    LOG_ERROR("Link", "bind(%u) failed: %s", (unsigned)_port, strerror(errno));
    end();
    return false;
  }

  if (::listen(_listen_fd, SERVER_LISTEN_BACKLOG) < 0) {
    LOG_ERROR("Link", "listen() failed: %s", strerror(errno));
    end();
    return false;
  }

  if (!setNonBlocking(_listen_fd)) {
    LOG_ERROR("Link", "O_NONBLOCK on listener failed: %s", strerror(errno));
    end();
    return false;
  }

  struct sockaddr_in bound = {};
  socklen_t len = sizeof(bound);
  if (getsockname(_listen_fd, (struct sockaddr*)&bound, &len) == 0) {
    _bound_port = ntohs(bound.sin_port);
  } else {
    _bound_port = _port;
  }

  _decoder.reset();
  _last_stats_ms = 0;

  LOG_INFO("Link", "Server ready on port %u", (unsigned)_bound_port);
  return true;
}

void CommandServer::end() {
  if (_client_fd >= 0) dropClient_("server closing");

  if (_listen_fd >= 0) {
    ::close(_listen_fd);
    _listen_fd = -1;
  }
  _bound_port = 0;
}

ServeResult CommandServer::tick(uint32_t now_ms) {
  // Fed regardless of client state: the watchdog guards this loop itself
  _watchdog.feed();

  if (_listen_fd < 0) return ServeResult::LISTEN_FAULT;

  if (!acceptPending_(now_ms)) return ServeResult::LISTEN_FAULT;

  if (_client_fd >= 0) {
    const ServeResult r = drainClient_(now_ms);
    if (r != ServeResult::CONTINUE) return r;
  }

  if (_client_fd >= 0 && (now_ms - _last_rx_ms) > CLIENT_INACTIVITY_MS) {
    LOG_WARN("Link", "No data for %lu ms", (unsigned long)(now_ms - _last_rx_ms));
    dropClient_("inactivity timeout");
  }

  logStats_(now_ms);
  return ServeResult::CONTINUE;
}

ServeResult CommandServer::serve() {
  for (;;) {
    waitReadable_(SERVER_POLL_MS);

    const ServeResult r = tick(millis());
    if (r != ServeResult::CONTINUE) return r;
  }
}

bool CommandServer::acceptPending_(uint32_t now_ms) {
  for (;;) {
    struct sockaddr_in client_addr;
    socklen_t addr_len = sizeof(client_addr);

    const int fd = ::accept(_listen_fd, (struct sockaddr*)&client_addr, &addr_len);
    if (fd < 0) {
      switch (errno) {
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case EINTR:
        case ECONNABORTED:
        case EPROTO:
          return true;
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
          LOG_WARN("Link", "accept() deferred: %s", strerror(errno));
          return true;
        default:
          LOG_ERROR("Link", "accept() failed: %s", strerror(errno));
          return false;
      }
    }

    char ip[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

    if (_client_fd >= 0) {
      _stats.refused++;
      LOG_WARN("Link", "Refusing %s:%u, a console is already connected",
               ip, (unsigned)ntohs(client_addr.sin_port));
      ::close(fd);
      continue;
    }

    if (!setNonBlocking(fd)) {
      LOG_ERROR("Link", "O_NONBLOCK on client failed: %s", strerror(errno));
      ::close(fd);
      continue;
    }

    // Acks are tiny; do not let Nagle sit on them
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    _client_fd = fd;
    _decoder.reset();
    _last_rx_ms = now_ms;
    _stats.clients++;

    LOG_INFO("Link", "Client connected: %s:%u", ip, (unsigned)ntohs(client_addr.sin_port));
  }
}

ServeResult CommandServer::drainClient_(uint32_t now_ms) {
  uint8_t chunk[RX_CHUNK_BYTES];

  for (int i = 0; i < RX_MAX_CHUNKS_PER_TICK && _client_fd >= 0; i++) {
    const ssize_t n = ::recv(_client_fd, chunk, sizeof(chunk), 0);

    if (n > 0) {
      _last_rx_ms = now_ms;
      _decoder.push(chunk, (size_t)n);

      const ServeResult r = processFrames_(now_ms);
      if (r != ServeResult::CONTINUE) return r;
      continue;
    }

    if (n == 0) {
      dropClient_("client disconnected");
      break;
    }

    if (errno == EAGAIN || errno == EWOULDBLOCK) break;   // nothing to read
    if (errno == EINTR) continue;

    if (errno == ECONNRESET) {
      dropClient_("connection reset by peer");
    } else {
      LOG_ERROR("Link", "recv() failed: %s", strerror(errno));
      dropClient_("recv error");
    }
    break;
  }

  return ServeResult::CONTINUE;
}

ServeResult CommandServer::processFrames_(uint32_t now_ms) {
  for (;;) {
    const FrameDecoder::Result r = _decoder.next(_payload);

    if (r == FrameDecoder::Result::NEED_MORE) return ServeResult::CONTINUE;

    if (r == FrameDecoder::Result::REJECTED) {
      _stats.rejected++;
      note_(now_ms, "RX REJECT len=%lu", (unsigned long)_decoder.lastRejectedLength());
      LOG_WARN("Link", "Dropped frame header with invalid length %lu",
               (unsigned long)_decoder.lastRejectedLength());
      continue;
    }

    const ServeResult sr = handlePayload_(now_ms);
    if (sr != ServeResult::CONTINUE) return sr;
  }
}

ServeResult CommandServer::handlePayload_(uint32_t now_ms) {
  CommandFrame cmd;
  if (!protocol::decodeCommand(_payload.data(), _payload.size(), cmd) || !cmd.valid) {
    _stats.fail++;
    note_(now_ms, "RX FAIL len=%u", (unsigned)_payload.size());
    LOG_WARN("Link", "Command decode failed (len=%u, ok=%lu fail=%lu)",
             (unsigned)_payload.size(),
             (unsigned long)_stats.ok,
             (unsigned long)_stats.fail);
    return ServeResult::CONTINUE;
  }
  _stats.ok++;
  note_(now_ms, "RX OK id=%lld len=%u",
        cmd.has_cmd_id ? (long long)cmd.cmd_id : -1LL,
        (unsigned)_payload.size());

  switch (cmd.directive) {
    case Directive::RESTART:
      LOG_WARN("Link", "Restart directive received");
      sendAck_(cmd);
      dropClient_("restart directive");
      return ServeResult::RESTART;

    case Directive::SHUTDOWN:
      LOG_WARN("Link", "Shutdown directive received");
      sendAck_(cmd);
      delayMs(SHUTDOWN_ACK_DELAY_MS);
      dropClient_("shutdown directive");
      return ServeResult::SHUTDOWN;

    case Directive::UNKNOWN:
      LOG_WARN("Link", "Ignoring unknown directive");
      return ServeResult::CONTINUE;

    case Directive::NONE:
      break;
  }

  _drive.apply(cmd.wheels, now_ms);

  LOG_DEBUG("Link", "cmd lf=%.2f lr=%.2f rf=%.2f rr=%.2f id=%lld",
            cmd.wheels.lf, cmd.wheels.lr, cmd.wheels.rf, cmd.wheels.rr,
            cmd.has_cmd_id ? (long long)cmd.cmd_id : -1LL);

  // Motors are already applied; ack failure only costs a latency sample
  sendAck_(cmd);
  return ServeResult::CONTINUE;
}

void CommandServer::sendAck_(const CommandFrame& cmd) {
  if (!cmd.has_cmd_id || _client_fd < 0) return;

  if (!protocol::encodeAck(cmd.cmd_id, _tx)) {
    _stats.ack_fail++;
    LOG_ERROR("Link", "Ack encode failed for cmd_id=%lld", (long long)cmd.cmd_id);
    return;
  }

  const ssize_t n = ::send(_client_fd, _tx.data(), _tx.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
  if (n != (ssize_t)_tx.size()) {
    _stats.ack_fail++;
    LOG_WARN("Link", "Ack for cmd_id=%lld not sent: %s",
             (long long)cmd.cmd_id,
             n < 0 ? strerror(errno) : "short write");
    return;
  }
  _stats.acks++;
}

void CommandServer::dropClient_(const char* reason) {
  if (_client_fd < 0) return;

  ::close(_client_fd);
  _client_fd = -1;
  _decoder.reset();

  LOG_INFO("Link", "Client closed (%s)", reason);
}

void CommandServer::waitReadable_(int timeout_ms) {
  struct pollfd fds[2];
  nfds_t n = 0;

  if (_listen_fd >= 0) {
    fds[n].fd = _listen_fd;
    fds[n].events = POLLIN;
    fds[n].revents = 0;
    n++;
  }
  if (_client_fd >= 0) {
    fds[n].fd = _client_fd;
    fds[n].events = POLLIN;
    fds[n].revents = 0;
    n++;
  }

  if (::poll(fds, n, timeout_ms) < 0 && errno != EINTR) {
    LOG_ERROR("Link", "poll() failed: %s", strerror(errno));
    delayMs((uint32_t)timeout_ms);
  }
}

void CommandServer::logStats_(uint32_t now_ms) {
  if (_last_stats_ms == 0) {
    _last_stats_ms = now_ms;
    return;
  }
  if ((now_ms - _last_stats_ms) < STATS_LOG_INTERVAL_MS) return;
  _last_stats_ms = now_ms;

  const FrameDecoder::Stats& d = _decoder.stats();
  LOG_INFO("Link", "RX frames=%lu ok=%lu fail=%lu rejected=%lu max_len=%lu acks=%lu refused=%lu",
           (unsigned long)d.frames,
           (unsigned long)_stats.ok,
           (unsigned long)_stats.fail,
           (unsigned long)_stats.rejected,
           (unsigned long)d.max_len_seen,
           (unsigned long)_stats.acks,
           (unsigned long)_stats.refused);
}

void CommandServer::note_(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_ms = now_ms;
  _has_note = true;
}

const char* CommandServer::debugNote(uint32_t now_ms) const {
  if (!_has_note || (now_ms - _note_ms) > DEBUG_NOTE_MS) return nullptr;
  return _note_buf;
}
