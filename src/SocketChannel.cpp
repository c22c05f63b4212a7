/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/SocketChannel.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <arpa/inet.h>
#include <chrono>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "SocketChannel.h"
#include "WireCodec.h"

static const int SEND_STALL_TIMEOUT_MS = 5000;

const char *channelStatusToString(ChannelStatus s) {
  switch (s) {
  case CHANNEL_OK:
    return "OK";
  case CHANNEL_TIMEOUT:
    return "TIMEOUT";
  case CHANNEL_CLOSED:
    return "CLOSED";
  case CHANNEL_ERROR:
    return "ERROR";
  case CHANNEL_PROTOCOL_ERROR:
    return "PROTOCOL_ERROR";
  default:
    return "UNKNOWN";
  }
}

static unsigned long nowMs() {
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

SocketChannel::SocketChannel(int fd, const std::string &peer) : _fd(fd), _peer(peer), _bytesIn(0) {
  int yes = 1;
  setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
  setsockopt(_fd, SOL_SOCKET, SO_KEEPALIVE, &yes, sizeof(yes));
}

SocketChannel::~SocketChannel() {
  if (_fd >= 0) close(_fd);
}

void SocketChannel::shutdownBoth() {
  if (_fd >= 0) shutdown(_fd, SHUT_RDWR);
}

/**
 * Non-blocking connect bounded by timeoutMs, tried against every resolved
 * address in turn.
 */
int SocketChannel::connectTo(const char *host, uint16_t port, uint32_t timeoutMs, std::string &errorMsg) {
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *res = nullptr;
  std::string portStr = std::to_string(port);
  int gai = getaddrinfo(host, portStr.c_str(), &hints, &res);
  if (gai != 0) {
    errorMsg = std::string("Resolve ") + host + ": " + gai_strerror(gai);
    return -1;
  }

  int fd = -1;
  for (struct addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      errorMsg = std::string("socket: ") + strerror(errno);
      continue;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      struct pollfd pfd;
      pfd.fd = fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      rc = poll(&pfd, 1, (int)timeoutMs);
      if (rc == 1) {
        int soErr = 0;
        socklen_t len = sizeof(soErr);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len);
        rc = (soErr == 0) ? 0 : -1;
        if (soErr != 0) errno = soErr;
      } else {
        if (rc == 0) errno = ETIMEDOUT;
        rc = -1;
      }
    }

    if (rc == 0) {
      fcntl(fd, F_SETFL, flags);
      break;
    }

    errorMsg = std::string("connect ") + host + ":" + portStr + ": " + strerror(errno);
    close(fd);
    fd = -1;
  }

  freeaddrinfo(res);
  return fd;
}

// =================================================================================
// SECTION: SEND
// =================================================================================

bool SocketChannel::writeAll(const uint8_t *data, size_t len, std::string &errorMsg) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(_fd, data + sent, len - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n > 0) {
      sent += (size_t)n;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd;
      pfd.fd = _fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      if (poll(&pfd, 1, SEND_STALL_TIMEOUT_MS) <= 0) {
        errorMsg = "send stalled";
        return false;
      }
      continue;
    }
    errorMsg = std::string("send: ") + strerror(errno);
    return false;
  }
  return true;
}

bool SocketChannel::send(const WireMessage &msg, std::string &errorMsg) {
  std::vector<uint8_t> frame;
  if (!WireCodec::encode(msg, frame, errorMsg)) return false;

  std::lock_guard<std::mutex> lock(_sendMutex);
  return writeAll(frame.data(), frame.size(), errorMsg);
}

// =================================================================================
// SECTION: RECEIVE
// =================================================================================

ChannelStatus SocketChannel::receive(WireMessage &out, uint32_t timeoutMs, std::string &errorMsg) {
  unsigned long deadline = nowMs() + timeoutMs;

  for (;;) {
    WireFrame frame;
    FrameStatus fs = _reader.next(frame, errorMsg);
    if (fs == FRAME_ERROR) return CHANNEL_PROTOCOL_ERROR;
    if (fs == FRAME_READY) {
      return WireCodec::decode(frame, out, errorMsg) ? CHANNEL_OK : CHANNEL_PROTOCOL_ERROR;
    }

    unsigned long now = nowMs();
    if (now >= deadline) return CHANNEL_TIMEOUT;

    struct pollfd pfd;
    pfd.fd = _fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = poll(&pfd, 1, (int)(deadline - now));
    if (pr < 0) {
      if (errno == EINTR) continue;
      errorMsg = std::string("poll: ") + strerror(errno);
      return CHANNEL_ERROR;
    }
    if (pr == 0) return CHANNEL_TIMEOUT;

    uint8_t buf[64 * 1024];
    ssize_t n = ::recv(_fd, buf, sizeof(buf), 0);
    if (n == 0) {
      errorMsg = "peer closed connection";
      return CHANNEL_CLOSED;
    }
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      errorMsg = std::string("recv: ") + strerror(errno);
      return CHANNEL_ERROR;
    }
    _bytesIn += (uint64_t)n;
    _reader.feed(buf, (size_t)n);
  }
}
