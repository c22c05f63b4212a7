/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/SocketChannel.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * One framed TCP connection. Owns the socket descriptor (closed on
 * destruction). Sends are serialized by a mutex so the telemetry publisher
 * and the reader thread can both write; receives belong to one thread.
 * =================================================================================
 */
#pragma once
#include <mutex>
#include <string>

#include "FrameReader.h"
#include "WireTypes.h"

enum ChannelStatus : uint8_t {
  CHANNEL_OK,
  CHANNEL_TIMEOUT,        // Nothing complete arrived in time
  CHANNEL_CLOSED,         // Orderly shutdown by the peer
  CHANNEL_ERROR,          // Socket error (ConnectionError)
  CHANNEL_PROTOCOL_ERROR  // Bad framing or header (ProtocolError)
};

class SocketChannel {
public:
  SocketChannel(int fd, const std::string &peer);
  ~SocketChannel();

  SocketChannel(const SocketChannel &) = delete;
  SocketChannel &operator=(const SocketChannel &) = delete;

  // Returns a connected descriptor or -1 with errorMsg set.
  static int connectTo(const char *host, uint16_t port, uint32_t timeoutMs, std::string &errorMsg);

  bool send(const WireMessage &msg, std::string &errorMsg);
  ChannelStatus receive(WireMessage &out, uint32_t timeoutMs, std::string &errorMsg);

  // Wakes a blocked receive() from another thread.
  void shutdownBoth();

  const std::string &peer() const { return _peer; }
  uint64_t bytesReceived() const { return _bytesIn; }

private:
  int _fd;
  std::string _peer;
  std::mutex _sendMutex;
  FrameReader _reader;
  uint64_t _bytesIn;

  bool writeAll(const uint8_t *data, size_t len, std::string &errorMsg);
};

extern const char *channelStatusToString(ChannelStatus s);
