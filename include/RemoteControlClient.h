/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/RemoteControlClient.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Remote side of the control link. One worker thread owns the connection:
 * connect, HELLO, CLAIM, optional initial sync, then the heartbeat and
 * receive pump. Any disconnect ends in a backoff delay and a fresh CLAIM.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "AppTypes.h"
#include "InitialSync.h"
#include "ReconnectBackoff.h"
#include "SocketChannel.h"

enum LinkStatus : uint8_t {
  LINK_DISCONNECTED,
  LINK_CONNECTING,
  LINK_CLAIMING,
  LINK_SYNCING,
  LINK_ACTIVE,
  LINK_BACKOFF,
  LINK_PAUSED
};

extern const char *linkStatusToString(LinkStatus s);

// Receives everything the link learns. Called from the client thread.
class IRemoteConsumer {
public:
  virtual ~IRemoteConsumer() {}

  virtual void onTelemetry(const HardwareSnapshot &snapshot) = 0;
  virtual void onCommandResult(uint32_t sequence, CommandKind kind, bool accepted, const char *reason,
                               const HardwareSnapshot &snapshot) = 0;
  virtual void onLinkStatus(LinkStatus status, const char *detail) = 0;
};

class RemoteControlClient : public ISyncTransport {
public:
  // 'sync' and 'sink' may be null when no initial sync is wanted.
  RemoteControlClient(IPlatformHAL &hal, const RemoteSettings &settings, InitialSync *sync, ISyncSink *sink);
  ~RemoteControlClient();

  void setConsumer(IRemoteConsumer *consumer) { _consumer = consumer; }

  void start();
  void stop();

  // --- Operator Controls ---
  bool sendCommand(CommandKind kind, uint32_t readCycles, std::string &errorMsg);
  void requestDisconnect(); // Graceful RELEASE, then stay offline
  void requestReconnect();  // Leave PAUSED / skip the current backoff wait

  // --- Status ---
  LinkStatus getLinkStatus() const;
  bool isTelemetryStale() const;
  bool getLastSnapshot(HardwareSnapshot &out) const;
  std::string getSessionId() const;
  uint32_t getReconnectAttempts() const { return _attempts; }
  uint32_t getStaleLinkMs() const;
  size_t getPendingCount() const;

  // --- ISyncTransport Implementation ---
  bool fetchArtifacts(const SyncManifest &manifest, ISyncSink &sink, std::string &errorMsg) override;

private:
  // --- Dependencies ---
  IPlatformHAL &_hal;
  RemoteSettings _settings;
  InitialSync *_sync;
  ISyncSink *_sink;
  IRemoteConsumer *_consumer;
  ReconnectBackoff _backoff;

  // --- Thread Control ---
  std::thread _thread;
  std::atomic<bool> _running;
  std::atomic<bool> _paused;
  std::atomic<uint32_t> _attempts;
  bool _wake;
  std::condition_variable _cv;

  // --- Link State (guarded by _mutex) ---
  mutable std::mutex _mutex;
  LinkStatus _status;
  std::shared_ptr<SocketChannel> _channel;
  std::string _sessionId;
  uint32_t _timeoutMs;
  uint32_t _heartbeatMs;
  uint32_t _nextSequence;
  std::map<uint32_t, CommandKind> _pending;
  HardwareSnapshot _snapshot;
  bool _haveSnapshot;

  // Worker thread only
  unsigned long _lastRxAt;
  unsigned long _lastHeartbeatAt;
  bool _linkLost;

  std::mutex _commandMutex; // Keeps sequence allocation and send in order

  // --- Worker ---
  void run();
  bool connectAndClaim(std::string &errorMsg);
  void sessionLoop();
  void releaseGracefully();
  bool pumpOnce(uint32_t waitMs, std::string &errorMsg);
  bool handleFrame(const WireMessage &msg);
  void closeChannel();

  // --- Helpers ---
  ChannelStatus receiveFrame(WireMessage &out, uint32_t timeoutMs, std::string &errorMsg);
  bool sendFrame(const WireMessage &msg, std::string &errorMsg);
  void maybeHeartbeat();
  bool linkIsStale();
  void setStatus(LinkStatus status, const char *detail);
  void waitInterruptible(uint32_t ms);
  void logKeyValue(const char *key, const char *value);
};
