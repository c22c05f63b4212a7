/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/TargetControlService.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * TCP endpoint of the target. One reader thread per connection, one accept
 * thread and one telemetry publisher.
 * - Every connection must HELLO with the matching protocol version first.
 * - Any connection may CLAIM; only one can own the session.
 * - Command outcomes and releases arrive from the session manager through
 *   IControlListener and are routed to the owning connection.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "AppTypes.h"
#include "ArtifactCatalog.h"
#include "ControlSession.h"
#include "SocketChannel.h"

class TargetControlService : public IControlListener {
public:
  TargetControlService(IControlHAL &hal, ControlSessionManager &session, const ArtifactCatalog &catalog,
                       const TargetSettings &settings);
  ~TargetControlService();

  // Binds the control port (0 = ephemeral) and starts the threads.
  bool start(std::string &errorMsg);
  void stop();

  uint16_t getBoundPort() const { return _boundPort; }
  size_t getConnectionCount();

  // --- IControlListener Implementation ---
  void onCommandCompleted(const char *sessionId, uint32_t sequence, CommandKind kind, RejectReason result,
                          const SnapshotDelta &delta) override;
  void onSessionReleased(const char *sessionId, ReleaseReason reason) override;

private:
  struct Connection {
    uint32_t id;
    std::shared_ptr<SocketChannel> channel;
    std::thread thread;
    std::atomic<bool> finished;
    std::string endpoint;
    std::string ownedSessionId; // Guarded by _connMutex
    bool claimAcknowledged;     // CLAIM_OK sent for ownedSessionId. Guarded by _connMutex
  };

  // Outcome of handling one inbound message
  enum HandleResult : uint8_t { HANDLE_CONTINUE, HANDLE_PROTOCOL_ERROR };

  IControlHAL &_hal;
  ControlSessionManager &_session;
  const ArtifactCatalog &_catalog;
  TargetSettings _settings;

  int _listenFd;
  uint16_t _boundPort;
  std::atomic<bool> _running;
  std::thread _acceptThread;
  std::thread _telemetryThread;

  std::mutex _connMutex;
  std::list<std::shared_ptr<Connection>> _connections;
  std::shared_ptr<Connection> _owner;
  uint32_t _nextConnectionId;
  std::atomic<bool> _fullTelemetryPending;

  // --- Threads ---
  void acceptLoop();
  void connectionLoop(std::shared_ptr<Connection> conn);
  void telemetryLoop();

  // --- Protocol ---
  bool handshake(Connection &conn);
  HandleResult handleMessage(std::shared_ptr<Connection> conn, const WireMessage &msg);
  void handleClaim(std::shared_ptr<Connection> conn, const WireMessage &msg);
  void streamSync(Connection &conn, const WireMessage &request);
  bool sendTo(Connection &conn, const WireMessage &msg);

  // --- Ownership ---
  std::shared_ptr<Connection> ownerFor(const char *sessionId);
  void releaseIfOwner(Connection &conn, ReleaseReason reason);
  void reapFinished();

  void logKeyValue(const char *key, const char *value);
};
