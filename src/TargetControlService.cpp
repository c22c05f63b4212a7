/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/TargetControlService.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Connection handling and message routing on the target. Session decisions
 * stay in ControlSessionManager; this file only translates between frames
 * and manager calls.
 * =================================================================================
 */
#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "Config.h"
#include "LogicUtils.h"
#include "TargetControlService.h"

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

TargetControlService::TargetControlService(IControlHAL &hal, ControlSessionManager &session,
                                           const ArtifactCatalog &catalog, const TargetSettings &settings)
    : _hal(hal), _session(session), _catalog(catalog), _settings(settings), _listenFd(-1), _boundPort(0),
      _running(false), _nextConnectionId(1), _fullTelemetryPending(false) {}

TargetControlService::~TargetControlService() { stop(); }

void TargetControlService::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

bool TargetControlService::start(std::string &errorMsg) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    errorMsg = std::string("socket: ") + strerror(errno);
    return false;
  }

  int reuse = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(_settings.listenPort);

  if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
    errorMsg = "bind port " + std::to_string(_settings.listenPort) + ": " + strerror(errno);
    close(fd);
    return false;
  }
  if (listen(fd, 8) != 0) {
    errorMsg = std::string("listen: ") + strerror(errno);
    close(fd);
    return false;
  }

  socklen_t len = sizeof(addr);
  if (getsockname(fd, (struct sockaddr *)&addr, &len) == 0) {
    _boundPort = ntohs(addr.sin_port);
  }

  _listenFd = fd;
  _running = true;
  _acceptThread = std::thread(&TargetControlService::acceptLoop, this);
  _telemetryThread = std::thread(&TargetControlService::telemetryLoop, this);

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Listening on TCP port %u", (unsigned)_boundPort);
  logKeyValue("Control", logBuf);
  return true;
}

void TargetControlService::stop() {
  _running = false;

  if (_acceptThread.joinable()) _acceptThread.join();
  if (_telemetryThread.joinable()) _telemetryThread.join();

  if (_listenFd >= 0) {
    close(_listenFd);
    _listenFd = -1;
  }

  std::list<std::shared_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(_connMutex);
    connections.swap(_connections);
  }
  for (auto &conn : connections) conn->channel->shutdownBoth();
  for (auto &conn : connections) {
    if (conn->thread.joinable()) conn->thread.join();
  }

  std::lock_guard<std::mutex> lock(_connMutex);
  _owner.reset();
}

size_t TargetControlService::getConnectionCount() {
  reapFinished();
  std::lock_guard<std::mutex> lock(_connMutex);
  return _connections.size();
}

void TargetControlService::reapFinished() {
  std::list<std::shared_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(_connMutex);
    for (auto it = _connections.begin(); it != _connections.end();) {
      if ((*it)->finished) {
        finished.push_back(*it);
        it = _connections.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &conn : finished) {
    if (conn->thread.joinable()) conn->thread.join();
  }
}

// =================================================================================
// SECTION: ACCEPT LOOP
// =================================================================================

void TargetControlService::acceptLoop() {
  char logBuf[128];

  while (_running) {
    struct pollfd pfd;
    pfd.fd = _listenFd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = poll(&pfd, 1, 250);
    if (pr <= 0) continue;

    struct sockaddr_in peerAddr;
    socklen_t len = sizeof(peerAddr);
    int cfd = accept(_listenFd, (struct sockaddr *)&peerAddr, &len);
    if (cfd < 0) {
      if (errno == EINTR) continue;
      snprintf(logBuf, sizeof(logBuf), "accept() error: %s", strerror(errno));
      logKeyValue("Control", logBuf);
      continue;
    }

    char ip[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &peerAddr.sin_addr, ip, sizeof(ip));
    std::string peer = std::string(ip) + ":" + std::to_string(ntohs(peerAddr.sin_port));

    reapFinished();

    std::lock_guard<std::mutex> lock(_connMutex);
    if (_connections.size() >= _settings.maxConnections) {
      snprintf(logBuf, sizeof(logBuf), "Refusing %s: %u connections open", peer.c_str(),
               (unsigned)_connections.size());
      logKeyValue("Control", logBuf);
      close(cfd);
      continue;
    }

    std::shared_ptr<Connection> conn = std::make_shared<Connection>();
    conn->id = _nextConnectionId++;
    conn->channel = std::make_shared<SocketChannel>(cfd, peer);
    conn->finished = false;
    conn->claimAcknowledged = false;
    _connections.push_back(conn);
    conn->thread = std::thread(&TargetControlService::connectionLoop, this, conn);
  }
}

// =================================================================================
// SECTION: CONNECTION LOOP
// =================================================================================

bool TargetControlService::sendTo(Connection &conn, const WireMessage &msg) {
  std::string err;
  if (conn.channel->send(msg, err)) return true;

  char logBuf[128];
  snprintf(logBuf, sizeof(logBuf), "Send %s to #%u failed: %s", messageTypeToString(msg.type), conn.id, err.c_str());
  logKeyValue("Control", logBuf);
  return false;
}

bool TargetControlService::handshake(Connection &conn) {
  char logBuf[128];
  WireMessage hello;
  std::string err;

  ChannelStatus st = conn.channel->receive(hello, HANDSHAKE_TIMEOUT_MS, err);
  if (st != CHANNEL_OK) {
    snprintf(logBuf, sizeof(logBuf), "#%u handshake failed: %s %s", conn.id, channelStatusToString(st), err.c_str());
    logKeyValue("Control", logBuf);
    return false;
  }
  if (hello.type != MSG_HELLO) {
    snprintf(logBuf, sizeof(logBuf), "#%u ProtocolError: %s before HELLO", conn.id, messageTypeToString(hello.type));
    logKeyValue("Control", logBuf);
    return false;
  }
  if (hello.protocolVersion != FLAPLINK_PROTOCOL_VERSION) {
    snprintf(logBuf, sizeof(logBuf), "#%u ProtocolError: version %u, expected %u", conn.id, hello.protocolVersion,
             (unsigned)FLAPLINK_PROTOCOL_VERSION);
    logKeyValue("Control", logBuf);
    return false;
  }

  conn.endpoint = hello.endpoint.empty() ? conn.channel->peer() : hello.endpoint;

  WireMessage ack(MSG_HELLO_ACK);
  ack.protocolVersion = FLAPLINK_PROTOCOL_VERSION;
  ack.endpoint = DEVICE_NAME;
  if (!sendTo(conn, ack)) return false;

  snprintf(logBuf, sizeof(logBuf), "#%u HELLO from '%s' (%s)", conn.id, conn.endpoint.c_str(),
           conn.channel->peer().c_str());
  logKeyValue("Control", logBuf);
  return true;
}

void TargetControlService::connectionLoop(std::shared_ptr<Connection> conn) {
  char logBuf[160];
  ReleaseReason exitReason = RELEASE_CONNECTION_LOST;

  snprintf(logBuf, sizeof(logBuf), "Connection #%u from %s", conn->id, conn->channel->peer().c_str());
  logKeyValue("Control", logBuf);

  if (handshake(*conn)) {
    while (_running) {
      WireMessage msg;
      std::string err;
      ChannelStatus st = conn->channel->receive(msg, RECEIVE_SLICE_MS, err);

      if (st == CHANNEL_TIMEOUT) continue;
      if (st == CHANNEL_OK) {
        if (handleMessage(conn, msg) == HANDLE_CONTINUE) continue;
        exitReason = RELEASE_PROTOCOL_ERROR;
        break;
      }

      if (st == CHANNEL_PROTOCOL_ERROR) {
        exitReason = RELEASE_PROTOCOL_ERROR;
        snprintf(logBuf, sizeof(logBuf), "#%u ProtocolError: %s", conn->id, err.c_str());
      } else {
        snprintf(logBuf, sizeof(logBuf), "#%u closed (%s) after %llu bytes: %s", conn->id, channelStatusToString(st),
                 (unsigned long long)conn->channel->bytesReceived(), err.c_str());
      }
      logKeyValue("Control", logBuf);
      break;
    }
  }

  if (!_running) exitReason = RELEASE_SHUTDOWN;
  releaseIfOwner(*conn, exitReason);

  conn->channel->shutdownBoth();
  conn->finished = true;
}

// =================================================================================
// SECTION: MESSAGE HANDLING
// =================================================================================

TargetControlService::HandleResult TargetControlService::handleMessage(std::shared_ptr<Connection> conn,
                                                                        const WireMessage &msg) {
  char logBuf[128];

  switch (msg.type) {
  case MSG_CLAIM:
    handleClaim(conn, msg);
    return HANDLE_CONTINUE;

  case MSG_HEARTBEAT:
    if (_session.heartbeat(msg.sessionId.c_str(), msg.timestamp)) {
      WireMessage ack(MSG_HEARTBEAT_ACK);
      ack.sessionId = msg.sessionId;
      ack.timestamp = msg.timestamp;
      sendTo(*conn, ack);
    }
    return HANDLE_CONTINUE;

  case MSG_COMMAND: {
    CommandMessage cmd;
    memset(&cmd, 0, sizeof(cmd));
    LogicUtils::copyString(cmd.sessionId, sizeof(cmd.sessionId), msg.sessionId.c_str());
    cmd.sequence = msg.sequence;
    cmd.kind = msg.command;
    cmd.readCycles = msg.readCycles;

    // Accepted commands are answered by onCommandCompleted
    RejectReason r = _session.dispatch(cmd);
    if (r != REJECT_NONE) {
      WireMessage rej(MSG_REJECTED);
      rej.sessionId = msg.sessionId;
      rej.sequence = msg.sequence;
      rej.command = msg.command;
      rej.reason = rejectToString(r);
      sendTo(*conn, rej);
    }
    return HANDLE_CONTINUE;
  }

  case MSG_RELEASE:
    if (!_session.release(msg.sessionId.c_str(), RELEASE_GRACEFUL)) {
      snprintf(logBuf, sizeof(logBuf), "#%u RELEASE for inactive session '%s'", conn->id, msg.sessionId.c_str());
      logKeyValue("Control", logBuf);
    }
    return HANDLE_CONTINUE;

  case MSG_SYNC_REQUEST:
    if (ownerFor(msg.sessionId.c_str()) != conn) {
      WireMessage fail(MSG_SYNC_FAILED);
      fail.reason = rejectToString(REJECT_AUTHORIZATION);
      sendTo(*conn, fail);
      return HANDLE_CONTINUE;
    }
    streamSync(*conn, msg);
    return HANDLE_CONTINUE;

  default:
    snprintf(logBuf, sizeof(logBuf), "#%u ProtocolError: unexpected %s", conn->id, messageTypeToString(msg.type));
    logKeyValue("Control", logBuf);
    return HANDLE_PROTOCOL_ERROR;
  }
}

void TargetControlService::handleClaim(std::shared_ptr<Connection> conn, const WireMessage &msg) {
  WireMessage reply(MSG_CLAIM_REJECTED);

  {
    std::lock_guard<std::mutex> lock(_connMutex);
    if (!conn->ownedSessionId.empty()) {
      reply.reason = claimToString(CLAIM_ALREADY_OWNED);
      sendTo(*conn, reply);
      return;
    }
  }

  std::string endpoint = msg.endpoint.empty() ? conn->endpoint : msg.endpoint;
  endpoint += "@" + conn->channel->peer();

  char sessionId[SESSION_ID_LENGTH + 1];
  ClaimResult result = _session.claim(endpoint.c_str(), sessionId, sizeof(sessionId));
  if (result != CLAIM_ACCEPTED) {
    reply.reason = claimToString(result);
    sendTo(*conn, reply);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(_connMutex);
    conn->ownedSessionId = sessionId;
    _owner = conn;
  }

  // The watchdog may have ended the session before ownership was recorded
  if (!_session.isOwner(sessionId)) {
    {
      std::lock_guard<std::mutex> lock(_connMutex);
      if (_owner == conn) _owner.reset();
      conn->ownedSessionId.clear();
      conn->claimAcknowledged = false;
    }
    reply.reason = claimToString(CLAIM_ABORTED);
    sendTo(*conn, reply);
    return;
  }

  const ControlTimings &t = _session.getTimings();
  WireMessage ok(MSG_CLAIM_OK);
  ok.sessionId = sessionId;
  ok.controlTimeoutMs = t.controlTimeoutMs;
  ok.heartbeatIntervalMs = t.controlTimeoutMs / 3 > MIN_HEARTBEAT_INTERVAL_MS ? t.controlTimeoutMs / 3
                                                                             : MIN_HEARTBEAT_INTERVAL_MS;
  sendTo(*conn, ok);

  // Nothing else is pushed to the owner until it has its CLAIM_OK
  {
    std::lock_guard<std::mutex> lock(_connMutex);
    if (conn->ownedSessionId == sessionId) conn->claimAcknowledged = true;
  }
  _fullTelemetryPending = true;
}

// =================================================================================
// SECTION: OWNERSHIP
// =================================================================================

std::shared_ptr<TargetControlService::Connection> TargetControlService::ownerFor(const char *sessionId) {
  std::lock_guard<std::mutex> lock(_connMutex);
  if (_owner && sessionId && _owner->ownedSessionId == sessionId) return _owner;
  return nullptr;
}

void TargetControlService::releaseIfOwner(Connection &conn, ReleaseReason reason) {
  std::string sessionId;
  {
    std::lock_guard<std::mutex> lock(_connMutex);
    sessionId = conn.ownedSessionId;
  }
  if (sessionId.empty()) return;

  char logBuf[128];
  snprintf(logBuf, sizeof(logBuf), "Owner connection #%u gone (%s). Releasing %s.", conn.id, releaseToString(reason),
           sessionId.c_str());
  logKeyValue("Control", logBuf);

  _session.release(sessionId.c_str(), reason);

  std::lock_guard<std::mutex> lock(_connMutex);
  conn.ownedSessionId.clear();
  conn.claimAcknowledged = false;
  if (_owner.get() == &conn) _owner.reset();
}

void TargetControlService::onSessionReleased(const char *sessionId, ReleaseReason reason) {
  std::shared_ptr<Connection> owner;
  {
    std::lock_guard<std::mutex> lock(_connMutex);
    if (_owner && _owner->ownedSessionId == sessionId) {
      owner = _owner;
      owner->ownedSessionId.clear();
      owner->claimAcknowledged = false;
      _owner.reset();
    }
  }
  if (!owner) return;

  // A lost connection cannot be told any more
  if (reason == RELEASE_CONNECTION_LOST || reason == RELEASE_PROTOCOL_ERROR) return;

  WireMessage msg(MSG_RELEASE);
  msg.sessionId = sessionId;
  msg.reason = releaseToString(reason);
  sendTo(*owner, msg);
}

void TargetControlService::onCommandCompleted(const char *sessionId, uint32_t sequence, CommandKind kind,
                                              RejectReason result, const SnapshotDelta &delta) {
  std::shared_ptr<Connection> owner = ownerFor(sessionId);
  if (!owner) return;

  WireMessage msg(result == REJECT_NONE ? MSG_ACK : MSG_REJECTED);
  msg.sessionId = sessionId;
  msg.sequence = sequence;
  msg.command = kind;
  if (result == REJECT_NONE) {
    msg.snapshot = delta.current;
    msg.changedMask = delta.changedMask;
  } else {
    msg.reason = rejectToString(result);
  }
  sendTo(*owner, msg);
}

// =================================================================================
// SECTION: TELEMETRY
// =================================================================================

void TargetControlService::telemetryLoop() {
  uint32_t lastVersion = 0;
  std::string lastSessionId;

  while (_running) {
    _hal.sleepMs(_settings.timings.telemetryIntervalMs);

    std::shared_ptr<Connection> owner;
    std::string sessionId;
    {
      std::lock_guard<std::mutex> lock(_connMutex);
      if (_owner && _owner->claimAcknowledged) {
        owner = _owner;
        sessionId = owner->ownedSessionId;
      }
    }
    if (!owner || _session.getState() != ACTIVE) continue;

    HardwareSnapshot snap;
    memset(&snap, 0, sizeof(snap));
    if (!_session.readSnapshot(snap)) continue;

    bool full = _fullTelemetryPending.exchange(false);
    if (!full && sessionId == lastSessionId && snap.version == lastVersion) continue;

    WireMessage msg(MSG_TELEMETRY);
    msg.sessionId = sessionId;
    msg.snapshot = snap;
    msg.changedMask = FIELD_ALL;
    if (sendTo(*owner, msg)) {
      lastVersion = snap.version;
      lastSessionId = sessionId;
    }
  }
}

// =================================================================================
// SECTION: SYNC STREAM
// =================================================================================

/**
 * Streams the requested artifacts as SYNC_DATA chunks. Runs on the owner's
 * reader thread; every chunk pushes the session deadline out.
 */
void TargetControlService::streamSync(Connection &conn, const WireMessage &request) {
  char logBuf[160];
  uint32_t totalFiles = 0;
  uint64_t totalBytes = 0;
  std::vector<uint8_t> buf(SYNC_CHUNK_SIZE);

  auto fail = [&](const std::string &reason) {
    snprintf(logBuf, sizeof(logBuf), "Sync FAILED: %s", reason.c_str());
    logKeyValue("Sync", logBuf);
    WireMessage msg(MSG_SYNC_FAILED);
    msg.reason = reason;
    sendTo(conn, msg);
  };

  logKeyValue("Sync", "Sync stream started.");

  for (int i = 0; i < ARTIFACT_COUNT; i++) {
    if (!request.manifest.include[i]) continue;
    ArtifactId artifact = (ArtifactId)i;

    std::vector<ArtifactFile> files;
    std::string err;
    if (!_catalog.listFiles(artifact, files, err)) {
      fail(err);
      return;
    }

    for (const ArtifactFile &f : files) {
      FILE *fp = fopen(f.absPath.c_str(), "rb");
      if (!fp) {
        fail(f.absPath + ": " + strerror(errno));
        return;
      }

      uint64_t offset = 0;
      uint32_t hash = LogicUtils::FNV_OFFSET;
      bool final = false;
      while (!final) {
        size_t n = fread(buf.data(), 1, buf.size(), fp);
        if (ferror(fp)) {
          fclose(fp);
          fail(f.absPath + ": read error");
          return;
        }
        final = (n < buf.size());
        hash = LogicUtils::fnv1a(buf.data(), n, hash);

        WireMessage chunk(MSG_SYNC_DATA);
        chunk.sessionId = request.sessionId;
        chunk.artifact = artifact;
        chunk.path = f.relPath;
        chunk.offset = offset;
        chunk.final = final;
        chunk.checksum = final ? hash : 0;
        chunk.body.assign(buf.data(), buf.data() + n);

        if (!sendTo(conn, chunk)) {
          fclose(fp);
          return;
        }
        offset += n;

        if (!_session.extendDeadline(request.sessionId.c_str())) {
          fclose(fp);
          logKeyValue("Sync", "Session ended during sync stream.");
          return;
        }
      }
      fclose(fp);
      totalFiles++;
      totalBytes += offset;
    }
  }

  WireMessage done(MSG_SYNC_DONE);
  done.sessionId = request.sessionId;
  done.files = totalFiles;
  done.bytes = totalBytes;
  sendTo(conn, done);

  snprintf(logBuf, sizeof(logBuf), "Sync stream complete: %u files, %llu bytes", totalFiles,
           (unsigned long long)totalBytes);
  logKeyValue("Sync", logBuf);
}
