/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/RemoteControlClient.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <chrono>
#include <stdio.h>
#include <string.h>

#include "Config.h"
#include "LogicUtils.h"
#include "RemoteControlClient.h"
#include "TimeUtils.h"

#define PUMP_SLICE_MS 200
#define RELEASE_GRACE_MS 1000

const char *linkStatusToString(LinkStatus s) {
  switch (s) {
  case LINK_DISCONNECTED:
    return "DISCONNECTED";
  case LINK_CONNECTING:
    return "CONNECTING";
  case LINK_CLAIMING:
    return "CLAIMING";
  case LINK_SYNCING:
    return "SYNCING";
  case LINK_ACTIVE:
    return "ACTIVE";
  case LINK_BACKOFF:
    return "BACKOFF";
  case LINK_PAUSED:
    return "PAUSED";
  default:
    return "UNKNOWN";
  }
}

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

RemoteControlClient::RemoteControlClient(IPlatformHAL &hal, const RemoteSettings &settings, InitialSync *sync,
                                         ISyncSink *sink)
    : _hal(hal), _settings(settings), _sync(sync), _sink(sink), _consumer(nullptr),
      _backoff(hal, settings.link.backoffInitialMs, settings.link.backoffCapMs, settings.link.backoffJitterPct),
      _running(false), _paused(false), _attempts(0), _wake(false), _status(LINK_DISCONNECTED),
      _timeoutMs(settings.link.controlTimeoutMs), _heartbeatMs(settings.link.heartbeatIntervalMs), _nextSequence(1),
      _haveSnapshot(false), _lastRxAt(0), _lastHeartbeatAt(0), _linkLost(false) {
  memset(&_snapshot, 0, sizeof(_snapshot));
}

RemoteControlClient::~RemoteControlClient() { stop(); }

void RemoteControlClient::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

void RemoteControlClient::start() {
  if (_running.exchange(true)) return;
  _thread = std::thread(&RemoteControlClient::run, this);
}

void RemoteControlClient::stop() {
  if (!_running.exchange(false)) return;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _wake = true;
  }
  _cv.notify_all();
  if (_thread.joinable()) _thread.join();
}

void RemoteControlClient::requestDisconnect() {
  _paused = true;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _wake = true;
  }
  _cv.notify_all();
  logKeyValue("Client", "Manual disconnect requested.");
}

void RemoteControlClient::requestReconnect() {
  _paused = false;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _wake = true;
  }
  _cv.notify_all();
  logKeyValue("Client", "Reconnect requested.");
}

// =================================================================================
// SECTION: STATUS
// =================================================================================

LinkStatus RemoteControlClient::getLinkStatus() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _status;
}

bool RemoteControlClient::isTelemetryStale() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _status != LINK_ACTIVE || !_haveSnapshot;
}

bool RemoteControlClient::getLastSnapshot(HardwareSnapshot &out) const {
  std::lock_guard<std::mutex> lock(_mutex);
  out = _snapshot;
  return _haveSnapshot;
}

std::string RemoteControlClient::getSessionId() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _sessionId;
}

uint32_t RemoteControlClient::getStaleLinkMs() const {
  std::lock_guard<std::mutex> lock(_mutex);
  uint32_t staleMs = _timeoutMs + STALE_LINK_MARGIN_MS;
  return staleMs > MIN_STALE_LINK_MS ? staleMs : MIN_STALE_LINK_MS;
}

size_t RemoteControlClient::getPendingCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _pending.size();
}

void RemoteControlClient::setStatus(LinkStatus status, const char *detail) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_status == status) return;
    _status = status;
  }

  char logBuf[128];
  snprintf(logBuf, sizeof(logBuf), ">>> LINK: %s %s", linkStatusToString(status), detail ? detail : "");
  logKeyValue("Client", logBuf);

  if (_consumer) _consumer->onLinkStatus(status, detail ? detail : "");
}

void RemoteControlClient::waitInterruptible(uint32_t ms) {
  std::unique_lock<std::mutex> lock(_mutex);
  _cv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return _wake || !_running; });
  _wake = false;
}

// =================================================================================
// SECTION: WORKER LOOP
// =================================================================================

/**
 * Connect / claim / serve until the link drops, then wait out the backoff
 * delay. Runs until stop().
 */
void RemoteControlClient::run() {
  char logBuf[160];

  while (_running) {
    if (_paused) {
      setStatus(LINK_PAUSED, "operator");
      waitInterruptible(1000);
      continue;
    }

    std::string err;
    if (connectAndClaim(err)) {
      _backoff.reset();
      _attempts = 0;
      sessionLoop();
    } else {
      snprintf(logBuf, sizeof(logBuf), "Connect/claim failed: %s", err.c_str());
      logKeyValue("Client", logBuf);
    }
    closeChannel();

    if (!_running || _paused) continue;

    uint32_t delay = _backoff.nextDelay();
    _attempts = _backoff.getAttempts();
    snprintf(logBuf, sizeof(logBuf), "retry #%u in %u ms", (unsigned)_attempts, delay);
    setStatus(LINK_BACKOFF, logBuf);
    waitInterruptible(delay);
  }

  closeChannel();
  setStatus(LINK_DISCONNECTED, "stopped");
}

void RemoteControlClient::closeChannel() {
  std::shared_ptr<SocketChannel> channel;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    channel.swap(_channel);
    _sessionId.clear();
    _pending.clear();
    _haveSnapshot = false;
  }
  if (channel) channel->shutdownBoth();
}

bool RemoteControlClient::connectAndClaim(std::string &errorMsg) {
  char detail[128];
  snprintf(detail, sizeof(detail), "%s:%u", _settings.targetHost, (unsigned)_settings.targetPort);
  setStatus(LINK_CONNECTING, detail);

  int fd = SocketChannel::connectTo(_settings.targetHost, _settings.targetPort, _settings.link.connectTimeoutMs,
                                    errorMsg);
  if (fd < 0) return false;

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _channel = std::make_shared<SocketChannel>(fd, detail);
  }
  _linkLost = false;

  // --- Handshake ---
  WireMessage hello(MSG_HELLO);
  hello.protocolVersion = FLAPLINK_PROTOCOL_VERSION;
  hello.endpoint = _settings.endpointId;
  if (!sendFrame(hello, errorMsg)) return false;

  WireMessage reply;
  ChannelStatus st = receiveFrame(reply, _settings.link.handshakeTimeoutMs, errorMsg);
  if (st != CHANNEL_OK) {
    if (errorMsg.empty()) errorMsg = std::string("HELLO_ACK: ") + channelStatusToString(st);
    return false;
  }
  if (reply.type != MSG_HELLO_ACK || reply.protocolVersion != FLAPLINK_PROTOCOL_VERSION) {
    errorMsg = std::string("ProtocolError: ") + messageTypeToString(reply.type) + " version " +
               std::to_string(reply.protocolVersion);
    return false;
  }

  // --- Claim ---
  setStatus(LINK_CLAIMING, reply.endpoint.c_str());
  WireMessage claim(MSG_CLAIM);
  claim.endpoint = _settings.endpointId;
  if (!sendFrame(claim, errorMsg)) return false;

  // The target settles its hardware before answering
  st = receiveFrame(reply, _settings.link.handshakeTimeoutMs + _settings.link.controlTimeoutMs, errorMsg);
  if (st != CHANNEL_OK) {
    if (errorMsg.empty()) errorMsg = std::string("CLAIM: ") + channelStatusToString(st);
    return false;
  }
  if (reply.type == MSG_CLAIM_REJECTED) {
    errorMsg = "CLAIM_REJECTED: " + reply.reason;
    return false;
  }
  if (reply.type != MSG_CLAIM_OK) {
    errorMsg = std::string("ProtocolError: ") + messageTypeToString(reply.type) + " instead of CLAIM_OK";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _sessionId = reply.sessionId;
    if (reply.controlTimeoutMs > 0) _timeoutMs = reply.controlTimeoutMs;
    uint32_t interval = reply.heartbeatIntervalMs;
    if (interval == 0 || interval >= _timeoutMs) interval = _timeoutMs / 3;
    if (interval < MIN_HEARTBEAT_INTERVAL_MS) interval = MIN_HEARTBEAT_INTERVAL_MS;
    _heartbeatMs = interval;
    _nextSequence = 1;
    _pending.clear();
    _haveSnapshot = false;
  }
  _lastHeartbeatAt = _hal.getMillis();

  char logBuf[128];
  snprintf(logBuf, sizeof(logBuf), "Claimed %s (T=%u ms, I=%u ms)", reply.sessionId.c_str(), _timeoutMs,
           _heartbeatMs);
  logKeyValue("Client", logBuf);
  return true;
}

void RemoteControlClient::sessionLoop() {
  char logBuf[160];

  if (_settings.syncOnFirstConnect && _sync && _sink && !_sync->isSynced()) {
    setStatus(LINK_SYNCING, "initial sync");
    uint64_t wallMs = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    SyncStatus result = _sync->sync(_settings.manifest, *this, *_sink, _settings.targetHost, wallMs);
    snprintf(logBuf, sizeof(logBuf), "Initial sync: %s", syncStatusToString(result));
    logKeyValue("Sync", logBuf);
    if (_linkLost || !_running) return;
  }

  setStatus(LINK_ACTIVE, getSessionId().c_str());

  std::string err;
  while (_running && !_paused) {
    if (!pumpOnce(PUMP_SLICE_MS, err)) {
      snprintf(logBuf, sizeof(logBuf), "Link lost: %s", err.c_str());
      logKeyValue("Client", logBuf);
      return;
    }
  }

  releaseGracefully();
}

void RemoteControlClient::releaseGracefully() {
  std::string err;
  WireMessage release(MSG_RELEASE);
  release.sessionId = getSessionId();
  release.reason = releaseToString(RELEASE_GRACEFUL);
  if (!sendFrame(release, err)) return;

  // Wait for the target to confirm with its own RELEASE
  unsigned long startedAt = _hal.getMillis();
  while (TimeUtils::elapsedSince(startedAt, _hal.getMillis()) < RELEASE_GRACE_MS) {
    WireMessage msg;
    ChannelStatus st = receiveFrame(msg, PUMP_SLICE_MS, err);
    if (st == CHANNEL_TIMEOUT) continue;
    if (st != CHANNEL_OK) break;
    if (!handleFrame(msg)) break;
  }
  logKeyValue("Client", "Session released.");
}

// =================================================================================
// SECTION: PUMP
// =================================================================================

ChannelStatus RemoteControlClient::receiveFrame(WireMessage &out, uint32_t timeoutMs, std::string &errorMsg) {
  std::shared_ptr<SocketChannel> channel;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    channel = _channel;
  }
  if (!channel) {
    errorMsg = "not connected";
    return CHANNEL_CLOSED;
  }

  ChannelStatus st = channel->receive(out, timeoutMs, errorMsg);
  if (st == CHANNEL_OK) _lastRxAt = _hal.getMillis();
  return st;
}

bool RemoteControlClient::sendFrame(const WireMessage &msg, std::string &errorMsg) {
  std::shared_ptr<SocketChannel> channel;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    channel = _channel;
  }
  if (!channel) {
    errorMsg = "not connected";
    return false;
  }
  return channel->send(msg, errorMsg);
}

void RemoteControlClient::maybeHeartbeat() {
  unsigned long now = _hal.getMillis();
  if (TimeUtils::elapsedSince(_lastHeartbeatAt, now) < _heartbeatMs) return;
  _lastHeartbeatAt = now;

  WireMessage hb(MSG_HEARTBEAT);
  hb.sessionId = getSessionId();
  hb.timestamp = now;

  std::string err;
  if (!sendFrame(hb, err)) {
    logKeyValue("Client", ("Heartbeat send failed: " + err).c_str());
  }
}

bool RemoteControlClient::linkIsStale() {
  return TimeUtils::elapsedSince(_lastRxAt, _hal.getMillis()) >= getStaleLinkMs();
}

bool RemoteControlClient::pumpOnce(uint32_t waitMs, std::string &errorMsg) {
  maybeHeartbeat();

  if (linkIsStale()) {
    errorMsg = "no frame from target for " + std::to_string(getStaleLinkMs()) + " ms";
    return false;
  }

  WireMessage msg;
  ChannelStatus st = receiveFrame(msg, waitMs, errorMsg);
  if (st == CHANNEL_TIMEOUT) return true;
  if (st != CHANNEL_OK) {
    if (errorMsg.empty()) errorMsg = channelStatusToString(st);
    return false;
  }

  if (!handleFrame(msg)) {
    errorMsg = std::string(messageTypeToString(msg.type)) + " " + msg.reason;
    return false;
  }
  return true;
}

/**
 * Applies one frame received while a session is held. Returns false when the
 * frame ends the session.
 */
bool RemoteControlClient::handleFrame(const WireMessage &msg) {
  char logBuf[128];

  switch (msg.type) {
  case MSG_HEARTBEAT_ACK:
    return true;

  case MSG_TELEMETRY: {
    HardwareSnapshot snap;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      LogicUtils::mergeSnapshot(_snapshot, msg.snapshot, msg.changedMask);
      _haveSnapshot = true;
      snap = _snapshot;
    }
    if (_consumer) _consumer->onTelemetry(snap);
    return true;
  }

  case MSG_ACK:
  case MSG_REJECTED: {
    bool accepted = (msg.type == MSG_ACK);
    HardwareSnapshot snap;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _pending.erase(msg.sequence);
      if (accepted && msg.changedMask) LogicUtils::mergeSnapshot(_snapshot, msg.snapshot, msg.changedMask);
      snap = _snapshot;
    }
    if (!accepted) {
      snprintf(logBuf, sizeof(logBuf), "#%u %s REJECTED: %s", msg.sequence, commandToString(msg.command),
               msg.reason.c_str());
      logKeyValue("Client", logBuf);
    }
    if (_consumer) _consumer->onCommandResult(msg.sequence, msg.command, accepted, msg.reason.c_str(), snap);
    return true;
  }

  case MSG_RELEASE:
    snprintf(logBuf, sizeof(logBuf), "Target released session: %s", msg.reason.c_str());
    logKeyValue("Client", logBuf);
    _linkLost = true;
    return false;

  case MSG_SYNC_DATA:
  case MSG_SYNC_DONE:
  case MSG_SYNC_FAILED:
    // Leftovers of an aborted sync stream
    return true;

  default:
    snprintf(logBuf, sizeof(logBuf), "ProtocolError: unexpected %s", messageTypeToString(msg.type));
    logKeyValue("Client", logBuf);
    _linkLost = true;
    return false;
  }
}

// =================================================================================
// SECTION: COMMANDS
// =================================================================================

bool RemoteControlClient::sendCommand(CommandKind kind, uint32_t readCycles, std::string &errorMsg) {
  if (kind >= CMD_UNKNOWN) {
    errorMsg = "unknown command";
    return false;
  }

  std::lock_guard<std::mutex> order(_commandMutex);

  WireMessage cmd(MSG_COMMAND);
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_status != LINK_ACTIVE || !_channel) {
      errorMsg = std::string("link ") + linkStatusToString(_status);
      return false;
    }
    for (const auto &p : _pending) {
      if (p.second == kind) {
        errorMsg = std::string(commandToString(kind)) + " already pending as #" + std::to_string(p.first);
        return false;
      }
    }
    cmd.sessionId = _sessionId;
    cmd.sequence = _nextSequence++;
    _pending[cmd.sequence] = kind;
  }
  cmd.command = kind;
  cmd.readCycles = readCycles;

  if (!sendFrame(cmd, errorMsg)) {
    std::lock_guard<std::mutex> lock(_mutex);
    _pending.erase(cmd.sequence);
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: SYNC TRANSPORT
// =================================================================================

/**
 * Requests the artifacts and feeds SYNC_DATA chunks to 'sink' until
 * SYNC_DONE. Heartbeats keep flowing; other frames are handled as usual.
 */
bool RemoteControlClient::fetchArtifacts(const SyncManifest &manifest, ISyncSink &sink, std::string &errorMsg) {
  WireMessage request(MSG_SYNC_REQUEST);
  request.sessionId = getSessionId();
  request.manifest = manifest;
  if (!sendFrame(request, errorMsg)) {
    _linkLost = true;
    return false;
  }

  while (_running) {
    maybeHeartbeat();
    if (linkIsStale()) {
      errorMsg = "stale link during sync";
      _linkLost = true;
      return false;
    }

    WireMessage msg;
    ChannelStatus st = receiveFrame(msg, PUMP_SLICE_MS, errorMsg);
    if (st == CHANNEL_TIMEOUT) continue;
    if (st != CHANNEL_OK) {
      if (errorMsg.empty()) errorMsg = channelStatusToString(st);
      _linkLost = true;
      return false;
    }

    switch (msg.type) {
    case MSG_SYNC_DATA:
      if (!sink.writeChunk(msg.artifact, msg.path.c_str(), msg.offset, msg.body.data(), msg.body.size(), msg.final,
                           msg.checksum, errorMsg)) {
        return false;
      }
      break;

    case MSG_SYNC_DONE: {
      char logBuf[96];
      snprintf(logBuf, sizeof(logBuf), "Target sent %u files, %llu bytes", msg.files,
               (unsigned long long)msg.bytes);
      logKeyValue("Sync", logBuf);
      return true;
    }

    case MSG_SYNC_FAILED:
      errorMsg = "target: " + msg.reason;
      return false;

    default:
      if (!handleFrame(msg)) {
        errorMsg = std::string("link ended during sync (") + messageTypeToString(msg.type) + ")";
        return false;
      }
      break;
    }
  }

  errorMsg = "client stopped";
  return false;
}
