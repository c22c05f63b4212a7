/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/InitialSync.cpp
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "InitialSync.h"
#include "LogicUtils.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: TALLY
// =================================================================================

namespace {

// Forwards to the real sink and records files, bytes and checksum per artifact.
class TallyingSink : public ISyncSink {
public:
    TallyingSink(ISyncSink& inner, SyncArtifactRecord* records) : _inner(inner), _records(records) {
        for (int i = 0; i < ARTIFACT_COUNT; i++) {
            _records[i].files = 0;
            _records[i].bytes = 0;
            _records[i].checksum = LogicUtils::FNV_OFFSET;
        }
    }

    bool writeChunk(ArtifactId artifact, const char* relPath, uint64_t offset, const uint8_t* data, size_t len,
                    bool final, uint32_t checksum, std::string& errorMsg) override {
        if (artifact >= ARTIFACT_COUNT) {
            errorMsg = "Chunk for unknown artifact";
            return false;
        }
        if (!_inner.writeChunk(artifact, relPath, offset, data, len, final, checksum, errorMsg)) return false;

        SyncArtifactRecord& rec = _records[artifact];
        rec.bytes += len;
        if (len > 0) rec.checksum = LogicUtils::fnv1a(data, len, rec.checksum);
        if (final) rec.files++;
        return true;
    }

    void discardPartial() override { _inner.discardPartial(); }

private:
    ISyncSink& _inner;
    SyncArtifactRecord* _records;
};

} // namespace

// =================================================================================
// SECTION: SYNC
// =================================================================================

InitialSync::InitialSync(IPlatformHAL& hal, ISyncMarkerStore& markers) : _hal(hal), _markers(markers) {
    memset(&_marker, 0, sizeof(_marker));
}

void InitialSync::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

bool InitialSync::isSynced() {
    SyncMarker m;
    memset(&m, 0, sizeof(m));
    return _markers.load(m) && m.synced;
}

SyncStatus InitialSync::sync(const SyncManifest& manifest, ISyncTransport& transport, ISyncSink& sink,
                             const char* targetHost, uint64_t wallClockMs) {
    char logBuf[128];

    SyncMarker existing;
    memset(&existing, 0, sizeof(existing));
    if (_markers.load(existing) && existing.synced) {
        _marker = existing;
        snprintf(logBuf, sizeof(logBuf), "Already synced from %s. Skipping.", existing.targetHost);
        logKeyValue("Sync", logBuf);
        return SYNC_ALREADY_DONE;
    }

    SyncMarker fresh;
    memset(&fresh, 0, sizeof(fresh));
    TallyingSink tally(sink, fresh.records);

    logKeyValue("Sync", "Initial sync started.");
    unsigned long started = _hal.getMillis();

    std::string err;
    if (!transport.fetchArtifacts(manifest, tally, err)) {
        tally.discardPartial();
        snprintf(logBuf, sizeof(logBuf), "Initial sync FAILED: %s", err.c_str());
        logKeyValue("Sync", logBuf);
        return SYNC_TRANSFER_FAILED;
    }

    fresh.synced = true;
    fresh.syncedAtMs = wallClockMs;
    LogicUtils::copyString(fresh.targetHost, sizeof(fresh.targetHost), targetHost);
    for (int i = 0; i < ARTIFACT_COUNT; i++) {
        fresh.included[i] = manifest.include[i];
        if (!manifest.include[i]) continue;

        snprintf(logBuf, sizeof(logBuf), "%-12s %u files, %llu bytes, fnv %08X", artifactToString((ArtifactId)i),
                 fresh.records[i].files, (unsigned long long)fresh.records[i].bytes, fresh.records[i].checksum);
        logKeyValue("Sync", logBuf);
    }

    if (!_markers.save(fresh, err)) {
        snprintf(logBuf, sizeof(logBuf), "Marker write FAILED: %s", err.c_str());
        logKeyValue("Sync", logBuf);
        return SYNC_MARKER_FAILED;
    }

    _marker = fresh;
    char timeStr[48];
    TimeUtils::formatMillis(TimeUtils::elapsedSince(started, _hal.getMillis()), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Initial sync complete in %s.", timeStr);
    logKeyValue("Sync", logBuf);
    return SYNC_COMPLETED;
}
