/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/InitialSync.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * One-shot pull of the target's artifacts (database, config, pictures, models,
 * label-studio data) onto the remote, gated by a persisted marker.
 * - Marker present: returns SYNC_ALREADY_DONE without touching the transport.
 * - Marker written only after every included artifact arrived intact.
 * =================================================================================
 */
#pragma once
#include <string>

#include "ControlContext.h"
#include "Types.h"

// Persistence of the "synced" marker next to the remote's database.
class ISyncMarkerStore {
public:
    virtual ~ISyncMarkerStore() {}

    // Returns true when a valid marker exists.
    virtual bool load(SyncMarker& out) = 0;
    virtual bool save(const SyncMarker& marker, std::string& errorMsg) = 0;
    virtual bool remove() = 0;
};

// Local destination of the transferred files.
class ISyncSink {
public:
    virtual ~ISyncSink() {}

    /**
     * Receives one chunk of a file. 'offset' is the byte position inside the
     * file. The file becomes visible at its final path only after the chunk
     * flagged 'final' was written and 'checksum' (FNV-1a of the whole file)
     * matched.
     */
    virtual bool writeChunk(ArtifactId artifact, const char* relPath, uint64_t offset, const uint8_t* data,
                            size_t len, bool final, uint32_t checksum, std::string& errorMsg) = 0;

    // Drops any partially written temp files.
    virtual void discardPartial() = 0;
};

// The request/response exchange with the target.
class ISyncTransport {
public:
    virtual ~ISyncTransport() {}

    // Streams every included artifact into 'sink'. Returns false on any failure.
    virtual bool fetchArtifacts(const SyncManifest& manifest, ISyncSink& sink, std::string& errorMsg) = 0;
};

class InitialSync {
public:
    InitialSync(IPlatformHAL& hal, ISyncMarkerStore& markers);

    bool isSynced();

    SyncStatus sync(const SyncManifest& manifest, ISyncTransport& transport, ISyncSink& sink,
                    const char* targetHost, uint64_t wallClockMs);

    const SyncMarker& getLastMarker() const { return _marker; }

private:
    IPlatformHAL& _hal;
    ISyncMarkerStore& _markers;
    SyncMarker _marker;

    void logKeyValue(const char* key, const char* value);
};
