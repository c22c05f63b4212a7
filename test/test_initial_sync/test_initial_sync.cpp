/*
 * File: test/test_initial_sync/test_initial_sync.cpp
 * Description: One-shot artifact pull gated by the synced marker, and the
 * file assembly on the remote side.
 */
#include <unity.h>
#include <map>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "ArtifactWriter.h"
#include "InitialSync.h"
#include "LogicUtils.h"
#include "MockControlHAL.h"
#include "Storage.h"

// ============================================================================
// FAKES
// ============================================================================

class MemoryMarkerStore : public ISyncMarkerStore {
public:
    bool present = false;
    bool failSave = false;
    int saves = 0;
    SyncMarker stored;

    bool load(SyncMarker& out) override {
        if (!present) return false;
        out = stored;
        return true;
    }
    bool save(const SyncMarker& marker, std::string& errorMsg) override {
        saves++;
        if (failSave) {
            errorMsg = "disk full";
            return false;
        }
        stored = marker;
        present = true;
        return true;
    }
    bool remove() override {
        present = false;
        return true;
    }
};

class MemorySink : public ISyncSink {
public:
    std::map<std::string, std::string> files;
    int discards = 0;

    bool writeChunk(ArtifactId, const char* relPath, uint64_t, const uint8_t* data, size_t len, bool,
                    uint32_t, std::string&) override {
        files[relPath].append((const char*)data, len);
        return true;
    }
    void discardPartial() override { discards++; }
};

// Sends two files of the database artifact, optionally failing after the first.
class FakeTransport : public ISyncTransport {
public:
    int calls = 0;
    bool failMidway = false;

    bool fetchArtifacts(const SyncManifest& manifest, ISyncSink& sink, std::string& errorMsg) override {
        calls++;
        if (!manifest.include[ARTIFACT_DATABASE]) return true;

        const char* a = "CREATE TABLE pets;";
        if (!sink.writeChunk(ARTIFACT_DATABASE, "db/pets.db", 0, (const uint8_t*)a, strlen(a), true,
                             LogicUtils::fnv1a((const uint8_t*)a, strlen(a)), errorMsg)) return false;
        if (failMidway) {
            errorMsg = "connection lost";
            return false;
        }
        const char* b = "{}";
        return sink.writeChunk(ARTIFACT_DATABASE, "db/meta.json", 0, (const uint8_t*)b, 2, true,
                               LogicUtils::fnv1a((const uint8_t*)b, 2), errorMsg);
    }
};

static SyncManifest databaseOnly() {
    SyncManifest m;
    memset(&m, 0, sizeof(m));
    m.include[ARTIFACT_DATABASE] = true;
    return m;
}

static std::string makeTempDir() {
    char tmpl[] = "/tmp/flaplink-sync-XXXXXX";
    char* dir = mkdtemp(tmpl);
    TEST_ASSERT_NOT_NULL(dir);
    return std::string(dir);
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// MARKER GATING
// ============================================================================

void test_first_sync_writes_marker(void) {
    MockControlHAL hal;
    MemoryMarkerStore markers;
    MemorySink sink;
    FakeTransport transport;
    InitialSync sync(hal, markers);

    TEST_ASSERT_FALSE(sync.isSynced());
    TEST_ASSERT_EQUAL(SYNC_COMPLETED, sync.sync(databaseOnly(), transport, sink, "petdoor.local", 1700000000000ULL));

    TEST_ASSERT_TRUE(sync.isSynced());
    TEST_ASSERT_EQUAL_STRING("petdoor.local", markers.stored.targetHost);
    TEST_ASSERT_TRUE(markers.stored.included[ARTIFACT_DATABASE]);
    TEST_ASSERT_FALSE(markers.stored.included[ARTIFACT_PICTURES]);
    TEST_ASSERT_EQUAL_UINT32(2, markers.stored.records[ARTIFACT_DATABASE].files);
    TEST_ASSERT_TRUE(markers.stored.records[ARTIFACT_DATABASE].bytes == 20);
    TEST_ASSERT_EQUAL_STRING("CREATE TABLE pets;", sink.files["db/pets.db"].c_str());
}

void test_marker_present_skips_transport(void) {
    MockControlHAL hal;
    MemoryMarkerStore markers;
    MemorySink sink;
    FakeTransport transport;
    InitialSync sync(hal, markers);

    sync.sync(databaseOnly(), transport, sink, "petdoor.local", 1);
    TEST_ASSERT_EQUAL(1, transport.calls);

    TEST_ASSERT_EQUAL(SYNC_ALREADY_DONE, sync.sync(databaseOnly(), transport, sink, "petdoor.local", 2));
    TEST_ASSERT_EQUAL(1, transport.calls);
    TEST_ASSERT_EQUAL(1, markers.saves);
}

void test_failed_transfer_leaves_no_marker(void) {
    MockControlHAL hal;
    MemoryMarkerStore markers;
    MemorySink sink;
    FakeTransport transport;
    transport.failMidway = true;
    InitialSync sync(hal, markers);

    TEST_ASSERT_EQUAL(SYNC_TRANSFER_FAILED, sync.sync(databaseOnly(), transport, sink, "petdoor.local", 1));
    TEST_ASSERT_FALSE(markers.present);
    TEST_ASSERT_EQUAL(1, sink.discards);
    TEST_ASSERT_TRUE(hal.hasLog("connection lost"));

    // Next connection retries from scratch
    transport.failMidway = false;
    TEST_ASSERT_EQUAL(SYNC_COMPLETED, sync.sync(databaseOnly(), transport, sink, "petdoor.local", 2));
    TEST_ASSERT_EQUAL(2, transport.calls);
}

void test_marker_save_failure_reported(void) {
    MockControlHAL hal;
    MemoryMarkerStore markers;
    markers.failSave = true;
    MemorySink sink;
    FakeTransport transport;
    InitialSync sync(hal, markers);

    TEST_ASSERT_EQUAL(SYNC_MARKER_FAILED, sync.sync(databaseOnly(), transport, sink, "petdoor.local", 1));
    TEST_ASSERT_FALSE(sync.isSynced());
    TEST_ASSERT_TRUE(hal.hasLog("disk full"));
}

// ============================================================================
// ARTIFACT WRITER
// ============================================================================

void test_writer_assembles_and_renames(void) {
    std::string root = makeTempDir();
    ArtifactWriter writer(root);
    std::string err;

    const char* part1 = "hello ";
    const char* part2 = "world";
    uint32_t hash = LogicUtils::fnv1a((const uint8_t*)part1, 6);
    hash = LogicUtils::fnv1a((const uint8_t*)part2, 5, hash);

    TEST_ASSERT_TRUE(writer.writeChunk(ARTIFACT_CONFIG, "config/app.yaml", 0, (const uint8_t*)part1, 6, false, 0, err));
    TEST_ASSERT_FALSE(fileExists(joinPath(root, "config/app.yaml")));
    TEST_ASSERT_TRUE(fileExists(joinPath(root, "config/app.yaml.part")));

    TEST_ASSERT_TRUE(writer.writeChunk(ARTIFACT_CONFIG, "config/app.yaml", 6, (const uint8_t*)part2, 5, true, hash, err));

    std::string content;
    TEST_ASSERT_TRUE(readFileToString(joinPath(root, "config/app.yaml"), content, err));
    TEST_ASSERT_EQUAL_STRING("hello world", content.c_str());
    TEST_ASSERT_FALSE(fileExists(joinPath(root, "config/app.yaml.part")));
    TEST_ASSERT_EQUAL_UINT32(1, writer.getCompletedFiles());
}

void test_writer_rejects_checksum_mismatch(void) {
    std::string root = makeTempDir();
    ArtifactWriter writer(root);
    std::string err;

    TEST_ASSERT_FALSE(writer.writeChunk(ARTIFACT_MODELS, "models/net.bin", 0, (const uint8_t*)"abc", 3, true,
                                        0x12345678, err));
    TEST_ASSERT_TRUE(err.find("checksum mismatch") != std::string::npos);
    TEST_ASSERT_FALSE(fileExists(joinPath(root, "models/net.bin")));
    TEST_ASSERT_FALSE(fileExists(joinPath(root, "models/net.bin.part")));
}

void test_writer_rejects_unsafe_path_and_gaps(void) {
    std::string root = makeTempDir();
    ArtifactWriter writer(root);
    std::string err;

    TEST_ASSERT_FALSE(writer.writeChunk(ARTIFACT_CONFIG, "../escape", 0, (const uint8_t*)"x", 1, true, 0, err));
    TEST_ASSERT_TRUE(err.find("unsafe") != std::string::npos);

    TEST_ASSERT_FALSE(writer.writeChunk(ARTIFACT_CONFIG, "config/late.yaml", 10, (const uint8_t*)"x", 1, false, 0, err));

    TEST_ASSERT_TRUE(writer.writeChunk(ARTIFACT_CONFIG, "config/gap.yaml", 0, (const uint8_t*)"ab", 2, false, 0, err));
    TEST_ASSERT_FALSE(writer.writeChunk(ARTIFACT_CONFIG, "config/gap.yaml", 5, (const uint8_t*)"cd", 2, false, 0, err));
    TEST_ASSERT_FALSE(fileExists(joinPath(root, "config/gap.yaml.part")));
}

void test_writer_discards_partials(void) {
    std::string root = makeTempDir();
    ArtifactWriter writer(root);
    std::string err;

    writer.writeChunk(ARTIFACT_PICTURES, "pictures/a.jpg", 0, (const uint8_t*)"xx", 2, false, 0, err);
    TEST_ASSERT_TRUE(fileExists(joinPath(root, "pictures/a.jpg.part")));
    writer.discardPartial();
    TEST_ASSERT_FALSE(fileExists(joinPath(root, "pictures/a.jpg.part")));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_first_sync_writes_marker);
    RUN_TEST(test_marker_present_skips_transport);
    RUN_TEST(test_failed_transfer_leaves_no_marker);
    RUN_TEST(test_marker_save_failure_reported);

    RUN_TEST(test_writer_assembles_and_renames);
    RUN_TEST(test_writer_rejects_checksum_mismatch);
    RUN_TEST(test_writer_rejects_unsafe_path_and_gaps);
    RUN_TEST(test_writer_discards_partials);

    return UNITY_END();
}
