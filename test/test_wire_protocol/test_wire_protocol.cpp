/*
 * File: test/test_wire_protocol/test_wire_protocol.cpp
 * Description: Framing and header codec of the control link. Partial reads,
 * size limits, required fields and the ACK delta encoding.
 */
#include <unity.h>
#include <string.h>
#include "FrameReader.h"
#include "WireCodec.h"

void setUp(void) {}
void tearDown(void) {}

// --- Helper ---
static std::vector<uint8_t> rawFrame(const char* header) {
    std::vector<uint8_t> out;
    FrameReader::writeFrame(header, nullptr, 0, out);
    return out;
}

static bool decodeHeader(const char* header, WireMessage& msg, std::string& err) {
    WireFrame frame;
    frame.header = header;
    return WireCodec::decode(frame, msg, err);
}

// ============================================================================
// FRAMING
// ============================================================================

void test_frame_fed_byte_by_byte(void) {
    WireMessage hb(MSG_HEARTBEAT);
    hb.sessionId = "S0001-0000ABCD";
    hb.timestamp = 123456789ULL;
    std::vector<uint8_t> bytes;
    std::string err;
    TEST_ASSERT_TRUE(WireCodec::encode(hb, bytes, err));

    FrameReader reader;
    WireFrame frame;
    for (size_t i = 0; i + 1 < bytes.size(); i++) {
        reader.feed(&bytes[i], 1);
        TEST_ASSERT_EQUAL(FRAME_INCOMPLETE, reader.next(frame, err));
    }
    reader.feed(&bytes[bytes.size() - 1], 1);
    TEST_ASSERT_EQUAL(FRAME_READY, reader.next(frame, err));
    TEST_ASSERT_EQUAL(0, reader.buffered());

    WireMessage out;
    TEST_ASSERT_TRUE(WireCodec::decode(frame, out, err));
    TEST_ASSERT_EQUAL(MSG_HEARTBEAT, out.type);
    TEST_ASSERT_EQUAL_STRING("S0001-0000ABCD", out.sessionId.c_str());
    TEST_ASSERT_TRUE(out.timestamp == 123456789ULL);
}

void test_two_frames_in_one_read(void) {
    std::vector<uint8_t> a = rawFrame("{\"type\":\"HELLO\",\"version\":1}");
    std::vector<uint8_t> b = rawFrame("{\"type\":\"CLAIM\",\"endpoint\":\"desk\"}");
    a.insert(a.end(), b.begin(), b.end());

    FrameReader reader;
    reader.feed(a.data(), a.size());

    WireFrame frame;
    std::string err;
    TEST_ASSERT_EQUAL(FRAME_READY, reader.next(frame, err));
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"HELLO\",\"version\":1}", frame.header.c_str());
    TEST_ASSERT_EQUAL(FRAME_READY, reader.next(frame, err));
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"CLAIM\",\"endpoint\":\"desk\"}", frame.header.c_str());
    TEST_ASSERT_EQUAL(FRAME_INCOMPLETE, reader.next(frame, err));
}

void test_oversize_frame_is_fatal(void) {
    FrameReader reader(1024);
    const uint8_t prefix[] = { 0x00, 0x00, 0x08, 0x00 }; // 2048
    reader.feed(prefix, sizeof(prefix));

    WireFrame frame;
    std::string err;
    TEST_ASSERT_EQUAL(FRAME_ERROR, reader.next(frame, err));
    TEST_ASSERT_TRUE(err.find("too large") != std::string::npos);

    // Sticky until reset
    std::vector<uint8_t> ok = rawFrame("{\"type\":\"HELLO\",\"version\":1}");
    reader.feed(ok.data(), ok.size());
    TEST_ASSERT_EQUAL(FRAME_ERROR, reader.next(frame, err));
    reader.reset();
    reader.feed(ok.data(), ok.size());
    TEST_ASSERT_EQUAL(FRAME_READY, reader.next(frame, err));
}

void test_bad_header_length_is_fatal(void) {
    // frame_len 4, header_len 10
    const uint8_t bytes[] = { 0x00, 0x00, 0x00, 0x04, 0x00, 0x0A, '{', '}' };
    FrameReader reader;
    reader.feed(bytes, sizeof(bytes));

    WireFrame frame;
    std::string err;
    TEST_ASSERT_EQUAL(FRAME_ERROR, reader.next(frame, err));
    TEST_ASSERT_TRUE(err.find("header length") != std::string::npos);
}

void test_body_travels_after_header(void) {
    WireMessage data(MSG_SYNC_DATA);
    data.artifact = ARTIFACT_PICTURES;
    data.path = "pictures/2024/cat.jpg";
    data.offset = 0;
    data.final = true;
    data.checksum = 0xCAFEBABE;
    data.body = { 0xFF, 0xD8, 0x00, 0x01 };

    std::vector<uint8_t> bytes;
    std::string err;
    TEST_ASSERT_TRUE(WireCodec::encode(data, bytes, err));

    FrameReader reader;
    reader.feed(bytes.data(), bytes.size());
    WireFrame frame;
    TEST_ASSERT_EQUAL(FRAME_READY, reader.next(frame, err));

    WireMessage out;
    TEST_ASSERT_TRUE(WireCodec::decode(frame, out, err));
    TEST_ASSERT_EQUAL(ARTIFACT_PICTURES, out.artifact);
    TEST_ASSERT_EQUAL_STRING("pictures/2024/cat.jpg", out.path.c_str());
    TEST_ASSERT_TRUE(out.final);
    TEST_ASSERT_EQUAL_HEX32(0xCAFEBABE, out.checksum);
    TEST_ASSERT_EQUAL(4, out.body.size());
    TEST_ASSERT_EQUAL_HEX8(0xD8, out.body[1]);
}

// ============================================================================
// HEADER CODEC
// ============================================================================

void test_hello_requires_version(void) {
    WireMessage msg;
    std::string err;
    TEST_ASSERT_FALSE(decodeHeader("{\"type\":\"HELLO\",\"endpoint\":\"desk\"}", msg, err));
    TEST_ASSERT_EQUAL_STRING("HELLO without version", err.c_str());
}

void test_unknown_type_and_garbage_rejected(void) {
    WireMessage msg;
    std::string err;
    TEST_ASSERT_FALSE(decodeHeader("{\"type\":\"SELF_DESTRUCT\"}", msg, err));
    TEST_ASSERT_FALSE(decodeHeader("[1,2,3]", msg, err));
    TEST_ASSERT_FALSE(decodeHeader("{\"type\":", msg, err));
    TEST_ASSERT_TRUE(err.find("Malformed header") != std::string::npos);
}

void test_unknown_command_name_decodes(void) {
    WireMessage msg;
    std::string err;
    TEST_ASSERT_TRUE(decodeHeader(
        "{\"type\":\"COMMAND\",\"session_id\":\"S0001-00000001\",\"seq\":4,\"command\":\"OPEN_ALL\"}", msg, err));
    TEST_ASSERT_EQUAL(CMD_UNKNOWN, msg.command);
    TEST_ASSERT_EQUAL_UINT32(4, msg.sequence);

    TEST_ASSERT_FALSE(decodeHeader("{\"type\":\"COMMAND\",\"command\":\"LOCK_INNER\"}", msg, err));
}

void test_heartbeat_and_claim_ok_need_session(void) {
    WireMessage msg;
    std::string err;
    TEST_ASSERT_FALSE(decodeHeader("{\"type\":\"HEARTBEAT\",\"ts\":5}", msg, err));
    TEST_ASSERT_FALSE(decodeHeader("{\"type\":\"CLAIM_OK\",\"timeout_ms\":10000}", msg, err));

    TEST_ASSERT_TRUE(decodeHeader(
        "{\"type\":\"CLAIM_OK\",\"session_id\":\"S0002-00000001\",\"timeout_ms\":10000,"
        "\"heartbeat_interval_ms\":3333}", msg, err));
    TEST_ASSERT_EQUAL_UINT32(10000, msg.controlTimeoutMs);
    TEST_ASSERT_EQUAL_UINT32(3333, msg.heartbeatIntervalMs);
}

void test_ack_carries_only_changed_fields(void) {
    WireMessage ack(MSG_ACK);
    ack.sessionId = "S0001-00000001";
    ack.sequence = 3;
    ack.command = CMD_UNLOCK_INNER;
    ack.snapshot.version = 17;
    ack.snapshot.innerUnlocked = true;
    ack.snapshot.rfidPowered = true; // not part of the delta
    ack.changedMask = FIELD_INNER_LOCK;

    std::vector<uint8_t> bytes;
    std::string err;
    TEST_ASSERT_TRUE(WireCodec::encode(ack, bytes, err));

    FrameReader reader;
    reader.feed(bytes.data(), bytes.size());
    WireFrame frame;
    reader.next(frame, err);
    TEST_ASSERT_TRUE(frame.header.find("inner_unlocked") != std::string::npos);
    TEST_ASSERT_TRUE(frame.header.find("rfid_power") == std::string::npos);

    WireMessage out;
    TEST_ASSERT_TRUE(WireCodec::decode(frame, out, err));
    TEST_ASSERT_EQUAL_HEX16(FIELD_INNER_LOCK, out.changedMask);
    TEST_ASSERT_TRUE(out.snapshot.innerUnlocked);
    TEST_ASSERT_EQUAL_UINT32(17, out.snapshot.version);
}

void test_telemetry_carries_full_snapshot(void) {
    WireMessage tel(MSG_TELEMETRY);
    tel.sessionId = "S0001-00000001";
    tel.snapshot.version = 2;
    tel.snapshot.rfidReading = true;
    strncpy(tel.snapshot.rfidTag, "900123456789012", sizeof(tel.snapshot.rfidTag) - 1);
    tel.snapshot.rfidTimestampMs = 1700000000000ULL;

    std::vector<uint8_t> bytes;
    std::string err;
    TEST_ASSERT_TRUE(WireCodec::encode(tel, bytes, err));

    FrameReader reader;
    reader.feed(bytes.data(), bytes.size());
    WireFrame frame;
    reader.next(frame, err);

    WireMessage out;
    TEST_ASSERT_TRUE(WireCodec::decode(frame, out, err));
    TEST_ASSERT_EQUAL_HEX16(FIELD_ALL, out.changedMask);
    TEST_ASSERT_TRUE(out.snapshot.rfidReading);
    TEST_ASSERT_EQUAL_STRING("900123456789012", out.snapshot.rfidTag);
    TEST_ASSERT_TRUE(out.snapshot.rfidTimestampMs == 1700000000000ULL);
}

void test_sync_request_manifest(void) {
    WireMessage msg;
    std::string err;
    TEST_ASSERT_TRUE(decodeHeader(
        "{\"type\":\"SYNC_REQUEST\",\"session_id\":\"S\",\"artifacts\":[\"database\",\"models\"]}", msg, err));
    TEST_ASSERT_TRUE(msg.manifest.include[ARTIFACT_DATABASE]);
    TEST_ASSERT_TRUE(msg.manifest.include[ARTIFACT_MODELS]);
    TEST_ASSERT_FALSE(msg.manifest.include[ARTIFACT_PICTURES]);

    TEST_ASSERT_FALSE(decodeHeader("{\"type\":\"SYNC_REQUEST\",\"artifacts\":[\"passwords\"]}", msg, err));
}

void test_unsafe_sync_paths(void) {
    WireMessage msg;
    std::string err;
    TEST_ASSERT_FALSE(decodeHeader(
        "{\"type\":\"SYNC_DATA\",\"artifact\":\"config\",\"path\":\"../etc/passwd\",\"offset\":0}", msg, err));
    TEST_ASSERT_TRUE(err.find("unsafe path") != std::string::npos);

    TEST_ASSERT_TRUE(WireCodec::isSafeRelativePath("config/config.yaml"));
    TEST_ASSERT_FALSE(WireCodec::isSafeRelativePath("/etc/passwd"));
    TEST_ASSERT_FALSE(WireCodec::isSafeRelativePath("a/../../b"));
    TEST_ASSERT_FALSE(WireCodec::isSafeRelativePath("a//b"));
    TEST_ASSERT_FALSE(WireCodec::isSafeRelativePath("a/"));
    TEST_ASSERT_FALSE(WireCodec::isSafeRelativePath(""));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_frame_fed_byte_by_byte);
    RUN_TEST(test_two_frames_in_one_read);
    RUN_TEST(test_oversize_frame_is_fatal);
    RUN_TEST(test_bad_header_length_is_fatal);
    RUN_TEST(test_body_travels_after_header);

    RUN_TEST(test_hello_requires_version);
    RUN_TEST(test_unknown_type_and_garbage_rejected);
    RUN_TEST(test_unknown_command_name_decodes);
    RUN_TEST(test_heartbeat_and_claim_ok_need_session);
    RUN_TEST(test_ack_carries_only_changed_fields);
    RUN_TEST(test_telemetry_carries_full_snapshot);
    RUN_TEST(test_sync_request_manifest);
    RUN_TEST(test_unsafe_sync_paths);

    return UNITY_END();
}
