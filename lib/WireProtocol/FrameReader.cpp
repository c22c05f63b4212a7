/*
 * =================================================================================
 * File:      lib/WireProtocol/FrameReader.cpp
 * =================================================================================
 */
#include "FrameReader.h"

static uint32_t readU32(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

static uint16_t readU16(const uint8_t* p) {
    return (uint16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
}

FrameReader::FrameReader(uint32_t maxFrameSize) : _maxFrameSize(maxFrameSize), _readPos(0), _failed(false) {}

void FrameReader::reset() {
    _buf.clear();
    _readPos = 0;
    _failed = false;
}

void FrameReader::feed(const uint8_t* data, size_t len) {
    if (_failed || len == 0) return;
    _buf.insert(_buf.end(), data, data + len);
}

void FrameReader::compact() {
    if (_readPos == 0) return;
    _buf.erase(_buf.begin(), _buf.begin() + (long)_readPos);
    _readPos = 0;
}

FrameStatus FrameReader::next(WireFrame& out, std::string& errorMsg) {
    if (_failed) {
        errorMsg = "Stream already failed";
        return FRAME_ERROR;
    }

    size_t avail = _buf.size() - _readPos;
    if (avail < WIRE_FRAME_PREFIX) return FRAME_INCOMPLETE;

    const uint8_t* p = _buf.data() + _readPos;
    uint32_t frameLen = readU32(p);

    // Validate the length before waiting for the rest of it
    if (frameLen > _maxFrameSize) {
        _failed = true;
        errorMsg = "Frame too large: " + std::to_string(frameLen) + " bytes";
        return FRAME_ERROR;
    }
    if (frameLen < WIRE_HEADER_PREFIX) {
        _failed = true;
        errorMsg = "Frame too short for header length";
        return FRAME_ERROR;
    }
    if (avail < WIRE_FRAME_PREFIX + (size_t)frameLen) return FRAME_INCOMPLETE;

    uint16_t headerLen = readU16(p + WIRE_FRAME_PREFIX);
    if (headerLen == 0 || (uint32_t)headerLen > frameLen - WIRE_HEADER_PREFIX) {
        _failed = true;
        errorMsg = "Invalid header length: " + std::to_string(headerLen);
        return FRAME_ERROR;
    }

    const uint8_t* header = p + WIRE_FRAME_PREFIX + WIRE_HEADER_PREFIX;
    size_t bodyLen = frameLen - WIRE_HEADER_PREFIX - headerLen;

    out.header.assign((const char*)header, headerLen);
    out.body.assign(header + headerLen, header + headerLen + bodyLen);

    _readPos += WIRE_FRAME_PREFIX + frameLen;
    if (_readPos == _buf.size()) {
        _buf.clear();
        _readPos = 0;
    } else if (_readPos > 64 * 1024) {
        compact();
    }
    return FRAME_READY;
}

void FrameReader::writeFrame(const std::string& header, const uint8_t* body, size_t bodyLen,
                             std::vector<uint8_t>& out) {
    uint32_t frameLen = (uint32_t)(WIRE_HEADER_PREFIX + header.size() + bodyLen);
    uint16_t headerLen = (uint16_t)header.size();

    out.clear();
    out.reserve(WIRE_FRAME_PREFIX + frameLen);
    out.push_back((uint8_t)(frameLen >> 24));
    out.push_back((uint8_t)(frameLen >> 16));
    out.push_back((uint8_t)(frameLen >> 8));
    out.push_back((uint8_t)(frameLen));
    out.push_back((uint8_t)(headerLen >> 8));
    out.push_back((uint8_t)(headerLen));
    out.insert(out.end(), header.begin(), header.end());
    if (body && bodyLen > 0) out.insert(out.end(), body, body + bodyLen);
}
