/*
 * =================================================================================
 * File:      lib/WireProtocol/FrameReader.h
 * Description:
 * Incremental frame cutter. Bytes are fed as they arrive from the socket;
 * complete frames are taken out one at a time.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "WireTypes.h"

enum FrameStatus : uint8_t { FRAME_INCOMPLETE, FRAME_READY, FRAME_ERROR };

class FrameReader {
public:
    explicit FrameReader(uint32_t maxFrameSize = WIRE_MAX_FRAME_SIZE);

    void feed(const uint8_t* data, size_t len);

    // FRAME_ERROR is sticky: the stream cannot be resynchronised.
    FrameStatus next(WireFrame& out, std::string& errorMsg);

    void reset();
    size_t buffered() const { return _buf.size() - _readPos; }

    static void writeFrame(const std::string& header, const uint8_t* body, size_t bodyLen,
                           std::vector<uint8_t>& out);

private:
    uint32_t _maxFrameSize;
    std::vector<uint8_t> _buf;
    size_t _readPos;
    bool _failed;

    void compact();
};
