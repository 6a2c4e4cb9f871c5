#ifndef RTMP_TEST_UTIL_HPP
#define RTMP_TEST_UTIL_HPP
#include "chunk_header.hpp"
#include "chunk_reassembler.hpp"
#include "rtmp_session_base.hpp"
#include "rtmp_handshake.hpp"
#include "rtmp_message.hpp"
#include "rtmp_pub.hpp"
#include "byte_stream.hpp"
#include "data_buffer.hpp"

#include <stdint.h>
#include <string.h>
#include <vector>
#include <string>

namespace cpp_rtmp
{

inline ChunkHeader MakeChunkHeader(uint8_t fmt, uint32_t csid, uint32_t timestamp,
                                uint32_t msg_len = 0, uint8_t type_id = 0,
                                uint32_t msg_stream_id = 0) {
    ChunkHeader header;

    header.fmt_           = fmt;
    header.csid_          = csid;
    header.timestamp_     = timestamp;
    header.msg_len_       = msg_len;
    header.type_id_       = type_id;
    header.msg_stream_id_ = msg_stream_id;
    header.ext_ts_        = (fmt != 3) && (timestamp >= CHUNK_EXT_TIMESTAMP);
    return header;
}

inline void AppendChunk(DataBuffer& buffer, const ChunkHeader& header,
                    const uint8_t* payload = nullptr, size_t len = 0) {
    uint8_t data[CHUNK_HEADER_MAX_SIZE];

    int header_len = EncodeChunkHeader(header, data);
    if (header_len > 0) {
        buffer.AppendData((char*)data, header_len);
    }
    if (payload && len > 0) {
        buffer.AppendData((const char*)payload, len);
    }
}

inline std::vector<uint8_t> MakePayload(size_t len, uint8_t seed) {
    std::vector<uint8_t> payload(len);

    for (size_t i = 0; i < len; i++) {
        payload[i] = (uint8_t)(seed + i * 7);
    }
    return payload;
}

// protocol control message from the client side, always on csid 2
inline void AppendControl(DataBuffer& buffer, uint8_t type_id, const uint8_t* payload, size_t len) {
    AppendChunk(buffer, MakeChunkHeader(0, CHUNK_CONTROL_CSID, 0, (uint32_t)len, type_id, 0),
            payload, len);
}

inline void AppendControl4(DataBuffer& buffer, uint8_t type_id, uint32_t value) {
    uint8_t data[4];

    ByteStream::Write4Bytes(data, value);
    AppendControl(buffer, type_id, data, sizeof(data));
}

// c0 + simple c1: time, zero, random
inline void AppendSimpleC0C1(DataBuffer& buffer) {
    uint8_t c0c1[1 + RTMP_HANDSHAKE_SIZE];

    c0c1[0] = RTMP_HANDSHAKE_VERSION;
    for (size_t i = 1; i < sizeof(c0c1); i++) {
        c0c1[i] = (uint8_t)(i * 13 + 5);
    }
    ByteStream::Write4Bytes(c0c1 + 1, 0x01020304);
    ByteStream::Write4Bytes(c0c1 + 5, 0);
    buffer.AppendData((char*)c0c1, sizeof(c0c1));
}

inline void AppendC2(DataBuffer& buffer) {
    uint8_t c2[RTMP_HANDSHAKE_SIZE];

    memset(c2, 0x5a, sizeof(c2));
    buffer.AppendData((char*)c2, sizeof(c2));
}

class MessageCollector : public ChunkMessageCallbackI
{
public:
    virtual int OnChunkMessage(RTMP_MESSAGE_PTR msg_ptr) override {
        messages_.push_back(msg_ptr);
        return ret_;
    }

public:
    std::vector<RTMP_MESSAGE_PTR> messages_;
    int ret_ = RTMP_OK;
};

// peer side reader of the bytes a session sends, it follows SetChunkSize
class PeerChunkReader : public ChunkMessageCallbackI
{
public:
    PeerChunkReader():reassembler_(this)
    {
    }

public:
    int Read(const uint8_t* data, size_t len) {
        size_t consumed = 0;
        return reassembler_.Feed(data, len, consumed);
    }

    virtual int OnChunkMessage(RTMP_MESSAGE_PTR msg_ptr) override {
        if ((msg_ptr->type_id_ == RTMP_CONTROL_SET_CHUNK_SIZE) && (msg_ptr->Length() >= 4)) {
            reassembler_.SetChunkSize(ByteStream::Read4Bytes(msg_ptr->Data()));
        }
        messages_.push_back(msg_ptr);
        return RTMP_OK;
    }

public:
    ChunkReassembler reassembler_;
    std::vector<RTMP_MESSAGE_PTR> messages_;
};

// session whose transport is a byte buffer
class TestSession : public RtmpSessionBase, public RtmpSessionCallbackI
{
public:
    TestSession(const RtmpSessionConfig& config = RtmpSessionConfig()):RtmpSessionBase(config, this, nullptr)
    {
    }

public:
    virtual int RtmpSend(const char* data, size_t len) override {
        if (send_fail_) {
            return -1;
        }
        sent_.AppendData(data, len);
        return RTMP_OK;
    }

    virtual void OnHandshakeDone() override {
        handshake_done_count_++;
    }

    virtual int OnMessage(RTMP_MESSAGE_PTR msg_ptr) override {
        messages_.push_back(msg_ptr);
        return RTMP_OK;
    }

    virtual void OnError(int code, size_t consumed) override {
        error_count_++;
        error_code_     = code;
        error_consumed_ = consumed;
    }

public:
    int Feed(DataBuffer& buffer) {
        return OnRecvData((const uint8_t*)buffer.Data(), buffer.DataLen());
    }

    // simple handshake, the s0s1s2 bytes are dropped from sent_
    int DoHandshake() {
        DataBuffer buffer;

        AppendSimpleC0C1(buffer);
        AppendC2(buffer);
        int ret = Feed(buffer);
        sent_.Reset();
        return ret;
    }

    // messages this session sent, parsed as the peer would
    std::vector<RTMP_MESSAGE_PTR> SentMessages() {
        PeerChunkReader reader;

        reader.Read((const uint8_t*)sent_.Data(), sent_.DataLen());
        return reader.messages_;
    }

public:
    DataBuffer sent_;
    bool send_fail_ = false;
    int handshake_done_count_ = 0;
    std::vector<RTMP_MESSAGE_PTR> messages_;
    int error_count_ = 0;
    int error_code_ = RTMP_OK;
    size_t error_consumed_ = 0;
};

}
#endif //RTMP_TEST_UTIL_HPP
