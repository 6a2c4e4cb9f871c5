#ifndef CHUNK_REASSEMBLER_HPP
#define CHUNK_REASSEMBLER_HPP
#include "chunk_header.hpp"
#include "chunk_stream.hpp"
#include "rtmp_message.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>
#include <stddef.h>

namespace cpp_rtmp
{

class ChunkMessageCallbackI
{
public:
    // a negative return stops the reassembler with that error
    virtual int OnChunkMessage(RTMP_MESSAGE_PTR msg_ptr) = 0;
};

typedef enum {
    REASSEMBLE_HEADER_PHASE,
    REASSEMBLE_PAYLOAD_PHASE
} REASSEMBLE_PHASE;

/*
 * turns the chunk byte stream into complete messages.
 * bytes may arrive split anywhere, the state resumes at byte granularity.
 * any error is sticky: later Feed calls return it without reading.
 */
class ChunkReassembler
{
public:
    ChunkReassembler(ChunkMessageCallbackI* cb, Logger* logger = nullptr);
    ~ChunkReassembler();

public:
    // consumed: bytes read before returning, on error the bytes before the failure
    int Feed(const uint8_t* data, size_t len, size_t& consumed);

    int SetChunkSize(uint32_t chunk_size);
    uint32_t GetChunkSize() { return chunk_size_; }
    void SetMaxMessageSize(uint32_t max_size) { max_message_size_ = max_size; }
    uint32_t GetMaxMessageSize() { return max_message_size_; }

    // drop the partial message of the csid
    void Abort(uint32_t csid);

    int GetError() { return error_; }
    CHUNK_STREAM_PTR GetChunkStream(uint32_t csid);
    size_t GetChunkStreamCount() { return cs_map_.size(); }

private:
    CHUNK_STREAM_PTR GetOrCreateChunkStream(uint32_t csid);
    int OnHeader(const ChunkHeader& header);
    int EmitMessage(CHUNK_STREAM_PTR cs_ptr);

private:
    ChunkMessageCallbackI* cb_ = nullptr;
    ChunkHeaderDecoder decoder_;
    CHUNK_STREAM_MAP cs_map_;
    CHUNK_STREAM_PTR current_cs_;
    REASSEMBLE_PHASE phase_     = REASSEMBLE_HEADER_PHASE;
    uint32_t chunk_left_        = 0;
    uint32_t chunk_size_        = CHUNK_DEF_SIZE;
    uint32_t max_message_size_  = RTMP_DEF_MAX_MESSAGE_SIZE;
    int error_ = RTMP_OK;

private:
    Logger* logger_ = nullptr;
};

}
#endif //CHUNK_REASSEMBLER_HPP
