#ifndef CHUNK_HEADER_HPP
#define CHUNK_HEADER_HPP
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <unordered_map>
#include <string>

namespace cpp_rtmp
{

class ChunkStream;
typedef std::shared_ptr<ChunkStream> CHUNK_STREAM_PTR;
typedef std::unordered_map<uint32_t, CHUNK_STREAM_PTR> CHUNK_STREAM_MAP;

/*
 * one chunk header as it is on the wire.
 * timestamp_ holds the absolute timestamp for fmt0 and the delta for fmt1/fmt2,
 * with the extended timestamp already in place of the 24 bits field.
 * for fmt3 it holds the extended timestamp when ext_ts_ is set.
 */
class ChunkHeader
{
public:
    uint8_t  fmt_           = 0;
    uint32_t csid_          = 0;
    uint32_t timestamp_     = 0;
    uint32_t msg_len_       = 0;
    uint8_t  type_id_       = 0;
    uint32_t msg_stream_id_ = 0;
    bool     ext_ts_        = false;

public:
    std::string Dump() const;
};

size_t GetBasicHeaderSize(uint32_t csid);
size_t GetMessageHeaderSize(uint8_t fmt);
size_t GetChunkHeaderSize(const ChunkHeader& header);

// returns the bytes written (at most CHUNK_HEADER_MAX_SIZE) or a negative error
int EncodeChunkHeader(const ChunkHeader& header, uint8_t* data);

typedef enum {
    CHUNK_HEADER_PHASE_BASIC,
    CHUNK_HEADER_PHASE_BASIC_EXT,
    CHUNK_HEADER_PHASE_MESSAGE,
    CHUNK_HEADER_PHASE_EXT_TIMESTAMP
} CHUNK_HEADER_PHASE;

/*
 * resumable chunk header decoder.
 * Decode consumes at most one header, staging partial bytes internally
 * so a header split over several reads is never parsed twice.
 */
class ChunkHeaderDecoder
{
public:
    ChunkHeaderDecoder(Logger* logger = nullptr);
    ~ChunkHeaderDecoder();

public:
    // returns RTMP_OK with the header ready, RTMP_NEED_READ_MORE when all input
    // was consumed, or an error. consumed is set in every case.
    int Decode(const uint8_t* data, size_t len, size_t& consumed,
            const CHUNK_STREAM_MAP& cs_map);
    const ChunkHeader& GetHeader() { return header_; }
    bool IsIdle() { return (phase_ == CHUNK_HEADER_PHASE_BASIC) && (staged_len_ == 0); }
    void Reset();

private:
    size_t Stage(const uint8_t* data, size_t len, size_t need);
    int OnBasicHeader(const CHUNK_STREAM_MAP& cs_map);
    void OnMessageHeader();

private:
    CHUNK_HEADER_PHASE phase_ = CHUNK_HEADER_PHASE_BASIC;
    uint8_t staged_[CHUNK_HEADER_MAX_SIZE];
    size_t staged_len_   = 0;
    size_t basic_size_   = 1;
    size_t message_pos_  = 0;
    bool   context_ext_  = false;
    ChunkHeader header_;

private:
    Logger* logger_ = nullptr;
};

}
#endif //CHUNK_HEADER_HPP
