#ifndef CHUNK_STREAM_HPP
#define CHUNK_STREAM_HPP
#include "data_buffer.hpp"
#include "byte_stream.hpp"
#include "chunk_header.hpp"
#include "rtmp_message.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>
#include <memory>

namespace cpp_rtmp
{

/*
 * per chunk stream id context, used for both directions:
 * it keeps the last fully resolved message header which
 * the next fmt1/fmt2/fmt3 header is applied to.
 */
class ChunkStream
{
public:
    ChunkStream(uint32_t csid, Logger* logger = nullptr);
    ~ChunkStream();

public:
    bool HasHeader() { return header_ready_; }
    bool IsReady() { return receiving_ && (remain_ == 0); }
    bool IsReceiving() { return receiving_ && (remain_ > 0); }

    // apply the header of a new message to the timestamp/length/type state
    int ResolveHeader(const ChunkHeader& header);

    // first chunk of a message or a continuation chunk
    int ReadMessageHeader(const ChunkHeader& header, uint32_t max_message_size);
    size_t ReadMessagePayload(const uint8_t* data, size_t len);
    RTMP_MESSAGE_PTR TakeMessage();

    // drop the message in progress, returns the bytes dropped
    size_t Abort();
    std::string DumpHeader();

public:
    uint32_t csid_            = 0;
    uint8_t  basis_fmt_       = 0;
    uint32_t timestamp_       = 0;
    uint32_t timestamp_delta_ = 0;
    uint32_t ts_field_        = 0;
    bool     ext_ts_flag_     = false;
    uint32_t msg_len_         = 0;
    uint8_t  type_id_         = 0;
    uint32_t msg_stream_id_   = 0;
    uint32_t remain_          = 0;
    int64_t  msg_count_       = 0;

private:
    bool header_ready_ = false;
    bool receiving_    = false;
    DATA_BUFFER_PTR payload_;

private:
    Logger* logger_ = nullptr;
};

}
#endif
