#ifndef CHUNK_WRITER_HPP
#define CHUNK_WRITER_HPP
#include "chunk_header.hpp"
#include "chunk_stream.hpp"
#include "rtmp_message.hpp"
#include "data_buffer.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>

namespace cpp_rtmp
{

// cheapest header for the first chunk of a message against the last one sent on the csid
ChunkHeader SelectChunkHeader(uint32_t csid, const RtmpMessage& msg, ChunkStream* prior);

/*
 * splits outbound messages into chunks of at most the write chunk size:
 * the first chunk carries the selected header, the rest use fmt3.
 */
class ChunkWriter
{
public:
    ChunkWriter(Logger* logger = nullptr);
    ~ChunkWriter();

public:
    // appends the chunks of the message to output
    int WriteMessage(uint32_t csid, const RtmpMessage& msg, DataBuffer& output);

    int SetChunkSize(uint32_t chunk_size);
    uint32_t GetChunkSize() { return chunk_size_; }
    CHUNK_STREAM_PTR GetChunkStream(uint32_t csid);

private:
    CHUNK_STREAM_MAP cs_map_;
    uint32_t chunk_size_ = CHUNK_DEF_SIZE;

private:
    Logger* logger_ = nullptr;
};

}
#endif //CHUNK_WRITER_HPP
