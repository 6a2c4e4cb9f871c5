#include "chunk_writer.hpp"

namespace cpp_rtmp
{

ChunkHeader SelectChunkHeader(uint32_t csid, const RtmpMessage& msg, ChunkStream* prior) {
    ChunkHeader header;

    header.csid_          = csid;
    header.msg_len_       = (uint32_t)msg.Length();
    header.type_id_       = msg.type_id_;
    header.msg_stream_id_ = msg.msg_stream_id_;

    if (!prior || !prior->HasHeader() || (prior->msg_stream_id_ != msg.msg_stream_id_)
        || (msg.timestamp_ < prior->timestamp_)) {
        header.fmt_       = 0;
        header.timestamp_ = msg.timestamp_;
        header.ext_ts_    = (header.timestamp_ >= CHUNK_EXT_TIMESTAMP);
        return header;
    }

    uint32_t delta = msg.timestamp_ - prior->timestamp_;
    if ((prior->type_id_ != msg.type_id_) || (prior->msg_len_ != header.msg_len_)) {
        header.fmt_ = 1;
    } else if (delta == prior->timestamp_delta_) {
        // the receiver adds the inherited delta
        header.fmt_       = 3;
        header.timestamp_ = prior->ts_field_;
        header.ext_ts_    = prior->ext_ts_flag_;
        return header;
    } else {
        header.fmt_ = 2;
    }
    header.timestamp_ = delta;
    header.ext_ts_    = (delta >= CHUNK_EXT_TIMESTAMP);
    return header;
}

ChunkWriter::ChunkWriter(Logger* logger):logger_(logger)
{
}

ChunkWriter::~ChunkWriter()
{
}

int ChunkWriter::SetChunkSize(uint32_t chunk_size) {
    if ((chunk_size == 0) || (chunk_size > CHUNK_MAX_SIZE)) {
        LogErrorf(logger_, "invalid write chunk size:%u", chunk_size);
        return RTMP_ERROR_INVALID_CHUNK_SIZE;
    }
    chunk_size_ = chunk_size;
    return RTMP_OK;
}

CHUNK_STREAM_PTR ChunkWriter::GetChunkStream(uint32_t csid) {
    auto iter = cs_map_.find(csid);
    if (iter == cs_map_.end()) {
        return nullptr;
    }
    return iter->second;
}

int ChunkWriter::WriteMessage(uint32_t csid, const RtmpMessage& msg, DataBuffer& output) {
    uint8_t header_data[CHUNK_HEADER_MAX_SIZE];

    if ((csid < CHUNK_MIN_CSID) || (csid > CHUNK_MAX_CSID)) {
        LogErrorf(logger_, "write message on invalid csid:%u", csid);
        return RTMP_ERROR_INVALID_CSID;
    }
    if ((csid == CHUNK_CONTROL_CSID) && !IsRtmpControlMessage(msg.type_id_)) {
        LogErrorf(logger_, "csid:%u is reserved for control messages, type:%d",
                csid, msg.type_id_);
        return RTMP_ERROR_INVALID_CSID;
    }
    if (msg.Length() > 0xffffff) {
        LogErrorf(logger_, "message length:%lu can't be framed", (unsigned long)msg.Length());
        return RTMP_ERROR_MESSAGE_TOO_LARGE;
    }

    CHUNK_STREAM_PTR cs_ptr = GetChunkStream(csid);
    if (!cs_ptr) {
        cs_ptr = std::make_shared<ChunkStream>(csid, logger_);
        cs_map_[csid] = cs_ptr;
    }

    ChunkHeader header = SelectChunkHeader(csid, msg, cs_ptr.get());
    int header_len = EncodeChunkHeader(header, header_data);
    if (header_len < 0) {
        return header_len;
    }
    int ret = cs_ptr->ResolveHeader(header);
    if (ret != RTMP_OK) {
        return ret;
    }

    const uint8_t* p = msg.Data();
    size_t left = msg.Length();
    size_t write_len = (left < chunk_size_) ? left : chunk_size_;

    output.AppendData((char*)header_data, header_len);
    output.AppendData((char*)p, write_len);
    p    += write_len;
    left -= write_len;

    if (left > 0) {
        // continuation chunks: fmt3, the extended timestamp repeated when present
        ChunkHeader cont_header;
        cont_header.fmt_       = 3;
        cont_header.csid_      = csid;
        cont_header.ext_ts_    = cs_ptr->ext_ts_flag_;
        cont_header.timestamp_ = cs_ptr->ts_field_;

        header_len = EncodeChunkHeader(cont_header, header_data);
        if (header_len < 0) {
            return header_len;
        }
        while (left > 0) {
            write_len = (left < chunk_size_) ? left : chunk_size_;
            output.AppendData((char*)header_data, header_len);
            output.AppendData((char*)p, write_len);
            p    += write_len;
            left -= write_len;
        }
    }
    cs_ptr->msg_count_++;

    return RTMP_OK;
}

}
