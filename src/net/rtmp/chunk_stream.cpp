#include "chunk_stream.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdio.h>

namespace cpp_rtmp
{

ChunkStream::ChunkStream(uint32_t csid, Logger* logger):csid_(csid)
    , logger_(logger)
{
}

ChunkStream::~ChunkStream()
{
}

int ChunkStream::ResolveHeader(const ChunkHeader& header) {
    if ((header.fmt_ != 0) && !header_ready_) {
        LogErrorf(logger_, "csid:%u has no header for fmt:%d", csid_, header.fmt_);
        return RTMP_ERROR_MISSING_HEADER_CONTEXT;
    }

    switch (header.fmt_) {
        case 0:
        {
            timestamp_       = header.timestamp_;
            timestamp_delta_ = 0;
            msg_len_         = header.msg_len_;
            type_id_         = header.type_id_;
            msg_stream_id_   = header.msg_stream_id_;
            break;
        }
        case 1:
        {
            timestamp_delta_ = header.timestamp_;
            timestamp_      += timestamp_delta_;
            msg_len_         = header.msg_len_;
            type_id_         = header.type_id_;
            break;
        }
        case 2:
        {
            timestamp_delta_ = header.timestamp_;
            timestamp_      += timestamp_delta_;
            break;
        }
        case 3:
        {
            // everything inherited, the delta after a fmt0 basis is zero
            if (header.ext_ts_) {
                if (basis_fmt_ == 0) {
                    timestamp_ = header.timestamp_;
                } else {
                    timestamp_delta_ = header.timestamp_;
                    timestamp_      += timestamp_delta_;
                }
                return RTMP_OK;
            }
            timestamp_ += timestamp_delta_;
            return RTMP_OK;
        }
        default:
        {
            LogErrorf(logger_, "unknown chunk fmt:%d", header.fmt_);
            return RTMP_ERROR_CODEC;
        }
    }
    basis_fmt_    = header.fmt_;
    ts_field_     = header.timestamp_;
    ext_ts_flag_  = header.ext_ts_;
    header_ready_ = true;

    return RTMP_OK;
}

int ChunkStream::ReadMessageHeader(const ChunkHeader& header, uint32_t max_message_size) {
    if (IsReceiving()) {
        if (header.fmt_ != 3) {
            LogErrorf(logger_, "csid:%u gets fmt:%d in the middle of a message, remain:%u",
                    csid_, header.fmt_, remain_);
            return RTMP_ERROR_CODEC;
        }
        // continuation chunk, a repeated extended timestamp is ignored
        return RTMP_OK;
    }

    int ret = ResolveHeader(header);
    if (ret != RTMP_OK) {
        return ret;
    }

    if (msg_len_ > max_message_size) {
        LogErrorf(logger_, "csid:%u message length:%u is over the limit:%u",
                csid_, msg_len_, max_message_size);
        return RTMP_ERROR_MESSAGE_TOO_LARGE;
    }

    remain_    = msg_len_;
    receiving_ = true;
    payload_   = std::make_shared<DataBuffer>(msg_len_);

    return RTMP_OK;
}

size_t ChunkStream::ReadMessagePayload(const uint8_t* data, size_t len) {
    if (!IsReceiving()) {
        return 0;
    }
    size_t read_len = (len < remain_) ? len : remain_;

    payload_->AppendData((char*)data, read_len);
    remain_ -= (uint32_t)read_len;
    return read_len;
}

RTMP_MESSAGE_PTR ChunkStream::TakeMessage() {
    if (!IsReady()) {
        return nullptr;
    }
    RTMP_MESSAGE_PTR msg_ptr = std::make_shared<RtmpMessage>(type_id_, msg_stream_id_,
                                                timestamp_, payload_);
    msg_ptr->csid_ = csid_;

    payload_   = nullptr;
    receiving_ = false;
    msg_count_++;

    return msg_ptr;
}

size_t ChunkStream::Abort() {
    if (!receiving_) {
        return 0;
    }
    size_t dropped = payload_ ? payload_->DataLen() : 0;

    payload_   = nullptr;
    remain_    = 0;
    receiving_ = false;

    return dropped;
}

std::string ChunkStream::DumpHeader() {
    char desc[256];

    snprintf(desc, sizeof(desc), "csid:%u, basis fmt:%d, timestamp:%u, delta:%u, msg len:%u, type id:%d, msg stream id:%u, remain:%u, ext ts:%s",
            csid_, basis_fmt_, timestamp_, timestamp_delta_, msg_len_, type_id_, msg_stream_id_,
            remain_, ext_ts_flag_ ? "true" : "false");
    return std::string(desc);
}

}
