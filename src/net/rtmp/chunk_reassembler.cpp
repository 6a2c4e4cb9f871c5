#include "chunk_reassembler.hpp"

namespace cpp_rtmp
{

ChunkReassembler::ChunkReassembler(ChunkMessageCallbackI* cb, Logger* logger):cb_(cb)
    , decoder_(logger)
    , logger_(logger)
{
}

ChunkReassembler::~ChunkReassembler()
{
}

int ChunkReassembler::SetChunkSize(uint32_t chunk_size) {
    if ((chunk_size == 0) || (chunk_size > CHUNK_MAX_SIZE)) {
        LogErrorf(logger_, "invalid read chunk size:%u", chunk_size);
        return RTMP_ERROR_INVALID_CHUNK_SIZE;
    }
    LogDebugf(logger_, "read chunk size %u -> %u", chunk_size_, chunk_size);
    chunk_size_ = chunk_size;
    return RTMP_OK;
}

CHUNK_STREAM_PTR ChunkReassembler::GetChunkStream(uint32_t csid) {
    auto iter = cs_map_.find(csid);
    if (iter == cs_map_.end()) {
        return nullptr;
    }
    return iter->second;
}

CHUNK_STREAM_PTR ChunkReassembler::GetOrCreateChunkStream(uint32_t csid) {
    CHUNK_STREAM_PTR cs_ptr = GetChunkStream(csid);
    if (!cs_ptr) {
        cs_ptr = std::make_shared<ChunkStream>(csid, logger_);
        cs_map_[csid] = cs_ptr;
    }
    return cs_ptr;
}

void ChunkReassembler::Abort(uint32_t csid) {
    CHUNK_STREAM_PTR cs_ptr = GetChunkStream(csid);
    if (!cs_ptr) {
        LogDebugf(logger_, "abort unknown csid:%u", csid);
        return;
    }
    size_t dropped = cs_ptr->Abort();
    if ((current_cs_ == cs_ptr) && (phase_ == REASSEMBLE_PAYLOAD_PHASE)) {
        phase_      = REASSEMBLE_HEADER_PHASE;
        chunk_left_ = 0;
        current_cs_ = nullptr;
    }
    LogInfof(logger_, "abort csid:%u, dropped %lu bytes", csid, (unsigned long)dropped);
}

int ChunkReassembler::Feed(const uint8_t* data, size_t len, size_t& consumed) {
    int ret = RTMP_OK;

    consumed = 0;
    if (error_ != RTMP_OK) {
        return error_;
    }

    while (consumed < len) {
        if (phase_ == REASSEMBLE_HEADER_PHASE) {
            size_t header_len = 0;

            ret = decoder_.Decode(data + consumed, len - consumed, header_len, cs_map_);
            consumed += header_len;
            if (ret == RTMP_NEED_READ_MORE) {
                break;
            }
            if (ret != RTMP_OK) {
                error_ = ret;
                return ret;
            }
            ret = OnHeader(decoder_.GetHeader());
            if (ret != RTMP_OK) {
                error_ = ret;
                return ret;
            }
            continue;
        }

        size_t read_len = len - consumed;
        if (read_len > chunk_left_) {
            read_len = chunk_left_;
        }
        read_len = current_cs_->ReadMessagePayload(data + consumed, read_len);
        consumed    += read_len;
        chunk_left_ -= (uint32_t)read_len;

        if (chunk_left_ > 0) {
            continue;
        }
        phase_ = REASSEMBLE_HEADER_PHASE;

        CHUNK_STREAM_PTR cs_ptr = current_cs_;
        current_cs_ = nullptr;
        if (cs_ptr->IsReady()) {
            ret = EmitMessage(cs_ptr);
            if (ret < 0) {
                error_ = ret;
                return ret;
            }
        }
    }
    return RTMP_OK;
}

int ChunkReassembler::OnHeader(const ChunkHeader& header) {
    CHUNK_STREAM_PTR cs_ptr = GetOrCreateChunkStream(header.csid_);

    int ret = cs_ptr->ReadMessageHeader(header, max_message_size_);
    if (ret != RTMP_OK) {
        LogErrorf(logger_, "read message header error:%s, header:%s",
                GetRtmpErrorDesc(ret), header.Dump().c_str());
        return ret;
    }

    if (cs_ptr->IsReady()) {
        // zero length message, no payload follows
        return EmitMessage(cs_ptr);
    }

    chunk_left_ = (cs_ptr->remain_ < chunk_size_) ? cs_ptr->remain_ : chunk_size_;
    current_cs_ = cs_ptr;
    phase_      = REASSEMBLE_PAYLOAD_PHASE;
    return RTMP_OK;
}

int ChunkReassembler::EmitMessage(CHUNK_STREAM_PTR cs_ptr) {
    RTMP_MESSAGE_PTR msg_ptr = cs_ptr->TakeMessage();
    if (!msg_ptr) {
        return RTMP_OK;
    }
    LogDebugf(logger_, "reassembled message %s", msg_ptr->Dump().c_str());

    if (!cb_) {
        return RTMP_OK;
    }
    int ret = cb_->OnChunkMessage(msg_ptr);
    if (ret < 0) {
        return ret;
    }
    return RTMP_OK;
}

}
