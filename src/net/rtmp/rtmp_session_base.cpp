#include "rtmp_session_base.hpp"
#include "timeex.hpp"

namespace cpp_rtmp
{

const char* GetSessionPhaseDesc(RTMP_SESSION_PHASE phase) {
    switch (phase) {
        case session_handshake_phase:
            return "handshake";
        case session_chunk_phase:
            return "chunk";
        case session_error_phase:
            return "error";
        default:
            break;
    }
    return "unknown";
}

RtmpSessionBase::RtmpSessionBase(const RtmpSessionConfig& config, RtmpSessionCallbackI* cb,
                            Logger* logger):config_(config)
    , cb_(cb)
    , recv_buffer_(RTMP_HANDSHAKE_SIZE * 2 + 1)
    , handshake_(logger)
    , reassembler_(this, logger)
    , writer_(logger)
    , ctrl_handler_(this, logger)
    , logger_(logger)
{
    handshake_.SetDigestEnable(config_.digest_handshake_);
    handshake_.SetSimpleFallback(config_.simple_handshake_fallback_);
    reassembler_.SetMaxMessageSize(config_.max_message_size_);
}

RtmpSessionBase::~RtmpSessionBase()
{
}

uint32_t RtmpSessionBase::GetRelativeTime() {
    if (epoch_ms_ == 0) {
        return 0;
    }
    return (uint32_t)(now_millisec() - epoch_ms_);
}

uint64_t RtmpSessionBase::GetUnackedBytes() {
    // the peer acknowledges with a 32 bits sequence number which wraps
    uint32_t sent = (uint32_t)send_bytes_;
    return (uint64_t)(uint32_t)(sent - peer_acked_bytes_);
}

void RtmpSessionBase::OnFatalError(int code) {
    if (error_ != RTMP_OK) {
        return;
    }
    error_ = code;
    phase_ = session_error_phase;

    LogErrorf(logger_, "rtmp session fatal error:%d(%s), consumed bytes:%lu",
            code, GetRtmpErrorDesc(code), (unsigned long)consumed_bytes_);
    if (cb_) {
        cb_->OnError(code, consumed_bytes_);
    }
}

int RtmpSessionBase::OnRecvData(const uint8_t* data, size_t len) {
    int ret = RTMP_OK;

    if (error_ != RTMP_OK) {
        return error_;
    }
    recv_bytes_   += len;
    ack_received_ += len;

    if (phase_ == session_handshake_phase) {
        DataBuffer output(RTMP_HANDSHAKE_SIZE * 2 + 1);

        recv_buffer_.AppendData((char*)data, len);
        size_t before_len = recv_buffer_.DataLen();

        ret = handshake_.HandleData(recv_buffer_, output);
        consumed_bytes_ += before_len - recv_buffer_.DataLen();

        if (output.DataLen() > 0) {
            int send_ret = RtmpSend(output.Data(), output.DataLen());
            if (send_ret < 0) {
                OnFatalError(RTMP_ERROR_SEND);
                return error_;
            }
            send_bytes_ += output.DataLen();
        }

        if (ret == RTMP_NEED_READ_MORE) {
            return RTMP_OK;
        }
        if (ret != RTMP_OK) {
            OnFatalError(ret);
            return error_;
        }

        phase_    = session_chunk_phase;
        epoch_ms_ = now_millisec();
        if (cb_) {
            cb_->OnHandshakeDone();
        }
        if (error_ != RTMP_OK) {
            return error_;
        }

        // chunks which arrived together with c2
        if (recv_buffer_.DataLen() > 0) {
            DataBuffer left_buffer(recv_buffer_);
            recv_buffer_.Reset();

            ret = FeedChunks((uint8_t*)left_buffer.Data(), left_buffer.DataLen());
            if (ret != RTMP_OK) {
                return ret;
            }
        }
        return CheckAck();
    }

    ret = FeedChunks(data, len);
    if (ret != RTMP_OK) {
        return ret;
    }
    return CheckAck();
}

int RtmpSessionBase::FeedChunks(const uint8_t* data, size_t len) {
    size_t consumed = 0;

    int ret = reassembler_.Feed(data, len, consumed);
    consumed_bytes_ += consumed;
    if (ret != RTMP_OK) {
        OnFatalError(ret);
        return error_;
    }
    if (error_ != RTMP_OK) {
        return error_;
    }
    return RTMP_OK;
}

int RtmpSessionBase::CheckAck() {
    if ((remote_window_acksize_ == 0) || (ack_received_ < remote_window_acksize_)) {
        return RTMP_OK;
    }
    ack_received_ = 0;

    int ret = ctrl_handler_.SendRtmpAck((uint32_t)recv_bytes_);
    if (ret != RTMP_OK) {
        OnFatalError(ret);
        return error_;
    }
    return RTMP_OK;
}

int RtmpSessionBase::OnChunkMessage(RTMP_MESSAGE_PTR msg_ptr) {
    int ret = RTMP_OK;

    if (IsRtmpControlMessage(msg_ptr->type_id_)) {
        ret = ctrl_handler_.HandleRtmpControlMessage(msg_ptr);
        if (ret < 0) {
            LogErrorf(logger_, "handle rtmp control message error:%d(%s), message:%s",
                    ret, GetRtmpErrorDesc(ret), msg_ptr->Dump().c_str());
        }
        return ret;
    }

    if (!cb_) {
        return RTMP_OK;
    }
    ret = cb_->OnMessage(msg_ptr);
    if (ret < 0) {
        LogErrorf(logger_, "message handler error:%d, message:%s", ret, msg_ptr->Dump().c_str());
    }
    return ret;
}

int RtmpSessionBase::SendMessage(uint32_t csid, const RtmpMessage& msg) {
    if (phase_ != session_chunk_phase) {
        LogErrorf(logger_, "send message in session phase:%s", GetSessionPhaseDesc(phase_));
        return RTMP_ERROR_INVALID_STATE;
    }
    DataBuffer output(msg.Length() + CHUNK_HEADER_MAX_SIZE * 4);

    int ret = writer_.WriteMessage(csid, msg, output);
    if (ret != RTMP_OK) {
        LogErrorf(logger_, "write message error:%d(%s), csid:%u, message:%s",
                ret, GetRtmpErrorDesc(ret), csid, msg.Dump().c_str());
        return ret;
    }

    ret = RtmpSend(output.Data(), output.DataLen());
    if (ret < 0) {
        LogErrorf(logger_, "rtmp send error:%d", ret);
        return RTMP_ERROR_SEND;
    }
    send_bytes_ += output.DataLen();
    return RTMP_OK;
}

int RtmpSessionBase::SendMessage(uint32_t csid, uint8_t type_id, uint32_t msg_stream_id,
                            uint32_t timestamp, const uint8_t* data, size_t len) {
    RtmpMessage msg(type_id, msg_stream_id, timestamp, data, len);

    return SendMessage(csid, msg);
}

}
