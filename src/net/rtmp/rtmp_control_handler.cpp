#include "rtmp_control_handler.hpp"
#include "rtmp_session_base.hpp"
#include "byte_stream.hpp"

namespace cpp_rtmp
{

RtmpControlHandler::RtmpControlHandler(RtmpSessionBase* session, Logger* logger):session_(session)
    , logger_(logger)
{
}

RtmpControlHandler::~RtmpControlHandler()
{
}

RTMP_MESSAGE_PTR RtmpControlHandler::GenControlMessage(RTMP_CONTROL_TYPE ctrl_type, uint32_t size,
                                                uint32_t value, uint8_t extra) {
    uint8_t data[5];

    switch (size) {
        case 4:
        {
            ByteStream::Write4Bytes(data, value);
            break;
        }
        case 5:
        {
            ByteStream::Write4Bytes(data, value);
            data[4] = extra;
            break;
        }
        default:
        {
            return nullptr;
        }
    }
    return std::make_shared<RtmpMessage>((uint8_t)ctrl_type, 0, 0, data, size);
}

RTMP_MESSAGE_PTR RtmpControlHandler::GenUserControlMessage(RTMP_USER_EVENT_TYPE event, uint32_t value) {
    uint8_t data[6];

    ByteStream::Write2Bytes(data, (uint16_t)event);
    ByteStream::Write4Bytes(data + 2, value);

    return std::make_shared<RtmpMessage>((uint8_t)RTMP_CONTROL_USER_CTRL_MESSAGES, 0, 0, data, sizeof(data));
}

int RtmpControlHandler::SendControlMessage(RTMP_MESSAGE_PTR msg_ptr) {
    if (!msg_ptr) {
        return RTMP_ERROR_CODEC;
    }
    return session_->SendMessage(CHUNK_CONTROL_CSID, *msg_ptr);
}

int RtmpControlHandler::SendSetChunksize(uint32_t chunk_size) {
    if ((chunk_size == 0) || (chunk_size > CHUNK_MAX_SIZE)) {
        LogErrorf(logger_, "send invalid chunk size:%u", chunk_size);
        return RTMP_ERROR_INVALID_CHUNK_SIZE;
    }
    int ret = SendControlMessage(GenControlMessage(RTMP_CONTROL_SET_CHUNK_SIZE, 4, chunk_size));
    if (ret != RTMP_OK) {
        return ret;
    }
    LogInfof(logger_, "send ctrl message chunk size:%u", chunk_size);
    return session_->writer_.SetChunkSize(chunk_size);
}

int RtmpControlHandler::SendWindowAckSize(uint32_t size) {
    int ret = SendControlMessage(GenControlMessage(RTMP_CONTROL_WINDOW_ACK_SIZE, 4, size));
    if (ret != RTMP_OK) {
        return ret;
    }
    session_->window_acksize_ = size;
    return RTMP_OK;
}

int RtmpControlHandler::SendSetPeerBandwidth(uint32_t size, RTMP_PEER_BANDWIDTH_LIMIT limit) {
    return SendControlMessage(GenControlMessage(RTMP_CONTROL_SET_PEER_BANDWIDTH, 5, size, (uint8_t)limit));
}

int RtmpControlHandler::SendRtmpAck(uint32_t sequence) {
    LogDebugf(logger_, "send ack sequence:%u", sequence);
    return SendControlMessage(GenControlMessage(RTMP_CONTROL_ACK, 4, sequence));
}

int RtmpControlHandler::SendAbortMessage(uint32_t csid) {
    return SendControlMessage(GenControlMessage(RTMP_CONTROL_ABORT_MESSAGE, 4, csid));
}

int RtmpControlHandler::SendUserControl(RTMP_USER_EVENT_TYPE event, uint32_t value) {
    return SendControlMessage(GenUserControlMessage(event, value));
}

int RtmpControlHandler::SendSetBufferLength(uint32_t stream_id, uint32_t buffer_ms) {
    uint8_t data[10];

    ByteStream::Write2Bytes(data, (uint16_t)RTMP_USER_EVENT_SET_BUFFER_LENGTH);
    ByteStream::Write4Bytes(data + 2, stream_id);
    ByteStream::Write4Bytes(data + 6, buffer_ms);

    RtmpMessage msg((uint8_t)RTMP_CONTROL_USER_CTRL_MESSAGES, 0, 0, data, sizeof(data));
    return session_->SendMessage(CHUNK_CONTROL_CSID, msg);
}

int RtmpControlHandler::SendStreamBegin(uint32_t stream_id) {
    return SendUserControl(RTMP_USER_EVENT_STREAM_BEGIN, stream_id);
}

int RtmpControlHandler::SendPingRequest(uint32_t timestamp) {
    return SendUserControl(RTMP_USER_EVENT_PING_REQUEST, timestamp);
}

int RtmpControlHandler::SendPingResponse(uint32_t timestamp) {
    return SendUserControl(RTMP_USER_EVENT_PING_RESPONSE, timestamp);
}

int RtmpControlHandler::HandleRtmpControlMessage(RTMP_MESSAGE_PTR msg_ptr) {
    switch (msg_ptr->type_id_) {
        case RTMP_CONTROL_SET_CHUNK_SIZE:
            return HandleSetChunkSize(msg_ptr);
        case RTMP_CONTROL_ABORT_MESSAGE:
            return HandleAbortMessage(msg_ptr);
        case RTMP_CONTROL_ACK:
            return HandleAck(msg_ptr);
        case RTMP_CONTROL_USER_CTRL_MESSAGES:
            return HandleUserControl(msg_ptr);
        case RTMP_CONTROL_WINDOW_ACK_SIZE:
            return HandleWindowAckSize(msg_ptr);
        case RTMP_CONTROL_SET_PEER_BANDWIDTH:
            return HandleSetPeerBandwidth(msg_ptr);
        default:
            LogInfof(logger_, "don't handle rtmp control message:%d", msg_ptr->type_id_);
            break;
    }
    return RTMP_OK;
}

int RtmpControlHandler::HandleSetChunkSize(RTMP_MESSAGE_PTR msg_ptr) {
    if (msg_ptr->Length() < 4) {
        LogErrorf(logger_, "set chunk size control message size error:%lu", (unsigned long)msg_ptr->Length());
        return RTMP_ERROR_INVALID_CHUNK_SIZE;
    }
    uint32_t chunk_size = ByteStream::Read4Bytes(msg_ptr->Data());

    int ret = session_->reassembler_.SetChunkSize(chunk_size);
    if (ret != RTMP_OK) {
        return ret;
    }
    LogInfof(logger_, "update read chunk size:%u", chunk_size);
    return RTMP_OK;
}

int RtmpControlHandler::HandleAbortMessage(RTMP_MESSAGE_PTR msg_ptr) {
    if (msg_ptr->Length() < 4) {
        LogWarnf(logger_, "abort control message size error:%lu", (unsigned long)msg_ptr->Length());
        return RTMP_OK;
    }
    uint32_t csid = ByteStream::Read4Bytes(msg_ptr->Data());

    session_->reassembler_.Abort(csid);
    return RTMP_OK;
}

int RtmpControlHandler::HandleAck(RTMP_MESSAGE_PTR msg_ptr) {
    if (msg_ptr->Length() < 4) {
        LogWarnf(logger_, "ack control message size error:%lu", (unsigned long)msg_ptr->Length());
        return RTMP_OK;
    }
    session_->peer_acked_bytes_ = ByteStream::Read4Bytes(msg_ptr->Data());
    LogDebugf(logger_, "receive rtmp ack:%u, send bytes:%lu", session_->peer_acked_bytes_,
            (unsigned long)session_->send_bytes_);
    return RTMP_OK;
}

int RtmpControlHandler::HandleWindowAckSize(RTMP_MESSAGE_PTR msg_ptr) {
    if (msg_ptr->Length() < 4) {
        LogWarnf(logger_, "window ack size control message size error:%lu", (unsigned long)msg_ptr->Length());
        return RTMP_OK;
    }
    session_->remote_window_acksize_ = ByteStream::Read4Bytes(msg_ptr->Data());
    LogInfof(logger_, "update remote window ack size:%u", session_->remote_window_acksize_);
    return RTMP_OK;
}

int RtmpControlHandler::HandleSetPeerBandwidth(RTMP_MESSAGE_PTR msg_ptr) {
    if (msg_ptr->Length() < 5) {
        LogWarnf(logger_, "set peer bandwidth control message size error:%lu", (unsigned long)msg_ptr->Length());
        return RTMP_OK;
    }
    uint32_t bandwidth = ByteStream::Read4Bytes(msg_ptr->Data());
    uint8_t limit = msg_ptr->Data()[4];
    uint32_t window = session_->window_acksize_;

    switch (limit) {
        case RTMP_PEER_BANDWIDTH_HARD:
        {
            window = bandwidth;
            break;
        }
        case RTMP_PEER_BANDWIDTH_SOFT:
        {
            if ((window == 0) || (bandwidth < window)) {
                window = bandwidth;
            }
            break;
        }
        case RTMP_PEER_BANDWIDTH_DYNAMIC:
        {
            if (session_->peer_bandwidth_limit_ != RTMP_PEER_BANDWIDTH_HARD) {
                LogInfof(logger_, "ignore dynamic peer bandwidth:%u, previous limit:%d",
                        bandwidth, session_->peer_bandwidth_limit_);
                return RTMP_OK;
            }
            window = bandwidth;
            limit  = RTMP_PEER_BANDWIDTH_HARD;
            break;
        }
        default:
        {
            LogWarnf(logger_, "unknown peer bandwidth limit type:%d", limit);
            return RTMP_OK;
        }
    }
    session_->peer_bandwidth_       = bandwidth;
    session_->peer_bandwidth_limit_ = limit;
    LogInfof(logger_, "update peer bandwidth:%u, limit:%d", bandwidth, limit);

    if (window != session_->window_acksize_) {
        return SendWindowAckSize(window);
    }
    return RTMP_OK;
}

int RtmpControlHandler::HandleUserControl(RTMP_MESSAGE_PTR msg_ptr) {
    if (msg_ptr->Length() < 6) {
        LogWarnf(logger_, "user control message size error:%lu", (unsigned long)msg_ptr->Length());
        return RTMP_OK;
    }
    const uint8_t* p = msg_ptr->Data();
    uint16_t event = ByteStream::Read2Bytes(p);
    uint32_t value = ByteStream::Read4Bytes(p + 2);

    switch (event) {
        case RTMP_USER_EVENT_STREAM_BEGIN:
        {
            LogInfof(logger_, "user control stream begin, stream id:%u", value);
            break;
        }
        case RTMP_USER_EVENT_STREAM_EOF:
        {
            LogInfof(logger_, "user control stream eof, stream id:%u", value);
            break;
        }
        case RTMP_USER_EVENT_STREAM_DRY:
        {
            LogInfof(logger_, "user control stream dry, stream id:%u", value);
            break;
        }
        case RTMP_USER_EVENT_SET_BUFFER_LENGTH:
        {
            if (msg_ptr->Length() < 10) {
                LogWarnf(logger_, "set buffer length message size error:%lu", (unsigned long)msg_ptr->Length());
                break;
            }
            session_->buffer_length_ms_ = ByteStream::Read4Bytes(p + 6);
            LogInfof(logger_, "user control set buffer length, stream id:%u, buffer:%ums",
                    value, session_->buffer_length_ms_);
            break;
        }
        case RTMP_USER_EVENT_STREAM_IS_RECORDED:
        {
            LogInfof(logger_, "user control stream is recorded, stream id:%u", value);
            break;
        }
        case RTMP_USER_EVENT_PING_REQUEST:
        {
            LogDebugf(logger_, "user control ping request:%u", value);
            return SendPingResponse(value);
        }
        case RTMP_USER_EVENT_PING_RESPONSE:
        {
            LogDebugf(logger_, "user control ping response:%u", value);
            break;
        }
        default:
        {
            LogInfof(logger_, "don't handle user control event:%d", event);
            break;
        }
    }
    return RTMP_OK;
}

}
