#include "rtmp_server_session.hpp"

namespace cpp_rtmp
{

RtmpServerSession::RtmpServerSession(uv_loop_t* loop,
                                uv_stream_t* server_handle,
                                const RtmpSessionConfig& config,
                                RtmpSessionOwnerI* owner,
                                RtmpServerCallbackI* cb,
                                Logger* logger):RtmpSessionBase(config, this, logger)
    , TimerInterface(loop, config.handshake_timeout_ms_)
    , conn_(loop, server_handle, this, logger)
    , owner_(owner)
    , server_cb_(cb)
{
    LogInfof(logger_, "rtmp server session construct, remote:%s", conn_.GetRemoteEndpoint().c_str());
}

RtmpServerSession::~RtmpServerSession()
{
    LogInfof(logger_, "rtmp server session destruct, remote:%s", conn_.GetRemoteEndpoint().c_str());
}

void RtmpServerSession::Start() {
    if (config_.handshake_timeout_ms_ > 0) {
        StartTimer();
    }
    conn_.AsyncRead();
}

void RtmpServerSession::Close(int reason) {
    if (closed_) {
        return;
    }
    closed_ = true;
    StopTimer();

    LogInfof(logger_, "rtmp server session close, remote:%s, reason:%d(%s), recv bytes:%lu, send bytes:%lu, pending write:%lu",
            conn_.GetRemoteEndpoint().c_str(), reason, GetRtmpErrorDesc(reason),
            (unsigned long)recv_bytes_, (unsigned long)send_bytes_,
            (unsigned long)conn_.GetPendingWriteBytes());
    conn_.Close();

    if (server_cb_) {
        server_cb_->OnSessionClose(this, reason);
    }
    if (owner_) {
        owner_->OnSessionClosed(this);
    }
}

int RtmpServerSession::RtmpSend(const char* data, size_t len) {
    if (closed_) {
        return RTMP_ERROR_SEND;
    }
    try {
        conn_.AsyncWrite(data, len);
    } catch(CppRtmpException& e) {
        LogErrorf(logger_, "rtmp send exception:%s, remote:%s", e.what(), conn_.GetRemoteEndpoint().c_str());
        return RTMP_ERROR_SEND;
    }
    return RTMP_OK;
}

void RtmpServerSession::OnWrite(int ret_code, size_t sent_size) {
    if (ret_code != 0) {
        LogErrorf(logger_, "rtmp write error:%d, remote:%s", ret_code, conn_.GetRemoteEndpoint().c_str());
        Close(RTMP_ERROR_SEND);
        return;
    }
}

void RtmpServerSession::OnRead(int ret_code, const char* data, size_t data_size) {
    if (closed_) {
        return;
    }
    if (ret_code != 0) {
        if (!IsHandshakeDone()) {
            // end of stream before the handshake completed
            Close(RTMP_ERROR_HANDSHAKE);
            return;
        }
        Close(RTMP_OK);
        return;
    }

    int ret = OnRecvData((const uint8_t*)data, data_size);
    if (ret < 0) {
        Close(ret);
    }
}

void RtmpServerSession::OnHandshakeDone() {
    StopTimer();
    LogInfof(logger_, "rtmp handshake done, remote:%s, mode:%s",
            conn_.GetRemoteEndpoint().c_str(), IsDigestHandshake() ? "digest" : "simple");

    int ret = AnnounceParameters();
    if (ret != RTMP_OK) {
        LogErrorf(logger_, "announce session parameters error:%d(%s)", ret, GetRtmpErrorDesc(ret));
        OnFatalError(ret);
        return;
    }
    if (server_cb_) {
        server_cb_->OnSessionHandshakeDone(this);
    }
}

int RtmpServerSession::AnnounceParameters() {
    int ret = ctrl_handler_.SendWindowAckSize(config_.window_ack_size_);
    if (ret != RTMP_OK) {
        return ret;
    }
    ret = ctrl_handler_.SendSetPeerBandwidth(config_.peer_bandwidth_, config_.peer_bandwidth_limit_);
    if (ret != RTMP_OK) {
        return ret;
    }
    if (config_.chunk_size_ != GetWriteChunkSize()) {
        ret = ctrl_handler_.SendSetChunksize(config_.chunk_size_);
    }
    return ret;
}

int RtmpServerSession::OnMessage(RTMP_MESSAGE_PTR msg_ptr) {
    if (!server_cb_) {
        return RTMP_OK;
    }
    return server_cb_->OnSessionMessage(this, msg_ptr);
}

void RtmpServerSession::OnError(int code, size_t consumed) {
    LogErrorf(logger_, "rtmp session error:%d(%s), consumed:%lu, remote:%s",
            code, GetRtmpErrorDesc(code), (unsigned long)consumed, conn_.GetRemoteEndpoint().c_str());
    Close(code);
}

void RtmpServerSession::OnTimer() {
    if (closed_ || IsHandshakeDone()) {
        return;
    }
    LogErrorf(logger_, "rtmp handshake timeout:%ums, remote:%s",
            config_.handshake_timeout_ms_, conn_.GetRemoteEndpoint().c_str());
    OnFatalError(RTMP_ERROR_HANDSHAKE);
}

}
