#include "rtmp_server.hpp"

namespace cpp_rtmp
{

RtmpServer::RtmpServer(uv_loop_t* loop,
                    const std::string& ip,
                    uint16_t port,
                    const RtmpSessionConfig& config,
                    RtmpServerCallbackI* cb,
                    Logger* logger):TimerInterface(loop, RTMP_SERVER_SWEEP_INTERVAL, RTMP_SERVER_SWEEP_INTERVAL)
    , config_(config)
    , cb_(cb)
    , logger_(logger)
    , tcp_server_(loop, ip, port, this, logger)
{
    LogInfof(logger_, "rtmp server start, config:%s", config_.Dump().c_str());
    StartTimer();
}

RtmpServer::~RtmpServer()
{
    Stop();
}

void RtmpServer::Stop() {
    tcp_server_.Close();
    StopTimer();

    // Close() moves the session from sessions_ to closed_sessions_
    while (!sessions_.empty()) {
        RTMP_SERVER_SESSION_PTR session_ptr = sessions_.begin()->second;
        session_ptr->Close(RTMP_OK);
        sessions_.erase(session_ptr.get());
    }
    closed_sessions_.clear();
}

void RtmpServer::OnAccept(int ret_code, uv_loop_t* loop, uv_stream_t* handle) {
    if (ret_code < 0) {
        LogErrorf(logger_, "rtmp server accept error:%d", ret_code);
        return;
    }

    RTMP_SERVER_SESSION_PTR session_ptr;
    try {
        session_ptr = std::make_shared<RtmpServerSession>(loop, handle, config_, this, cb_, logger_);
        sessions_[session_ptr.get()] = session_ptr;
        session_ptr->Start();
    } catch(CppRtmpException& e) {
        LogErrorf(logger_, "rtmp server accept exception:%s", e.what());
        if (session_ptr) {
            session_ptr->Close(RTMP_ERROR_HANDSHAKE);
        }
        return;
    }
    LogInfof(logger_, "rtmp server accept session, remote:%s, session count:%lu",
            session_ptr->GetRemoteEndpoint().c_str(), (unsigned long)sessions_.size());
}

void RtmpServer::OnSessionClosed(RtmpServerSession* session) {
    auto iter = sessions_.find(session);
    if (iter == sessions_.end()) {
        return;
    }
    closed_sessions_.push_back(iter->second);
    sessions_.erase(iter);
    LogInfof(logger_, "rtmp server remove session, remote:%s, session count:%lu",
            session->GetRemoteEndpoint().c_str(), (unsigned long)sessions_.size());
}

void RtmpServer::OnTimer() {
    closed_sessions_.clear();
}

}
