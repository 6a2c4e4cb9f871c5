#ifndef RTMP_SERVER_SESSION_HPP
#define RTMP_SERVER_SESSION_HPP
#include "tcp_session.hpp"
#include "tcp_pub.hpp"
#include "rtmp_pub.hpp"
#include "rtmp_session_base.hpp"
#include "rtmp_session_config.hpp"
#include "timer.hpp"
#include "logger.hpp"

#include <uv.h>
#include <memory>
#include <stdint.h>
#include <string>

namespace cpp_rtmp
{

class RtmpServerSession;

class RtmpServerCallbackI
{
public:
    virtual void OnSessionHandshakeDone(RtmpServerSession* session) = 0;
    virtual int OnSessionMessage(RtmpServerSession* session, RTMP_MESSAGE_PTR msg_ptr) = 0;
    // reason is RTMP_OK when the peer closed the connection
    virtual void OnSessionClose(RtmpServerSession* session, int reason) = 0;
};

class RtmpSessionOwnerI
{
public:
    virtual void OnSessionClosed(RtmpServerSession* session) = 0;
};

/*
 * one accepted tcp connection. the handshake must finish within
 * handshake_timeout_ms_, then the session announces its window ack size,
 * peer bandwidth and write chunk size.
 */
class RtmpServerSession : public TcpSessionCallbackI
                        , public RtmpSessionCallbackI
                        , public RtmpSessionBase
                        , public TimerInterface
{
public:
    RtmpServerSession(uv_loop_t* loop,
                    uv_stream_t* server_handle,
                    const RtmpSessionConfig& config,
                    RtmpSessionOwnerI* owner,
                    RtmpServerCallbackI* cb,
                    Logger* logger = nullptr);
    virtual ~RtmpServerSession();

public:
    void Start();
    void Close(int reason);
    bool IsClosed() { return closed_; }
    std::string GetRemoteEndpoint() { return conn_.GetRemoteEndpoint(); }
    std::string GetLocalEndpoint() { return conn_.GetLocalEndpoint(); }

public://tcp session callback implement
    virtual void OnWrite(int ret_code, size_t sent_size) override;
    virtual void OnRead(int ret_code, const char* data, size_t data_size) override;

public://rtmp session callback implement
    virtual void OnHandshakeDone() override;
    virtual int OnMessage(RTMP_MESSAGE_PTR msg_ptr) override;
    virtual void OnError(int code, size_t consumed) override;

public://timer implement
    virtual void OnTimer() override;

protected://implement rtmp_session_base
    virtual int RtmpSend(const char* data, size_t len) override;

private:
    int AnnounceParameters();

private:
    TcpSession conn_;
    RtmpSessionOwnerI* owner_ = nullptr;
    RtmpServerCallbackI* server_cb_ = nullptr;
    bool closed_ = false;
};

typedef std::shared_ptr<RtmpServerSession> RTMP_SERVER_SESSION_PTR;

}
#endif //RTMP_SERVER_SESSION_HPP
