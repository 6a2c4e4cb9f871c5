#ifndef RTMP_SERVER_HPP
#define RTMP_SERVER_HPP
#include "tcp_server.hpp"
#include "tcp_pub.hpp"
#include "rtmp_server_session.hpp"
#include "rtmp_session_config.hpp"
#include "timer.hpp"
#include "logger.hpp"

#include <uv.h>
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include <stdint.h>

namespace cpp_rtmp
{

#define RTMP_SERVER_SWEEP_INTERVAL 1000

class RtmpServer : public TcpServerCallbackI, public RtmpSessionOwnerI, public TimerInterface
{
public:
    RtmpServer(uv_loop_t* loop,
            const std::string& ip,
            uint16_t port,
            const RtmpSessionConfig& config,
            RtmpServerCallbackI* cb,
            Logger* logger = nullptr);
    virtual ~RtmpServer();

public:
    void Stop();
    size_t GetSessionCount() { return sessions_.size(); }

public://tcp server callback implement
    virtual void OnAccept(int ret_code, uv_loop_t* loop, uv_stream_t* handle) override;

public://session owner implement
    virtual void OnSessionClosed(RtmpServerSession* session) override;

public://timer implement
    virtual void OnTimer() override;

private:
    RtmpSessionConfig config_;
    RtmpServerCallbackI* cb_ = nullptr;
    Logger* logger_ = nullptr;

private:
    std::unordered_map<RtmpServerSession*, RTMP_SERVER_SESSION_PTR> sessions_;
    // closed sessions are released from the timer, never inside their own callbacks
    std::vector<RTMP_SERVER_SESSION_PTR> closed_sessions_;

private:
    TcpServer tcp_server_;
};

}
#endif //RTMP_SERVER_HPP
