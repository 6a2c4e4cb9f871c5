#ifndef TCP_SERVER_HPP
#define TCP_SERVER_HPP
#include "tcp_pub.hpp"
#include "logger.hpp"
#include <uv.h>
#include <string>
#include <stdint.h>
#include <stdlib.h>

namespace cpp_rtmp
{

inline static void OnUvConnection(uv_stream_t* server, int status);
inline static void OnUvServerClose(uv_handle_t* handle) {
    free(handle);
}

class TcpServer
{
friend void OnUvConnection(uv_stream_t* server, int status);

public:
    TcpServer(uv_loop_t* loop,
            const std::string& ip,
            uint16_t port,
            TcpServerCallbackI* cb,
            Logger* logger):loop_(loop)
                        , cb_(cb)
                        , logger_(logger)
    {
        struct sockaddr_storage addr;

        int err = uv_ip4_addr(ip.c_str(), port, (struct sockaddr_in*)&addr);
        if (err != 0) {
            err = uv_ip6_addr(ip.c_str(), port, (struct sockaddr_in6*)&addr);
            if (err != 0) {
                CPP_RTMP_THROW_ERROR("tcp server address error, ip:%s, port:%d", ip.c_str(), port);
            }
        }

        server_handle_ = (uv_tcp_t*)malloc(sizeof(uv_tcp_t));
        err = uv_tcp_init(loop_, server_handle_);
        if (err != 0) {
            free(server_handle_);
            server_handle_ = nullptr;
            CPP_RTMP_THROW_ERROR("uv_tcp_init() failed:%s", uv_strerror(err));
        }
        server_handle_->data = this;

        err = uv_tcp_bind(server_handle_, (const struct sockaddr*)&addr, 0);
        if (err != 0) {
            Close();
            CPP_RTMP_THROW_ERROR("uv_tcp_bind() failed:%s, ip:%s, port:%d",
                                uv_strerror(err), ip.c_str(), port);
        }
        err = uv_listen((uv_stream_t*)server_handle_, TCP_DEF_BACKLOG,
                    static_cast<uv_connection_cb>(OnUvConnection));
        if (err != 0) {
            Close();
            CPP_RTMP_THROW_ERROR("uv_listen() failed:%s, ip:%s, port:%d",
                                uv_strerror(err), ip.c_str(), port);
        }
        LogInfof(logger_, "tcp server listen on %s:%d", ip.c_str(), port);
    }

    ~TcpServer()
    {
        Close();
    }

public:
    void Close() {
        if (closed_ || !server_handle_) {
            return;
        }
        closed_ = true;
        server_handle_->data = nullptr;
        uv_close((uv_handle_t*)server_handle_, static_cast<uv_close_cb>(OnUvServerClose));
        server_handle_ = nullptr;
    }

private:
    void OnConnection(int status) {
        if (closed_ || !cb_) {
            return;
        }
        if (status < 0) {
            LogErrorf(logger_, "tcp server connection error:%s", uv_strerror(status));
        }
        cb_->OnAccept(status, loop_, (uv_stream_t*)server_handle_);
    }

private:
    uv_loop_t* loop_ = nullptr;
    uv_tcp_t* server_handle_ = nullptr;
    TcpServerCallbackI* cb_ = nullptr;
    bool closed_ = false;

private:
    Logger* logger_ = nullptr;
};

inline static void OnUvConnection(uv_stream_t* server, int status) {
    TcpServer* tcp_server = (TcpServer*)server->data;
    if (tcp_server) {
        tcp_server->OnConnection(status);
    }
}

}
#endif //TCP_SERVER_HPP
