#ifndef TCP_SESSION_HPP
#define TCP_SESSION_HPP
#include "logger.hpp"
#include "data_buffer.hpp"
#include "tcp_pub.hpp"
#include "ipaddress.hpp"
#include <uv.h>
#include <memory>
#include <string>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <sstream>

namespace cpp_rtmp
{

inline static void OnTcpClose(uv_handle_t* handle);
inline static void OnUvAlloc(uv_handle_t* handle,
                       size_t suggested_size,
                       uv_buf_t* buf);
inline static void OnUvRead(uv_stream_t* handle,
                       ssize_t nread,
                       const uv_buf_t* buf);
inline static void OnUvWrite(uv_write_t* req, int status);

class TcpSession : public TcpBaseSession
{
friend void OnTcpClose(uv_handle_t* handle);
friend void OnUvAlloc(uv_handle_t* handle,
                    size_t suggested_size,
                    uv_buf_t* buf);
friend void OnUvRead(uv_stream_t* handle,
                    ssize_t nread,
                    const uv_buf_t* buf);
friend void OnUvWrite(uv_write_t* req, int status);

public:
    TcpSession(uv_loop_t* loop,
            uv_stream_t* server_uv_handle,
            TcpSessionCallbackI* callback,
            Logger* logger):callback_(callback)
                            , logger_(logger)
    {
        buffer_    = (char*)malloc(buffer_size_);
        uv_handle_ = (uv_tcp_t*)malloc(sizeof(uv_tcp_t));
        uv_handle_->data = this;

        int err = uv_tcp_init(loop, uv_handle_);
        if (err != 0) {
            free(uv_handle_);
            uv_handle_ = nullptr;
            free(buffer_);
            buffer_ = nullptr;
            CPP_RTMP_THROW_ERROR("uv_tcp_init() failed:%s", uv_strerror(err));
        }
        err = uv_accept(server_uv_handle, reinterpret_cast<uv_stream_t*>(uv_handle_));
        if (err != 0) {
            // the handle is initialized, it is released in the close callback
            uv_handle_->data = nullptr;
            uv_close(reinterpret_cast<uv_handle_t*>(uv_handle_), static_cast<uv_close_cb>(OnTcpClose));
            uv_handle_ = nullptr;
            free(buffer_);
            buffer_ = nullptr;
            CPP_RTMP_THROW_ERROR("uv_accept() failed:%s", uv_strerror(err));
        }
        uv_tcp_nodelay(uv_handle_, 1);

        struct sockaddr_storage name;
        int namelen = (int)sizeof(name);
        if (uv_tcp_getsockname(uv_handle_, (struct sockaddr*)&name, &namelen) == 0) {
            local_endpoint_ = MakeEndpoint((struct sockaddr*)&name);
        }
        namelen = (int)sizeof(name);
        if (uv_tcp_getpeername(uv_handle_, (struct sockaddr*)&name, &namelen) == 0) {
            remote_endpoint_ = MakeEndpoint((struct sockaddr*)&name);
        }
        close_ = false;
    }

    virtual ~TcpSession()
    {
        Close();
        if (buffer_) {
            free(buffer_);
            buffer_ = nullptr;
        }
    }

public:
    virtual void AsyncRead() override {
        if (close_ || !uv_handle_) {
            return;
        }

        int err = uv_read_start(
                            reinterpret_cast<uv_stream_t*>(uv_handle_),
                            static_cast<uv_alloc_cb>(OnUvAlloc),
                            static_cast<uv_read_cb>(OnUvRead));

        if (err != 0) {
            if (err == UV_EALREADY) {
                return;
            }
            CPP_RTMP_THROW_ERROR("uv_read_start() failed:%s", uv_strerror(err));
        }
    }

    virtual void AsyncWrite(const char* data, size_t len) override {
        if (close_ || !uv_handle_) {
            return;
        }
        write_req_t* wr = (write_req_t*) malloc(sizeof(write_req_t));

        char* new_data = (char*)malloc(len);
        memcpy(new_data, data, len);

        wr->buf = uv_buf_init(new_data, (unsigned int)len);
        int err = uv_write((uv_write_t*)wr, reinterpret_cast<uv_stream_t*>(uv_handle_), &wr->buf, 1, OnUvWrite);
        if (err != 0) {
            free(new_data);
            free(wr);
            CPP_RTMP_THROW_ERROR("uv_write error:%s", uv_strerror(err));
        }
        pending_write_bytes_ += len;
    }

    virtual void Close() override {
        if (close_) {
            return;
        }
        close_ = true;

        if (!uv_handle_) {
            return;
        }
        uv_read_stop(reinterpret_cast<uv_stream_t*>(uv_handle_));

        LogDebugf(logger_, "tcp close, remote:%s", remote_endpoint_.c_str());
        // the request callbacks of pending writes still run before the close callback
        uv_handle_->data = nullptr;
        uv_close(reinterpret_cast<uv_handle_t*>(uv_handle_), static_cast<uv_close_cb>(OnTcpClose));
        uv_handle_ = nullptr;
    }

    virtual std::string GetRemoteEndpoint() override {
        return remote_endpoint_;
    }

    virtual std::string GetLocalEndpoint() override {
        return local_endpoint_;
    }

    size_t GetPendingWriteBytes() { return pending_write_bytes_; }

private:
    static std::string MakeEndpoint(struct sockaddr* addr) {
        std::stringstream ss;
        uint16_t port = 0;
        std::string ip = GetIpStr(addr, port);

        ss << ip << ":" << port;
        return ss.str();
    }

    void OnAlloc(uv_buf_t* buf) {
        buf->base = buffer_;
        buf->len  = buffer_size_;
    }

    void OnRead(ssize_t nread, const uv_buf_t* buf) {
        if (close_) {
            return;
        }
        if (nread == 0) {
            return;
        }
        if (nread < 0) {
            LogInfof(logger_, "tcp read end, remote:%s, error:%s",
                    remote_endpoint_.c_str(), uv_strerror((int)nread));
            callback_->OnRead(-1, nullptr, 0);
            return;
        }

        callback_->OnRead(0, buf->base, (size_t)nread);
    }

    void OnWrite(write_req_t* req, int status) {
        size_t sent_size = req->buf.len;

        if (pending_write_bytes_ >= sent_size) {
            pending_write_bytes_ -= sent_size;
        }
        if (callback_ && !close_) {
            callback_->OnWrite(status, sent_size);
        }
    }

private:
    TcpSessionCallbackI* callback_ = nullptr;
    uv_tcp_t* uv_handle_ = nullptr;
    std::string local_endpoint_;
    std::string remote_endpoint_;
    char* buffer_        = nullptr;
    size_t buffer_size_  = TCP_DEF_RECV_BUFFER_SIZE;
    size_t pending_write_bytes_ = 0;
    bool close_          = false;

private:
    Logger* logger_ = nullptr;
};

inline static void OnUvAlloc(uv_handle_t* handle,
                       size_t suggested_size,
                       uv_buf_t* buf) {
    TcpSession* session = (TcpSession*)handle->data;
    if (session) {
        session->OnAlloc(buf);
        return;
    }
    buf->base = nullptr;
    buf->len  = 0;
}

inline static void OnUvRead(uv_stream_t* handle, ssize_t nread, const uv_buf_t* buf) {
    TcpSession* session = (TcpSession*)handle->data;
    if (session) {
        if (nread == 0) {
            return;
        }
        session->OnRead(nread, buf);
    }
    return;
}

inline static void OnUvWrite(uv_write_t* req, int status) {
    write_req_t* wr = (write_req_t*)req;
    TcpSession* session = static_cast<TcpSession*>(req->handle->data);

    if (session) {
        session->OnWrite(wr, status);
    }
    free(wr->buf.base);
    free(wr);
}

inline static void OnTcpClose(uv_handle_t* handle) {
    free(handle);
}

}
#endif //TCP_SESSION_HPP
