#ifndef TCP_PUB_HPP
#define TCP_PUB_HPP
#include "data_buffer.hpp"
#include <uv.h>
#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <string>

namespace cpp_rtmp
{

#define TCP_DEF_RECV_BUFFER_SIZE (8*1024)
#define TCP_DEF_BACKLOG          128

typedef struct {
  uv_write_t req;
  uv_buf_t buf;
} write_req_t;

class TcpServerCallbackI
{
public:
    virtual void OnAccept(int ret_code, uv_loop_t* loop, uv_stream_t* handle) = 0;
};

class TcpSessionCallbackI
{
public:
    virtual void OnWrite(int ret_code, size_t sent_size) = 0;
    // ret_code < 0: the peer closed or the read failed
    virtual void OnRead(int ret_code, const char* data, size_t data_size) = 0;
};

class TcpBaseSession
{
public:
    virtual void AsyncWrite(const char* data, size_t data_size) = 0;
    virtual void AsyncRead() = 0;
    virtual void Close() = 0;
    virtual std::string GetRemoteEndpoint() = 0;
    virtual std::string GetLocalEndpoint() = 0;
};

}

#endif
