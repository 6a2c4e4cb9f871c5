#include "rtmp_server.hpp"
#include "rtmp_server_session.hpp"
#include "rtmp_session_config.hpp"
#include "rtmp_command.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"
#include "ipaddress.hpp"

#include <uv.h>
#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <memory>
#include <unistd.h>

using namespace cpp_rtmp;

static Logger* s_logger = nullptr;

class RtmpChunkServerMgr : public RtmpServerCallbackI
{
public:
    RtmpChunkServerMgr(Logger* logger):logger_(logger)
    {
    }
    virtual ~RtmpChunkServerMgr()
    {
    }

public:
    virtual void OnSessionHandshakeDone(RtmpServerSession* session) override {
        LogInfof(logger_, "session ready, remote:%s, window ack size:%u, write chunk size:%u",
                session->GetRemoteEndpoint().c_str(), session->GetWindowAckSize(),
                session->GetWriteChunkSize());
    }

    virtual int OnSessionMessage(RtmpServerSession* session, RTMP_MESSAGE_PTR msg_ptr) override {
        message_count_++;

        if (IsRtmpCommandMessage(msg_ptr->type_id_) || IsRtmpDataMessage(msg_ptr->type_id_)) {
            RtmpCommand cmd(logger_);

            int ret = cmd.Decode(*msg_ptr);
            if (ret != RTMP_OK) {
                LogWarnf(logger_, "remote:%s, undecodable amf message:%s",
                        session->GetRemoteEndpoint().c_str(), msg_ptr->Dump().c_str());
                return RTMP_OK;
            }
            LogInfof(logger_, "remote:%s, csid:%u, stream id:%u, %s",
                    session->GetRemoteEndpoint().c_str(), msg_ptr->csid_,
                    msg_ptr->msg_stream_id_, cmd.Dump().c_str());
            return RTMP_OK;
        }

        LogDebugf(logger_, "remote:%s, %s message, csid:%u, stream id:%u, size:%lu, timestamp:%u",
                session->GetRemoteEndpoint().c_str(), GetRtmpMessageTypeDesc(msg_ptr->type_id_),
                msg_ptr->csid_, msg_ptr->msg_stream_id_, (unsigned long)msg_ptr->Length(),
                msg_ptr->timestamp_);
        return RTMP_OK;
    }

    virtual void OnSessionClose(RtmpServerSession* session, int reason) override {
        LogInfof(logger_, "session closed, remote:%s, reason:%s, recv bytes:%lu, messages:%lu",
                session->GetRemoteEndpoint().c_str(), GetRtmpErrorDesc(reason),
                (unsigned long)session->GetRecvBytes(), (unsigned long)message_count_);
    }

private:
    Logger* logger_ = nullptr;
    size_t message_count_ = 0;
};

static bool AddConfigOption(RtmpSessionConfig& config, const char* key, const char* value) {
    try {
        config.AddOption(key, value, s_logger);
    } catch(CppRtmpException& e) {
        printf("option %s error: %s\r\n", key, e.what());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    char log_file[128];
    char bind_ip[64];
    uint16_t port = 1935;

    int opt = 0;
    bool log_file_ready = false;
    bool debug_enable = false;
    RtmpSessionConfig config;

    strncpy(bind_ip, "0.0.0.0", sizeof(bind_ip));
    s_logger = new Logger();

    while ((opt = getopt(argc, argv, "i:p:c:m:t:l:dh")) != -1) {
        switch (opt) {
            case 'i': strncpy(bind_ip, optarg, sizeof(bind_ip) - 1); bind_ip[sizeof(bind_ip) - 1] = 0; break;
            case 'p':
            {
                if (!ParsePort(optarg, port)) {
                    printf("invalid port:%s, it must be in [1, 65535]\r\n", optarg);
                    delete s_logger;
                    return -1;
                }
                break;
            }
            case 'c':
            {
                if (!AddConfigOption(config, "chunk_size", optarg)) {
                    return -1;
                }
                break;
            }
            case 'm':
            {
                if (!AddConfigOption(config, "max_message_size", optarg)) {
                    return -1;
                }
                break;
            }
            case 't':
            {
                if (!AddConfigOption(config, "handshake_timeout_ms", optarg)) {
                    return -1;
                }
                break;
            }
            case 'l': strncpy(log_file, optarg, sizeof(log_file) - 1); log_file[sizeof(log_file) - 1] = 0; log_file_ready = true; break;
            case 'd': debug_enable = true; break;
            case 'h':
            default:
            {
                printf("Usage: %s [-i bind ip, default 0.0.0.0]\n\
    [-p port, default 1935]\n\
    [-c write chunk size, default %d]\n\
    [-m max message size, default %d]\n\
    [-t handshake timeout ms, default %d]\n\
    [-l log file name]\n\
    [-d debug log]\n",
                    argv[0], RTMP_DEF_WRITE_CHUNK_SIZE, RTMP_DEF_MAX_MESSAGE_SIZE,
                    RTMP_DEF_HANDSHAKE_TIMEOUT);
                delete s_logger;
                return -1;
            }
        }
    }

    if (log_file_ready) {
        s_logger->SetFilename(std::string(log_file));
        s_logger->EnableConsole();
    }
    if (debug_enable) {
        s_logger->SetLevel(LOGGER_DEBUG_LEVEL);
    }

    uv_loop_t* loop = (uv_loop_t*)malloc(sizeof(uv_loop_t));
    uv_loop_init(loop);

    RtmpChunkServerMgr mgr(s_logger);
    std::shared_ptr<RtmpServer> server_ptr;
    try {
        server_ptr = std::make_shared<RtmpServer>(loop, std::string(bind_ip), port, config, &mgr, s_logger);
    } catch(CppRtmpException& e) {
        LogErrorf(s_logger, "rtmp chunk server start error:%s", e.what());
        uv_run(loop, UV_RUN_NOWAIT);
        uv_loop_close(loop);
        free(loop);
        delete s_logger;
        return -1;
    }

    LogInfof(s_logger, "rtmp chunk server is running on %s:%d", bind_ip, port);
    uv_run(loop, UV_RUN_DEFAULT);

    server_ptr = nullptr;
    // let the close callbacks of the released handles run
    uv_run(loop, UV_RUN_NOWAIT);
    uv_loop_close(loop);
    free(loop);

    delete s_logger;
    return 0;
}
