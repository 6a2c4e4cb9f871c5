#ifndef RTMP_SESSION_BASE_HPP
#define RTMP_SESSION_BASE_HPP
#include "data_buffer.hpp"
#include "chunk_reassembler.hpp"
#include "chunk_writer.hpp"
#include "rtmp_handshake.hpp"
#include "rtmp_control_handler.hpp"
#include "rtmp_session_config.hpp"
#include "rtmp_message.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <memory>
#include <stdint.h>

namespace cpp_rtmp
{
typedef enum {
    session_handshake_phase,
    session_chunk_phase,
    session_error_phase
} RTMP_SESSION_PHASE;

const char* GetSessionPhaseDesc(RTMP_SESSION_PHASE phase);

class RtmpSessionCallbackI
{
public:
    virtual void OnHandshakeDone() = 0;
    // every message which is not a protocol control message, in arrival order
    virtual int OnMessage(RTMP_MESSAGE_PTR msg_ptr) = 0;
    // fatal error, consumed is the number of stream bytes handled before it
    virtual void OnError(int code, size_t consumed) = 0;
};

/*
 * per connection rtmp state: handshake, read/write chunk sizes,
 * acknowledgement windows, byte counters and the chunk stream tables.
 * the transport is reached through RtmpSend.
 */
class RtmpSessionBase : public ChunkMessageCallbackI
{
friend class RtmpControlHandler;

public:
    RtmpSessionBase(const RtmpSessionConfig& config, RtmpSessionCallbackI* cb, Logger* logger);
    virtual ~RtmpSessionBase();

public:
    virtual int RtmpSend(const char* data, size_t len) = 0;

public:
    // bytes from the transport, handshake first, then chunks
    int OnRecvData(const uint8_t* data, size_t len);

    // caller assigns the chunk stream id, 2 is only for control messages
    int SendMessage(uint32_t csid, const RtmpMessage& msg);
    int SendMessage(uint32_t csid, uint8_t type_id, uint32_t msg_stream_id,
                uint32_t timestamp, const uint8_t* data, size_t len);

    virtual int OnChunkMessage(RTMP_MESSAGE_PTR msg_ptr) override;

    RtmpControlHandler& GetControlHandler() { return ctrl_handler_; }
    const RtmpSessionConfig& GetConfig() { return config_; }

public:
    RTMP_SESSION_PHASE GetPhase() { return phase_; }
    bool IsHandshakeDone() { return phase_ == session_chunk_phase; }
    bool IsDigestHandshake() { return handshake_.IsDigestMode(); }
    int GetError() { return error_; }

    uint32_t GetReadChunkSize() { return reassembler_.GetChunkSize(); }
    uint32_t GetWriteChunkSize() { return writer_.GetChunkSize(); }
    uint32_t GetRemoteWindowAckSize() { return remote_window_acksize_; }
    uint32_t GetWindowAckSize() { return window_acksize_; }
    uint32_t GetPeerBandwidth() { return peer_bandwidth_; }
    int GetPeerBandwidthLimit() { return peer_bandwidth_limit_; }

    int64_t GetEpoch() { return epoch_ms_; }
    // milliseconds since the handshake completed
    uint32_t GetRelativeTime();

    uint64_t GetRecvBytes() { return recv_bytes_; }
    uint64_t GetSendBytes() { return send_bytes_; }
    uint32_t GetPeerAckedBytes() { return peer_acked_bytes_; }
    uint64_t GetUnackedBytes();
    uint32_t GetBufferLength() { return buffer_length_ms_; }
    size_t GetConsumedBytes() { return consumed_bytes_; }

protected:
    void OnFatalError(int code);
    int CheckAck();
    int FeedChunks(const uint8_t* data, size_t len);

protected:
    RtmpSessionConfig config_;
    RtmpSessionCallbackI* cb_ = nullptr;
    RTMP_SESSION_PHASE phase_ = session_handshake_phase;
    int error_ = RTMP_OK;

    DataBuffer recv_buffer_;
    RtmpServerHandshake handshake_;
    ChunkReassembler reassembler_;
    ChunkWriter writer_;
    RtmpControlHandler ctrl_handler_;

protected:
    int64_t  epoch_ms_              = 0;
    uint32_t remote_window_acksize_ = RTMP_DEF_WINDOW_ACK_SIZE; //set by the peer, we ack by it
    uint32_t window_acksize_        = 0;                        //announced to the peer
    uint32_t peer_bandwidth_        = 0;
    int peer_bandwidth_limit_       = -1;
    uint64_t recv_bytes_            = 0;
    uint64_t ack_received_          = 0; //bytes since the last ack we sent
    uint64_t send_bytes_            = 0;
    uint32_t peer_acked_bytes_      = 0;
    uint32_t buffer_length_ms_      = 0;
    size_t consumed_bytes_          = 0;

protected:
    Logger* logger_ = nullptr;
};

}

#endif //RTMP_SESSION_BASE_HPP
