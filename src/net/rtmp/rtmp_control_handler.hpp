#ifndef RTMP_CONTROL_HANDLER_HPP
#define RTMP_CONTROL_HANDLER_HPP
#include "rtmp_message.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>

namespace cpp_rtmp
{

class RtmpSessionBase;

// protocol control messages (types 1-6), sent on csid 2 with message stream id 0
class RtmpControlHandler
{
public:
    RtmpControlHandler(RtmpSessionBase* session, Logger* logger = nullptr);
    ~RtmpControlHandler();

public:
    int HandleRtmpControlMessage(RTMP_MESSAGE_PTR msg_ptr);

public:
    // the message is framed with the old chunk size, the new one applies afterwards
    int SendSetChunksize(uint32_t chunk_size);
    int SendWindowAckSize(uint32_t size);
    int SendSetPeerBandwidth(uint32_t size, RTMP_PEER_BANDWIDTH_LIMIT limit);
    int SendRtmpAck(uint32_t sequence);
    int SendAbortMessage(uint32_t csid);
    int SendUserControl(RTMP_USER_EVENT_TYPE event, uint32_t value);
    int SendSetBufferLength(uint32_t stream_id, uint32_t buffer_ms);
    int SendStreamBegin(uint32_t stream_id);
    int SendPingRequest(uint32_t timestamp);
    int SendPingResponse(uint32_t timestamp);

public:
    static RTMP_MESSAGE_PTR GenControlMessage(RTMP_CONTROL_TYPE ctrl_type, uint32_t size,
                                        uint32_t value, uint8_t extra = 0);
    static RTMP_MESSAGE_PTR GenUserControlMessage(RTMP_USER_EVENT_TYPE event, uint32_t value);

private:
    int HandleSetChunkSize(RTMP_MESSAGE_PTR msg_ptr);
    int HandleAbortMessage(RTMP_MESSAGE_PTR msg_ptr);
    int HandleAck(RTMP_MESSAGE_PTR msg_ptr);
    int HandleUserControl(RTMP_MESSAGE_PTR msg_ptr);
    int HandleWindowAckSize(RTMP_MESSAGE_PTR msg_ptr);
    int HandleSetPeerBandwidth(RTMP_MESSAGE_PTR msg_ptr);
    int SendControlMessage(RTMP_MESSAGE_PTR msg_ptr);

private:
    RtmpSessionBase* session_;

private:
    Logger* logger_ = nullptr;
};

}

#endif //RTMP_CONTROL_HANDLER_HPP
