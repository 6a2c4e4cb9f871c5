#ifndef RTMP_MESSAGE_HPP
#define RTMP_MESSAGE_HPP
#include "data_buffer.hpp"
#include "rtmp_pub.hpp"

#include <stdint.h>
#include <memory>
#include <string>
#include <stdio.h>

namespace cpp_rtmp
{

class RtmpMessage
{
public:
    RtmpMessage() {
        payload_ = std::make_shared<DataBuffer>(0);
    }
    RtmpMessage(uint8_t type_id, uint32_t msg_stream_id, uint32_t timestamp,
            DATA_BUFFER_PTR payload):type_id_(type_id)
        , msg_stream_id_(msg_stream_id)
        , timestamp_(timestamp)
        , payload_(payload)
    {
        if (!payload_) {
            payload_ = std::make_shared<DataBuffer>(0);
        }
    }
    RtmpMessage(uint8_t type_id, uint32_t msg_stream_id, uint32_t timestamp,
            const uint8_t* data, size_t len):type_id_(type_id)
        , msg_stream_id_(msg_stream_id)
        , timestamp_(timestamp)
    {
        payload_ = std::make_shared<DataBuffer>(len);
        payload_->AppendData((const char*)data, len);
    }
    ~RtmpMessage() {}

public:
    const uint8_t* Data() const {
        return (const uint8_t*)payload_->Data();
    }
    size_t Length() const {
        return payload_->DataLen();
    }
    std::string Dump() const {
        char desc[256];

        snprintf(desc, sizeof(desc), "type:%d(%s), stream id:%u, timestamp:%u, csid:%u, length:%lu",
                type_id_, GetRtmpMessageTypeDesc(type_id_), msg_stream_id_, timestamp_,
                csid_, (unsigned long)Length());
        return std::string(desc);
    }

public:
    uint8_t  type_id_       = 0;
    uint32_t msg_stream_id_ = 0;
    uint32_t timestamp_     = 0;
    uint32_t csid_          = 0; //chunk stream id it arrived on
    DATA_BUFFER_PTR payload_;
};

typedef std::shared_ptr<RtmpMessage> RTMP_MESSAGE_PTR;

}
#endif //RTMP_MESSAGE_HPP
