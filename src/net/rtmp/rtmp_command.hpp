#ifndef RTMP_COMMAND_HPP
#define RTMP_COMMAND_HPP
#include "amf/amf0.hpp"
#include "rtmp_message.hpp"
#include "data_buffer.hpp"
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>
#include <string>
#include <vector>

namespace cpp_rtmp
{

bool IsRtmpCommandMessage(uint8_t type_id);
bool IsRtmpDataMessage(uint8_t type_id);

/*
 * generic amf command/data message:
 *   command (20, 17): name, transaction id, command object, arguments...
 *   data (18, 15):    name, arguments...
 * the amf3 types (17, 15) start with a 0x00 format byte and carry amf0 values.
 */
class RtmpCommand
{
public:
    RtmpCommand(Logger* logger = nullptr);
    RtmpCommand(const RtmpCommand& input) = delete;
    RtmpCommand& operator=(const RtmpCommand& input) = delete;
    ~RtmpCommand();

public:
    int Decode(const RtmpMessage& msg);
    int Decode(uint8_t type_id, const uint8_t* data, size_t len);
    int Encode(uint8_t type_id, DataBuffer& buffer);
    RTMP_MESSAGE_PTR GenMessage(uint8_t type_id, uint32_t msg_stream_id, uint32_t timestamp);

    bool IsCommand() { return IsRtmpCommandMessage(type_id_); }
    // takes the ownership of the item
    void AddArgument(AMF_ITERM* item);
    void SetCommandObject(AMF_ITERM* item);
    void Clear();
    std::string Dump();

public:
    uint8_t type_id_ = RTMP_COMMAND_MESSAGES_AMF0;
    std::string name_;
    double transaction_id_ = 0.0;
    AMF_ITERM* cmd_obj_ = nullptr;
    std::vector<AMF_ITERM*> args_;

private:
    Logger* logger_ = nullptr;
};

}
#endif //RTMP_COMMAND_HPP
