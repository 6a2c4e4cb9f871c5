#include "rtmp_command.hpp"

#include <sstream>

namespace cpp_rtmp
{

bool IsRtmpCommandMessage(uint8_t type_id) {
    return (type_id == RTMP_COMMAND_MESSAGES_AMF0) || (type_id == RTMP_COMMAND_MESSAGES_AMF3);
}

bool IsRtmpDataMessage(uint8_t type_id) {
    return (type_id == RTMP_COMMAND_MESSAGES_META_DATA0) || (type_id == RTMP_COMMAND_MESSAGES_META_DATA3);
}

static bool IsAmf3Message(uint8_t type_id) {
    return (type_id == RTMP_COMMAND_MESSAGES_AMF3) || (type_id == RTMP_COMMAND_MESSAGES_META_DATA3);
}

RtmpCommand::RtmpCommand(Logger* logger):logger_(logger)
{
}

RtmpCommand::~RtmpCommand()
{
    Clear();
}

void RtmpCommand::Clear() {
    if (cmd_obj_) {
        delete cmd_obj_;
        cmd_obj_ = nullptr;
    }
    for (auto item : args_) {
        delete item;
    }
    args_.clear();
    name_.clear();
    transaction_id_ = 0.0;
}

void RtmpCommand::AddArgument(AMF_ITERM* item) {
    args_.push_back(item);
}

void RtmpCommand::SetCommandObject(AMF_ITERM* item) {
    if (cmd_obj_) {
        delete cmd_obj_;
    }
    cmd_obj_ = item;
}

int RtmpCommand::Decode(const RtmpMessage& msg) {
    return Decode(msg.type_id_, msg.Data(), msg.Length());
}

int RtmpCommand::Decode(uint8_t type_id, const uint8_t* data, size_t len) {
    const uint8_t* p = data;
    size_t left_len = len;

    if (!IsRtmpCommandMessage(type_id) && !IsRtmpDataMessage(type_id)) {
        LogErrorf(logger_, "message type:%d is not an amf command", type_id);
        return RTMP_ERROR_AMF_DECODE;
    }
    Clear();
    type_id_ = type_id;

    if (IsAmf3Message(type_id)) {
        if (left_len < 1) {
            return RTMP_ERROR_AMF_DECODE;
        }
        // format byte
        p++;
        left_len--;
    }

    AMF_ITERM name_item;
    if ((AMF_Decoder::Decode(p, left_len, name_item) != 0)
        || ((name_item.GetAmfType() != AMF_DATA_TYPE_STRING)
            && (name_item.GetAmfType() != AMF_DATA_TYPE_LONG_STRING))) {
        LogErrorf(logger_, "amf command name decode error, type:%d, len:%lu",
                type_id, (unsigned long)len);
        return RTMP_ERROR_AMF_DECODE;
    }
    name_ = name_item.desc_str_;

    if (IsRtmpCommandMessage(type_id)) {
        AMF_ITERM id_item;
        if ((AMF_Decoder::Decode(p, left_len, id_item) != 0)
            || (id_item.GetAmfType() != AMF_DATA_TYPE_NUMBER)) {
            LogErrorf(logger_, "amf command:%s transaction id decode error", name_.c_str());
            return RTMP_ERROR_AMF_DECODE;
        }
        transaction_id_ = id_item.number_;

        if (left_len > 0) {
            cmd_obj_ = new AMF_ITERM();
            if (AMF_Decoder::Decode(p, left_len, *cmd_obj_) != 0) {
                LogErrorf(logger_, "amf command:%s object decode error", name_.c_str());
                return RTMP_ERROR_AMF_DECODE;
            }
        }
    }

    while (left_len > 0) {
        AMF_ITERM* item = new AMF_ITERM();
        if (AMF_Decoder::Decode(p, left_len, *item) != 0) {
            delete item;
            LogErrorf(logger_, "amf command:%s argument[%lu] decode error",
                    name_.c_str(), (unsigned long)args_.size());
            return RTMP_ERROR_AMF_DECODE;
        }
        args_.push_back(item);
    }
    return RTMP_OK;
}

int RtmpCommand::Encode(uint8_t type_id, DataBuffer& buffer) {
    if (!IsRtmpCommandMessage(type_id) && !IsRtmpDataMessage(type_id)) {
        return RTMP_ERROR_AMF_DECODE;
    }
    if (IsAmf3Message(type_id)) {
        uint8_t format = 0;
        buffer.AppendData((char*)&format, 1);
    }
    AMF_Encoder::Encode(name_, buffer);

    if (IsRtmpCommandMessage(type_id)) {
        AMF_Encoder::Encode(transaction_id_, buffer);
        if (cmd_obj_) {
            if (AMF_Encoder::Encode(*cmd_obj_, buffer) != 0) {
                return RTMP_ERROR_AMF_DECODE;
            }
        } else {
            AMF_Encoder::EncodeNull(buffer);
        }
    }

    for (auto item : args_) {
        if (AMF_Encoder::Encode(*item, buffer) != 0) {
            LogErrorf(logger_, "amf command:%s argument encode error, type:%d",
                    name_.c_str(), item->GetAmfType());
            return RTMP_ERROR_AMF_DECODE;
        }
    }
    type_id_ = type_id;
    return RTMP_OK;
}

RTMP_MESSAGE_PTR RtmpCommand::GenMessage(uint8_t type_id, uint32_t msg_stream_id, uint32_t timestamp) {
    DATA_BUFFER_PTR buffer_ptr = std::make_shared<DataBuffer>();

    if (Encode(type_id, *buffer_ptr) != RTMP_OK) {
        return nullptr;
    }
    return std::make_shared<RtmpMessage>(type_id, msg_stream_id, timestamp, buffer_ptr);
}

std::string RtmpCommand::Dump() {
    std::stringstream ss;

    ss << "command:" << name_ << ", type:" << (int)type_id_;
    if (IsCommand()) {
        ss << ", transaction id:" << transaction_id_;
        if (cmd_obj_) {
            ss << ", object:" << cmd_obj_->DumpAmf();
        }
    }
    ss << ", args count:" << args_.size();
    for (auto item : args_) {
        ss << "\r\n" << item->DumpAmf();
    }
    return ss.str();
}

}
