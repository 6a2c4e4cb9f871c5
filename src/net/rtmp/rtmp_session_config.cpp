#include "rtmp_session_config.hpp"

#include <stdlib.h>
#include <errno.h>
#include <sstream>

namespace cpp_rtmp
{

RtmpSessionConfig::RtmpSessionConfig()
{
}

RtmpSessionConfig::~RtmpSessionConfig()
{
}

bool RtmpSessionConfig::ParseUint32(const std::string& value, uint32_t& output) {
    if (value.empty() || (value[0] == '-')) {
        return false;
    }
    char* end = nullptr;

    errno = 0;
    unsigned long long number = strtoull(value.c_str(), &end, 10);
    if ((errno != 0) || (end == nullptr) || (*end != '\0') || (number > 0xffffffffULL)) {
        return false;
    }
    output = (uint32_t)number;
    return true;
}

bool RtmpSessionConfig::ParseBool(const std::string& value, bool& output) {
    if ((value == "1") || (value == "true") || (value == "on") || (value == "yes")) {
        output = true;
        return true;
    }
    if ((value == "0") || (value == "false") || (value == "off") || (value == "no")) {
        output = false;
        return true;
    }
    return false;
}

void RtmpSessionConfig::AddOption(const std::string& key, const std::string& value, Logger* logger) {
    uint32_t number = 0;
    bool flag = false;
    bool valid = false;

    if (key == "chunk_size") {
        valid = ParseUint32(value, number) && (number > 0) && (number <= CHUNK_MAX_SIZE);
        if (valid) {
            chunk_size_ = number;
        }
    } else if (key == "max_message_size") {
        valid = ParseUint32(value, number) && (number > 0) && (number <= 0xffffff);
        if (valid) {
            max_message_size_ = number;
        }
    } else if (key == "window_ack_size") {
        valid = ParseUint32(value, number);
        if (valid) {
            window_ack_size_ = number;
        }
    } else if (key == "peer_bandwidth") {
        valid = ParseUint32(value, number);
        if (valid) {
            peer_bandwidth_ = number;
        }
    } else if (key == "peer_bandwidth_limit") {
        valid = true;
        if (value == "hard") {
            peer_bandwidth_limit_ = RTMP_PEER_BANDWIDTH_HARD;
        } else if (value == "soft") {
            peer_bandwidth_limit_ = RTMP_PEER_BANDWIDTH_SOFT;
        } else if (value == "dynamic") {
            peer_bandwidth_limit_ = RTMP_PEER_BANDWIDTH_DYNAMIC;
        } else {
            valid = false;
        }
    } else if (key == "handshake_timeout_ms") {
        valid = ParseUint32(value, number) && (number > 0);
        if (valid) {
            handshake_timeout_ms_ = number;
        }
    } else if (key == "simple_handshake_fallback") {
        valid = ParseBool(value, flag);
        if (valid) {
            simple_handshake_fallback_ = flag;
        }
    } else if (key == "digest_handshake") {
        valid = ParseBool(value, flag);
        if (valid) {
            digest_handshake_ = flag;
        }
    } else {
        std::stringstream ss;
        ss << "the option key:" << key << " does not exist";
        LogErrorf(logger, "%s", ss.str().c_str());
        throw CppRtmpException(ss.str().c_str());
    }

    if (!valid) {
        LogErrorf(logger, "invalid option value, key:%s, value:%s", key.c_str(), value.c_str());
        CPP_RTMP_THROW_ERROR("invalid option value, key:%s, value:%s", key.c_str(), value.c_str());
    }
    LogInfof(logger, "set rtmp session option key:%s, value:%s", key.c_str(), value.c_str());
}

std::string RtmpSessionConfig::Dump() const {
    std::stringstream ss;

    ss << "chunk_size:" << chunk_size_
       << ", max_message_size:" << max_message_size_
       << ", window_ack_size:" << window_ack_size_
       << ", peer_bandwidth:" << peer_bandwidth_
       << ", peer_bandwidth_limit:" << (int)peer_bandwidth_limit_
       << ", handshake_timeout_ms:" << handshake_timeout_ms_
       << ", simple_handshake_fallback:" << (simple_handshake_fallback_ ? "on" : "off")
       << ", digest_handshake:" << (digest_handshake_ ? "on" : "off");
    return ss.str();
}

}
