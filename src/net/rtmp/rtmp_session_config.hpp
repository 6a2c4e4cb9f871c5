#ifndef RTMP_SESSION_CONFIG_HPP
#define RTMP_SESSION_CONFIG_HPP
#include "rtmp_pub.hpp"
#include "logger.hpp"

#include <stdint.h>
#include <string>

namespace cpp_rtmp
{

class RtmpSessionConfig
{
public:
    RtmpSessionConfig();
    ~RtmpSessionConfig();

public:
    // string key/value form, throws CppRtmpException on unknown key or bad value
    void AddOption(const std::string& key, const std::string& value, Logger* logger = nullptr);
    std::string Dump() const;

public:
    uint32_t chunk_size_           = RTMP_DEF_WRITE_CHUNK_SIZE;
    uint32_t max_message_size_     = RTMP_DEF_MAX_MESSAGE_SIZE;
    uint32_t window_ack_size_      = RTMP_DEF_WINDOW_ACK_SIZE;
    uint32_t peer_bandwidth_       = RTMP_DEF_PEER_BANDWIDTH;
    RTMP_PEER_BANDWIDTH_LIMIT peer_bandwidth_limit_ = RTMP_PEER_BANDWIDTH_DYNAMIC;
    uint32_t handshake_timeout_ms_ = RTMP_DEF_HANDSHAKE_TIMEOUT;
    bool simple_handshake_fallback_ = true;
    bool digest_handshake_          = true;

private:
    static bool ParseUint32(const std::string& value, uint32_t& output);
    static bool ParseBool(const std::string& value, bool& output);
};

}
#endif //RTMP_SESSION_CONFIG_HPP
