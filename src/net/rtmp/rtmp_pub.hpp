#ifndef RTMP_PUB_HPP
#define RTMP_PUB_HPP
#include <stdint.h>
#include <stddef.h>

namespace cpp_rtmp
{

#define RTMP_OK                  0
#define RTMP_NEED_READ_MORE      1
#define RTMP_SIMPLE_HANDSHAKE    2

#define RTMP_ERROR_HANDSHAKE                 -1
#define RTMP_ERROR_UNSUPPORTED_VERSION       -2
#define RTMP_ERROR_HANDSHAKE_DIGEST_MISMATCH -3
#define RTMP_ERROR_CODEC                     -4
#define RTMP_ERROR_MISSING_HEADER_CONTEXT    -5
#define RTMP_ERROR_MESSAGE_TOO_LARGE         -6
#define RTMP_ERROR_INVALID_CHUNK_SIZE        -7
#define RTMP_ERROR_INVALID_CSID              -8
#define RTMP_ERROR_AMF_DECODE                -9
#define RTMP_ERROR_INVALID_STATE             -10
#define RTMP_ERROR_SEND                      -11

#define CHUNK_DEF_SIZE              128
#define CHUNK_MAX_SIZE              0x7fffffff
#define CHUNK_EXT_TIMESTAMP         0xffffff
#define CHUNK_CONTROL_CSID          2
#define CHUNK_MIN_CSID              2
#define CHUNK_MAX_CSID              65599
#define CHUNK_BASIC_HEADER_MAX_SIZE 3
#define CHUNK_HEADER_MAX_SIZE       18 //3 basic + 11 message + 4 extended timestamp

#define RTMP_DEF_MAX_MESSAGE_SIZE   (10*1024*1024)
#define RTMP_DEF_WINDOW_ACK_SIZE    2500000
#define RTMP_DEF_PEER_BANDWIDTH     2500000
#define RTMP_DEF_WRITE_CHUNK_SIZE   4096
#define RTMP_DEF_HANDSHAKE_TIMEOUT  5000

typedef enum {
    RTMP_CONTROL_SET_CHUNK_SIZE     = 1,
    RTMP_CONTROL_ABORT_MESSAGE      = 2,
    RTMP_CONTROL_ACK                = 3,
    RTMP_CONTROL_USER_CTRL_MESSAGES = 4,
    RTMP_CONTROL_WINDOW_ACK_SIZE    = 5,
    RTMP_CONTROL_SET_PEER_BANDWIDTH = 6
} RTMP_CONTROL_TYPE;

typedef enum {
    RTMP_MEDIA_PACKET_AUDIO         = 8,
    RTMP_MEDIA_PACKET_VIDEO         = 9,
    RTMP_COMMAND_MESSAGES_META_DATA3 = 15,
    RTMP_COMMAND_MESSAGES_SHARED_OBJ3 = 16,
    RTMP_COMMAND_MESSAGES_AMF3      = 17,
    RTMP_COMMAND_MESSAGES_META_DATA0 = 18,
    RTMP_COMMAND_MESSAGES_SHARED_OBJ0 = 19,
    RTMP_COMMAND_MESSAGES_AMF0      = 20,
    RTMP_AGGREGATE_MESSAGE          = 22
} RTMP_MESSAGE_TYPE;

typedef enum {
    RTMP_USER_EVENT_STREAM_BEGIN       = 0,
    RTMP_USER_EVENT_STREAM_EOF         = 1,
    RTMP_USER_EVENT_STREAM_DRY         = 2,
    RTMP_USER_EVENT_SET_BUFFER_LENGTH  = 3,
    RTMP_USER_EVENT_STREAM_IS_RECORDED = 4,
    RTMP_USER_EVENT_PING_REQUEST       = 6,
    RTMP_USER_EVENT_PING_RESPONSE      = 7
} RTMP_USER_EVENT_TYPE;

typedef enum {
    RTMP_PEER_BANDWIDTH_HARD    = 0,
    RTMP_PEER_BANDWIDTH_SOFT    = 1,
    RTMP_PEER_BANDWIDTH_DYNAMIC = 2
} RTMP_PEER_BANDWIDTH_LIMIT;

inline bool IsRtmpControlMessage(uint8_t type_id) {
    return (type_id >= RTMP_CONTROL_SET_CHUNK_SIZE) && (type_id <= RTMP_CONTROL_SET_PEER_BANDWIDTH);
}

inline const char* GetRtmpErrorDesc(int code) {
    switch (code) {
        case RTMP_OK:
            return "ok";
        case RTMP_NEED_READ_MORE:
            return "need read more";
        case RTMP_SIMPLE_HANDSHAKE:
            return "simple handshake";
        case RTMP_ERROR_HANDSHAKE:
            return "handshake error";
        case RTMP_ERROR_UNSUPPORTED_VERSION:
            return "unsupported version";
        case RTMP_ERROR_HANDSHAKE_DIGEST_MISMATCH:
            return "handshake digest mismatch";
        case RTMP_ERROR_CODEC:
            return "chunk codec error";
        case RTMP_ERROR_MISSING_HEADER_CONTEXT:
            return "missing header context";
        case RTMP_ERROR_MESSAGE_TOO_LARGE:
            return "message too large";
        case RTMP_ERROR_INVALID_CHUNK_SIZE:
            return "invalid chunk size";
        case RTMP_ERROR_INVALID_CSID:
            return "invalid chunk stream id";
        case RTMP_ERROR_AMF_DECODE:
            return "amf decode error";
        case RTMP_ERROR_INVALID_STATE:
            return "invalid session state";
        case RTMP_ERROR_SEND:
            return "send error";
        default:
            break;
    }
    return "unknown error";
}

inline const char* GetRtmpMessageTypeDesc(uint8_t type_id) {
    switch (type_id) {
        case RTMP_CONTROL_SET_CHUNK_SIZE:
            return "SetChunkSize";
        case RTMP_CONTROL_ABORT_MESSAGE:
            return "Abort";
        case RTMP_CONTROL_ACK:
            return "Acknowledgement";
        case RTMP_CONTROL_USER_CTRL_MESSAGES:
            return "UserControl";
        case RTMP_CONTROL_WINDOW_ACK_SIZE:
            return "WindowAckSize";
        case RTMP_CONTROL_SET_PEER_BANDWIDTH:
            return "SetPeerBandwidth";
        case RTMP_MEDIA_PACKET_AUDIO:
            return "Audio";
        case RTMP_MEDIA_PACKET_VIDEO:
            return "Video";
        case RTMP_COMMAND_MESSAGES_META_DATA3:
            return "AMF3Data";
        case RTMP_COMMAND_MESSAGES_SHARED_OBJ3:
            return "AMF3SharedObject";
        case RTMP_COMMAND_MESSAGES_AMF3:
            return "AMF3Command";
        case RTMP_COMMAND_MESSAGES_META_DATA0:
            return "AMF0Data";
        case RTMP_COMMAND_MESSAGES_SHARED_OBJ0:
            return "AMF0SharedObject";
        case RTMP_COMMAND_MESSAGES_AMF0:
            return "AMF0Command";
        case RTMP_AGGREGATE_MESSAGE:
            return "Aggregate";
        default:
            break;
    }
    return "Unknown";
}

}
#endif //RTMP_PUB_HPP
