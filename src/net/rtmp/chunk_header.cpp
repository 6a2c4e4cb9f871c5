#include "chunk_header.hpp"
#include "chunk_stream.hpp"
#include "byte_stream.hpp"

#include <stdio.h>
#include <string.h>

namespace cpp_rtmp
{

std::string ChunkHeader::Dump() const {
    char desc[256];

    snprintf(desc, sizeof(desc), "fmt:%d, csid:%u, timestamp:%u, msg len:%u, type id:%d, msg stream id:%u, ext ts:%s",
            fmt_, csid_, timestamp_, msg_len_, type_id_, msg_stream_id_, ext_ts_ ? "true" : "false");
    return std::string(desc);
}

size_t GetBasicHeaderSize(uint32_t csid) {
    if (csid < 64) {
        return 1;
    } else if (csid < 320) {
        return 2;
    }
    return 3;
}

size_t GetMessageHeaderSize(uint8_t fmt) {
    const size_t sizes[] = {11, 7, 3, 0};

    return sizes[fmt & 0x03];
}

size_t GetChunkHeaderSize(const ChunkHeader& header) {
    return GetBasicHeaderSize(header.csid_) + GetMessageHeaderSize(header.fmt_)
        + (header.ext_ts_ ? 4 : 0);
}

int EncodeChunkHeader(const ChunkHeader& header, uint8_t* data) {
    uint8_t* p = data;

    if ((header.csid_ < CHUNK_MIN_CSID) || (header.csid_ > CHUNK_MAX_CSID)) {
        return RTMP_ERROR_INVALID_CSID;
    }
    if (header.fmt_ > 3) {
        return RTMP_ERROR_CODEC;
    }
    if ((header.fmt_ <= 1) && (header.msg_len_ > 0xffffff)) {
        return RTMP_ERROR_MESSAGE_TOO_LARGE;
    }

    /* ++++++ basic header ++++++ */
    if (header.csid_ < 64) {
        *p++ = (uint8_t)((header.fmt_ << 6) | header.csid_);
    } else if (header.csid_ < 320) {
        *p++ = (uint8_t)(header.fmt_ << 6);
        *p++ = (uint8_t)(header.csid_ - 64);
    } else {
        uint32_t value = header.csid_ - 64;
        *p++ = (uint8_t)((header.fmt_ << 6) | 0x01);
        *p++ = (uint8_t)(value & 0xff);
        *p++ = (uint8_t)((value >> 8) & 0xff);
    }

    /* ++++++ message header ++++++ */
    uint32_t ts_field = header.ext_ts_ ? CHUNK_EXT_TIMESTAMP : header.timestamp_;
    if (header.fmt_ <= 2) {
        ByteStream::Write3Bytes(p, ts_field);
        p += 3;
    }
    if (header.fmt_ <= 1) {
        ByteStream::Write3Bytes(p, header.msg_len_);
        p += 3;
        *p++ = header.type_id_;
    }
    if (header.fmt_ == 0) {
        ByteStream::Write4Bytes_le(p, header.msg_stream_id_);
        p += 4;
    }

    /* ++++++ extended timestamp ++++++ */
    if (header.ext_ts_) {
        ByteStream::Write4Bytes(p, header.timestamp_);
        p += 4;
    }
    return (int)(p - data);
}

ChunkHeaderDecoder::ChunkHeaderDecoder(Logger* logger):logger_(logger)
{
    memset(staged_, 0, sizeof(staged_));
}

ChunkHeaderDecoder::~ChunkHeaderDecoder()
{
}

void ChunkHeaderDecoder::Reset() {
    phase_       = CHUNK_HEADER_PHASE_BASIC;
    staged_len_  = 0;
    basic_size_  = 1;
    message_pos_ = 0;
    context_ext_ = false;
}

size_t ChunkHeaderDecoder::Stage(const uint8_t* data, size_t len, size_t need) {
    if (staged_len_ >= need) {
        return 0;
    }
    size_t copy_len = need - staged_len_;
    if (copy_len > len) {
        copy_len = len;
    }
    memcpy(staged_ + staged_len_, data, copy_len);
    staged_len_ += copy_len;
    return copy_len;
}

int ChunkHeaderDecoder::Decode(const uint8_t* data, size_t len, size_t& consumed,
                            const CHUNK_STREAM_MAP& cs_map) {
    int ret = RTMP_OK;

    consumed = 0;
    while (true) {
        switch (phase_) {
            case CHUNK_HEADER_PHASE_BASIC:
            {
                consumed += Stage(data + consumed, len - consumed, 1);
                if (staged_len_ < 1) {
                    return RTMP_NEED_READ_MORE;
                }
                header_ = ChunkHeader();
                header_.fmt_ = staged_[0] >> 6;

                uint8_t low_bits = staged_[0] & 0x3f;
                if (low_bits == 0) {
                    basic_size_ = 2;
                } else if (low_bits == 1) {
                    basic_size_ = 3;
                } else {
                    basic_size_ = 1;
                }
                if (basic_size_ > 1) {
                    phase_ = CHUNK_HEADER_PHASE_BASIC_EXT;
                    break;
                }
                ret = OnBasicHeader(cs_map);
                if (ret != RTMP_OK) {
                    return ret;
                }
                break;
            }
            case CHUNK_HEADER_PHASE_BASIC_EXT:
            {
                consumed += Stage(data + consumed, len - consumed, basic_size_);
                if (staged_len_ < basic_size_) {
                    return RTMP_NEED_READ_MORE;
                }
                ret = OnBasicHeader(cs_map);
                if (ret != RTMP_OK) {
                    return ret;
                }
                break;
            }
            case CHUNK_HEADER_PHASE_MESSAGE:
            {
                size_t need = message_pos_ + GetMessageHeaderSize(header_.fmt_);
                consumed += Stage(data + consumed, len - consumed, need);
                if (staged_len_ < need) {
                    return RTMP_NEED_READ_MORE;
                }
                OnMessageHeader();
                if (!header_.ext_ts_) {
                    Reset();
                    return RTMP_OK;
                }
                phase_ = CHUNK_HEADER_PHASE_EXT_TIMESTAMP;
                break;
            }
            case CHUNK_HEADER_PHASE_EXT_TIMESTAMP:
            {
                size_t ext_pos = message_pos_ + GetMessageHeaderSize(header_.fmt_);
                consumed += Stage(data + consumed, len - consumed, ext_pos + 4);
                if (staged_len_ < ext_pos + 4) {
                    return RTMP_NEED_READ_MORE;
                }
                header_.timestamp_ = ByteStream::Read4Bytes(staged_ + ext_pos);
                Reset();
                return RTMP_OK;
            }
            default:
                LogErrorf(logger_, "unknown chunk header phase:%d", (int)phase_);
                Reset();
                return RTMP_ERROR_CODEC;
        }
    }
    return RTMP_OK;
}

int ChunkHeaderDecoder::OnBasicHeader(const CHUNK_STREAM_MAP& cs_map) {
    if (basic_size_ == 1) {
        header_.csid_ = staged_[0] & 0x3f;
    } else if (basic_size_ == 2) {
        header_.csid_ = 64 + (uint32_t)staged_[1];
    } else {
        header_.csid_ = 64 + (uint32_t)staged_[1] + (uint32_t)staged_[2] * 256;
    }
    message_pos_ = basic_size_;

    bool has_context = false;
    auto iter = cs_map.find(header_.csid_);
    if ((iter != cs_map.end()) && iter->second->HasHeader()) {
        has_context = true;
        context_ext_ = iter->second->ext_ts_flag_;
    } else {
        context_ext_ = false;
    }

    if ((header_.fmt_ != 0) && !has_context) {
        LogErrorf(logger_, "chunk header fmt:%d on csid:%u without a previous header",
                header_.fmt_, header_.csid_);
        Reset();
        return RTMP_ERROR_MISSING_HEADER_CONTEXT;
    }
    phase_ = CHUNK_HEADER_PHASE_MESSAGE;
    return RTMP_OK;
}

void ChunkHeaderDecoder::OnMessageHeader() {
    const uint8_t* p = staged_ + message_pos_;

    if (header_.fmt_ == 3) {
        header_.ext_ts_ = context_ext_;
        return;
    }

    header_.timestamp_ = ByteStream::Read3Bytes(p);
    p += 3;
    header_.ext_ts_ = (header_.timestamp_ == CHUNK_EXT_TIMESTAMP);

    if (header_.fmt_ <= 1) {
        header_.msg_len_ = ByteStream::Read3Bytes(p);
        p += 3;
        header_.type_id_ = *p++;
    }
    if (header_.fmt_ == 0) {
        header_.msg_stream_id_ = ByteStream::Read4Bytes_le(p);
    }
}

}
