#include "rtmp_handshake.hpp"
#include "timeex.hpp"

#include <stdlib.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/err.h>

namespace cpp_rtmp
{

const uint8_t GENUINE_FLASH_PLAYER_KEY[GENUINE_FP_KEY_CRUD_SIZE] = {
    0x47, 0x65, 0x6E, 0x75, 0x69, 0x6E, 0x65, 0x20,
    0x41, 0x64, 0x6F, 0x62, 0x65, 0x20, 0x46, 0x6C,
    0x61, 0x73, 0x68, 0x20, 0x50, 0x6C, 0x61, 0x79,
    0x65, 0x72, 0x20, 0x30, 0x30, 0x31,
    // "Genuine Adobe Flash Player 001"
    0xF0, 0xEE, 0xC2, 0x4A, 0x80, 0x68, 0xBE, 0xE8,
    0x2E, 0x00, 0xD0, 0xD1, 0x02, 0x9E, 0x7E, 0x57,
    0x6E, 0xEC, 0x5D, 0x2D, 0x29, 0x80, 0x6F, 0xAB,
    0x93, 0xB8, 0xE6, 0x36, 0xCF, 0xEB, 0x31, 0xAE
};

const uint8_t GENUINE_FLASH_MEDIA_SERVER_KEY[GENUINE_FMS_KEY_CRUD_SIZE] = {
    0x47, 0x65, 0x6e, 0x75, 0x69, 0x6e, 0x65, 0x20,
    0x41, 0x64, 0x6f, 0x62, 0x65, 0x20, 0x46, 0x6c,
    0x61, 0x73, 0x68, 0x20, 0x4d, 0x65, 0x64, 0x69,
    0x61, 0x20, 0x53, 0x65, 0x72, 0x76, 0x65, 0x72,
    0x20, 0x30, 0x30, 0x31, // Genuine Adobe Flash Media Server 001
    0xf0, 0xee, 0xc2, 0x4a, 0x80, 0x68, 0xbe, 0xe8,
    0x2e, 0x00, 0xd0, 0xd1, 0x02, 0x9e, 0x7e, 0x57,
    0x6e, 0xec, 0x5d, 0x2d, 0x29, 0x80, 0x6f, 0xab,
    0x93, 0xb8, 0xe6, 0x36, 0xcf, 0xeb, 0x31, 0xae
};

void RtmpRandomGenerate(uint8_t* bytes, size_t size, Logger* logger) {
    if (RAND_bytes(bytes, (int)size) == 1) {
        return;
    }
    LogWarnf(logger, "RAND_bytes error:%lu, size:%lu, use random() instead",
            ERR_get_error(), size);
    for (size_t i = 0; i < size; i++) {
        // the common value in [0x0f, 0xf0]
        bytes[i] = 0x0f + (random() % (256 - 0x0f - 0x0f));
    }
}

int HmacSha256(const uint8_t* key, size_t key_size, const uint8_t* data, size_t data_size, uint8_t* digest) {
    unsigned int digest_size = 0;

    if (HMAC(EVP_sha256(), key, (int)key_size, data, data_size, digest, &digest_size) == nullptr) {
        return -1;
    }
    if (digest_size != RTMP_DIGEST_SIZE) {
        return -1;
    }
    return 0;
}

uint32_t GetDigestOffset(const uint8_t* packet, HANDSHAKE_SCHEMA schema) {
    //digest block: 764bytes
    //---- offset: 4bytes
    //---- random-data: (offset)bytes
    //---- digest-data: 32bytes
    //---- random-data: (764-4-offset-32)bytes
    const uint32_t MAX_OFFSET = 764 - 32 - 4;
    uint32_t block_pos = (schema == SCHEMA0) ? (8 + 764) : 8;
    const uint8_t* p = packet + block_pos;

    uint32_t offset = (uint32_t)p[0] + p[1] + p[2] + p[3];
    return (offset % MAX_OFFSET) + block_pos + 4;
}

const char* GetSchemaDesc(HANDSHAKE_SCHEMA schema) {
    switch (schema) {
        case SCHEMA0:
            return "schema0";
        case SCHEMA1:
            return "schema1";
        default:
            break;
    }
    return "unknown schema";
}

C1S1Handle::C1S1Handle(Logger* logger):logger_(logger)
{
    memset(c1_data_, 0, sizeof(c1_data_));
    memset(digest_data_, 0, sizeof(digest_data_));
}

C1S1Handle::~C1S1Handle()
{
}

int C1S1Handle::ParseC1(const uint8_t* c1, size_t len) {
    if (len < RTMP_HANDSHAKE_SIZE) {
        LogErrorf(logger_, "c1 length error:%lu", (unsigned long)len);
        return RTMP_ERROR_HANDSHAKE;
    }
    memcpy(c1_data_, c1, sizeof(c1_data_));

    c1_time_    = ByteStream::Read4Bytes(c1_data_);
    c1_version_ = ByteStream::Read4Bytes(c1_data_ + 4);

    if (c1_version_ == 0) {
        schema_ = SCHEMA_INIT;
        return RTMP_SIMPLE_HANDSHAKE;
    }

    //schema1 first which make ffmpeg happy
    if (CheckDigestValid(c1_data_, SCHEMA1, GENUINE_FLASH_PLAYER_KEY, GENUINE_FP_KEY_SIZE)) {
        schema_ = SCHEMA1;
    } else if (CheckDigestValid(c1_data_, SCHEMA0, GENUINE_FLASH_PLAYER_KEY, GENUINE_FP_KEY_SIZE)) {
        schema_ = SCHEMA0;
    } else {
        LogWarnf(logger_, "c1 digest is invalid in both schemas, c1 version:0x%08x", c1_version_);
        schema_ = SCHEMA_INIT;
        return RTMP_ERROR_HANDSHAKE_DIGEST_MISMATCH;
    }

    uint32_t digest_pos = GetDigestOffset(c1_data_, schema_);
    memcpy(digest_data_, c1_data_ + digest_pos, sizeof(digest_data_));

    LogDebugf(logger_, "c1 digest is valid in %s, digest pos:%u", GetSchemaDesc(schema_), digest_pos);
    return RTMP_OK;
}

int C1S1Handle::MakeS1(uint8_t* s1_data, uint32_t s1_time) {
    if ((schema_ != SCHEMA0) && (schema_ != SCHEMA1)) {
        LogErrorf(logger_, "schema not init:%d", (int)schema_);
        return RTMP_ERROR_HANDSHAKE;
    }
    RtmpRandomGenerate(s1_data, RTMP_HANDSHAKE_SIZE, logger_);
    ByteStream::Write4Bytes(s1_data, s1_time);
    ByteStream::Write4Bytes(s1_data + 4, RTMP_S1_VERSION);

    return MakeDigest(s1_data, schema_, GENUINE_FLASH_MEDIA_SERVER_KEY, GENUINE_FMS_KEY_SIZE);
}

int C1S1Handle::MakeC1(uint8_t* c1_data, HANDSHAKE_SCHEMA schema) {
    RtmpRandomGenerate(c1_data, RTMP_HANDSHAKE_SIZE, logger_);
    ByteStream::Write4Bytes(c1_data, (uint32_t)now_millisec());
    ByteStream::Write4Bytes(c1_data + 4, 0x80000702); // client c1 version

    int ret = MakeDigest(c1_data, schema, GENUINE_FLASH_PLAYER_KEY, GENUINE_FP_KEY_SIZE);
    if (ret != 0) {
        return ret;
    }
    schema_ = schema;
    memcpy(c1_data_, c1_data, sizeof(c1_data_));
    c1_time_    = ByteStream::Read4Bytes(c1_data_);
    c1_version_ = ByteStream::Read4Bytes(c1_data_ + 4);
    memcpy(digest_data_, c1_data_ + GetDigestOffset(c1_data_, schema), sizeof(digest_data_));
    return RTMP_OK;
}

bool C1S1Handle::CheckS1Digest(const uint8_t* s1_data) {
    return CheckDigestValid(s1_data, schema_, GENUINE_FLASH_MEDIA_SERVER_KEY, GENUINE_FMS_KEY_SIZE);
}

bool C1S1Handle::CheckDigestValid(const uint8_t* packet, HANDSHAKE_SCHEMA schema,
                                const uint8_t* key, size_t key_size) {
    uint8_t joined_bytes[RTMP_HANDSHAKE_SIZE - RTMP_DIGEST_SIZE];
    uint8_t digest[RTMP_DIGEST_SIZE];

    if ((schema != SCHEMA0) && (schema != SCHEMA1)) {
        return false;
    }
    uint32_t digest_pos = GetDigestOffset(packet, schema);

    // the packet without the 32 bytes digest
    memcpy(joined_bytes, packet, digest_pos);
    memcpy(joined_bytes + digest_pos, packet + digest_pos + RTMP_DIGEST_SIZE,
        RTMP_HANDSHAKE_SIZE - digest_pos - RTMP_DIGEST_SIZE);

    if (HmacSha256(key, key_size, joined_bytes, sizeof(joined_bytes), digest) != 0) {
        LogErrorf(logger_, "hmac sha256 error");
        return false;
    }
    return ByteStream::BytesIsEqual((char*)digest, (char*)packet + digest_pos, sizeof(digest));
}

int C1S1Handle::MakeDigest(uint8_t* packet, HANDSHAKE_SCHEMA schema,
                        const uint8_t* key, size_t key_size) {
    uint8_t joined_bytes[RTMP_HANDSHAKE_SIZE - RTMP_DIGEST_SIZE];
    uint32_t digest_pos = GetDigestOffset(packet, schema);

    memcpy(joined_bytes, packet, digest_pos);
    memcpy(joined_bytes + digest_pos, packet + digest_pos + RTMP_DIGEST_SIZE,
        RTMP_HANDSHAKE_SIZE - digest_pos - RTMP_DIGEST_SIZE);

    if (HmacSha256(key, key_size, joined_bytes, sizeof(joined_bytes), packet + digest_pos) != 0) {
        LogErrorf(logger_, "hmac sha256 error");
        return RTMP_ERROR_HANDSHAKE;
    }
    return RTMP_OK;
}

C2S2Handle::C2S2Handle(Logger* logger):logger_(logger)
{
    RtmpRandomGenerate(random_, sizeof(random_), logger_);
    RtmpRandomGenerate(digest_, sizeof(digest_), logger_);
}

C2S2Handle::~C2S2Handle()
{
}

void C2S2Handle::Generate(uint8_t* body) {
    memcpy(body, random_, sizeof(random_));
    memcpy(body + sizeof(random_), digest_, sizeof(digest_));
}

void C2S2Handle::Parse(const uint8_t* body) {
    memcpy(random_, body, sizeof(random_));
    memcpy(digest_, body + sizeof(random_), sizeof(digest_));
}

int C2S2Handle::CreateByDigest(const uint8_t* c1_digest) {
    return CalcDigest(c1_digest, digest_);
}

bool C2S2Handle::ValidateS2(const uint8_t* c1_digest) {
    uint8_t digest[RTMP_DIGEST_SIZE];

    if (CalcDigest(c1_digest, digest) != 0) {
        return false;
    }
    return ByteStream::BytesIsEqual((char*)digest_, (char*)digest, sizeof(digest_));
}

int C2S2Handle::CalcDigest(const uint8_t* c1_digest, uint8_t* digest) {
    uint8_t temp_key[RTMP_DIGEST_SIZE];

    int ret = HmacSha256(GENUINE_FLASH_MEDIA_SERVER_KEY, GENUINE_FMS_KEY_CRUD_SIZE,
                    c1_digest, RTMP_DIGEST_SIZE, temp_key);
    if (ret != 0) {
        LogErrorf(logger_, "hmac sha256 error:%d", ret);
        return RTMP_ERROR_HANDSHAKE;
    }

    ret = HmacSha256(temp_key, sizeof(temp_key), random_, sizeof(random_), digest);
    if (ret != 0) {
        LogErrorf(logger_, "hmac sha256 error:%d", ret);
        return RTMP_ERROR_HANDSHAKE;
    }
    return RTMP_OK;
}

RtmpServerHandshake::RtmpServerHandshake(Logger* logger):c1s1_(logger)
    , c2s2_(logger)
    , logger_(logger)
{
}

RtmpServerHandshake::~RtmpServerHandshake()
{
}

int RtmpServerHandshake::HandleData(DataBuffer& recv_buffer, DataBuffer& output) {
    int ret = RTMP_NEED_READ_MORE;

    if (phase_ == HANDSHAKE_C0C1_PHASE) {
        ret = HandleC0C1(recv_buffer, output);
        if (ret != RTMP_OK) {
            return ret;
        }
        phase_ = HANDSHAKE_C2_PHASE;
    }

    if (phase_ == HANDSHAKE_C2_PHASE) {
        ret = HandleC2(recv_buffer);
        if (ret != RTMP_OK) {
            return ret;
        }
        phase_ = HANDSHAKE_DONE_PHASE;
        LogInfof(logger_, "rtmp handshake done, mode:%s", digest_mode_ ? "digest" : "simple");
    }
    return RTMP_OK;
}

int RtmpServerHandshake::HandleC0C1(DataBuffer& recv_buffer, DataBuffer& output) {
    const size_t c0_size = 1;
    const size_t c1_size = RTMP_HANDSHAKE_SIZE;

    if (!recv_buffer.Require(c0_size)) {
        return RTMP_NEED_READ_MORE;
    }
    uint8_t version = (uint8_t)recv_buffer.Data()[0];
    if (version != RTMP_HANDSHAKE_VERSION) {
        LogErrorf(logger_, "rtmp handshake version error:0x%02x", version);
        return RTMP_ERROR_UNSUPPORTED_VERSION;
    }

    if (!recv_buffer.Require(c0_size + c1_size)) {
        return RTMP_NEED_READ_MORE;
    }
    const uint8_t* c1 = (uint8_t*)recv_buffer.Data() + c0_size;

    if (digest_enable_) {
        int ret = c1s1_.ParseC1(c1, c1_size);
        if (ret == RTMP_OK) {
            digest_mode_ = true;
        } else if (ret == RTMP_ERROR_HANDSHAKE_DIGEST_MISMATCH) {
            if (!simple_fallback_) {
                LogErrorf(logger_, "c1 digest mismatch and simple handshake fallback is disabled");
                return ret;
            }
            LogInfof(logger_, "try to rtmp handshake in simple mode");
        } else if (ret != RTMP_SIMPLE_HANDSHAKE) {
            return ret;
        }
    } else {
        int ret = c1s1_.ParseC1(c1, c1_size);
        if (ret < 0 && ret != RTMP_ERROR_HANDSHAKE_DIGEST_MISMATCH) {
            return ret;
        }
    }

    uint8_t s0s1s2[1 + RTMP_HANDSHAKE_SIZE * 2];
    int ret = MakeS0S1S2(s0s1s2);
    if (ret != RTMP_OK) {
        return ret;
    }
    output.AppendData((char*)s0s1s2, sizeof(s0s1s2));
    recv_buffer.ConsumeData(c0_size + c1_size);

    return RTMP_OK;
}

int RtmpServerHandshake::HandleC2(DataBuffer& recv_buffer) {
    const size_t c2_size = RTMP_HANDSHAKE_SIZE;

    if (!recv_buffer.Require(c2_size)) {
        return RTMP_NEED_READ_MORE;
    }
    // c2 content is not verified
    recv_buffer.ConsumeData(c2_size);
    return RTMP_OK;
}

int RtmpServerHandshake::MakeS0S1S2(uint8_t* s0s1s2) {
    uint8_t* p = s0s1s2;
    uint32_t s1_time = (uint32_t)now_millisec();

    /* ++++++ s0 ++++++*/
    p[0] = RTMP_HANDSHAKE_VERSION;
    p++;

    if (!digest_mode_) {
        /* ++++++ s1: time + zero + random ++++++*/
        RtmpRandomGenerate(p, RTMP_HANDSHAKE_SIZE, logger_);
        ByteStream::Write4Bytes(p, s1_time);
        ByteStream::Write4Bytes(p + 4, 0);
        p += RTMP_HANDSHAKE_SIZE;

        /* ++++++ s2: echo c1 ++++++*/
        memcpy(p, c1s1_.GetC1Data(), RTMP_HANDSHAKE_SIZE);
        return RTMP_OK;
    }

    /* ++++++ s1 ++++++*/
    int ret = c1s1_.MakeS1(p, s1_time);
    if (ret != RTMP_OK) {
        LogErrorf(logger_, "make s1 error:%d", ret);
        return ret;
    }
    p += RTMP_HANDSHAKE_SIZE;

    /* ++++++ s2 ++++++*/
    ret = c2s2_.CreateByDigest(c1s1_.GetC1Digest());
    if (ret != RTMP_OK) {
        LogErrorf(logger_, "c2s2 create by digest s2 error...");
        return ret;
    }
    c2s2_.Generate(p);
    return RTMP_OK;
}

}
