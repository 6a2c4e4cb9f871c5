#ifndef RTMP_HANDSHAKE_HPP
#define RTMP_HANDSHAKE_HPP
#include "rtmp_pub.hpp"
#include "logger.hpp"
#include "byte_stream.hpp"
#include "data_buffer.hpp"

#include <stdint.h>
#include <stddef.h>
#include <string.h>

namespace cpp_rtmp
{

#define HASH_SIZE 512
#define RTMP_HANDSHAKE_VERSION 0x03
#define RTMP_HANDSHAKE_SIZE    1536
#define RTMP_DIGEST_SIZE       32
#define RTMP_S1_VERSION        0x04050001

#define GENUINE_FP_KEY_SIZE        30
#define GENUINE_FP_KEY_CRUD_SIZE   62
#define GENUINE_FMS_KEY_SIZE       36
#define GENUINE_FMS_KEY_CRUD_SIZE  68

typedef enum {
    SCHEMA_INIT = -1,
    SCHEMA0,  //key first, digest second
    SCHEMA1   //digest first, key second
} HANDSHAKE_SCHEMA;

typedef enum {
    HANDSHAKE_C0C1_PHASE,
    HANDSHAKE_C2_PHASE,
    HANDSHAKE_DONE_PHASE
} RTMP_HANDSHAKE_PHASE;

// 62bytes Flash Player key which is used to sign the client packet.
extern const uint8_t GENUINE_FLASH_PLAYER_KEY[GENUINE_FP_KEY_CRUD_SIZE];

// 68bytes FMS key which is used to sign the sever packet.
extern const uint8_t GENUINE_FLASH_MEDIA_SERVER_KEY[GENUINE_FMS_KEY_CRUD_SIZE];

// falls back to random() with a warning when RAND_bytes fails
void RtmpRandomGenerate(uint8_t* bytes, size_t size, Logger* logger = nullptr);

int HmacSha256(const uint8_t* key, size_t key_size, const uint8_t* data, size_t data_size, uint8_t* digest);

// position of the 32 bytes digest inside a c1/s1 packet for the schema
uint32_t GetDigestOffset(const uint8_t* packet, HANDSHAKE_SCHEMA schema);

const char* GetSchemaDesc(HANDSHAKE_SCHEMA schema);

class C1S1Handle
{
public:
    C1S1Handle(Logger* logger = nullptr);
    ~C1S1Handle();

public:
    // c1: 1536 bytes, returns RTMP_OK with a valid digest or RTMP_SIMPLE_HANDSHAKE
    int ParseC1(const uint8_t* c1, size_t len);
    int MakeS1(uint8_t* s1_data, uint32_t s1_time);
    int MakeC1(uint8_t* c1_data, HANDSHAKE_SCHEMA schema);
    bool CheckS1Digest(const uint8_t* s1_data);

    uint32_t GetC1Time() { return c1_time_; }
    uint32_t GetC1Version() { return c1_version_; }
    const uint8_t* GetC1Digest() { return digest_data_; }
    const uint8_t* GetC1Data() { return c1_data_; }
    HANDSHAKE_SCHEMA GetSchema() { return schema_; }

private:
    bool CheckDigestValid(const uint8_t* packet, HANDSHAKE_SCHEMA schema,
                        const uint8_t* key, size_t key_size);
    int MakeDigest(uint8_t* packet, HANDSHAKE_SCHEMA schema,
                const uint8_t* key, size_t key_size);

private:
    HANDSHAKE_SCHEMA schema_ = SCHEMA_INIT;
    uint8_t c1_data_[RTMP_HANDSHAKE_SIZE];
    uint32_t c1_time_    = 0;
    uint32_t c1_version_ = 0;
    uint8_t digest_data_[RTMP_DIGEST_SIZE];

private:
    Logger* logger_ = nullptr;
};

class C2S2Handle
{
public:
    C2S2Handle(Logger* logger = nullptr);
    ~C2S2Handle();

public:
    void Generate(uint8_t* body);
    void Parse(const uint8_t* body);
    int CreateByDigest(const uint8_t* c1_digest);
    bool ValidateS2(const uint8_t* c1_digest);

private:
    int CalcDigest(const uint8_t* c1_digest, uint8_t* digest);

private:
    uint8_t random_[RTMP_HANDSHAKE_SIZE - RTMP_DIGEST_SIZE];
    uint8_t digest_[RTMP_DIGEST_SIZE];

private:
    Logger* logger_ = nullptr;
};

/*
 * server side handshake:
 *   c0c1 in -> s0s1s2 out -> c2 in -> done
 * HandleData may be called with any partial amount of bytes,
 * it only consumes the bytes belonging to the handshake.
 */
class RtmpServerHandshake
{
public:
    RtmpServerHandshake(Logger* logger = nullptr);
    ~RtmpServerHandshake();

public:
    void SetDigestEnable(bool enable) { digest_enable_ = enable; }
    void SetSimpleFallback(bool enable) { simple_fallback_ = enable; }

    // returns RTMP_OK when the handshake is done, RTMP_NEED_READ_MORE, or an error
    int HandleData(DataBuffer& recv_buffer, DataBuffer& output);

    bool IsDone() { return phase_ == HANDSHAKE_DONE_PHASE; }
    bool IsDigestMode() { return digest_mode_; }
    RTMP_HANDSHAKE_PHASE GetPhase() { return phase_; }
    uint32_t GetC1Time() { return c1s1_.GetC1Time(); }

private:
    int HandleC0C1(DataBuffer& recv_buffer, DataBuffer& output);
    int HandleC2(DataBuffer& recv_buffer);
    int MakeS0S1S2(uint8_t* s0s1s2);

private:
    RTMP_HANDSHAKE_PHASE phase_ = HANDSHAKE_C0C1_PHASE;
    bool digest_enable_   = true;
    bool simple_fallback_ = true;
    bool digest_mode_     = false;
    C1S1Handle c1s1_;
    C2S2Handle c2s2_;

private:
    Logger* logger_ = nullptr;
};

}
#endif //RTMP_HANDSHAKE_HPP
