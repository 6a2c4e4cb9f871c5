#define OPENSSL_SUPPRESS_DEPRECATED
#include "rtmp_handshake.hpp"
#include "rtmp_test_util.hpp"

#include <gtest/gtest.h>
#include <openssl/rand.h>
#include <fstream>
#include <sstream>
#include <stdio.h>
#include <string.h>

using namespace cpp_rtmp;

static const size_t S0S1S2_SIZE = 1 + RTMP_HANDSHAKE_SIZE * 2;

static void AppendDigestC0C1(DataBuffer& buffer, C1S1Handle& client, HANDSHAKE_SCHEMA schema) {
    uint8_t c0c1[1 + RTMP_HANDSHAKE_SIZE];

    c0c1[0] = RTMP_HANDSHAKE_VERSION;
    ASSERT_EQ(RTMP_OK, client.MakeC1(c0c1 + 1, schema));
    buffer.AppendData((char*)c0c1, sizeof(c0c1));
}

static int FailingRandBytes(unsigned char* buf, int num) {
    (void)buf;
    (void)num;
    return 0;
}

TEST(RtmpHandshakeTest, RandomFailureIsLoggedAndFilled) {
    const char* log_file = "rtmp_handshake_random_test.log";
    RAND_METHOD failing_method = {nullptr, FailingRandBytes, nullptr, nullptr, nullptr, nullptr};
    const RAND_METHOD* saved_method = RAND_get_rand_method();
    uint8_t bytes[64];

    remove(log_file);
    Logger logger(log_file, LOGGER_WARN_LEVEL);

    memset(bytes, 0, sizeof(bytes));
    ASSERT_EQ(1, RAND_set_rand_method(&failing_method));
    RtmpRandomGenerate(bytes, sizeof(bytes), &logger);
    RAND_set_rand_method(saved_method);

    for (size_t i = 0; i < sizeof(bytes); i++) {
        EXPECT_GE(bytes[i], 0x0f);
        EXPECT_LE(bytes[i], 0xf0);
    }

    std::ifstream input(log_file);
    std::stringstream content;
    content << input.rdbuf();
    EXPECT_NE(std::string::npos, content.str().find("RAND_bytes error"));
    remove(log_file);

    // the default generator works again and logs nothing
    Logger quiet_logger(log_file, LOGGER_WARN_LEVEL);
    RtmpRandomGenerate(bytes, sizeof(bytes), &quiet_logger);
    std::ifstream missing(log_file);
    EXPECT_FALSE(missing.good());
}

TEST(RtmpHandshakeTest, HmacSha256KnownAnswer) {
    const char* key = "Jefe";
    const char* data = "what do ya want for nothing?";
    const uint8_t expect[RTMP_DIGEST_SIZE] = {
        0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e,
        0x6a, 0x04, 0x24, 0x26, 0x08, 0x95, 0x75, 0xc7,
        0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83,
        0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43
    };
    uint8_t digest[RTMP_DIGEST_SIZE];

    ASSERT_EQ(0, HmacSha256((const uint8_t*)key, strlen(key), (const uint8_t*)data, strlen(data), digest));
    EXPECT_EQ(0, memcmp(expect, digest, sizeof(digest)));
}

TEST(RtmpHandshakeTest, DigestOffset) {
    uint8_t packet[RTMP_HANDSHAKE_SIZE];

    memset(packet, 0, sizeof(packet));
    packet[8]  = 1;
    packet[9]  = 2;
    packet[10] = 3;
    packet[11] = 4;
    EXPECT_EQ(10u + 8u + 4u, GetDigestOffset(packet, SCHEMA1));

    packet[772] = 200;
    packet[773] = 200;
    packet[774] = 200;
    packet[775] = 200;
    EXPECT_EQ((800u % 728u) + 772u + 4u, GetDigestOffset(packet, SCHEMA0));
}

TEST(RtmpHandshakeTest, SimpleHandshake) {
    RtmpServerHandshake handshake;
    DataBuffer recv_buffer;
    DataBuffer output;

    AppendSimpleC0C1(recv_buffer);
    std::string c1(recv_buffer.Data() + 1, RTMP_HANDSHAKE_SIZE);

    ASSERT_EQ(RTMP_NEED_READ_MORE, handshake.HandleData(recv_buffer, output));
    EXPECT_EQ(HANDSHAKE_C2_PHASE, handshake.GetPhase());
    EXPECT_EQ(0u, recv_buffer.DataLen());
    ASSERT_EQ(S0S1S2_SIZE, output.DataLen());

    const uint8_t* p = (uint8_t*)output.Data();
    EXPECT_EQ(RTMP_HANDSHAKE_VERSION, p[0]);
    EXPECT_EQ(0u, ByteStream::Read4Bytes(p + 1 + 4));
    EXPECT_EQ(0, memcmp(c1.data(), p + 1 + RTMP_HANDSHAKE_SIZE, RTMP_HANDSHAKE_SIZE));
    EXPECT_FALSE(handshake.IsDigestMode());
    EXPECT_EQ(0x01020304u, handshake.GetC1Time());

    AppendC2(recv_buffer);
    ASSERT_EQ(RTMP_OK, handshake.HandleData(recv_buffer, output));
    EXPECT_TRUE(handshake.IsDone());
    EXPECT_EQ(0u, recv_buffer.DataLen());
    EXPECT_EQ(S0S1S2_SIZE, output.DataLen());
}

TEST(RtmpHandshakeTest, PartialReads) {
    RtmpServerHandshake handshake;
    DataBuffer all;
    DataBuffer recv_buffer;
    DataBuffer output;

    AppendSimpleC0C1(all);
    AppendC2(all);
    const char* data = all.Data();
    const size_t pieces[] = {1, 100, 1436, 1000, 535, 1};
    size_t pos = 0;

    for (size_t i = 0; i < sizeof(pieces) / sizeof(pieces[0]); i++) {
        recv_buffer.AppendData(data + pos, pieces[i]);
        pos += pieces[i];

        int ret = handshake.HandleData(recv_buffer, output);
        if (pos < all.DataLen()) {
            ASSERT_EQ(RTMP_NEED_READ_MORE, ret) << "piece " << i;
        } else {
            ASSERT_EQ(RTMP_OK, ret);
        }
        if (pos < 1 + RTMP_HANDSHAKE_SIZE) {
            EXPECT_EQ(0u, output.DataLen());
        } else {
            EXPECT_EQ(S0S1S2_SIZE, output.DataLen());
        }
    }
    EXPECT_EQ(all.DataLen(), pos);
    EXPECT_TRUE(handshake.IsDone());
}

TEST(RtmpHandshakeTest, BytesAfterC2AreLeft) {
    RtmpServerHandshake handshake;
    DataBuffer recv_buffer;
    DataBuffer output;
    const char extra[5] = {0x02, 0x00, 0x00, 0x00, 0x00};

    AppendSimpleC0C1(recv_buffer);
    AppendC2(recv_buffer);
    recv_buffer.AppendData(extra, sizeof(extra));

    ASSERT_EQ(RTMP_OK, handshake.HandleData(recv_buffer, output));
    ASSERT_EQ(sizeof(extra), recv_buffer.DataLen());
    EXPECT_EQ(0, memcmp(extra, recv_buffer.Data(), sizeof(extra)));
}

TEST(RtmpHandshakeTest, UnsupportedVersion) {
    RtmpServerHandshake handshake;
    DataBuffer recv_buffer;
    DataBuffer output;
    const char c0 = 0x06;

    recv_buffer.AppendData(&c0, 1);
    EXPECT_EQ(RTMP_ERROR_UNSUPPORTED_VERSION, handshake.HandleData(recv_buffer, output));
    EXPECT_EQ(0u, output.DataLen());
    EXPECT_FALSE(handshake.IsDone());
}

TEST(RtmpHandshakeTest, DigestHandshakeSchema1) {
    RtmpServerHandshake handshake;
    C1S1Handle client;
    DataBuffer recv_buffer;
    DataBuffer output;

    AppendDigestC0C1(recv_buffer, client, SCHEMA1);
    ASSERT_EQ(RTMP_NEED_READ_MORE, handshake.HandleData(recv_buffer, output));
    ASSERT_TRUE(handshake.IsDigestMode());
    ASSERT_EQ(S0S1S2_SIZE, output.DataLen());

    const uint8_t* s1 = (uint8_t*)output.Data() + 1;
    const uint8_t* s2 = s1 + RTMP_HANDSHAKE_SIZE;
    EXPECT_EQ((uint32_t)RTMP_S1_VERSION, ByteStream::Read4Bytes(s1 + 4));
    EXPECT_TRUE(client.CheckS1Digest(s1));

    C2S2Handle s2_handle;
    s2_handle.Parse(s2);
    EXPECT_TRUE(s2_handle.ValidateS2(client.GetC1Digest()));

    AppendC2(recv_buffer);
    EXPECT_EQ(RTMP_OK, handshake.HandleData(recv_buffer, output));
}

TEST(RtmpHandshakeTest, DigestHandshakeSchema0) {
    RtmpServerHandshake handshake;
    C1S1Handle client;
    DataBuffer recv_buffer;
    DataBuffer output;

    AppendDigestC0C1(recv_buffer, client, SCHEMA0);
    ASSERT_EQ(RTMP_NEED_READ_MORE, handshake.HandleData(recv_buffer, output));
    ASSERT_TRUE(handshake.IsDigestMode());

    const uint8_t* s1 = (uint8_t*)output.Data() + 1;
    EXPECT_TRUE(client.CheckS1Digest(s1));

    C2S2Handle s2_handle;
    s2_handle.Parse(s1 + RTMP_HANDSHAKE_SIZE);
    EXPECT_TRUE(s2_handle.ValidateS2(client.GetC1Digest()));
}

TEST(RtmpHandshakeTest, ForgedDigestFallsBackToSimple) {
    RtmpServerHandshake handshake;
    DataBuffer recv_buffer;
    DataBuffer output;

    AppendSimpleC0C1(recv_buffer);
    // non zero version without a valid digest
    ByteStream::Write4Bytes((uint8_t*)recv_buffer.Data() + 1 + 4, 0x80000702);
    std::string c1(recv_buffer.Data() + 1, RTMP_HANDSHAKE_SIZE);

    ASSERT_EQ(RTMP_NEED_READ_MORE, handshake.HandleData(recv_buffer, output));
    EXPECT_FALSE(handshake.IsDigestMode());
    ASSERT_EQ(S0S1S2_SIZE, output.DataLen());
    EXPECT_EQ(0, memcmp(c1.data(), output.Data() + 1 + RTMP_HANDSHAKE_SIZE, RTMP_HANDSHAKE_SIZE));
}

TEST(RtmpHandshakeTest, ForgedDigestWithoutFallbackFails) {
    RtmpServerHandshake handshake;
    DataBuffer recv_buffer;
    DataBuffer output;

    handshake.SetSimpleFallback(false);
    AppendSimpleC0C1(recv_buffer);
    ByteStream::Write4Bytes((uint8_t*)recv_buffer.Data() + 1 + 4, 0x80000702);

    EXPECT_EQ(RTMP_ERROR_HANDSHAKE_DIGEST_MISMATCH, handshake.HandleData(recv_buffer, output));
    EXPECT_EQ(0u, output.DataLen());
}

TEST(RtmpHandshakeTest, ZeroVersionSkipsDigestEvenWithoutFallback) {
    RtmpServerHandshake handshake;
    DataBuffer recv_buffer;
    DataBuffer output;

    handshake.SetSimpleFallback(false);
    AppendSimpleC0C1(recv_buffer);
    EXPECT_EQ(RTMP_NEED_READ_MORE, handshake.HandleData(recv_buffer, output));
    EXPECT_FALSE(handshake.IsDigestMode());
}

TEST(RtmpHandshakeTest, DigestDisabledAnswersSimple) {
    RtmpServerHandshake handshake;
    C1S1Handle client;
    DataBuffer recv_buffer;
    DataBuffer output;

    handshake.SetDigestEnable(false);
    AppendDigestC0C1(recv_buffer, client, SCHEMA1);
    std::string c1(recv_buffer.Data() + 1, RTMP_HANDSHAKE_SIZE);

    ASSERT_EQ(RTMP_NEED_READ_MORE, handshake.HandleData(recv_buffer, output));
    EXPECT_FALSE(handshake.IsDigestMode());
    EXPECT_EQ(0, memcmp(c1.data(), output.Data() + 1 + RTMP_HANDSHAKE_SIZE, RTMP_HANDSHAKE_SIZE));
}
