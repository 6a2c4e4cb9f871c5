#include "amf/amf0.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace cpp_rtmp;

static int DecodeAll(const DataBuffer& buffer, AMF_ITERM& item, size_t& left_len) {
    const uint8_t* p = (const uint8_t*)buffer.Data();

    left_len = buffer.DataLen();
    return AMF_Decoder::Decode(p, left_len, item);
}

TEST(Amf0Test, NumberBytes) {
    DataBuffer buffer;
    const uint8_t expect[] = {0x00, 0x3f, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    AMF_Encoder::Encode(1.0, buffer);
    ASSERT_EQ(sizeof(expect), buffer.DataLen());
    EXPECT_EQ(0, memcmp(expect, buffer.Data(), sizeof(expect)));

    AMF_ITERM item;
    size_t left_len = 0;
    ASSERT_EQ(0, DecodeAll(buffer, item, left_len));
    EXPECT_EQ(0u, left_len);
    EXPECT_EQ(AMF_DATA_TYPE_NUMBER, item.GetAmfType());
    EXPECT_DOUBLE_EQ(1.0, item.number_);
}

TEST(Amf0Test, StringBytes) {
    DataBuffer buffer;
    const uint8_t expect[] = {0x02, 0x00, 0x07, 'c', 'o', 'n', 'n', 'e', 'c', 't'};

    AMF_Encoder::Encode(std::string("connect"), buffer);
    ASSERT_EQ(sizeof(expect), buffer.DataLen());
    EXPECT_EQ(0, memcmp(expect, buffer.Data(), sizeof(expect)));
}

TEST(Amf0Test, LongString) {
    DataBuffer buffer;
    std::string long_str(70000, 'x');

    AMF_Encoder::Encode(long_str, buffer);
    ASSERT_EQ(1u + 4u + 70000u, buffer.DataLen());
    EXPECT_EQ(AMF_DATA_TYPE_LONG_STRING, buffer.Data()[0]);

    AMF_ITERM item;
    size_t left_len = 0;
    ASSERT_EQ(0, DecodeAll(buffer, item, left_len));
    EXPECT_EQ(AMF_DATA_TYPE_LONG_STRING, item.GetAmfType());
    EXPECT_EQ(long_str, item.desc_str_);
}

TEST(Amf0Test, ObjectWithMembers) {
    DataBuffer buffer;
    AMF_ITERM obj;

    obj.SetAmfType(AMF_DATA_TYPE_OBJECT);
    obj.AddMember("app", AMF_ITERM::MakeString("live"));
    obj.AddMember("fpad", AMF_ITERM::MakeBool(false));
    obj.AddMember("audioCodecs", AMF_ITERM::MakeNumber(3575.0));
    obj.AddMember("pageUrl", AMF_ITERM::MakeNull());
    ASSERT_EQ(0, AMF_Encoder::Encode(obj, buffer));

    // ends with an empty key and the object end marker
    const uint8_t* end = (const uint8_t*)buffer.Data() + buffer.DataLen() - 3;
    EXPECT_EQ(0x00, end[0]);
    EXPECT_EQ(0x00, end[1]);
    EXPECT_EQ(AMF_DATA_TYPE_OBJECT_END, end[2]);

    AMF_ITERM item;
    size_t left_len = 0;
    ASSERT_EQ(0, DecodeAll(buffer, item, left_len));
    EXPECT_EQ(0u, left_len);
    ASSERT_EQ(AMF_DATA_TYPE_OBJECT, item.GetAmfType());
    ASSERT_EQ(4u, item.amf_obj_.size());

    AMF_ITERM* app = item.GetMember("app");
    ASSERT_TRUE(app != nullptr);
    EXPECT_EQ("live", app->desc_str_);
    ASSERT_TRUE(item.GetMember("fpad") != nullptr);
    EXPECT_FALSE(item.GetMember("fpad")->enable_);
    EXPECT_DOUBLE_EQ(3575.0, item.GetMember("audioCodecs")->number_);
    EXPECT_EQ(AMF_DATA_TYPE_NULL, item.GetMember("pageUrl")->GetAmfType());
    EXPECT_TRUE(item.GetMember("tcUrl") == nullptr);
}

TEST(Amf0Test, EcmaArrayAndStrictArray) {
    const uint8_t ecma[] = {
        0x08, 0x00, 0x00, 0x00, 0x01,
        0x00, 0x05, 'w', 'i', 'd', 't', 'h',
        0x00, 0x40, 0x94, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x09
    };
    const uint8_t* p = ecma;
    size_t left_len = sizeof(ecma);
    AMF_ITERM item;

    ASSERT_EQ(0, AMF_Decoder::Decode(p, left_len, item));
    EXPECT_EQ(0u, left_len);
    ASSERT_EQ(AMF_DATA_TYPE_MIXEDARRAY, item.GetAmfType());
    ASSERT_TRUE(item.GetMember("width") != nullptr);
    EXPECT_DOUBLE_EQ(1280.0, item.GetMember("width")->number_);

    const uint8_t strict[] = {
        0x0a, 0x00, 0x00, 0x00, 0x02,
        0x01, 0x01,
        0x05
    };
    p = strict;
    left_len = sizeof(strict);
    AMF_ITERM array;

    ASSERT_EQ(0, AMF_Decoder::Decode(p, left_len, array));
    ASSERT_EQ(2u, array.amf_array_.size());
    EXPECT_TRUE(array.amf_array_[0]->enable_);
    EXPECT_EQ(AMF_DATA_TYPE_NULL, array.amf_array_[1]->GetAmfType());
}

TEST(Amf0Test, Date) {
    DataBuffer buffer;

    AMF_Encoder::EncodeDate(1700000000000.0, 60, buffer);
    ASSERT_EQ(11u, buffer.DataLen());

    AMF_ITERM item;
    size_t left_len = 0;
    ASSERT_EQ(0, DecodeAll(buffer, item, left_len));
    EXPECT_EQ(AMF_DATA_TYPE_DATE, item.GetAmfType());
    EXPECT_DOUBLE_EQ(1700000000000.0, item.number_);
    EXPECT_EQ(60, item.timezone_);
}

TEST(Amf0Test, TruncatedInputFails) {
    DataBuffer buffer;
    AMF_ITERM obj;

    obj.SetAmfType(AMF_DATA_TYPE_OBJECT);
    obj.AddMember("code", AMF_ITERM::MakeString("NetConnection.Connect.Success"));
    AMF_Encoder::Encode(obj, buffer);
    AMF_Encoder::Encode(2.0, buffer);

    // every strict prefix of the object is rejected
    const size_t obj_len = buffer.DataLen() - 9;
    for (size_t len = 0; len < obj_len; len++) {
        const uint8_t* p = (const uint8_t*)buffer.Data();
        size_t left_len = len;
        AMF_ITERM item;

        EXPECT_EQ(-1, AMF_Decoder::Decode(p, left_len, item)) << "length " << len;
    }
}

TEST(Amf0Test, UnsupportedMarkerFails) {
    const uint8_t reference[] = {0x07, 0x00, 0x01};
    const uint8_t amf3_marker[] = {0x11, 0x00};
    const uint8_t* p = reference;
    size_t left_len = sizeof(reference);
    AMF_ITERM item;

    EXPECT_EQ(-1, AMF_Decoder::Decode(p, left_len, item));

    p = amf3_marker;
    left_len = sizeof(amf3_marker);
    AMF_ITERM other;
    EXPECT_EQ(-1, AMF_Decoder::Decode(p, left_len, other));
}

TEST(Amf0Test, NestingDepthIsLimited) {
    DataBuffer buffer;
    const uint8_t key[] = {0x00, 0x01, 'a'};
    const uint8_t object_marker = AMF_DATA_TYPE_OBJECT;

    buffer.AppendData((char*)&object_marker, 1);
    for (int i = 0; i < AMF_MAX_DEPTH + 2; i++) {
        buffer.AppendData((char*)key, sizeof(key));
        buffer.AppendData((char*)&object_marker, 1);
    }

    AMF_ITERM item;
    size_t left_len = 0;
    EXPECT_EQ(-1, DecodeAll(buffer, item, left_len));
}
