#include "rtmp_command.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace cpp_rtmp;

TEST(RtmpCommandTest, MessageTypes) {
    EXPECT_TRUE(IsRtmpCommandMessage(RTMP_COMMAND_MESSAGES_AMF0));
    EXPECT_TRUE(IsRtmpCommandMessage(RTMP_COMMAND_MESSAGES_AMF3));
    EXPECT_FALSE(IsRtmpCommandMessage(RTMP_COMMAND_MESSAGES_META_DATA0));
    EXPECT_TRUE(IsRtmpDataMessage(RTMP_COMMAND_MESSAGES_META_DATA0));
    EXPECT_TRUE(IsRtmpDataMessage(RTMP_COMMAND_MESSAGES_META_DATA3));
    EXPECT_FALSE(IsRtmpDataMessage(RTMP_MEDIA_PACKET_VIDEO));
}

TEST(RtmpCommandTest, DecodeConnect) {
    DataBuffer buffer;
    AMF_ITERM obj;

    AMF_Encoder::Encode(std::string("connect"), buffer);
    AMF_Encoder::Encode(1.0, buffer);
    obj.SetAmfType(AMF_DATA_TYPE_OBJECT);
    obj.AddMember("app", AMF_ITERM::MakeString("live"));
    obj.AddMember("tcUrl", AMF_ITERM::MakeString("rtmp://127.0.0.1/live"));
    AMF_Encoder::Encode(obj, buffer);

    RtmpMessage msg(RTMP_COMMAND_MESSAGES_AMF0, 0, 0, (uint8_t*)buffer.Data(), buffer.DataLen());
    RtmpCommand command;

    ASSERT_EQ(RTMP_OK, command.Decode(msg));
    EXPECT_TRUE(command.IsCommand());
    EXPECT_EQ("connect", command.name_);
    EXPECT_DOUBLE_EQ(1.0, command.transaction_id_);
    ASSERT_TRUE(command.cmd_obj_ != nullptr);
    ASSERT_TRUE(command.cmd_obj_->GetMember("app") != nullptr);
    EXPECT_EQ("live", command.cmd_obj_->GetMember("app")->desc_str_);
    EXPECT_TRUE(command.args_.empty());
}

TEST(RtmpCommandTest, DecodeCommandArguments) {
    DataBuffer buffer;

    AMF_Encoder::Encode(std::string("publish"), buffer);
    AMF_Encoder::Encode(5.0, buffer);
    AMF_Encoder::EncodeNull(buffer);
    AMF_Encoder::Encode(std::string("stream1"), buffer);
    AMF_Encoder::Encode(std::string("live"), buffer);

    RtmpCommand command;
    ASSERT_EQ(RTMP_OK, command.Decode(RTMP_COMMAND_MESSAGES_AMF0, (uint8_t*)buffer.Data(), buffer.DataLen()));
    EXPECT_EQ("publish", command.name_);
    EXPECT_DOUBLE_EQ(5.0, command.transaction_id_);
    ASSERT_TRUE(command.cmd_obj_ != nullptr);
    EXPECT_EQ(AMF_DATA_TYPE_NULL, command.cmd_obj_->GetAmfType());
    ASSERT_EQ(2u, command.args_.size());
    EXPECT_EQ("stream1", command.args_[0]->desc_str_);
    EXPECT_EQ("live", command.args_[1]->desc_str_);
}

TEST(RtmpCommandTest, DecodeDataMessage) {
    DataBuffer buffer;
    AMF_ITERM meta;

    AMF_Encoder::Encode(std::string("@setDataFrame"), buffer);
    AMF_Encoder::Encode(std::string("onMetaData"), buffer);
    meta.SetAmfType(AMF_DATA_TYPE_MIXEDARRAY);
    meta.AddMember("width", AMF_ITERM::MakeNumber(1920.0));
    AMF_Encoder::Encode(meta, buffer);

    RtmpCommand command;
    ASSERT_EQ(RTMP_OK, command.Decode(RTMP_COMMAND_MESSAGES_META_DATA0, (uint8_t*)buffer.Data(), buffer.DataLen()));
    EXPECT_FALSE(command.IsCommand());
    EXPECT_EQ("@setDataFrame", command.name_);
    EXPECT_TRUE(command.cmd_obj_ == nullptr);
    ASSERT_EQ(2u, command.args_.size());
    EXPECT_EQ("onMetaData", command.args_[0]->desc_str_);
    ASSERT_EQ(AMF_DATA_TYPE_MIXEDARRAY, command.args_[1]->GetAmfType());
    EXPECT_DOUBLE_EQ(1920.0, command.args_[1]->GetMember("width")->number_);
}

TEST(RtmpCommandTest, DecodeAmf3CommandSkipsFormatByte) {
    DataBuffer buffer;
    const uint8_t format = 0;

    buffer.AppendData((char*)&format, 1);
    AMF_Encoder::Encode(std::string("createStream"), buffer);
    AMF_Encoder::Encode(2.0, buffer);
    AMF_Encoder::EncodeNull(buffer);

    RtmpCommand command;
    ASSERT_EQ(RTMP_OK, command.Decode(RTMP_COMMAND_MESSAGES_AMF3, (uint8_t*)buffer.Data(), buffer.DataLen()));
    EXPECT_EQ("createStream", command.name_);
    EXPECT_DOUBLE_EQ(2.0, command.transaction_id_);
}

TEST(RtmpCommandTest, DecodeErrors) {
    RtmpCommand command;
    DataBuffer buffer;

    // not an amf message type
    AMF_Encoder::Encode(std::string("connect"), buffer);
    EXPECT_EQ(RTMP_ERROR_AMF_DECODE, command.Decode(RTMP_MEDIA_PACKET_AUDIO, (uint8_t*)buffer.Data(), buffer.DataLen()));

    // name without transaction id
    EXPECT_EQ(RTMP_ERROR_AMF_DECODE, command.Decode(RTMP_COMMAND_MESSAGES_AMF0, (uint8_t*)buffer.Data(), buffer.DataLen()));

    // name is not a string
    DataBuffer number;
    AMF_Encoder::Encode(3.0, number);
    EXPECT_EQ(RTMP_ERROR_AMF_DECODE, command.Decode(RTMP_COMMAND_MESSAGES_AMF0, (uint8_t*)number.Data(), number.DataLen()));

    // truncated argument
    DataBuffer truncated;
    AMF_Encoder::Encode(std::string("play"), truncated);
    AMF_Encoder::Encode(4.0, truncated);
    AMF_Encoder::EncodeNull(truncated);
    AMF_Encoder::Encode(std::string("stream1"), truncated);
    EXPECT_EQ(RTMP_ERROR_AMF_DECODE, command.Decode(RTMP_COMMAND_MESSAGES_AMF0, (uint8_t*)truncated.Data(),
                                                truncated.DataLen() - 2));

    EXPECT_EQ(RTMP_ERROR_AMF_DECODE, command.Decode(RTMP_COMMAND_MESSAGES_AMF3, nullptr, 0));
}

TEST(RtmpCommandTest, GenMessage) {
    RtmpCommand command;
    AMF_ITERM* props = AMF_ITERM::MakeObject();
    AMF_ITERM* info = AMF_ITERM::MakeObject();

    props->AddMember("fmsVer", AMF_ITERM::MakeString("FMS/3,0,1,123"));
    info->AddMember("level", AMF_ITERM::MakeString("status"));
    info->AddMember("code", AMF_ITERM::MakeString("NetConnection.Connect.Success"));

    command.name_           = "_result";
    command.transaction_id_ = 1.0;
    command.SetCommandObject(props);
    command.AddArgument(info);

    RTMP_MESSAGE_PTR msg_ptr = command.GenMessage(RTMP_COMMAND_MESSAGES_AMF0, 0, 0);
    ASSERT_TRUE(msg_ptr != nullptr);
    EXPECT_EQ(RTMP_COMMAND_MESSAGES_AMF0, msg_ptr->type_id_);

    RtmpCommand decoded;
    ASSERT_EQ(RTMP_OK, decoded.Decode(*msg_ptr));
    EXPECT_EQ("_result", decoded.name_);
    EXPECT_DOUBLE_EQ(1.0, decoded.transaction_id_);
    ASSERT_TRUE(decoded.cmd_obj_ != nullptr);
    EXPECT_EQ("FMS/3,0,1,123", decoded.cmd_obj_->GetMember("fmsVer")->desc_str_);
    ASSERT_EQ(1u, decoded.args_.size());
    EXPECT_EQ("NetConnection.Connect.Success", decoded.args_[0]->GetMember("code")->desc_str_);
}

TEST(RtmpCommandTest, EncodeWithoutObjectWritesNull) {
    RtmpCommand command;
    DataBuffer buffer;

    command.name_           = "onStatus";
    command.transaction_id_ = 0.0;
    ASSERT_EQ(RTMP_OK, command.Encode(RTMP_COMMAND_MESSAGES_AMF3, buffer));

    // format byte, name, transaction id and a null command object
    ASSERT_EQ(1u + 11u + 9u + 1u, buffer.DataLen());
    EXPECT_EQ(0x00, buffer.Data()[0]);
    EXPECT_EQ(AMF_DATA_TYPE_NULL, buffer.Data()[buffer.DataLen() - 1]);

    EXPECT_EQ(RTMP_ERROR_AMF_DECODE, command.Encode(RTMP_MEDIA_PACKET_VIDEO, buffer));
}
