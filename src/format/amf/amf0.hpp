#ifndef AFM0_HPP
#define AFM0_HPP
#include "byte_stream.hpp"
#include "data_buffer.hpp"

#include <stdint.h>
#include <string.h>
#include <vector>
#include <string>
#include <map>
#include <sstream>

namespace cpp_rtmp
{
typedef enum {
    AMF_DATA_TYPE_UNKNOWN     = -1,
    AMF_DATA_TYPE_NUMBER      = 0x00,
    AMF_DATA_TYPE_BOOL        = 0x01,
    AMF_DATA_TYPE_STRING      = 0x02,
    AMF_DATA_TYPE_OBJECT      = 0x03,
    AMF_DATA_TYPE_NULL        = 0x05,
    AMF_DATA_TYPE_UNDEFINED   = 0x06,
    AMF_DATA_TYPE_REFERENCE   = 0x07,
    AMF_DATA_TYPE_MIXEDARRAY  = 0x08,
    AMF_DATA_TYPE_OBJECT_END  = 0x09,
    AMF_DATA_TYPE_ARRAY       = 0x0a,
    AMF_DATA_TYPE_DATE        = 0x0b,
    AMF_DATA_TYPE_LONG_STRING = 0x0c,
    AMF_DATA_TYPE_UNSUPPORTED = 0x0d,
} AMF_DATA_TYPE;

#define AMF_MAX_DEPTH 64

class AMF_ITERM
{
public:
    AMF_ITERM() {}
    AMF_ITERM(const AMF_ITERM& input) = delete;
    AMF_ITERM& operator=(const AMF_ITERM& input) = delete;

    ~AMF_ITERM() {
        for (auto iter : amf_obj_) {
            AMF_ITERM* temp = iter.second;
            delete temp;
        }
        amf_obj_.clear();

        for (auto iter : amf_array_) {
            AMF_ITERM* temp = iter;
            delete temp;
        }
        amf_array_.clear();
    }

public:
    AMF_DATA_TYPE GetAmfType() {
        return amf_type_;
    }

    void SetAmfType(AMF_DATA_TYPE type) {
        amf_type_ = type;
    }

    // object and ecma array members, nullptr when missing
    AMF_ITERM* GetMember(const std::string& key) {
        auto iter = amf_obj_.find(key);
        if (iter == amf_obj_.end()) {
            return nullptr;
        }
        return iter->second;
    }

    void AddMember(const std::string& key, AMF_ITERM* item) {
        auto iter = amf_obj_.find(key);
        if (iter != amf_obj_.end()) {
            delete iter->second;
            amf_obj_.erase(iter);
        }
        amf_obj_.insert(std::make_pair(key, item));
    }

    static AMF_ITERM* MakeNumber(double number) {
        AMF_ITERM* item = new AMF_ITERM();
        item->SetAmfType(AMF_DATA_TYPE_NUMBER);
        item->number_ = number;
        return item;
    }

    static AMF_ITERM* MakeBool(bool enable) {
        AMF_ITERM* item = new AMF_ITERM();
        item->SetAmfType(AMF_DATA_TYPE_BOOL);
        item->enable_ = enable;
        return item;
    }

    static AMF_ITERM* MakeString(const std::string& str) {
        AMF_ITERM* item = new AMF_ITERM();
        item->SetAmfType((str.length() > 0xffff) ? AMF_DATA_TYPE_LONG_STRING : AMF_DATA_TYPE_STRING);
        item->desc_str_ = str;
        return item;
    }

    static AMF_ITERM* MakeNull() {
        AMF_ITERM* item = new AMF_ITERM();
        item->SetAmfType(AMF_DATA_TYPE_NULL);
        return item;
    }

    static AMF_ITERM* MakeObject() {
        AMF_ITERM* item = new AMF_ITERM();
        item->SetAmfType(AMF_DATA_TYPE_OBJECT);
        return item;
    }

    std::string DumpAmf() {
        std::stringstream ss;
        switch (amf_type_)
        {
            case AMF_DATA_TYPE_NUMBER:
            {
                ss << "amf type: number, value:" <<  number_;
                break;
            }
            case AMF_DATA_TYPE_BOOL:
            {
                ss << "amf type: bool, value:" << enable_;
                break;
            }
            case AMF_DATA_TYPE_STRING:
            {
                ss << "amf type: string, value:" << desc_str_;
                break;
            }
            case AMF_DATA_TYPE_OBJECT:
            {
                ss << "amf type: object, count:" << amf_obj_.size() << "\r\n";
                for (auto iter : amf_obj_) {
                    ss << "object key:" << iter.first.c_str() << "\r\n";
                    ss << iter.second->DumpAmf() << "\r\n";
                }
                break;
            }
            case AMF_DATA_TYPE_NULL:
            {
                ss << "amf type: null";
                break;
            }
            case AMF_DATA_TYPE_UNDEFINED:
            {
                ss << "amf type: undefined";
                break;
            }
            case AMF_DATA_TYPE_MIXEDARRAY:
            {
                ss << "amf type: ecma array, count:" << amf_obj_.size() << "\r\n";
                for (auto iter : amf_obj_) {
                    ss << "object key:" <<  iter.first.c_str()  << "\r\n";
                    ss << iter.second->DumpAmf() << "\r\n";
                }
                break;
            }
            case AMF_DATA_TYPE_ARRAY:
            {
                ss << "amf type: strict array, count:" <<  amf_array_.size() << "\r\n";
                for (auto iter : amf_array_) {
                    ss << iter->DumpAmf() << "\r\n";
                }
                break;
            }
            case AMF_DATA_TYPE_DATE:
            {
                ss << "amf type: date, number:" << number_ << ", timezone:" << timezone_;
                break;
            }
            case AMF_DATA_TYPE_LONG_STRING:
            {
                ss << "amf type: long string, string:" <<  desc_str_;
                break;
            }
            default:
                ss << "amf type: unknown";
                break;
        }
        return ss.str();
    }

public:
    AMF_DATA_TYPE amf_type_ = AMF_DATA_TYPE_UNKNOWN;

public:
    double number_ = 0.0;
    bool enable_   = false;
    int16_t timezone_ = 0;
    std::string desc_str_;
    std::map<std::string, AMF_ITERM*> amf_obj_;
    std::vector<AMF_ITERM*> amf_array_;
};

class AMF_Encoder
{
public:
    static int Encode(double num, DataBuffer& buffer) {
        const size_t amf_len = 1 + 8;
        uint8_t data[amf_len];
        uint8_t* p     = data;

        *p = (uint8_t)AMF_DATA_TYPE_NUMBER;
        p++;

        uint64_t number = ByteStream::ByteDouble2Int(num);
        ByteStream::Write8Bytes(p, number);

        buffer.AppendData((char*)data, amf_len);
        return 0;
    }

    static int EncodeNull(DataBuffer& buffer) {
        return EncodeOnlyType(AMF_DATA_TYPE_NULL, buffer);
    }

    static int Encode(bool flag, DataBuffer& buffer) {
        const size_t amf_len = 1 + 1;
        uint8_t data[amf_len];
        data[0] = AMF_DATA_TYPE_BOOL;
        data[1] = flag ? 0x01 : 0x00;

        buffer.AppendData((char*)data, amf_len);
        return 0;
    }

    // a key inside an object skips the marker and is always a short string
    static int Encode(const std::string& str, DataBuffer& buffer, bool skip_marker = false) {
        uint8_t header[5];
        uint8_t* p = header;

        if (str.length() > 0xffff) {
            if (skip_marker) {
                return -1;
            }
            *p++ = (uint8_t)AMF_DATA_TYPE_LONG_STRING;
            ByteStream::Write4Bytes(p, (uint32_t)str.length());
            p += 4;
        } else {
            if (!skip_marker) {
                *p++ = (uint8_t)AMF_DATA_TYPE_STRING;
            }
            ByteStream::Write2Bytes(p, (uint16_t)str.length());
            p += 2;
        }
        buffer.AppendData((char*)header, p - header);
        buffer.AppendData(str.c_str(), str.length());
        return 0;
    }

    static int EncodeOnlyType(AMF_DATA_TYPE amf_type, DataBuffer& buffer) {
        uint8_t data = (uint8_t)amf_type;

        buffer.AppendData((char*)&data, 1);
        return 0;
    }

    static int EncodeDate(double ms, int16_t timezone, DataBuffer& buffer) {
        uint8_t data[1 + 8 + 2];

        data[0] = (uint8_t)AMF_DATA_TYPE_DATE;
        ByteStream::Write8Bytes(data + 1, ByteStream::ByteDouble2Int(ms));
        ByteStream::Write2Bytes(data + 9, (uint16_t)timezone);

        buffer.AppendData((char*)data, sizeof(data));
        return 0;
    }

    static int Encode(AMF_ITERM& amf_item, DataBuffer& buffer) {
        switch(amf_item.GetAmfType()) {
            case AMF_DATA_TYPE_NUMBER:
            {
                return AMF_Encoder::Encode(amf_item.number_, buffer);
            }
            case AMF_DATA_TYPE_BOOL:
            {
                return AMF_Encoder::Encode(amf_item.enable_, buffer);
            }
            case AMF_DATA_TYPE_STRING:
            case AMF_DATA_TYPE_LONG_STRING:
            {
                return AMF_Encoder::Encode(amf_item.desc_str_, buffer);
            }
            case AMF_DATA_TYPE_OBJECT:
            {
                return AMF_Encoder::Encode(amf_item.amf_obj_, buffer);
            }
            case AMF_DATA_TYPE_NULL:
            case AMF_DATA_TYPE_UNDEFINED:
            {
                return AMF_Encoder::EncodeOnlyType(amf_item.GetAmfType(), buffer);
            }
            case AMF_DATA_TYPE_MIXEDARRAY:
            {
                uint8_t header[5];
                header[0] = AMF_DATA_TYPE_MIXEDARRAY;
                ByteStream::Write4Bytes(header + 1, (uint32_t)amf_item.amf_obj_.size());
                buffer.AppendData((char*)header, sizeof(header));
                return EncodeProperties(amf_item.amf_obj_, buffer);
            }
            case AMF_DATA_TYPE_ARRAY:
            {
                uint8_t header[5];
                header[0] = AMF_DATA_TYPE_ARRAY;
                ByteStream::Write4Bytes(header + 1, (uint32_t)amf_item.amf_array_.size());
                buffer.AppendData((char*)header, sizeof(header));
                for (auto item : amf_item.amf_array_) {
                    int ret = AMF_Encoder::Encode(*item, buffer);
                    if (ret != 0) {
                        return ret;
                    }
                }
                return 0;
            }
            case AMF_DATA_TYPE_DATE:
            {
                return AMF_Encoder::EncodeDate(amf_item.number_, amf_item.timezone_, buffer);
            }
            default:
                break;
        }
        return -1;
    }

    static int Encode(const std::map<std::string, AMF_ITERM*>& amf_obj, DataBuffer& buffer) {
        uint8_t start = AMF_DATA_TYPE_OBJECT;
        buffer.AppendData((char*)&start, 1);

        return EncodeProperties(amf_obj, buffer);
    }

private:
    static int EncodeProperties(const std::map<std::string, AMF_ITERM*>& amf_obj, DataBuffer& buffer) {
        for (const auto& iter : amf_obj) {
            int ret = AMF_Encoder::Encode(iter.first, buffer, true);
            if (ret != 0) {
                return ret;
            }
            ret = AMF_Encoder::Encode(*iter.second, buffer);
            if (ret != 0) {
                return ret;
            }
        }
        std::string end_str;
        AMF_Encoder::Encode(end_str, buffer, true);
        uint8_t end = AMF_DATA_TYPE_OBJECT_END;
        buffer.AppendData((char*)&end, 1);
        return 0;
    }
};

// every read is checked against left_len, -1 on truncated or unsupported data
class AMF_Decoder
{
public:
    static int Decode(const uint8_t*& data, size_t& left_len, AMF_ITERM& amf_item, int depth = 0) {
        if ((left_len < 1) || (depth > AMF_MAX_DEPTH)) {
            return -1;
        }
        uint8_t type = data[0];
        if (type > AMF_DATA_TYPE_UNSUPPORTED) {
            return -1;
        }
        data++;
        left_len--;

        AMF_DATA_TYPE amf_type = (AMF_DATA_TYPE)type;
        switch (amf_type) {
            case AMF_DATA_TYPE_NUMBER:
            case AMF_DATA_TYPE_DATE:
            {
                size_t need = (amf_type == AMF_DATA_TYPE_DATE) ? 10 : 8;
                if (left_len < need) {
                    return -1;
                }
                uint64_t value = ByteStream::Read8Bytes(data);

                amf_item.SetAmfType(amf_type);
                amf_item.number_ = ByteStream::ByteInt2Double(value);
                if (amf_type == AMF_DATA_TYPE_DATE) {
                    amf_item.timezone_ = (int16_t)ByteStream::Read2Bytes(data + 8);
                }
                data     += need;
                left_len -= need;
                break;
            }
            case AMF_DATA_TYPE_BOOL:
            {
                if (left_len < 1) {
                    return -1;
                }
                amf_item.SetAmfType(amf_type);
                amf_item.enable_ = (*data != 0) ? true : false;

                data++;
                left_len--;
                break;
            }
            case AMF_DATA_TYPE_STRING:
            case AMF_DATA_TYPE_LONG_STRING:
            {
                std::string desc;
                int ret = DecodeString(data, left_len, desc, amf_type == AMF_DATA_TYPE_LONG_STRING);
                if (ret != 0) {
                    return ret;
                }
                amf_item.SetAmfType(amf_type);
                amf_item.desc_str_ = desc;
                break;
            }
            case AMF_DATA_TYPE_OBJECT:
            {
                amf_item.SetAmfType(amf_type);
                return DecodeAmfObject(data, left_len, amf_item.amf_obj_, depth);
            }
            case AMF_DATA_TYPE_NULL:
            case AMF_DATA_TYPE_UNDEFINED:
            case AMF_DATA_TYPE_UNSUPPORTED:
            {
                amf_item.SetAmfType(amf_type);
                break;
            }
            case AMF_DATA_TYPE_MIXEDARRAY:
            {
                if (left_len < 4) {
                    return -1;
                }
                // the count is only a hint, the object end marker terminates it
                data     += 4;
                left_len -= 4;

                amf_item.SetAmfType(AMF_DATA_TYPE_MIXEDARRAY);
                return DecodeAmfObject(data, left_len, amf_item.amf_obj_, depth);
            }
            case AMF_DATA_TYPE_ARRAY:
            {
                amf_item.SetAmfType(AMF_DATA_TYPE_ARRAY);
                return DecodeAmfArray(data, left_len, amf_item.amf_array_, depth);
            }
            default:
            {
                // reference, movieclip, recordset and the object end out of place
                amf_item.SetAmfType(AMF_DATA_TYPE_UNKNOWN);
                return -1;
            }
        }

        return 0;
    }

    static int DecodeString(const uint8_t*& data, size_t& left_len, std::string& output, bool long_string) {
        size_t len_bytes = long_string ? 4 : 2;

        if (left_len < len_bytes) {
            return -1;
        }
        size_t str_len = long_string ? ByteStream::Read4Bytes(data) : ByteStream::Read2Bytes(data);
        data     += len_bytes;
        left_len -= len_bytes;

        if (left_len < str_len) {
            return -1;
        }
        output.assign((const char*)data, str_len);
        data     += str_len;
        left_len -= str_len;
        return 0;
    }

    static int DecodeAmfObject(const uint8_t*& data, size_t& len,
                            std::map<std::string, AMF_ITERM*>& amf_obj, int depth = 0) {
        //amf object: <key: string type> : <value: amf object type>
        while (true) {
            std::string key;
            int ret = DecodeString(data, len, key, false);
            if (ret != 0) {
                return ret;
            }

            if (key.empty()) {
                if ((len < 1) || ((AMF_DATA_TYPE)data[0] != AMF_DATA_TYPE_OBJECT_END)) {
                    return -1;
                }
                data++;
                len--;
                break;
            }

            AMF_ITERM* amf_item = new AMF_ITERM();
            ret = Decode(data, len, *amf_item, depth + 1);
            if (ret != 0) {
                delete amf_item;
                return ret;
            }
            auto iter = amf_obj.find(key);
            if (iter != amf_obj.end()) {
                delete iter->second;
                amf_obj.erase(iter);
            }
            amf_obj.insert(std::make_pair(key, amf_item));
        }
        return 0;
    }

    static int DecodeAmfArray(const uint8_t*& data, size_t& len,
                        std::vector<AMF_ITERM*>& amf_array, int depth = 0) {
        if (len < 4) {
            return -1;
        }
        uint32_t array_len = ByteStream::Read4Bytes(data);
        data += 4;
        len -= 4;

        for (uint32_t index = 0; index < array_len; index++) {
            AMF_ITERM* item = new AMF_ITERM();
            int ret = Decode(data, len, *item, depth + 1);
            if (ret != 0) {
                delete item;
                return ret;
            }
            amf_array.push_back(item);
        }
        return 0;
    }
};

}
#endif
