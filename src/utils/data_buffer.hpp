#ifndef DATA_BUFFER_H
#define DATA_BUFFER_H
#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <string>
#include <memory>

#define EXTRA_LEN (10*1024)

#define PRE_RESERVE_HEADER_SIZE 200

namespace cpp_rtmp
{
class DataBuffer
{
public:
    DataBuffer(size_t data_size = EXTRA_LEN)
    {
        buffer_size_ = data_size + PRE_RESERVE_HEADER_SIZE;
        buffer_      = new char[buffer_size_];
        start_       = PRE_RESERVE_HEADER_SIZE;
        end_         = PRE_RESERVE_HEADER_SIZE;
        data_len_    = 0;
    }

    DataBuffer(const DataBuffer& input)//deep copy
    {
        buffer_size_ = input.buffer_size_;
        buffer_      = new char[buffer_size_];
        data_len_    = input.data_len_;
        start_       = input.start_;
        end_         = input.end_;

        memcpy(buffer_ + start_, input.buffer_ + input.start_, data_len_);
    }

    DataBuffer& operator=(const DataBuffer& input)//deep copy
    {
        if (this == &input) {
            return *this;
        }
        delete[] buffer_;

        buffer_size_ = input.buffer_size_;
        buffer_      = new char[buffer_size_];
        data_len_    = input.data_len_;
        start_       = input.start_;
        end_         = input.end_;

        memcpy(buffer_ + start_, input.buffer_ + input.start_, data_len_);
        return *this;
    }

    ~DataBuffer()
    {
        if (buffer_) {
            delete[] buffer_;
        }
    }

public:
    size_t AppendData(const char* input_data, size_t input_len) {
        if ((input_data == nullptr) || (input_len == 0)) {
            return data_len_;
        }

        if (end_ + input_len > buffer_size_) {
            if (PRE_RESERVE_HEADER_SIZE + data_len_ + input_len > buffer_size_) {
                size_t new_len = GetNewSize(PRE_RESERVE_HEADER_SIZE + data_len_ + input_len);
                char* new_buffer = new char[new_len];

                memcpy(new_buffer + PRE_RESERVE_HEADER_SIZE, buffer_ + start_, data_len_);
                delete[] buffer_;
                buffer_      = new_buffer;
                buffer_size_ = new_len;
            } else {
                //move the left data to the front
                memmove(buffer_ + PRE_RESERVE_HEADER_SIZE, buffer_ + start_, data_len_);
            }
            start_ = PRE_RESERVE_HEADER_SIZE;
            end_   = start_ + data_len_;
        }
        memcpy(buffer_ + end_, input_data, input_len);
        data_len_ += input_len;
        end_      += input_len;
        return data_len_;
    }

    char* ConsumeData(size_t consume_len) {
        if (consume_len > data_len_) {
            return nullptr;
        }
        start_    += consume_len;
        data_len_ -= consume_len;

        if (data_len_ == 0) {
            start_ = PRE_RESERVE_HEADER_SIZE;
            end_   = PRE_RESERVE_HEADER_SIZE;
        }
        return buffer_ + start_;
    }

    void Reset() {
        start_    = PRE_RESERVE_HEADER_SIZE;
        end_      = PRE_RESERVE_HEADER_SIZE;
        data_len_ = 0;
    }

    char* Data() {
        return buffer_ + start_;
    }
    const char* Data() const {
        return buffer_ + start_;
    }
    size_t DataLen() const {
        return data_len_;
    }
    bool Require(size_t len) const {
        return len <= data_len_;
    }

private:
    static size_t GetNewSize(size_t new_len) {
        size_t ret = new_len;

        if (new_len <= 50*1024) {
            ret = 50*1024;
        } else if (new_len <= 100*1024) {
            ret = 100*1024;
        } else if (new_len <= 200*1024) {
            ret = 200*1024;
        } else if (new_len <= 500*1024) {
            ret = 500*1024;
        } else {
            ret = new_len + EXTRA_LEN;
        }
        return ret;
    }

private:
    char* buffer_       = nullptr;
    size_t buffer_size_ = 0;
    size_t data_len_    = 0;
    size_t start_       = PRE_RESERVE_HEADER_SIZE;
    size_t end_         = PRE_RESERVE_HEADER_SIZE;
};

typedef std::shared_ptr<DataBuffer> DATA_BUFFER_PTR;

}
#endif //DATA_BUFFER_H
