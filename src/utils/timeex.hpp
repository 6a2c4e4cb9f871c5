#ifndef TIME_EX_HPP
#define TIME_EX_HPP
#include <stdint.h>
#include <stdio.h>
#include <time.h>
#include <sys/time.h>
#include <string>

namespace cpp_rtmp
{

inline int64_t now_millisec() {
    struct timeval tv;

    gettimeofday(&tv, nullptr);
    return (int64_t)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

//format: 2024-05-01 12:00:00.123
inline std::string get_now_str() {
    struct timeval tv;
    struct tm tm_now;
    char dscr[64];

    gettimeofday(&tv, nullptr);
    time_t sec = tv.tv_sec;
    localtime_r(&sec, &tm_now);

    snprintf(dscr, sizeof(dscr), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
            tm_now.tm_year + 1900, tm_now.tm_mon + 1, tm_now.tm_mday,
            tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec,
            (int)(tv.tv_usec / 1000));
    return std::string(dscr);
}

}
#endif //TIME_EX_HPP
