#ifndef TIMER_HPP
#define TIMER_HPP
#include <uv.h>
#include <stdint.h>

namespace cpp_rtmp
{
inline void OnUvTimerCallback(uv_timer_t *handle);

inline void OnUvTimerClose(uv_handle_t *handle) {
    delete (uv_timer_t*)handle;
}

// repeat_ms 0 makes a one-shot timer
class TimerInterface
{
friend void OnUvTimerCallback(uv_timer_t *handle);

public:
    TimerInterface(uv_loop_t* loop, uint32_t timeout_ms, uint32_t repeat_ms = 0):timeout_ms_(timeout_ms)
        , repeat_ms_(repeat_ms)
    {
        timer_ = new uv_timer_t;
        uv_timer_init(loop, timer_);
        timer_->data = this;
    }

    virtual ~TimerInterface() {
        StopTimer();
        timer_->data = nullptr;
        // the handle must outlive the close request, it is freed in the callback
        uv_close((uv_handle_t*)timer_, OnUvTimerClose);
    }

public:
    virtual void OnTimer() = 0;

public:
    void StartTimer() {
        if(running_) {
            return;
        }
        running_ = true;
        uv_timer_start(timer_, OnUvTimerCallback, timeout_ms_, repeat_ms_);
    }

    void StopTimer() {
        if (!running_) {
            return;
        }
        running_ = false;
        uv_timer_stop(timer_);
    }

    bool IsRunning() {
        return running_;
    }

private:
    uv_timer_t* timer_ = nullptr;
    uint32_t timeout_ms_;
    uint32_t repeat_ms_;
    bool running_ = false;
};

inline void OnUvTimerCallback(uv_timer_t *handle) {
    TimerInterface* timer = (TimerInterface*)handle->data;
    if (timer && timer->running_) {
        if (timer->repeat_ms_ == 0) {
            timer->running_ = false;
        }
        timer->OnTimer();
    }
}

}
#endif
