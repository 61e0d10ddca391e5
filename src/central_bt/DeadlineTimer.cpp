/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2021 Gothel Software e.K.
 * Copyright (c) 2021 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <cstdint>
#include <cinttypes>
#include <algorithm>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "CBTConst.hpp"
#include "DeadlineTimer.hpp"

using namespace central_bt;

DeadlineTimer::DeadlineTimer() noexcept
: deadlines(),
  next_id(INVALID_ID),
  stopping(false),
  worker_id(std::thread::id()),
  timer_service("DeadlineTimer::service", THREAD_SHUTDOWN_TIMEOUT_MS,
                jau::bind_member(this, &DeadlineTimer::timerWork),
                jau::service_runner::Callback() /* init */,
                jau::bind_member(this, &DeadlineTimer::timerEnd))
{
    timer_service.start();
    DBG_PRINT("DeadlineTimer.ctor: %s", toString().c_str());
}

DeadlineTimer::~DeadlineTimer() noexcept {
    DBG_PRINT("DeadlineTimer.dtor: %s", toString().c_str());
    stop();
    join();
}

std::chrono::milliseconds DeadlineTimer::toDelay(const jau::fraction_i64& timeout) noexcept {
    if( timeout >= MAX_DEADLINE_TIMEOUT ) {
        return std::chrono::milliseconds(MAX_DEADLINE_TIMEOUT.to_ms());
    }
    int64_t ms = timeout.to_ms();
    if( jau::fraction_i64(ms, 1000) < timeout ) {
        ++ms; // sub-millisecond remainder
    }
    return std::chrono::milliseconds( std::max<int64_t>(1, ms) );
}

void DeadlineTimer::timerWork(jau::service_runner& sr) noexcept {
    Action action;
    timer_id_t id = INVALID_ID;
    {
        std::unique_lock<std::mutex> lock(mtx_deadlines); // RAII-style acquire and relinquish via destructor
        if( stopping ) {
            sr.set_shall_stop();
            return;
        }
        const clock_t::time_point now = clock_t::now();
        if( 0 == deadlines.size() ) {
            cv_deadlines.wait_for(lock, std::chrono::milliseconds(DEADLINE_IDLE_POLL_TIMEOUT.to_ms()));
            return; // re-evaluate
        }
        if( now < deadlines.front().expiry ) {
            cv_deadlines.wait_until(lock, deadlines.front().expiry);
            return; // re-evaluate, new deadlines might have been added or cancelled
        }
        id = deadlines.front().id;
        action = std::move(deadlines.front().action);
        deadlines.erase(deadlines.begin());
    }
    worker_id = std::this_thread::get_id();
    try {
        action();
    } catch (std::exception &e) {
        ERR_PRINT("DeadlineTimer::timerWork: Deadline %" PRIu64 ": Caught exception %s", id, e.what());
    }
    worker_id = std::thread::id();
}

void DeadlineTimer::timerEnd(jau::service_runner& sr) noexcept {
    (void)sr;
    const std::lock_guard<std::mutex> lock(mtx_deadlines); // RAII-style acquire and relinquish via destructor
    WORDY_PRINT("DeadlineTimer::timerEnd: Discarding %zu deadlines", deadlines.size());
    deadlines.clear();
}

DeadlineScheduler::timer_id_t DeadlineTimer::schedule(const jau::fraction_i64& timeout, Action action) {
    const clock_t::time_point expiry = clock_t::now() + toDelay(timeout);
    timer_id_t id;
    {
        const std::lock_guard<std::mutex> lock(mtx_deadlines); // RAII-style acquire and relinquish via destructor
        if( stopping ) {
            WARN_PRINT("DeadlineTimer::schedule: Stopped, dropping deadline of %s", timeout.to_string().c_str());
            return INVALID_ID;
        }
        id = ++next_id;
        auto it = std::upper_bound(deadlines.begin(), deadlines.end(), expiry,
                                   [](const clock_t::time_point& t, const Deadline& d) -> bool { return t < d.expiry; });
        deadlines.insert(it, Deadline{id, expiry, std::move(action)});
    }
    cv_deadlines.notify_all();
    return id;
}

bool DeadlineTimer::cancel(const timer_id_t id) {
    if( INVALID_ID == id ) {
        return false;
    }
    const std::lock_guard<std::mutex> lock(mtx_deadlines); // RAII-style acquire and relinquish via destructor
    auto it = std::find_if(deadlines.begin(), deadlines.end(),
                           [id](const Deadline& d) -> bool { return id == d.id; });
    if( deadlines.end() == it ) {
        return false;
    }
    deadlines.erase(it);
    return true;
}

void DeadlineTimer::stop() {
    {
        const std::lock_guard<std::mutex> lock(mtx_deadlines); // RAII-style acquire and relinquish via destructor
        stopping = true;
        deadlines.clear();
    }
    cv_deadlines.notify_all();
}

void DeadlineTimer::join() {
    if( std::this_thread::get_id() == worker_id.load() ) {
        // called from within a deadline action, timerWork() ends the service
        return;
    }
    timer_service.stop();
}

size_t DeadlineTimer::pendingCount() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_deadlines); // RAII-style acquire and relinquish via destructor
    return deadlines.size();
}

std::string DeadlineTimer::toString() const noexcept {
    return "DeadlineTimer[next_id "+std::to_string(next_id)+", running "+std::to_string(timer_service.is_running())+
           ", shallStop "+std::to_string(timer_service.shall_stop())+"]";
}
