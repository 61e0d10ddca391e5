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

#include <jau/debug.hpp>

#include "ReadinessGate.hpp"

using namespace central_bt;

ReadinessGate::ReadinessGate(std::recursive_mutex & mtx_central_) noexcept
: mtx_central(mtx_central_), state(ReadinessState::UNKNOWN), closed(false), pending()
{ }

void ReadinessGate::invoke(Waiter& w, const ReadinessState s, const size_t idx, const size_t count) noexcept {
    try {
        if( !w.completion ) {
            w.observer(s);
        } else if( closed ) {
            w.outcome( CentralError::operationTerminatedUnexpectedly(w.operation, s) );
        } else {
            w.outcome( CentralError::fromReadinessState(s) );
        }
    } catch (std::exception &e) {
        ERR_PRINT("ReadinessGate::CB:StateResolved-CBs %zu/%zu: %s: Caught exception %s",
                idx+1, count, to_string(s).c_str(), e.what());
    }
}

ReadinessState ReadinessGate::getState() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return state;
}

void ReadinessGate::observeState(ReadinessCallback cb) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    Waiter w { false, std::string(), std::move(cb), CompletionCallback() };
    if( !closed && isTransitional(state) ) {
        pending.push_back(std::move(w));
        DBG_PRINT("ReadinessGate::observeState: %s, queued %zu", to_string(state).c_str(), pending.size());
        return;
    }
    invoke(w, state, 0, 1);
}

void ReadinessGate::ensureReady(CompletionCallback cb, const std::string& operation) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    Waiter w { true, operation, ReadinessCallback(), std::move(cb) };
    if( !closed && isTransitional(state) ) {
        pending.push_back(std::move(w));
        DBG_PRINT("ReadinessGate::ensureReady: %s: %s, queued %zu", operation.c_str(), to_string(state).c_str(), pending.size());
        return;
    }
    invoke(w, state, 0, 1);
}

void ReadinessGate::onStateChanged(const ReadinessState newState) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        DBG_PRINT("ReadinessGate::onStateChanged: Closed, dropped %s", to_string(newState).c_str());
        return;
    }
    const ReadinessState oldState = state;
    state = newState;
    DBG_PRINT("ReadinessGate::onStateChanged: %s -> %s, pending %zu",
            to_string(oldState).c_str(), to_string(newState).c_str(), pending.size());
    if( isTransitional(newState) ) {
        return;
    }
    jau::darray<Waiter> drained;
    drained.swap(pending);
    const size_t count = drained.size();
    for(size_t i=0; i<count; ++i) {
        invoke(drained[i], newState, i, count);
    }
}

size_t ReadinessGate::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        return 0;
    }
    closed = true;
    jau::darray<Waiter> drained;
    drained.swap(pending);
    const size_t count = drained.size();
    DBG_PRINT("ReadinessGate::close: %s, pending %zu", to_string(state).c_str(), count);
    for(size_t i=0; i<count; ++i) {
        invoke(drained[i], state, i, count);
    }
    return count;
}

bool ReadinessGate::isClosed() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return closed;
}

size_t ReadinessGate::pendingCount() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return pending.size();
}

std::string ReadinessGate::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return "ReadinessGate["+to_string(state)+", pending "+std::to_string(pending.size())+", closed "+std::to_string(closed)+"]";
}
