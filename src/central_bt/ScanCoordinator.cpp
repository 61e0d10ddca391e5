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

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "ScanCoordinator.hpp"

using namespace central_bt;

std::string ScanEvent::getTypeString(const Type type) noexcept {
    switch(type) {
        case Type::STARTED: return "STARTED";
        case Type::RESULT: return "RESULT";
        case Type::STOPPED: return "STOPPED";
    }
    return "Unknown ScanEvent::Type "+std::to_string(static_cast<int>(type));
}

std::string ScanEvent::toString() const noexcept {
    switch(type) {
        case Type::RESULT:
            return "ScanEvent[RESULT, "+peripheral.toString()+", rssi "+std::to_string(rssi)+", "+advertisement.toString()+"]";
        case Type::STOPPED:
            return "ScanEvent[STOPPED, "+error.toString()+"]";
        default:
            return "ScanEvent["+getTypeString(type)+"]";
    }
}

ScanCoordinator::ScanCoordinator(std::recursive_mutex & mtx_central_, RadioManager & radio_, DeadlineScheduler & timers_,
                                 ReadinessGate & gate_, const bool debug_event_) noexcept
: mtx_central(mtx_central_), radio(radio_), timers(timers_), gate(gate_), debug_event(debug_event_),
  next_token(0), active(nullptr)
{ }

void ScanCoordinator::invoke(ScanCallback& cb, const ScanEvent& event) noexcept {
    try {
        cb(event);
    } catch (std::exception &e) {
        ERR_PRINT("ScanCoordinator::CB:%s: Caught exception %s", event.toString().c_str(), e.what());
    }
}

void ScanCoordinator::scan(const jau::fraction_i64& timeout, const ScanFilter& filter, ScanCallback cb) {
    if( jau::fractions_i64::zero >= timeout ) {
        throw jau::IllegalArgumentException("Non-positive scan timeout "+timeout.to_string(), E_FILE_LINE);
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    gate.ensureReady( [this, timeout, filter, cb](const CentralError& error) {
        if( error ) {
            DBG_PRINT("ScanCoordinator::scan: Not ready: %s", error.toString().c_str());
            ScanCallback cb2 = cb;
            invoke(cb2, ScanEvent::stopped(error));
            return;
        }
        start(timeout, filter, cb);
    }, "scan" );
}

void ScanCoordinator::start(const jau::fraction_i64& timeout, const ScanFilter& filter, ScanCallback cb) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor

    // The replaced scan's callback may start yet another scan, hence loop until idle.
    while( nullptr != active ) {
        std::unique_ptr<ScanRequest> old = std::move(active);
        DBG_PRINT("ScanCoordinator::start: Replacing active scan, token %" PRIu64, old->token);
        timers.cancel(old->timer);
        try {
            radio.stopScan();
        } catch (std::exception &e) {
            ERR_PRINT("ScanCoordinator::start: stopScan: Caught exception %s", e.what());
        }
        invoke(old->callback, ScanEvent::stopped(CentralError()));
    }

    const uint64_t token = ++next_token;
    active = std::make_unique<ScanRequest>(ScanRequest{token, DeadlineScheduler::INVALID_ID, cb});
    {
        ScanCallback cb2 = cb;
        invoke(cb2, ScanEvent::started());
    }
    if( nullptr == active || token != active->token ) {
        DBG_PRINT("ScanCoordinator::start: Scan %" PRIu64 " ended within STARTED callback", token);
        return;
    }
    try {
        radio.startScan(filter);
    } catch (std::exception &e) {
        ERR_PRINT("ScanCoordinator::start: startScan %s: Caught exception %s", filter.toString().c_str(), e.what());
        if( nullptr != active && token == active->token ) {
            stop( CentralError::resourceError("scan", std::make_error_code(std::errc::io_error)) );
        }
        return;
    }
    if( nullptr == active || token != active->token ) {
        return;
    }
    const DeadlineScheduler::timer_id_t timer = timers.schedule(timeout, [this, token]() { onDeadline(token); });
    if( nullptr != active && token == active->token ) {
        active->timer = timer;
    } else {
        timers.cancel(timer);
    }
    COND_PRINT(debug_event, "ScanCoordinator::start: Scan %" PRIu64 " active, timeout %s, %s",
            token, timeout.to_string().c_str(), filter.toString().c_str());
}

void ScanCoordinator::stop(const CentralError& error) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    std::unique_ptr<ScanRequest> req = std::move(active);
    try {
        radio.stopScan();
    } catch (std::exception &e) {
        ERR_PRINT("ScanCoordinator::stop: stopScan: Caught exception %s", e.what());
    }
    if( nullptr == req ) {
        return;
    }
    timers.cancel(req->timer);
    COND_PRINT(debug_event, "ScanCoordinator::stop: Scan %" PRIu64 " stopped: %s", req->token, error.toString().c_str());
    invoke(req->callback, ScanEvent::stopped(error));
}

void ScanCoordinator::onDeadline(const uint64_t token) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( nullptr == active || token != active->token ) {
        COND_PRINT(debug_event, "ScanCoordinator::onDeadline: Stale scan %" PRIu64 ", dropped", token);
        return;
    }
    active->timer = DeadlineScheduler::INVALID_ID; // fired
    stop();
}

void ScanCoordinator::onDiscovered(const PeripheralId& target, const AdvertisementReport& ad, const int8_t rssi) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( nullptr == active ) {
        COND_PRINT(debug_event, "ScanCoordinator::onDiscovered: Not scanning, dropped %s", target.toString().c_str());
        return;
    }
    ScanCallback cb = active->callback;
    invoke(cb, ScanEvent::result(target, ad, rssi));
}

bool ScanCoordinator::isScanning() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return nullptr != active;
}

std::string ScanCoordinator::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( nullptr == active ) {
        return "ScanCoordinator[idle]";
    }
    return "ScanCoordinator[active, token "+std::to_string(active->token)+", timer "+std::to_string(active->timer)+"]";
}
