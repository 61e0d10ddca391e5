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

#include "PeripheralCoordinator.hpp"

using namespace central_bt;

PeripheralCoordinator::PeripheralCoordinator(std::string operationName_,
                                             std::recursive_mutex & mtx_central_, RadioManager & radio_, DeadlineScheduler & timers_,
                                             ReadinessGate & gate_, const bool debug_event_) noexcept
: operationName(std::move(operationName_)), next_token(0), requests(),
  mtx_central(mtx_central_), radio(radio_), timers(timers_), gate(gate_), debug_event(debug_event_)
{ }

void PeripheralCoordinator::invoke(CompletionCallback& cb, const CentralError& error, const std::string& op,
                                   const PeripheralId& target, const size_t idx, const size_t count) noexcept {
    try {
        cb(error);
    } catch (std::exception &e) {
        ERR_PRINT("PeripheralCoordinator::CB:%s-CBs %zu/%zu: %s, %s: Caught exception %s",
                op.c_str(), idx+1, count, target.toString().c_str(), error.toString().c_str(), e.what());
    }
}

void PeripheralCoordinator::request(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb) {
    if( jau::fractions_i64::zero >= timeout ) {
        throw jau::IllegalArgumentException(operationName+": Non-positive timeout "+timeout.to_string(), E_FILE_LINE);
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    gate.ensureReady( [this, target, timeout, cb](const CentralError& error) {
        if( error ) {
            DBG_PRINT("PeripheralCoordinator::request: %s %s: Not ready: %s",
                    operationName.c_str(), target.toString().c_str(), error.toString().c_str());
            CompletionCallback cb2 = cb;
            invoke(cb2, error, operationName, target, 0, 1);
            return;
        }
        admit(target, timeout, cb);
    }, operationName );
}

void PeripheralCoordinator::admit(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor

    // one-time already satisfied check
    try {
        jau::darray<PeripheralId> ids;
        ids.push_back(target);
        const jau::darray<KnownPeripheral> known = radio.retrieveKnownPeripherals(ids);
        for(size_t i=0; i<known.size(); ++i) {
            if( known[i].id == target && isSatisfied(known[i].state) ) {
                COND_PRINT(debug_event, "PeripheralCoordinator::admit: %s %s: Already satisfied, %s",
                        operationName.c_str(), target.toString().c_str(), to_string(known[i].state).c_str());
                invoke(cb, CentralError(), operationName, target, 0, 1);
                return;
            }
        }
    } catch (std::exception &e) {
        ERR_PRINT("PeripheralCoordinator::admit: %s %s: retrieveKnownPeripherals: Caught exception %s",
                operationName.c_str(), target.toString().c_str(), e.what());
    }

    auto it = requests.find(target);
    if( requests.end() != it ) {
        it->second->waiters.push_back(std::move(cb));
        COND_PRINT(debug_event, "PeripheralCoordinator::admit: %s %s: Joined request %" PRIu64 ", waiter %zu",
                operationName.c_str(), target.toString().c_str(), it->second->token, it->second->waiters.size());
        return;
    }

    const uint64_t token = ++next_token;
    {
        std::unique_ptr<PeripheralRequest> req = std::make_unique<PeripheralRequest>();
        req->target = target;
        req->token = token;
        req->timer = DeadlineScheduler::INVALID_ID;
        req->waiters.push_back(std::move(cb));
        requests[target] = std::move(req);
    }
    COND_PRINT(debug_event, "PeripheralCoordinator::admit: %s %s: New request %" PRIu64 ", timeout %s",
            operationName.c_str(), target.toString().c_str(), token, timeout.to_string().c_str());

    try {
        issueCommand(target);
    } catch (std::exception &e) {
        ERR_PRINT("PeripheralCoordinator::admit: %s %s: Command: Caught exception %s",
                operationName.c_str(), target.toString().c_str(), e.what());
        resolve(target, CentralError::resourceError(operationName, std::make_error_code(std::errc::io_error)));
        return;
    }

    // The command may have completed synchronously, resolving or replacing the request.
    it = requests.find(target);
    if( requests.end() == it || token != it->second->token ) {
        return;
    }
    const DeadlineScheduler::timer_id_t timer = timers.schedule(timeout, [this, target, token]() { onDeadline(target, token); });
    it = requests.find(target);
    if( requests.end() != it && token == it->second->token ) {
        it->second->timer = timer;
    } else {
        timers.cancel(timer);
    }
}

void PeripheralCoordinator::onDeadline(const PeripheralId& target, const uint64_t token) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    auto it = requests.find(target);
    if( requests.end() == it || token != it->second->token ) {
        COND_PRINT(debug_event, "PeripheralCoordinator::onDeadline: %s %s: Stale request %" PRIu64 ", dropped",
                operationName.c_str(), target.toString().c_str(), token);
        return;
    }
    it->second->timer = DeadlineScheduler::INVALID_ID; // fired
    WORDY_PRINT("PeripheralCoordinator::onDeadline: %s %s: Timeout of request %" PRIu64,
            operationName.c_str(), target.toString().c_str(), token);
    resolve(target, CentralError::operationTimeout(operationName));
}

bool PeripheralCoordinator::resolve(const PeripheralId& target, const CentralError& error) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    auto it = requests.find(target);
    if( requests.end() == it ) {
        COND_PRINT(debug_event, "PeripheralCoordinator::resolve: %s %s: No pending request, dropped %s",
                operationName.c_str(), target.toString().c_str(), error.toString().c_str());
        return false;
    }
    std::unique_ptr<PeripheralRequest> req = std::move(it->second);
    requests.erase(it);
    timers.cancel(req->timer);

    const size_t count = req->waiters.size();
    COND_PRINT(debug_event, "PeripheralCoordinator::resolve: %s %s: Request %" PRIu64 ", %zu waiters: %s",
            operationName.c_str(), target.toString().c_str(), req->token, count, error.toString().c_str());
    for(size_t i=0; i<count; ++i) {
        invoke(req->waiters[i], error, operationName, req->target, i, count);
    }
    return true;
}

size_t PeripheralCoordinator::resolveAll(const CentralError& error) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    jau::darray<PeripheralId> targets;
    for(const auto& e : requests) {
        targets.push_back(e.first);
    }
    size_t count = 0;
    for(size_t i=0; i<targets.size(); ++i) {
        if( resolve(targets[i], error) ) {
            ++count;
        }
    }
    return count;
}

size_t PeripheralCoordinator::pendingCount() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return requests.size();
}

bool PeripheralCoordinator::isPending(const PeripheralId& target) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return requests.end() != requests.find(target);
}

size_t PeripheralCoordinator::waiterCount(const PeripheralId& target) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    auto it = requests.find(target);
    if( requests.end() == it ) {
        return 0;
    }
    return it->second->waiters.size();
}

std::string PeripheralCoordinator::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return "PeripheralCoordinator['"+operationName+"', pending "+std::to_string(requests.size())+"]";
}
