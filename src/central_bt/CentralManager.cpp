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
#include <jau/basic_types.hpp>

#include "CentralManager.hpp"

using namespace central_bt;

template<typename T>
static std::shared_ptr<T> requireNonNull(std::shared_ptr<T> p, const std::string& name) {
    if( nullptr == p ) {
        throw jau::IllegalArgumentException("CentralManager: "+name+" is null", E_FILE_LINE);
    }
    return p;
}

CentralManager::CentralManager(RadioManagerRef radio_, DeadlineSchedulerRef timers_)
: env(CentralEnv::get()),
  mtx_central(),
  radio( requireNonNull(std::move(radio_), "RadioManager") ),
  timers( requireNonNull(std::move(timers_), "DeadlineScheduler") ),
  gate(mtx_central),
  scanCoordinator(mtx_central, *radio, *timers, gate, env.DEBUG_EVENT),
  connectCoordinator(mtx_central, *radio, *timers, gate, env.DEBUG_EVENT),
  disconnectCoordinator(mtx_central, *radio, *timers, gate, env.DEBUG_EVENT),
  dispatcher( std::make_shared<EventDispatcher>(mtx_central, gate, scanCoordinator, connectCoordinator, disconnectCoordinator,
                                                env.DEBUG_EVENT, env.FAIL_PENDING_ON_STATE_LOSS) ),
  closed(false)
{
    radio->setEventListener(dispatcher);
    WORDY_PRINT("CentralManager.ctor: %s", toString().c_str());
}

CentralManager::CentralManager(RadioManagerRef radio_)
: CentralManager(std::move(radio_), std::make_shared<DeadlineTimer>())
{ }

CentralManager::~CentralManager() noexcept {
    DBG_PRINT("CentralManager.dtor: %s", toString().c_str());
    close();
    // A deadline action already running may still wait for the central lock.
    try {
        timers->join();
    } catch (std::exception &e) {
        ERR_PRINT("CentralManager.dtor: DeadlineScheduler join: Caught exception %s", e.what());
    }
}

void CentralManager::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        return;
    }
    closed = true;
    dispatcher->close();
    try {
        radio->setEventListener(nullptr);
    } catch (std::exception &e) {
        ERR_PRINT("CentralManager::close: setEventListener: Caught exception %s", e.what());
    }
    // Does not wait for a running deadline action, which is joined by the destructor.
    try {
        timers->stop();
    } catch (std::exception &e) {
        ERR_PRINT("CentralManager::close: DeadlineScheduler stop: Caught exception %s", e.what());
    }
    const ReadinessState state = gate.getState();
    const size_t g = gate.close();
    if( scanCoordinator.isScanning() ) {
        scanCoordinator.stop();
    }
    const size_t c = connectCoordinator.resolveAll(
            CentralError::operationTerminatedUnexpectedly(connectCoordinator.getOperationName(), state) );
    const size_t d = disconnectCoordinator.resolveAll(
            CentralError::operationTerminatedUnexpectedly(disconnectCoordinator.getOperationName(), state) );
    DBG_PRINT("CentralManager::close: Terminated %zu readiness waiters, %zu connect and %zu disconnect requests", g, c, d);
}

bool CentralManager::isClosed() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return closed;
}

void CentralManager::checkOpen(const std::string& op) const {
    if( closed ) {
        throw jau::IllegalStateException("CentralManager::"+op+": Closed", E_FILE_LINE);
    }
}

void CentralManager::observeReadiness(ReadinessCallback cb) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    checkOpen("observeReadiness");
    gate.observeState(std::move(cb));
}

void CentralManager::ensureReady(CompletionCallback cb) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    checkOpen("ensureReady");
    gate.ensureReady(std::move(cb));
}

void CentralManager::scan(const jau::fraction_i64& timeout, const ScanFilter& filter, ScanCallback cb) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    checkOpen("scan");
    scanCoordinator.scan(timeout, filter, std::move(cb));
}

void CentralManager::scan(const ScanFilter& filter, ScanCallback cb) {
    scan(env.SCAN_TIMEOUT, filter, std::move(cb));
}

void CentralManager::stopScan(const CentralError& error) noexcept {
    scanCoordinator.stop(error);
}

void CentralManager::connect(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    checkOpen("connect");
    connectCoordinator.request(target, timeout, std::move(cb));
}

void CentralManager::connect(const PeripheralId& target, CompletionCallback cb) {
    connect(target, env.CONNECT_TIMEOUT, std::move(cb));
}

void CentralManager::disconnect(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    checkOpen("disconnect");
    disconnectCoordinator.request(target, timeout, std::move(cb));
}

void CentralManager::disconnect(const PeripheralId& target, CompletionCallback cb) {
    disconnect(target, env.DISCONNECT_TIMEOUT, std::move(cb));
}

std::string CentralManager::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    return "CentralManager["+gate.toString()+", "+scanCoordinator.toString()+
           ", connect "+std::to_string(connectCoordinator.pendingCount())+
           ", disconnect "+std::to_string(disconnectCoordinator.pendingCount())+
           ", closed "+std::to_string(closed)+", radio "+radio->toString()+"]";
}
