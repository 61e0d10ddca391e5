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
#include <jau/basic_algos.hpp>

#include "EventDispatcher.hpp"

using namespace central_bt;

std::string central_bt::to_string(const CentralEvent v) noexcept {
    switch(v) {
        case CentralEvent::STATE_CHANGE: return "STATE_CHANGE";
        case CentralEvent::WILL_RESTORE_STATE: return "WILL_RESTORE_STATE";
    }
    return "Unknown CentralEvent "+jau::to_hexstring(number(v));
}

EventDispatcher::statusListenerList_t::equal_comparator EventDispatcher::statusListenerRefEqComparator =
        [](const CentralStatusListenerRef &a, const CentralStatusListenerRef &b) -> bool { return *a == *b; };

EventDispatcher::EventDispatcher(std::recursive_mutex & mtx_central_, ReadinessGate & gate_,
                                 ScanCoordinator & scanCoordinator_, ConnectCoordinator & connectCoordinator_,
                                 DisconnectCoordinator & disconnectCoordinator_,
                                 const bool debug_event_, const bool failPendingOnStateLoss_) noexcept
: mtx_central(mtx_central_), gate(gate_),
  scanCoordinator(scanCoordinator_), connectCoordinator(connectCoordinator_), disconnectCoordinator(disconnectCoordinator_),
  debug_event(debug_event_), failPendingOnStateLoss(failPendingOnStateLoss_), closed(false),
  statusListenerList()
{ }

void EventDispatcher::stateChanged(const ReadinessState newState) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        COND_PRINT(debug_event, "EventDispatcher::stateChanged: Closed, dropped %s", to_string(newState).c_str());
        return;
    }
    const ReadinessState oldState = gate.getState();
    COND_PRINT(debug_event, "EventDispatcher::stateChanged: %s -> %s", to_string(oldState).c_str(), to_string(newState).c_str());

    sendStateChanged(newState, jau::getCurrentMilliseconds());
    gate.onStateChanged(newState);

    if( ReadinessState::POWERED_ON != newState ) {
        if( scanCoordinator.isScanning() ) {
            scanCoordinator.stop( CentralError::scanTerminatedUnexpectedly(newState) );
        }
        if( failPendingOnStateLoss ) {
            const size_t c = connectCoordinator.resolveAll(
                    CentralError::operationTerminatedUnexpectedly(connectCoordinator.getOperationName(), newState) );
            const size_t d = disconnectCoordinator.resolveAll(
                    CentralError::operationTerminatedUnexpectedly(disconnectCoordinator.getOperationName(), newState) );
            if( 0 < c + d ) {
                WORDY_PRINT("EventDispatcher::stateChanged: %s: Terminated %zu connect and %zu disconnect requests",
                        to_string(newState).c_str(), c, d);
            }
        }
    }
}

void EventDispatcher::connected(const PeripheralId& target) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    COND_PRINT(debug_event, "EventDispatcher::connected: %s", target.toString().c_str());
    if( closed ) {
        return;
    }
    connectCoordinator.onConnected(target);
}

void EventDispatcher::disconnected(const PeripheralId& target, const std::error_code& error) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    COND_PRINT(debug_event, "EventDispatcher::disconnected: %s, error %d", target.toString().c_str(), error.value());
    if( closed ) {
        return;
    }
    disconnectCoordinator.onDisconnected(target, error);
}

void EventDispatcher::failedToConnect(const PeripheralId& target, const std::error_code& error) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    COND_PRINT(debug_event, "EventDispatcher::failedToConnect: %s, error %d", target.toString().c_str(), error.value());
    if( closed ) {
        return;
    }
    connectCoordinator.onFailedToConnect(target, error);
}

void EventDispatcher::discovered(const PeripheralId& target, const AdvertisementReport& ad, const int8_t rssi) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        return;
    }
    scanCoordinator.onDiscovered(target, ad, rssi);
}

void EventDispatcher::willRestoreState(const RestoreState& payload) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    COND_PRINT(debug_event, "EventDispatcher::willRestoreState: %s", payload.toString().c_str());
    if( closed ) {
        return;
    }
    sendWillRestoreState(payload, jau::getCurrentMilliseconds());
}

void EventDispatcher::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_central); // RAII-style acquire and relinquish via destructor
    closed = true;
}

void EventDispatcher::sendStateChanged(const ReadinessState state, const uint64_t timestamp) noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](CentralStatusListenerRef &l) {
        try {
            l->centralStateChanged(state, timestamp);
        } catch (std::exception &e) {
            ERR_PRINT("EventDispatcher::CB:%s-CBs %d/%zd: %s: Caught exception %s",
                    to_string(CentralEvent::STATE_CHANGE).c_str(), i+1, statusListenerList.size(),
                    l->toString().c_str(), e.what());
        }
        i++;
    });
}

void EventDispatcher::sendWillRestoreState(const RestoreState& payload, const uint64_t timestamp) noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](CentralStatusListenerRef &l) {
        try {
            l->willRestoreState(payload, timestamp);
        } catch (std::exception &e) {
            ERR_PRINT("EventDispatcher::CB:%s-CBs %d/%zd: %s: Caught exception %s",
                    to_string(CentralEvent::WILL_RESTORE_STATE).c_str(), i+1, statusListenerList.size(),
                    l->toString().c_str(), e.what());
        }
        i++;
    });
}

bool EventDispatcher::addStatusListener(const CentralStatusListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("CentralStatusListener ref is null");
        return false;
    }
    const bool added = statusListenerList.push_back_unique(l, statusListenerRefEqComparator);
    DBG_PRINT("EventDispatcher::addStatusListener: added %d, %s", added, l->toString().c_str());
    return added;
}

bool EventDispatcher::removeStatusListener(const CentralStatusListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("CentralStatusListener ref is null");
        return false;
    }
    const size_type count = statusListenerList.erase_matching(l, false /* all_matching */, statusListenerRefEqComparator);
    DBG_PRINT("EventDispatcher::removeStatusListener: res %d, %s", count>0, l->toString().c_str());
    return count > 0;
}

EventDispatcher::size_type EventDispatcher::removeAllStatusListener() noexcept {
    const size_type count = statusListenerList.size();
    statusListenerList.clear();
    return count;
}

std::string EventDispatcher::toString() const noexcept {
    return "EventDispatcher[listener "+std::to_string(statusListenerList.size())+
           ", failPendingOnStateLoss "+std::to_string(failPendingOnStateLoss.load())+"]";
}
