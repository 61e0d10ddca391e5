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

#include "DisconnectCoordinator.hpp"

using namespace central_bt;

DisconnectCoordinator::DisconnectCoordinator(std::recursive_mutex & mtx_central_, RadioManager & radio_, DeadlineScheduler & timers_,
                                             ReadinessGate & gate_, const bool debug_event_) noexcept
: PeripheralCoordinator("disconnect peripheral", mtx_central_, radio_, timers_, gate_, debug_event_)
{ }

bool DisconnectCoordinator::isSatisfied(const PeripheralState state) const noexcept {
    return PeripheralState::DISCONNECTED == state || PeripheralState::DISCONNECTING == state;
}

void DisconnectCoordinator::issueCommand(const PeripheralId& target) {
    radio.cancelConnection(target);
}

void DisconnectCoordinator::onDisconnected(const PeripheralId& target, const std::error_code& error) noexcept {
    if( error ) {
        resolve(target, CentralError::resourceError(getOperationName(), error));
    } else {
        resolve(target, CentralError());
    }
}
