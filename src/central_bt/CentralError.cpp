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
#include <jau/string_util.hpp>

#include "CentralError.hpp"

using namespace central_bt;

#define CENTRALSTATUSCODE_ENUM(X) \
        X(SUCCESS) \
        X(OPERATION_TIMEOUT) \
        X(RESOURCE_ERROR) \
        X(BLUETOOTH_UNSUPPORTED) \
        X(BLUETOOTH_UNAUTHORIZED) \
        X(BLUETOOTH_POWERED_OFF) \
        X(CONNECT_FAILED_UNKNOWN_REASON) \
        X(SCAN_TERMINATED_UNEXPECTEDLY) \
        X(OPERATION_TERMINATED_UNEXPECTEDLY)

#define CENTRALSTATUSCODE_CASE_TO_STRING(V) case CentralStatusCode::V: return #V;

std::string central_bt::to_string(const CentralStatusCode ec) noexcept {
    switch(ec) {
        CENTRALSTATUSCODE_ENUM(CENTRALSTATUSCODE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown CentralStatusCode "+jau::to_hexstring(number(ec));
}

CentralError CentralError::fromReadinessState(const ReadinessState state) noexcept {
    switch(state) {
        case ReadinessState::UNSUPPORTED:
            return CentralError(CentralStatusCode::BLUETOOTH_UNSUPPORTED, std::string(), std::error_code(), number(state));
        case ReadinessState::UNAUTHORIZED:
            return CentralError(CentralStatusCode::BLUETOOTH_UNAUTHORIZED, std::string(), std::error_code(), number(state));
        case ReadinessState::POWERED_OFF:
            return CentralError(CentralStatusCode::BLUETOOTH_POWERED_OFF, std::string(), std::error_code(), number(state));
        default:
            return CentralError();
    }
}

std::string CentralError::toString() const noexcept {
    if( !*this ) {
        return "CentralError[none]";
    }
    std::string res = "CentralError["+to_string(code)+" ("+std::to_string(number(code))+")";
    if( operation.size() > 0 ) {
        res.append(", op '"+operation+"'");
    }
    if( cause ) {
        res.append(", cause "+std::string(cause.category().name())+":"+std::to_string(cause.value())+" "+cause.message());
    }
    if( 0 <= invalid_state ) {
        res.append(", state "+to_string(to_ReadinessState(static_cast<uint8_t>(invalid_state))));
    }
    res.append("]");
    return res;
}
