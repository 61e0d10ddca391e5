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

#include "CentralTypes.hpp"

using namespace central_bt;

#define READINESSSTATE_ENUM(X) \
        X(UNKNOWN) \
        X(RESETTING) \
        X(UNSUPPORTED) \
        X(UNAUTHORIZED) \
        X(POWERED_OFF) \
        X(POWERED_ON)

#define READINESSSTATE_CASE_TO_STRING(V) case ReadinessState::V: return #V;

std::string central_bt::to_string(const ReadinessState v) noexcept {
    switch(v) {
        READINESSSTATE_ENUM(READINESSSTATE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ReadinessState "+jau::to_hexstring(number(v));
}

#define PERIPHERALSTATE_ENUM(X) \
        X(DISCONNECTED) \
        X(CONNECTING) \
        X(CONNECTED) \
        X(DISCONNECTING)

#define PERIPHERALSTATE_CASE_TO_STRING(V) case PeripheralState::V: return #V;

std::string central_bt::to_string(const PeripheralState v) noexcept {
    switch(v) {
        PERIPHERALSTATE_ENUM(PERIPHERALSTATE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown PeripheralState "+jau::to_hexstring(number(v));
}

std::string central_bt::to_string(const PeripheralAddressType type) noexcept {
    switch(type) {
        case PeripheralAddressType::BREDR: return "BDADDR_BREDR";
        case PeripheralAddressType::LE_PUBLIC: return "BDADDR_LE_PUBLIC";
        case PeripheralAddressType::LE_RANDOM: return "BDADDR_LE_RANDOM";
        case PeripheralAddressType::UNDEFINED: return "BDADDR_UNDEFINED";
    }
    return "Unknown PeripheralAddressType "+jau::to_hexstring(number(type));
}

std::string PeripheralId::toString() const noexcept {
    return "["+address.toString()+", "+to_string(type)+"]";
}

static std::string uuid_list_to_string(const uuid_list_t & list) noexcept {
    std::string res("[");
    for(size_t i=0; i<list.size(); ++i) {
        const UUIDRef & u = list[i];
        if( 0 < i ) {
            res.append(", ");
        }
        if( nullptr == u ) {
            res.append("null");
        } else {
            res.append(u->toString());
        }
    }
    res.append("]");
    return res;
}

std::string ScanFilter::toString() const noexcept {
    return "ScanFilter[services "+uuid_list_to_string(services)+
           ", duplicates "+std::to_string(allowDuplicates)+"]";
}

std::string AdvertisementReport::toString() const noexcept {
    return "AdvertisementReport[name '"+name+"', services "+uuid_list_to_string(services)+
           ", msd "+std::to_string(manufacturerData.size())+" bytes, connectable "+std::to_string(connectable)+"]";
}

std::string RestoreState::toString() const noexcept {
    std::string res("RestoreState[peripherals [");
    for(size_t i=0; i<peripherals.size(); ++i) {
        if( 0 < i ) {
            res.append(", ");
        }
        res.append(peripherals[i].toString());
    }
    res.append("], scan services "+uuid_list_to_string(scanServices)+"]");
    return res;
}
