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

#ifndef CBT_CENTRAL_TYPES_HPP_
#define CBT_CENTRAL_TYPES_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <functional>

#include <jau/int_types.hpp>
#include <jau/darray.hpp>
#include <jau/eui48.hpp>
#include <jau/uuid.hpp>

namespace central_bt {

    /** @defgroup CBTUserAPI Central-BT General User Level API
     *  General User level Central-BT API types and functionality.
     *
     *  @{
     */

    /**
     * Readiness state of the radio manager.
     * <p>
     * ReadinessState::UNKNOWN and ReadinessState::RESETTING are transitional,
     * all other states are terminal until changed by the radio manager.
     * </p>
     * <p>
     * The numeric value is the raw state value carried by CentralError::getInvalidState().
     * </p>
     */
    enum class ReadinessState : uint8_t {
        UNKNOWN      = 0,
        RESETTING    = 1,
        UNSUPPORTED  = 2,
        UNAUTHORIZED = 3,
        POWERED_OFF  = 4,
        POWERED_ON   = 5
    };
    constexpr uint8_t number(const ReadinessState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr ReadinessState to_ReadinessState(const uint8_t v) noexcept {
        if( v <= 5 ) {
            return static_cast<ReadinessState>(v);
        }
        return ReadinessState::UNKNOWN;
    }
    /** Returns true if the given state is ReadinessState::UNKNOWN or ReadinessState::RESETTING. */
    constexpr bool isTransitional(const ReadinessState v) noexcept {
        return ReadinessState::UNKNOWN == v || ReadinessState::RESETTING == v;
    }
    std::string to_string(const ReadinessState v) noexcept;

    /**
     * Connection state of a known peripheral as reported by RadioManager::retrieveKnownPeripherals().
     */
    enum class PeripheralState : uint8_t {
        DISCONNECTED  = 0,
        CONNECTING    = 1,
        CONNECTED     = 2,
        DISCONNECTING = 3
    };
    constexpr uint8_t number(const PeripheralState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const PeripheralState v) noexcept;

    enum class PeripheralAddressType : uint8_t {
        /** Bluetooth BR/EDR address */
        BREDR      = 0x00,
        /** Bluetooth LE public address */
        LE_PUBLIC  = 0x01,
        /** Bluetooth LE random address */
        LE_RANDOM  = 0x02,
        /** Undefined */
        UNDEFINED  = 0xff
    };
    constexpr PeripheralAddressType to_PeripheralAddressType(const uint8_t v) noexcept {
        if( v <= 2 ) {
            return static_cast<PeripheralAddressType>(v);
        }
        return PeripheralAddressType::UNDEFINED;
    }
    constexpr uint8_t number(const PeripheralAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const PeripheralAddressType type) noexcept;

    /**
     * Stable identity of a remote peripheral, its EUI48 address and address type.
     * <p>
     * Used as the key of all per-peripheral requests.
     * </p>
     */
    class PeripheralId {
        public:
            jau::EUI48 address;
            PeripheralAddressType type;

            PeripheralId(const jau::EUI48 & address_, PeripheralAddressType type_) noexcept
            : address(address_), type(type_) {}

            /**
             * Parses the given EUI48 string, e.g. `C0:26:DA:01:DA:B1`.
             * @throws jau::IllegalArgumentException if the address string is malformed
             */
            PeripheralId(const std::string & address_, PeripheralAddressType type_)
            : address(address_), type(type_) {}

            PeripheralId() noexcept : address(), type(PeripheralAddressType::UNDEFINED) {}

            PeripheralId(const PeripheralId &o) noexcept = default;
            PeripheralId(PeripheralId &&o) noexcept = default;
            PeripheralId& operator=(const PeripheralId &o) noexcept = default;
            PeripheralId& operator=(PeripheralId &&o) noexcept = default;

            constexpr bool isLEAddress() const noexcept {
                return PeripheralAddressType::LE_PUBLIC == type || PeripheralAddressType::LE_RANDOM == type;
            }

            std::size_t hash_code() const noexcept {
                // 31 * x == (x << 5) - x
                std::size_t h = 31 + address.hash_code();
                h = ((h << 5) - h) + number(type);
                return h;
            }

            std::string toString() const noexcept;
    };
    inline bool operator==(const PeripheralId& lhs, const PeripheralId& rhs) noexcept {
        if( &lhs == &rhs ) {
            return true;
        }
        return lhs.address == rhs.address &&
               lhs.type == rhs.type;
    }
    inline bool operator!=(const PeripheralId& lhs, const PeripheralId& rhs) noexcept
    { return !(lhs == rhs); }

    inline std::string to_string(const PeripheralId& a) noexcept { return a.toString(); }

    typedef std::shared_ptr<const jau::uuid_t> UUIDRef;
    typedef jau::darray<UUIDRef> uuid_list_t;

    /**
     * Discovery filter passed to RadioManager::startScan().
     */
    class ScanFilter {
        public:
            /** Advertised service UUIDs a peripheral must carry to be reported, empty for all peripherals. */
            uuid_list_t services;

            /** Report every advertising packet, not only the first per peripheral. */
            bool allowDuplicates;

            ScanFilter() noexcept : services(), allowDuplicates(false) {}

            ScanFilter(uuid_list_t services_, const bool allowDuplicates_=false) noexcept
            : services(std::move(services_)), allowDuplicates(allowDuplicates_) {}

            bool matchesAll() const noexcept { return 0 == services.size(); }

            std::string toString() const noexcept;
    };

    /**
     * Advertising data of a discovered peripheral, as reported by RadioEventListener::discovered().
     */
    class AdvertisementReport {
        public:
            /** Complete or shortened local name, may be empty. */
            std::string name;
            /** Advertised service UUIDs. */
            uuid_list_t services;
            /** Manufacturer specific data, may be empty. */
            jau::darray<uint8_t> manufacturerData;
            bool connectable;

            AdvertisementReport() noexcept
            : name(), services(), manufacturerData(), connectable(false) {}

            AdvertisementReport(std::string name_, uuid_list_t services_, const bool connectable_) noexcept
            : name(std::move(name_)), services(std::move(services_)), manufacturerData(), connectable(connectable_) {}

            std::string toString() const noexcept;
    };

    /**
     * Radio manager state restored by the system after a process restart,
     * delivered via RadioEventListener::willRestoreState() and passed through
     * to CentralStatusListener::willRestoreState() as is.
     */
    class RestoreState {
        public:
            /** Peripherals the system was connected or connecting to. */
            jau::darray<PeripheralId> peripherals;
            /** Service filter of the scan which was active. */
            uuid_list_t scanServices;

            std::string toString() const noexcept;
    };

    /**
     * A known peripheral and its current PeripheralState.
     */
    struct KnownPeripheral {
        PeripheralId id;
        PeripheralState state;

        std::string toString() const noexcept {
            return "KnownPeripheral["+id.toString()+", "+to_string(state)+"]";
        }
    };

    /**@}*/

} // namespace central_bt

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    template<> struct hash<central_bt::PeripheralId> {
        std::size_t operator()(central_bt::PeripheralId const& a) const noexcept {
            return a.hash_code();
        }
    };

    /**@}*/
}

#endif /* CBT_CENTRAL_TYPES_HPP_ */
