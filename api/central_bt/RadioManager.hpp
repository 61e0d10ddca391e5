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

#ifndef CBT_RADIO_MANAGER_HPP_
#define CBT_RADIO_MANAGER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <system_error>

#include <jau/darray.hpp>

#include "CentralTypes.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Receiver of the asynchronous notifications of a RadioManager.
     * <p>
     * Notifications may arrive on any thread, late or not at all.
     * </p>
     */
    class RadioEventListener {
        public:
            /** The readiness state of the radio manager has changed. */
            virtual void stateChanged(const ReadinessState newState) = 0;

            /** Connection to the given peripheral has been established. */
            virtual void connected(const PeripheralId& target) = 0;

            /**
             * Connection to the given peripheral has been torn down.
             * @param target the disconnected peripheral
             * @param error the underlying radio error, empty if disconnected as requested
             */
            virtual void disconnected(const PeripheralId& target, const std::error_code& error) = 0;

            /**
             * Connection attempt to the given peripheral has failed.
             * @param target the peripheral
             * @param error the underlying radio error, may be empty if the radio gives no reason
             */
            virtual void failedToConnect(const PeripheralId& target, const std::error_code& error) = 0;

            /** An advertising peripheral has been discovered while scanning. */
            virtual void discovered(const PeripheralId& target, const AdvertisementReport& ad, const int8_t rssi) = 0;

            /** The system restored the radio manager state, e.g. after a process restart. */
            virtual void willRestoreState(const RestoreState& payload) = 0;

            virtual std::string toString() const noexcept = 0;

            virtual ~RadioEventListener() noexcept = default;
    };
    typedef std::shared_ptr<RadioEventListener> RadioEventListenerRef;

    /**
     * Abstract radio manager, the single shared hardware resource driven by CentralManager.
     * <p>
     * All commands complete asynchronously and report via the attached RadioEventListener.
     * Commands are issued while CentralManager holds its serialization lock,
     * hence implementations shall not block on a thread waiting for CentralManager.
     * </p>
     */
    class RadioManager {
        public:
            /**
             * Attaches the receiver of all notifications, replacing any previous one.
             * @param l the listener, nullptr to detach
             */
            virtual void setEventListener(const RadioEventListenerRef& l) = 0;

            /** Start discovery using the given filter. */
            virtual void startScan(const ScanFilter& filter) = 0;

            /** Stop discovery. Harmless if not scanning. */
            virtual void stopScan() = 0;

            /** Start connecting to the given peripheral. */
            virtual void connect(const PeripheralId& target) = 0;

            /** Cancel an established or pending connection to the given peripheral. */
            virtual void cancelConnection(const PeripheralId& target) = 0;

            /**
             * Returns the known peripherals and their current state matching the given identifiers.
             * <p>
             * Unknown identifiers are not included.
             * </p>
             */
            virtual jau::darray<KnownPeripheral> retrieveKnownPeripherals(const jau::darray<PeripheralId>& ids) = 0;

            virtual std::string toString() const noexcept = 0;

            virtual ~RadioManager() noexcept = default;
    };
    typedef std::shared_ptr<RadioManager> RadioManagerRef;

    /**@}*/

} // namespace central_bt

#endif /* CBT_RADIO_MANAGER_HPP_ */
