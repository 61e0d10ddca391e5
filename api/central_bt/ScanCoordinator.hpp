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

#ifndef CBT_SCAN_COORDINATOR_HPP_
#define CBT_SCAN_COORDINATOR_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/fraction_type.hpp>
#include <jau/function_def.hpp>

#include "CentralTypes.hpp"
#include "CentralError.hpp"
#include "RadioManager.hpp"
#include "DeadlineTimer.hpp"
#include "ReadinessGate.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Event delivered to the callback of a scan request.
     * <ul>
     *   <li>Type::STARTED once the scan has been admitted</li>
     *   <li>Type::RESULT for each discovered peripheral while the scan is active</li>
     *   <li>Type::STOPPED exactly once at the end, carrying an error if not stopped regularly</li>
     * </ul>
     */
    class ScanEvent {
        public:
            enum class Type : uint8_t {
                STARTED = 0,
                RESULT  = 1,
                STOPPED = 2
            };
            static std::string getTypeString(const Type type) noexcept;

        private:
            Type type;
            PeripheralId peripheral;
            AdvertisementReport advertisement;
            int8_t rssi;
            CentralError error;

            ScanEvent(const Type type_, const PeripheralId& peripheral_, const AdvertisementReport& ad_,
                      const int8_t rssi_, const CentralError& error_) noexcept
            : type(type_), peripheral(peripheral_), advertisement(ad_), rssi(rssi_), error(error_) {}

        public:
            static ScanEvent started() noexcept {
                return ScanEvent(Type::STARTED, PeripheralId(), AdvertisementReport(), 0, CentralError());
            }
            static ScanEvent result(const PeripheralId& peripheral_, const AdvertisementReport& ad_, const int8_t rssi_) noexcept {
                return ScanEvent(Type::RESULT, peripheral_, ad_, rssi_, CentralError());
            }
            static ScanEvent stopped(const CentralError& error_) noexcept {
                return ScanEvent(Type::STOPPED, PeripheralId(), AdvertisementReport(), 0, error_);
            }

            Type getType() const noexcept { return type; }

            /** Discovered peripheral, valid for Type::RESULT only. */
            const PeripheralId& getPeripheral() const noexcept { return peripheral; }

            /** Advertising data, valid for Type::RESULT only. */
            const AdvertisementReport& getAdvertisement() const noexcept { return advertisement; }

            /** Received signal strength in dBm, valid for Type::RESULT only. */
            int8_t getRSSI() const noexcept { return rssi; }

            /** Reason the scan has been stopped, no error for a regular stop. Valid for Type::STOPPED only. */
            const CentralError& getError() const noexcept { return error; }

            std::string toString() const noexcept;
    };

    typedef jau::function<void(const ScanEvent&)> ScanCallback;

    /**
     * Owns the single active scan request.
     * <p>
     * Idle -> (scan) -> Active -> (stop | deadline | readiness loss) -> Idle.
     * A new scan replaces the active one, stopping it before the new one starts.
     * </p>
     */
    class ScanCoordinator {
        private:
            struct ScanRequest {
                uint64_t token;
                DeadlineScheduler::timer_id_t timer;
                ScanCallback callback;
            };

            std::recursive_mutex & mtx_central;
            RadioManager & radio;
            DeadlineScheduler & timers;
            ReadinessGate & gate;
            const bool debug_event;

            uint64_t next_token;
            std::unique_ptr<ScanRequest> active;

            static void invoke(ScanCallback& cb, const ScanEvent& event) noexcept;

            void start(const jau::fraction_i64& timeout, const ScanFilter& filter, ScanCallback cb) noexcept;

            void onDeadline(const uint64_t token) noexcept;

        public:
            ScanCoordinator(std::recursive_mutex & mtx_central_, RadioManager & radio_, DeadlineScheduler & timers_,
                            ReadinessGate & gate_, const bool debug_event_) noexcept;

            ScanCoordinator(const ScanCoordinator&) = delete;
            void operator=(const ScanCoordinator&) = delete;

            /**
             * Starts a scan after the readiness gate has resolved, replacing any active scan.
             * <p>
             * If the gate fails, the callback receives ScanEvent::Type::STOPPED with the gate error
             * and no radio command is issued.
             * </p>
             * @param timeout positive scan duration
             * @param filter discovery filter
             * @param cb receives all ScanEvent of this request
             * @throws jau::IllegalArgumentException if timeout is not positive
             */
            void scan(const jau::fraction_i64& timeout, const ScanFilter& filter, ScanCallback cb);

            /**
             * Stops the active scan, if any, delivering ScanEvent::Type::STOPPED with the given error exactly once.
             * <p>
             * Always issues RadioManager::stopScan().
             * </p>
             */
            void stop(const CentralError& error = CentralError()) noexcept;

            /** Forwards a discovery to the active scan's callback, dropped if idle. */
            void onDiscovered(const PeripheralId& target, const AdvertisementReport& ad, const int8_t rssi) noexcept;

            bool isScanning() const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_SCAN_COORDINATOR_HPP_ */
