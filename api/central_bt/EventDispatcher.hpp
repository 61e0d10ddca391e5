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

#ifndef CBT_EVENT_DISPATCHER_HPP_
#define CBT_EVENT_DISPATCHER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <atomic>

#include <jau/cow_darray.hpp>

#include "CentralTypes.hpp"
#include "RadioManager.hpp"
#include "ReadinessGate.hpp"
#include "ScanCoordinator.hpp"
#include "ConnectCoordinator.hpp"
#include "DisconnectCoordinator.hpp"
#include "CentralStatusListener.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Routes the RadioManager notifications to the ReadinessGate and coordinators,
     * and publishes CentralEvent to the attached CentralStatusListener.
     * <p>
     * Notifications without a matching request are dropped.
     * </p>
     */
    class EventDispatcher : public RadioEventListener {
        public:
            typedef jau::nsize_t size_type;
            typedef jau::cow_darray<CentralStatusListenerRef, size_type> statusListenerList_t;

        private:
            static statusListenerList_t::equal_comparator statusListenerRefEqComparator;

            std::recursive_mutex & mtx_central;
            ReadinessGate & gate;
            ScanCoordinator & scanCoordinator;
            ConnectCoordinator & connectCoordinator;
            DisconnectCoordinator & disconnectCoordinator;
            const bool debug_event;

            std::atomic<bool> failPendingOnStateLoss;
            bool closed;
            statusListenerList_t statusListenerList;

            void sendStateChanged(const ReadinessState state, const uint64_t timestamp) noexcept;
            void sendWillRestoreState(const RestoreState& payload, const uint64_t timestamp) noexcept;

        public:
            EventDispatcher(std::recursive_mutex & mtx_central_, ReadinessGate & gate_,
                            ScanCoordinator & scanCoordinator_, ConnectCoordinator & connectCoordinator_,
                            DisconnectCoordinator & disconnectCoordinator_,
                            const bool debug_event_, const bool failPendingOnStateLoss_) noexcept;

            EventDispatcher(const EventDispatcher&) = delete;
            void operator=(const EventDispatcher&) = delete;

            /**
             * Publishes CentralEvent::STATE_CHANGE, updates the ReadinessGate
             * and for any state but ReadinessState::POWERED_ON cancels the active scan with
             * CentralStatusCode::SCAN_TERMINATED_UNEXPECTEDLY.
             * <p>
             * Pending connect and disconnect requests are left to their deadline,
             * unless isFailPendingOnStateLoss().
             * </p>
             */
            void stateChanged(const ReadinessState newState) noexcept override;

            void connected(const PeripheralId& target) noexcept override;

            void disconnected(const PeripheralId& target, const std::error_code& error) noexcept override;

            void failedToConnect(const PeripheralId& target, const std::error_code& error) noexcept override;

            void discovered(const PeripheralId& target, const AdvertisementReport& ad, const int8_t rssi) noexcept override;

            /** Publishes CentralEvent::WILL_RESTORE_STATE only. */
            void willRestoreState(const RestoreState& payload) noexcept override;

            /** Drops all further notifications. */
            void close() noexcept;

            /**
             * If enabled, a readiness loss also fails all pending connect and disconnect requests
             * with CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY.
             * @see CentralEnv::FAIL_PENDING_ON_STATE_LOSS
             */
            void setFailPendingOnStateLoss(const bool v) noexcept { failPendingOnStateLoss = v; }

            bool isFailPendingOnStateLoss() const noexcept { return failPendingOnStateLoss; }

            /**
             * Adds the given listener, unique by CentralStatusListener::operator==().
             * @return true if added, false if already present or null
             */
            bool addStatusListener(const CentralStatusListenerRef& l) noexcept;

            /**
             * Removes the given listener.
             * @return true if removed, false if not present or null
             */
            bool removeStatusListener(const CentralStatusListenerRef& l) noexcept;

            /**
             * Removes all listeners.
             * @return number of removed listeners
             */
            size_type removeAllStatusListener() noexcept;

            size_type getStatusListenerCount() const noexcept { return statusListenerList.size(); }

            std::string toString() const noexcept override;
    };
    typedef std::shared_ptr<EventDispatcher> EventDispatcherRef;

    /**@}*/

} // namespace central_bt

#endif /* CBT_EVENT_DISPATCHER_HPP_ */
