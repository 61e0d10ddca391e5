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

#ifndef CBT_CENTRAL_MANAGER_HPP_
#define CBT_CENTRAL_MANAGER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/fraction_type.hpp>

#include "CBTConst.hpp"
#include "CentralEnv.hpp"
#include "CentralTypes.hpp"
#include "CentralError.hpp"
#include "RadioManager.hpp"
#include "DeadlineTimer.hpp"
#include "ReadinessGate.hpp"
#include "ScanCoordinator.hpp"
#include "ConnectCoordinator.hpp"
#include "DisconnectCoordinator.hpp"
#include "EventDispatcher.hpp"
#include "CentralStatusListener.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * CentralManager coordinates all operations against one shared RadioManager.
     * <p>
     * Requests for the same peripheral operation are merged into one radio command,
     * one deadline and one outcome delivered to every caller exactly once.
     * All operations are gated by the ReadinessState and fail fast
     * if the radio is unsupported, unauthorized or powered off.
     * </p>
     * <p>
     * All state is guarded by one recursive serialization lock.
     * Every operation, radio notification and deadline acquires it
     * and callbacks are invoked while it is held, hence callbacks may re-enter this instance on the same thread.
     * Callbacks shall not block on other threads using this instance.
     * </p>
     * <p>
     * Callbacks are invoked
     * - on the calling thread for immediate outcomes, e.g. a readiness failure,
     * - on the radio notification thread for completions,
     * - on the DeadlineScheduler thread for timeouts.
     * </p>
     */
    class CentralManager {
        private:
            const CentralEnv & env;
            mutable std::recursive_mutex mtx_central;
            RadioManagerRef radio;
            DeadlineSchedulerRef timers;
            ReadinessGate gate;
            ScanCoordinator scanCoordinator;
            ConnectCoordinator connectCoordinator;
            DisconnectCoordinator disconnectCoordinator;
            EventDispatcherRef dispatcher;
            bool closed;

            void checkOpen(const std::string& op) const;

        public:
            /**
             * Creates a CentralManager using the given RadioManager and DeadlineScheduler,
             * attaching itself as the RadioManager's event listener.
             * @throws jau::IllegalArgumentException if any argument is null
             */
            CentralManager(RadioManagerRef radio_, DeadlineSchedulerRef timers_);

            /**
             * Creates a CentralManager using the given RadioManager and its own DeadlineTimer.
             * @throws jau::IllegalArgumentException if radio_ is null
             */
            explicit CentralManager(RadioManagerRef radio_);

            CentralManager(const CentralManager&) = delete;
            void operator=(const CentralManager&) = delete;

            /** See close(), additionally waits for a running deadline action to return. */
            ~CentralManager() noexcept;

            /**
             * Detaches from the RadioManager, stops the DeadlineScheduler
             * and terminates all outstanding requests.
             * <p>
             * An active scan is stopped regularly, pending connect and disconnect requests
             * as well as operations still waiting for a terminal ReadinessState
             * fail with CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY.
             * observeReadiness() callbacks still queued receive the current ReadinessState.
             * </p>
             * <p>
             * May be called from within any callback, it does not wait for a running deadline action.
             * The destructor waits for it, hence shall not be invoked from within a callback.
             * </p>
             */
            void close() noexcept;

            bool isClosed() const noexcept;

            const RadioManagerRef& getRadioManager() const noexcept { return radio; }

            ReadinessState getReadinessState() const noexcept { return gate.getState(); }

            /**
             * Invokes the given callback once the ReadinessState is terminal,
             * synchronously if already terminal.
             */
            void observeReadiness(ReadinessCallback cb);

            /**
             * Invokes the given callback once the ReadinessState is terminal,
             * with no error for ReadinessState::POWERED_ON, otherwise
             * CentralStatusCode::BLUETOOTH_UNSUPPORTED, BLUETOOTH_UNAUTHORIZED or BLUETOOTH_POWERED_OFF.
             */
            void ensureReady(CompletionCallback cb);

            /**
             * Starts a scan for the given duration, replacing any active scan.
             * @see ScanCoordinator::scan()
             * @throws jau::IllegalArgumentException if timeout is not positive
             * @throws jau::IllegalStateException if closed
             */
            void scan(const jau::fraction_i64& timeout, const ScanFilter& filter, ScanCallback cb);

            /** Starts a scan for CentralEnv::SCAN_TIMEOUT. */
            void scan(const ScanFilter& filter, ScanCallback cb);

            /** Stops the active scan, delivering ScanEvent::Type::STOPPED with the given error. */
            void stopScan(const CentralError& error = CentralError()) noexcept;

            bool isScanning() const noexcept { return scanCoordinator.isScanning(); }

            /**
             * Connects to the given peripheral, joining a pending connection attempt if any.
             * <p>
             * The outcome is no error on success, CentralStatusCode::OPERATION_TIMEOUT if not connected within timeout,
             * CentralStatusCode::RESOURCE_ERROR or CentralStatusCode::CONNECT_FAILED_UNKNOWN_REASON if the radio failed.
             * </p>
             * @throws jau::IllegalArgumentException if timeout is not positive
             * @throws jau::IllegalStateException if closed
             */
            void connect(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb);

            /** Connects using CentralEnv::CONNECT_TIMEOUT. */
            void connect(const PeripheralId& target, CompletionCallback cb);

            /**
             * Disconnects from the given peripheral, joining a pending teardown if any.
             * @throws jau::IllegalArgumentException if timeout is not positive
             * @throws jau::IllegalStateException if closed
             */
            void disconnect(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb);

            /** Disconnects using CentralEnv::DISCONNECT_TIMEOUT. */
            void disconnect(const PeripheralId& target, CompletionCallback cb);

            size_t getPendingConnectCount() const noexcept { return connectCoordinator.pendingCount(); }
            size_t getPendingDisconnectCount() const noexcept { return disconnectCoordinator.pendingCount(); }
            bool isConnectPending(const PeripheralId& target) const noexcept { return connectCoordinator.isPending(target); }
            bool isDisconnectPending(const PeripheralId& target) const noexcept { return disconnectCoordinator.isPending(target); }

            /**
             * Sets the readiness loss policy for pending connect and disconnect requests,
             * initially CentralEnv::FAIL_PENDING_ON_STATE_LOSS.
             * @see EventDispatcher::setFailPendingOnStateLoss()
             */
            void setFailPendingOnStateLoss(const bool v) noexcept { dispatcher->setFailPendingOnStateLoss(v); }

            bool isFailPendingOnStateLoss() const noexcept { return dispatcher->isFailPendingOnStateLoss(); }

            /**
             * Adds the given CentralStatusListener, if not already present.
             * @return true if added, false if already present or null
             */
            bool addStatusListener(const CentralStatusListenerRef& l) noexcept { return dispatcher->addStatusListener(l); }

            bool removeStatusListener(const CentralStatusListenerRef& l) noexcept { return dispatcher->removeStatusListener(l); }

            EventDispatcher::size_type removeAllStatusListener() noexcept { return dispatcher->removeAllStatusListener(); }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_CENTRAL_MANAGER_HPP_ */
