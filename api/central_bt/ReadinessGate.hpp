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

#ifndef CBT_READINESS_GATE_HPP_
#define CBT_READINESS_GATE_HPP_

#include <cstdint>
#include <string>
#include <mutex>

#include <jau/darray.hpp>
#include <jau/function_def.hpp>

#include "CentralTypes.hpp"
#include "CentralError.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /** One-shot callback receiving the resolved, i.e. terminal ReadinessState. */
    typedef jau::function<void(ReadinessState)> ReadinessCallback;

    /** One-shot callback receiving the outcome of an operation, no error denotes success. */
    typedef jau::function<void(const CentralError&)> CompletionCallback;

    /**
     * Tracks the ReadinessState of the radio manager and defers callers
     * until the state has left the transitional phase.
     * <p>
     * All methods acquire the shared central lock.
     * Callbacks are invoked while holding it.
     * </p>
     */
    class ReadinessGate {
        private:
            /** A queued caller, either observing the plain state or awaiting the gate outcome of an operation. */
            struct Waiter {
                bool completion;
                std::string operation;
                ReadinessCallback observer;
                CompletionCallback outcome;
            };

            std::recursive_mutex & mtx_central;
            ReadinessState state;
            bool closed;
            jau::darray<Waiter> pending;

            void invoke(Waiter& w, const ReadinessState s, const size_t idx, const size_t count) noexcept;

        public:
            explicit ReadinessGate(std::recursive_mutex & mtx_central_) noexcept;

            ReadinessGate(const ReadinessGate&) = delete;
            void operator=(const ReadinessGate&) = delete;

            ReadinessState getState() const noexcept;

            /**
             * Invokes the given callback synchronously with the current state if terminal,
             * otherwise queues it until the state resolves.
             */
            void observeState(ReadinessCallback cb) noexcept;

            /**
             * Like observeState(), mapping the resolved state to its gate outcome via CentralError::fromReadinessState().
             * <p>
             * If the gate gets closed before the state resolves, the callback receives
             * CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY for the given operation and the current state.
             * </p>
             */
            void ensureReady(CompletionCallback cb, const std::string& operation="ensure ready") noexcept;

            /**
             * Stores the new state and, if terminal, drains all queued callbacks in registration order.
             * <p>
             * Callbacks registered from within a draining callback are not part of the drained set.
             * </p>
             */
            void onStateChanged(const ReadinessState newState) noexcept;

            /**
             * Closes this gate, resolving all queued callers once.
             * <p>
             * ensureReady() waiters fail with CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY,
             * observeState() waiters receive the current, possibly transitional state.
             * Later state changes are ignored and later callers are resolved the same way immediately.
             * </p>
             * @return the number of resolved waiters
             */
            size_t close() noexcept;

            bool isClosed() const noexcept;

            size_t pendingCount() const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_READINESS_GATE_HPP_ */
