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

#ifndef CBT_PERIPHERAL_COORDINATOR_HPP_
#define CBT_PERIPHERAL_COORDINATOR_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>

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
     * Deduplicating coordinator of one per-peripheral operation family, e.g. connect or disconnect.
     * <p>
     * Holds at most one request per PeripheralId. Callers asking for a pending target join its request
     * and share its single radio command, deadline and outcome.
     * A request is removed before its waiters are invoked, hence a caller
     * joining from within a waiter callback creates a new request.
     * </p>
     * <p>
     * Specializations define when a target already satisfies the operation
     * and which radio command to issue.
     * </p>
     */
    class PeripheralCoordinator {
        private:
            struct PeripheralRequest {
                PeripheralId target;
                uint64_t token;
                DeadlineScheduler::timer_id_t timer;
                jau::darray<CompletionCallback> waiters;
            };
            typedef std::unordered_map<PeripheralId, std::unique_ptr<PeripheralRequest>> request_map_t;

            const std::string operationName;
            uint64_t next_token;
            request_map_t requests;

            void admit(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb) noexcept;

            void onDeadline(const PeripheralId& target, const uint64_t token) noexcept;

            static void invoke(CompletionCallback& cb, const CentralError& error, const std::string& op,
                               const PeripheralId& target, const size_t idx, const size_t count) noexcept;

        protected:
            std::recursive_mutex & mtx_central;
            RadioManager & radio;
            DeadlineScheduler & timers;
            ReadinessGate & gate;
            const bool debug_event;

            PeripheralCoordinator(std::string operationName_,
                                  std::recursive_mutex & mtx_central_, RadioManager & radio_, DeadlineScheduler & timers_,
                                  ReadinessGate & gate_, const bool debug_event_) noexcept;

            /** Returns true if a known peripheral in the given state needs no command. */
            virtual bool isSatisfied(const PeripheralState state) const noexcept = 0;

            /** Issues the radio command for the given target. */
            virtual void issueCommand(const PeripheralId& target) = 0;

            /**
             * Removes the request of the given target and invokes all its waiters with the given outcome.
             * @return false if no request was pending for the target
             */
            bool resolve(const PeripheralId& target, const CentralError& error) noexcept;

        public:
            PeripheralCoordinator(const PeripheralCoordinator&) = delete;
            void operator=(const PeripheralCoordinator&) = delete;

            virtual ~PeripheralCoordinator() noexcept = default;

            /** Operation name used in timeout and resource errors, e.g. `connect peripheral`. */
            const std::string& getOperationName() const noexcept { return operationName; }

            /**
             * Requests the operation for the given target after the readiness gate has resolved.
             * <p>
             * A gate failure is delivered synchronously and creates no request.
             * If the target already satisfies the operation, the callback receives no error immediately.
             * Otherwise the callback joins the pending request of the target, or a new request is created,
             * its radio command issued and its deadline started.
             * </p>
             * @param target the peripheral
             * @param timeout positive timeout of a newly created request
             * @param cb receives the outcome exactly once
             * @throws jau::IllegalArgumentException if timeout is not positive
             */
            void request(const PeripheralId& target, const jau::fraction_i64& timeout, CompletionCallback cb);

            /**
             * Resolves all pending requests with the given error.
             * @return the number of resolved requests
             */
            size_t resolveAll(const CentralError& error) noexcept;

            size_t pendingCount() const noexcept;

            bool isPending(const PeripheralId& target) const noexcept;

            /** Number of waiters of the given target's request, zero if none pending. */
            size_t waiterCount(const PeripheralId& target) const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_PERIPHERAL_COORDINATOR_HPP_ */
