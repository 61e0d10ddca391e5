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

#ifndef CBT_CONNECT_COORDINATOR_HPP_
#define CBT_CONNECT_COORDINATOR_HPP_

#include <string>
#include <system_error>

#include "PeripheralCoordinator.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Deduplicates connection attempts per peripheral.
     * <p>
     * A target reported PeripheralState::CONNECTED is satisfied without a radio command,
     * otherwise RadioManager::connect() is issued once per request.
     * </p>
     */
    class ConnectCoordinator : public PeripheralCoordinator {
        protected:
            bool isSatisfied(const PeripheralState state) const noexcept override;

            void issueCommand(const PeripheralId& target) override;

        public:
            ConnectCoordinator(std::recursive_mutex & mtx_central_, RadioManager & radio_, DeadlineScheduler & timers_,
                               ReadinessGate & gate_, const bool debug_event_) noexcept;

            /** Resolves the target's request with no error, dropped if none pending. */
            void onConnected(const PeripheralId& target) noexcept;

            /**
             * Resolves the target's request with CentralStatusCode::RESOURCE_ERROR carrying the given error,
             * or CentralStatusCode::CONNECT_FAILED_UNKNOWN_REASON if the error is empty.
             * Dropped if none pending.
             */
            void onFailedToConnect(const PeripheralId& target, const std::error_code& error) noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_CONNECT_COORDINATOR_HPP_ */
