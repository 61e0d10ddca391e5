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

#ifndef CBT_CENTRAL_ENV_HPP_
#define CBT_CENTRAL_ENV_HPP_

#include <cstdint>
#include <string>

#include <jau/environment.hpp>
#include <jau/fraction_type.hpp>

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Central runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     * <p>
     * Unix shell users may replace the dots of each property name by underscores,
     * e.g. 'central_bt_central_connect_timeout' instead of 'central_bt.central.connect.timeout'.
     * </p>
     */
    class CentralEnv : public jau::root_environment {
        private:
            CentralEnv() noexcept; // NOLINT(modernize-use-equals-delete)

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Default scan duration used by CentralManager::scan() without explicit timeout, defaults to 10s.
             * <p>
             * Environment variable is 'central_bt.central.scan.timeout'.
             * </p>
             */
            const jau::fraction_i64 SCAN_TIMEOUT;

            /**
             * Default connect timeout used by CentralManager::connect() without explicit timeout, defaults to 10s.
             * <p>
             * Environment variable is 'central_bt.central.connect.timeout'.
             * </p>
             */
            const jau::fraction_i64 CONNECT_TIMEOUT;

            /**
             * Default disconnect timeout used by CentralManager::disconnect() without explicit timeout, defaults to 10s.
             * <p>
             * Environment variable is 'central_bt.central.disconnect.timeout'.
             * </p>
             */
            const jau::fraction_i64 DISCONNECT_TIMEOUT;

            /**
             * If true, pending connect and disconnect requests are failed with
             * CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY as soon as the readiness state
             * leaves ReadinessState::POWERED_ON, instead of being left to their own timeout.
             * <p>
             * Defaults to false.
             * </p>
             * <p>
             * Environment variable is 'central_bt.central.fail_pending_on_state_loss'.
             * </p>
             */
            const bool FAIL_PENDING_ON_STATE_LOSS;

            /**
             * Debug all inbound radio notifications and request resolutions.
             * <p>
             * Environment variable is 'central_bt.debug.central.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static CentralEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static CentralEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_CENTRAL_ENV_HPP_ */
