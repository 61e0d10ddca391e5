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

#ifndef CBT_CENTRAL_STATUS_LISTENER_HPP_
#define CBT_CENTRAL_STATUS_LISTENER_HPP_

#include <cstdint>
#include <string>
#include <memory>

#include <jau/string_util.hpp>

#include "CentralTypes.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /** Name of an event published to CentralStatusListener. */
    enum class CentralEvent : uint8_t {
        /** See CentralStatusListener::centralStateChanged() */
        STATE_CHANGE       = 0,
        /** See CentralStatusListener::willRestoreState() */
        WILL_RESTORE_STATE = 1
    };
    constexpr uint8_t number(const CentralEvent rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const CentralEvent v) noexcept;

    /**
     * CentralStatusListener receives the events published by CentralManager.
     * <p>
     * A listener instance may be attached to a CentralManager via CentralManager::addStatusListener().
     * </p>
     * <p>
     * All methods are invoked while CentralManager holds its serialization lock,
     * on the thread delivering the radio notification.
     * </p>
     */
    class CentralStatusListener {
        public:
            /**
             * The readiness state of the radio manager has changed, event CentralEvent::STATE_CHANGE.
             * @param state the new ReadinessState
             * @param timestamp the time in monotonic milliseconds when this event occurred. See BasicTypes::getCurrentMilliseconds().
             */
            virtual void centralStateChanged(const ReadinessState state, const uint64_t timestamp) {
                (void)state;
                (void)timestamp;
            }

            /**
             * The system restored the radio manager state, event CentralEvent::WILL_RESTORE_STATE.
             * @param payload the restored state as delivered by the radio manager
             * @param timestamp the time in monotonic milliseconds when this event occurred. See BasicTypes::getCurrentMilliseconds().
             */
            virtual void willRestoreState(const RestoreState& payload, const uint64_t timestamp) {
                (void)payload;
                (void)timestamp;
            }

            virtual ~CentralStatusListener() noexcept = default;

            virtual std::string toString() const noexcept { return "CentralStatusListener["+jau::to_hexstring(this)+"]"; }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const CentralStatusListener& rhs) const
            { return this == &rhs; }

            bool operator!=(const CentralStatusListener& rhs) const
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<CentralStatusListener> CentralStatusListenerRef;

    /**@}*/

} // namespace central_bt

#endif /* CBT_CENTRAL_STATUS_LISTENER_HPP_ */
