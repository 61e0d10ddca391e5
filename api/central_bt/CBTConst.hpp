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

#ifndef CBT_CONST_HPP_
#define CBT_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace central_bt {

    using namespace jau::fractions_i64_literals;

    /**
     * Maximum time to wait for a thread shutdown.
     *
     * Used for the DeadlineTimer service thread.
     */
    inline constexpr const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT_MS = 8_s;

    /**
     * Maximum time the idle DeadlineTimer thread sleeps before re-checking its stop condition.
     */
    inline constexpr const jau::fraction_i64 DEADLINE_IDLE_POLL_TIMEOUT = 1_s;

    /** Longest deadline a DeadlineTimer schedules, longer timeouts are clamped. */
    inline constexpr const jau::fraction_i64 MAX_DEADLINE_TIMEOUT = 2592000_s; // 30 days

    /** Default scan duration, if not given by the caller. See CentralEnv::SCAN_TIMEOUT. */
    inline constexpr const jau::fraction_i64 DEFAULT_SCAN_TIMEOUT = 10_s;

    /** Default connect timeout, if not given by the caller. See CentralEnv::CONNECT_TIMEOUT. */
    inline constexpr const jau::fraction_i64 DEFAULT_CONNECT_TIMEOUT = 10_s;

    /** Default disconnect timeout, if not given by the caller. See CentralEnv::DISCONNECT_TIMEOUT. */
    inline constexpr const jau::fraction_i64 DEFAULT_DISCONNECT_TIMEOUT = 10_s;

} // namespace central_bt

#endif /* CBT_CONST_HPP_ */
