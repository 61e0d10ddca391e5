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

#ifndef CBT_DEADLINE_TIMER_HPP_
#define CBT_DEADLINE_TIMER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <atomic>

#include <jau/fraction_type.hpp>
#include <jau/function_def.hpp>
#include <jau/service_runner.hpp>

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * One-shot deadline service used by the coordinators to time out their requests.
     */
    class DeadlineScheduler {
        public:
            typedef uint64_t timer_id_t;
            typedef jau::function<void()> Action;

            /** Invalid timer id, returned if no deadline could be scheduled. */
            static constexpr const timer_id_t INVALID_ID = 0;

            /**
             * Schedule the given action to be run once after the given timeout.
             * @return the non-zero timer id, or INVALID_ID if this scheduler has been stopped
             */
            virtual timer_id_t schedule(const jau::fraction_i64& timeout, Action action) = 0;

            /**
             * Cancel the pending deadline of the given id.
             * @return true if a not yet fired deadline has been removed
             */
            virtual bool cancel(const timer_id_t id) = 0;

            /**
             * Stop this scheduler, discarding all pending deadlines and refusing new ones.
             * <p>
             * Does not wait for a currently running action, see join().
             * </p>
             */
            virtual void stop() = 0;

            /**
             * Wait until a currently running action has returned and the scheduler has ended.
             * <p>
             * Returns immediately if called from within an action.
             * </p>
             */
            virtual void join() = 0;

            virtual std::string toString() const noexcept = 0;

            virtual ~DeadlineScheduler() noexcept = default;
    };
    typedef std::shared_ptr<DeadlineScheduler> DeadlineSchedulerRef;

    /**
     * DeadlineScheduler implementation running all deadline actions on its own jau::service_runner thread.
     * <p>
     * Deadlines are held ordered by expiry, equal expiries in scheduling order.
     * Actions are invoked without the timer lock held, hence an action may schedule or cancel deadlines.
     * </p>
     */
    class DeadlineTimer : public DeadlineScheduler {
        private:
            typedef std::chrono::steady_clock clock_t;

            struct Deadline {
                timer_id_t id;
                clock_t::time_point expiry;
                Action action;
            };

            std::mutex mtx_deadlines;
            std::condition_variable cv_deadlines;
            std::vector<Deadline> deadlines;
            timer_id_t next_id;
            bool stopping;
            std::atomic<std::thread::id> worker_id;

            jau::service_runner timer_service;

            void timerWork(jau::service_runner& sr) noexcept;
            void timerEnd(jau::service_runner& sr) noexcept;

        public:
            /** Starts the deadline thread. */
            DeadlineTimer() noexcept;

            DeadlineTimer(const DeadlineTimer&) = delete;
            void operator=(const DeadlineTimer&) = delete;

            /** Stops the deadline thread, see stop() and join(). */
            ~DeadlineTimer() noexcept override;

            /**
             * Returns the delay for the given timeout, rounded up to whole milliseconds
             * and clamped to [1 ms, MAX_DEADLINE_TIMEOUT].
             */
            static std::chrono::milliseconds toDelay(const jau::fraction_i64& timeout) noexcept;

            timer_id_t schedule(const jau::fraction_i64& timeout, Action action) override;

            bool cancel(const timer_id_t id) override;

            /**
             * Discards all pending deadlines and signals the deadline thread to end
             * after a currently running action returns.
             */
            void stop() override;

            void join() override;

            bool isRunning() const noexcept { return timer_service.is_running(); }

            size_t pendingCount() noexcept;

            std::string toString() const noexcept override;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_DEADLINE_TIMER_HPP_ */
