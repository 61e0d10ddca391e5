#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <vector>
#include <memory>
#include <stdexcept>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>

#include "central_test_util.hpp"

using namespace central_bt;
using namespace central_bt_test;
using namespace jau::fractions_i64_literals;

/** Polls the given condition every 5ms until true or max_wait_ms elapsed. */
template<typename Cond>
static bool waitFor(Cond cond, const int max_wait_ms) {
    for(int i=0; i<max_wait_ms; i+=5) {
        if( cond() ) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

TEST_CASE( "DeadlineTimer Fire Order Test 01", "[timer]" ) {
    DeadlineTimer timer;
    REQUIRE( timer.isRunning() );

    std::mutex mtx;
    std::vector<int> fired;
    const uint64_t t0 = jau::getCurrentMilliseconds();
    uint64_t t_first = 0;

    const DeadlineScheduler::timer_id_t id2 = timer.schedule(120_ms, [&]() {
        const std::lock_guard<std::mutex> lock(mtx);
        fired.push_back(2);
    } );
    const DeadlineScheduler::timer_id_t id1 = timer.schedule(60_ms, [&]() {
        const std::lock_guard<std::mutex> lock(mtx);
        t_first = jau::getCurrentMilliseconds();
        fired.push_back(1);
    } );
    REQUIRE( DeadlineScheduler::INVALID_ID != id1 );
    REQUIRE( DeadlineScheduler::INVALID_ID != id2 );
    REQUIRE( id1 != id2 );

    REQUIRE( waitFor([&]() { const std::lock_guard<std::mutex> lock(mtx); return 2 == fired.size(); }, 3000) );
    {
        const std::lock_guard<std::mutex> lock(mtx);
        REQUIRE( std::vector<int>{1, 2} == fired );
        REQUIRE( t_first - t0 >= 60 );
    }
    REQUIRE( 0 == timer.pendingCount() );
    timer.stop();
    timer.join();
    REQUIRE( !timer.isRunning() );
}

TEST_CASE( "DeadlineTimer Cancel Test 02", "[timer]" ) {
    DeadlineTimer timer;
    std::atomic<int> a(0);
    std::atomic<int> b(0);

    const DeadlineScheduler::timer_id_t ida = timer.schedule(50_ms, [&]() { ++a; });
    timer.schedule(100_ms, [&]() { ++b; });
    REQUIRE( 2 == timer.pendingCount() );
    REQUIRE( timer.cancel(ida) );
    REQUIRE( !timer.cancel(ida) );
    REQUIRE( !timer.cancel(DeadlineScheduler::INVALID_ID) );

    REQUIRE( waitFor([&]() { return 1 == b.load(); }, 3000) );
    REQUIRE( 0 == a.load() );
}

TEST_CASE( "DeadlineTimer Stop Test 03", "[timer]" ) {
    DeadlineTimer timer;
    std::atomic<int> count(0);
    timer.schedule(10_s, [&]() { ++count; });
    REQUIRE( 1 == timer.pendingCount() );

    timer.stop();
    REQUIRE( 0 == timer.pendingCount() );
    timer.join();
    REQUIRE( !timer.isRunning() );
    REQUIRE( DeadlineScheduler::INVALID_ID == timer.schedule(1_ms, [&]() { ++count; }) );
    REQUIRE( 0 == count.load() );

    // stopping twice is harmless
    timer.stop();
    timer.join();
}

TEST_CASE( "DeadlineTimer Action Exception Test 04", "[timer]" ) {
    DeadlineTimer timer;
    std::atomic<int> count(0);
    timer.schedule(10_ms, [&]() { ++count; throw std::runtime_error("action failure"); });
    timer.schedule(20_ms, [&]() { ++count; });
    REQUIRE( waitFor([&]() { return 2 == count.load(); }, 3000) );
    REQUIRE( timer.isRunning() );
}

TEST_CASE( "CentralManager Connect Timeout Threaded Test 05", "[timer][connect]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    std::mutex mtx;
    std::vector<CentralError> results;
    CentralManager cm(radio);
    radio->emitState(ReadinessState::POWERED_ON);

    const PeripheralId x = peripheral("C0:26:DA:01:DA:B1");
    cm.connect(x, 100_ms, [&](const CentralError& e) {
        const std::lock_guard<std::mutex> lock(mtx);
        results.push_back(e);
    } );
    REQUIRE( cm.isConnectPending(x) );

    REQUIRE( waitFor([&]() { const std::lock_guard<std::mutex> lock(mtx); return 1 == results.size(); }, 3000) );
    {
        const std::lock_guard<std::mutex> lock(mtx);
        REQUIRE( CentralStatusCode::OPERATION_TIMEOUT == results[0].getCode() );
    }
    REQUIRE( !cm.isConnectPending(x) );

    // late completion is dropped
    radio->emitConnected(x);
    {
        const std::lock_guard<std::mutex> lock(mtx);
        REQUIRE( 1 == results.size() );
    }
    cm.close();
}

TEST_CASE( "CentralManager Close From Deadline Test 06", "[timer][close]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    std::atomic<int> count(0);
    CentralManager cm(radio);
    radio->emitState(ReadinessState::POWERED_ON);

    cm.scan(50_ms, ScanFilter(), [&](const ScanEvent& e) {
        if( ScanEvent::Type::STOPPED == e.getType() ) {
            ++count;
            // closing on the deadline thread does not wait for itself
            cm.close();
        }
    } );
    REQUIRE( waitFor([&]() { return cm.isClosed(); }, 3000) );
    REQUIRE( 1 == count.load() );
    REQUIRE( !radio->hasListener() );
}

TEST_CASE( "DeadlineTimer Delay Test 07", "[timer]" ) {
    REQUIRE( std::chrono::milliseconds(1) == DeadlineTimer::toDelay(1_ns) );
    REQUIRE( std::chrono::milliseconds(1) == DeadlineTimer::toDelay(500_us) );
    REQUIRE( std::chrono::milliseconds(1) == DeadlineTimer::toDelay(1_ms) );
    REQUIRE( std::chrono::milliseconds(2) == DeadlineTimer::toDelay(1500_us) );
    REQUIRE( std::chrono::milliseconds(10000) == DeadlineTimer::toDelay(10_s) );

    const std::chrono::milliseconds max_delay(MAX_DEADLINE_TIMEOUT.to_ms());
    REQUIRE( max_delay == DeadlineTimer::toDelay(MAX_DEADLINE_TIMEOUT) );
    REQUIRE( max_delay == DeadlineTimer::toDelay(1000000000_s) );

    // a sub-millisecond deadline does not overtake an earlier scheduled 1 ms deadline
    DeadlineTimer timer;
    std::mutex mtx;
    std::vector<int> fired;
    timer.schedule(1_ms, [&]() { const std::lock_guard<std::mutex> lock(mtx); fired.push_back(1); });
    timer.schedule(100_us, [&]() { const std::lock_guard<std::mutex> lock(mtx); fired.push_back(2); });
    REQUIRE( waitFor([&]() { const std::lock_guard<std::mutex> lock(mtx); return 2 == fired.size(); }, 3000) );
    {
        const std::lock_guard<std::mutex> lock(mtx);
        REQUIRE( std::vector<int>{1, 2} == fired );
    }
}

TEST_CASE( "DeadlineTimer Stop Without Wait Test 08", "[timer]" ) {
    DeadlineTimer timer;
    std::atomic<bool> started(false);
    std::atomic<bool> finished(false);
    timer.schedule(10_ms, [&]() {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        finished = true;
    } );
    REQUIRE( waitFor([&]() { return started.load(); }, 3000) );

    const uint64_t t0 = jau::getCurrentMilliseconds();
    timer.stop();
    REQUIRE( jau::getCurrentMilliseconds() - t0 < 200 );
    REQUIRE( !finished.load() );

    timer.join();
    REQUIRE( finished.load() );
    REQUIRE( !timer.isRunning() );
}
