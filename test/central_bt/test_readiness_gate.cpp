#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <vector>
#include <stdexcept>
#include <mutex>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <central_bt/ReadinessGate.hpp>

using namespace central_bt;

TEST_CASE( "ReadinessGate Queue Test 01", "[readiness][gate]" ) {
    std::recursive_mutex mtx;
    ReadinessGate gate(mtx);
    REQUIRE( ReadinessState::UNKNOWN == gate.getState() );

    std::vector<int> order;
    std::vector<ReadinessState> states;
    for(int i=0; i<3; ++i) {
        gate.observeState( [i, &order, &states](ReadinessState s) {
            order.push_back(i);
            states.push_back(s);
        } );
    }
    REQUIRE( 3 == gate.pendingCount() );
    REQUIRE( 0 == order.size() );

    // transitional states keep the queue
    gate.onStateChanged(ReadinessState::RESETTING);
    REQUIRE( ReadinessState::RESETTING == gate.getState() );
    REQUIRE( 3 == gate.pendingCount() );
    REQUIRE( 0 == order.size() );

    gate.onStateChanged(ReadinessState::POWERED_ON);
    REQUIRE( 0 == gate.pendingCount() );
    REQUIRE( std::vector<int>{0, 1, 2} == order );
    for(ReadinessState s : states) {
        REQUIRE( ReadinessState::POWERED_ON == s );
    }

    // drained callbacks are never invoked again
    gate.onStateChanged(ReadinessState::POWERED_OFF);
    REQUIRE( 3 == order.size() );
}

TEST_CASE( "ReadinessGate Immediate Test 02", "[readiness][gate]" ) {
    std::recursive_mutex mtx;
    ReadinessGate gate(mtx);
    gate.onStateChanged(ReadinessState::POWERED_OFF);

    int count = 0;
    ReadinessState seen = ReadinessState::UNKNOWN;
    gate.observeState( [&](ReadinessState s) { ++count; seen = s; } );
    REQUIRE( 1 == count );
    REQUIRE( ReadinessState::POWERED_OFF == seen );
    REQUIRE( 0 == gate.pendingCount() );
}

TEST_CASE( "ReadinessGate ensureReady Test 03", "[readiness][gate][error]" ) {
    struct Case { ReadinessState state; CentralStatusCode code; };
    const std::vector<Case> cases = {
        { ReadinessState::UNSUPPORTED,  CentralStatusCode::BLUETOOTH_UNSUPPORTED },
        { ReadinessState::UNAUTHORIZED, CentralStatusCode::BLUETOOTH_UNAUTHORIZED },
        { ReadinessState::POWERED_OFF,  CentralStatusCode::BLUETOOTH_POWERED_OFF },
        { ReadinessState::POWERED_ON,   CentralStatusCode::SUCCESS }
    };
    for(const Case& c : cases) {
        std::recursive_mutex mtx;
        ReadinessGate gate(mtx);
        std::vector<CentralError> errors;
        gate.ensureReady( [&errors](const CentralError& e) { errors.push_back(e); } );
        REQUIRE( 0 == errors.size() );
        gate.onStateChanged(c.state);
        REQUIRE( 1 == errors.size() );
        REQUIRE( c.code == errors[0].getCode() );
    }
}

TEST_CASE( "ReadinessGate Reentrant Test 04", "[readiness][gate]" ) {
    std::recursive_mutex mtx;
    ReadinessGate gate(mtx);
    std::vector<std::string> trace;

    gate.observeState( [&](ReadinessState s) {
        trace.push_back("a:"+to_string(s));
        // registering from within a draining callback resolves synchronously
        gate.observeState( [&](ReadinessState s2) { trace.push_back("c:"+to_string(s2)); } );
    } );
    gate.observeState( [&](ReadinessState s) { trace.push_back("b:"+to_string(s)); } );

    gate.onStateChanged(ReadinessState::POWERED_ON);
    REQUIRE( std::vector<std::string>{"a:POWERED_ON", "c:POWERED_ON", "b:POWERED_ON"} == trace );
    REQUIRE( 0 == gate.pendingCount() );
}

TEST_CASE( "ReadinessGate Exception Test 05", "[readiness][gate]" ) {
    std::recursive_mutex mtx;
    ReadinessGate gate(mtx);
    int count = 0;
    gate.observeState( [&](ReadinessState) { ++count; throw std::runtime_error("callback failure"); } );
    gate.observeState( [&](ReadinessState) { ++count; } );
    gate.onStateChanged(ReadinessState::POWERED_ON);
    REQUIRE( 2 == count );
}

TEST_CASE( "ReadinessGate Close Test 06", "[readiness][gate][close]" ) {
    std::recursive_mutex mtx;
    ReadinessGate gate(mtx);
    gate.onStateChanged(ReadinessState::RESETTING);

    std::vector<ReadinessState> states;
    std::vector<CentralError> errors;
    gate.observeState( [&states](ReadinessState s) { states.push_back(s); } );
    gate.ensureReady( [&errors](const CentralError& e) { errors.push_back(e); }, "connect peripheral" );
    gate.ensureReady( [&errors](const CentralError& e) { errors.push_back(e); } );
    REQUIRE( 3 == gate.pendingCount() );

    REQUIRE( 3 == gate.close() );
    REQUIRE( gate.isClosed() );
    REQUIRE( 0 == gate.pendingCount() );

    REQUIRE( std::vector<ReadinessState>{ReadinessState::RESETTING} == states );
    REQUIRE( 2 == errors.size() );
    REQUIRE( CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY == errors[0].getCode() );
    REQUIRE( "connect peripheral" == errors[0].getOperation() );
    REQUIRE( number(ReadinessState::RESETTING) == errors[0].getInvalidState() );
    REQUIRE( CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY == errors[1].getCode() );
    REQUIRE( "ensure ready" == errors[1].getOperation() );

    // a later state change neither admits nor re-invokes anyone
    gate.onStateChanged(ReadinessState::POWERED_ON);
    REQUIRE( ReadinessState::RESETTING == gate.getState() );
    REQUIRE( 1 == states.size() );
    REQUIRE( 2 == errors.size() );

    // late callers are resolved immediately, never admitted
    gate.ensureReady( [&errors](const CentralError& e) { errors.push_back(e); } );
    REQUIRE( 3 == errors.size() );
    REQUIRE( CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY == errors[2].getCode() );
    REQUIRE( 0 == gate.close() );
}
