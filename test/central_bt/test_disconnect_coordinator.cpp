#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <vector>
#include <memory>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "central_test_util.hpp"

using namespace central_bt;
using namespace central_bt_test;
using namespace jau::fractions_i64_literals;

typedef FakeRadioManager::Command Command;

static const PeripheralId X = peripheral("C0:26:DA:01:DA:B1");

TEST_CASE( "Disconnect Dedup Test 01", "[disconnect][dedup]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    auto timers = std::make_shared<ManualDeadlineScheduler>();
    CentralManager cm(radio, timers);
    radio->emitState(ReadinessState::POWERED_ON);
    radio->setKnownState(X, PeripheralState::CONNECTED);

    std::vector<CentralError> results;
    cm.disconnect(X, 5_s, recorder(results));
    cm.disconnect(X, 5_s, recorder(results));
    cm.disconnect(X, 5_s, recorder(results));
    REQUIRE( 1 == radio->count(Command::CANCEL_CONNECTION, X) );
    REQUIRE( 1 == timers->scheduledCount() );
    REQUIRE( cm.isDisconnectPending(X) );

    radio->emitDisconnected(X, std::error_code());
    REQUIRE( 3 == results.size() );
    for(const CentralError& e : results) {
        REQUIRE( !e );
    }
    REQUIRE( 0 == cm.getPendingDisconnectCount() );
    REQUIRE( 0 == timers->pendingCount() );
}

TEST_CASE( "Disconnect Already Satisfied Test 02", "[disconnect]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    auto timers = std::make_shared<ManualDeadlineScheduler>();
    CentralManager cm(radio, timers);
    radio->emitState(ReadinessState::POWERED_ON);

    std::vector<CentralError> results;
    radio->setKnownState(X, PeripheralState::DISCONNECTED);
    cm.disconnect(X, 5_s, recorder(results));
    radio->setKnownState(X, PeripheralState::DISCONNECTING);
    cm.disconnect(X, 5_s, recorder(results));

    REQUIRE( 2 == results.size() );
    REQUIRE( !results[0] );
    REQUIRE( !results[1] );
    REQUIRE( 0 == radio->count(Command::CANCEL_CONNECTION) );
    REQUIRE( 0 == timers->scheduledCount() );
}

TEST_CASE( "Disconnect Timeout Test 03", "[disconnect][timeout]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    auto timers = std::make_shared<ManualDeadlineScheduler>();
    CentralManager cm(radio, timers);
    radio->emitState(ReadinessState::POWERED_ON);
    radio->setKnownState(X, PeripheralState::CONNECTED);

    std::vector<CentralError> results;
    cm.disconnect(X, 2_s, recorder(results));
    timers->advance(2_s);
    REQUIRE( 1 == results.size() );
    REQUIRE( CentralStatusCode::OPERATION_TIMEOUT == results[0].getCode() );
    REQUIRE( "disconnect peripheral" == results[0].getOperation() );

    radio->emitDisconnected(X, std::error_code());
    REQUIRE( 1 == results.size() );
}

TEST_CASE( "Disconnect Error Test 04", "[disconnect][error]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    auto timers = std::make_shared<ManualDeadlineScheduler>();
    CentralManager cm(radio, timers);
    radio->emitState(ReadinessState::POWERED_ON);
    radio->setKnownState(X, PeripheralState::CONNECTED);

    std::vector<CentralError> results;
    cm.disconnect(X, 5_s, recorder(results));
    const std::error_code cause = std::make_error_code(std::errc::connection_reset);
    radio->emitDisconnected(X, cause);
    REQUIRE( 1 == results.size() );
    REQUIRE( CentralStatusCode::RESOURCE_ERROR == results[0].getCode() );
    REQUIRE( "disconnect peripheral" == results[0].getOperation() );
    REQUIRE( cause == results[0].getCause() );
}

TEST_CASE( "Disconnect Not Ready Test 05", "[disconnect][readiness]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    auto timers = std::make_shared<ManualDeadlineScheduler>();
    CentralManager cm(radio, timers);
    radio->emitState(ReadinessState::UNAUTHORIZED);
    radio->clearCommands();

    std::vector<CentralError> results;
    cm.disconnect(X, 5_s, recorder(results));
    REQUIRE( 1 == results.size() );
    REQUIRE( CentralStatusCode::BLUETOOTH_UNAUTHORIZED == results[0].getCode() );
    REQUIRE( 0 == radio->commandCount() );
}

TEST_CASE( "Disconnect Unmatched Notification Test 06", "[disconnect]" ) {
    auto radio = std::make_shared<FakeRadioManager>();
    auto timers = std::make_shared<ManualDeadlineScheduler>();
    CentralManager cm(radio, timers);
    radio->emitState(ReadinessState::POWERED_ON);
    radio->setKnownState(X, PeripheralState::CONNECTED);

    // a pending connect is not resolved by a disconnect notification
    std::vector<CentralError> connects;
    radio->setKnownState(X, PeripheralState::DISCONNECTED);
    cm.connect(X, 5_s, recorder(connects));
    radio->emitDisconnected(X, std::error_code());
    REQUIRE( 0 == connects.size() );
    REQUIRE( cm.isConnectPending(X) );
    REQUIRE( 0 == cm.getPendingDisconnectCount() );

    cm.close();
    REQUIRE( 1 == connects.size() );
    REQUIRE( CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY == connects[0].getCode() );
}
