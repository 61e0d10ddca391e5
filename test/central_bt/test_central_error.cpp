#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <unordered_set>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <central_bt/CentralError.hpp>
#include <central_bt/CentralTypes.hpp>

using namespace central_bt;

TEST_CASE( "CentralStatusCode Test 01", "[error][code]" ) {
    REQUIRE(   0 == number(CentralStatusCode::SUCCESS) );
    REQUIRE( 100 == number(CentralStatusCode::OPERATION_TIMEOUT) );
    REQUIRE( 101 == number(CentralStatusCode::RESOURCE_ERROR) );
    REQUIRE( 105 == number(CentralStatusCode::BLUETOOTH_UNSUPPORTED) );
    REQUIRE( 106 == number(CentralStatusCode::BLUETOOTH_UNAUTHORIZED) );
    REQUIRE( 107 == number(CentralStatusCode::BLUETOOTH_POWERED_OFF) );
    REQUIRE( 109 == number(CentralStatusCode::CONNECT_FAILED_UNKNOWN_REASON) );
    REQUIRE( 110 == number(CentralStatusCode::SCAN_TERMINATED_UNEXPECTEDLY) );
    REQUIRE( 112 == number(CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY) );

    REQUIRE( "OPERATION_TIMEOUT" == to_string(CentralStatusCode::OPERATION_TIMEOUT) );

    const std::error_code ec = CentralStatusCode::BLUETOOTH_POWERED_OFF;
    REQUIRE( 107 == ec.value() );
    REQUIRE( std::string("Central") == ec.category().name() );
    REQUIRE( "Central::BLUETOOTH_POWERED_OFF" == ec.message() );
    REQUIRE( ec == make_error_code(CentralStatusCode::BLUETOOTH_POWERED_OFF) );
}

TEST_CASE( "CentralError Test 01", "[error]" ) {
    {
        const CentralError none;
        REQUIRE( !none );
        REQUIRE( CentralStatusCode::SUCCESS == none.getCode() );
        REQUIRE( -1 == none.getInvalidState() );
        REQUIRE( none == CentralError() );
        INFO_STR(none.toString());
    }
    {
        const CentralError e = CentralError::operationTimeout("connect peripheral");
        REQUIRE( e );
        REQUIRE( CentralStatusCode::OPERATION_TIMEOUT == e.getCode() );
        REQUIRE( "connect peripheral" == e.getOperation() );
        REQUIRE( !e.getCause() );
        REQUIRE( 100 == e.getErrorCode().value() );
        INFO_STR(e.toString());
    }
    {
        const std::error_code cause = std::make_error_code(std::errc::connection_refused);
        const CentralError e = CentralError::resourceError("disconnect peripheral", cause);
        REQUIRE( CentralStatusCode::RESOURCE_ERROR == e.getCode() );
        REQUIRE( "disconnect peripheral" == e.getOperation() );
        REQUIRE( cause == e.getCause() );
        REQUIRE( e != CentralError::resourceError("connect peripheral", cause) );
        INFO_STR(e.toString());
    }
    {
        const CentralError e = CentralError::scanTerminatedUnexpectedly(ReadinessState::POWERED_OFF);
        REQUIRE( CentralStatusCode::SCAN_TERMINATED_UNEXPECTEDLY == e.getCode() );
        REQUIRE( 4 == e.getInvalidState() );
    }
    {
        const CentralError e = CentralError::operationTerminatedUnexpectedly("connect peripheral", ReadinessState::RESETTING);
        REQUIRE( CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY == e.getCode() );
        REQUIRE( 1 == e.getInvalidState() );
    }
    REQUIRE( CentralStatusCode::CONNECT_FAILED_UNKNOWN_REASON == CentralError::connectFailedUnknownReason().getCode() );
}

TEST_CASE( "CentralError from ReadinessState Test 02", "[error][readiness]" ) {
    REQUIRE( CentralStatusCode::BLUETOOTH_UNSUPPORTED  == CentralError::fromReadinessState(ReadinessState::UNSUPPORTED).getCode() );
    REQUIRE( CentralStatusCode::BLUETOOTH_UNAUTHORIZED == CentralError::fromReadinessState(ReadinessState::UNAUTHORIZED).getCode() );
    REQUIRE( CentralStatusCode::BLUETOOTH_POWERED_OFF  == CentralError::fromReadinessState(ReadinessState::POWERED_OFF).getCode() );
    REQUIRE( !CentralError::fromReadinessState(ReadinessState::POWERED_ON) );
    REQUIRE( 2 == CentralError::fromReadinessState(ReadinessState::UNSUPPORTED).getInvalidState() );
}

TEST_CASE( "ReadinessState Test 01", "[datatype][readiness]" ) {
    REQUIRE( 0 == number(ReadinessState::UNKNOWN) );
    REQUIRE( 5 == number(ReadinessState::POWERED_ON) );
    REQUIRE( isTransitional(ReadinessState::UNKNOWN) );
    REQUIRE( isTransitional(ReadinessState::RESETTING) );
    REQUIRE( !isTransitional(ReadinessState::UNSUPPORTED) );
    REQUIRE( !isTransitional(ReadinessState::UNAUTHORIZED) );
    REQUIRE( !isTransitional(ReadinessState::POWERED_OFF) );
    REQUIRE( !isTransitional(ReadinessState::POWERED_ON) );
    REQUIRE( ReadinessState::POWERED_OFF == to_ReadinessState(4) );
    REQUIRE( ReadinessState::UNKNOWN == to_ReadinessState(42) );
    REQUIRE( "POWERED_ON" == to_string(ReadinessState::POWERED_ON) );
}

TEST_CASE( "PeripheralId Test 01", "[datatype][peripheral]" ) {
    const PeripheralId a("C0:26:DA:01:DA:B1", PeripheralAddressType::LE_PUBLIC);
    const PeripheralId b("C0:26:DA:01:DA:B1", PeripheralAddressType::LE_PUBLIC);
    const PeripheralId c("C0:26:DA:01:DA:B1", PeripheralAddressType::LE_RANDOM);
    const PeripheralId d("C0:26:DA:01:DA:B2", PeripheralAddressType::LE_PUBLIC);
    INFO_STR(a.toString());

    REQUIRE( a == b );
    REQUIRE( a.hash_code() == b.hash_code() );
    REQUIRE( a != c );
    REQUIRE( a != d );
    REQUIRE( a.isLEAddress() );

    std::unordered_set<PeripheralId> set;
    set.insert(a);
    set.insert(b);
    set.insert(c);
    set.insert(d);
    REQUIRE( 3 == set.size() );
}
