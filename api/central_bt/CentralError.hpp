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

#ifndef CBT_CENTRAL_ERROR_HPP_
#define CBT_CENTRAL_ERROR_HPP_

#include <cstdint>
#include <string>
#include <system_error>

#include "CentralTypes.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Status codes reported by CentralManager operations.
     * <p>
     * Integrated with std::error_code via CentralStatusCodeCategory.
     * </p>
     */
    enum class CentralStatusCode : uint16_t {
        SUCCESS                           =   0,
        OPERATION_TIMEOUT                 = 100,
        RESOURCE_ERROR                    = 101,
        BLUETOOTH_UNSUPPORTED             = 105,
        BLUETOOTH_UNAUTHORIZED            = 106,
        BLUETOOTH_POWERED_OFF             = 107,
        CONNECT_FAILED_UNKNOWN_REASON     = 109,
        SCAN_TERMINATED_UNEXPECTEDLY      = 110,
        OPERATION_TERMINATED_UNEXPECTEDLY = 112
    };
    constexpr uint16_t number(const CentralStatusCode rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }
    std::string to_string(const CentralStatusCode ec) noexcept;

    class CentralStatusCodeCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "Central"; }
            std::string message(int condition) const override {
                return "Central::"+to_string( static_cast<CentralStatusCode>(condition) );
            }
            static CentralStatusCodeCategory& get() {
                static CentralStatusCodeCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( CentralStatusCode e ) noexcept {
      return std::error_code( number(e), CentralStatusCodeCategory::get() );
    }

    /**
     * Outcome of a CentralManager operation.
     * <p>
     * A default constructed instance denotes success, i.e. no error,
     * see operator bool().
     * </p>
     * <p>
     * Besides its CentralStatusCode an error carries
     * - the name of the failed operation, e.g. `connect peripheral`, for OPERATION_TIMEOUT and RESOURCE_ERROR,
     * - the underlying radio std::error_code for RESOURCE_ERROR,
     * - the raw ReadinessState value for SCAN_TERMINATED_UNEXPECTEDLY and OPERATION_TERMINATED_UNEXPECTEDLY.
     * </p>
     */
    class CentralError {
        private:
            CentralStatusCode code;
            std::string operation;
            std::error_code cause;
            int invalid_state;

            CentralError(const CentralStatusCode code_, std::string operation_, std::error_code cause_, const int invalid_state_) noexcept
            : code(code_), operation(std::move(operation_)), cause(cause_), invalid_state(invalid_state_) {}

        public:
            /** No error. */
            CentralError() noexcept
            : code(CentralStatusCode::SUCCESS), operation(), cause(), invalid_state(-1) {}

            CentralError(const CentralError &o) = default;
            CentralError(CentralError &&o) noexcept = default;
            CentralError& operator=(const CentralError &o) = default;
            CentralError& operator=(CentralError &&o) noexcept = default;

            static CentralError operationTimeout(const std::string& operation_) noexcept {
                return CentralError(CentralStatusCode::OPERATION_TIMEOUT, operation_, std::error_code(), -1);
            }

            static CentralError resourceError(const std::string& operation_, const std::error_code& cause_) noexcept {
                return CentralError(CentralStatusCode::RESOURCE_ERROR, operation_, cause_, -1);
            }

            static CentralError connectFailedUnknownReason() noexcept {
                return CentralError(CentralStatusCode::CONNECT_FAILED_UNKNOWN_REASON, "connect peripheral", std::error_code(), -1);
            }

            static CentralError scanTerminatedUnexpectedly(const ReadinessState state) noexcept {
                return CentralError(CentralStatusCode::SCAN_TERMINATED_UNEXPECTEDLY, "scan", std::error_code(), number(state));
            }

            static CentralError operationTerminatedUnexpectedly(const std::string& operation_, const ReadinessState state) noexcept {
                return CentralError(CentralStatusCode::OPERATION_TERMINATED_UNEXPECTEDLY, operation_, std::error_code(), number(state));
            }

            /**
             * Maps a terminal ReadinessState to the readiness gate outcome.
             * <p>
             * ReadinessState::POWERED_ON and the transitional states map to no error.
             * </p>
             */
            static CentralError fromReadinessState(const ReadinessState state) noexcept;

            /** Returns true if this instance denotes an error. */
            explicit operator bool() const noexcept { return CentralStatusCode::SUCCESS != code; }

            CentralStatusCode getCode() const noexcept { return code; }

            std::error_code getErrorCode() const noexcept { return make_error_code(code); }

            /** Name of the failed operation, may be empty. */
            const std::string& getOperation() const noexcept { return operation; }

            /** Underlying radio error of a RESOURCE_ERROR, empty otherwise. */
            const std::error_code& getCause() const noexcept { return cause; }

            /** Raw ReadinessState value leading to this error or -1 if not applicable. */
            int getInvalidState() const noexcept { return invalid_state; }

            std::string toString() const noexcept;
    };
    inline bool operator==(const CentralError& lhs, const CentralError& rhs) noexcept {
        return lhs.getCode() == rhs.getCode() &&
               lhs.getOperation() == rhs.getOperation() &&
               lhs.getCause() == rhs.getCause() &&
               lhs.getInvalidState() == rhs.getInvalidState();
    }
    inline bool operator!=(const CentralError& lhs, const CentralError& rhs) noexcept
    { return !(lhs == rhs); }

    inline std::string to_string(const CentralError& e) noexcept { return e.toString(); }

    /**@}*/

} // namespace central_bt

namespace std
{
    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    template <>
        struct is_error_code_enum<central_bt::CentralStatusCode> : true_type {};

    /**@}*/
}

#endif /* CBT_CENTRAL_ERROR_HPP_ */
