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

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/debug.hpp>

#include "CBTConst.hpp"
#include "CentralEnv.hpp"

using namespace central_bt;

CentralEnv::CentralEnv() noexcept
: exploding( jau::environment::getExplodingProperties("central_bt.central") ),
  SCAN_TIMEOUT( jau::environment::getFractionProperty("central_bt.central.scan.timeout", DEFAULT_SCAN_TIMEOUT, 1_ms /* min */, 365_d /* max */) ),
  CONNECT_TIMEOUT( jau::environment::getFractionProperty("central_bt.central.connect.timeout", DEFAULT_CONNECT_TIMEOUT, 1_ms /* min */, 365_d /* max */) ),
  DISCONNECT_TIMEOUT( jau::environment::getFractionProperty("central_bt.central.disconnect.timeout", DEFAULT_DISCONNECT_TIMEOUT, 1_ms /* min */, 365_d /* max */) ),
  FAIL_PENDING_ON_STATE_LOSS( jau::environment::getBooleanProperty("central_bt.central.fail_pending_on_state_loss", false) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("central_bt.debug.central.event", false) )
{
    DBG_PRINT("CentralEnv: scan %s, connect %s, disconnect %s, fail_pending_on_state_loss %d",
              SCAN_TIMEOUT.to_string().c_str(), CONNECT_TIMEOUT.to_string().c_str(),
              DISCONNECT_TIMEOUT.to_string().c_str(), FAIL_PENDING_ON_STATE_LOSS);
}
