/*
   Copyright 2026 The Zkcoord Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "shutdown_signal.hpp"

#include <utility>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <zkcoord/common/log.hpp>

namespace zkcoord::concurrency {

void ShutdownSignal::cancel() {
    signals_.cancel();
}

void ShutdownSignal::on_signal(std::function<void(SignalNumber)> callback) {
    signals_.async_wait([callback = std::move(callback)](const boost::system::error_code& error, int signal_number) {
        if (error) {
            if (error != boost::system::errc::operation_canceled) {
                ZKCOORD_ERROR << "ShutdownSignal::on_signal async_wait error: " << error;
                throw boost::system::system_error(error);
            }
            ZKCOORD_DEBUG << "ShutdownSignal::on_signal async_wait cancelled";
            return;
        }
        ZKCOORD_INFO << "Signal caught, number: " << signal_number;
        callback(signal_number);
    });
}

void ShutdownSignal::cancel_on_signal(CancellationSignal& cancellation) {
    on_signal([&cancellation](SignalNumber) { cancellation.cancel(); });
}

}  // namespace zkcoord::concurrency
