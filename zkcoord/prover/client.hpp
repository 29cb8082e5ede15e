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

#ifndef ZKCOORD_PROVER_CLIENT_HPP_
#define ZKCOORD_PROVER_CLIENT_HPP_

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <zkcoord/concurrency/cancellation_signal.hpp>

namespace zkcoord::prover {

//! \brief The outcome of one successful proof generation
struct Proof {
    uint64_t batch_number{0};
    std::string prover_id;
    std::string data;
};

//! \brief Raised when a prover fails to generate a proof (i.e. the prover, not the caller, is at fault)
class ProverError : public std::runtime_error {
  public:
    ProverError(std::string prover_id, const std::string& what)
        : std::runtime_error(what), prover_id_{std::move(prover_id)} {}

    [[nodiscard]] const std::string& prover_id() const { return prover_id_; }

  private:
    std::string prover_id_;
};

//! \brief Session with one external proof generation server
//! \details A prover can run one job at a time: callers must hold exclusive access for the whole prove() call
class Client {
  public:
    virtual ~Client() = default;

    //! \brief Identifier used for logging and diagnostics
    [[nodiscard]] virtual const std::string& id() const = 0;

    //! \brief Generates the proof for the given batch, blocking for the whole proving time
    //! \throws ProverError on proving failure
    //! \throws boost::system::system_error with operation_canceled if \p signal fires meanwhile
    virtual Proof prove(const concurrency::CancellationSignal& signal, uint64_t batch_number) = 0;
};

using ClientPtr = std::shared_ptr<Client>;

}  // namespace zkcoord::prover

#endif  // ZKCOORD_PROVER_CLIENT_HPP_
