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

#ifndef ZKCOORD_COORDINATOR_SETTINGS_HPP_
#define ZKCOORD_COORDINATOR_SETTINGS_HPP_

#include <cstdint>

namespace zkcoord::coordinator {

struct ProverPoolSettings {
    uint32_t max_server_proofs{1};  // Pool capacity i.e. max number of concurrent proof jobs
};

struct PipelineSettings {
    uint32_t num_workers{1};             // Number of concurrent pipeline workers
    uint32_t max_attempts{3};            // Proving attempts per batch before giving up on it
    bool discard_failed_provers{false};  // Whether provers failing a job are dropped instead of returned
};

}  // namespace zkcoord::coordinator

#endif  // ZKCOORD_COORDINATOR_SETTINGS_HPP_
