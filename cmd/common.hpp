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

#pragma once

#include <cstdint>

#include <CLI/CLI.hpp>

#include <zkcoord/common/log.hpp>
#include <zkcoord/coordinator/settings.hpp>
#include <zkcoord/prover/mock_client.hpp>

namespace zkcoord::cmd {

//! The overall settings for the prover pool driver
struct ProverPoolDriverSettings {
    log::Settings log_settings;
    coordinator::ProverPoolSettings pool_settings;
    coordinator::PipelineSettings pipeline_settings;
    prover::MockClientSettings prover_settings;
    uint32_t num_provers{1};
    uint64_t first_batch{1};
    uint64_t num_batches{10};
};

//! \brief Parses command line arguments for the prover pool driver
//! \throws CLI::ParseError on invalid command line (already reported to the user)
void parse_command_line(CLI::App& cli, int argc, char* argv[], ProverPoolDriverSettings& settings);

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options to populate prover pool and mock prover settings after cli.parse()
void add_prover_pool_options(CLI::App& cli, ProverPoolDriverSettings& settings);

//! \brief Set up options to populate pipeline settings after cli.parse()
void add_pipeline_options(CLI::App& cli, ProverPoolDriverSettings& settings);

}  // namespace zkcoord::cmd
