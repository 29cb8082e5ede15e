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

#include "terminal.hpp"

#include <unistd.h>

namespace zkcoord {

bool is_terminal_stderr() { return ::isatty(STDERR_FILENO) != 0; }

bool is_terminal_stdout() { return ::isatty(STDOUT_FILENO) != 0; }

}  // namespace zkcoord
