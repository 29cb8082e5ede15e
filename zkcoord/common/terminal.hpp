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

#ifndef ZKCOORD_COMMON_TERMINAL_HPP_
#define ZKCOORD_COMMON_TERMINAL_HPP_

namespace zkcoord {

inline constexpr const char* kColorReset = "\x1b[0m";  // Resets fore color to terminal default

inline constexpr const char* kColorCoal = "\x1b[90m";
inline constexpr const char* kColorRed = "\x1b[91m";
inline constexpr const char* kColorGreen = "\x1b[32m";
inline constexpr const char* kColorCyan = "\x1b[96m";
inline constexpr const char* kColorWhiteHigh = "\x1b[1;97m";
inline constexpr const char* kColorOrangeHigh = "\x1b[1;33m";

inline constexpr const char* kBackgroundPurple = "\x1b[105m";
inline constexpr const char* kBackgroundRed = "\x1b[101m";

//! \brief Whether the standard error stream is attached to an interactive terminal
bool is_terminal_stderr();

//! \brief Whether the standard output stream is attached to an interactive terminal
bool is_terminal_stdout();

}  // namespace zkcoord

#endif  // ZKCOORD_COMMON_TERMINAL_HPP_
