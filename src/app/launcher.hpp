#pragma once

#include "core/browser.hpp"

#include <string>
#include <string_view>

namespace waypoint::app
{

//! Single-quotes |argument| for /bin/sh.
[[nodiscard]] std::string QuotePosixArgument(std::string_view argument);

//! Double-quotes |argument| for cmd.exe. Embedded quotes become %22.
[[nodiscard]] std::string QuoteWindowsArgument(std::string_view argument);

//! Quotes one argument for the platform shell used by std::system.
[[nodiscard]] std::string QuoteArgument(std::string_view argument);

//! Shell command that starts |browser| detached with its stored arguments
//! followed by |url|.
[[nodiscard]] std::string BuildLaunchCommand(const BrowserCandidate& browser, std::string_view url);

/**
 * @brief Starts |browser| with |url| and returns once the shell has handed it off.
 *
 * Returns false without launching when the executable no longer exists, and
 * false when the shell reports a non-zero status.
 */
bool Launch(const BrowserCandidate& browser, std::string_view url);

} // namespace waypoint::app
