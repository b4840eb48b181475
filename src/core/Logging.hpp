#pragma once

namespace creak {

/// Routes BOOST_LOG_TRIVIAL output to stderr. Warnings and above by default;
/// everything when CREAK_DEBUG is set in the environment.
void initLogging();

} // namespace creak
