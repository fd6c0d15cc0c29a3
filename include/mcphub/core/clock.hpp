#pragma once

#include <cstdint>
#include <string>

namespace mcphub {

// Current wall-clock time as ISO-8601 UTC with millisecond precision,
// e.g. "2025-01-31T12:00:00.000Z".
std::string Iso8601Now();

// Milliseconds since the Unix epoch.
int64_t NowEpochMillis();

} // namespace mcphub
