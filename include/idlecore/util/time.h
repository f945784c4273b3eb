#pragma once

#include <string>

namespace idlecore {

// Current wall-clock time as "YYYY-MM-DDTHH:MM:SSZ". Only used for metadata
// (replay headers); never feeds simulation state.
std::string utc_now_iso8601();

} // namespace idlecore
