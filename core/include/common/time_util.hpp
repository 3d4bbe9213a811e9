#pragma once

#include <string>

namespace tp {
    // Seconds since the unix epoch, sub-second precision.
    double wall_seconds_now();

    // Local hour of day in [0, 23].
    int local_hour_now();

    // 32 lowercase hex characters, suitable for session ids and upload names.
    std::string random_hex_id();
}
