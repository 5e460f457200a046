#pragma once

#include "chronicle/time_types.hpp"
#include <string>

namespace chronicle {

// Time-ordered UUIDv7. Ids generated within one process sort by creation order.
std::string generate_uuid_v7();
std::string generate_uuid_v7(Instant now);

} // namespace chronicle
