#pragma once

#include <sortid/config.hpp>
#include <sortid/ulid.hpp>
#include <string>

namespace sortid {

// One-line rendering of `id` for the generate command
std::string format_ulid(const Ulid& id, OutputFormat format);

// Multi-line breakdown of `id`: text, raw hex, UTC time, timestamp, random
// payload and UUID form
std::string describe(const Ulid& id);

} // namespace sortid
