#pragma once

#include <args.hxx>
#include <string>

namespace r4mtool::commands {

/**
 * summary command - aggregates an event log written by the tracer
 */
int summary(
    args::ValueFlag<std::string>& file_flag, args::ValueFlag<size_t>& top_flag,
    args::ValueFlag<std::string>& region_flag
);

} // namespace r4mtool::commands
