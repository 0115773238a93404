#pragma once

#include <args.hxx>
#include <string>

namespace r4mtool::commands {

/**
 * replay command - runs the tracer over a directory of recorded frames
 */
int replay(
    args::ValueFlag<std::string>& frames_flag, args::ValueFlag<std::string>& output_flag,
    args::ValueFlag<std::string>& snapshots_flag, args::ValueFlag<uint32_t>& chunks_flag,
    args::ValueFlag<uint64_t>& window_flag, args::ValueFlag<size_t>& flush_threshold_flag,
    args::ValueFlag<uint64_t>& frame_skip_flag, args::ValueFlag<uint64_t>& limit_flag, args::Flag& header_flag,
    int verbosity
);

} // namespace r4mtool::commands
