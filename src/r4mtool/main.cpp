#include <cstdint>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "commands/replay.hpp"
#include "commands/summary.hpp"
#include "r4mbase/cli/verbosity.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

int verbosity() { return args::get(verbosity_flag); }

void apply_verbosity() { r4mw4tch::cli::apply_verbosity(verbosity()); }
} // namespace cli

namespace {
int g_exit_code = 0;
} // namespace

void cmd_replay(args::Subparser& parser) {
  args::ValueFlag<std::string> frames(parser, "dir", "directory of recorded frame dumps", {'d', "frames"});
  args::ValueFlag<std::string> output(parser, "path", "event log path", {'o', "output"});
  args::ValueFlag<std::string> snapshots(parser, "dir", "snapshot directory", {"snapshots"});
  args::ValueFlag<uint32_t> chunks(parser, "count", "chunks per region pass", {"chunks"});
  args::ValueFlag<uint64_t> window(parser, "frames", "frequency window in frames", {"window"});
  args::ValueFlag<size_t> flush_threshold(parser, "lines", "buffered lines per flush", {"flush-threshold"});
  args::ValueFlag<uint64_t> frame_skip(parser, "n", "trace every n-th frame", {"frame-skip"});
  args::ValueFlag<uint64_t> limit(parser, "n", "stop after n frames", {"limit"});
  args::Flag header(parser, "header", "start the event log with a csv header row", {"header"});
  parser.Parse();

  cli::apply_verbosity();
  g_exit_code = r4mtool::commands::replay(
      frames, output, snapshots, chunks, window, flush_threshold, frame_skip, limit, header, cli::verbosity()
  );
}

void cmd_summary(args::Subparser& parser) {
  args::ValueFlag<std::string> file(parser, "path", "path to event log", {'f', "file"});
  args::ValueFlag<size_t> top(parser, "n", "number of hottest addresses to list", {'t', "top"});
  args::ValueFlag<std::string> region(parser, "name", "only count one region", {'r', "region"});
  parser.Parse();

  cli::apply_verbosity();
  g_exit_code = r4mtool::commands::summary(file, top, region);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "r4mtool - memory change tracer tools", "replay recorded frames through the tracer and inspect event logs"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command replay_cmd(commands, "replay", "trace a directory of recorded frame dumps", &cmd_replay);
  args::Command summary_cmd(commands, "summary", "summarize an event log", &cmd_summary);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
