#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace dircache {

struct Stage {
  std::vector<std::string> argv;
  bool discard_stderr = false;
};

struct PipelineOptions {
  // when set, the last stage writes here (truncated) instead of the relay
  std::filesystem::path stdout_file;
};

using LineHandler = std::function<void(const std::string &)>;

// Runs `stages` connected stdout->stdin and blocks until all of them exit.
// Output is relayed line by line from one reader thread per stream while the
// stages run. Returns the rightmost non-zero exit status, or 0.
// Throws std::system_error when pipes or processes cannot be created.
int run_pipeline(const std::vector<Stage> &stages,
                 const PipelineOptions &opts,
                 const LineHandler &on_stdout,
                 const LineHandler &on_stderr);

std::string describe(const std::vector<Stage> &stages);

} // namespace dircache
