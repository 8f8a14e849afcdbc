#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dircache {

struct CommonOpts {
  std::optional<std::string> cache_dir;
  std::optional<std::string> scope;
};

struct CmdSave {
  std::vector<std::string> paths;
  std::string key;
  CommonOpts common;
};

struct CmdRestore {
  std::vector<std::string> paths;
  std::string key;
  std::vector<std::string> restore_keys;
  bool lookup_only = false;
  bool fail_on_miss = false;
  CommonOpts common;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdSave, CmdRestore, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace dircache
