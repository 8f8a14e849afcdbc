#include <dircache/cli.hpp>

#include <sstream>
#include <string_view>

namespace dircache {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

// newline separated list, as multi-line workflow inputs arrive
static void append_lines(const std::string &text,
                         std::vector<std::string> &out) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (!line.empty())
      out.push_back(line);
  }
}

// Consumes options shared by save and restore. Returns false when argv[i]
// is not one of them; sets `err` when it is but its value is missing.
static bool parse_common(int &i, int argc, char **argv, CommonOpts &c,
                         std::string &err) {
  std::string_view a = argv[i];
  if (a != "--cache-dir" && a != "--scope")
    return false;
  if (!has_arg(i, argc)) {
    err = std::string(a) + ": value required";
    return true;
  }
  if (a == "--cache-dir")
    c.cache_dir = argv[++i];
  else
    c.scope = argv[++i];
  return true;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "save") {
    CmdSave c{};
    bool have_key = false;
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (parse_common(i, argc, argv, c.common, r.error)) {
        if (!r.error.empty())
          return r;
      } else if (a == "--path" && has_arg(i, argc)) {
        c.paths.push_back(argv[++i]);
      } else if (a == "--key" && has_arg(i, argc)) {
        c.key = argv[++i];
        have_key = true;
      } else {
        r.error = "save: unexpected argument: " + std::string(a);
        return r;
      }
    }
    if (!have_key) {
      r.error = "save: --key required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "restore") {
    CmdRestore c{};
    bool have_key = false;
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (parse_common(i, argc, argv, c.common, r.error)) {
        if (!r.error.empty())
          return r;
      } else if (a == "--path" && has_arg(i, argc)) {
        c.paths.push_back(argv[++i]);
      } else if (a == "--key" && has_arg(i, argc)) {
        c.key = argv[++i];
        have_key = true;
      } else if (a == "--restore-key" && has_arg(i, argc)) {
        c.restore_keys.push_back(argv[++i]);
      } else if (a == "--restore-keys" && has_arg(i, argc)) {
        append_lines(argv[++i], c.restore_keys);
      } else if (a == "--lookup-only") {
        c.lookup_only = true;
      } else if (a == "--fail-on-cache-miss") {
        c.fail_on_miss = true;
      } else {
        r.error = "restore: unexpected argument: " + std::string(a);
        return r;
      }
    }
    if (!have_key) {
      r.error = "restore: --key required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace dircache
