#include <dircache/app.hpp>
#include <dircache/cache.hpp>
#include <dircache/cli.hpp>
#include <dircache/config.hpp>
#include <dircache/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

#ifndef DIRCACHE_VERSION
#define DIRCACHE_VERSION "unknown"
#endif

namespace dircache {

static void print_help() {
  std::cout <<
      R"(dircache - key-based save/restore of a directory to a local cache

Usage:
  dircache save    --path <dir> --key <key> [--cache-dir <dir>] [--scope <name>]
  dircache restore --path <dir> --key <key> [--restore-key <prefix>]...
                   [--restore-keys "<prefix>\n<prefix>"] [--lookup-only]
                   [--fail-on-cache-miss] [--cache-dir <dir>] [--scope <name>]
  dircache version

Environment:
  CACHE_DIR            cache root (default /media/cache)
  GITHUB_REPOSITORY    scope the entries are stored under
  DIRCACHE_LOG_LEVEL   trace|debug|info|warn|err|critical|off
)";
}

static void apply_log_level() {
  if (const char *lvl = ::getenv("DIRCACHE_LOG_LEVEL")) {
    auto level = spdlog::level::from_str(lvl);
    spdlog::set_level(level);
  }
}

static CacheConfig make_config(const CommonOpts &c) {
  CacheConfig cfg = CacheConfig::from_env();
  if (c.cache_dir)
    cfg.root = *c.cache_dir;
  if (c.scope)
    cfg.scope = *c.scope;
  return cfg;
}

int App::run(int argc, char **argv) {
  apply_log_level();

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("dircache {}\n", DIRCACHE_VERSION);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdSave>) {
            Cache cache(make_config(c.common));
            auto saved = cache.save(c.paths, c.key);
            std::cout << "cache-path=" << saved.path.string() << "\n";
            return 0;

          } else if constexpr (std::is_same_v<T, CmdRestore>) {
            Cache cache(make_config(c.common));
            RestoreOptions opts{};
            opts.lookup_only = c.lookup_only;
            auto res = cache.restore(c.paths, c.key, c.restore_keys, opts);

            std::cout << "cache-hit=" << (res && res->exact_hit ? "true" : "false")
                      << "\n";
            if (res) {
              std::cout << "cache-matched-key=" << res->matched_key << "\n";
              return 0;
            }
            if (c.fail_on_miss) {
              spdlog::error("Failed to restore cache entry. Exiting as "
                            "fail-on-cache-miss is set. Input key: {}",
                            c.key);
              return 1;
            }
            return 0;
          }
        },
        *pr.cmd);
  } catch (const CacheError &e) {
    spdlog::error("{}: {}", to_string(e.kind()), e.what());
    return e.kind() == ErrorKind::Validation ? 2 : 1;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace dircache
