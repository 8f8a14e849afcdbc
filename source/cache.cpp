#include <dircache/cache.hpp>
#include <dircache/error.hpp>
#include <dircache/format.hpp>
#include <dircache/key.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <system_error>

namespace fs = std::filesystem;

namespace dircache {

namespace {

struct Target {
  fs::path parent; // tar -C
  std::string name;
};

Target split_target(const std::string &raw) {
  fs::path p(raw);
  // "data/" means "data"
  if (!p.has_filename() && p.has_parent_path())
    p = p.parent_path();
  if (!p.has_filename())
    throw CacheError(ErrorKind::Operational,
                     fmt::format("Cannot cache {}: no directory name", raw));

  Target t{p.parent_path(), p.filename().string()};
  if (t.parent.empty())
    t.parent = ".";
  if (t.name.front() == '-')
    t.name = "./" + t.name;
  return t;
}

std::string join_keys(const std::string &primary,
                      const std::vector<std::string> &rest) {
  std::string out = primary;
  for (const auto &k : rest)
    out += ", " + k;
  return out;
}

} // namespace

Cache::Cache(CacheConfig cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(std::move(cfg)), locator_(cfg_),
      log_(log ? std::move(log) : spdlog::default_logger()) {}

fs::path Cache::archive_path(const std::string &key) const {
  return cfg_.cache_dir() / (sanitize_key(key) + cfg_.suffix);
}

void Cache::run(const std::vector<Stage> &stages,
                const PipelineOptions &opts) {
  const auto cmd = describe(stages);
  log_->debug("[cache] exec: {}", cmd);

  int rc = 0;
  try {
    rc = run_pipeline(
        stages, opts, [this](const std::string &l) { log_->info("{}", l); },
        [this](const std::string &l) { log_->warn("{}", l); });
  } catch (const std::system_error &e) {
    throw CacheError(ErrorKind::Operational,
                     fmt::format("{}: {}", cmd, e.what()));
  }
  if (rc != 0) {
    throw CacheError(ErrorKind::Operational,
                     fmt::format("Command failed with exit code {}: {}", rc,
                                 cmd));
  }
}

SavedArchive Cache::save(const std::vector<std::string> &paths,
                         const std::string &key) {
  validate_paths(paths);
  validate_key(key);
  validate_scope(cfg_.scope);

  if (paths.size() > 1) {
    log_->warn("[cache] only the first path is cached, ignoring {} more",
               paths.size() - 1);
  }
  const std::string &src = paths.front();
  const Target target = split_target(src);

  std::error_code ec;
  if (!fs::exists(src, ec)) {
    throw CacheError(ErrorKind::Operational,
                     fmt::format("Path does not exist: {}", src));
  }

  const fs::path dir = cfg_.cache_dir();
  fs::create_directories(dir, ec);
  if (ec) {
    throw CacheError(ErrorKind::Operational,
                     fmt::format("Cannot create cache directory {}: {}",
                                 dir.string(), ec.message()));
  }

  const fs::path dest = archive_path(key);
  const std::string name = dest.filename().string();
  // имя с точкой: локатор не увидит недописанный архив
  const fs::path tmp = dir / fmt::format(".{}.{}.tmp", name, ::getpid());

  log_->info("[cache] Save cache: {}", name);

  const std::vector<Stage> stages{
      {{cfg_.archiver, "cf", "-", "-C", target.parent.string(), target.name},
       false},
      {{cfg_.compressor, "-c"}, true},
  };

  auto drop_tmp = [&] {
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    if (rm_ec)
      log_->warn("[cache] cannot remove {}: {}", tmp.string(),
                 rm_ec.message());
  };

  try {
    run(stages, PipelineOptions{tmp});
  } catch (const CacheError &) {
    drop_tmp();
    throw;
  }

  fs::rename(tmp, dest, ec);
  if (ec) {
    drop_tmp();
    throw CacheError(ErrorKind::Operational,
                     fmt::format("Cannot move archive into place {}: {}",
                                 dest.string(), ec.message()));
  }

  SavedArchive saved{key, dest, fs::file_size(dest, ec)};
  if (ec)
    saved.size = 0;
  log_->info("[cache] Cache saved: {} ({})", name, pretty_bytes(saved.size));
  return saved;
}

std::optional<RestoreResult>
Cache::restore(const std::vector<std::string> &paths,
               const std::string &primary_key,
               const std::optional<std::vector<std::string>> &restore_keys,
               const RestoreOptions &opts) {
  validate_key(primary_key);
  validate_paths(paths);
  const auto fallbacks = normalize_restore_keys(restore_keys);
  validate_scope(cfg_.scope);

  auto found = locator_.resolve(primary_key, fallbacks);
  if (!found) {
    log_->info("[cache] Cache not found for input keys: {}",
               join_keys(primary_key, fallbacks));
    return std::nullopt;
  }

  RestoreResult res{found->key, found->key == primary_key,
                    std::move(found->entry)};
  log_->info("[cache] Restoring cache: {}", res.entry.name);
  log_->info("[cache] Created: {}", iso8601(res.entry.mtime));
  log_->info("[cache] Size: {}", pretty_bytes(res.entry.size));

  if (opts.lookup_only) {
    log_->info("[cache] Lookup only, {} not extracted", res.entry.name);
    return res;
  }

  const Target target = split_target(paths.front());
  std::error_code ec;
  fs::create_directories(target.parent, ec);
  if (ec) {
    throw CacheError(ErrorKind::Operational,
                     fmt::format("Cannot create {}: {}",
                                 target.parent.string(), ec.message()));
  }

  const std::vector<Stage> stages{
      {{cfg_.compressor, "-d", "-c", res.entry.path.string()}, true},
      {{cfg_.archiver, "xf", "-", "-C", target.parent.string()}, false},
  };
  run(stages, {});

  log_->info("[cache] Cache restored from key: {}", res.matched_key);
  return res;
}

} // namespace dircache
