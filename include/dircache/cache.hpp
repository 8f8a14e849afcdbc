#pragma once
#include <dircache/config.hpp>
#include <dircache/locator.hpp>
#include <dircache/pipeline.hpp>

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dircache {

struct SavedArchive {
  std::string key;
  std::filesystem::path path;
  std::uintmax_t size{0};
};

struct RestoreOptions {
  bool lookup_only = false;
};

struct RestoreResult {
  std::string matched_key;
  bool exact_hit{false};
  CacheEntry entry;
};

class Cache {
public:
  explicit Cache(CacheConfig cfg,
                 std::shared_ptr<spdlog::logger> log = nullptr);

  // Only paths[0] is archived; further paths are accepted and ignored.
  SavedArchive save(const std::vector<std::string> &paths,
                    const std::string &key);

  // Unpacks the best entry into the parent directory of paths[0].
  // std::nullopt on a miss, in which case nothing is touched.
  std::optional<RestoreResult>
  restore(const std::vector<std::string> &paths,
          const std::string &primary_key,
          const std::optional<std::vector<std::string>> &restore_keys = {},
          const RestoreOptions &opts = {});

  std::filesystem::path archive_path(const std::string &key) const;

  const CacheConfig &config() const { return cfg_; }

private:
  void run(const std::vector<Stage> &stages, const PipelineOptions &opts);

  CacheConfig cfg_;
  Locator locator_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace dircache
