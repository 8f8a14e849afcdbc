#pragma once
#include <dircache/config.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dircache {

struct CacheEntry {
  std::filesystem::path path;
  std::string name;
  std::filesystem::file_time_type mtime{};
  std::uintmax_t size{0};
};

struct Candidate {
  std::string key;       // as given by the caller
  std::string sanitized; // file name prefix it matches
};

struct LocateResult {
  std::string key;
  CacheEntry entry;
};

// Picks the first candidate with at least one entry whose name starts with
// it, then the newest of those entries (the later one in `entries` on ties).
std::optional<LocateResult> locate(const std::vector<Candidate> &candidates,
                                   const std::vector<CacheEntry> &entries);

class Locator {
public:
  explicit Locator(CacheConfig cfg) : cfg_(std::move(cfg)) {}

  // Regular files in the cache dir matching any candidate, ordered by name.
  std::vector<CacheEntry> scan(const std::vector<Candidate> &candidates) const;

  std::optional<LocateResult>
  resolve(const std::string &primary_key,
          const std::vector<std::string> &restore_keys = {}) const;

  const CacheConfig &config() const { return cfg_; }

private:
  CacheConfig cfg_;
};

} // namespace dircache
