#pragma once
#include <filesystem>
#include <string>

namespace dircache {

struct CacheConfig {
  std::filesystem::path root = "/media/cache";
  std::string scope; // repository the entries belong to, e.g. "owner/repo"

  std::string suffix = ".tar.lz4";
  std::string archiver = "tar";
  std::string compressor = "lz4";

  // root/scope; entries for one project live directly inside it
  std::filesystem::path cache_dir() const;

  // CACHE_DIR and GITHUB_REPOSITORY, empty values are ignored
  static CacheConfig from_env();
};

// Throws CacheError(Validation) when the scope is absolute or escapes the
// root through "..".
void validate_scope(const std::string &scope);

} // namespace dircache
