#include <dircache/config.hpp>
#include <dircache/error.hpp>

#include <cstdlib>

namespace fs = std::filesystem;

namespace dircache {

static const char *env_or_null(const char *name) {
  const char *v = ::getenv(name);
  return (v && *v) ? v : nullptr;
}

fs::path CacheConfig::cache_dir() const {
  if (scope.empty())
    return root;
  return root / scope;
}

CacheConfig CacheConfig::from_env() {
  CacheConfig cfg{};
  if (const char *dir = env_or_null("CACHE_DIR"))
    cfg.root = dir;
  if (const char *repo = env_or_null("GITHUB_REPOSITORY"))
    cfg.scope = repo;
  return cfg;
}

void validate_scope(const std::string &scope) {
  fs::path p(scope);
  if (p.is_absolute())
    throw CacheError(ErrorKind::Validation,
                     "Scope Validation Error: " + scope +
                         " must be a relative path.");
  for (const auto &part : p) {
    if (part == "..")
      throw CacheError(ErrorKind::Validation,
                       "Scope Validation Error: " + scope +
                           " cannot contain '..'.");
  }
}

} // namespace dircache
