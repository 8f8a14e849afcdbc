#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "fixture.hpp"

#include <dircache/config.hpp>

#include <cstdlib>

using namespace dircache;

TEST_CASE("cache dir is root joined with scope") {
  CacheConfig cfg{};
  cfg.root = "/var/cache/ci";
  REQUIRE(cfg.cache_dir() == fs::path("/var/cache/ci"));
  cfg.scope = "owner/repo";
  REQUIRE(cfg.cache_dir() == fs::path("/var/cache/ci/owner/repo"));
}

TEST_CASE("config from environment") {
  ::unsetenv("CACHE_DIR");
  ::unsetenv("GITHUB_REPOSITORY");
  auto def = CacheConfig::from_env();
  REQUIRE(def.root == fs::path("/media/cache"));
  REQUIRE(def.scope.empty());
  REQUIRE(def.suffix == ".tar.lz4");

  ::setenv("CACHE_DIR", "/tmp/ci-cache", 1);
  ::setenv("GITHUB_REPOSITORY", "integration-test", 1);
  auto cfg = CacheConfig::from_env();
  REQUIRE(cfg.root == fs::path("/tmp/ci-cache"));
  REQUIRE(cfg.scope == "integration-test");
  REQUIRE(cfg.cache_dir() == fs::path("/tmp/ci-cache/integration-test"));

  ::setenv("CACHE_DIR", "", 1);
  REQUIRE(CacheConfig::from_env().root == fs::path("/media/cache"));

  ::unsetenv("CACHE_DIR");
  ::unsetenv("GITHUB_REPOSITORY");
}

TEST_CASE("scope must stay below the cache root") {
  REQUIRE_NOTHROW(validate_scope(""));
  REQUIRE_NOTHROW(validate_scope("owner/repo"));
  REQUIRE(kind_of([] { validate_scope("/etc"); }) == ErrorKind::Validation);
  REQUIRE(kind_of([] { validate_scope("owner/../../x"); }) == ErrorKind::Validation);
}
