#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "fixture.hpp"

#include <dircache/cache.hpp>

using namespace dircache;
using namespace std::chrono_literals;

static CacheConfig config_in(const fs::path& base, const std::string& scope = "integration-test"){
  CacheConfig cfg{};
  cfg.root = base / "__tmp__";
  cfg.scope = scope;
  return cfg;
}

using Keys = std::vector<std::string>;

TEST_CASE("restore from fallback key") {
  auto base = mkd("fallback");
  auto data = make_fixture(base);
  auto before = snapshot(data);
  Cache cache(config_in(base));

  cache.save({data.string()}, "fallback-test");
  fs::remove_all(data);

  auto res = cache.restore({data.string()}, "fallback-test-doesnt-exist", Keys{"fallback-test"});
  REQUIRE(res);
  REQUIRE(res->matched_key == "fallback-test");
  REQUIRE_FALSE(res->exact_hit);
  REQUIRE(snapshot(data) == before);
}

TEST_CASE("restore latest archive for a shared prefix") {
  auto base = mkd("latest");
  auto data = make_fixture(base);
  Cache cache(config_in(base));

  cache.save({data.string()}, "latest-archive-test-1");
  set_age(cache.archive_path("latest-archive-test-1"), 60s);
  fs::remove(data / "helloWorld.txt");
  cache.save({data.string()}, "latest-archive-test-2");
  fs::remove_all(data);

  SECTION("as a fallback key") {
    auto res = cache.restore({data.string()}, "latest-archive-test-3", Keys{"latest-archive-test"});
    REQUIRE(res);
    REQUIRE(res->matched_key == "latest-archive-test");
    REQUIRE_FALSE(res->exact_hit);
    REQUIRE(res->entry.name == "latest-archive-test-2.tar.lz4");
  }
  SECTION("as the primary key") {
    // the primary key is matched by prefix too and counts as exact
    auto res = cache.restore({data.string()}, "latest-archive-test");
    REQUIRE(res);
    REQUIRE(res->exact_hit);
    REQUIRE(res->entry.name == "latest-archive-test-2.tar.lz4");
  }

  REQUIRE(fs::exists(data / "primes.txt"));
  REQUIRE_FALSE(fs::exists(data / "helloWorld.txt"));
}

TEST_CASE("first restore key with any match wins over a newer one") {
  auto base = mkd("first_wins");
  auto data = base / "data";
  Cache cache(config_in(base));

  write_file(data / "version.txt", "v1");
  cache.save({data.string()}, "v1-deps");
  set_age(cache.archive_path("v1-deps"), 120s);

  write_file(data / "version.txt", "v2");
  cache.save({data.string()}, "v2-deps");
  fs::remove_all(data);

  auto res = cache.restore({data.string()}, "v3-deps", Keys{"v1-deps", "v2-deps"});
  REQUIRE(res);
  REQUIRE(res->matched_key == "v1-deps");
  REQUIRE_FALSE(res->exact_hit);
  REQUIRE(read_file(data / "version.txt") == "v1");
}

TEST_CASE("primary key is tried before restore keys") {
  auto base = mkd("primary_first");
  auto data = base / "data";
  Cache cache(config_in(base));

  write_file(data / "version.txt", "fallback");
  cache.save({data.string()}, "deps-fallback");
  write_file(data / "version.txt", "exact");
  cache.save({data.string()}, "deps-exact");
  set_age(cache.archive_path("deps-exact"), 300s);
  fs::remove_all(data);

  auto res = cache.restore({data.string()}, "deps-exact", Keys{"deps-"});
  REQUIRE(res);
  REQUIRE(res->exact_hit);
  REQUIRE(read_file(data / "version.txt") == "exact");
}

TEST_CASE("keys with reserved characters round-trip") {
  auto base = mkd("reserved");
  auto data = make_fixture(base);
  Cache cache(config_in(base));

  auto saved = cache.save({data.string()}, "linux/x64:node<18>");
  REQUIRE(saved.path.filename() == "linux!x64!node!18.tar.lz4");
  fs::remove_all(data);

  auto res = cache.restore({data.string()}, "linux/x64:node<18>");
  REQUIRE(res);
  REQUIRE(res->matched_key == "linux/x64:node<18>");
  REQUIRE(res->exact_hit);
  REQUIRE(fs::exists(data / "primes.txt"));
}

TEST_CASE("empty restore keys are ignored") {
  auto base = mkd("empty_restore_keys");
  auto data = make_fixture(base);
  Cache cache(config_in(base));
  cache.save({data.string()}, "something");

  REQUIRE_FALSE(cache.restore({data.string()}, "other", Keys{"", ""}));
}

TEST_CASE("scopes do not see each other's entries") {
  auto base = mkd("scopes");
  auto data = make_fixture(base);
  Cache a(config_in(base, "org/a"));
  Cache b(config_in(base, "org/b"));

  a.save({data.string()}, "shared-key");
  REQUIRE(a.restore({data.string()}, "shared-key", std::nullopt, RestoreOptions{true}));
  REQUIRE_FALSE(b.restore({data.string()}, "shared-key"));
}
