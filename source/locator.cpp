#include <dircache/key.hpp>
#include <dircache/locator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace dircache {

static bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<LocateResult> locate(const std::vector<Candidate> &candidates,
                                   const std::vector<CacheEntry> &entries) {
  for (const auto &cand : candidates) {
    const CacheEntry *latest = nullptr;
    for (const auto &e : entries) {
      if (!starts_with(e.name, cand.sanitized))
        continue;
      if (!latest || e.mtime >= latest->mtime)
        latest = &e;
    }
    if (latest)
      return LocateResult{cand.key, *latest};
  }
  return std::nullopt;
}

std::vector<CacheEntry>
Locator::scan(const std::vector<Candidate> &candidates) const {
  std::vector<CacheEntry> out;
  const fs::path dir = cfg_.cache_dir();

  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return out;

  fs::directory_iterator it(dir, ec), end;
  if (ec) {
    spdlog::warn("[locator] cannot list {}: {}", dir.string(), ec.message());
    return out;
  }
  for (; it != end; it.increment(ec)) {
    if (ec)
      break;
    const auto &de = *it;
    std::error_code e2;
    if (!de.is_regular_file(e2))
      continue;
    std::string name = de.path().filename().string();
    if (name.empty() || name.front() == '.')
      continue;
    bool wanted = std::any_of(
        candidates.begin(), candidates.end(),
        [&](const Candidate &c) { return starts_with(name, c.sanitized); });
    if (!wanted)
      continue;

    // vanished between listing and stat
    auto mtime = de.last_write_time(e2);
    if (e2)
      continue;
    auto size = de.file_size(e2);
    if (e2)
      continue;
    out.push_back(CacheEntry{de.path(), std::move(name), mtime, size});
  }
  if (ec)
    spdlog::warn("[locator] listing {} stopped early: {}", dir.string(),
                 ec.message());

  std::sort(out.begin(), out.end(),
            [](const CacheEntry &a, const CacheEntry &b) {
              return a.name < b.name;
            });
  return out;
}

std::optional<LocateResult>
Locator::resolve(const std::string &primary_key,
                 const std::vector<std::string> &restore_keys) const {
  std::vector<Candidate> candidates;
  candidates.reserve(restore_keys.size() + 1);
  candidates.push_back({primary_key, sanitize_key(primary_key)});
  for (const auto &k : restore_keys)
    candidates.push_back({k, sanitize_key(k)});

  auto entries = scan(candidates);
  spdlog::debug("[locator] {} candidate file(s) in {}", entries.size(),
                cfg_.cache_dir().string());
  return locate(candidates, entries);
}

} // namespace dircache
