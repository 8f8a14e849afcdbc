#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dircache {

constexpr std::size_t kMaxKeyLength = 255;

// Sanitized names longer than this are shortened and suffixed with a hash.
constexpr std::size_t kMaxSanitizedLength = 200;

// Maps a cache key to a string usable as a single path segment.
std::string sanitize_key(std::string_view key);

// Throw CacheError(Validation); no side effects.
void validate_key(const std::string &key);
void validate_paths(const std::vector<std::string> &paths);

// Drops empty entries and validates the rest.
std::vector<std::string>
normalize_restore_keys(const std::optional<std::vector<std::string>> &keys);

} // namespace dircache
