#include <dircache/error.hpp>
#include <dircache/key.hpp>

#include <fmt/format.h>
#include <xxhash.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace dircache {

static constexpr char kReplacement = '!';
static constexpr std::string_view kReserved = "<>:\"/\\|?*";

static bool is_windows_device_name(std::string_view s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  static const std::array<std::string_view, 4> plain{"con", "prn", "aux",
                                                     "nul"};
  if (std::find(plain.begin(), plain.end(), lower) != plain.end())
    return true;
  if (lower.size() == 4 &&
      (lower.compare(0, 3, "com") == 0 || lower.compare(0, 3, "lpt") == 0))
    return std::isdigit(static_cast<unsigned char>(lower[3])) != 0;
  return false;
}

static std::string shorten(const std::string &s) {
  // 1 byte for '-' and 16 hex digits of the hash
  std::size_t keep = kMaxSanitizedLength - 17;
  // don't cut a UTF-8 sequence in half
  while (keep > 0 && (static_cast<unsigned char>(s[keep]) & 0xC0) == 0x80)
    --keep;
  auto h = XXH3_64bits(s.data(), s.size());
  return fmt::format("{}-{:016x}", s.substr(0, keep), h);
}

// code points, not bytes
static std::size_t utf8_length(std::string_view s) {
  std::size_t n = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80)
      ++n;
  return n;
}

std::string sanitize_key(std::string_view key) {
  std::string out;
  out.reserve(key.size());

  for (std::size_t i = 0; i < key.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(key[i]);
    if (c < 0x20 || c == 0x7F || kReserved.find(static_cast<char>(c)) !=
                                     std::string_view::npos) {
      out += kReplacement;
    } else if (c == 0xC2 && i + 1 < key.size() &&
               static_cast<unsigned char>(key[i + 1]) >= 0x80 &&
               static_cast<unsigned char>(key[i + 1]) <= 0x9F) {
      // U+0080..U+009F
      out += kReplacement;
      ++i;
    } else {
      out += static_cast<char>(c);
    }
  }

  std::string collapsed;
  collapsed.reserve(out.size());
  for (char c : out) {
    if (c == kReplacement && !collapsed.empty() &&
        collapsed.back() == kReplacement)
      continue;
    collapsed += c;
  }
  out.swap(collapsed);

  if (out.size() > 1) {
    if (out.front() == kReplacement)
      out.erase(0, 1);
    if (out.size() > 1 && out.back() == kReplacement)
      out.pop_back();
  }

  // ".", ".." and hidden names; the locator skips dot files
  if (!out.empty() && out.front() == '.') {
    out.erase(0, out.find_first_not_of('.'));
    if (out.empty() || out.front() != kReplacement)
      out.insert(out.begin(), kReplacement);
  }

  while (!out.empty() && out.back() == '.')
    out.pop_back();
  if (out.empty())
    out += kReplacement;

  if (is_windows_device_name(out))
    out += kReplacement;

  if (out.size() > kMaxSanitizedLength)
    out = shorten(out);
  return out;
}

void validate_key(const std::string &key) {
  if (key.empty()) {
    throw CacheError(ErrorKind::Validation,
                     "Key Validation Error: key is required.");
  }
  if (utf8_length(key) > kMaxKeyLength) {
    throw CacheError(ErrorKind::Validation,
                     fmt::format("Key Validation Error: {} cannot be larger "
                                 "than {} characters.",
                                 key, kMaxKeyLength));
  }
  if (key.find(',') != std::string::npos) {
    throw CacheError(ErrorKind::Validation,
                     fmt::format("Key Validation Error: {} cannot contain "
                                 "commas.",
                                 key));
  }
}

void validate_paths(const std::vector<std::string> &paths) {
  if (paths.empty()) {
    throw CacheError(ErrorKind::Validation,
                     "Path Validation Error: At least one directory or file "
                     "path is required");
  }
}

std::vector<std::string>
normalize_restore_keys(const std::optional<std::vector<std::string>> &keys) {
  std::vector<std::string> out;
  if (!keys)
    return out;
  for (const auto &k : *keys) {
    if (k.empty())
      continue;
    validate_key(k);
    out.push_back(k);
  }
  return out;
}

} // namespace dircache
