#include <dircache/format.hpp>

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <ctime>

namespace dircache {

std::string pretty_bytes(std::uintmax_t bytes) {
  static const std::array<const char *, 7> units{"B",  "kB", "MB", "GB",
                                                 "TB", "PB", "EB"};
  if (bytes < 1000)
    return fmt::format("{} B", bytes);

  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  // 999.6 kB would print as "1e+03 kB"
  while (value >= 999.5 && unit + 1 < units.size()) {
    value /= 1000.0;
    ++unit;
  }
  return fmt::format("{:.3g} {}", value, units[unit]);
}

std::string iso8601(std::filesystem::file_time_type t) {
  using namespace std::chrono;
  auto sys = time_point_cast<system_clock::duration>(
      t - std::filesystem::file_time_type::clock::now() + system_clock::now());
  std::time_t tt = system_clock::to_time_t(sys);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  char buf[64];
  std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
  return std::string(buf);
}

} // namespace dircache
