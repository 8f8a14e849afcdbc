#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace dircache {

// 0 B, 999 B, 1.5 kB, 12.3 MB ...
std::string pretty_bytes(std::uintmax_t bytes);

std::string iso8601(std::filesystem::file_time_type t);

} // namespace dircache
