#include <dircache/error.hpp>

namespace dircache {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "ValidationError";
  case ErrorKind::Operational:
    return "OperationalError";
  case ErrorKind::Reserve:
    return "ReserveCacheError";
  }
  return "CacheError";
}

} // namespace dircache
