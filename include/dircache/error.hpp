#pragma once
#include <stdexcept>
#include <string>

namespace dircache {

enum class ErrorKind {
  Validation,  // malformed key, scope or path list; raised before any I/O
  Operational, // pack/unpack pipeline failed
  Reserve      // cache already reserved under the key (not raised yet)
};

const char *to_string(ErrorKind kind);

class CacheError : public std::runtime_error {
public:
  CacheError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace dircache
