#pragma once
#include <dircache/error.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// свежий каталог на каждый тест: <tmp>/dircache_<name>_<pid>
inline fs::path mkd(const std::string& name){
  auto d = fs::temp_directory_path() /
           ("dircache_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

inline void write_file(const fs::path& p, const std::string& content){
  fs::create_directories(p.parent_path());
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << content;
}

inline std::string read_file(const fs::path& p){
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// relative path -> content; directories map to "<dir>"
inline std::map<std::string, std::string> snapshot(const fs::path& root){
  std::map<std::string, std::string> out;
  if (!fs::exists(root)) return out;
  for (auto& e : fs::recursive_directory_iterator(root)) {
    auto rel = fs::relative(e.path(), root).string();
    out[rel] = e.is_directory() ? std::string("<dir>") : read_file(e.path());
  }
  return out;
}

// data/{helloWorld.txt, primes.txt, nested/deep/value.bin}
inline fs::path make_fixture(const fs::path& base){
  auto data = base / "data";
  write_file(data / "helloWorld.txt", "Hello World!\n");
  write_file(data / "primes.txt", "2\n3\n5\n7\n11\n13\n");
  write_file(data / "nested" / "deep" / "value.bin", std::string("\x00\x01\x02\xff", 4));
  return data;
}

inline void set_age(const fs::path& p, std::chrono::seconds age){
  fs::last_write_time(p, fs::file_time_type::clock::now() - age);
}

inline dircache::ErrorKind kind_of(const std::function<void()>& f){
  try {
    f();
  } catch (const dircache::CacheError& e) {
    return e.kind();
  }
  throw std::runtime_error("expected CacheError");
}
