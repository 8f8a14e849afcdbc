#pragma once

namespace dircache {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace dircache
