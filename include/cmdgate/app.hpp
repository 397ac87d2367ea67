#pragma once
#include <iosfwd>

namespace cmdgate {

class App {
public:
  App();
  App(std::istream &in, std::ostream &out);

  int run(int argc, char **argv);

private:
  std::istream &in_;
  std::ostream &out_;
};

} // namespace cmdgate
