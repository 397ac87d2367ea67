#include <cmdgate/app.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  try {
    return cmdgate::App{}.run(argc, argv);
  } catch (const std::exception &e) {
    spdlog::critical("{}", e.what());
    return 1;
  }
}
