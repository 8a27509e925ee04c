#pragma once

namespace procmux {

struct App {
  int run(int argc, char **argv);
};

} // namespace procmux
