#include <procmux/app.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  // диагностика в stderr, stdout занят мультиплексированным выводом
  spdlog::set_default_logger(spdlog::stderr_color_mt("procmux"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::cfg::load_env_levels();
  return procmux::App{}.run(argc, argv);
}
