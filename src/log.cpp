#include <gcx/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gcx::log {

static std::shared_ptr<spdlog::logger> make_logger_() {
  if (auto existing = spdlog::get("gcx")) return existing;
  auto lg = spdlog::stderr_color_mt("gcx");
  lg->set_pattern("[%H:%M:%S.%e][%l] %v");
  lg->set_level(spdlog::level::info);
  return lg;
}

std::shared_ptr<spdlog::logger> get() {
  static std::shared_ptr<spdlog::logger> g_logger = make_logger_();
  return g_logger;
}

void init(const std::string& level) {
  auto lg = get();
  const auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && level != "off") {
    lg->set_level(spdlog::level::info);
    lg->warn("unknown log level '{}', using info", level);
    return;
  }
  lg->set_level(lvl);
}

} // namespace gcx::log
