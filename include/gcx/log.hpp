#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace gcx::log {

// Creates the shared "gcx" stderr logger on first use.
std::shared_ptr<spdlog::logger> get();

// level: trace, debug, info, warn, error, critical, off. Unknown names keep info.
void init(const std::string& level = "info");

} // namespace gcx::log
