#include <mergeimport/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mergeimport {

std::shared_ptr<spdlog::logger> make_logger(const LogOptions &opts) {
  spdlog::drop(opts.name);
  auto logger = spdlog::stderr_color_mt(opts.name);
  logger->set_pattern(opts.pattern);
  logger->set_level(spdlog::level::from_str(opts.level));
  return logger;
}

} // namespace mergeimport
