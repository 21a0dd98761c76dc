#pragma once
#include <mergeimport/config.hpp>

#include <memory>
#include <spdlog/spdlog.h>

namespace mergeimport {

// stderr logger with colour, level and pattern taken from opts.
// Replaces any registered logger of the same name.
std::shared_ptr<spdlog::logger> make_logger(const LogOptions &opts);

} // namespace mergeimport
