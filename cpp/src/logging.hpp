#pragma once

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace llm_typed {

using Logger = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

// Named logger cloned from the default one; registered on first use so SPDLOG_LEVEL applies per name.
LoggerPtr get_logger(const std::string& name);

}  // namespace llm_typed
