/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace tagnorm::log {
void set_debug(bool enabled);

void info(const char* fmt, ...);
void status(const char* fmt, ...);
void error(const char* fmt, ...);
void debug(const char* fmt, ...);
}  // namespace tagnorm::log

#define TAGNORM_LOG_INFO(fmt, ...) ::tagnorm::log::info(fmt, ##__VA_ARGS__)
#define TAGNORM_LOG_STATUS(fmt, ...) ::tagnorm::log::status(fmt, ##__VA_ARGS__)
#define TAGNORM_LOG_ERROR(fmt, ...) ::tagnorm::log::error(fmt, ##__VA_ARGS__)
#define TAGNORM_LOG_DEBUG(fmt, ...) ::tagnorm::log::debug(fmt, ##__VA_ARGS__)
