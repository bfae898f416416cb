/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace j2m::log {
void info(const char* fmt, ...);
void error(const char* fmt, ...);

// Used when stdout carries converted output.
void info_to_stderr();
}  // namespace j2m::log

#define J2M_LOG_INFO(fmt, ...) ::j2m::log::info(fmt, ##__VA_ARGS__)
#define J2M_LOG_ERROR(fmt, ...) ::j2m::log::error(fmt, ##__VA_ARGS__)
