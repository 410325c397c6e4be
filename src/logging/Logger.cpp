//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members (level seeded from BASICAUTH_LOG_LEVEL).
//==========================================================================================================

#include "logging/Logger.h"

// Define static members
LogLevel Logger::sLogLevel = Logger::levelFromEnvironment();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
