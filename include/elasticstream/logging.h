/**
 * \file
 * Module for maintain log messages.
 */

#pragma once
#include <string>
#include <functional>

#ifndef __GNUC__
#undef ERROR
#endif

/// The elasticstream namespace
namespace elasticstream {


/// Levels of logging
enum class LogLevel {
    FATAL   = 0,
    ERROR   = 1,
    WARNING = 2,
    INFO    = 3,
    DEBUG   = 4
};


/// Definition of LogCallback
using LogCallback = std::function<void(LogLevel, const std::string &)>;


/// Return upper-case name of \p logLevel (i.e. "WARNING").
const char *logLevelName(LogLevel logLevel);


/**
 * Function for set custom logging callback. If logging is wanted it is recomended to set custom
 * callback before using any of elasticstream class.
 * If custom LogCallback function is not set logging is disabled.
 */
void setLogFunction(LogCallback extLogFunction);


} // namespace elasticstream
