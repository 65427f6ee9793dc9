/**
 * \file
 * Implementation for log messages.
 */

#include "elasticstream/logging.h"

#include <utility>
#include "logging-impl.h"


namespace elasticstream {


/// LogCallback function
static LogCallback logFunction;


const char *logLevelName(LogLevel logLevel) {
    switch (logLevel) {
        case LogLevel::FATAL:   return "FATAL";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::DEBUG:   return "DEBUG";
    }
    return "UNKNOWN";
}


void setLogFunction(LogCallback extLogFunction) {
    logFunction = std::move(extLogFunction);
}


void log(LogLevel logLevel, const std::string &message) {
    if (logFunction) {
        logFunction(logLevel, message);
    }
}


} // namespace elasticstream
