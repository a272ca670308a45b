#pragma once

#include <iostream>
#include <fstream>
#include <mutex>

#include "namespaces.h"
#include "util/str.h"
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

// Logger macros which should be used for efficiency:
// arguments are only formatted if the level is enabled.
#define LOG_SILLY(...) do { if (::httpsig::logger.get_threshold() <= ::httpsig::SILLY) ::httpsig::logger.silly(::httpsig::util::str(__VA_ARGS__)); } while (false)
#define LOG_DEBUG(...) do { if (::httpsig::logger.get_threshold() <= ::httpsig::DEBUG) ::httpsig::logger.debug(::httpsig::util::str(__VA_ARGS__)); } while (false)
#define LOG_VERBOSE(...) do { if (::httpsig::logger.get_threshold() <= ::httpsig::VERBOSE) ::httpsig::logger.verbose(::httpsig::util::str(__VA_ARGS__)); } while (false)
#define LOG_INFO(...) do { if (::httpsig::logger.get_threshold() <= ::httpsig::INFO) ::httpsig::logger.info(::httpsig::util::str(__VA_ARGS__)); } while (false)
#define LOG_WARN(...) do { if (::httpsig::logger.get_threshold() <= ::httpsig::WARN) ::httpsig::logger.warn(::httpsig::util::str(__VA_ARGS__)); } while (false)
#define LOG_ERROR(...) do { if (::httpsig::logger.get_threshold() <= ::httpsig::ERROR) ::httpsig::logger.error(::httpsig::util::str(__VA_ARGS__)); } while (false)
#define LOG_ABORT(...) ::httpsig::logger.abort(::httpsig::util::str(__VA_ARGS__))

namespace httpsig {

// Standard log levels, ascending order of specificity.
enum log_level_t { SILLY, DEBUG, VERBOSE, INFO, WARN, ERROR, ABORT };

log_level_t default_log_level();

// Case-insensitive, e.g. "warn" or "DEBUG".
boost::optional<log_level_t> parse_log_level(boost::string_view);

inline std::ostream& operator<<(std::ostream& os, log_level_t ll) {
    switch (ll) {
        case SILLY:   return os << "SILLY";
        case DEBUG:   return os << "DEBUG";
        case VERBOSE: return os << "VERBOSE";
        case INFO:    return os << "INFO";
        case WARN:    return os << "WARN";
        case ERROR:   return os << "ERROR";
        case ABORT:   return os << "ABORT";
    }
    return os << "???";
}

class Logger
{
  public:
    Logger(log_level_t threshold);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    log_level_t get_threshold() const { return threshold; }
    void set_threshold(log_level_t level);
    bool would_log(log_level_t) const;

    void enable_timestamp() { _stamp_with_time = true; }
    void disable_timestamp() { _stamp_with_time = false; }

    void enable_stderr() { _log_to_stderr = true; }
    void disable_stderr() { _log_to_stderr = false; }

    // Append messages to `fname` as well; an empty name stops it.
    void log_to_file(const std::string& fname);
    std::string current_log_file() const { return log_filename; }

    void log(log_level_t level, const std::string& msg, boost::string_view function_name = "");

    void silly  (const std::string& msg, boost::string_view function_name = "");
    void debug  (const std::string& msg, boost::string_view function_name = "");
    void verbose(const std::string& msg, boost::string_view function_name = "");
    void info   (const std::string& msg, boost::string_view function_name = "");
    void warn   (const std::string& msg, boost::string_view function_name = "");
    void error  (const std::string& msg, boost::string_view function_name = "");
    void abort  (const std::string& msg, boost::string_view function_name = "");

  private:
    log_level_t threshold;
    bool _stamp_with_time = false;
    bool _log_to_stderr = true;
    std::string log_filename;
    boost::optional<std::ofstream> log_file;
    // Signing and verification may log from several threads.
    std::mutex _mutex;
};

extern Logger logger;

} // httpsig namespace
