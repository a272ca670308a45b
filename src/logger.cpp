#include <chrono>
#include <iomanip> // std::setprecision
#include <string>

#include <boost/algorithm/string/case_conv.hpp>

#include "logger.h"

namespace httpsig {

static const long LOG_FILE_MAX_SIZE = 15 * 1024 * 1024;

static const char* log_level_announce[] =     {"SILLY"        , "DEBUG"     , "VERBOSE"   , "INFO"      , "WARN"        , "ERROR"      , "ABORT"};
static const char* log_level_color_prefix[] = {"\033[1;35;47m", "\033[1;32m", "\033[1;37m", "\033[1;34m", "\033[90;103m", "\033[31;40m", "\033[1;31;40m"};
static const bool log_level_colored_msg[] =   {true           , false       , false       , false       , true          , true         , true};

log_level_t default_log_level() {
    return INFO;
}

boost::optional<log_level_t> parse_log_level(boost::string_view s) {
    auto upper = boost::algorithm::to_upper_copy(std::string(s));
    for (int l = SILLY; l <= ABORT; ++l) {
        if (upper == log_level_announce[l]) return static_cast<log_level_t>(l);
    }
    return boost::none;
}

Logger logger(default_log_level());

// Seconds since the first time stamp was requested.
static double log_get_timestamp()
{
    using clock = std::chrono::steady_clock;
    static const clock::time_point base = clock::now();
    return std::chrono::duration<double>(clock::now() - base).count();
}

Logger::Logger(log_level_t threshold)
    : threshold(threshold < SILLY || threshold > ABORT ? default_log_level() : threshold)
{
}

void Logger::set_threshold(log_level_t level)
{
    if (level >= SILLY && level <= ABORT) {
        threshold = level;
    }
}

bool Logger::would_log(log_level_t level) const
{
    return get_threshold() <= level;
}

void Logger::log_to_file(const std::string& fname)
{
    std::lock_guard<std::mutex> lock(_mutex);

    if (fname.empty()) {
        log_file = boost::none;
        log_filename.clear();
        return;
    }

    if (log_filename == fname && log_file) return;

    log_file.emplace(fname, std::ios::out | std::ios::app);

    if (!log_file->is_open()) {
        std::cerr << "Failed to open log file " << fname << "\n";
        log_filename.clear();
        log_file = boost::none;
        return;
    }

    log_filename = fname;
    *log_file << "\nHTTPSIG START\n";
}

namespace {
    struct Printer {
        using string_view = boost::string_view;

        log_level_t level;
        bool with_color;
        boost::optional<double> ts;
        string_view msg;
        string_view fun;

        friend std::ostream& operator<<(std::ostream& os, const Printer& p) {
            static const char* color_end = "\033[0m";

            if (p.ts) {
                // Prevent scientific notation
                os << std::fixed << std::showpoint << std::setprecision(4);
                os << *p.ts << ": ";
            }

            if (p.with_color) {
                os << log_level_color_prefix[p.level];
            }

            os << "[" << log_level_announce[p.level];

            if (log_level_colored_msg[p.level] || !p.with_color) {
                os << "] ";
            } else {
                os << "]" << color_end << " ";
            }

            if (!p.fun.empty()) {
                os << p.fun << ": ";
            }

            os << p.msg;

            if (p.with_color && log_level_colored_msg[p.level]) {
                os << color_end;
            }

            return os;
        }
    };
}

void Logger::log(log_level_t level, const std::string& msg, boost::string_view function_name)
{
    if (level < SILLY || level > ABORT || level < threshold) {
        return;
    }

    std::lock_guard<std::mutex> lock(_mutex);

    boost::optional<double> ts;
    if (_stamp_with_time || log_file) ts = log_get_timestamp();

    if (_log_to_stderr) {
        std::cerr << Printer{level, true, _stamp_with_time ? ts : boost::optional<double>(), msg, function_name} << "\n";
    }

    if (log_file && log_file->is_open()) {
        *log_file << Printer{level, false, ts, msg, function_name} << std::endl;

        if (log_file->tellp() > LOG_FILE_MAX_SIZE) {
            log_file->close();
            log_file->open(log_filename, std::ios::out | std::ios::trunc);
        }
    }
}

void Logger::silly(const std::string& msg, boost::string_view function_name)
{
    log(SILLY, msg, function_name);
}

void Logger::debug(const std::string& msg, boost::string_view function_name)
{
    log(DEBUG, msg, function_name);
}

void Logger::verbose(const std::string& msg, boost::string_view function_name)
{
    log(VERBOSE, msg, function_name);
}

void Logger::info(const std::string& msg, boost::string_view function_name)
{
    log(INFO, msg, function_name);
}

void Logger::warn(const std::string& msg, boost::string_view function_name)
{
    log(WARN, msg, function_name);
}

void Logger::error(const std::string& msg, boost::string_view function_name)
{
    log(ERROR, msg, function_name);
}

void Logger::abort(const std::string& msg, boost::string_view function_name)
{
    log(ABORT, msg, function_name);
}

} // httpsig namespace
