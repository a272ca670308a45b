#define BOOST_TEST_MODULE logger_tester
#include <boost/test/included/unit_test.hpp>

#include <fstream>
#include <sstream>
#include <string>

#include <boost/filesystem.hpp>

#include "namespaces.h"
#include "logger.h"

BOOST_AUTO_TEST_SUITE(logger_tester)

using namespace std;
using namespace httpsig;

static string read_file(const fs::path& p) {
    ifstream in(p.string());
    stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

BOOST_AUTO_TEST_CASE(test_levels)
{
    Logger log(SILLY);                // All logs with level >= SILLY will display
    log.disable_stderr();

    BOOST_REQUIRE(log.would_log(SILLY));

    log.set_threshold(VERBOSE);
    BOOST_REQUIRE(log.would_log(VERBOSE));
    BOOST_REQUIRE(log.would_log(ERROR));
    BOOST_REQUIRE(!log.would_log(DEBUG));

    BOOST_REQUIRE(parse_log_level("warn") == WARN);
    BOOST_REQUIRE(parse_log_level("DEBUG") == DEBUG);
    BOOST_REQUIRE(!parse_log_level("loud"));

    ostringstream os;
    os << ABORT;
    BOOST_REQUIRE_EQUAL(os.str(), "ABORT");
}

BOOST_AUTO_TEST_CASE(test_log_to_file)
{
    auto path = fs::temp_directory_path() / fs::unique_path("httpsig-log-%%%%-%%%%.txt");

    Logger log(INFO);
    log.disable_stderr();
    log.log_to_file(path.string());
    BOOST_REQUIRE_EQUAL(log.current_log_file(), path.string());

    log.info("signed request");
    log.debug("This should not make it out");
    log.warn("nonce replayed", "check_nonce");

    log.log_to_file("");
    BOOST_REQUIRE(log.current_log_file().empty());

    auto content = read_file(path);
    fs::remove(path);

    BOOST_REQUIRE(content.find("HTTPSIG START") != string::npos);
    BOOST_REQUIRE(content.find("[INFO] signed request") != string::npos);
    BOOST_REQUIRE(content.find("[WARN] check_nonce: nonce replayed") != string::npos);
    BOOST_REQUIRE(content.find("should not") == string::npos);
}

BOOST_AUTO_TEST_CASE(test_default_logger)
{
    // The global logger, used by the macros.
    logger.set_threshold(VERBOSE);
    LOG_VERBOSE("This should make it out from the default logger with the macro");
    LOG_WARN("This should make it out with from the default logger the macro");
    LOG_DEBUG("This should not make it out from the default logger with the macro");

    int formatted = 0;
    auto count = [&] { return ++formatted; };

    // Arguments of disabled levels are not evaluated.
    LOG_DEBUG("count: ", count());
    BOOST_REQUIRE_EQUAL(formatted, 0);
    LOG_INFO("count: ", count());
    BOOST_REQUIRE_EQUAL(formatted, 1);

    logger.set_threshold(default_log_level());
}

BOOST_AUTO_TEST_SUITE_END()
