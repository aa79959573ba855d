// tests/log/test_logger.cpp
#define BOOST_TEST_MODULE LoggerTests
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <string>

#include "confwire/log/log_config.hpp"
#include "confwire/log/logger.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

using confwire::log::LogConfig;
using confwire::log::Logger;

// Captures log records into a stringstream
class StringStreamBackend : public sinks::text_ostream_backend {
public:
    explicit StringStreamBackend(std::ostream& os) {
        add_stream(boost::shared_ptr<std::ostream>(&os, boost::null_deleter()));
    }
};

std::stringstream g_log_stream;
boost::shared_ptr<sinks::synchronous_sink<StringStreamBackend>> g_test_sink;

void install_test_sink() {
    g_test_sink =
        boost::make_shared<sinks::synchronous_sink<StringStreamBackend>>(
            boost::make_shared<StringStreamBackend>(g_log_stream));
    g_test_sink->set_formatter(
        expr::stream << expr::attr<logging::trivial::severity_level>("Severity")
                     << ": " << expr::smessage);
    logging::core::get()->add_sink(g_test_sink);
}

void clear_log() {
    g_log_stream.str("");
    g_log_stream.clear();
}

void reset_filter() {
    logging::core::get()->set_filter(
        expr::attr<logging::trivial::severity_level>("Severity") >=
        logging::trivial::trace);
}

struct LogFixture {
    LogFixture() {
        clear_log();
        logging::core::get()->remove_all_sinks();
        install_test_sink();
        reset_filter();
        logging::add_common_attributes();
    }

    ~LogFixture() {
        logging::core::get()->remove_sink(g_test_sink);
        g_test_sink.reset();
    }
};

BOOST_GLOBAL_FIXTURE(LogFixture);

BOOST_AUTO_TEST_SUITE(LoggerTestSuite)

BOOST_AUTO_TEST_CASE(test_log_info_message) {
    clear_log();
    CONFWIRE_LOG_INFO << "This is an info message.";
    BOOST_CHECK(g_log_stream.str().find("info: This is an info message.") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_log_warning_message) {
    clear_log();
    CONFWIRE_LOG_WARN << "Value could not be converted.";
    BOOST_CHECK(g_log_stream.str().find(
                    "warning: Value could not be converted.") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_set_level_filters_messages) {
    clear_log();

    Logger::set_level(LogConfig::LogLevel::WARN);

    CONFWIRE_LOG_INFO << "This info message should not appear.";
    CONFWIRE_LOG_WARN << "This warning message should appear.";
    CONFWIRE_LOG_ERROR << "This error message should also appear.";

    const std::string output = g_log_stream.str();
    BOOST_CHECK(output.find("This info message should not appear.") ==
                std::string::npos);
    BOOST_CHECK(output.find("warning: This warning message should appear.") !=
                std::string::npos);
    BOOST_CHECK(output.find("error: This error message should also appear.") !=
                std::string::npos);
    BOOST_CHECK(Logger::config().global_level == LogConfig::LogLevel::WARN);

    reset_filter();
}

BOOST_AUTO_TEST_CASE(test_level_from_string) {
    BOOST_CHECK(Logger::level_from_string("TRACE") ==
                LogConfig::LogLevel::TRACE);
    BOOST_CHECK(Logger::level_from_string("warning") ==
                LogConfig::LogLevel::WARN);
    BOOST_CHECK(Logger::level_from_string("critical") ==
                LogConfig::LogLevel::FATAL);
    BOOST_CHECK_THROW(Logger::level_from_string("verbose"),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(LogConfig::level_to_string(LogConfig::LogLevel::ERROR),
                      "error");
}

BOOST_AUTO_TEST_CASE(test_log_config_from_ptree) {
    boost::property_tree::ptree pt;
    pt.put("global_level", "debug");
    pt.put("console.enabled", false);
    pt.put("file.enabled", true);
    pt.put("file.log_file", "logs/test.log");
    pt.put("file.max_file_size", 2048);

    LogConfig config;
    config.from_ptree(pt);

    BOOST_CHECK(config.global_level == LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(!config.console.enabled);
    BOOST_CHECK(config.file.enabled);
    BOOST_CHECK_EQUAL(config.file.log_file, "logs/test.log");
    BOOST_CHECK_EQUAL(config.file.max_file_size, 2048);
    BOOST_CHECK_EQUAL(config.properties_name(), "log");
    BOOST_CHECK_NO_THROW(config.validate());
}

BOOST_AUTO_TEST_CASE(test_log_config_validate_rejects_empty_file) {
    LogConfig config;
    config.file.enabled = true;
    config.file.log_file.clear();

    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

// Logger::shutdown removes every sink, so this runs last and restores ours
BOOST_AUTO_TEST_CASE(test_logger_init_shutdown) {
    clear_log();

    LogConfig config;
    config.global_level = LogConfig::LogLevel::INFO;
    config.console.enabled = false;
    config.file.enabled = false;

    Logger::init(config);
    BOOST_CHECK(g_log_stream.str().find("info: Logger initialized") !=
                std::string::npos);

    clear_log();
    Logger::shutdown();
    BOOST_CHECK(g_log_stream.str().find("info: Logger shutting down") !=
                std::string::npos);

    install_test_sink();
    reset_filter();
}

BOOST_AUTO_TEST_SUITE_END()
