#include <gtest/gtest.h>
#include "zmcp/error.hpp"
#include "zmcp/logging.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>

using namespace zmcp;

TEST(Logging, ParseLevel) {
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("INFO"), spdlog::level::info);
    EXPECT_EQ(logging::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("nonsense"), spdlog::level::info);
}

TEST(Logging, NamedLoggersSharePrefix) {
    auto a = logging::get("server");
    auto b = logging::get("server");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), "zmcp.server");
}

TEST(Logging, SinkAndLevelApplyToExistingLoggers) {
    auto before = logging::get("logging_test_existing");

    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    logging::init_with_sink(sink, spdlog::level::warn);

    before->info("hidden");
    before->warn("visible warning");
    logging::get("logging_test_new")->error("new logger error");
    sink->flush();

    std::string out = oss.str();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("visible warning"), std::string::npos);
    EXPECT_NE(out.find("new logger error"), std::string::npos);
    EXPECT_NE(out.find("[zmcp.logging_test_new]"), std::string::npos);

    logging::init_with_sink(sink, spdlog::level::info);
}

TEST(Logging, FileSink) {
    std::string path = ::testing::TempDir() + "zmcp_logging_test.log";
    std::remove(path.c_str());

    logging::LoggingConfig cfg;
    cfg.level = "debug";
    cfg.file = path;
    logging::init(cfg);

    auto log = logging::get("file_test");
    log->debug("written to file");
    log->flush();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("written to file"), std::string::npos);
    EXPECT_NE(content.str().find("debug"), std::string::npos);

    logging::init(logging::LoggingConfig{});
}

TEST(Logging, UnopenableFileIsConfigError) {
    // A regular file cannot act as the log directory.
    std::string blocker = ::testing::TempDir() + "zmcp_logging_blocker";
    std::ofstream(blocker) << "x";

    logging::LoggingConfig cfg;
    cfg.file = blocker + "/server.log";
    EXPECT_THROW(logging::init(cfg), McpConfigError);
}
