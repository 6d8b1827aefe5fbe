#include <catch2/catch_test_macros.hpp>
#include <tripwire/logger.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tripwire;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Logger: File output", "[logging]") {
    const std::string path = "tripwire_test_logs/breaker.log";
    std::filesystem::remove_all("tripwire_test_logs");

    {
        Logger logger;
        logger.configure(path);
        logger.set_level(LogLevel::INFO);

        logger.debug("hidden");
        logger.info("[circuit-breaker a] Circuit breaker closed");
        logger.warn("[circuit-breaker a] Circuit breaker opened");
        logger.flush();

        const std::string content = read_file(path);
        CHECK(content.find("INFO: [circuit-breaker a] Circuit breaker closed") != std::string::npos);
        CHECK(content.find("WARN: [circuit-breaker a] Circuit breaker opened") != std::string::npos);
        CHECK(content.find("hidden") == std::string::npos);
        CHECK(content.front() == '[');
    }

    std::filesystem::remove_all("tripwire_test_logs");
}

TEST_CASE("Logger: Disabled output", "[logging]") {
    const std::string path = "tripwire_test_disabled.log";
    std::remove(path.c_str());

    Logger logger;
    logger.configure("/dev/null");
    logger.error("dropped");
    logger.flush();

    CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Logger: Level names", "[logging]") {
    CHECK(to_string(LogLevel::DEBUG) == "DEBUG");
    CHECK(to_string(LogLevel::WARN) == "WARN");
    CHECK(to_string(LogLevel::ERROR) == "ERROR");
}
