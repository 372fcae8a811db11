#include <catch2/catch.hpp>
#include <aarc/log.hpp>
#include <cstdio>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace aarc::log;

// Helper: capture log output from a callable through a temporary file
static std::string capture_log(std::function<void()> fn) {
    std::FILE* tmp = std::tmpfile();
    set_output(tmp);
    set_color_enabled(false);

    fn();

    set_output(nullptr);
    std::fflush(tmp);
    std::rewind(tmp);
    std::string output;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);
    set_level(Error);
    REQUIRE(get_level() == Error);
    set_level(Info);
    REQUIRE(get_level() == Info);
}

TEST_CASE("parse_level accepts level names only", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("debug", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("error", lvl));
    REQUIRE(lvl == Error);
    REQUIRE_FALSE(parse_level("verbose", lvl));
    REQUIRE(lvl == Error);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    auto output = capture_log([] {
        info("should not appear");
    });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at threshold are emitted with level prefix", "[log]") {
    set_level(Warn);
    auto output = capture_log([] {
        warn("could not create %s", "/cache");
    });
    REQUIRE(output == "warn: could not create /cache\n");
    set_level(Info);
}

TEST_CASE("Long messages are written in full", "[log]") {
    std::string path = "/cache/" + std::string(5000, 'p') + "/res/values/strings.xml";
    auto output = capture_log([&] {
        info("not copying %s to %s", path.c_str(), path.c_str());
    });
    REQUIRE(output == "info: not copying " + path + " to " + path + "\n");
}

TEST_CASE("Concurrent writers never interleave within a line", "[log]") {
    set_level(Info);
    auto output = capture_log([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < 50; ++i) info("worker %d line %d", t, i);
            });
        }
        for (auto& th : threads) th.join();
    });

    size_t lines = 0;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        REQUIRE(end != std::string::npos);
        std::string line = output.substr(start, end - start);
        CHECK(line.rfind("info: worker ", 0) == 0);
        lines++;
        start = end + 1;
    }
    REQUIRE(lines == 200);
}
