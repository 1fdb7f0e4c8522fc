// ═══════════════════════════════════════════════════════════════════
//  test_console.cpp — Tests for leveled console logging
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlir/console.h>
#include <algorithm>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace gqlir;

class ConsoleTest : public ::testing::Test {
protected:
    std::ostringstream out;

    void SetUp() override {
        console::setSink(&out);
        console::setLevel(console::Level::Info);
    }

    void TearDown() override {
        console::setSink(nullptr);
        console::setLevel(console::Level::Info);
    }
};

TEST_F(ConsoleTest, LogJoinsArgumentsWithSpaces) {
    console::log("compiled", 3, "operations", true);
    EXPECT_NE(out.str().find("compiled 3 operations true"), std::string::npos);
}

TEST_F(ConsoleTest, SinkDisablesColors) {
    console::error("boom");
    EXPECT_EQ(out.str().find("\033["), std::string::npos);
    EXPECT_NE(out.str().find("boom"), std::string::npos);
}

TEST_F(ConsoleTest, DebugHiddenAtInfoLevel) {
    console::debug("hidden");
    EXPECT_TRUE(out.str().empty());
    EXPECT_FALSE(console::enabled(console::Level::Debug));
}

TEST_F(ConsoleTest, DebugShownAtDebugLevel) {
    console::setLevel(console::Level::Debug);
    console::debug("visible");
    EXPECT_NE(out.str().find("visible"), std::string::npos);
}

TEST_F(ConsoleTest, SilentSuppressesErrors) {
    console::setLevel(console::Level::Silent);
    console::error("nothing");
    console::warn("nothing");
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ConsoleTest, StringifiesJson) {
    console::log(nlohmann::json{{"a", 1}});
    EXPECT_NE(out.str().find("{\"a\":1}"), std::string::npos);
}

TEST_F(ConsoleTest, TimerReportsElapsed) {
    console::time("lowering");
    double ms = console::timeEnd("lowering");
    EXPECT_GE(ms, 0.0);
    EXPECT_NE(out.str().find("lowering:"), std::string::npos);
}

TEST_F(ConsoleTest, UnknownTimerWarns) {
    EXPECT_EQ(console::timeEnd("missing"), 0.0);
    EXPECT_NE(out.str().find("Timer 'missing' does not exist"), std::string::npos);
}

TEST_F(ConsoleTest, ConcurrentTimersAndWrites) {
    console::setLevel(console::Level::Debug);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; i++) {
                auto label = "worker" + std::to_string(t);
                console::time(label);
                console::timeEnd(label, console::Level::Debug);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto text = out.str();
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 200);
    EXPECT_EQ(text.find("does not exist"), std::string::npos);
}
