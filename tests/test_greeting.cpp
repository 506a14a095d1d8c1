#include "tools/greeting.hpp"

#include <gtest/gtest.h>

using gv::tools::build_greeting_lines;

TEST(GreetingTest, SingleGreeting) {
    EXPECT_EQ(build_greeting_lines("World", 1, false), (std::vector<std::string>{"Hello, World!"}));
}

TEST(GreetingTest, UppercaseNameAndGreeting) {
    EXPECT_EQ(build_greeting_lines("Alice", 1, true), (std::vector<std::string>{"HELLO, ALICE!"}));
}

TEST(GreetingTest, RepeatedGreetingsAreNumbered) {
    EXPECT_EQ(build_greeting_lines("Bob", 3, false),
              (std::vector<std::string>{"Hello, Bob! (1)", "Hello, Bob! (2)", "Hello, Bob! (3)"}));
}

TEST(GreetingTest, ZeroCountPrintsNothing) {
    EXPECT_TRUE(build_greeting_lines("World", 0, false).empty());
}
