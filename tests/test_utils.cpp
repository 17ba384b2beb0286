#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <regex>

TEST(Trim, StripsBothEnds) {
    EXPECT_EQ(trimmed("  hello \n"), "hello");
    EXPECT_EQ(trimmed("\t\r\n"), "");
    EXPECT_EQ(trimmed("a b"), "a b");
}

TEST(ProgramBasename, StripsDirectories) {
    EXPECT_EQ(program_basename("/usr/local/bin/aspect-credential-helper"), "aspect-credential-helper");
    EXPECT_EQ(program_basename("helper"), "helper");
}

TEST(LogStamp, Format) {
    std::string s = now_log_stamp();
    EXPECT_TRUE(std::regex_match(s, std::regex("\\d{2}:\\d{2}:\\d{2}\\.\\d{3}"))) << s;
}
