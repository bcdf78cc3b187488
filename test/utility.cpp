//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "utility.hpp"

using kiln::shell_quote;
using kiln::split_command_line;
using words = std::vector<std::string>;

TEST(utility, split_plain_words) {
    EXPECT_EQ(split_command_line("python -u main.py"), (words{"python", "-u", "main.py"}));
    EXPECT_EQ(split_command_line("  a \t b\n c  "), (words{"a", "b", "c"}));
    EXPECT_EQ(split_command_line(""), words{});
    EXPECT_EQ(split_command_line("   "), words{});
}

TEST(utility, split_quotes) {
    EXPECT_EQ(
        split_command_line("python -c 'print(1 + 1)'"), (words{"python", "-c", "print(1 + 1)"})
    );
    EXPECT_EQ(split_command_line("echo \"a b\" c"), (words{"echo", "a b", "c"}));
    EXPECT_EQ(split_command_line("echo 'it'\\''s'"), (words{"echo", "it's"}));
    EXPECT_EQ(split_command_line("a'b'\"c\"d"), (words{"abcd"}));
    EXPECT_EQ(split_command_line("echo ''"), (words{"echo", ""}));
}

TEST(utility, split_backslashes) {
    EXPECT_EQ(split_command_line("a\\ b c"), (words{"a b", "c"}));
    EXPECT_EQ(split_command_line("echo \"say \\\"hi\\\"\""), (words{"echo", "say \"hi\""}));
    // kept verbatim inside single quotes
    EXPECT_EQ(split_command_line("echo '\\n'"), (words{"echo", "\\n"}));
}

TEST(utility, split_unterminated_quote_throws) {
    EXPECT_THROW(split_command_line("echo 'oops"), std::runtime_error);
    EXPECT_THROW(split_command_line("echo \"oops"), std::runtime_error);
}

TEST(utility, shell_quote_reads_back_verbatim) {
    for (std::string const value : {"six", "a b", "it's", "$(rm -rf /)", "\"q\"", ""}) {
        EXPECT_EQ(split_command_line("cmd " + shell_quote(value)), (words{"cmd", value})) << value;
    }
}

TEST(utility, execution_ids_are_unique) {
    auto const a = kiln::make_execution_id();
    auto const b = kiln::make_execution_id();

    EXPECT_EQ(a.compare(0, 5, "exec-"), 0);
    EXPECT_NE(a, b);
}

TEST(utility, random_name_length) {
    EXPECT_EQ(kiln::make_random_name(10).size(), 10u);
    EXPECT_EQ(kiln::make_random_name(0), "");
}
