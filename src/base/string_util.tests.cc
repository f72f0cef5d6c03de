/**
 * Copyright (c) 2024, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file string_util.tests.cc
 */

#include "base/string_util.hh"

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

TEST_CASE("endswith")
{
    std::string hw("hello");

    CHECK(endswith(hw, "f") == false);
    CHECK(endswith(hw, "lo") == true);
    CHECK(startswith(hw, "he"));
    CHECK_FALSE(startswith(hw, "lo"));
}

TEST_CASE("trim and case")
{
    CHECK(trim("  abc \t\n") == "abc");
    CHECK(trim("   ").empty());
    CHECK(tolower("ABC-def") == "abc-def");
    CHECK(toupper("credit_card") == "CREDIT_CARD");
    CHECK(is_blank(" \t"));
    CHECK_FALSE(is_blank(" x "));
}

TEST_CASE("split_ws")
{
    std::vector<std::string> toks;

    split_ws("  John   Q\tPublic ", toks);
    REQUIRE(toks.size() == 3);
    CHECK(toks[0] == "John");
    CHECK(toks[2] == "Public");
}

TEST_CASE("repeat and digits_only")
{
    CHECK(repeat("*", 3) == "***");
    CHECK(repeat("ab", 0).empty());
    CHECK(digits_only(string_fragment::from_const("(555) 123-4567"))
          == "5551234567");
}

TEST_CASE("utf8")
{
    // "héllo 世界"
    std::string str = "h\xc3\xa9llo \xe4\xb8\x96\xe7\x95\x8c";

    CHECK(utf8_char_size('h') == 1);
    CHECK(utf8_char_size(0xc3) == 2);
    CHECK(utf8_char_size(0xe4) == 3);
    CHECK(utf8_char_size(0xf0) == 4);
    CHECK(utf8_next_boundary(str, 2) == 3);
    CHECK(utf8_next_boundary(str, 3) == 3);

    auto win = utf8_window(str, 7, 8, 0);
    CHECK(win.sf_begin == 7);
    CHECK(win.sf_end == 10);

    win = utf8_window(str, 0, 1, 1);
    CHECK(win.sf_begin == 0);
    CHECK(win.sf_end == 3);
}

TEST_CASE("scrub_utf8")
{
    CHECK(scrub_utf8("") == "");
    CHECK(scrub_utf8("plain ascii") == "plain ascii");
    CHECK(scrub_utf8("caf\xc3\xa9 \xe4\xb8\x96 \xf0\x9f\x98\x80")
          == "caf\xc3\xa9 \xe4\xb8\x96 \xf0\x9f\x98\x80");

    // latin-1 bytes
    CHECK(scrub_utf8("caf\xe9 na\xefve") == "caf? na?ve");
    // stray continuation byte and truncated sequence at the end
    CHECK(scrub_utf8("a\x80" "b\xe4\xb8") == "a?b??");
    // overlong encoding and UTF-16 surrogate
    CHECK(scrub_utf8("\xc0\xaf\xed\xa0\x80") == "?????");
    CHECK(scrub_utf8("\xf5\x80") == "??");

    std::string mixed = "SSN \xff\xfe 123";
    CHECK(scrub_utf8(mixed).size() == mixed.size());
}
