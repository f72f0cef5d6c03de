/**
 * Copyright (c) 2022, Timothy Stack
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
 * @file test_pcre2pp.cc
 */

#include <vector>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pcre2pp.hh"

TEST_CASE("bad pattern")
{
    auto compile_res
        = piiguard::pcre2pp::code::from(string_fragment::from_const("[abc"));

    CHECK(compile_res.isErr());
    auto ce = compile_res.unwrapErr();
    CHECK(ce.ce_offset == 4);
    CHECK(ce.ce_pattern == "[abc");
    CHECK_FALSE(ce.get_message().empty());
}

TEST_CASE("for_each collects every match")
{
    static const char INPUT[] = "key1=1234;key2=5678;";

    auto co = piiguard::pcre2pp::code::from_const(R"((\w+)=([^;]+);)");
    std::vector<std::string> keys;
    std::vector<std::string> values;

    auto res = co.capture_from(string_fragment::from_const(INPUT))
                   .for_each([&](piiguard::pcre2pp::match_data& md) {
                       keys.emplace_back(md[1]->to_string());
                       values.emplace_back(md[2]->to_string());
                   });

    CHECK(res.isOk());
    CHECK(keys == std::vector<std::string>{"key1", "key2"});
    CHECK(values == std::vector<std::string>{"1234", "5678"});
}

TEST_CASE("capture_count")
{
    auto co = piiguard::pcre2pp::code::from_const(R"(^(\w+)=([^;]+);)");

    CHECK(co.get_capture_count() == 2);
}

TEST_CASE("offsets are bytes")
{
    static const char INPUT[] = "caf\xc3\xa9 123-45-6789";

    auto co = piiguard::pcre2pp::code::from_const(R"(\d{3}-\d{2}-\d{4})");
    auto find_res
        = co.find_in(string_fragment::from_const(INPUT)).ignore_error();

    REQUIRE(find_res.has_value());
    CHECK(find_res->f_all.sf_begin == 6);
    CHECK(find_res->f_all.sf_end == 17);
}

TEST_CASE("unicode word boundaries")
{
    auto co = piiguard::pcre2pp::code::from_const(R"(\b\d{3}\b)", PCRE2_UCP);

    CHECK_FALSE(co.find_in(string_fragment::from_const("\xc3\xa9"
                                                       "123"))
                    .ignore_error()
                    .has_value());
    CHECK(co.find_in(string_fragment::from_const("x 123"))
              .ignore_error()
              .has_value());
}

TEST_CASE("caseless")
{
    auto co = piiguard::pcre2pp::code::from_const("[A-Z]{3}", PCRE2_CASELESS);
    auto find_res
        = co.find_in(string_fragment::from_const("abc")).ignore_error();

    CHECK(find_res.has_value());
}

TEST_CASE("empty matches step over code points")
{
    static const char INPUT[] = "\xc3\xa9";

    auto co = piiguard::pcre2pp::code::from_const("x*");
    int count = 0;

    auto res = co.capture_from(string_fragment::from_const(INPUT))
                   .for_each([&count](piiguard::pcre2pp::match_data& md) {
                       count += 1;
                   });

    CHECK(res.isOk());
    CHECK(count == 2);
}

TEST_CASE("invalid utf-8 is an error")
{
    static const char INPUT[] = "\xff abc";

    auto co = piiguard::pcre2pp::code::from_const("abc");
    auto res = co.capture_from(string_fragment::from_const(INPUT))
                   .for_each([](piiguard::pcre2pp::match_data& md) {});

    CHECK(res.isErr());
    CHECK_FALSE(co.find_in(string_fragment::from_const(INPUT))
                    .ignore_error()
                    .has_value());
}

TEST_CASE("anchored")
{
    auto re = piiguard::pcre2pp::code::from_const(
        "abc", PCRE2_ANCHORED | PCRE2_ENDANCHORED);

    const auto sub1 = string_fragment::from_const("abc");
    const auto sub2 = string_fragment::from_const("abcd");
    const auto sub3 = string_fragment::from_const("0abc");

    CHECK(re.find_in(sub1).ignore_error().has_value());
    CHECK_FALSE(re.find_in(sub2).ignore_error().has_value());
    CHECK_FALSE(re.find_in(sub3).ignore_error().has_value());
}
