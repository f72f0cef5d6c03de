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
 * @file test_token_vault.cc
 */

#include <vector>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pcrepp/pcre2pp.hh"
#include "token_vault.hh"

using namespace piiguard;

TEST_CASE("tokenize is stable per value")
{
    token_vault tv;

    auto tok1 = tv.tokenize("alice@example.com", "email");
    auto tok2 = tv.tokenize("alice@example.com", "email");
    auto tok3 = tv.tokenize("bob@example.com", "email");

    CHECK(tok1 == tok2);
    CHECK(tok1 != tok3);
    CHECK(tv.size() == 2);

    static const auto TOKEN_RE
        = pcre2pp::code::from_const(R"(^TOK_EMAIL_[0-9a-f]{12}$)");
    CHECK(TOKEN_RE.find_in(tok1).ignore_error().has_value());
}

TEST_CASE("field types are kept apart")
{
    token_vault tv;

    auto email_tok = tv.tokenize("12345", "email");
    auto phone_tok = tv.tokenize("12345", "phone");

    CHECK(email_tok != phone_tok);
    CHECK(tv.detokenize(email_tok, "email").value() == "12345");
    CHECK_FALSE(tv.detokenize(email_tok, "phone").has_value());
}

TEST_CASE("a colliding token is minted again")
{
    token_vault tv;
    std::vector<std::string> suffixes = {"aaaa", "aaaa", "aaaa", "bbbb"};
    size_t next = 0;

    tv.set_token_source([&suffixes, &next]() { return suffixes[next++]; });

    auto tok1 = tv.tokenize("alice@example.com", "email");
    auto tok2 = tv.tokenize("bob@example.com", "email");

    CHECK(tok1 == "TOK_EMAIL_aaaa");
    CHECK(tok2 == "TOK_EMAIL_bbbb");
    CHECK(next == 4);
    CHECK(tv.size() == 2);
    CHECK(tv.detokenize(tok1, "email").value() == "alice@example.com");
    CHECK(tv.detokenize(tok2, "email").value() == "bob@example.com");

    next = 0;
    auto phone_tok = tv.tokenize("555-123-4567", "phone");
    CHECK(phone_tok == "TOK_PHONE_aaaa");
}

TEST_CASE("detokenize")
{
    token_vault tv;

    auto tok = tv.tokenize("123-45-6789", "ssn");

    CHECK(tv.detokenize(tok, "ssn").value() == "123-45-6789");
    CHECK_FALSE(tv.detokenize("TOK_SSN_000000000000", "ssn").has_value());
    CHECK_FALSE(tv.detokenize(tok, "unknown").has_value());
}

TEST_CASE("encryption key")
{
    token_vault generated;
    token_vault given(std::string("my-key"));

    CHECK(generated.get_encryption_key().size() == 24);
    CHECK(given.get_encryption_key() == "my-key");
}

TEST_CASE("export and import")
{
    token_vault tv;

    auto tok = tv.tokenize("Alice", "name");
    auto snap = tv.export_vault();

    REQUIRE(snap.vs_reverse.count("name") == 1);
    CHECK(snap.vs_reverse["name"][tok] == "Alice");
    CHECK(snap.vs_vault["name"].size() == 1);

    // the snapshot is a copy
    tv.tokenize("Bob", "name");
    CHECK(snap.vs_reverse["name"].size() == 1);

    token_vault restored;
    restored.import_vault(snap);
    CHECK(restored.size() == 1);
    CHECK(restored.detokenize(tok, "name").value() == "Alice");
    CHECK(restored.tokenize("Alice", "name") == tok);
}

TEST_CASE("json round trip")
{
    token_vault tv;

    auto tok = tv.tokenize("4111 1111 1111 1111", "credit_card");
    auto json = tv.to_json();

    CHECK(json.find("\"vault\"") != std::string::npos);
    CHECK(json.find("\"reverse\"") != std::string::npos);

    auto snap_res = token_vault::from_json(json);
    REQUIRE(snap_res.isOk());

    token_vault restored;
    restored.import_vault(snap_res.unwrap());
    CHECK(restored.detokenize(tok, "credit_card").value()
          == "4111 1111 1111 1111");
}

TEST_CASE("json errors")
{
    SUBCASE("malformed")
    {
        CHECK(token_vault::from_json("{\"vault\": ").isErr());
    }

    SUBCASE("not an object")
    {
        auto res = token_vault::from_json("[]");

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr() == "expecting a vault object, found array");
    }

    SUBCASE("bad entry")
    {
        auto res = token_vault::from_json(
            R"({"vault": {}, "reverse": {"email": {"TOK_EMAIL_1": 1}}})");

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr()
              == "/reverse/email/TOK_EMAIL_1: expecting a string, found "
                 "number");
    }

    SUBCASE("missing sections are empty")
    {
        auto res = token_vault::from_json("{}");

        REQUIRE(res.isOk());
        CHECK(res.unwrap().vs_vault.empty());
        CHECK(res.unwrap().vs_reverse.empty());
    }
}
