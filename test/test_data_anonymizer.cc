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
 * @file test_data_anonymizer.cc
 */

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "data_anonymizer.hh"
#include "doctest/doctest.h"
#include "pcrepp/pcre2pp.hh"

using namespace piiguard;

static std::string
run(field_type_t type,
    anon_method_t method,
    const anon_value& value,
    std::map<std::string, param_value> params = {})
{
    field_config fc{"f", to_string(type), method, std::move(params)};
    strategy_context ctx;
    auto res = apply_strategy(value, fc, ctx);

    REQUIRE(res.isOk());
    return to_string(res.unwrap());
}

static std::string
run(field_type_t type,
    anon_method_t method,
    const char* value,
    std::map<std::string, param_value> params = {})
{
    return run(type, method, anon_value{std::string(value)}, params);
}

template<std::size_t N>
static bool
matches(const char (&pattern)[N], const std::string& str)
{
    auto co = pcre2pp::code::from_const(pattern);

    return co.find_in(str).ignore_error().has_value();
}

TEST_CASE("email strategies")
{
    CHECK(run(field_type_t::email, anon_method_t::redact, "jo@example.com")
          == "[EMAIL_REDACTED]");
    CHECK(run(field_type_t::email, anon_method_t::mask, "john.doe@example.com")
          == "j***@example.com");
    CHECK(run(field_type_t::email, anon_method_t::mask, "nope")
          == "***@***.***");
    CHECK(matches(
        R"(^anon_[0-9a-f]{12}@example\.com$)",
        run(field_type_t::email, anon_method_t::hash, "jo@example.com")));
    CHECK(matches(
        R"(^[a-z]{8}@(example\.com|test\.org|sample\.net)$)",
        run(field_type_t::email, anon_method_t::fake, "jo@example.com")));
    CHECK(matches(
        R"(^TOK_EMAIL_[0-9a-f]{12}$)",
        run(field_type_t::email, anon_method_t::tokenize, "jo@example.com")));
}

TEST_CASE("phone and credit card masks")
{
    CHECK(run(field_type_t::phone, anon_method_t::mask, "555-123-4567")
          == "******4567");
    CHECK(run(field_type_t::phone,
              anon_method_t::mask,
              "555-123-4567",
              {{"show_last", param_value{int64_t{2}}},
               {"mask_char", param_value{std::string("#")}}})
          == "########67");
    CHECK(run(field_type_t::credit_card,
              anon_method_t::mask,
              "4111 1111 1111 1111")
          == "************1111");
    CHECK(matches(
        R"(^\+1-\d{3}-\d{3}-\d{4}$)",
        run(field_type_t::phone, anon_method_t::fake, "555-123-4567")));
    CHECK(run(field_type_t::credit_card, anon_method_t::redact, "4111")
          == "[CC_REDACTED]");
}

TEST_CASE("mask_digits")
{
    CHECK(mask_digits("(555) 123-4567", 4, "*") == "******4567");
    CHECK(mask_digits("12", 4, "*") == "**");
    CHECK(mask_digits("1234", 0, "x") == "xxxx");
}

TEST_CASE("name and ssn strategies")
{
    CHECK(run(field_type_t::name, anon_method_t::mask, "John Smith")
          == "J*** S***");
    CHECK(matches(R"(^User_[0-9a-f]{8}$)",
                  run(field_type_t::name, anon_method_t::hash, "John Smith")));
    CHECK(matches(R"(^[A-Z][a-z]+ [A-Z][a-z]+$)",
                  run(field_type_t::name, anon_method_t::fake, "John Smith")));
    CHECK(run(field_type_t::ssn, anon_method_t::mask, "123-45-6789")
          == "***-**-6789");
    CHECK(run(field_type_t::ssn, anon_method_t::mask, "12") == "***-**-****");
    CHECK(matches(R"(^[0-9a-f]{3}-[0-9a-f]{2}-[0-9a-f]{4}$)",
                  run(field_type_t::ssn, anon_method_t::hash, "123-45-6789")));
    CHECK(run(field_type_t::ssn, anon_method_t::redact, "123-45-6789")
          == "[SSN_REDACTED]");
}

TEST_CASE("date strategies")
{
    auto year = param_value{std::string("year")};
    auto decade = param_value{std::string("decade")};

    CHECK(run(field_type_t::date, anon_method_t::generalize, "1985-06-15")
          == "1985-06-01");
    CHECK(run(field_type_t::date,
              anon_method_t::generalize,
              "1985-06-15",
              {{"precision", year}})
          == "1985-01-01");
    CHECK(run(field_type_t::date,
              anon_method_t::generalize,
              "1985-06-15",
              {{"precision", decade}})
          == "1980-01-01");
    CHECK(run(field_type_t::date, anon_method_t::mask, "1985-06-15T10:30:00Z")
          == "1985-06-15");
    CHECK(run(field_type_t::date, anon_method_t::generalize, "June 1985")
          == "[DATE_REDACTED]");
    CHECK(matches(R"(^\d{4}-\d{2}-\d{2}$)",
                  run(field_type_t::date, anon_method_t::fake, "1985-06-15")));
}

TEST_CASE("parse_iso_date")
{
    CHECK(parse_iso_date("2024-02-29").has_value());
    CHECK(parse_iso_date("2024-02-29T23:59:59+01:00").has_value());
    CHECK(parse_iso_date("2024-02-29 12:00:00.123").has_value());
    CHECK_FALSE(parse_iso_date("2023-02-29").has_value());
    CHECK_FALSE(parse_iso_date("2024-01-01T24:00:00").has_value());
    CHECK_FALSE(parse_iso_date("2024-01-01 trailing").has_value());
}

TEST_CASE("numeric strategies")
{
    field_config fc{"age", "numeric", anon_method_t::generalize};
    strategy_context ctx;

    CHECK(to_string(apply_strategy(anon_value{int64_t{5}}, fc, ctx).unwrap())
          == "0-10");
    CHECK(to_string(apply_strategy(anon_value{500.0}, fc, ctx).unwrap())
          == "other");
    CHECK(to_string(apply_strategy(anon_value{std::string(" 42 ")}, fc, ctx)
                        .unwrap())
          == "21-50");

    fc.fc_params["ranges"] = param_value{std::vector<numeric_range>{
        {0, 18}, {19, 30}, {31, 50}, {51, 100}}};
    CHECK(to_string(apply_strategy(anon_value{int64_t{25}}, fc, ctx).unwrap())
          == "19-30");
    CHECK(to_string(apply_strategy(anon_value{int64_t{45}}, fc, ctx).unwrap())
          == "31-50");

    auto bad_res = apply_strategy(anon_value{std::string("abc")}, fc, ctx);
    REQUIRE(bad_res.isErr());
    CHECK(bad_res.unwrapErr() == "could not convert string to float: 'abc'");

    fc.fc_method = anon_method_t::redact;
    auto redacted = apply_strategy(anon_value{2.5}, fc, ctx).unwrap();
    CHECK(redacted.is<int64_t>());
    CHECK(redacted.get<int64_t>() == 0);

    fc.fc_method = anon_method_t::fake;
    fc.fc_params["noise_percent"] = param_value{5.0};
    auto noisy = apply_strategy(anon_value{100.0}, fc, ctx).unwrap();
    REQUIRE(noisy.is<double>());
    CHECK(noisy.get<double>() >= 95.0);
    CHECK(noisy.get<double>() <= 105.0);
}

TEST_CASE("text and address strategies")
{
    CHECK(run(field_type_t::text, anon_method_t::mask, "Hi 42!") == "** **!");
    CHECK(run(field_type_t::text, anon_method_t::redact, "Hi")
          == "[TEXT_REDACTED]");
    CHECK(matches(R"(^text_[0-9a-f]{16}$)",
                  run(field_type_t::text, anon_method_t::hash, "Hi")));

    auto zip = param_value{std::string("zip")};
    CHECK(run(field_type_t::address,
              anon_method_t::generalize,
              "1 Main St, Springfield, IL 62701",
              {{"precision", zip}})
          == "62701");
    CHECK(run(field_type_t::address,
              anon_method_t::generalize,
              "1 Main St, Springfield, IL 62701")
          == "[LOCATION_GENERALIZED]");
    CHECK(run(field_type_t::address, anon_method_t::redact, "1 Main St")
          == "[ADDRESS_REDACTED]");
    CHECK(matches(
        R"(^\d+ [A-Za-z ]+, [A-Za-z]+, [A-Z]{2} \d{5}$)",
        run(field_type_t::address, anon_method_t::fake, "1 Main St")));
}

TEST_CASE("nulls pass through strategies")
{
    for (int lpc = 0; lpc <= static_cast<int>(field_type_t::credit_card);
         lpc++)
    {
        field_config fc{"f",
                        to_string(static_cast<field_type_t>(lpc)),
                        anon_method_t::fake};
        strategy_context ctx;

        CHECK(is_null(apply_strategy(anon_value{}, fc, ctx).unwrap()));
    }
}

static anonymization_config
users_config(bool vault)
{
    anonymization_config retval;
    table_config tc;

    retval.ac_config_id = "cfg-1";
    retval.ac_name = "test";
    retval.ac_seed = 42;
    retval.ac_use_token_vault = vault;
    tc.tc_table_name = "users";
    tc.tc_fields = {
        {"email", "email", anon_method_t::fake},
        {"phone", "phone", anon_method_t::mask},
        {"ssn", "ssn", anon_method_t::tokenize},
        {"notes", "text", anon_method_t::preserve},
        {"secret", "text", anon_method_t::null},
        {"age",
         "numeric",
         anon_method_t::generalize,
         {{"ranges",
           param_value{std::vector<numeric_range>{
               {0, 18}, {19, 30}, {31, 50}, {51, 100}}}}}},
    };
    retval.ac_tables.emplace_back(std::move(tc));

    return retval;
}

static record_t
user_record(const std::string& email, const anon_value& age)
{
    return {
        {"id", anon_value{int64_t{1}}},
        {"email", anon_value{email}},
        {"phone", anon_value{std::string("555-123-4567")}},
        {"ssn", anon_value{std::string("123-45-6789")}},
        {"notes", anon_value{std::string("keep me")}},
        {"secret", anon_value{std::string("drop me")}},
        {"age", age},
    };
}

TEST_CASE("anonymize_record")
{
    data_anonymizer da(users_config(false));
    auto rec = user_record("alice@corp.com", anon_value{int64_t{25}});
    auto res = da.anonymize_record(rec, "users");

    REQUIRE(res.isOk());
    auto out = res.unwrap();
    CHECK(out.size() == rec.size());
    CHECK(out.at("id").get<int64_t>() == 1);
    CHECK(to_string(out.at("email")) != "alice@corp.com");
    CHECK(to_string(out.at("phone")) == "******4567");
    CHECK(to_string(out.at("ssn")) == "[SSN_REDACTED]");
    CHECK(to_string(out.at("notes")) == "keep me");
    CHECK(is_null(out.at("secret")));
    CHECK(to_string(out.at("age")) == "19-30");
    CHECK(da.get_vault() == nullptr);
    CHECK_FALSE(da.export_vault().has_value());

    SUBCASE("consistent across records")
    {
        auto again = da.anonymize_record(
            user_record("alice@corp.com", anon_value{int64_t{45}}), "users");

        REQUIRE(again.isOk());
        CHECK(again.unwrap().at("email") == out.at("email"));
        CHECK(to_string(again.unwrap().at("age")) == "31-50");
    }

    SUBCASE("same seed same output")
    {
        data_anonymizer other(users_config(false));

        CHECK(other.anonymize_record(rec, "users").unwrap().at("email")
              == out.at("email"));
    }

    SUBCASE("unknown table passes through")
    {
        auto passed = da.anonymize_record(rec, "orders");

        REQUIRE(passed.isOk());
        CHECK(passed.unwrap() == rec);
    }

    SUBCASE("nulls are preserved")
    {
        auto null_rec = user_record("x@y.com", anon_value{});
        auto null_res = da.anonymize_record(null_rec, "users");

        REQUIRE(null_res.isOk());
        CHECK(is_null(null_res.unwrap().at("age")));
    }
}

TEST_CASE("anonymize_record with a vault")
{
    data_anonymizer da(users_config(true));
    auto rec = user_record("alice@corp.com", anon_value{int64_t{25}});
    auto out = da.anonymize_record(rec, "users").unwrap();
    auto tok = to_string(out.at("ssn"));

    CHECK(matches(R"(^TOK_SSN_[0-9a-f]{12}$)", tok));
    REQUIRE(da.get_vault() != nullptr);
    CHECK(da.get_vault()->detokenize(tok, "ssn").value() == "123-45-6789");

    auto exported = da.export_vault();
    REQUIRE(exported.has_value());
    CHECK(exported->at(tok) == "123-45-6789");
}

TEST_CASE("anonymize_records")
{
    data_anonymizer da(users_config(false));
    std::vector<record_t> records = {
        user_record("a@corp.com", anon_value{int64_t{25}}),
        user_record("b@corp.com", anon_value{std::string("abc")}),
        user_record("c@corp.com", anon_value{int64_t{45}}),
    };

    auto res = da.anonymize_records(records, "users");
    const auto& summary = res.br_summary;

    REQUIRE(res.br_records.size() == 3);
    CHECK(summary.ar_original_count == 3);
    CHECK(summary.ar_anonymized_count == 2);
    REQUIRE(summary.ar_errors.size() == 1);
    CHECK(summary.ar_errors[0]
          == "Record 1: age: could not convert string to float: 'abc'");
    CHECK(res.br_records[1] == records[1]);
    CHECK(to_string(res.br_records[0].at("age")) == "19-30");
    CHECK(to_string(res.br_records[2].at("age")) == "31-50");
    CHECK(summary.ar_fields_processed.at("age") == 2);
    CHECK(summary.ar_processing_time_seconds >= 0.0);

    auto json = summary.to_json();
    CHECK(json.find("\"original_count\":3") != std::string::npos);
    CHECK(json.find("\"anonymized_count\":2") != std::string::npos);
}

TEST_CASE("anonymize free text")
{
    data_anonymizer da(users_config(false));

    CHECK(da.anonymize_text("call 555") == "[TEXT_REDACTED]");
    CHECK(da.anonymize_text("call 555", anon_method_t::mask) == "**** ***");
}

TEST_CASE("record json")
{
    record_t rec = {
        {"active", anon_value{true}},
        {"age", anon_value{int64_t{42}}},
        {"name", anon_value{std::string("Jo")}},
        {"note", anon_value{null_value_t{}}},
        {"score", anon_value{2.5}},
    };
    auto json = record_to_json(rec);

    CHECK(json
          == R"({"active":true,"age":42,"name":"Jo","note":null,)"
             R"("score":2.5})");

    auto rec_res = record_from_json(json);
    REQUIRE(rec_res.isOk());
    auto copy = rec_res.unwrap();
    CHECK(copy.size() == 5);
    CHECK(copy["active"].is<bool>());
    CHECK(copy["age"].is<int64_t>());
    CHECK(copy["age"].get<int64_t>() == 42);
    CHECK(copy["score"].get<double>() == 2.5);
    CHECK(to_string(copy["name"]) == "Jo");
    CHECK(is_null(copy["note"]));

    SUBCASE("bad records")
    {
        auto not_obj = record_from_json("[1]");
        REQUIRE(not_obj.isErr());
        CHECK(not_obj.unwrapErr() == "/: expecting an object, found array");

        auto nested = record_from_json(R"({"id":1,"tags":["a"]})");
        REQUIRE(nested.isErr());
        CHECK(nested.unwrapErr()
              == "/tags: expecting a scalar value, found array");

        auto truncated = record_from_json("{");
        REQUIRE(truncated.isErr());
        CHECK(truncated.unwrapErr().find("JSON parsing failed -- ") == 0);
    }
}

TEST_CASE("records json")
{
    auto recs_res = records_from_json(R"([{"id":1},{"id":2,"name":"x"}])");
    REQUIRE(recs_res.isOk());
    auto recs = recs_res.unwrap();
    REQUIRE(recs.size() == 2);
    CHECK(recs[0].size() == 1);
    CHECK(to_string(recs[1]["id"]) == "2");
    CHECK(to_string(recs[1]["name"]) == "x");

    auto empty_res = records_from_json("[]");
    REQUIRE(empty_res.isOk());
    CHECK(empty_res.unwrap().empty());

    auto not_arr = records_from_json(R"({"id":1})");
    REQUIRE(not_arr.isErr());
    CHECK(not_arr.unwrapErr() == "/: expecting an array, found object");

    auto bad_elem = records_from_json(R"([{"id":1},3])");
    REQUIRE(bad_elem.isErr());
    CHECK(bad_elem.unwrapErr() == "/1: expecting an object, found number");

    auto bad_field = records_from_json(R"([{"id":{"x":1}}])");
    REQUIRE(bad_field.isErr());
    CHECK(bad_field.unwrapErr()
          == "/0/id: expecting a scalar value, found object");

    CHECK(records_from_json("[1,").isErr());
}
