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
 * @file test_pii_detector.cc
 */

#include <algorithm>
#include <set>

#include <string.h>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pii_detector.hh"
#include "piiguard.hh"

using namespace piiguard;

static std::vector<pii_entity>
of_type(const std::vector<pii_entity>& entities, const std::string& label)
{
    std::vector<pii_entity> retval;

    std::copy_if(entities.begin(),
                 entities.end(),
                 std::back_inserter(retval),
                 [&label](const pii_entity& pe) {
                     return pe.pe_label == label;
                 });

    return retval;
}

static void
check_invariants(const std::string& text,
                 const std::vector<pii_entity>& entities)
{
    for (size_t lpc = 0; lpc < entities.size(); lpc++) {
        const auto& pe = entities[lpc];

        CHECK(pe.pe_start < pe.pe_end);
        CHECK(pe.pe_end <= text.size());
        CHECK(text.substr(pe.pe_start, pe.pe_end - pe.pe_start) == pe.pe_text);
        CHECK(pe.pe_confidence >= 0.0);
        CHECK(pe.pe_confidence <= 0.99);
        if (lpc > 0) {
            CHECK(entities[lpc - 1].pe_start <= pe.pe_start);
            CHECK_FALSE(entities[lpc - 1].overlaps(pe));
        }
    }
}

TEST_CASE("detect email")
{
    pii_detector pd;
    std::string text = "Contact me at john.doe@example.com for more info";
    auto entities = pd.detect(text);
    auto emails = of_type(entities, "EMAIL");

    check_invariants(text, entities);
    REQUIRE(emails.size() == 1);
    CHECK(emails[0].pe_text == "john.doe@example.com");
    CHECK(emails[0].pe_start == 14);
    CHECK(emails[0].pe_confidence > 0.9);
    CHECK(emails[0].pe_language == "en");
}

TEST_CASE("detect ssn")
{
    pii_detector pd;
    std::string text = "My SSN is 123-45-6789";
    auto entities = pd.detect(text);
    auto ssns = of_type(entities, "SSN");

    check_invariants(text, entities);
    REQUIRE(ssns.size() == 1);
    CHECK(ssns[0].pe_text == "123-45-6789");
}

TEST_CASE("detect credit cards")
{
    pii_detector pd;

    SUBCASE("visa")
    {
        std::string text = "Card number: 4532015112830366";
        auto entities = pd.detect(text);
        auto cards = of_type(entities, "CREDIT_CARD");

        check_invariants(text, entities);
        REQUIRE(cards.size() == 1);
        CHECK(cards[0].pe_text == "4532015112830366");
        CHECK(of_type(entities, "BANK_ACCOUNT").empty());
    }

    SUBCASE("mastercard")
    {
        std::string text = "Payment card: 5425233430109903";
        auto entities = pd.detect(text);

        check_invariants(text, entities);
        CHECK(of_type(entities, "CREDIT_CARD").size() == 1);
    }
}

TEST_CASE("detect network and crypto identifiers")
{
    pii_detector pd;

    SUBCASE("ip")
    {
        std::string text = "Server IP: 192.168.1.100";
        auto ips = of_type(pd.detect(text), "IP_ADDRESS");

        REQUIRE(ips.size() == 1);
        CHECK(ips[0].pe_text == "192.168.1.100");
    }

    SUBCASE("bitcoin")
    {
        std::string text = "Send BTC to 1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2";

        CHECK(of_type(pd.detect(text), "BITCOIN_ADDRESS").size() == 1);
    }

    SUBCASE("ethereum")
    {
        std::string text
            = "ETH wallet: 0x742d35Cc6634C0532925a3b844Bc454e4438f44e";

        CHECK(of_type(pd.detect(text), "ETHEREUM_ADDRESS").size() == 1);
    }

    SUBCASE("iban")
    {
        std::string text = "Bank transfer to IBAN GB82WEST12345698765432";

        CHECK(of_type(pd.detect(text), "IBAN").size() == 1);
    }
}

TEST_CASE("placeholders are suppressed")
{
    pii_detector pd;

    CHECK(of_type(pd.detect("Call 555-555-5555 now"), "PHONE").empty());
    CHECK(of_type(pd.detect("server ip 127.0.0.1"), "IP_ADDRESS").empty());
}

TEST_CASE("detect multiple entities")
{
    pii_detector pd;
    std::string text
        = "Contact john@example.com or call 555-123-4567. SSN: 123-45-6789";
    auto entities = pd.detect(text);

    check_invariants(text, entities);
    for (const auto* label : {"EMAIL", "PHONE", "SSN"}) {
        auto found = of_type(entities, label);

        INFO("label: " << label);
        REQUIRE(found.size() == 1);
        CHECK(found[0].pe_confidence > 0.75);
    }
    CHECK(of_type(entities, "EMAIL")[0].pe_text == "john@example.com");
    CHECK(of_type(entities, "SSN")[0].pe_text == "123-45-6789");
}

TEST_CASE("no pii")
{
    pii_detector pd;
    auto entities = pd.detect("This is a normal sentence with no PII.");

    CHECK(std::none_of(
        entities.begin(), entities.end(), [](const pii_entity& pe) {
            return pe.pe_confidence > 0.9;
        }));
}

TEST_CASE("edge cases")
{
    pii_detector pd;

    CHECK(pd.detect("").empty());
    CHECK(pd.detect("   \n\t  ").empty());

    SUBCASE("unicode")
    {
        std::string text = "Contact \xe7\x94\xb0\xe4\xb8\xad\xe5\xa4\xaa"
                           "\xe9\x83\x8e at email@example.com";
        auto entities = pd.detect(text);
        auto emails = of_type(entities, "EMAIL");

        check_invariants(text, entities);
        REQUIRE(emails.size() == 1);
        CHECK(emails[0].pe_text == "email@example.com");
        CHECK(emails[0].pe_language == "zh");
    }

    SUBCASE("long text")
    {
        std::string text;

        for (int lpc = 0; lpc < 1000; lpc++) {
            text.append("Normal text. ");
        }
        text.append("Email: test@example.com");

        auto emails = of_type(pd.detect(text), "EMAIL");
        REQUIRE(emails.size() == 1);
        CHECK(emails[0].pe_start == 13000 + 7);
    }

    SUBCASE("a lone ssn is reported once")
    {
        CHECK(of_type(pd.detect("123-45-6789"), "SSN").size() <= 1);
    }
}

TEST_CASE("detect_language")
{
    CHECK(pii_detector::detect_language("hello there") == "en");
    CHECK(pii_detector::detect_language("Jos\xc3\xa9 Garc\xc3\xad" "a")
          == "fr");
    CHECK(pii_detector::detect_language("Herr Schr\xc3\xb6" "der") == "de");
    CHECK(pii_detector::detect_language("el ni\xc3\xb1o") == "es");
    CHECK(pii_detector::detect_language("\xe6\x9d\xb1\xe4\xba\xac") == "zh");
    CHECK(pii_detector::detect_language("\xe3\x82\xab\xe3\x82\xbf") == "ja");
    CHECK(pii_detector::detect_language("\xe0\xa4\xa8\xe0\xa4\xae") == "hi");
}

TEST_CASE("redact")
{
    pii_detector pd;

    SUBCASE("basic")
    {
        auto res = pd.redact("Email: john@example.com");

        CHECK(res.rr_text.find("john@example.com") == std::string::npos);
        CHECK(res.rr_text.find("[EMAIL:****]") != std::string::npos);
        CHECK(of_type(res.rr_entities, "EMAIL").size() == 1);
    }

    SUBCASE("ssn")
    {
        auto res = pd.redact("SSN: 123-45-6789");

        CHECK(res.rr_text.find("123-45-6789") == std::string::npos);
        CHECK(res.rr_text.find("[SSN:****]") != std::string::npos);
    }

    SUBCASE("custom mask")
    {
        auto res = pd.redact("Email: test@example.com", "#");

        CHECK(res.rr_text.find("[EMAIL:####]") != std::string::npos);
    }

    SUBCASE("redaction is stable")
    {
        std::string text
            = "Contact john@example.com or call 555-123-4567. SSN: "
              "123-45-6789";
        auto first = pd.redact(text);
        auto second = pd.detect(first.rr_text);

        CHECK(first.rr_text.find("[EMAIL:****]") != std::string::npos);
        CHECK(first.rr_text.find("[PHONE:****]") != std::string::npos);
        CHECK(first.rr_text.find("[SSN:****]") != std::string::npos);
        for (const auto* label : {"EMAIL", "PHONE", "SSN"}) {
            CHECK(of_type(second, label).empty());
        }
    }
}

TEST_CASE("get_statistics")
{
    pii_detector pd;

    SUBCASE("empty")
    {
        auto stats = pd.get_statistics({});

        CHECK(stats.ds_total == 0);
        CHECK(stats.ds_by_type.empty());
        CHECK(stats.ds_avg_confidence == 0.0);
    }

    SUBCASE("by type")
    {
        pii_entity email{"a@b.co", "EMAIL", 0, 6, 0.9};
        pii_entity ssn1{"123-45-6789", "SSN", 10, 21, 0.8};
        pii_entity ssn2{"234-56-7890", "SSN", 30, 41, 0.6, "", "fr"};
        auto stats = pd.get_statistics({email, ssn1, ssn2});

        CHECK(stats.ds_total == 3);
        CHECK(stats.ds_by_type["SSN"].ts_count == 2);
        CHECK(stats.ds_by_type["SSN"].ts_avg_confidence
              == doctest::Approx(0.7));
        CHECK(stats.ds_by_type["EMAIL"].ts_count == 1);
        CHECK(stats.ds_by_language["en"] == 2);
        CHECK(stats.ds_by_language["fr"] == 1);
        CHECK(stats.ds_avg_confidence == doctest::Approx(0.7666666));
        CHECK(stats.to_json().find("\"total\":3") != std::string::npos);
    }
}

TEST_CASE("entity json")
{
    pii_entity pe{"a@b.co", "EMAIL", 7, 13, 0.98761, "mail a@b.co", "en"};

    CHECK(pe.to_display_json()
          == R"({"type":"EMAIL","text":"a@b.co","start":7,"end":13,)"
             R"("confidence":0.9876})");

    auto parse_res = pii_entity::from_json(pe.to_json());
    REQUIRE(parse_res.isOk());
    auto copy = parse_res.unwrap();
    CHECK(copy.pe_text == pe.pe_text);
    CHECK(copy.pe_label == pe.pe_label);
    CHECK(copy.pe_start == 7);
    CHECK(copy.pe_end == 13);
    CHECK(copy.pe_confidence == doctest::Approx(0.98761));
    CHECK(copy.pe_context == "mail a@b.co");

    auto defaults_res = pii_entity::from_json(
        R"({"text":"x","label":"NAME","start":0,"end":1,"confidence":1})");
    REQUIRE(defaults_res.isOk());
    CHECK(defaults_res.unwrap().pe_language == "en");
    CHECK(defaults_res.unwrap().pe_context.empty());

    auto bad_res = pii_entity::from_json(
        R"({"text":7,"label":"NAME","start":0,"end":1,"confidence":1})");
    REQUIRE(bad_res.isErr());
    CHECK(bad_res.unwrapErr() == "/text: expecting a string, found number");

    CHECK(pii_entity::from_json("{").isErr());
}

TEST_CASE("entity catalog")
{
    auto labels = list_entity_types();
    std::set<std::string> unique(labels.begin(), labels.end());

    CHECK(labels.size() == ENTITY_TYPES.size());
    CHECK(unique.size() == labels.size());
    CHECK(labels.front() == "SSN");
    CHECK(category_for("EMAIL") == entity_category_t::contact);
    CHECK(category_for("VIN") == entity_category_t::vehicle);
    CHECK_FALSE(category_for("NOPE").has_value());
    CHECK(std::string(category_name(entity_category_t::government_id))
          == "government_id");
}

TEST_CASE("context")
{
    CHECK(scan("test@example.com").isErr());
    CHECK(scan("test@example.com").unwrapErr() == "no active piiguard context");
    CHECK(list_entities().isErr());

    {
        auto ctx_res = context::create(42);
        REQUIRE(ctx_res.isOk());
        auto ctx = ctx_res.unwrap();

        CHECK(context::active() == ctx.get());
        CHECK(context::create().isErr());

        auto scan_res = scan("Email me at test@example.com");
        REQUIRE(scan_res.isOk());
        CHECK(of_type(scan_res.unwrap(), "EMAIL").size() == 1);

        auto redact_res = redact("SSN: 123-45-6789");
        REQUIRE(redact_res.isOk());
        CHECK(redact_res.unwrap().rr_text.find("[SSN:") != std::string::npos);

        auto list_res = list_entities();
        REQUIRE(list_res.isOk());
        auto labels = list_res.unwrap();
        CHECK(labels.size() > 30);
        CHECK(std::find(labels.begin(), labels.end(), "CREDIT_CARD")
              != labels.end());
        CHECK(ctx->get_fake_data().get_seed() == std::optional<int64_t>(42));
    }

    CHECK(context::active() == nullptr);
    CHECK(redact("SSN: 123-45-6789").isErr());

    {
        auto ctx_res = context::create(std::nullopt, "fr_FR");
        REQUIRE(ctx_res.isOk());
        auto ctx = ctx_res.unwrap();
        auto other = ctx;

        ctx.reset();
        CHECK(context::active() == other.get());
        CHECK(other->get_fake_data().get_locale() == "fr_FR");
        CHECK_FALSE(other->get_fake_data().get_seed().has_value());
    }

    CHECK(context::active() == nullptr);
}

TEST_CASE("invalid utf-8")
{
    pii_detector pd;

    SUBCASE("redact")
    {
        std::string text = "SSN: 123-45-6789 caf\xe9";
        auto res = pd.redact(text);
        auto ssns = of_type(res.rr_entities, "SSN");

        check_invariants(text, res.rr_entities);
        REQUIRE(ssns.size() == 1);
        CHECK(ssns[0].pe_text == "123-45-6789");
        CHECK(ssns[0].pe_context.find("caf\xe9") != std::string::npos);
        CHECK(res.rr_text.find("123-45-6789") == std::string::npos);
        CHECK(res.rr_text.find("[SSN:****]") != std::string::npos);
        CHECK(res.rr_text.back() == '\xe9');
    }

    SUBCASE("offsets are kept")
    {
        std::string text = "\xff\xfe mail john@example.com";
        auto entities = pd.detect(text);
        auto emails = of_type(entities, "EMAIL");

        check_invariants(text, entities);
        REQUIRE(emails.size() == 1);
        CHECK(emails[0].pe_start == 8);
        CHECK(emails[0].pe_text == "john@example.com");
    }

    SUBCASE("scan input")
    {
        std::string text = "Fran\xe7ois \xc3\xa9t\xc3\xa9";
        scan_input input(text);

        CHECK(&input.si_text == &text);
        CHECK(input.si_scan == "Fran?ois \xc3\xa9t\xc3\xa9");
        CHECK(input.si_language == "fr");
    }
}

TEST_CASE("name stage")
{
    pii_detector pd;

    SUBCASE("title")
    {
        std::string text = "Ask for Dr. Smith today";
        scan_input input(text);
        std::vector<pii_entity> entities;

        pd.scan_names(input, entities);
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].pe_label == "NAME");
        CHECK(entities[0].pe_text == "Dr. Smith");
        CHECK(entities[0].pe_start == 8);
        CHECK(entities[0].pe_confidence == doctest::Approx(0.99));
    }

    SUBCASE("capitalized")
    {
        std::string text = "we met John Smith today";
        scan_input input(text);
        std::vector<pii_entity> entities;

        pd.scan_names(input, entities);
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].pe_text == "John Smith");
        CHECK(entities[0].pe_confidence == doctest::Approx(0.93));
    }

    SUBCASE("indicator")
    {
        std::string text = "the author John Smith wrote it";
        scan_input input(text);
        std::vector<pii_entity> entities;

        pd.scan_names(input, entities);
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].pe_text == "John Smith");
        CHECK(entities[0].pe_confidence == doctest::Approx(0.99));
    }

    SUBCASE("accented")
    {
        std::string text = "rencontre avec Fran\xc3\xa7ois Dupr\xc3\xa9 hier";
        scan_input input(text);
        std::vector<pii_entity> entities;

        pd.scan_names(input, entities);
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].pe_text == "Fran\xc3\xa7ois Dupr\xc3\xa9");
        CHECK(entities[0].pe_language == "fr");
        CHECK(entities[0].pe_confidence == doctest::Approx(0.93));
    }

    SUBCASE("earlier candidates win")
    {
        std::string text = "we met John Smith today";
        scan_input input(text);
        std::vector<pii_entity> entities
            = {pii_entity{"John", "LICENSE_PLATE", 7, 11, 0.8}};

        pd.scan_names(input, entities);
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].pe_label == "LICENSE_PLATE");
    }
}

TEST_CASE("name_confidence")
{
    std::string text = "see Dr. smith";

    CHECK(detail::name_confidence(text,
                                  string_fragment::from_str_range(text, 4, 13))
          == doctest::Approx(0.96));

    text = "by Jo Lee";
    CHECK(detail::name_confidence(text,
                                  string_fragment::from_str_range(text, 3, 9))
          == doctest::Approx(0.99));

    text = "met jo lee";
    CHECK(detail::name_confidence(text,
                                  string_fragment::from_str_range(text, 4, 10))
          == doctest::Approx(0.88));
}

TEST_CASE("address stage")
{
    pii_detector pd;
    auto addresses = [&pd](const std::string& text) {
        scan_input input(text);
        std::vector<pii_entity> retval;

        pd.scan_addresses(input, retval);
        return retval;
    };

    SUBCASE("us street")
    {
        auto found = addresses("ship to 123 Main Street please");

        REQUIRE(found.size() == 1);
        CHECK(found[0].pe_label == "ADDRESS");
        CHECK(found[0].pe_text == "123 Main Street");
        CHECK(found[0].pe_start == 8);
        CHECK(found[0].pe_confidence == doctest::Approx(0.95));
    }

    SUBCASE("city state zip")
    {
        auto found = addresses("Address: Springfield, IL 62704");

        REQUIRE(found.size() == 1);
        CHECK(found[0].pe_text == "Springfield, IL 62704");
    }

    SUBCASE("european street")
    {
        auto found = addresses("habite au 12 rue Lepic");

        REQUIRE(found.size() == 1);
        CHECK(found[0].pe_text == "12 rue Lepic");
    }

    SUBCASE("uk postcode")
    {
        auto found = addresses("post to SW1A 1AA");

        REQUIRE(found.size() == 1);
        CHECK(found[0].pe_text == "SW1A 1AA");
    }

    SUBCASE("canadian postal code")
    {
        auto found = addresses("Ottawa K1A 0B1");

        REQUIRE(found.size() == 1);
        CHECK(found[0].pe_text == "K1A 0B1");
    }

    SUBCASE("earlier candidates win")
    {
        std::string text = "ship to 123 Main Street please";
        scan_input input(text);
        std::vector<pii_entity> entities
            = {pii_entity{"123 Main", "LICENSE_PLATE", 8, 16, 0.8}};

        pd.scan_addresses(input, entities);
        CHECK(entities.size() == 1);
    }
}

TEST_CASE("resolve_overlaps")
{
    SUBCASE("chained spans form one group")
    {
        std::vector<pii_entity> entities = {
            {"a", "PHONE", 0, 10, 0.80},
            {"b", "SSN", 8, 20, 0.90},
            {"c", "LICENSE_PLATE", 18, 30, 0.85},
            {"d", "EMAIL", 40, 45, 0.90},
        };
        auto resolved = detail::resolve_overlaps(entities);

        REQUIRE(resolved.size() == 2);
        CHECK(resolved[0].pe_label == "SSN");
        CHECK(resolved[0].pe_start == 8);
        CHECK(resolved[0].pe_end == 20);
        CHECK(resolved[0].pe_confidence == doctest::Approx(0.92));
        CHECK(resolved[1].pe_label == "EMAIL");
        CHECK(resolved[1].pe_confidence == doctest::Approx(0.90));
    }

    SUBCASE("a bridging span merges groups")
    {
        std::vector<pii_entity> entities = {
            {"a", "PHONE", 0, 5, 0.80},
            {"b", "SSN", 10, 15, 0.85},
            {"c", "TAX_ID", 3, 12, 0.82},
        };
        auto resolved = detail::resolve_overlaps(entities);

        REQUIRE(resolved.size() == 1);
        CHECK(resolved[0].pe_label == "SSN");
        CHECK(resolved[0].pe_confidence == doctest::Approx(0.87));
    }

    SUBCASE("pairs are not boosted and ties go to the first")
    {
        std::vector<pii_entity> entities = {
            {"a", "PHONE", 0, 10, 0.90},
            {"b", "SSN", 5, 15, 0.90},
        };
        auto resolved = detail::resolve_overlaps(entities);

        REQUIRE(resolved.size() == 1);
        CHECK(resolved[0].pe_label == "PHONE");
        CHECK(resolved[0].pe_confidence == doctest::Approx(0.90));
    }

    SUBCASE("boost is clamped")
    {
        std::vector<pii_entity> entities = {
            {"a", "CREDIT_CARD", 0, 16, 0.98},
            {"b", "BANK_ACCOUNT", 0, 16, 0.90},
            {"c", "PHONE", 4, 14, 0.85},
        };
        auto resolved = detail::resolve_overlaps(entities);

        REQUIRE(resolved.size() == 1);
        CHECK(resolved[0].pe_label == "CREDIT_CARD");
        CHECK(resolved[0].pe_confidence == doctest::Approx(0.99));
    }

    SUBCASE("adjacent spans do not overlap")
    {
        std::vector<pii_entity> entities = {
            {"a", "PHONE", 0, 5, 0.80},
            {"b", "SSN", 5, 10, 0.85},
        };

        CHECK(detail::resolve_overlaps(entities).size() == 2);
    }
}

TEST_CASE("is_filtered")
{
    auto filtered = [](const char* label, double conf, const char* text) {
        return detail::is_filtered(
            pii_entity{text, label, 0, strlen(text), conf});
    };

    CHECK(filtered("BANK_ACCOUNT", 0.879, "12345678"));
    CHECK_FALSE(filtered("BANK_ACCOUNT", 0.88, "12345678"));
    CHECK(filtered("DRIVER_LICENSE", 0.849, "D1234567"));
    CHECK_FALSE(filtered("DRIVER_LICENSE", 0.85, "D1234567"));
    CHECK(filtered("EMPLOYEE_ID", 0.869, "EMP12345"));
    CHECK_FALSE(filtered("EMPLOYEE_ID", 0.87, "EMP12345"));
    CHECK(filtered("TAX_ID", 0.869, "12-3456789"));
    CHECK_FALSE(filtered("TAX_ID", 0.87, "12-3456789"));
    CHECK_FALSE(filtered("SSN", 0.5, "123-45-6789"));

    CHECK(filtered("PHONE", 0.99, "555-555-5555"));
    CHECK(filtered("PHONE", 0.99, "+1 123-456-7890"));
    CHECK_FALSE(filtered("PHONE", 0.99, "555-123-4567"));
    CHECK(filtered("IP_ADDRESS", 0.99, "127.0.0.1"));
    CHECK(filtered("IP_ADDRESS", 0.99, "255.255.255.255"));
    CHECK_FALSE(filtered("IP_ADDRESS", 0.99, "192.168.1.100"));
}
