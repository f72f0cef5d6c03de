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
 * @file field_strategies.cc
 */

#include <cmath>

#include "field_strategies.hh"

#include <ctype.h>
#include <stdlib.h>

#include "base/piiguard_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"
#include "hasher.hh"
#include "pcrepp/pcre2pp.hh"

namespace piiguard {

static const std::vector<const char*> FAKE_DOMAINS = {
    "example.com",
    "test.org",
    "sample.net",
};

static const std::vector<const char*> FAKE_FIRST_NAMES = {
    "John",
    "Jane",
    "Alex",
    "Sam",
    "Chris",
    "Pat",
    "Jordan",
    "Taylor",
    "Morgan",
    "Casey",
};

static const std::vector<const char*> FAKE_LAST_NAMES = {
    "Smith",
    "Johnson",
    "Williams",
    "Brown",
    "Jones",
    "Garcia",
    "Miller",
    "Davis",
    "Wilson",
    "Moore",
};

static const std::vector<const char*> FAKE_STREETS = {
    "Main St",
    "Oak Ave",
    "Park Blvd",
    "First St",
    "Elm Way",
    "Maple Dr",
};

static const std::vector<const char*> FAKE_CITIES = {
    "Springfield",
    "Riverside",
    "Fairview",
    "Madison",
    "Georgetown",
    "Clinton",
};

static const std::vector<const char*> FAKE_STATES = {
    "CA",
    "NY",
    "TX",
    "FL",
    "WA",
    "IL",
};

static const std::vector<numeric_range> DEFAULT_RANGES = {
    {0, 10},
    {11, 20},
    {21, 50},
    {51, 100},
};

static strategy_result
text_result(std::string str)
{
    return Ok(anon_value{std::move(str)});
}

/**
 * Run func with the generator for the given locale, reusing the context's
 * generator when the locales agree.
 */
template<typename F>
static auto
with_locale_generator(strategy_context& ctx, const std::string& locale, F func)
{
    if (ctx.sc_fake_data != nullptr
        && ctx.sc_fake_data->get_locale() == locale)
    {
        return func(*ctx.sc_fake_data);
    }

    fake_data_generator fdg(ctx.sc_seed, locale);

    return func(fdg);
}

std::string
mask_digits(const std::string& str,
            int64_t show_last,
            const std::string& mask_char)
{
    auto digits = digits_only(str);

    if (show_last > 0 && digits.size() > (size_t) show_last) {
        return repeat(mask_char, digits.size() - show_last)
            + digits.substr(digits.size() - show_last);
    }

    return repeat(mask_char, digits.size());
}

strategy_result
anonymize_email(const anon_value& value,
                const field_config& fc,
                strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto email = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::redact:
            break;
        case anon_method_t::mask: {
            auto at_pos = email.find('@');

            if (at_pos == std::string::npos) {
                return text_result("***@***.***");
            }

            auto local = email.substr(0, at_pos);
            std::string masked_local = "***";
            if (!local.empty()) {
                auto first_len = utf8_char_size(local[0]);

                if (first_len < local.size()) {
                    masked_local = local.substr(0, first_len) + "***";
                }
            }
            return text_result(masked_local + email.substr(at_pos));
        }
        case anon_method_t::hash:
            return text_result(
                fmt::format(FMT_STRING("anon_{}@example.com"),
                            sha256_hex(email).substr(0, 12)));
        case anon_method_t::fake: {
            auto rng = value_seeded_rng(ctx.sc_seed, email);
            std::string fake_name;

            for (int lpc = 0; lpc < 8; lpc++) {
                fake_name.push_back(
                    static_cast<char>('a' + rand_between(rng, 0, 25)));
            }
            return text_result(fmt::format(FMT_STRING("{}@{}"),
                                           fake_name,
                                           rand_choice(rng, FAKE_DOMAINS)));
        }
        case anon_method_t::tokenize:
            if (ctx.sc_vault != nullptr) {
                return text_result(ctx.sc_vault->tokenize(email, "email"));
            }
            return text_result(fmt::format(FMT_STRING("TOK_EMAIL_{}"),
                                           md5_hex(email).substr(0, 12)));
        default:
            break;
    }

    return text_result("[EMAIL_REDACTED]");
}

strategy_result
anonymize_phone(const anon_value& value,
                const field_config& fc,
                strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto phone = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::mask:
            return text_result(mask_digits(phone,
                                           fc.get_int("show_last", 4),
                                           fc.get_string("mask_char", "*")));
        case anon_method_t::hash:
            return text_result(fmt::format(FMT_STRING("+1{}"),
                                           sha256_hex(phone).substr(0, 10)));
        case anon_method_t::fake: {
            auto rng = value_seeded_rng(ctx.sc_seed, phone);
            auto area = rand_between(rng, 200, 999);
            auto exchange = rand_between(rng, 200, 999);
            auto subscriber = rand_between(rng, 1000, 9999);

            return text_result(fmt::format(
                FMT_STRING("+1-{}-{}-{}"), area, exchange, subscriber));
        }
        default:
            break;
    }

    return text_result("[PHONE_REDACTED]");
}

strategy_result
anonymize_name(const anon_value& value,
               const field_config& fc,
               strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto name = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::mask: {
            std::vector<std::string> parts;
            std::string retval;

            split_ws(name, parts);
            for (const auto& part : parts) {
                auto first_len = utf8_char_size(part[0]);

                if (!retval.empty()) {
                    retval.push_back(' ');
                }
                if (first_len < part.size()) {
                    retval.append(part, 0, first_len);
                }
                retval.append("***");
            }
            return text_result(retval);
        }
        case anon_method_t::hash:
            return text_result(fmt::format(FMT_STRING("User_{}"),
                                           sha256_hex(name).substr(0, 8)));
        case anon_method_t::fake: {
            if (fc.has_param("locale")) {
                return text_result(with_locale_generator(
                    ctx,
                    fc.get_string("locale", "en_US"),
                    [&name](fake_data_generator& fdg) {
                        return fdg.full_name(name);
                    }));
            }

            auto rng = value_seeded_rng(ctx.sc_seed, name);
            const auto* first = rand_choice(rng, FAKE_FIRST_NAMES);
            const auto* last = rand_choice(rng, FAKE_LAST_NAMES);

            return text_result(fmt::format(FMT_STRING("{} {}"), first, last));
        }
        default:
            break;
    }

    return text_result("[NAME_REDACTED]");
}

strategy_result
anonymize_ssn(const anon_value& value,
              const field_config& fc,
              strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto ssn = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::mask: {
            auto digits = digits_only(ssn);

            if (digits.size() >= 4) {
                return text_result(fmt::format(
                    FMT_STRING("***-**-{}"), digits.substr(digits.size() - 4)));
            }
            return text_result("***-**-****");
        }
        case anon_method_t::hash: {
            auto hex = sha256_hex(ssn);

            return text_result(fmt::format(FMT_STRING("{}-{}-{}"),
                                           hex.substr(0, 3),
                                           hex.substr(3, 2),
                                           hex.substr(5, 4)));
        }
        case anon_method_t::fake: {
            auto rng = value_seeded_rng(ctx.sc_seed, ssn);
            auto area = rand_between(rng, 100, 999);
            auto group = rand_between(rng, 10, 99);
            auto serial = rand_between(rng, 1000, 9999);

            return text_result(
                fmt::format(FMT_STRING("{}-{}-{}"), area, group, serial));
        }
        default:
            break;
    }

    return text_result("[SSN_REDACTED]");
}

std::optional<date::year_month_day>
parse_iso_date(const std::string& str)
{
    static const auto ISO_DATE_RE = pcre2pp::code::from_const(
        R"(^(\d{4})-(\d{2})-(\d{2}))"
        R"((?:.(\d{2})(?::(\d{2})(?::(\d{2})(?:\.(?:\d{3}|\d{6}))?)?)?)"
        R"((?:Z|[+-]\d{2}:\d{2}(?::\d{2}(?:\.\d{6})?)?)?)?\z)");

    auto md = ISO_DATE_RE.create_match_data();
    auto match_res = ISO_DATE_RE.capture_from(str).into(md).matches();
    if (!match_res.ignore_error()) {
        return std::nullopt;
    }

    auto to_int = [&md](size_t index, int def) {
        auto cap = md[index];

        if (!cap) {
            return def;
        }
        return (int) strtol(cap->to_string().c_str(), nullptr, 10);
    };

    date::year_month_day retval{date::year{to_int(1, 0)},
                                date::month(to_int(2, 0)),
                                date::day(to_int(3, 0))};
    if (!retval.ok()) {
        return std::nullopt;
    }
    if (to_int(4, 0) >= 24 || to_int(5, 0) >= 60 || to_int(6, 0) >= 60) {
        return std::nullopt;
    }

    return retval;
}

strategy_result
anonymize_date(const anon_value& value,
               const field_config& fc,
               strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto str = to_string(value);
    auto ymd_opt = parse_iso_date(str);
    if (!ymd_opt) {
        log_debug("unparseable date value in field %s",
                  fc.fc_field_name.c_str());
        return text_result("[DATE_REDACTED]");
    }

    auto days = date::sys_days{ymd_opt.value()};
    switch (fc.fc_method) {
        case anon_method_t::redact:
            return text_result("[DATE_REDACTED]");
        case anon_method_t::generalize: {
            auto precision = fc.get_string("precision", "month");

            if (precision == "year") {
                return text_result(date::format("%Y-01-01", days));
            }
            if (precision == "month") {
                return text_result(date::format("%Y-%m-01", days));
            }
            if (precision == "decade") {
                auto decade = (int(ymd_opt->year()) / 10) * 10;

                return text_result(fmt::format(FMT_STRING("{}-01-01"), decade));
            }
            break;
        }
        case anon_method_t::fake: {
            auto rng = value_seeded_rng(ctx.sc_seed, str);
            auto shift = date::days{
                static_cast<int>(rand_between(rng, -365, 365))};

            return text_result(date::format("%Y-%m-%d", days + shift));
        }
        default:
            break;
    }

    return text_result(date::format("%Y-%m-%d", days));
}

static Result<double, std::string>
to_number(const anon_value& value)
{
    return value.match(
        [](null_value_t) -> Result<double, std::string> {
            return Err(std::string(
                "float() argument must be a string or a real number, not "
                "'NoneType'"));
        },
        [](bool bval) -> Result<double, std::string> {
            return Ok(bval ? 1.0 : 0.0);
        },
        [](int64_t ival) -> Result<double, std::string> {
            return Ok(static_cast<double>(ival));
        },
        [](double dval) -> Result<double, std::string> { return Ok(dval); },
        [](const std::string& sval) -> Result<double, std::string> {
            auto trimmed = trim(sval);
            char* end = nullptr;

            if (!trimmed.empty()) {
                auto retval = strtod(trimmed.c_str(), &end);

                if (end == trimmed.c_str() + trimmed.size()) {
                    return Ok(retval);
                }
            }

            return Err(fmt::format(
                FMT_STRING("could not convert string to float: '{}'"), sval));
        });
}

strategy_result
anonymize_numeric(const anon_value& value,
                  const field_config& fc,
                  strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto num_res = to_number(value);
    if (num_res.isErr()) {
        return Err(num_res.unwrapErr());
    }

    auto num = num_res.unwrap();
    switch (fc.fc_method) {
        case anon_method_t::redact:
            return Ok(anon_value{int64_t{0}});
        case anon_method_t::generalize: {
            for (const auto& nr : fc.get_ranges("ranges", DEFAULT_RANGES)) {
                if (nr.contains(num)) {
                    return text_result(nr.to_label());
                }
            }
            return text_result("other");
        }
        case anon_method_t::fake: {
            auto rng = value_seeded_rng(ctx.sc_seed, to_string(value));
            auto noise_pct = std::fabs(fc.get_number("noise_percent", 10.0));
            auto noise
                = num * (rand_uniform(rng, -noise_pct, noise_pct) / 100.0);

            return Ok(anon_value{std::round((num + noise) * 100.0) / 100.0});
        }
        default:
            break;
    }

    return Ok(anon_value{num});
}

strategy_result
anonymize_text(const anon_value& value,
               const field_config& fc,
               strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto text = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::hash:
            return text_result(fmt::format(FMT_STRING("text_{}"),
                                           sha256_hex(text).substr(0, 16)));
        case anon_method_t::mask:
            for (auto& ch : text) {
                if (isalnum((unsigned char) ch)) {
                    ch = '*';
                }
            }
            return text_result(text);
        case anon_method_t::preserve:
            return text_result(text);
        default:
            break;
    }

    return text_result("[TEXT_REDACTED]");
}

strategy_result
anonymize_address(const anon_value& value,
                  const field_config& fc,
                  strategy_context& ctx)
{
    static const auto ZIP_RE
        = pcre2pp::code::from_const(R"(\b\d{5}(?:-\d{4})?\b)");

    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto address = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::fake: {
            if (fc.has_param("locale")) {
                return text_result(with_locale_generator(
                    ctx,
                    fc.get_string("locale", "en_US"),
                    [&address](fake_data_generator& fdg) {
                        return fdg.address(address).fa_full;
                    }));
            }

            auto rng = value_seeded_rng(ctx.sc_seed, address);
            auto num = rand_between(rng, 100, 9999);
            const auto* street = rand_choice(rng, FAKE_STREETS);
            const auto* city = rand_choice(rng, FAKE_CITIES);
            const auto* state = rand_choice(rng, FAKE_STATES);
            auto zipcode = rand_between(rng, 10000, 99999);

            return text_result(fmt::format(FMT_STRING("{} {}, {}, {} {}"),
                                           num,
                                           street,
                                           city,
                                           state,
                                           zipcode));
        }
        case anon_method_t::generalize: {
            if (fc.get_string("precision", "city") == "zip") {
                auto zip_match = ZIP_RE.find_in(address).ignore_error();

                if (zip_match) {
                    return text_result(zip_match->f_all.to_string());
                }
            }
            return text_result("[LOCATION_GENERALIZED]");
        }
        default:
            break;
    }

    return text_result("[ADDRESS_REDACTED]");
}

strategy_result
anonymize_credit_card(const anon_value& value,
                      const field_config& fc,
                      strategy_context& ctx)
{
    if (is_null(value)) {
        return Ok(anon_value{});
    }

    auto cc = to_string(value);

    switch (fc.fc_method) {
        case anon_method_t::mask:
            return text_result(mask_digits(cc,
                                           fc.get_int("show_last", 4),
                                           fc.get_string("mask_char", "*")));
        case anon_method_t::hash:
            return text_result(sha256_hex(cc).substr(0, 16));
        default:
            break;
    }

    return text_result("[CC_REDACTED]");
}

strategy_func
strategy_for(field_type_t type)
{
    static constexpr strategy_func STRATEGIES[] = {
        anonymize_email,
        anonymize_phone,
        anonymize_name,
        anonymize_ssn,
        anonymize_date,
        anonymize_numeric,
        anonymize_text,
        anonymize_address,
        anonymize_credit_card,
    };

    return STRATEGIES[static_cast<int>(type)];
}

}  // namespace piiguard
