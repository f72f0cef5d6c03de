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
 * @file pii_detector.cc
 */

#include <algorithm>

#include "pii_detector.hh"

#include "base/piiguard_log.hh"
#include "base/string_util.hh"
#include "pii_validators.hh"
#include "yajlpp/yajlpp.hh"

namespace piiguard {

static constexpr size_t SCORE_WINDOW = 100;
static constexpr size_t CONTEXT_WINDOW = 50;
static constexpr double ACCEPT_THRESHOLD = 0.75;
static constexpr double NAME_THRESHOLD = 0.80;
static constexpr double NAME_BASE_CONFIDENCE = 0.88;
static constexpr double ADDRESS_CONFIDENCE = 0.95;
static constexpr double MAX_CONFIDENCE = 0.99;
static constexpr double ENSEMBLE_BOOST = 0.02;

static const char* const NAME_TITLES[] = {
    "Mr.",
    "Mrs.",
    "Ms.",
    "Dr.",
    "Prof.",
    "Sr.",
    "Sra.",
    "M.",
    "Mme.",
    "Herr",
    "Frau",
    "Sig.",
    "Sig.ra",
};

static const char* const NAME_INDICATORS[] = {
    "name",
    "called",
    "by",
    "author",
    "contact",
    "person",
    "nom",
    "nombre",
    "nome",
};

/**
 * Well-known placeholder values that show up in examples and test data.
 */
static const char* const PHONE_PLACEHOLDERS[] = {
    "555-555-5555",
    "123-456-7890",
    "000-000-0000",
};

static const char* const IP_PLACEHOLDERS[] = {
    "127.0.0.1",
    "0.0.0.0",
    "255.255.255.255",
};

static double
context_score(const std::string& text,
              string_fragment match,
              const std::vector<const char*>& keywords)
{
    auto window = tolower(
        utf8_window(text, match.sf_begin, match.sf_end, SCORE_WINDOW)
            .to_string());
    double retval = 0.0;

    for (const auto* keyword : keywords) {
        if (window.find(keyword) != std::string::npos) {
            retval += 0.2;
        }
    }

    return std::min(1.0, retval);
}

static bool
email_has_dotted_domain(const std::string& value)
{
    auto at_pos = value.find('@');

    if (at_pos == std::string::npos) {
        return false;
    }

    auto domain_end = value.find('@', at_pos + 1);
    auto dot_pos = value.find('.', at_pos + 1);

    return dot_pos != std::string::npos && dot_pos < domain_end;
}

static double
validator_bonus(const std::string& label, const std::string& value)
{
    if (label == "SSN") {
        return validators::ssn(value) ? 0.05 : 0.0;
    }
    if (label == "CREDIT_CARD") {
        return validators::luhn(digits_only(value)) ? 0.08 : 0.0;
    }
    if (label == "EMAIL") {
        return email_has_dotted_domain(value) ? 0.03 : 0.0;
    }
    if (label == "IP_ADDRESS") {
        return validators::ipv4(value) ? 0.04 : 0.0;
    }
    if (label == "VIN") {
        return validators::vin(value) ? 0.06 : 0.0;
    }
    if (label == "IBAN") {
        return validators::iban(value) ? 0.07 : 0.0;
    }
    if (label == "BITCOIN_ADDRESS") {
        return validators::bitcoin(value) ? 0.05 : 0.0;
    }

    return 0.0;
}

static double
validator_penalty(const std::string& label, const std::string& value)
{
    if (label == "VIN" && !validators::vin(value)) {
        return 0.7;
    }
    if (label == "IBAN" && !validators::iban(value)) {
        return 0.6;
    }
    if (label == "BITCOIN_ADDRESS" && !validators::bitcoin(value)) {
        return 0.8;
    }

    return 1.0;
}

namespace detail {

double
name_confidence(const std::string& text, string_fragment match)
{
    auto name = match.to_string();
    double retval = NAME_BASE_CONFIDENCE;

    for (const auto* title : NAME_TITLES) {
        if (name.find(title) != std::string::npos) {
            retval += 0.08;
            break;
        }
    }

    std::vector<std::string> words;
    split_ws(name, words);
    if (std::all_of(words.begin(), words.end(), [](const std::string& word) {
            return isupper((unsigned char) word[0]);
        }))
    {
        retval += 0.05;
    }

    auto context = tolower(
        utf8_window(text, match.sf_begin, match.sf_end, CONTEXT_WINDOW)
            .to_string());
    for (const auto* indicator : NAME_INDICATORS) {
        if (context.find(indicator) != std::string::npos) {
            retval += 0.06;
            break;
        }
    }

    return std::min(MAX_CONFIDENCE, retval);
}

}  // namespace detail

static pii_entity
make_entity(const scan_input& input,
            string_fragment match,
            const char* label,
            double confidence)
{
    const auto& text = input.si_text;
    pii_entity retval;

    retval.pe_text = text.substr(match.sf_begin, match.length());
    retval.pe_label = label;
    retval.pe_start = match.sf_begin;
    retval.pe_end = match.sf_end;
    retval.pe_confidence = std::min(MAX_CONFIDENCE, confidence);
    retval.pe_context
        = utf8_window(text, match.sf_begin, match.sf_end, CONTEXT_WINDOW)
              .to_string();
    retval.pe_language = input.si_language;

    return retval;
}

static bool
overlaps_any(const std::vector<pii_entity>& entities, string_fragment match)
{
    return std::any_of(
        entities.begin(), entities.end(), [&match](const pii_entity& pe) {
            return pe.overlaps(match.sf_begin, match.sf_end);
        });
}

static void
log_scan_error(const char* rule, const pcre2pp::matcher::error& err)
{
    log_debug("%s: scan stopped -- %s", rule, err.get_message().c_str());
}

template<size_t N>
static bool
contains_any(const std::string& text, const char* const (&needles)[N])
{
    for (const auto* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }

    return false;
}

namespace detail {

std::vector<pii_entity>
resolve_overlaps(const std::vector<pii_entity>& entities)
{
    std::vector<std::vector<size_t>> groups;

    for (size_t lpc = 0; lpc < entities.size(); lpc++) {
        std::optional<size_t> home;

        for (size_t gi = 0; gi < groups.size();) {
            auto& group = groups[gi];
            auto hit = std::any_of(
                group.begin(), group.end(), [&entities, lpc](size_t idx) {
                    return entities[idx].overlaps(entities[lpc]);
                });

            if (!hit) {
                gi += 1;
                continue;
            }
            if (!home) {
                home = gi;
                group.push_back(lpc);
                gi += 1;
                continue;
            }

            auto& home_group = groups[home.value()];
            home_group.insert(home_group.end(), group.begin(), group.end());
            std::sort(home_group.begin(), home_group.end());
            groups.erase(groups.begin() + gi);
        }

        if (!home) {
            groups.push_back({lpc});
        }
    }

    std::vector<pii_entity> retval;

    retval.reserve(groups.size());
    for (const auto& group : groups) {
        if (group.size() == 1) {
            retval.push_back(entities[group.front()]);
            continue;
        }

        auto best_idx = group.front();
        for (auto idx : group) {
            if (entities[idx].pe_confidence > entities[best_idx].pe_confidence)
            {
                best_idx = idx;
            }
        }

        auto best = entities[best_idx];
        if (group.size() > 2) {
            best.pe_confidence
                = std::min(MAX_CONFIDENCE, best.pe_confidence + ENSEMBLE_BOOST);
        }
        retval.push_back(std::move(best));
    }

    return retval;
}

bool
is_filtered(const pii_entity& pe)
{
    const auto& label = pe.pe_label;

    if (label == "BANK_ACCOUNT" && pe.pe_confidence < 0.88) {
        return true;
    }
    if (label == "DRIVER_LICENSE" && pe.pe_confidence < 0.85) {
        return true;
    }
    if ((label == "EMPLOYEE_ID" || label == "TAX_ID")
        && pe.pe_confidence < 0.87)
    {
        return true;
    }
    if (label == "PHONE" && contains_any(pe.pe_text, PHONE_PLACEHOLDERS)) {
        return true;
    }
    if (label == "IP_ADDRESS" && contains_any(pe.pe_text, IP_PLACEHOLDERS)) {
        return true;
    }

    return false;
}

}  // namespace detail

scan_input::scan_input(const std::string& text)
    : si_text(text), si_scan(scrub_utf8(text)),
      si_language(pii_detector::detect_language(this->si_scan))
{
}

pii_detector::pii_detector()
    : pd_patterns(get_entity_patterns()),
      pd_name_patterns(get_name_patterns()),
      pd_address_patterns(get_address_patterns())
{
}

std::string
pii_detector::detect_language(const std::string& text)
{
    for (const auto& rule : get_language_rules()) {
        if (rule.lr_code.find_in(text).ignore_error()) {
            return rule.lr_language;
        }
    }

    return "en";
}

void
pii_detector::scan_patterns(const scan_input& input,
                            std::vector<pii_entity>& entities) const
{
    const auto& text = input.si_scan;

    for (const auto& def : this->pd_patterns) {
        std::string label = def.pd_label;
        auto scan_res = def.pd_code.capture_from(text).for_each(
            [&](const pcre2pp::match_data& md) {
                auto match = md[0].value();
                auto value = match.to_string();
                auto score = context_score(text, match, def.pd_keywords);
                auto confidence = def.pd_base_confidence * def.pd_weight
                    + score * 0.1;

                confidence += validator_bonus(label, value);
                confidence = std::min(MAX_CONFIDENCE, confidence);
                confidence *= validator_penalty(label, value);

                if (confidence > ACCEPT_THRESHOLD) {
                    entities.emplace_back(
                        make_entity(input, match, def.pd_label, confidence));
                }
            });

        if (scan_res.isErr()) {
            log_scan_error(def.pd_label, scan_res.unwrapErr());
        }
    }
}

void
pii_detector::scan_names(const scan_input& input,
                         std::vector<pii_entity>& entities) const
{
    const auto& text = input.si_scan;

    for (const auto& co : this->pd_name_patterns) {
        auto scan_res = co.capture_from(text).for_each(
            [&](const pcre2pp::match_data& md) {
                auto match = md[0].value();

                if (overlaps_any(entities, match)) {
                    return;
                }

                auto confidence = detail::name_confidence(text, match);
                if (confidence > NAME_THRESHOLD) {
                    entities.emplace_back(
                        make_entity(input, match, "NAME", confidence));
                }
            });

        if (scan_res.isErr()) {
            log_scan_error("NAME", scan_res.unwrapErr());
        }
    }
}

void
pii_detector::scan_addresses(const scan_input& input,
                             std::vector<pii_entity>& entities) const
{
    for (const auto& co : this->pd_address_patterns) {
        auto scan_res = co.capture_from(input.si_scan).for_each(
            [&](const pcre2pp::match_data& md) {
                auto match = md[0].value();

                if (overlaps_any(entities, match)) {
                    return;
                }

                entities.emplace_back(
                    make_entity(input, match, "ADDRESS", ADDRESS_CONFIDENCE));
            });

        if (scan_res.isErr()) {
            log_scan_error("ADDRESS", scan_res.unwrapErr());
        }
    }
}

std::vector<pii_entity>
pii_detector::detect(const std::string& text) const
{
    std::vector<pii_entity> entities;

    if (text.empty()) {
        return entities;
    }

    scan_input input(text);

    this->scan_patterns(input, entities);
    this->scan_names(input, entities);
    this->scan_addresses(input, entities);

    auto candidate_count = entities.size();
    auto resolved = detail::resolve_overlaps(entities);
    std::vector<pii_entity> retval;

    retval.reserve(resolved.size());
    for (auto& pe : resolved) {
        if (!detail::is_filtered(pe)) {
            retval.emplace_back(std::move(pe));
        }
    }
    std::stable_sort(
        retval.begin(),
        retval.end(),
        [](const pii_entity& lhs, const pii_entity& rhs) {
            return lhs.pe_start < rhs.pe_start;
        });

    log_debug("detected %zu entities (%zu candidates) in %zu bytes; lang=%s",
              retval.size(),
              candidate_count,
              text.size(),
              input.si_language.c_str());

    return retval;
}

redaction_result
pii_detector::redact(const std::string& text,
                     const std::string& mask_char) const
{
    redaction_result retval;

    retval.rr_entities = this->detect(text);
    retval.rr_text = text;

    auto mask = repeat(mask_char, 4);
    for (auto iter = retval.rr_entities.rbegin();
         iter != retval.rr_entities.rend();
         ++iter)
    {
        retval.rr_text.replace(
            iter->pe_start,
            iter->pe_end - iter->pe_start,
            fmt::format(FMT_STRING("[{}:{}]"), iter->pe_label, mask));
    }

    return retval;
}

detection_statistics
pii_detector::get_statistics(const std::vector<pii_entity>& entities) const
{
    detection_statistics retval;

    if (entities.empty()) {
        return retval;
    }

    std::map<std::string, double> conf_sums;
    double total_conf = 0.0;

    for (const auto& pe : entities) {
        retval.ds_by_type[pe.pe_label].ts_count += 1;
        conf_sums[pe.pe_label] += pe.pe_confidence;
        retval.ds_by_language[pe.pe_language] += 1;
        total_conf += pe.pe_confidence;
    }
    for (auto& type_pair : retval.ds_by_type) {
        type_pair.second.ts_avg_confidence
            = conf_sums[type_pair.first] / type_pair.second.ts_count;
    }
    retval.ds_total = entities.size();
    retval.ds_avg_confidence = total_conf / entities.size();

    return retval;
}

void
detection_statistics::gen(yajl_gen gen) const
{
    yajlpp_map root(gen);

    root.gen("total");
    root.gen(this->ds_total);
    root.gen("by_type");
    {
        yajlpp_map type_map(gen);

        for (const auto& type_pair : this->ds_by_type) {
            type_map.gen(type_pair.first);
            {
                yajlpp_map stats_map(gen);

                stats_map.gen("count");
                stats_map.gen(type_pair.second.ts_count);
                stats_map.gen("avg_confidence");
                stats_map.gen(type_pair.second.ts_avg_confidence);
            }
        }
    }
    root.gen("by_language");
    {
        yajlpp_map lang_map(gen);

        for (const auto& lang_pair : this->ds_by_language) {
            lang_map.gen(lang_pair.first);
            lang_map.gen(lang_pair.second);
        }
    }
    root.gen("avg_confidence");
    root.gen(this->ds_avg_confidence);
}

std::string
detection_statistics::to_json() const
{
    yajlpp_gen gen;

    this->gen(gen);

    return gen.to_string_fragment().to_string();
}

}  // namespace piiguard
