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
 * @file pii_patterns.cc
 */

#include <array>
#include <utility>

#include "pii_patterns.hh"


namespace piiguard {

static constexpr std::array<std::pair<const char*, double>, 32> ENTITY_WEIGHTS
    = {{
        {"SSN", 0.99},
        {"CREDIT_CARD", 0.99},
        {"IBAN", 0.98},
        {"BITCOIN_ADDRESS", 0.97},
        {"ETHEREUM_ADDRESS", 0.96},
        {"SWIFT_CODE", 0.98},
        {"ROUTING_NUMBER", 0.95},

        {"EMAIL", 0.99},
        {"PHONE", 0.97},
        {"IP_ADDRESS", 0.98},
        {"IPV6_ADDRESS", 0.97},
        {"MAC_ADDRESS", 0.96},

        {"NAME", 0.96},
        {"ADDRESS", 0.95},
        {"DATE_OF_BIRTH", 0.94},

        {"VIN", 0.98},
        {"LICENSE_PLATE", 0.93},

        {"MEDICAL_RECORD", 0.99},
        {"MEDICARE", 0.97},
        {"DEA_NUMBER", 0.96},
        {"NPI", 0.95},

        {"PASSPORT", 0.97},
        {"DRIVER_LICENSE", 0.95},
        {"UK_NINO", 0.96},
        {"CANADA_SIN", 0.96},
        {"FRANCE_INSEE", 0.95},
        {"GERMANY_STEUER", 0.94},
        {"INDIA_AADHAAR", 0.97},
        {"INDIA_PAN", 0.96},

        {"EMPLOYEE_ID", 0.93},
        {"TAX_ID", 0.94},
        {"BANK_ACCOUNT", 0.92},
    }};

double
entity_weight(const std::string& label)
{
    for (const auto& pair : ENTITY_WEIGHTS) {
        if (label == pair.first) {
            return pair.second;
        }
    }

    return DEFAULT_ENTITY_WEIGHT;
}

static constexpr int ENTITY_OPTIONS = PCRE2_CASELESS | PCRE2_UCP;
static constexpr int NAME_OPTIONS = PCRE2_UCP;

static std::vector<pattern_def>
compile_entity_patterns()
{
    std::vector<pattern_def> retval;

    auto add = [&retval](const char* label,
                         pcre2pp::code co,
                         std::vector<const char*> keywords,
                         double base) {
        retval.emplace_back(pattern_def{
            label,
            std::move(co),
            std::move(keywords),
            base,
            entity_weight(label),
        });
    };

    // financial
    add("SSN",
        pcre2pp::code::from_const(R"(\b(?:\d{3}-\d{2}-\d{4}|\d{9})\b)",
                                  ENTITY_OPTIONS),
        {"ssn", "social", "security", "tax", "tin", "taxpayer"},
        0.95);
    add("CREDIT_CARD",
        pcre2pp::code::from_const(
            R"(\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13})"
            R"(|3(?:0[0-5]|[68][0-9])[0-9]{11}|6(?:011|5[0-9]{2})[0-9]{12})"
            R"(|(?:2131|1800|35\d{3})\d{11})\b)",
            ENTITY_OPTIONS),
        {"card", "credit", "visa", "mastercard", "amex", "payment", "cc"},
        0.98);
    add("IBAN",
        pcre2pp::code::from_const(
            R"(\b[A-Z]{2}[0-9]{2}[A-Z0-9]{4}[0-9]{7}([A-Z0-9]?){0,16}\b)",
            ENTITY_OPTIONS),
        {"iban", "swift", "bank", "transfer", "wire", "sepa", "bic"},
        0.96);
    add("BITCOIN_ADDRESS",
        pcre2pp::code::from_const(
            R"(\b(?:[13][a-km-zA-HJ-NP-Z1-9]{25,34}|bc1[a-z0-9]{39,59})\b)",
            ENTITY_OPTIONS),
        {"bitcoin", "btc", "wallet", "crypto", "cryptocurrency", "address"},
        0.94);
    add("ETHEREUM_ADDRESS",
        pcre2pp::code::from_const(R"(\b0x[a-fA-F0-9]{40}\b)", ENTITY_OPTIONS),
        {"ethereum", "eth", "wallet", "crypto", "address", "0x"},
        0.93);
    add("ROUTING_NUMBER",
        pcre2pp::code::from_const(R"(\b[0-9]{9}\b)", ENTITY_OPTIONS),
        {"routing", "aba", "rtn", "bank", "wire"},
        0.88);

    // contact
    add("EMAIL",
        pcre2pp::code::from_const(
            R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
            ENTITY_OPTIONS),
        {"email", "mail", "contact", "@", "address"},
        0.99);
    add("PHONE",
        pcre2pp::code::from_const(
            R"((?:\+?[1-9]\d{0,3}[-.\s]?)?\(?\d{1,4}\)?[-.\s]?\d{1,4})"
            R"([-.\s]?\d{1,4}[-.\s]?\d{1,9})",
            ENTITY_OPTIONS),
        {"phone",
         "call",
         "mobile",
         "cell",
         "tel",
         "contact",
         "number",
         "whatsapp"},
        0.92);
    add("IP_ADDRESS",
        pcre2pp::code::from_const(
            R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3})"
            R"((?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)",
            ENTITY_OPTIONS),
        {"ip", "address", "server", "host", "connection", "network"},
        0.94);
    add("IPV6_ADDRESS",
        pcre2pp::code::from_const(R"(\b(?:[A-Fa-f0-9]{1,4}:){7}[A-Fa-f0-9]{1,4}\b)",
                                  ENTITY_OPTIONS),
        {"ipv6", "ip", "address", "network", "server"},
        0.93);
    add("MAC_ADDRESS",
        pcre2pp::code::from_const(R"(\b(?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}\b)",
                                  ENTITY_OPTIONS),
        {"mac", "address", "hardware", "network", "device"},
        0.91);

    // personal
    add("DATE_OF_BIRTH",
        pcre2pp::code::from_const(
            R"(\b(?:0[1-9]|1[0-2])[/-](?:0[1-9]|[12]\d|3[01])[/-](?:19|20)\d{2}\b)",
            ENTITY_OPTIONS),
        {"birth", "born", "dob", "birthday", "date of birth", "age"},
        0.88);
    add("DRIVER_LICENSE",
        pcre2pp::code::from_const(R"(\b(?:[A-Z][0-9]{7,12}|[0-9]{7,12}[A-Z]?)\b)",
                                  ENTITY_OPTIONS),
        {"driver", "license", "dl", "dmv", "driving", "licence"},
        0.85);
    add("PASSPORT",
        pcre2pp::code::from_const(R"(\b[A-Z][0-9]{8}\b)", ENTITY_OPTIONS),
        {"passport", "travel", "document", "visa", "immigration"},
        0.87);

    // vehicle
    add("VIN",
        pcre2pp::code::from_const(R"(\b[A-HJ-NPR-Z0-9]{17}\b)", ENTITY_OPTIONS),
        {"vin", "vehicle", "car", "auto", "chassis", "identification"},
        0.92);
    add("LICENSE_PLATE",
        pcre2pp::code::from_const(
            R"(\b[A-Z0-9]{1,3}[-\s]?[A-Z0-9]{1,4}[-\s]?[A-Z0-9]{1,4}\b)",
            ENTITY_OPTIONS),
        {"plate", "license", "registration", "vehicle", "car"},
        0.86);

    // healthcare
    add("MEDICAL_RECORD",
        pcre2pp::code::from_const(
            R"(\b(?:MRN|Patient ID|Medical Record)[:\s]*[A-Z0-9]{6,10}\b)",
            ENTITY_OPTIONS),
        {"patient", "medical", "record", "mrn", "health", "hospital", "clinic"},
        0.96);
    add("MEDICARE",
        pcre2pp::code::from_const(R"(\b[0-9]{3}-[0-9]{2}-[0-9]{4}[A-Z]\b)",
                                  ENTITY_OPTIONS),
        {"medicare", "cms", "health", "insurance", "beneficiary"},
        0.91);
    add("DEA_NUMBER",
        pcre2pp::code::from_const(R"(\b[A-Z]{2}[0-9]{7}\b)", ENTITY_OPTIONS),
        {"dea",
         "prescriber",
         "drug",
         "enforcement",
         "prescription",
         "doctor"},
        0.89);
    add("NPI",
        pcre2pp::code::from_const(R"(\b[0-9]{10}\b)", ENTITY_OPTIONS),
        {"npi", "provider", "national", "identifier", "healthcare"},
        0.87);

    // government ids
    add("UK_NINO",
        pcre2pp::code::from_const(R"(\b[A-Z]{2}[0-9]{6}[A-Z]\b)",
                                  ENTITY_OPTIONS),
        {"nino", "national insurance", "ni number", "uk"},
        0.90);
    add("CANADA_SIN",
        pcre2pp::code::from_const(R"(\b[0-9]{3}[-\s]?[0-9]{3}[-\s]?[0-9]{3}\b)",
                                  ENTITY_OPTIONS),
        {"sin", "social insurance", "canada", "canadian"},
        0.89);
    add("FRANCE_INSEE",
        pcre2pp::code::from_const(R"(\b[12][0-9]{2}[0-1][0-9][0-9]{8}[0-9]{2}\b)",
                                  ENTITY_OPTIONS),
        {"insee", "securite sociale", "france", "french"},
        0.88);
    add("GERMANY_STEUER",
        pcre2pp::code::from_const(
            R"(\b[0-9]{2}\s?[0-9]{3}\s?[0-9]{3}\s?[0-9]{3}\b)", ENTITY_OPTIONS),
        {"steuer", "steuernummer", "tax", "german", "deutschland"},
        0.87);
    add("INDIA_AADHAAR",
        pcre2pp::code::from_const(
            R"(\b[0-9]{4}[-\s]?[0-9]{4}[-\s]?[0-9]{4}\b)", ENTITY_OPTIONS),
        {"aadhaar", "uid", "india", "indian", "identity"},
        0.91);
    add("INDIA_PAN",
        pcre2pp::code::from_const(R"(\b[A-Z]{5}[0-9]{4}[A-Z]\b)",
                                  ENTITY_OPTIONS),
        {"pan", "permanent account", "tax", "india"},
        0.90);

    // bank accounts
    add("BANK_ACCOUNT",
        pcre2pp::code::from_const(R"(\b\d{8,17}\b)", ENTITY_OPTIONS),
        {"account", "bank", "checking", "savings", "deposit"},
        0.83);
    add("SWIFT_CODE",
        pcre2pp::code::from_const(
            R"(\b[A-Z]{4}[A-Z]{2}[A-Z0-9]{2}([A-Z0-9]{3})?\b)", ENTITY_OPTIONS),
        {"swift", "bic", "bank", "code", "transfer"},
        0.91);

    // corporate
    add("EMPLOYEE_ID",
        pcre2pp::code::from_const(
            R"(\b(?:EMP|EMPLOYEE|ID)[:\s]?[A-Z0-9]{5,10}\b)", ENTITY_OPTIONS),
        {"employee", "emp", "staff", "worker", "personnel"},
        0.88);
    add("TAX_ID",
        pcre2pp::code::from_const(R"(\b[0-9]{2}-[0-9]{7}\b)", ENTITY_OPTIONS),
        {"ein", "tax", "employer", "identification", "federal"},
        0.89);

    return retval;
}

const std::vector<pattern_def>&
get_entity_patterns()
{
    static const auto retval = compile_entity_patterns();

    return retval;
}

static std::vector<pcre2pp::code>
compile_name_patterns()
{
    std::vector<pcre2pp::code> retval;

    // english
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z]+ [A-Z][a-z]+(?:\s+[A-Z][a-z]+)?\b)", NAME_OPTIONS));
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b(?:Mr|Mrs|Ms|Dr|Prof)\.?\s+[A-Z][a-z]+\b)", NAME_OPTIONS));
    // spanish and portuguese
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z\x{e1}\x{e9}\x{ed}\x{f3}\x{fa}\x{f1}]+)"
        R"( [A-Z][a-z\x{e1}\x{e9}\x{ed}\x{f3}\x{fa}\x{f1}]+)"
        R"((?:\s+[A-Z][a-z\x{e1}\x{e9}\x{ed}\x{f3}\x{fa}\x{f1}]+)?\b)",
        NAME_OPTIONS));
    // french
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z\x{e0}\x{e2}\x{e7}\x{e9}\x{e8}\x{ea}\x{eb}\x{ef}\x{ee})"
        R"(\x{f4}\x{f9}\x{fb}\x{fc}]+)"
        R"( [A-Z][a-z\x{e0}\x{e2}\x{e7}\x{e9}\x{e8}\x{ea}\x{eb}\x{ef}\x{ee})"
        R"(\x{f4}\x{f9}\x{fb}\x{fc}]+\b)",
        NAME_OPTIONS));
    // german
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z\x{e4}\x{f6}\x{fc}\x{df}]+ [A-Z][a-z\x{e4}\x{f6}\x{fc}\x{df}]+\b)",
        NAME_OPTIONS));
    // italian
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z\x{e0}\x{e8}\x{e9}\x{ec}\x{ed}\x{f2}\x{f3}\x{f9}\x{fa}]+)"
        R"( [A-Z][a-z\x{e0}\x{e8}\x{e9}\x{ec}\x{ed}\x{f2}\x{f3}\x{f9}\x{fa}]+\b)",
        NAME_OPTIONS));
    // romanized chinese
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z]+ [A-Z][a-z]{1,3}\b)", NAME_OPTIONS));
    // romanized japanese
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z]+ [A-Z][a-z]+(?:moto|yama|kawa|mura|ta|da|shi|no|o)\b)",
        NAME_OPTIONS));

    return retval;
}

const std::vector<pcre2pp::code>&
get_name_patterns()
{
    static const auto retval = compile_name_patterns();

    return retval;
}

static std::vector<pcre2pp::code>
compile_address_patterns()
{
    std::vector<pcre2pp::code> retval;

    // united states
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b\d{1,5}\s+[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*\s+)"
        R"((?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr)"
        R"(|Court|Ct|Circle|Cir|Plaza|Pl|Terrace|Ter|Way)\b)",
        ENTITY_OPTIONS));
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*,\s*[A-Z]{2}\s+\d{5}(?:-\d{4})?\b)",
        ENTITY_OPTIONS));
    // europe
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b\d{1,4}\s+(?:rue|avenue|boulevard|place|chemin)\s+[A-Z][a-z]+\b)",
        ENTITY_OPTIONS));
    // uk postcodes
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z]{1,2}[0-9]{1,2}[A-Z]?\s*[0-9][A-Z]{2}\b)", ENTITY_OPTIONS));
    // canadian postal codes
    retval.emplace_back(pcre2pp::code::from_const(
        R"(\b[A-Z][0-9][A-Z]\s*[0-9][A-Z][0-9]\b)", ENTITY_OPTIONS));

    return retval;
}

const std::vector<pcre2pp::code>&
get_address_patterns()
{
    static const auto retval = compile_address_patterns();

    return retval;
}

static std::vector<language_rule>
compile_language_rules()
{
    std::vector<language_rule> retval;

    retval.emplace_back(language_rule{
        "fr",
        pcre2pp::code::from_const(
            R"([\x{e0}\x{e2}\x{e7}\x{e9}\x{e8}\x{ea}\x{eb}\x{ef}\x{ee}\x{f4})"
            R"(\x{f9}\x{fb}\x{fc}])",
            PCRE2_CASELESS),
    });
    retval.emplace_back(language_rule{
        "de",
        pcre2pp::code::from_const(R"([\x{e4}\x{f6}\x{fc}\x{df}])",
                                  PCRE2_CASELESS),
    });
    retval.emplace_back(language_rule{
        "es",
        pcre2pp::code::from_const(
            R"([\x{e1}\x{e9}\x{ed}\x{f3}\x{fa}\x{f1}])", PCRE2_CASELESS),
    });
    retval.emplace_back(language_rule{
        "it",
        pcre2pp::code::from_const(
            R"([\x{e0}\x{e8}\x{e9}\x{ec}\x{ed}\x{f2}\x{f3}\x{f9}\x{fa}])",
            PCRE2_CASELESS),
    });
    retval.emplace_back(language_rule{
        "zh",
        pcre2pp::code::from_const(R"([\x{4e00}-\x{9fff}])"),
    });
    retval.emplace_back(language_rule{
        "ja",
        pcre2pp::code::from_const(R"([\x{3040}-\x{309f}\x{30a0}-\x{30ff}])"),
    });
    retval.emplace_back(language_rule{
        "hi",
        pcre2pp::code::from_const(R"([\x{0900}-\x{097f}])"),
    });

    return retval;
}

const std::vector<language_rule>&
get_language_rules()
{
    static const auto retval = compile_language_rules();

    return retval;
}

}  // namespace piiguard
