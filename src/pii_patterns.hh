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
 * @file pii_patterns.hh
 */

#ifndef piiguard_pii_patterns_hh
#define piiguard_pii_patterns_hh

#include <string>
#include <vector>

#include "pcrepp/pcre2pp.hh"

namespace piiguard {

/**
 * How a single entity type is recognized: the rule, the keywords that make
 * a match more believable when they are nearby and the starting confidence.
 */
struct pattern_def {
    const char* pd_label;
    pcre2pp::code pd_code;
    std::vector<const char*> pd_keywords;
    double pd_base_confidence;
    double pd_weight;
};

struct language_rule {
    const char* lr_language;
    pcre2pp::code lr_code;
};

constexpr double DEFAULT_ENTITY_WEIGHT = 0.85;

/**
 * @return The weight applied to the base confidence of the given type.
 */
double entity_weight(const std::string& label);

/**
 * The entity rules in the order they are scanned.  The table is compiled
 * on first use and is never modified afterward.
 */
const std::vector<pattern_def>& get_entity_patterns();

const std::vector<pcre2pp::code>& get_name_patterns();

const std::vector<pcre2pp::code>& get_address_patterns();

const std::vector<language_rule>& get_language_rules();

}  // namespace piiguard

#endif
