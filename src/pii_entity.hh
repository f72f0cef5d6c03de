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
 * @file pii_entity.hh
 */

#ifndef piiguard_pii_entity_hh
#define piiguard_pii_entity_hh

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "result.h"
#include "yajl/yajl_gen.h"
#include "yajl/yajl_tree.h"

namespace piiguard {

enum class entity_category_t {
    financial,
    contact,
    personal,
    vehicle,
    healthcare,
    government_id,
    corporate,
};

const char* category_name(entity_category_t cat);

struct entity_type_info {
    const char* eti_label;
    entity_category_t eti_category;
};

constexpr std::array<entity_type_info, 32> ENTITY_TYPES = {{
    {"SSN", entity_category_t::financial},
    {"CREDIT_CARD", entity_category_t::financial},
    {"IBAN", entity_category_t::financial},
    {"BITCOIN_ADDRESS", entity_category_t::financial},
    {"ETHEREUM_ADDRESS", entity_category_t::financial},
    {"ROUTING_NUMBER", entity_category_t::financial},
    {"BANK_ACCOUNT", entity_category_t::financial},
    {"SWIFT_CODE", entity_category_t::financial},

    {"EMAIL", entity_category_t::contact},
    {"PHONE", entity_category_t::contact},
    {"IP_ADDRESS", entity_category_t::contact},
    {"IPV6_ADDRESS", entity_category_t::contact},
    {"MAC_ADDRESS", entity_category_t::contact},

    {"NAME", entity_category_t::personal},
    {"ADDRESS", entity_category_t::personal},
    {"DATE_OF_BIRTH", entity_category_t::personal},
    {"DRIVER_LICENSE", entity_category_t::personal},
    {"PASSPORT", entity_category_t::personal},

    {"VIN", entity_category_t::vehicle},
    {"LICENSE_PLATE", entity_category_t::vehicle},

    {"MEDICAL_RECORD", entity_category_t::healthcare},
    {"MEDICARE", entity_category_t::healthcare},
    {"DEA_NUMBER", entity_category_t::healthcare},
    {"NPI", entity_category_t::healthcare},

    {"UK_NINO", entity_category_t::government_id},
    {"CANADA_SIN", entity_category_t::government_id},
    {"FRANCE_INSEE", entity_category_t::government_id},
    {"GERMANY_STEUER", entity_category_t::government_id},
    {"INDIA_AADHAAR", entity_category_t::government_id},
    {"INDIA_PAN", entity_category_t::government_id},

    {"EMPLOYEE_ID", entity_category_t::corporate},
    {"TAX_ID", entity_category_t::corporate},
}};

/**
 * @return The labels of every supported entity type in catalog order.
 */
std::vector<std::string> list_entity_types();

std::optional<entity_category_t> category_for(const std::string& label);

/**
 * A single piece of PII found in a text.  The offsets are byte offsets into
 * the UTF-8 source and the range [pe_start, pe_end) covers exactly pe_text.
 */
struct pii_entity {
    std::string pe_text;
    std::string pe_label;
    size_t pe_start{0};
    size_t pe_end{0};
    double pe_confidence{0.0};
    std::string pe_context;
    std::string pe_language{"en"};

    bool overlaps(size_t start, size_t end) const
    {
        return !(end <= this->pe_start || start >= this->pe_end);
    }

    bool overlaps(const pii_entity& other) const
    {
        return this->overlaps(other.pe_start, other.pe_end);
    }

    /**
     * The confidence rounded to four decimal places, as it is shown to
     * users.
     */
    double display_confidence() const;

    /**
     * Generate the short form: type, text, start, end and confidence.
     */
    void gen_display(yajl_gen gen) const;

    /**
     * Generate every field, in a form that from_tree() can read back.
     */
    void gen_full(yajl_gen gen) const;

    std::string to_display_json() const;

    std::string to_json() const;

    static Result<pii_entity, std::string> from_tree(yajl_val node);

    static Result<pii_entity, std::string> from_json(const std::string& json);
};

}  // namespace piiguard

#endif
