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
 * @file anon_value.hh
 */

#ifndef piiguard_anon_value_hh
#define piiguard_anon_value_hh

#include <map>
#include <string>
#include <vector>

#include <stdint.h>

#include "mapbox/variant.hpp"
#include "result.h"
#include "yajl/yajl_gen.h"
#include "yajl/yajl_tree.h"

namespace piiguard {

struct null_value_t {
    bool operator==(const null_value_t&) const { return true; }
};

/**
 * A single field in a record.  Integers must be constructed as int64_t,
 * otherwise the variant will pick bool.
 */
using anon_value
    = mapbox::util::variant<null_value_t, bool, int64_t, double, std::string>;

using record_t = std::map<std::string, anon_value>;

inline bool
is_null(const anon_value& val)
{
    return val.is<null_value_t>();
}

/**
 * Convert a value to text: "None" for null, "True" or "False" for booleans
 * and reals in their shortest form with at least one fractional digit.
 */
std::string to_string(const anon_value& val);

std::string double_to_string(double value);

void gen_value(yajl_gen gen, const anon_value& val);

void gen_record(yajl_gen gen, const record_t& rec);

std::string record_to_json(const record_t& rec);

Result<anon_value, std::string> value_from_tree(yajl_val node);

/**
 * Read a single flat JSON object as a record.
 */
Result<record_t, std::string> record_from_json(const std::string& json);

Result<std::vector<record_t>, std::string> records_from_json(
    const std::string& json);

}  // namespace piiguard

#endif
