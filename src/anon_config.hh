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
 * @file anon_config.hh
 */

#ifndef piiguard_anon_config_hh
#define piiguard_anon_config_hh

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include "mapbox/variant.hpp"
#include "result.h"
#include "yajl/yajl_gen.h"

namespace piiguard {

enum class anon_method_t {
    redact,
    mask,
    hash,
    tokenize,
    fake,
    generalize,
    shuffle,
    null,
    preserve,
};

enum class field_type_t {
    email,
    phone,
    name,
    ssn,
    date,
    numeric,
    text,
    address,
    credit_card,
};

const char* to_string(anon_method_t method);

std::optional<anon_method_t> method_from_string(const std::string& name);

const char* to_string(field_type_t type);

/**
 * @return The field type with the given name, or text for any name that is
 *   not recognized.
 */
field_type_t field_type_from_string(const std::string& name);

struct numeric_range {
    double nr_low;
    double nr_high;
    /** True if the bounds were given as integers. */
    bool nr_integral{true};

    bool contains(double value) const
    {
        return this->nr_low <= value && value <= this->nr_high;
    }

    std::string to_label() const;
};

using param_value = mapbox::util::
    variant<int64_t, double, bool, std::string, std::vector<numeric_range>>;

struct field_config {
    std::string fc_field_name;
    std::string fc_field_type;
    anon_method_t fc_method{anon_method_t::redact};
    std::map<std::string, param_value> fc_params;

    field_config() = default;

    field_config(std::string name,
                 std::string type,
                 anon_method_t method,
                 std::map<std::string, param_value> params = {})
        : fc_field_name(std::move(name)), fc_field_type(std::move(type)),
          fc_method(method), fc_params(std::move(params))
    {
    }

    field_type_t get_type() const
    {
        return field_type_from_string(this->fc_field_type);
    }

    bool has_param(const std::string& key) const
    {
        return this->fc_params.count(key) > 0;
    }

    int64_t get_int(const std::string& key, int64_t def) const;

    double get_number(const std::string& key, double def) const;

    std::string get_string(const std::string& key,
                           const std::string& def) const;

    std::vector<numeric_range> get_ranges(
        const std::string& key, const std::vector<numeric_range>& def) const;
};

struct table_config {
    std::string tc_table_name;
    std::vector<field_config> tc_fields;
    std::string tc_primary_key{"id"};
    /** Field name to "table.column".  Informational only. */
    std::map<std::string, std::string> tc_foreign_keys;
};

struct anonymization_config {
    std::string ac_config_id;
    std::string ac_name;
    std::vector<table_config> ac_tables;
    std::optional<int64_t> ac_seed;
    bool ac_preserve_nulls{true};
    bool ac_preserve_format{true};
    bool ac_use_token_vault{false};
    std::optional<std::string> ac_vault_encryption_key;
    std::string ac_output_format{"json"};
    std::chrono::system_clock::time_point ac_created_at{
        std::chrono::system_clock::now()};

    void gen(yajl_gen gen) const;

    std::string to_json() const;

    /**
     * Parse a configuration document.  Errors name the JSON path of the
     * offending value.
     */
    static Result<anonymization_config, std::string> from_json(
        const std::string& json);
};

Result<anonymization_config, std::string> load_config_file(
    const std::filesystem::path& path);

namespace templates {

table_config user_table();

table_config orders_table();

anonymization_config gdpr_export_config();

anonymization_config staging_copy_config();

}  // namespace templates

}  // namespace piiguard

#endif
