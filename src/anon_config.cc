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
 * @file anon_config.cc
 */

#include <iterator>
#include <sstream>

#include "anon_config.hh"

#include "anon_value.hh"
#include "base/fs_util.hh"
#include "base/piiguard_log.hh"
#include "byte_array.hh"
#include "date/date.h"
#include "fmt/format.h"
#include "yajlpp/yajlpp.hh"

namespace piiguard {

static constexpr const char* METHOD_NAMES[] = {
    "redact",
    "mask",
    "hash",
    "tokenize",
    "fake",
    "generalize",
    "shuffle",
    "null",
    "preserve",
};

static constexpr const char* FIELD_TYPE_NAMES[] = {
    "email",
    "phone",
    "name",
    "ssn",
    "date",
    "numeric",
    "text",
    "address",
    "credit_card",
};

const char*
to_string(anon_method_t method)
{
    return METHOD_NAMES[static_cast<int>(method)];
}

std::optional<anon_method_t>
method_from_string(const std::string& name)
{
    for (size_t lpc = 0; lpc < std::size(METHOD_NAMES); lpc++) {
        if (name == METHOD_NAMES[lpc]) {
            return static_cast<anon_method_t>(lpc);
        }
    }

    return std::nullopt;
}

const char*
to_string(field_type_t type)
{
    return FIELD_TYPE_NAMES[static_cast<int>(type)];
}

field_type_t
field_type_from_string(const std::string& name)
{
    for (size_t lpc = 0; lpc < std::size(FIELD_TYPE_NAMES); lpc++) {
        if (name == FIELD_TYPE_NAMES[lpc]) {
            return static_cast<field_type_t>(lpc);
        }
    }

    return field_type_t::text;
}

static std::string
bound_to_string(double value, bool integral)
{
    if (integral) {
        return fmt::format(FMT_STRING("{}"), static_cast<int64_t>(value));
    }

    return double_to_string(value);
}

std::string
numeric_range::to_label() const
{
    return fmt::format(FMT_STRING("{}-{}"),
                       bound_to_string(this->nr_low, this->nr_integral),
                       bound_to_string(this->nr_high, this->nr_integral));
}

int64_t
field_config::get_int(const std::string& key, int64_t def) const
{
    auto iter = this->fc_params.find(key);

    if (iter == this->fc_params.end()) {
        return def;
    }
    if (iter->second.is<int64_t>()) {
        return iter->second.get<int64_t>();
    }
    if (iter->second.is<double>()) {
        return static_cast<int64_t>(iter->second.get<double>());
    }

    return def;
}

double
field_config::get_number(const std::string& key, double def) const
{
    auto iter = this->fc_params.find(key);

    if (iter == this->fc_params.end()) {
        return def;
    }
    if (iter->second.is<double>()) {
        return iter->second.get<double>();
    }
    if (iter->second.is<int64_t>()) {
        return static_cast<double>(iter->second.get<int64_t>());
    }

    return def;
}

std::string
field_config::get_string(const std::string& key, const std::string& def) const
{
    auto iter = this->fc_params.find(key);

    if (iter == this->fc_params.end() || !iter->second.is<std::string>()) {
        return def;
    }

    return iter->second.get<std::string>();
}

std::vector<numeric_range>
field_config::get_ranges(const std::string& key,
                         const std::vector<numeric_range>& def) const
{
    auto iter = this->fc_params.find(key);

    if (iter == this->fc_params.end()
        || !iter->second.is<std::vector<numeric_range>>())
    {
        return def;
    }

    return iter->second.get<std::vector<numeric_range>>();
}

static void
gen_param(yajl_gen gen, const param_value& pval)
{
    yajlpp_generator gval(gen);

    pval.match([&gval](int64_t ival) { gval(ival); },
               [&gval](double dval) { gval(dval); },
               [&gval](bool bval) { gval(bval); },
               [&gval](const std::string& sval) { gval(sval); },
               [gen](const std::vector<numeric_range>& ranges) {
                   yajlpp_array range_list(gen);

                   for (const auto& nr : ranges) {
                       yajlpp_array pair(gen);

                       if (nr.nr_integral) {
                           pair.gen(static_cast<int64_t>(nr.nr_low));
                           pair.gen(static_cast<int64_t>(nr.nr_high));
                       } else {
                           pair.gen(nr.nr_low);
                           pair.gen(nr.nr_high);
                       }
                   }
               });
}

static std::string
format_timestamp(std::chrono::system_clock::time_point tp)
{
    return date::format("%FT%TZ",
                        std::chrono::time_point_cast<std::chrono::seconds>(tp));
}

void
anonymization_config::gen(yajl_gen gen) const
{
    yajlpp_map root(gen);

    root.gen("config_id");
    root.gen(this->ac_config_id);
    root.gen("name");
    root.gen(this->ac_name);
    root.gen("seed");
    root.gen(this->ac_seed);
    root.gen("preserve_nulls");
    root.gen(this->ac_preserve_nulls);
    root.gen("preserve_format");
    root.gen(this->ac_preserve_format);
    root.gen("use_token_vault");
    root.gen(this->ac_use_token_vault);
    root.gen("vault_encryption_key");
    root.gen(this->ac_vault_encryption_key);
    root.gen("output_format");
    root.gen(this->ac_output_format);
    root.gen("created_at");
    root.gen(format_timestamp(this->ac_created_at));
    root.gen("tables");
    {
        yajlpp_array tables(gen);

        for (const auto& tc : this->ac_tables) {
            yajlpp_map table(gen);

            table.gen("table_name");
            table.gen(tc.tc_table_name);
            table.gen("primary_key");
            table.gen(tc.tc_primary_key);
            table.gen("foreign_keys");
            {
                yajlpp_map fkeys(gen);

                for (const auto& fk_pair : tc.tc_foreign_keys) {
                    fkeys.gen(fk_pair.first);
                    fkeys.gen(fk_pair.second);
                }
            }
            table.gen("fields");
            {
                yajlpp_array fields(gen);

                for (const auto& fc : tc.tc_fields) {
                    yajlpp_map field(gen);

                    field.gen("field_name");
                    field.gen(fc.fc_field_name);
                    field.gen("field_type");
                    field.gen(fc.fc_field_type);
                    field.gen("method");
                    field.gen(to_string(fc.fc_method));
                    field.gen("params");
                    {
                        yajlpp_map params(gen);

                        for (const auto& param_pair : fc.fc_params) {
                            params.gen(param_pair.first);
                            gen_param(gen, param_pair.second);
                        }
                    }
                }
            }
        }
    }
}

std::string
anonymization_config::to_json() const
{
    yajlpp_gen gen;

    this->gen(gen);

    return gen.to_string_fragment().to_string();
}

static std::string
type_error(const std::string& path, const char* expected, yajl_val node)
{
    return fmt::format(FMT_STRING("{}: expecting {}, found {}"),
                       path,
                       expected,
                       yajlpp::type_name(node));
}

static Result<std::optional<std::string>, std::string>
read_string(yajl_val node, const char* key, const std::string& path)
{
    auto* val = yajlpp::get_key(node, key);
    auto key_path = fmt::format(FMT_STRING("{}/{}"), path, key);

    if (val == nullptr || YAJL_IS_NULL(val)) {
        return Ok(std::optional<std::string>());
    }
    if (!YAJL_IS_STRING(val)) {
        return Err(type_error(key_path, "a string", val));
    }

    return Ok(std::make_optional<std::string>(YAJL_GET_STRING(val)));
}

static Result<std::string, std::string>
require_string(yajl_val node, const char* key, const std::string& path)
{
    auto str_res = read_string(node, key, path);

    if (str_res.isErr()) {
        return Err(str_res.unwrapErr());
    }

    auto str = str_res.unwrap();
    if (!str) {
        return Err(fmt::format(
            FMT_STRING("{}/{}: missing required property"), path, key));
    }

    return Ok(str.value());
}

static Result<std::optional<bool>, std::string>
read_bool(yajl_val node, const char* key, const std::string& path)
{
    auto* val = yajlpp::get_key(node, key);

    if (val == nullptr || YAJL_IS_NULL(val)) {
        return Ok(std::optional<bool>());
    }
    if (!YAJL_IS_TRUE(val) && !YAJL_IS_FALSE(val)) {
        return Err(type_error(
            fmt::format(FMT_STRING("{}/{}"), path, key), "a boolean", val));
    }

    return Ok(std::make_optional(YAJL_IS_TRUE(val)));
}

static Result<numeric_range, std::string>
read_range(yajl_val node, const std::string& path)
{
    if (!YAJL_IS_ARRAY(node) || YAJL_GET_ARRAY(node)->len != 2) {
        return Err(type_error(path, "a [low, high] pair", node));
    }

    numeric_range retval{0.0, 0.0, true};
    auto* arr = YAJL_GET_ARRAY(node);
    double* bounds[] = {&retval.nr_low, &retval.nr_high};

    for (size_t lpc = 0; lpc < 2; lpc++) {
        auto* bound = arr->values[lpc];

        if (YAJL_IS_INTEGER(bound)) {
            *bounds[lpc] = static_cast<double>(YAJL_GET_INTEGER(bound));
        } else if (YAJL_IS_DOUBLE(bound)) {
            *bounds[lpc] = YAJL_GET_DOUBLE(bound);
            retval.nr_integral = false;
        } else {
            return Err(type_error(fmt::format(FMT_STRING("{}/{}"), path, lpc),
                                  "a number",
                                  bound));
        }
    }

    return Ok(retval);
}

static Result<param_value, std::string>
read_param(yajl_val node, const std::string& path)
{
    if (YAJL_IS_INTEGER(node)) {
        return Ok(param_value{static_cast<int64_t>(YAJL_GET_INTEGER(node))});
    }
    if (YAJL_IS_DOUBLE(node)) {
        return Ok(param_value{YAJL_GET_DOUBLE(node)});
    }
    if (YAJL_IS_TRUE(node) || YAJL_IS_FALSE(node)) {
        return Ok(param_value{static_cast<bool>(YAJL_IS_TRUE(node))});
    }
    if (YAJL_IS_STRING(node)) {
        return Ok(param_value{std::string(YAJL_GET_STRING(node))});
    }
    if (YAJL_IS_ARRAY(node)) {
        std::vector<numeric_range> ranges;
        auto* arr = YAJL_GET_ARRAY(node);

        for (size_t lpc = 0; lpc < arr->len; lpc++) {
            auto range_res = read_range(
                arr->values[lpc], fmt::format(FMT_STRING("{}/{}"), path, lpc));

            if (range_res.isErr()) {
                return Err(range_res.unwrapErr());
            }
            ranges.emplace_back(range_res.unwrap());
        }

        return Ok(param_value{ranges});
    }

    return Err(type_error(
        path, "a number, boolean, string or list of ranges", node));
}

static Result<field_config, std::string>
read_field(yajl_val node, const std::string& path)
{
    if (!YAJL_IS_OBJECT(node)) {
        return Err(type_error(path, "an object", node));
    }

    field_config retval;

    auto name_res = require_string(node, "field_name", path);
    if (name_res.isErr()) {
        return Err(name_res.unwrapErr());
    }
    retval.fc_field_name = name_res.unwrap();

    auto type_res = require_string(node, "field_type", path);
    if (type_res.isErr()) {
        return Err(type_res.unwrapErr());
    }
    retval.fc_field_type = type_res.unwrap();

    auto method_res = require_string(node, "method", path);
    if (method_res.isErr()) {
        return Err(method_res.unwrapErr());
    }
    auto method_name = method_res.unwrap();
    auto method = method_from_string(method_name);
    if (!method) {
        return Err(fmt::format(
            FMT_STRING("{}/method: unknown anonymization method -- {}"),
            path,
            method_name));
    }
    retval.fc_method = method.value();

    auto* params = yajlpp::get_key(node, "params");
    if (params != nullptr && !YAJL_IS_NULL(params)) {
        auto params_path = fmt::format(FMT_STRING("{}/params"), path);

        if (!YAJL_IS_OBJECT(params)) {
            return Err(type_error(params_path, "an object", params));
        }

        auto* obj = YAJL_GET_OBJECT(params);
        for (size_t lpc = 0; lpc < obj->len; lpc++) {
            auto param_res = read_param(
                obj->values[lpc],
                fmt::format(FMT_STRING("{}/{}"), params_path, obj->keys[lpc]));

            if (param_res.isErr()) {
                return Err(param_res.unwrapErr());
            }
            retval.fc_params.emplace(obj->keys[lpc], param_res.unwrap());
        }
    }

    return Ok(retval);
}

static Result<table_config, std::string>
read_table(yajl_val node, const std::string& path)
{
    if (!YAJL_IS_OBJECT(node)) {
        return Err(type_error(path, "an object", node));
    }

    table_config retval;

    auto name_res = require_string(node, "table_name", path);
    if (name_res.isErr()) {
        return Err(name_res.unwrapErr());
    }
    retval.tc_table_name = name_res.unwrap();

    auto pk_res = read_string(node, "primary_key", path);
    if (pk_res.isErr()) {
        return Err(pk_res.unwrapErr());
    }
    retval.tc_primary_key = pk_res.unwrap().value_or("id");

    auto* fkeys = yajlpp::get_key(node, "foreign_keys");
    if (fkeys != nullptr && !YAJL_IS_NULL(fkeys)) {
        auto fkeys_path = fmt::format(FMT_STRING("{}/foreign_keys"), path);

        if (!YAJL_IS_OBJECT(fkeys)) {
            return Err(type_error(fkeys_path, "an object", fkeys));
        }

        auto* obj = YAJL_GET_OBJECT(fkeys);
        for (size_t lpc = 0; lpc < obj->len; lpc++) {
            if (!YAJL_IS_STRING(obj->values[lpc])) {
                return Err(type_error(
                    fmt::format(
                        FMT_STRING("{}/{}"), fkeys_path, obj->keys[lpc]),
                    "a string",
                    obj->values[lpc]));
            }
            retval.tc_foreign_keys[obj->keys[lpc]]
                = YAJL_GET_STRING(obj->values[lpc]);
        }
    }

    auto* fields = yajlpp::get_key(node, "fields");
    auto fields_path = fmt::format(FMT_STRING("{}/fields"), path);
    if (fields == nullptr) {
        return Err(fmt::format(FMT_STRING("{}: missing required property"),
                               fields_path));
    }
    if (!YAJL_IS_ARRAY(fields)) {
        return Err(type_error(fields_path, "an array", fields));
    }

    auto* arr = YAJL_GET_ARRAY(fields);
    for (size_t lpc = 0; lpc < arr->len; lpc++) {
        auto field_res
            = read_field(arr->values[lpc],
                         fmt::format(FMT_STRING("{}/{}"), fields_path, lpc));

        if (field_res.isErr()) {
            return Err(field_res.unwrapErr());
        }
        retval.tc_fields.emplace_back(field_res.unwrap());
    }

    return Ok(retval);
}

static Result<std::chrono::system_clock::time_point, std::string>
parse_timestamp(const std::string& str, const std::string& path)
{
    date::sys_seconds retval;
    std::istringstream in(str);

    in >> date::parse("%FT%TZ", retval);
    if (in.fail()) {
        in.clear();
        in.str(str);

        date::sys_days day;
        in >> date::parse("%F", day);
        if (in.fail()) {
            return Err(fmt::format(
                FMT_STRING("{}: invalid timestamp -- {}"), path, str));
        }
        retval = day;
    }

    return Ok(std::chrono::system_clock::time_point(retval));
}

Result<anonymization_config, std::string>
anonymization_config::from_json(const std::string& json)
{
    auto parse_res = yajlpp::parse_tree(json);

    if (parse_res.isErr()) {
        return Err(parse_res.unwrapErr());
    }

    auto tree = parse_res.unwrap();
    auto* root = tree.get();
    if (!YAJL_IS_OBJECT(root)) {
        return Err(type_error("/", "an object", root));
    }

    anonymization_config retval;

    auto id_res = require_string(root, "config_id", "");
    if (id_res.isErr()) {
        return Err(id_res.unwrapErr());
    }
    retval.ac_config_id = id_res.unwrap();

    auto name_res = require_string(root, "name", "");
    if (name_res.isErr()) {
        return Err(name_res.unwrapErr());
    }
    retval.ac_name = name_res.unwrap();

    auto* seed = yajlpp::get_key(root, "seed");
    if (seed != nullptr && !YAJL_IS_NULL(seed)) {
        if (!YAJL_IS_INTEGER(seed)) {
            return Err(type_error("/seed", "an integer", seed));
        }
        retval.ac_seed = YAJL_GET_INTEGER(seed);
    }

    struct {
        const char* key;
        bool* dest;
    } bool_props[] = {
        {"preserve_nulls", &retval.ac_preserve_nulls},
        {"preserve_format", &retval.ac_preserve_format},
        {"use_token_vault", &retval.ac_use_token_vault},
    };
    for (const auto& prop : bool_props) {
        auto bool_res = read_bool(root, prop.key, "");
        if (bool_res.isErr()) {
            return Err(bool_res.unwrapErr());
        }

        auto bval = bool_res.unwrap();
        if (bval) {
            *prop.dest = bval.value();
        }
    }

    auto key_res = read_string(root, "vault_encryption_key", "");
    if (key_res.isErr()) {
        return Err(key_res.unwrapErr());
    }
    retval.ac_vault_encryption_key = key_res.unwrap();

    auto format_res = read_string(root, "output_format", "");
    if (format_res.isErr()) {
        return Err(format_res.unwrapErr());
    }
    retval.ac_output_format = format_res.unwrap().value_or("json");

    auto created_res = read_string(root, "created_at", "");
    if (created_res.isErr()) {
        return Err(created_res.unwrapErr());
    }
    auto created_at = created_res.unwrap();
    if (created_at) {
        auto ts_res = parse_timestamp(created_at.value(), "/created_at");
        if (ts_res.isErr()) {
            return Err(ts_res.unwrapErr());
        }
        retval.ac_created_at = ts_res.unwrap();
    }

    auto* tables = yajlpp::get_key(root, "tables");
    if (tables != nullptr && !YAJL_IS_NULL(tables)) {
        if (!YAJL_IS_ARRAY(tables)) {
            return Err(type_error("/tables", "an array", tables));
        }

        auto* arr = YAJL_GET_ARRAY(tables);
        for (size_t lpc = 0; lpc < arr->len; lpc++) {
            auto table_res = read_table(
                arr->values[lpc], fmt::format(FMT_STRING("/tables/{}"), lpc));

            if (table_res.isErr()) {
                return Err(table_res.unwrapErr());
            }
            retval.ac_tables.emplace_back(table_res.unwrap());
        }
    }

    return Ok(retval);
}

Result<anonymization_config, std::string>
load_config_file(const std::filesystem::path& path)
{
    auto read_res = filesystem::read_file(path);

    if (read_res.isErr()) {
        return Err(read_res.unwrapErr());
    }

    auto config_res = anonymization_config::from_json(read_res.unwrap());
    if (config_res.isErr()) {
        auto msg = fmt::format(
            FMT_STRING("{}: {}"), path.string(), config_res.unwrapErr());

        log_error("unable to load anonymization config: %s", msg.c_str());
        return Err(msg);
    }

    auto retval = config_res.unwrap();
    log_info("loaded anonymization config %s (%s) with %zu tables from %s",
             retval.ac_config_id.c_str(),
             retval.ac_name.c_str(),
             retval.ac_tables.size(),
             path.c_str());

    return Ok(retval);
}

namespace templates {

static std::string
new_config_id()
{
    auto ba = byte_array<16>::random();

    // version 4, variant 1
    ba.ba_data[6] = (ba.ba_data[6] & 0x0f) | 0x40;
    ba.ba_data[8] = (ba.ba_data[8] & 0x3f) | 0x80;

    return ba.to_uuid_string();
}

table_config
user_table()
{
    table_config retval;

    retval.tc_table_name = "users";
    retval.tc_primary_key = "id";
    retval.tc_fields = {
        {"email", "email", anon_method_t::fake},
        {"phone",
         "phone",
         anon_method_t::mask,
         {{"show_last", param_value{int64_t{4}}}}},
        {"first_name", "name", anon_method_t::fake},
        {"last_name", "name", anon_method_t::fake},
        {"ssn", "ssn", anon_method_t::redact},
        {"date_of_birth",
         "date",
         anon_method_t::generalize,
         {{"precision", param_value{std::string("year")}}}},
        {"address", "address", anon_method_t::fake},
        {"created_at", "date", anon_method_t::preserve},
    };

    return retval;
}

table_config
orders_table()
{
    table_config retval;

    retval.tc_table_name = "orders";
    retval.tc_primary_key = "id";
    retval.tc_fields = {
        {"customer_email", "email", anon_method_t::fake},
        {"shipping_address", "address", anon_method_t::fake},
        {"phone", "phone", anon_method_t::mask},
        {"amount", "numeric", anon_method_t::preserve},
        {"created_at", "date", anon_method_t::preserve},
    };
    retval.tc_foreign_keys = {{"user_id", "users.id"}};

    return retval;
}

anonymization_config
gdpr_export_config()
{
    anonymization_config retval;

    retval.ac_config_id = new_config_id();
    retval.ac_name = "GDPR Export";
    retval.ac_tables = {user_table()};
    retval.ac_preserve_nulls = true;
    retval.ac_use_token_vault = true;

    return retval;
}

anonymization_config
staging_copy_config()
{
    anonymization_config retval;

    retval.ac_config_id = new_config_id();
    retval.ac_name = "Staging Copy";
    retval.ac_tables = {user_table(), orders_table()};
    retval.ac_seed = 42;
    retval.ac_preserve_nulls = true;
    retval.ac_use_token_vault = false;

    return retval;
}

}  // namespace templates

}  // namespace piiguard
