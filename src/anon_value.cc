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
 * @file anon_value.cc
 */

#include <cmath>

#include "anon_value.hh"

#include "fmt/format.h"
#include "yajlpp/yajlpp.hh"

namespace piiguard {

std::string
double_to_string(double value)
{
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    auto retval = fmt::format(FMT_STRING("{}"), value);

    if (retval.find_first_of(".e") == std::string::npos) {
        retval.append(".0");
    }

    return retval;
}

std::string
to_string(const anon_value& val)
{
    return val.match(
        [](const null_value_t&) { return std::string("None"); },
        [](bool bval) { return std::string(bval ? "True" : "False"); },
        [](int64_t ival) { return std::to_string(ival); },
        [](double dval) { return double_to_string(dval); },
        [](const std::string& sval) { return sval; });
}

void
gen_value(yajl_gen gen, const anon_value& val)
{
    yajlpp_generator gval(gen);

    val.match([&gval](const null_value_t&) { gval(); },
              [&gval](bool bval) { gval(bval); },
              [&gval](int64_t ival) { gval(ival); },
              [&gval](double dval) { gval(dval); },
              [&gval](const std::string& sval) { gval(sval); });
}

void
gen_record(yajl_gen gen, const record_t& rec)
{
    yajlpp_map root(gen);

    for (const auto& field_pair : rec) {
        root.gen(field_pair.first);
        gen_value(gen, field_pair.second);
    }
}

std::string
record_to_json(const record_t& rec)
{
    yajlpp_gen gen;

    gen_record(gen, rec);

    return gen.to_string_fragment().to_string();
}

Result<anon_value, std::string>
value_from_tree(yajl_val node)
{
    if (node == nullptr || YAJL_IS_NULL(node)) {
        return Ok(anon_value{null_value_t{}});
    }
    if (YAJL_IS_TRUE(node)) {
        return Ok(anon_value{true});
    }
    if (YAJL_IS_FALSE(node)) {
        return Ok(anon_value{false});
    }
    if (YAJL_IS_INTEGER(node)) {
        return Ok(anon_value{(int64_t) YAJL_GET_INTEGER(node)});
    }
    if (YAJL_IS_DOUBLE(node)) {
        return Ok(anon_value{YAJL_GET_DOUBLE(node)});
    }
    if (YAJL_IS_STRING(node)) {
        return Ok(anon_value{std::string(YAJL_GET_STRING(node))});
    }

    return Err(fmt::format(FMT_STRING("expecting a scalar value, found {}"),
                           yajlpp::type_name(node)));
}

static Result<record_t, std::string>
record_from_tree(yajl_val node, const std::string& path)
{
    if (!YAJL_IS_OBJECT(node)) {
        return Err(fmt::format(FMT_STRING("{}: expecting an object, found {}"),
                               path.empty() ? "/" : path,
                               yajlpp::type_name(node)));
    }

    record_t retval;
    auto* obj = YAJL_GET_OBJECT(node);

    for (size_t lpc = 0; lpc < obj->len; lpc++) {
        auto val_res = value_from_tree(obj->values[lpc]);

        if (val_res.isErr()) {
            return Err(fmt::format(FMT_STRING("{}/{}: {}"),
                                   path,
                                   obj->keys[lpc],
                                   val_res.unwrapErr()));
        }
        retval[obj->keys[lpc]] = val_res.unwrap();
    }

    return Ok(retval);
}

Result<record_t, std::string>
record_from_json(const std::string& json)
{
    auto parse_res = yajlpp::parse_tree(json);

    if (parse_res.isErr()) {
        return Err(parse_res.unwrapErr());
    }

    auto tree = parse_res.unwrap();

    return record_from_tree(tree.get(), "");
}

Result<std::vector<record_t>, std::string>
records_from_json(const std::string& json)
{
    auto parse_res = yajlpp::parse_tree(json);

    if (parse_res.isErr()) {
        return Err(parse_res.unwrapErr());
    }

    auto tree = parse_res.unwrap();
    if (!YAJL_IS_ARRAY(tree.get())) {
        return Err(fmt::format(FMT_STRING("/: expecting an array, found {}"),
                               yajlpp::type_name(tree.get())));
    }

    std::vector<record_t> retval;
    auto* arr = YAJL_GET_ARRAY(tree.get());

    for (size_t lpc = 0; lpc < arr->len; lpc++) {
        auto rec_res = record_from_tree(arr->values[lpc],
                                        fmt::format(FMT_STRING("/{}"), lpc));

        if (rec_res.isErr()) {
            return Err(rec_res.unwrapErr());
        }
        retval.emplace_back(rec_res.unwrap());
    }

    return Ok(retval);
}

}  // namespace piiguard
