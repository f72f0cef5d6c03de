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
 * @file pii_entity.cc
 */

#include <cmath>

#include "pii_entity.hh"

#include "fmt/format.h"
#include "yajlpp/yajlpp.hh"

namespace piiguard {

const char*
category_name(entity_category_t cat)
{
    switch (cat) {
        case entity_category_t::financial:
            return "financial";
        case entity_category_t::contact:
            return "contact";
        case entity_category_t::personal:
            return "personal";
        case entity_category_t::vehicle:
            return "vehicle";
        case entity_category_t::healthcare:
            return "healthcare";
        case entity_category_t::government_id:
            return "government_id";
        case entity_category_t::corporate:
            return "corporate";
    }

    return "unknown";
}

std::vector<std::string>
list_entity_types()
{
    std::vector<std::string> retval;

    retval.reserve(ENTITY_TYPES.size());
    for (const auto& eti : ENTITY_TYPES) {
        retval.emplace_back(eti.eti_label);
    }

    return retval;
}

std::optional<entity_category_t>
category_for(const std::string& label)
{
    for (const auto& eti : ENTITY_TYPES) {
        if (label == eti.eti_label) {
            return eti.eti_category;
        }
    }

    return std::nullopt;
}

double
pii_entity::display_confidence() const
{
    return std::round(this->pe_confidence * 10000.0) / 10000.0;
}

void
pii_entity::gen_display(yajl_gen gen) const
{
    yajlpp_map root(gen);

    root.gen("type");
    root.gen(this->pe_label);
    root.gen("text");
    root.gen(this->pe_text);
    root.gen("start");
    root.gen(this->pe_start);
    root.gen("end");
    root.gen(this->pe_end);
    root.gen("confidence");
    root.gen(this->display_confidence());
}

void
pii_entity::gen_full(yajl_gen gen) const
{
    yajlpp_map root(gen);

    root.gen("text");
    root.gen(this->pe_text);
    root.gen("label");
    root.gen(this->pe_label);
    root.gen("start");
    root.gen(this->pe_start);
    root.gen("end");
    root.gen(this->pe_end);
    root.gen("confidence");
    root.gen(this->pe_confidence);
    root.gen("context");
    root.gen(this->pe_context);
    root.gen("language");
    root.gen(this->pe_language);
}

std::string
pii_entity::to_display_json() const
{
    yajlpp_gen gen;

    this->gen_display(gen);

    return gen.to_string_fragment().to_string();
}

std::string
pii_entity::to_json() const
{
    yajlpp_gen gen;

    this->gen_full(gen);

    return gen.to_string_fragment().to_string();
}

static Result<std::string, std::string>
string_member(yajl_val node, const char* key, std::optional<std::string> def)
{
    auto* val = yajlpp::get_key(node, key);

    if (val == nullptr && def) {
        return Ok(def.value());
    }
    if (val == nullptr || !YAJL_IS_STRING(val)) {
        return Err(fmt::format(FMT_STRING("/{}: expecting a string, found {}"),
                               key,
                               yajlpp::type_name(val)));
    }

    return Ok(std::string(YAJL_GET_STRING(val)));
}

static Result<size_t, std::string>
offset_member(yajl_val node, const char* key)
{
    auto* val = yajlpp::get_key(node, key);

    if (val == nullptr || !YAJL_IS_INTEGER(val)) {
        return Err(
            fmt::format(FMT_STRING("/{}: expecting an integer, found {}"),
                        key,
                        yajlpp::type_name(val)));
    }
    if (YAJL_GET_INTEGER(val) < 0) {
        return Err(
            fmt::format(FMT_STRING("/{}: offset cannot be negative -- {}"),
                        key,
                        YAJL_GET_INTEGER(val)));
    }

    return Ok((size_t) YAJL_GET_INTEGER(val));
}

Result<pii_entity, std::string>
pii_entity::from_tree(yajl_val node)
{
    if (node == nullptr || !YAJL_IS_OBJECT(node)) {
        return Err(
            fmt::format(FMT_STRING("expecting an entity object, found {}"),
                        yajlpp::type_name(node)));
    }

    pii_entity retval;

    auto text_res = string_member(node, "text", std::nullopt);
    if (text_res.isErr()) {
        return Err(text_res.unwrapErr());
    }
    retval.pe_text = text_res.unwrap();

    auto label_res = string_member(node, "label", std::nullopt);
    if (label_res.isErr()) {
        return Err(label_res.unwrapErr());
    }
    retval.pe_label = label_res.unwrap();

    auto start_res = offset_member(node, "start");
    if (start_res.isErr()) {
        return Err(start_res.unwrapErr());
    }
    retval.pe_start = start_res.unwrap();

    auto end_res = offset_member(node, "end");
    if (end_res.isErr()) {
        return Err(end_res.unwrapErr());
    }
    retval.pe_end = end_res.unwrap();
    if (retval.pe_end < retval.pe_start) {
        return Err(fmt::format(FMT_STRING("/end: {} is before start {}"),
                               retval.pe_end,
                               retval.pe_start));
    }

    auto* conf_val = yajlpp::get_key(node, "confidence");
    if (conf_val == nullptr || !YAJL_IS_NUMBER(conf_val)) {
        return Err(
            fmt::format(FMT_STRING("/confidence: expecting a number, found {}"),
                        yajlpp::type_name(conf_val)));
    }
    retval.pe_confidence = YAJL_IS_DOUBLE(conf_val)
        ? YAJL_GET_DOUBLE(conf_val)
        : (double) YAJL_GET_INTEGER(conf_val);

    auto context_res = string_member(node, "context", std::string());
    if (context_res.isErr()) {
        return Err(context_res.unwrapErr());
    }
    retval.pe_context = context_res.unwrap();

    auto lang_res = string_member(node, "language", std::string("en"));
    if (lang_res.isErr()) {
        return Err(lang_res.unwrapErr());
    }
    retval.pe_language = lang_res.unwrap();

    return Ok(retval);
}

Result<pii_entity, std::string>
pii_entity::from_json(const std::string& json)
{
    auto parse_res = yajlpp::parse_tree(json);

    if (parse_res.isErr()) {
        return Err(parse_res.unwrapErr());
    }

    auto tree = parse_res.unwrap();

    return from_tree(tree.get());
}

}  // namespace piiguard
