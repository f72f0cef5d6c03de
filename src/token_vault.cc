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
 * @file token_vault.cc
 */

#include "token_vault.hh"

#include "base/piiguard_log.hh"
#include "base/string_util.hh"
#include "byte_array.hh"
#include "fmt/format.h"
#include "hasher.hh"
#include "yajlpp/yajlpp.hh"

namespace piiguard {

static std::string
generate_key()
{
    return byte_array<16>::random().to_base64();
}

static std::string
random_token_suffix()
{
    return byte_array<6>::random().to_string();
}

token_vault::token_vault(std::optional<std::string> encryption_key)
    : tv_encryption_key(encryption_key ? std::move(encryption_key.value())
                                       : generate_key()),
      tv_token_source(random_token_suffix)
{
}

std::string
token_vault::tokenize(const std::string& value, const std::string& field_type)
{
    auto& forward = this->tv_vault[field_type];
    auto& reverse = this->tv_reverse[field_type];
    auto value_hash = sha256_hex(value).substr(0, 16);
    auto iter = forward.find(value_hash);

    if (iter != forward.end()) {
        return iter->second;
    }

    auto prefix = fmt::format(FMT_STRING("TOK_{}_"), toupper(field_type));
    std::string token;

    do {
        token = prefix + this->tv_token_source();
    } while (reverse.find(token) != reverse.end());

    forward.emplace(value_hash, token);
    reverse.emplace(token, value);

    return token;
}

std::optional<std::string>
token_vault::detokenize(const std::string& token,
                        const std::string& field_type) const
{
    auto type_iter = this->tv_reverse.find(field_type);

    if (type_iter == this->tv_reverse.end()) {
        return std::nullopt;
    }

    auto token_iter = type_iter->second.find(token);
    if (token_iter == type_iter->second.end()) {
        return std::nullopt;
    }

    return token_iter->second;
}

template<typename M>
static vault_snapshot::token_map
copy_maps(const M& src)
{
    vault_snapshot::token_map retval;

    for (const auto& type_pair : src) {
        auto& dst = retval[type_pair.first];

        for (const auto& entry : type_pair.second) {
            dst.emplace(entry.first, entry.second);
        }
    }

    return retval;
}

vault_snapshot
token_vault::export_vault() const
{
    vault_snapshot retval;

    retval.vs_vault = copy_maps(this->tv_vault);
    retval.vs_reverse = copy_maps(this->tv_reverse);

    return retval;
}

void
token_vault::import_vault(const vault_snapshot& snap)
{
    this->tv_vault.clear();
    this->tv_reverse.clear();

    for (const auto& type_pair : snap.vs_vault) {
        auto& dst = this->tv_vault[type_pair.first];

        for (const auto& entry : type_pair.second) {
            dst.emplace(entry.first, entry.second);
        }
    }
    for (const auto& type_pair : snap.vs_reverse) {
        auto& dst = this->tv_reverse[type_pair.first];

        for (const auto& entry : type_pair.second) {
            dst.emplace(entry.first, entry.second);
        }
    }

    log_info("imported token vault with %zu tokens", this->size());
}

size_t
token_vault::size() const
{
    size_t retval = 0;

    for (const auto& type_pair : this->tv_reverse) {
        retval += type_pair.second.size();
    }

    return retval;
}

static void
gen_token_map(yajl_gen gen, const vault_snapshot::token_map& tmap)
{
    yajlpp_map root(gen);

    for (const auto& type_pair : tmap) {
        root.gen(type_pair.first);
        {
            yajlpp_map type_map(gen);

            for (const auto& entry : type_pair.second) {
                type_map.gen(entry.first);
                type_map.gen(entry.second);
            }
        }
    }
}

std::string
token_vault::to_json() const
{
    auto snap = this->export_vault();
    yajlpp_gen gen;

    {
        yajlpp_map root(gen);

        root.gen("vault");
        gen_token_map(gen, snap.vs_vault);
        root.gen("reverse");
        gen_token_map(gen, snap.vs_reverse);
    }

    return gen.to_string_fragment().to_string();
}

static Result<vault_snapshot::token_map, std::string>
read_token_map(yajl_val node, const char* name)
{
    vault_snapshot::token_map retval;

    if (node == nullptr) {
        return Ok(retval);
    }
    if (!YAJL_IS_OBJECT(node)) {
        return Err(fmt::format(FMT_STRING("/{}: expecting an object, found {}"),
                               name,
                               yajlpp::type_name(node)));
    }

    auto* types = YAJL_GET_OBJECT(node);
    for (size_t lpc = 0; lpc < types->len; lpc++) {
        const auto* field_type = types->keys[lpc];
        auto* entries_node = types->values[lpc];

        if (!YAJL_IS_OBJECT(entries_node)) {
            return Err(
                fmt::format(FMT_STRING("/{}/{}: expecting an object, found {}"),
                            name,
                            field_type,
                            yajlpp::type_name(entries_node)));
        }

        auto& dst = retval[field_type];
        auto* entries = YAJL_GET_OBJECT(entries_node);
        for (size_t index = 0; index < entries->len; index++) {
            auto* val = entries->values[index];

            if (!YAJL_IS_STRING(val)) {
                return Err(fmt::format(
                    FMT_STRING("/{}/{}/{}: expecting a string, found {}"),
                    name,
                    field_type,
                    entries->keys[index],
                    yajlpp::type_name(val)));
            }
            dst[entries->keys[index]] = YAJL_GET_STRING(val);
        }
    }

    return Ok(retval);
}

Result<vault_snapshot, std::string>
token_vault::from_json(const std::string& json)
{
    auto parse_res = yajlpp::parse_tree(json);

    if (parse_res.isErr()) {
        return Err(parse_res.unwrapErr());
    }

    auto tree = parse_res.unwrap();
    if (!YAJL_IS_OBJECT(tree.get())) {
        return Err(fmt::format(FMT_STRING("expecting a vault object, found {}"),
                               yajlpp::type_name(tree.get())));
    }

    vault_snapshot retval;

    auto vault_res
        = read_token_map(yajlpp::get_key(tree.get(), "vault"), "vault");
    if (vault_res.isErr()) {
        return Err(vault_res.unwrapErr());
    }
    retval.vs_vault = vault_res.unwrap();

    auto reverse_res
        = read_token_map(yajlpp::get_key(tree.get(), "reverse"), "reverse");
    if (reverse_res.isErr()) {
        return Err(reverse_res.unwrapErr());
    }
    retval.vs_reverse = reverse_res.unwrap();

    return Ok(retval);
}

}  // namespace piiguard
