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
 * @file token_vault.hh
 */

#ifndef piiguard_token_vault_hh
#define piiguard_token_vault_hh

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "result.h"
#include "robin_hood.h"

namespace piiguard {

/**
 * A deep copy of a vault's contents, keyed by field type.
 */
struct vault_snapshot {
    using token_map = std::map<std::string, std::map<std::string, std::string>>;

    /** field type -> (value digest -> token) */
    token_map vs_vault;
    /** field type -> (token -> original value) */
    token_map vs_reverse;
};

/**
 * Reversible tokenization.  Tokenizing the same value for the same field
 * type always returns the same token and detokenize() maps the token back
 * to the original value.
 */
class token_vault {
public:
    /**
     * Produces the random part of a new token.
     */
    using token_source_t = std::function<std::string()>;

    explicit token_vault(std::optional<std::string> encryption_key
                         = std::nullopt);

    const std::string& get_encryption_key() const
    {
        return this->tv_encryption_key;
    }

    void set_token_source(token_source_t source)
    {
        this->tv_token_source = std::move(source);
    }

    /**
     * @return The token for the value.  A new token is never one that is
     *   already held for the field type.
     */
    std::string tokenize(const std::string& value,
                         const std::string& field_type);

    std::optional<std::string> detokenize(const std::string& token,
                                          const std::string& field_type) const;

    vault_snapshot export_vault() const;

    /**
     * Replace the contents of this vault with a copy of the snapshot.
     */
    void import_vault(const vault_snapshot& snap);

    /**
     * @return The number of tokens held across all field types.
     */
    size_t size() const;

    std::string to_json() const;

    static Result<vault_snapshot, std::string> from_json(
        const std::string& json);

private:
    using string_map = robin_hood::unordered_map<std::string, std::string>;

    std::string tv_encryption_key;
    token_source_t tv_token_source;
    robin_hood::unordered_map<std::string, string_map> tv_vault;
    robin_hood::unordered_map<std::string, string_map> tv_reverse;
};

}  // namespace piiguard

#endif
