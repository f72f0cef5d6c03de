/**
 * Copyright (c) 2015, Timothy Stack
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
 * @file yajlpp.cc
 */

#include <cmath>

#include "yajlpp.hh"

#include "fmt/format.h"

yajl_gen_status
yajl_gen_shortest_double(yajl_gen hand, double value)
{
    if (!std::isfinite(value)) {
        return yajl_gen_null(hand);
    }

    auto num_str = fmt::format(FMT_STRING("{}"), value);

    return yajl_gen_number(hand, num_str.c_str(), num_str.size());
}

string_fragment
yajlpp_gen::to_string_fragment()
{
    const unsigned char* buf;
    size_t len;

    yajl_gen_get_buf(this->yg_handle.in(), &buf, &len);

    return string_fragment::from_bytes(buf, len);
}

namespace yajlpp {

Result<tree_ptr, std::string>
parse_tree(const std::string& content)
{
    char error_buffer[1024];
    auto* tree
        = yajl_tree_parse(content.c_str(), error_buffer, sizeof(error_buffer));
    if (tree == nullptr) {
        return Err(
            fmt::format(FMT_STRING("JSON parsing failed -- {}"), error_buffer));
    }

    return Ok(tree_ptr(tree, yajl_tree_free));
}

yajl_val
get_key(yajl_val node, const char* key)
{
    const char* path[] = {key, nullptr};

    if (node == nullptr || !YAJL_IS_OBJECT(node)) {
        return nullptr;
    }

    return yajl_tree_get(node, path, yajl_t_any);
}

const char*
type_name(yajl_val node)
{
    if (node == nullptr) {
        return "missing";
    }

    switch (node->type) {
        case yajl_t_string:
            return "string";
        case yajl_t_number:
            return "number";
        case yajl_t_object:
            return "object";
        case yajl_t_array:
            return "array";
        case yajl_t_true:
        case yajl_t_false:
            return "boolean";
        case yajl_t_null:
            return "null";
        default:
            return "unknown";
    }
}

}  // namespace yajlpp
