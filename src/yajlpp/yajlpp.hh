/**
 * Copyright (c) 2013-2019, Timothy Stack
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
 * @file yajlpp.hh
 */

#ifndef piiguard_yajlpp_hh
#define piiguard_yajlpp_hh

#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <string.h>

#include "base/auto_mem.hh"
#include "base/string_fragment.hh"
#include "result.h"
#include "yajl/yajl_gen.h"
#include "yajl/yajl_tree.h"

inline yajl_gen_status
yajl_gen_pstring(yajl_gen hand, const char* str, size_t len)
{
    if (len == (size_t) -1) {
        len = strlen(str);
    }
    return yajl_gen_string(hand, (const unsigned char*) str, len);
}

inline yajl_gen_status
yajl_gen_string(yajl_gen hand, const std::string& str)
{
    return yajl_gen_string(
        hand, (const unsigned char*) str.c_str(), str.length());
}

/**
 * Generate a double in its shortest round-trip form.  Values that JSON
 * cannot represent (NaN and the infinities) are written as null.
 */
yajl_gen_status yajl_gen_shortest_double(yajl_gen hand, double value);

class yajlpp_generator {
public:
    yajlpp_generator(yajl_gen handle) : yg_handle(handle) {}

    yajl_gen_status operator()(const std::string& str)
    {
        return yajl_gen_string(this->yg_handle, str);
    }

    yajl_gen_status operator()(const char* str)
    {
        return yajl_gen_string(
            this->yg_handle, (const unsigned char*) str, strlen(str));
    }

    yajl_gen_status operator()(const char* str, size_t len)
    {
        return yajl_gen_string(
            this->yg_handle, (const unsigned char*) str, len);
    }

    yajl_gen_status operator()(const string_fragment& str)
    {
        return yajl_gen_string(
            this->yg_handle, (const unsigned char*) str.data(), str.length());
    }

    yajl_gen_status operator()(bool value)
    {
        return yajl_gen_bool(this->yg_handle, value);
    }

    yajl_gen_status operator()(double value)
    {
        return yajl_gen_shortest_double(this->yg_handle, value);
    }

    template<typename T>
    yajl_gen_status operator()(
        T value,
        typename std::enable_if<std::is_integral<T>::value
                                && !std::is_same<T, bool>::value>::type* dummy
        = 0)
    {
        return yajl_gen_integer(this->yg_handle, value);
    }

    template<typename T>
    yajl_gen_status operator()(std::optional<T> value)
    {
        if (!value.has_value()) {
            return yajl_gen_null(this->yg_handle);
        }

        return (*this)(value.value());
    }

    template<typename T>
    yajl_gen_status operator()(
        const T& container,
        typename std::enable_if<!std::is_integral<T>::value>::type* dummy = 0)
    {
        yajl_gen_array_open(this->yg_handle);
        for (const auto& elem : container) {
            yajl_gen_status rc = (*this)(elem);

            if (rc != yajl_gen_status_ok) {
                return rc;
            }
        }

        yajl_gen_array_close(this->yg_handle);

        return yajl_gen_status_ok;
    }

    yajl_gen_status operator()() { return yajl_gen_null(this->yg_handle); }

private:
    yajl_gen yg_handle;
};

class yajlpp_container_base {
public:
    yajlpp_container_base(yajl_gen handle) : gen(handle), ycb_handle(handle) {}

    yajlpp_generator gen;

protected:
    yajl_gen ycb_handle;
};

class yajlpp_map : public yajlpp_container_base {
public:
    yajlpp_map(yajl_gen handle) : yajlpp_container_base(handle)
    {
        yajl_gen_map_open(handle);
    }

    ~yajlpp_map() { yajl_gen_map_close(this->ycb_handle); }
};

class yajlpp_array : public yajlpp_container_base {
public:
    yajlpp_array(yajl_gen handle) : yajlpp_container_base(handle)
    {
        yajl_gen_array_open(handle);
    }

    ~yajlpp_array() { yajl_gen_array_close(this->ycb_handle); }
};

class yajlpp_gen {
public:
    yajlpp_gen() : yg_handle(yajl_gen_free)
    {
        this->yg_handle = yajl_gen_alloc(nullptr);
    }

    yajl_gen get_handle() const { return this->yg_handle.in(); }

    operator yajl_gen() { return this->yg_handle.in(); }

    string_fragment to_string_fragment();

private:
    auto_mem<yajl_gen_t> yg_handle;
};

namespace yajlpp {

using tree_ptr = std::shared_ptr<yajl_val_s>;

/**
 * Parse a JSON document into a yajl tree.
 *
 * @return The tree or the parser's error message.
 */
Result<tree_ptr, std::string> parse_tree(const std::string& content);

/**
 * Lookup a single key in an object node.
 *
 * @return The value or nullptr if the node is not an object or the key does
 * not exist.
 */
yajl_val get_key(yajl_val node, const char* key);

const char* type_name(yajl_val node);

}  // namespace yajlpp

#endif
