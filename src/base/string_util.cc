/**
 * Copyright (c) 2019, Timothy Stack
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
 * @file string_util.cc
 */

#include <algorithm>
#include <iterator>
#include <sstream>

#include "string_util.hh"

bool
is_blank(const std::string& str)
{
    return std::all_of(str.begin(), str.end(), [](const auto ch) {
        return isspace((unsigned char) ch);
    });
}

void
split_ws(const std::string& str, std::vector<std::string>& toks_out)
{
    std::string::size_type index = 0;

    while (index < str.size()) {
        while (index < str.size() && isspace((unsigned char) str[index])) {
            index += 1;
        }
        if (index == str.size()) {
            break;
        }

        auto tok_start = index;
        while (index < str.size() && !isspace((unsigned char) str[index])) {
            index += 1;
        }
        toks_out.emplace_back(str.substr(tok_start, index - tok_start));
    }
}

std::string
repeat(const std::string& input, size_t num)
{
    std::ostringstream os;
    std::fill_n(std::ostream_iterator<std::string>(os), num, input);
    return os.str();
}

std::string
digits_only(string_fragment sf)
{
    std::string retval;

    for (auto ch : sf) {
        if (isdigit((unsigned char) ch)) {
            retval.push_back(ch);
        }
    }

    return retval;
}

size_t
utf8_next_boundary(const std::string& str, size_t offset)
{
    while (offset < str.size() && is_utf8_continuation(str[offset])) {
        offset += 1;
    }

    return offset;
}

string_fragment
utf8_window(const std::string& str, size_t start, size_t end, size_t radius)
{
    size_t win_start = start > radius ? start - radius : 0;
    size_t win_end = std::min(str.size(), end + radius);

    while (win_start > 0 && is_utf8_continuation(str[win_start])) {
        win_start -= 1;
    }
    win_end = utf8_next_boundary(str, win_end);

    return string_fragment::from_str_range(str, win_start, win_end);
}

/**
 * @return The length of the well-formed UTF-8 sequence at the given offset
 * or zero if the bytes there are not one.
 */
static size_t
valid_utf8_length(const std::string& str, size_t offset)
{
    auto lead = (unsigned char) str[offset];
    unsigned char lower = 0x80, upper = 0xbf;
    size_t len;

    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xc2 && lead <= 0xdf) {
        len = 2;
    } else if (lead >= 0xe0 && lead <= 0xef) {
        len = 3;
        if (lead == 0xe0) {
            lower = 0xa0;
        } else if (lead == 0xed) {
            upper = 0x9f;
        }
    } else if (lead >= 0xf0 && lead <= 0xf4) {
        len = 4;
        if (lead == 0xf0) {
            lower = 0x90;
        } else if (lead == 0xf4) {
            upper = 0x8f;
        }
    } else {
        return 0;
    }

    if (offset + len > str.size()) {
        return 0;
    }

    auto second = (unsigned char) str[offset + 1];
    if (second < lower || second > upper) {
        return 0;
    }
    for (size_t lpc = 2; lpc < len; lpc++) {
        if (!is_utf8_continuation(str[offset + lpc])) {
            return 0;
        }
    }

    return len;
}

std::string
scrub_utf8(const std::string& str)
{
    std::string retval = str;
    size_t offset = 0;

    while (offset < retval.size()) {
        auto len = valid_utf8_length(retval, offset);

        if (len == 0) {
            retval[offset] = '?';
            len = 1;
        }
        offset += len;
    }

    return retval;
}
