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
 * @file string_util.hh
 */

#ifndef piiguard_string_util_hh
#define piiguard_string_util_hh

#include <string>
#include <vector>

#include <ctype.h>
#include <string.h>

#include "string_fragment.hh"

inline bool
startswith(const char* str, const char* prefix)
{
    return strncmp(str, prefix, strlen(prefix)) == 0;
}

inline bool
startswith(const std::string& str, const char* prefix)
{
    return startswith(str.c_str(), prefix);
}

inline bool
startswith(const std::string& str, const std::string& prefix)
{
    return startswith(str.c_str(), prefix.c_str());
}

inline bool
endswith(const char* str, const char* suffix)
{
    size_t len = strlen(str), suffix_len = strlen(suffix);

    if (suffix_len > len) {
        return false;
    }

    return strcmp(&str[len - suffix_len], suffix) == 0;
}

template<int N>
bool
endswith(const std::string& str, const char (&suffix)[N])
{
    if (N - 1 > str.length()) {
        return false;
    }

    return strcmp(&str[str.size() - (N - 1)], suffix) == 0;
}

inline std::string
trim(const std::string& str)
{
    std::string::size_type start, end;

    for (start = 0; start < str.size() && isspace((unsigned char) str[start]);
         start++)
        ;
    for (end = str.size(); end > 0 && isspace((unsigned char) str[end - 1]);
         end--)
        ;

    return str.substr(start, end - start);
}

/**
 * Lowercase the ASCII letters in the string.  Bytes of multi-byte UTF-8
 * sequences are left untouched so byte offsets are preserved.
 */
inline std::string
tolower(const char* str)
{
    std::string retval;

    for (int lpc = 0; str[lpc]; lpc++) {
        retval.push_back(::tolower((unsigned char) str[lpc]));
    }

    return retval;
}

inline std::string
tolower(const std::string& str)
{
    std::string retval;

    retval.reserve(str.size());
    for (auto ch : str) {
        retval.push_back(::tolower((unsigned char) ch));
    }

    return retval;
}

inline std::string
toupper(const std::string& str)
{
    std::string retval;

    retval.reserve(str.size());
    for (auto ch : str) {
        retval.push_back(::toupper((unsigned char) ch));
    }

    return retval;
}

bool is_blank(const std::string& str);

void split_ws(const std::string& str, std::vector<std::string>& toks_out);

std::string repeat(const std::string& input, size_t num);

/**
 * @return Only the ASCII digits in the given string.
 */
std::string digits_only(string_fragment sf);

/**
 * @return The number of bytes in the UTF-8 sequence that starts with the
 * given lead byte, or 1 for a byte that cannot start a sequence.
 */
inline size_t
utf8_char_size(unsigned char lead)
{
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xe0) == 0xc0) {
        return 2;
    }
    if ((lead & 0xf0) == 0xe0) {
        return 3;
    }
    if ((lead & 0xf8) == 0xf0) {
        return 4;
    }
    return 1;
}

inline bool
is_utf8_continuation(unsigned char ch)
{
    return (ch & 0xc0) == 0x80;
}

/**
 * Move a byte offset forward until it no longer points into the middle of a
 * UTF-8 sequence.
 */
size_t utf8_next_boundary(const std::string& str, size_t offset);

/**
 * Clamp a byte window of the given radius around [start, end) to the
 * string and widen it so that no UTF-8 sequence is split.
 */
string_fragment utf8_window(const std::string& str,
                            size_t start,
                            size_t end,
                            size_t radius);

/**
 * @return A copy of the string where every byte that is not part of a
 * well-formed UTF-8 sequence is replaced by a '?'.  The copy has the same
 * length as the input.
 */
std::string scrub_utf8(const std::string& str);

#endif
