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
 * @file pii_validators.cc
 */

#include <ctype.h>

#include "pii_validators.hh"

#include "base/string_util.hh"

namespace piiguard::validators {

bool
luhn(string_fragment digits)
{
    if (digits.length() < 13) {
        return false;
    }

    int checksum = 0;
    bool doubled = false;

    for (int lpc = digits.length() - 1; lpc >= 0; lpc--) {
        auto ch = digits[lpc];

        if (!isdigit((unsigned char) ch)) {
            return false;
        }

        int digit = ch - '0';
        if (doubled) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        checksum += digit;
        doubled = !doubled;
    }

    return checksum % 10 == 0;
}

bool
vin(string_fragment value)
{
    if (value.length() != 17) {
        return false;
    }

    for (auto ch : value) {
        switch (toupper((unsigned char) ch)) {
            case 'I':
            case 'O':
            case 'Q':
                return false;
            default:
                break;
        }
    }

    return true;
}

bool
iban(string_fragment value)
{
    std::string compact;

    for (auto ch : value) {
        if (ch != ' ') {
            compact.push_back(toupper((unsigned char) ch));
        }
    }

    if (compact.length() < 15 || compact.length() > 34) {
        return false;
    }

    return isalpha((unsigned char) compact[0])
        && isalpha((unsigned char) compact[1])
        && isdigit((unsigned char) compact[2])
        && isdigit((unsigned char) compact[3]);
}

bool
bitcoin(string_fragment value)
{
    if (value.length() < 26 || value.length() > 62) {
        return false;
    }
    if (value.front() != '1' && value.front() != '3'
        && !value.startswith("bc1"))
    {
        return false;
    }

    for (auto ch : value.substr(1)) {
        switch (ch) {
            case '0':
            case 'O':
            case 'I':
            case 'l':
                return false;
            default:
                break;
        }
    }

    return true;
}

bool
ssn(string_fragment value)
{
    auto digits = digits_only(value);

    if (digits.length() != 9) {
        return false;
    }

    auto area = digits.substr(0, 3);
    if (area == "000" || area == "666" || area >= "900") {
        return false;
    }
    if (digits.compare(3, 2, "00") == 0) {
        return false;
    }
    if (digits.compare(5, 4, "0000") == 0) {
        return false;
    }

    return true;
}

bool
ipv4(string_fragment value)
{
    int octets = 0;
    int current = 0;
    int digit_count = 0;

    for (auto ch : value) {
        if (ch == '.') {
            if (digit_count == 0 || current > 255) {
                return false;
            }
            octets += 1;
            current = 0;
            digit_count = 0;
            continue;
        }
        if (!isdigit((unsigned char) ch)) {
            return false;
        }
        // saturates past 255
        if (current <= 255) {
            current = current * 10 + (ch - '0');
        }
        digit_count += 1;
    }

    if (digit_count == 0 || current > 255) {
        return false;
    }

    return octets == 3;
}

}  // namespace piiguard::validators
