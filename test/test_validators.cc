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
 * @file test_validators.cc
 */

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pii_validators.hh"

using namespace piiguard;

TEST_CASE("luhn")
{
    CHECK(validators::luhn(string_fragment::from_const("4532015112830366")));
    CHECK(validators::luhn(string_fragment::from_const("5425233430109903")));
    CHECK_FALSE(
        validators::luhn(string_fragment::from_const("4532015112830367")));
    CHECK_FALSE(validators::luhn(string_fragment::from_const("4532")));
    CHECK_FALSE(
        validators::luhn(string_fragment::from_const("4532-0151-1283-0366")));
}

TEST_CASE("vin")
{
    CHECK(validators::vin(string_fragment::from_const("1HGBH41JXMN109186")));
    CHECK_FALSE(
        validators::vin(string_fragment::from_const("1HGBH41JXMN1091")));
    CHECK_FALSE(
        validators::vin(string_fragment::from_const("1HGBH41IXMN109186")));
    CHECK_FALSE(
        validators::vin(string_fragment::from_const("1HGBH41OXMN109186")));
}

TEST_CASE("iban")
{
    CHECK(validators::iban(
        string_fragment::from_const("GB82WEST12345698765432")));
    CHECK(validators::iban(
        string_fragment::from_const("GB82 WEST 1234 5698 7654 32")));
    CHECK_FALSE(
        validators::iban(string_fragment::from_const("12WEST12345698765432")));
    CHECK_FALSE(validators::iban(string_fragment::from_const("GB82WEST")));
}

TEST_CASE("bitcoin")
{
    CHECK(validators::bitcoin(
        string_fragment::from_const("1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2")));
    CHECK_FALSE(validators::bitcoin(string_fragment::from_const("invalid")));
    CHECK_FALSE(validators::bitcoin(
        string_fragment::from_const("1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN0")));
}

TEST_CASE("ipv4")
{
    CHECK(validators::ipv4(string_fragment::from_const("192.168.1.1")));
    CHECK(validators::ipv4(string_fragment::from_const("0.0.0.0")));
    CHECK_FALSE(validators::ipv4(string_fragment::from_const("256.168.1.1")));
    CHECK_FALSE(validators::ipv4(string_fragment::from_const("192.168.1")));
    CHECK_FALSE(validators::ipv4(string_fragment::from_const("192..1.1")));
    CHECK_FALSE(
        validators::ipv4(string_fragment::from_const("99999999999.1.1.1")));
}

TEST_CASE("ssn")
{
    CHECK(validators::ssn(string_fragment::from_const("123-45-6789")));
    CHECK(validators::ssn(string_fragment::from_const("123456789")));
    CHECK_FALSE(validators::ssn(string_fragment::from_const("000-45-6789")));
    CHECK_FALSE(validators::ssn(string_fragment::from_const("666-45-6789")));
    CHECK_FALSE(validators::ssn(string_fragment::from_const("900-45-6789")));
    CHECK_FALSE(validators::ssn(string_fragment::from_const("123-00-6789")));
    CHECK_FALSE(validators::ssn(string_fragment::from_const("123-45-0000")));
    CHECK_FALSE(validators::ssn(string_fragment::from_const("123-45-678")));
}
