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
 * @file fake_data.hh
 */

#ifndef piiguard_fake_data_hh
#define piiguard_fake_data_hh

#include <optional>
#include <random>
#include <string>
#include <vector>

#include <stdint.h>

namespace piiguard {

/**
 * Create a generator whose sequence depends only on the seed and the value:
 * the first eight hex digits of md5("<seed>:<value>"), or of md5(<value>)
 * when there is no seed.
 */
std::mt19937_64 value_seeded_rng(const std::optional<int64_t>& seed,
                                 const std::string& value);

inline int64_t
rand_between(std::mt19937_64& rng, int64_t low, int64_t high)
{
    std::uniform_int_distribution<int64_t> dist(low, high);

    return dist(rng);
}

inline double
rand_uniform(std::mt19937_64& rng, double low, double high)
{
    std::uniform_real_distribution<double> dist(low, high);

    return dist(rng);
}

template<typename C>
const typename C::value_type&
rand_choice(std::mt19937_64& rng, const C& choices)
{
    return choices[rand_between(rng, 0, choices.size() - 1)];
}

struct fake_address {
    std::string fa_street;
    std::string fa_city;
    std::string fa_state;
    std::string fa_postal_code;
    std::string fa_country;
    std::string fa_full;
};

/**
 * Produces realistic looking replacement values.  When an original value
 * is passed to an operation, the result is derived from that value alone
 * and is the same for every generator with the same seed and locale.
 * Otherwise, the generator's own sequence is used.
 */
class fake_data_generator {
public:
    using original_t = std::optional<std::string>;

    explicit fake_data_generator(std::optional<int64_t> seed = std::nullopt,
                                 std::string locale = "en_US");

    const std::optional<int64_t>& get_seed() const { return this->fdg_seed; }

    const std::string& get_locale() const { return this->fdg_locale; }

    std::string first_name(const original_t& original = std::nullopt);

    std::string last_name(const original_t& original = std::nullopt);

    std::string full_name(const original_t& original = std::nullopt);

    std::string email(const original_t& original = std::nullopt);

    /**
     * @param format One of "us", "uk" or "intl".  Anything else produces a
     *   555 number.
     */
    std::string phone(const original_t& original = std::nullopt,
                      const std::string& format = "us");

    std::string ssn(const original_t& original = std::nullopt);

    fake_address address(const original_t& original = std::nullopt);

    std::string street_address(const original_t& original = std::nullopt);

    std::string city(const original_t& original = std::nullopt);

    std::string company(const original_t& original = std::nullopt);

    std::string date(const original_t& original = std::nullopt,
                     int min_year = 1950,
                     int max_year = 2005);

    /**
     * @return A Luhn-valid card number with a Visa, Mastercard, Amex or
     *   Discover prefix.
     */
    std::string credit_card(const original_t& original = std::nullopt);

    std::string ip_address(const original_t& original = std::nullopt,
                           int version = 4);

    std::string username(const original_t& original = std::nullopt);

private:
    struct name_lists {
        const std::vector<const char*>& nl_first;
        const std::vector<const char*>& nl_last;
    };

    name_lists names_for_locale() const;

    template<typename F>
    auto with_rng(const original_t& original, F func);

    std::optional<int64_t> fdg_seed;
    std::string fdg_locale;
    std::mt19937_64 fdg_rng;
};

}  // namespace piiguard

#endif
