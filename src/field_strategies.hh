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
 * @file field_strategies.hh
 */

#ifndef piiguard_field_strategies_hh
#define piiguard_field_strategies_hh

#include <optional>
#include <string>

#include <stdint.h>

#include "anon_config.hh"
#include "anon_value.hh"
#include "date/date.h"
#include "fake_data.hh"
#include "result.h"
#include "token_vault.hh"

namespace piiguard {

/**
 * The state a strategy may consult.  None of the pointers are owned and any
 * of them may be null.
 */
struct strategy_context {
    token_vault* sc_vault{nullptr};
    std::optional<int64_t> sc_seed;
    fake_data_generator* sc_fake_data{nullptr};
};

using strategy_result = Result<anon_value, std::string>;

using strategy_func = strategy_result (*)(const anon_value& value,
                                          const field_config& fc,
                                          strategy_context& ctx);

strategy_result anonymize_email(const anon_value& value,
                                const field_config& fc,
                                strategy_context& ctx);

strategy_result anonymize_phone(const anon_value& value,
                                const field_config& fc,
                                strategy_context& ctx);

strategy_result anonymize_name(const anon_value& value,
                               const field_config& fc,
                               strategy_context& ctx);

strategy_result anonymize_ssn(const anon_value& value,
                              const field_config& fc,
                              strategy_context& ctx);

/**
 * Dates are expected in ISO-8601 form.  Values that do not parse are
 * always redacted.
 */
strategy_result anonymize_date(const anon_value& value,
                               const field_config& fc,
                               strategy_context& ctx);

/**
 * @return An error if the value cannot be converted to a number.
 */
strategy_result anonymize_numeric(const anon_value& value,
                                  const field_config& fc,
                                  strategy_context& ctx);

strategy_result anonymize_text(const anon_value& value,
                               const field_config& fc,
                               strategy_context& ctx);

strategy_result anonymize_address(const anon_value& value,
                                  const field_config& fc,
                                  strategy_context& ctx);

strategy_result anonymize_credit_card(const anon_value& value,
                                      const field_config& fc,
                                      strategy_context& ctx);

strategy_func strategy_for(field_type_t type);

inline strategy_result
apply_strategy(const anon_value& value,
               const field_config& fc,
               strategy_context& ctx)
{
    return strategy_for(fc.get_type())(value, fc, ctx);
}

/**
 * Parse the date portion of an ISO-8601 date or timestamp.  The time and
 * offset, if present, are validated and then dropped.
 */
std::optional<date::year_month_day> parse_iso_date(const std::string& str);

/**
 * Replace all but the last show_last digits with mask_char.  Non-digits
 * are dropped from the result.
 */
std::string mask_digits(const std::string& str,
                        int64_t show_last,
                        const std::string& mask_char);

}  // namespace piiguard

#endif
