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
 * @file data_anonymizer.cc
 */

#include <chrono>

#include "data_anonymizer.hh"

#include "base/piiguard_log.hh"
#include "fmt/format.h"
#include "yajlpp/yajlpp.hh"

namespace piiguard {

void
anonymization_result::gen(yajl_gen gen) const
{
    yajlpp_map root(gen);

    root.gen("original_count");
    root.gen(this->ar_original_count);
    root.gen("anonymized_count");
    root.gen(this->ar_anonymized_count);
    root.gen("fields_processed");
    {
        yajlpp_map fields(gen);

        for (const auto& field_pair : this->ar_fields_processed) {
            fields.gen(field_pair.first);
            fields.gen(field_pair.second);
        }
    }
    root.gen("processing_time_seconds");
    root.gen(this->ar_processing_time_seconds);
    root.gen("errors");
    root.gen(this->ar_errors);
}

std::string
anonymization_result::to_json() const
{
    yajlpp_gen gen;

    this->gen(gen);

    return gen.to_string_fragment().to_string();
}

data_anonymizer::data_anonymizer(anonymization_config config)
    : da_config(std::move(config)),
      da_fake_data(this->da_config.ac_seed, "en_US")
{
    if (this->da_config.ac_use_token_vault) {
        this->da_vault = std::make_unique<token_vault>(
            this->da_config.ac_vault_encryption_key);
    }

    for (const auto& tc : this->da_config.ac_tables) {
        auto& fields = this->da_field_configs[tc.tc_table_name];

        for (const auto& fc : tc.tc_fields) {
            fields.insert_or_assign(fc.fc_field_name, fc);
        }
    }

    log_info("anonymizer for config %s: tables=%zu; vault=%s; seed=%s",
             this->da_config.ac_config_id.c_str(),
             this->da_config.ac_tables.size(),
             this->da_vault ? "on" : "off",
             this->da_config.ac_seed
                 ? fmt::to_string(this->da_config.ac_seed.value()).c_str()
                 : "none");
}

Result<anon_value, std::string>
data_anonymizer::anonymize_field(const field_config& fc,
                                 const anon_value& value)
{
    switch (fc.fc_method) {
        case anon_method_t::preserve:
            return Ok(value);
        case anon_method_t::null:
            return Ok(anon_value{});
        case anon_method_t::tokenize:
            if (this->da_vault) {
                if (is_null(value)) {
                    return Ok(anon_value{});
                }
                return Ok(anon_value{this->da_vault->tokenize(
                    to_string(value), fc.fc_field_type)});
            }
            break;
        default:
            break;
    }

    strategy_context ctx{
        this->da_vault.get(),
        this->da_config.ac_seed,
        &this->da_fake_data,
    };

    return apply_strategy(value, fc, ctx);
}

Result<record_t, std::string>
data_anonymizer::anonymize_record(const record_t& record,
                                  const std::string& table_name)
{
    auto table_iter = this->da_field_configs.find(table_name);

    if (table_iter == this->da_field_configs.end()) {
        return Ok(record);
    }

    const auto& field_configs = table_iter->second;
    record_t retval;

    for (const auto& field_pair : record) {
        const auto& field_name = field_pair.first;
        const auto& value = field_pair.second;
        auto fc_iter = field_configs.find(field_name);

        if (fc_iter == field_configs.end()) {
            retval.emplace(field_name, value);
            continue;
        }

        if (is_null(value) && this->da_config.ac_preserve_nulls) {
            retval.emplace(field_name, anon_value{});
            continue;
        }

        auto& cache = this->da_consistency[fmt::format(
            FMT_STRING("{}.{}"), table_name, field_name)];
        auto value_key = to_string(value);
        if (!is_null(value)) {
            auto cache_iter = cache.find(value_key);

            if (cache_iter != cache.end()) {
                retval.emplace(field_name, cache_iter->second);
                continue;
            }
        }

        auto anon_res = this->anonymize_field(fc_iter->second, value);
        if (anon_res.isErr()) {
            return Err(fmt::format(
                FMT_STRING("{}: {}"), field_name, anon_res.unwrapErr()));
        }

        auto anon_val = anon_res.unwrap();
        cache.insert_or_assign(value_key, anon_val);
        retval.emplace(field_name, std::move(anon_val));
    }

    return Ok(retval);
}

batch_result
data_anonymizer::anonymize_records(const std::vector<record_t>& records,
                                   const std::string& table_name)
{
    auto start = std::chrono::steady_clock::now();
    batch_result retval;
    auto& summary = retval.br_summary;

    retval.br_records.reserve(records.size());
    for (size_t lpc = 0; lpc < records.size(); lpc++) {
        std::optional<std::string> error;

        try {
            auto anon_res = this->anonymize_record(records[lpc], table_name);

            if (anon_res.isOk()) {
                auto anon_rec = anon_res.unwrap();

                for (const auto& field_pair : anon_rec) {
                    summary.ar_fields_processed[field_pair.first] += 1;
                }
                retval.br_records.emplace_back(std::move(anon_rec));
                summary.ar_anonymized_count += 1;
            } else {
                error = anon_res.unwrapErr();
            }
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (error) {
            auto msg
                = fmt::format(FMT_STRING("Record {}: {}"), lpc, error.value());

            log_warning("%s: %s", table_name.c_str(), msg.c_str());
            summary.ar_errors.emplace_back(std::move(msg));
            retval.br_records.emplace_back(records[lpc]);
        }
    }

    std::chrono::duration<double> elapsed
        = std::chrono::steady_clock::now() - start;
    summary.ar_original_count = records.size();
    summary.ar_processing_time_seconds = elapsed.count();

    log_info("anonymized %zu/%zu %s records in %.3fs (%zu errors)",
             summary.ar_anonymized_count,
             summary.ar_original_count,
             table_name.c_str(),
             summary.ar_processing_time_seconds,
             summary.ar_errors.size());

    return retval;
}

std::string
data_anonymizer::anonymize_text(const std::string& text, anon_method_t method)
{
    field_config fc{"text", "text", method};
    strategy_context ctx{
        this->da_vault.get(),
        this->da_config.ac_seed,
        &this->da_fake_data,
    };
    auto anon_res = piiguard::anonymize_text(anon_value{text}, fc, ctx);

    if (anon_res.isErr()) {
        log_error("text anonymization failed: %s",
                  anon_res.unwrapErr().c_str());
        return "[TEXT_REDACTED]";
    }

    return to_string(anon_res.unwrap());
}

std::optional<std::map<std::string, std::string>>
data_anonymizer::export_vault() const
{
    if (!this->da_vault) {
        return std::nullopt;
    }

    std::map<std::string, std::string> retval;
    auto snap = this->da_vault->export_vault();

    for (const auto& type_pair : snap.vs_reverse) {
        retval.insert(type_pair.second.begin(), type_pair.second.end());
    }

    return retval;
}

}  // namespace piiguard
