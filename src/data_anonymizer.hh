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
 * @file data_anonymizer.hh
 */

#ifndef piiguard_data_anonymizer_hh
#define piiguard_data_anonymizer_hh

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "anon_config.hh"
#include "anon_value.hh"
#include "fake_data.hh"
#include "field_strategies.hh"
#include "result.h"
#include "robin_hood.h"
#include "token_vault.hh"
#include "yajl/yajl_gen.h"

namespace piiguard {

struct anonymization_result {
    size_t ar_original_count{0};
    /** The number of records that were anonymized without an error. */
    size_t ar_anonymized_count{0};
    /** Field name -> number of output records that contain the field. */
    std::map<std::string, size_t> ar_fields_processed;
    double ar_processing_time_seconds{0.0};
    std::vector<std::string> ar_errors;

    void gen(yajl_gen gen) const;

    std::string to_json() const;
};

struct batch_result {
    std::vector<record_t> br_records;
    anonymization_result br_summary;
};

/**
 * Applies an anonymization_config to records.  The same value in the same
 * table column is always replaced with the same output for the lifetime of
 * the anonymizer.
 */
class data_anonymizer {
public:
    explicit data_anonymizer(anonymization_config config);

    const anonymization_config& get_config() const { return this->da_config; }

    /**
     * @return The vault used for TOKENIZE or nullptr if the configuration
     * does not enable one.
     */
    token_vault* get_vault() const { return this->da_vault.get(); }

    /**
     * Anonymize the configured fields of a single record.  Records for an
     * unknown table and fields without a configuration are passed through.
     *
     * @return The new record or the first strategy error.
     */
    Result<record_t, std::string> anonymize_record(
        const record_t& record, const std::string& table_name);

    /**
     * Anonymize a batch.  A record that fails is kept in its original form
     * and the failure is reported in the summary.
     */
    batch_result anonymize_records(const std::vector<record_t>& records,
                                   const std::string& table_name);

    std::string anonymize_text(const std::string& text,
                               anon_method_t method = anon_method_t::redact);

    /**
     * @return The token to original value mapping for every field type, or
     * nothing if the vault is not enabled.
     */
    std::optional<std::map<std::string, std::string>> export_vault() const;

private:
    Result<anon_value, std::string> anonymize_field(const field_config& fc,
                                                    const anon_value& value);

    using field_map = robin_hood::unordered_map<std::string, field_config>;
    using value_cache = robin_hood::unordered_map<std::string, anon_value>;

    anonymization_config da_config;
    std::unique_ptr<token_vault> da_vault;
    fake_data_generator da_fake_data;
    robin_hood::unordered_map<std::string, field_map> da_field_configs;
    robin_hood::unordered_map<std::string, value_cache> da_consistency;
};

}  // namespace piiguard

#endif
