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
 * @file piiguard.hh
 */

#ifndef piiguard_hh
#define piiguard_hh

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include "fake_data.hh"
#include "pii_detector.hh"
#include "pii_entity.hh"
#include "result.h"

namespace piiguard {

/**
 * Process-wide state: logging, a default detector and a default fake data
 * generator.  At most one context may exist at a time and the free
 * functions below operate on it.
 */
class context {
    struct private_tag {
        explicit private_tag() = default;
    };

public:
    static Result<std::shared_ptr<context>, std::string> create(
        std::optional<int64_t> seed = std::nullopt,
        std::string locale = "en_US");

    /**
     * @return The active context or nullptr.
     */
    static context* active();

    /**
     * Only callable through create().
     */
    context(private_tag, std::optional<int64_t> seed, std::string locale);

    context(const context&) = delete;
    context& operator=(const context&) = delete;

    ~context();

    const pii_detector& get_detector() const { return this->c_detector; }

    fake_data_generator& get_fake_data() { return this->c_fake_data; }

private:
    pii_detector c_detector;
    fake_data_generator c_fake_data;
};

Result<std::vector<pii_entity>, std::string> scan(const std::string& text);

Result<redaction_result, std::string> redact(const std::string& text);

/**
 * @return The labels of every entity type the detector can report, in
 * catalog order.
 */
Result<std::vector<std::string>, std::string> list_entities();

}  // namespace piiguard

#endif
