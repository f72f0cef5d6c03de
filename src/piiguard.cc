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
 * @file piiguard.cc
 */

#include "piiguard.hh"

#include <sys/resource.h>

#include "base/piiguard_log.hh"
#include "config.h"

namespace piiguard {

static context* ACTIVE_CONTEXT = nullptr;

Result<std::shared_ptr<context>, std::string>
context::create(std::optional<int64_t> seed, std::string locale)
{
    if (ACTIVE_CONTEXT != nullptr) {
        return Err(std::string("a piiguard context is already active"));
    }

    return Ok(
        std::make_shared<context>(private_tag{}, seed, std::move(locale)));
}

context*
context::active()
{
    return ACTIVE_CONTEXT;
}

context::context(private_tag,
                 std::optional<int64_t> seed,
                 std::string locale)
    : c_fake_data(seed, std::move(locale))
{
    log_open_from_env();
    log_host_info();
    log_info("%s context started: locale=%s",
             PACKAGE_NAME,
             this->c_fake_data.get_locale().c_str());

    ACTIVE_CONTEXT = this;
}

context::~context()
{
    struct rusage ru;

    getrusage(RUSAGE_SELF, &ru);
    log_info("%s context finished", PACKAGE_NAME);
    log_rusage(piiguard_log_level_t::INFO, ru);
    log_close();

    ACTIVE_CONTEXT = nullptr;
}

static const char* const NO_CONTEXT_MSG = "no active piiguard context";

Result<std::vector<pii_entity>, std::string>
scan(const std::string& text)
{
    auto* ctx = context::active();

    if (ctx == nullptr) {
        return Err(std::string(NO_CONTEXT_MSG));
    }

    return Ok(ctx->get_detector().detect(text));
}

Result<redaction_result, std::string>
redact(const std::string& text)
{
    auto* ctx = context::active();

    if (ctx == nullptr) {
        return Err(std::string(NO_CONTEXT_MSG));
    }

    return Ok(ctx->get_detector().redact(text));
}

Result<std::vector<std::string>, std::string>
list_entities()
{
    if (context::active() == nullptr) {
        return Err(std::string(NO_CONTEXT_MSG));
    }

    return Ok(list_entity_types());
}

}  // namespace piiguard
