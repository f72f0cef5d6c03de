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
 * @file pii_detector.hh
 */

#ifndef piiguard_pii_detector_hh
#define piiguard_pii_detector_hh

#include <map>
#include <string>
#include <vector>

#include "pii_entity.hh"
#include "pii_patterns.hh"
#include "yajl/yajl_gen.h"

namespace piiguard {

struct type_statistics {
    size_t ts_count{0};
    double ts_avg_confidence{0.0};
};

struct detection_statistics {
    size_t ds_total{0};
    std::map<std::string, type_statistics> ds_by_type;
    std::map<std::string, size_t> ds_by_language;
    double ds_avg_confidence{0.0};

    void gen(yajl_gen gen) const;

    std::string to_json() const;
};

struct redaction_result {
    std::string rr_text;
    std::vector<pii_entity> rr_entities;
};

/**
 * The text handed to the scanning stages.  The rules run against si_scan,
 * a copy of si_text where every byte that is not valid UTF-8 has been
 * replaced, so an offset into one is an offset into the other.
 */
struct scan_input {
    explicit scan_input(const std::string& text);

    const std::string& si_text;
    std::string si_scan;
    std::string si_language;
};

/**
 * Finds PII in free-form text.  A detector holds no per-call state, so a
 * single instance can be shared by several threads.
 */
class pii_detector {
public:
    pii_detector();

    /**
     * Scan the text for every supported entity type.
     *
     * @param text The UTF-8 text to scan.  Bytes that are not valid UTF-8
     *   do not stop the scan.
     * @return The entities found, sorted by their start offset.  No two
     *   entities overlap.
     */
    std::vector<pii_entity> detect(const std::string& text) const;

    /**
     * Replace every detected entity with "[LABEL:" followed by four copies
     * of mask_char and "]".
     */
    redaction_result redact(const std::string& text,
                            const std::string& mask_char = "*") const;

    detection_statistics get_statistics(
        const std::vector<pii_entity>& entities) const;

    static std::string detect_language(const std::string& text);

    /**
     * The stages of detect().  Each stage appends its candidates to the
     * entities vector.  The name and address stages skip any match that
     * overlaps a candidate that is already in the vector.
     */
    void scan_patterns(const scan_input& input,
                       std::vector<pii_entity>& entities) const;

    void scan_names(const scan_input& input,
                    std::vector<pii_entity>& entities) const;

    void scan_addresses(const scan_input& input,
                        std::vector<pii_entity>& entities) const;

private:
    const std::vector<pattern_def>& pd_patterns;
    const std::vector<pcre2pp::code>& pd_name_patterns;
    const std::vector<pcre2pp::code>& pd_address_patterns;
};

namespace detail {

/**
 * @return The confidence for a name candidate: a base value raised by a
 * title, by every word being capitalized and by an indicator word like
 * "name" or "contact" in the surrounding text.
 */
double name_confidence(const std::string& text, string_fragment match);

/**
 * Collapse candidates with overlapping spans.  Overlap is transitive, so a
 * span that bridges two groups merges them.  The survivor of a group is
 * the member with the highest confidence, the earliest candidate wins a
 * tie.  A survivor of a group with more than two members has its
 * confidence raised by 0.02, up to 0.99.
 */
std::vector<pii_entity> resolve_overlaps(
    const std::vector<pii_entity>& entities);

/**
 * @return True if the entity is below the floor for its type or is a
 * well-known placeholder value.
 */
bool is_filtered(const pii_entity& pe);

}  // namespace detail

}  // namespace piiguard

#endif
