#pragma once

#include "ishne/ishne.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ishne::easy {

inline Lead make_lead(LeadSpec spec, std::int16_t resolution_nv, std::vector<std::int16_t> samples,
                      LeadQuality quality = LeadQuality::Good) {
    Lead l;
    l.spec_code = to_code(spec);
    l.quality_code = to_code(quality);
    l.resolution_nv = resolution_nv;
    l.samples = std::move(samples);
    return l;
}

// Quantize millivolt values to the lead's resolution (rounded, saturated at int16).
inline Lead make_lead_mv(LeadSpec spec, std::int16_t resolution_nv, const std::vector<double>& mv,
                         LeadQuality quality = LeadQuality::Good) {
    std::vector<std::int16_t> raw;
    raw.reserve(mv.size());
    for (double v : mv) raw.push_back(from_millivolts(v, resolution_nv));
    return make_lead(spec, resolution_nv, std::move(raw), quality);
}

// Index of the first lead with the given placement.
inline std::optional<std::size_t> find_lead(const Record& rec, LeadSpec spec) {
    for (std::size_t i = 0; i < rec.leads.size(); ++i) {
        if (rec.leads[i].spec() == spec) return i;
    }
    return std::nullopt;
}

// Keep only the listed leads, in the order given. Every spec must be present.
inline void retain_leads(Record& rec, const std::vector<LeadSpec>& keep) {
    std::vector<Lead> out;
    out.reserve(keep.size());
    for (LeadSpec spec : keep) {
        auto idx = find_lead(rec, spec);
        if (!idx) {
            std::ostringstream oss;
            oss << "record has no lead " << to_string(spec);
            throw IshneError(ErrorKind::InvalidRecord, oss.str());
        }
        out.push_back(rec.leads[*idx]);
    }
    rec.leads = std::move(out);
}

// Recording length; 0 when the sample rate is not positive.
inline double duration_seconds(const Record& rec) {
    if (rec.sample_rate <= 0) return 0.0;
    return static_cast<double>(rec.samples_per_lead()) / static_cast<double>(rec.sample_rate);
}

// Same, for a header-only record whose sample count lives in the layout.
inline double duration_seconds(const Record& rec, const Layout& layout) {
    if (rec.sample_rate <= 0) return 0.0;
    return static_cast<double>(layout.samples_per_lead) / static_cast<double>(rec.sample_rate);
}

} // namespace ishne::easy
