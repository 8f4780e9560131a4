#include "test_check.hpp"

#include "ishne/ishne_easy.hpp"

#include <cmath>
#include <iostream>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    // Interleaving order: value t*N+i is lead i sample t
    {
        ishne::Record rec = make_sample_record(3, 4);
        std::vector<std::uint8_t> block = ishne::interleave(rec.leads);
        CHECK(block.size() == 3u * 4u * 2u);
        for (std::size_t t = 0; t < 4; ++t) {
            for (std::size_t i = 0; i < 3; ++i) {
                const std::size_t k = 2 * (t * 3 + i);
                const auto v = static_cast<std::int16_t>(block[k] | (block[k + 1] << 8));
                CHECK(v == static_cast<std::int16_t>(i * 1000 + t));
            }
        }

        std::vector<ishne::Lead> back(3);
        CHECK(ishne::deinterleave(block.data(), block.size(), back) == 0);
        for (std::size_t i = 0; i < 3; ++i) CHECK(back[i].samples == rec.leads[i].samples);
    }

    // Negative values are little-endian two's complement
    {
        std::vector<ishne::Lead> leads(1);
        leads[0].samples = {-1, -32768, 32767};
        std::vector<std::uint8_t> block = ishne::interleave(leads);
        CHECK(block[0] == 0xFF && block[1] == 0xFF);
        CHECK(block[2] == 0x00 && block[3] == 0x80);
        CHECK(block[4] == 0xFF && block[5] == 0x7F);
    }

    // A partial frame at the end is cropped
    {
        ishne::Record rec = make_sample_record(2, 5);
        std::vector<std::uint8_t> bytes = ishne::encode(rec);
        bytes.push_back(0x11);
        bytes.push_back(0x22);
        bytes.push_back(0x33);
        auto [head, lay] = ishne::inspect(bytes);
        CHECK(lay.samples_per_lead == 5u);
        CHECK(lay.trailing_bytes == 3u);
        CHECK(ishne::decode(bytes) == rec);

        std::vector<ishne::Lead> leads(2);
        CHECK(ishne::deinterleave(bytes.data() + 522, 7, leads) == 3);
        CHECK(leads[0].samples.size() == 1);
    }

    // Empty sample block
    {
        ishne::Record rec = make_sample_record(2, 0);
        std::vector<std::uint8_t> bytes = ishne::encode(rec);
        CHECK(bytes.size() == ishne::kFixedHeaderSize);
        ishne::Record back = ishne::decode(bytes);
        CHECK(back.leads.size() == 2);
        CHECK(back.samples_per_lead() == 0);
    }

    // Lead count and length consistency
    {
        ishne::Record rec = make_sample_record(2, 5);
        rec.leads[1].samples.pop_back();
        CHECK(throws_kind([&] { (void)ishne::encode(rec); }, ishne::ErrorKind::InvalidRecord));
        CHECK(throws_kind([&] { (void)ishne::interleave(rec.leads); }, ishne::ErrorKind::InvalidRecord));

        CHECK(throws_kind([&] { (void)ishne::encode(make_sample_record(0, 5)); }, ishne::ErrorKind::InvalidRecord));
        CHECK(throws_kind([&] { (void)ishne::encode(make_sample_record(13, 5)); }, ishne::ErrorKind::InvalidRecord));
        CHECK(ishne::decode(ishne::encode(make_sample_record(12, 5))).leads.size() == 12);

        std::vector<ishne::Lead> none;
        std::uint8_t buf[4] = {0, 0, 0, 0};
        CHECK(throws_kind([&] { (void)ishne::deinterleave(buf, 4, none); }, ishne::ErrorKind::InvalidRecord));
    }

    // Unit conversion
    {
        CHECK(near(ishne::to_millivolts(400, 2500), 1.0));
        CHECK(near(ishne::to_millivolts(-200, 5000), -1.0));

        ishne::Lead l;
        l.resolution_nv = 2500;
        l.samples = {0, 400, -800};
        std::vector<double> mv = ishne::to_millivolts(l);
        CHECK(mv.size() == 3);
        CHECK(near(mv[1], 1.0) && near(mv[2], -2.0));
        CHECK(l.samples[1] == 400);  // raw data untouched

        l.resolution_nv = 0;
        CHECK(!ishne::convertible(l));
        CHECK(throws_kind([&] { (void)ishne::to_millivolts(l); }, ishne::ErrorKind::InvalidRecord));
        l.resolution_nv = -9;
        CHECK(throws_kind([&] { (void)ishne::to_millivolts(l); }, ishne::ErrorKind::InvalidRecord));
    }

    // Millivolts back to raw: rounded and saturated
    {
        CHECK(ishne::from_millivolts(1.0, 2500) == 400);
        CHECK(ishne::from_millivolts(0.0013, 1000) == 1);
        CHECK(ishne::from_millivolts(-0.0017, 1000) == -2);
        CHECK(ishne::from_millivolts(1e6, 2500) == 32767);
        CHECK(ishne::from_millivolts(-1e6, 2500) == -32768);
        CHECK(throws_kind([&] { (void)ishne::from_millivolts(std::nan(""), 2500); }, ishne::ErrorKind::InvalidRecord));

        ishne::Lead l = ishne::easy::make_lead_mv(ishne::LeadSpec::V1, 2500, {0.5, -0.25});
        CHECK(l.spec_code == 11);
        CHECK(l.quality() == ishne::LeadQuality::Good);
        CHECK(l.samples.size() == 2 && l.samples[0] == 200 && l.samples[1] == -100);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
