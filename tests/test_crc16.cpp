#include "test_check.hpp"

#include <cstring>
#include <iostream>

int main() {
    // CRC-16/CCITT-FALSE check value
    {
        const char* s = "123456789";
        CHECK(ishne::crc16(reinterpret_cast<const std::uint8_t*>(s), std::strlen(s)) == 0x29B1);
        CHECK(ishne::crc16(nullptr, 0) == 0xFFFF);
    }

    // Continuing from a previous result equals one pass
    {
        const char* s = "123456789";
        const auto* p = reinterpret_cast<const std::uint8_t*>(s);
        std::uint16_t first = ishne::crc16(p, 4);
        CHECK(ishne::crc16(p + 4, 5, first) == 0x29B1);
    }

    // Header scope stops at the ECG block, the other scope does not
    {
        ishne::Record rec = make_sample_record(2, 10);
        std::vector<std::uint8_t> bytes = ishne::encode(rec);
        CHECK(ishne::validate(bytes));

        bytes.back() ^= 0x01;
        CHECK(ishne::validate(bytes, ishne::ChecksumScope::Header));
        CHECK(!ishne::validate(bytes, ishne::ChecksumScope::HeaderAndData));

        ishne::WriteOptions wo;
        wo.checksum_scope = ishne::ChecksumScope::HeaderAndData;
        std::vector<std::uint8_t> all = ishne::encode(rec, wo);
        CHECK(ishne::validate(all, ishne::ChecksumScope::HeaderAndData));
        all.back() ^= 0x01;
        CHECK(!ishne::validate(all, ishne::ChecksumScope::HeaderAndData));
    }

    // The checksum field itself is outside the region
    {
        std::vector<std::uint8_t> bytes = ishne::encode(make_sample_record(1, 4));
        std::uint16_t before = ishne::compute_checksum(bytes);
        bytes[ishne::kChecksumOffset] ^= 0xFF;
        CHECK(ishne::compute_checksum(bytes) == before);
        CHECK(!ishne::validate(bytes));
    }

    // Too short to hold a header
    {
        std::vector<std::uint8_t> tiny(100, 0);
        CHECK(throws_kind([&] { (void)ishne::compute_checksum(tiny); }, ishne::ErrorKind::Truncated));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
