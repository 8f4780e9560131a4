#include "test_check.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>

static std::vector<std::uint8_t> slurp(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    CHECK(static_cast<bool>(f));
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

static void patch_bytes(const std::filesystem::path& p, std::streamoff pos, const std::vector<std::uint8_t>& bytes) {
    std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
    CHECK(static_cast<bool>(f));
    f.seekp(pos, std::ios::beg);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    CHECK(static_cast<bool>(f));
}

static void flip_one_byte(const std::filesystem::path& p, std::streamoff pos) {
    std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
    CHECK(static_cast<bool>(f));
    f.seekg(pos, std::ios::beg);
    char c;
    f.read(&c, 1);
    CHECK(static_cast<bool>(f));
    c ^= 0x01;
    f.seekp(pos, std::ios::beg);
    f.write(&c, 1);
    CHECK(static_cast<bool>(f));
}

int main() {
    std::filesystem::path tmp = temp_file("ishne_cpp_test.ecg");
    std::filesystem::path gz = temp_file("ishne_cpp_test.ecg.gz");

    ishne::Record rec = make_sample_record(3, 1000);
    rec.var_block = "file test";

    // Write + read back, plain file bytes equal encode()
    {
        ishne::write_file(tmp, rec);
        CHECK(slurp(tmp) == ishne::encode(rec));
        CHECK(ishne::read_file(tmp) == rec);
    }

    // Existing destination needs overwrite
    {
        CHECK(throws_kind([&] { ishne::write_file(tmp, rec); }, ishne::ErrorKind::AlreadyExists));

        ishne::Record other = make_sample_record(1, 10);
        ishne::WriteOptions wo;
        wo.overwrite = true;
        ishne::write_file(tmp, other, wo);
        CHECK(ishne::read_file(tmp) == other);
        ishne::write_file(tmp, rec, wo);
    }

    // A record that fails to encode leaves the destination alone
    {
        ishne::Record bad = rec;
        bad.leads[0].samples.pop_back();
        ishne::WriteOptions wo;
        wo.overwrite = true;
        CHECK(throws_kind([&] { ishne::write_file(tmp, bad, wo); }, ishne::ErrorKind::InvalidRecord));
        CHECK(ishne::read_file(tmp) == rec);
    }

    // Missing file
    {
        std::filesystem::path missing = temp_file("ishne_cpp_missing.ecg");
        CHECK(throws_kind([&] { (void)ishne::read_file(missing); }, ishne::ErrorKind::Io));
        CHECK(throws_kind([&] { ishne::HolterReader r(missing); }, ishne::ErrorKind::Io));
    }

    // Gzip output reads back transparently
    {
        ishne::WriteOptions wo;
        wo.gzip = true;
        wo.zlib_level = 9;
        ishne::write_file(gz, rec, wo);

        std::vector<std::uint8_t> raw = slurp(gz);
        CHECK(raw.size() > 2 && raw[0] == 0x1F && raw[1] == 0x8B);
        CHECK(ishne::read_file(gz) == rec);

        ishne::HolterReader reader(gz);
        CHECK(reader.compressed());
        CHECK(reader.layout().samples_per_lead == 1000u);
        CHECK(reader.read_lead(2) == rec.leads[2].samples);

        wo.overwrite = true;
        wo.zlib_level = 12;
        CHECK(throws_kind([&] { ishne::write_file(gz, rec, wo); }, ishne::ErrorKind::InvalidRecord));
    }

    // Lazy reads equal the eager decode
    {
        ishne::HolterReader reader(tmp);
        CHECK(!reader.compressed());
        CHECK(reader.lead_count() == 3);
        CHECK(reader.record().var_block == "file test");
        CHECK(reader.record().leads[0].samples.empty());
        CHECK(reader.layout().checksum_ok);
        CHECK(reader.layout().file_size == std::filesystem::file_size(tmp));

        for (std::size_t i = 0; i < reader.lead_count(); ++i) {
            CHECK(reader.read_lead(i) == rec.leads[i].samples);
        }
        CHECK(reader.load_samples() == rec);

        std::vector<double> mv = reader.read_lead_mv(1);
        CHECK(mv.size() == 1000);
        CHECK(std::fabs(mv[4] - (1004 * 2500) / 1e6) < 1e-9);

        CHECK(throws_kind([&] { (void)reader.read_lead(3); }, ishne::ErrorKind::LeadOutOfRange));
        CHECK(throws_kind([&] { (void)reader.read_lead_mv(7); }, ishne::ErrorKind::LeadOutOfRange));
    }

    // Lead without a usable resolution
    {
        ishne::Record r = make_sample_record(1, 5);
        r.leads[0].resolution_nv = -9;
        ishne::WriteOptions wo;
        wo.overwrite = true;
        ishne::write_file(tmp, r, wo);
        ishne::HolterReader reader(tmp);
        CHECK(reader.read_lead(0).size() == 5);
        CHECK(throws_kind([&] { (void)reader.read_lead_mv(0); }, ishne::ErrorKind::InvalidRecord));
        ishne::write_file(tmp, rec, wo);
    }

    // Corrupt header on disk: Strict throws, Report flags
    {
        flip_one_byte(tmp, 70);  // last_name
        CHECK(throws_kind([&] { (void)ishne::read_file(tmp); }, ishne::ErrorKind::ChecksumMismatch));
        CHECK(throws_kind([&] { ishne::HolterReader r(tmp); }, ishne::ErrorKind::ChecksumMismatch));

        ishne::ReadOptions ro;
        ro.checksum_policy = ishne::ChecksumPolicy::Report;
        ishne::HolterReader reader(tmp, ro);
        CHECK(!reader.layout().checksum_ok);
        CHECK(reader.record().first_name == "Ada");
        CHECK(reader.read_lead(0) == rec.leads[0].samples);
    }

    // Wider checksum scope through the reader
    {
        ishne::WriteOptions wo;
        wo.overwrite = true;
        wo.checksum_scope = ishne::ChecksumScope::HeaderAndData;
        ishne::write_file(tmp, rec, wo);

        ishne::ReadOptions ro;
        ro.checksum_scope = ishne::ChecksumScope::HeaderAndData;
        ishne::HolterReader ok(tmp, ro);
        CHECK(ok.layout().checksum_ok);

        flip_one_byte(tmp, static_cast<std::streamoff>(ok.layout().ecg_block_offset) + 100);
        CHECK(throws_kind([&] { ishne::HolterReader r(tmp, ro); }, ishne::ErrorKind::ChecksumMismatch));
        CHECK(throws_kind([&] { ishne::HolterReader r(tmp); }, ishne::ErrorKind::ChecksumMismatch));
    }

    // Sample block shorter than ecg_size declares
    {
        std::vector<std::uint8_t> bytes = ishne::encode(rec);
        bytes.resize(bytes.size() - 600);
        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        ishne::HolterReader reader(tmp);
        CHECK(!reader.layout().size_ok);
        CHECK(reader.layout().checksum_ok);
        CHECK(reader.layout().samples_per_lead == 900u);
        CHECK(reader.read_lead(1).size() == 900u);

        ishne::WriteOptions wo;
        wo.overwrite = true;
        ishne::write_file(tmp, rec, wo);
        CHECK(ishne::HolterReader(tmp).layout().size_ok);
    }

    // ECG offset far past the end of a small file fails without reading that much
    {
        ishne::WriteOptions wo;
        wo.overwrite = true;
        ishne::write_file(tmp, rec, wo);
        patch_bytes(tmp, 22, {0xFF, 0xFF, 0xFF, 0x7F});
        CHECK(throws_kind([&] { ishne::HolterReader r(tmp); }, ishne::ErrorKind::Truncated));
        CHECK(throws_kind([&] { (void)ishne::read_file(tmp); }, ishne::ErrorKind::Truncated));
    }

    // Annotation file: header through the reader, no samples
    {
        ishne::WriteOptions wo;
        wo.overwrite = true;
        ishne::write_file(tmp, rec, wo);
        patch_bytes(tmp, 0, {'A', 'N', 'N', ' ', ' ', '1', '.', '0'});
        ishne::HolterReader reader(tmp);
        CHECK(reader.layout().kind == ishne::FileKind::Annotation);
        CHECK(reader.record().var_block == "file test");
        CHECK(throws_kind([&] { (void)reader.read_lead(0); }, ishne::ErrorKind::InvalidRecord));
        CHECK(throws_kind([&] { (void)reader.load_samples(); }, ishne::ErrorKind::InvalidRecord));
        CHECK(throws_kind([&] { (void)ishne::read_file(tmp); }, ishne::ErrorKind::InvalidRecord));
    }

    // Truncated file
    {
        std::vector<std::uint8_t> bytes = ishne::encode(rec);
        bytes.resize(400);
        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        CHECK(throws_kind([&] { (void)ishne::read_file(tmp); }, ishne::ErrorKind::Truncated));
        CHECK(throws_kind([&] { ishne::HolterReader r(tmp); }, ishne::ErrorKind::Truncated));
    }

    std::filesystem::remove(tmp);
    std::filesystem::remove(gz);
    std::cout << "All tests passed.\n";
    return 0;
}
