#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace ishne {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    AlreadyExists,
    Truncated,
    BadMagic,
    InvalidHeader,
    ChecksumMismatch,
    InvalidRecord,
    LeadOutOfRange,
};

// Coarse grouping of ErrorKind: what a caller usually branches on.
enum class ErrorClass {
    Format,     // Truncated, BadMagic, InvalidHeader
    Integrity,  // ChecksumMismatch
    Value,      // InvalidRecord, LeadOutOfRange
    Io,         // Io, AlreadyExists
};

ErrorClass error_class(ErrorKind k) noexcept;
std::string to_string(ErrorKind k);

class IshneError : public std::runtime_error {
public:
    IshneError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Format constants
// ------------------------------

inline constexpr char kMagic[] = "ISHNE1.0";
inline constexpr char kAnnMagic[] = "ANN  1.0";   // annotation file sharing the same header
inline constexpr std::size_t kMagicSize = 8;
inline constexpr std::size_t kChecksumOffset = 8;
inline constexpr std::size_t kHeaderBlockOffset = 10;   // first byte covered by the checksum
inline constexpr std::size_t kFixedHeaderSize = 522;    // magic + checksum + fixed header
inline constexpr std::size_t kMaxLeads = 12;
inline constexpr std::int16_t kAbsentCode = -9;

// ------------------------------
// Code dictionaries
// ------------------------------

// Table 1 of the ISHNE Holter standard.
enum class LeadSpec {
    Absent,   // -9
    Unknown,  // 0
    Generic,
    X, Y, Z,
    I, II, III,
    aVR, aVL, aVF,
    V1, V2, V3, V4, V5, V6,
    ES, AS, AI,
    Unrecognized,
};

// Table 2 of the ISHNE Holter standard.
enum class LeadQuality {
    Absent,   // -9
    Unknown,  // 0
    Good,
    IntermittentNoise,
    FrequentNoise,
    IntermittentDisconnect,
    FrequentDisconnect,
    Unrecognized,
};

enum class Sex { Unknown, Male, Female, Unrecognized };

enum class Race { Unknown, White, Black, Oriental, Unrecognized };

enum class Pacemaker {
    Absent,  // -9
    None,
    UnknownType,
    SingleChamberUnipolar,
    DualChamberUnipolar,
    SingleChamberBipolar,
    DualChamberBipolar,
    Unrecognized,
};

enum class RecorderKind { Analog, Digital, Other };

LeadSpec lead_spec_from_code(std::int16_t code) noexcept;
LeadQuality lead_quality_from_code(std::int16_t code) noexcept;
Sex sex_from_code(std::int16_t code) noexcept;
Race race_from_code(std::int16_t code) noexcept;
Pacemaker pacemaker_from_code(std::int16_t code) noexcept;
RecorderKind recorder_kind_from_string(const std::string& s);

// Unrecognized has no code of its own: the raw value is kept by the record instead.
std::int16_t to_code(LeadSpec v);
std::int16_t to_code(LeadQuality v);
std::int16_t to_code(Sex v);
std::int16_t to_code(Race v);
std::int16_t to_code(Pacemaker v);

std::string to_string(LeadSpec v);
std::string to_string(LeadQuality v);
std::string to_string(Sex v);
std::string to_string(Race v);
std::string to_string(Pacemaker v);
std::string to_string(RecorderKind v);

// Case-insensitive name lookup; unknown names map to Unrecognized.
LeadSpec lead_spec_from_string(const std::string& s);
LeadQuality lead_quality_from_string(const std::string& s);

// ------------------------------
// Public data model
// ------------------------------

struct Date {
    int day{0};
    int month{0};
    int year{0};
};

struct TimeOfDay {
    int hour{0};
    int minute{0};
    int second{0};
};

bool is_valid(const Date& d) noexcept;
bool is_valid(const TimeOfDay& t) noexcept;

bool operator==(const Date& a, const Date& b) noexcept;
bool operator!=(const Date& a, const Date& b) noexcept;
bool operator==(const TimeOfDay& a, const TimeOfDay& b) noexcept;
bool operator!=(const TimeOfDay& a, const TimeOfDay& b) noexcept;

struct Lead {
    std::int16_t spec_code{0};
    std::int16_t quality_code{0};
    std::int16_t resolution_nv{0};

    // Raw ADC units, one value per sample index.
    std::vector<std::int16_t> samples{};

    LeadSpec spec() const noexcept;
    LeadQuality quality() const noexcept;
};

bool operator==(const Lead& a, const Lead& b);
bool operator!=(const Lead& a, const Lead& b);

struct Record {
    std::int16_t file_version{kAbsentCode};

    std::string first_name{};  // 40 bytes on disk
    std::string last_name{};   // 40 bytes on disk
    std::string id{};          // 20 bytes on disk

    std::int16_t sex_code{0};
    std::int16_t race_code{0};

    std::optional<Date> birth_date{};
    std::optional<Date> record_date{};
    std::optional<Date> file_date{};
    // Absent is stored as 00:00:00, so a recording started exactly at
    // midnight reads back with no start time.
    std::optional<TimeOfDay> start_time{};

    std::int16_t pacemaker_code{kAbsentCode};
    std::string recorder_type{};  // 40 bytes on disk
    std::int16_t sample_rate{0};  // Hz

    std::string proprietary{};  // 80 bytes on disk
    std::string copyright{};    // 80 bytes on disk
    std::string reserved{};     // 88 bytes on disk

    // Optional free text after the fixed header; empty means absent.
    std::string var_block{};

    std::vector<Lead> leads{};

    Sex sex() const noexcept;
    Race race() const noexcept;
    Pacemaker pacemaker() const noexcept;
    RecorderKind recorder_kind() const;
    std::size_t samples_per_lead() const noexcept;
};

bool operator==(const Record& a, const Record& b);
bool operator!=(const Record& a, const Record& b);

// ------------------------------
// Layout model
// ------------------------------

enum class FileKind {
    Ecg,         // "ISHNE1.0": header followed by samples
    Annotation,  // "ANN  1.0": header followed by beat annotations, not decoded
};

// On-disk framing of a decoded file, or of a file about to be encoded.
struct Layout {
    std::string magic{};
    FileKind kind{FileKind::Ecg};
    std::uint16_t checksum{0};  // stored value (decode) or stamped value (encode)

    std::int32_t var_block_size{0};
    std::int32_t ecg_size{0};
    std::int32_t var_block_offset{0};
    std::int32_t ecg_block_offset{0};
    std::int16_t nleads{0};

    std::uint64_t data_bytes{0};        // ecg_block_offset .. end of file
    std::uint64_t samples_per_lead{0};
    std::uint64_t trailing_bytes{0};    // odd byte / partial frame at the end, not decoded
    std::uint64_t file_size{0};

    bool checksum_ok{true};
    bool size_ok{true};  // sample block length matches ecg_size (per lead or total)
};

// ------------------------------
// Options
// ------------------------------

enum class ChecksumScope {
    Header,         // fixed header + variable block (bytes 10 .. ecg_block_offset)
    HeaderAndData,  // every byte after the checksum field
};

enum class ChecksumPolicy {
    Strict,  // mismatch throws ChecksumMismatch
    Report,  // mismatch is recorded in Layout::checksum_ok
};

enum class EcgSizeConvention {
    PerLead,  // ecg_size = samples in one lead
    Total,    // ecg_size = samples over all leads
};

struct ReadOptions {
    ChecksumPolicy checksum_policy{ChecksumPolicy::Strict};
    ChecksumScope checksum_scope{ChecksumScope::Header};
};

struct WriteOptions {
    ChecksumScope checksum_scope{ChecksumScope::Header};
    EcgSizeConvention ecg_size_convention{EcgSizeConvention::PerLead};
    bool truncate_text{false};    // clip over-long text fields instead of throwing
    bool stamp_file_date{false};  // write today's date as file_date
    bool overwrite{false};
    bool gzip{false};
    int zlib_level{6};  // 0..9
};

// ------------------------------
// Checksum
// ------------------------------

/// CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF). Pass a previous result as `crc` to continue.
std::uint16_t crc16(const std::uint8_t* data, std::size_t len, std::uint16_t crc = 0xFFFF) noexcept;

/// Checksum of an encoded file over the region selected by `scope`.
std::uint16_t compute_checksum(const std::vector<std::uint8_t>& file_bytes,
                               ChecksumScope scope = ChecksumScope::Header);

/// True when the stored checksum matches the recomputed one.
bool validate(const std::vector<std::uint8_t>& file_bytes,
              ChecksumScope scope = ChecksumScope::Header);

// ------------------------------
// Codec building blocks
// ------------------------------

/// Decode the 522-byte fixed header into `rec` (leads get metadata, no samples).
/// Accepts ECG and annotation files; see Layout::kind.
Layout decode_header(const std::uint8_t* data, std::size_t len, Record& rec);

/// Write magic, layout fields and every scalar of `rec` into `out` (kFixedHeaderSize bytes).
void encode_header(const Record& rec, const Layout& layout, const WriteOptions& opts, std::uint8_t* out);

/// Compute every size and offset of the encoded form of `rec` from its current content.
Layout plan_layout(const Record& rec, const WriteOptions& opts = WriteOptions{});

/// Time-interleave equal-length leads into little-endian int16 values.
std::vector<std::uint8_t> interleave(const std::vector<Lead>& leads);

/// Split an interleaved block into `leads` (their count decides the stride).
/// Returns the number of trailing bytes that did not form a whole frame.
std::size_t deinterleave(const std::uint8_t* data, std::size_t len, std::vector<Lead>& leads);

// ------------------------------
// Unit conversion
// ------------------------------

bool convertible(const Lead& lead) noexcept;
double to_millivolts(std::int16_t raw, std::int16_t resolution_nv);
std::vector<double> to_millivolts(const Lead& lead);
std::int16_t from_millivolts(double mv, std::int16_t resolution_nv);

// ------------------------------
// API
// ------------------------------

/// Decode header and variable block only. Samples stay empty.
std::tuple<Record, Layout> inspect(const std::vector<std::uint8_t>& bytes,
                                   const ReadOptions& opts = ReadOptions{});

/// Decode everything, samples included. Annotation files throw InvalidRecord.
Record decode(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts = ReadOptions{});

/// Encode `rec` into a complete file image with a fresh checksum.
std::vector<std::uint8_t> encode(const Record& rec, const WriteOptions& opts = WriteOptions{});

/// Read a plain or gzip-compressed ISHNE file completely.
Record read_file(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

/// Write `rec` to `file`. Throws AlreadyExists unless opts.overwrite is set.
void write_file(const std::filesystem::path& file,
                const Record& rec,
                const WriteOptions& opts = WriteOptions{});

// Two-phase access: the constructor reads header and variable block, samples
// are read from disk only when asked for. Every read opens its own stream.
class HolterReader {
public:
    explicit HolterReader(std::filesystem::path file, const ReadOptions& opts = ReadOptions{});

    const std::filesystem::path& path() const noexcept { return file_; }
    const Record& record() const noexcept { return record_; }
    const Layout& layout() const noexcept { return layout_; }
    std::size_t lead_count() const noexcept { return record_.leads.size(); }
    bool compressed() const noexcept { return compressed_; }

    std::vector<std::int16_t> read_lead(std::size_t lead) const;
    std::vector<double> read_lead_mv(std::size_t lead) const;

    /// Copy of record() with every lead's samples loaded.
    Record load_samples() const;

private:
    std::filesystem::path file_;
    Record record_;
    Layout layout_;
    bool compressed_{false};
};

} // namespace ishne
