#include "ishne/ishne.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <utility>

#include <zlib.h>

namespace ishne {

IshneError::IshneError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind IshneError::kind() const noexcept { return kind_; }

ErrorClass error_class(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::Truncated:
        case ErrorKind::BadMagic:
        case ErrorKind::InvalidHeader: return ErrorClass::Format;
        case ErrorKind::ChecksumMismatch: return ErrorClass::Integrity;
        case ErrorKind::InvalidRecord:
        case ErrorKind::LeadOutOfRange: return ErrorClass::Value;
        case ErrorKind::Io:
        case ErrorKind::AlreadyExists: return ErrorClass::Io;
    }
    return ErrorClass::Io;
}

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::AlreadyExists: return "already-exists";
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::BadMagic: return "bad-magic";
        case ErrorKind::InvalidHeader: return "invalid-header";
        case ErrorKind::ChecksumMismatch: return "checksum-mismatch";
        case ErrorKind::InvalidRecord: return "invalid-record";
        case ErrorKind::LeadOutOfRange: return "lead-out-of-range";
    }
    return "unknown";
}

// ------------------------------
// Field table
// ------------------------------

static constexpr std::size_t kOffVarBlockSize   = 10;
static constexpr std::size_t kOffEcgSize        = 14;
static constexpr std::size_t kOffVarBlockOffset = 18;
static constexpr std::size_t kOffEcgBlockOffset = 22;
static constexpr std::size_t kOffFileVersion    = 26;
static constexpr std::size_t kOffFirstName      = 28;
static constexpr std::size_t kOffLastName       = 68;
static constexpr std::size_t kOffId             = 108;
static constexpr std::size_t kOffSex            = 128;
static constexpr std::size_t kOffRace           = 130;
static constexpr std::size_t kOffBirthDate      = 132;
static constexpr std::size_t kOffRecordDate     = 138;
static constexpr std::size_t kOffFileDate       = 144;
static constexpr std::size_t kOffStartTime      = 150;
static constexpr std::size_t kOffNleads         = 156;
static constexpr std::size_t kOffLeadSpec       = 158;
static constexpr std::size_t kOffLeadQuality    = 182;
static constexpr std::size_t kOffResolution     = 206;
static constexpr std::size_t kOffPacemaker      = 230;
static constexpr std::size_t kOffRecorderType   = 232;
static constexpr std::size_t kOffSampleRate     = 272;
static constexpr std::size_t kOffProprietary    = 274;
static constexpr std::size_t kOffCopyright      = 354;
static constexpr std::size_t kOffReserved       = 434;

struct TextField {
    std::size_t offset;
    std::size_t width;
    const char* name;
};

static constexpr TextField kFirstName{kOffFirstName, 40, "first_name"};
static constexpr TextField kLastName{kOffLastName, 40, "last_name"};
static constexpr TextField kId{kOffId, 20, "id"};
static constexpr TextField kRecorderType{kOffRecorderType, 40, "recorder_type"};
static constexpr TextField kProprietary{kOffProprietary, 80, "proprietary"};
static constexpr TextField kCopyright{kOffCopyright, 80, "copyright"};
static constexpr TextField kReserved{kOffReserved, 88, "reserved"};

static constexpr std::size_t kIoChunk = 64u * 1024u;

// ------------------------------
// Little-endian helpers
// ------------------------------

static std::uint16_t read_u16_le_from(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (static_cast<std::uint16_t>(p[1]) << 8));
}

static std::int16_t read_i16_le_from(const std::uint8_t* p) {
    return static_cast<std::int16_t>(read_u16_le_from(p));
}

static std::int32_t read_i32_le_from(const std::uint8_t* p) {
    const std::uint32_t v = static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
                            (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    return static_cast<std::int32_t>(v);
}

static void write_u16_le_to(std::uint8_t* p, std::uint16_t v) {
    p[0] = static_cast<std::uint8_t>(v & 0xFFu);
    p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
}

static void write_i16_le_to(std::uint8_t* p, std::int16_t v) {
    write_u16_le_to(p, static_cast<std::uint16_t>(v));
}

static void write_i32_le_to(std::uint8_t* p, std::int32_t v) {
    const std::uint32_t u = static_cast<std::uint32_t>(v);
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<std::uint8_t>((u >> (8 * i)) & 0xFFu);
    }
}

static bool checked_mul_u64(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (a != 0 && b > (std::numeric_limits<std::uint64_t>::max)() / a) return false;
    out = a * b;
    return true;
}

static std::string upper_hex4(std::uint16_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << v;
    return oss.str();
}

static std::string printable(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(std::isprint(c) ? static_cast<char>(c) : '.');
    }
    return out;
}

static std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// ------------------------------
// Code dictionaries
// ------------------------------

template <typename E>
struct CodeEntry {
    E value;
    std::int16_t code;
    const char* name;
};

static constexpr CodeEntry<LeadSpec> kLeadSpecs[] = {
    {LeadSpec::Absent, -9, "absent"},
    {LeadSpec::Unknown, 0, "unknown"},
    {LeadSpec::Generic, 1, "generic"},
    {LeadSpec::X, 2, "X"},
    {LeadSpec::Y, 3, "Y"},
    {LeadSpec::Z, 4, "Z"},
    {LeadSpec::I, 5, "I"},
    {LeadSpec::II, 6, "II"},
    {LeadSpec::III, 7, "III"},
    {LeadSpec::aVR, 8, "aVR"},
    {LeadSpec::aVL, 9, "aVL"},
    {LeadSpec::aVF, 10, "aVF"},
    {LeadSpec::V1, 11, "V1"},
    {LeadSpec::V2, 12, "V2"},
    {LeadSpec::V3, 13, "V3"},
    {LeadSpec::V4, 14, "V4"},
    {LeadSpec::V5, 15, "V5"},
    {LeadSpec::V6, 16, "V6"},
    {LeadSpec::ES, 17, "ES"},
    {LeadSpec::AS, 18, "AS"},
    {LeadSpec::AI, 19, "AI"},
};

static constexpr CodeEntry<LeadQuality> kLeadQualities[] = {
    {LeadQuality::Absent, -9, "absent"},
    {LeadQuality::Unknown, 0, "unknown"},
    {LeadQuality::Good, 1, "good"},
    {LeadQuality::IntermittentNoise, 2, "intermittent noise"},
    {LeadQuality::FrequentNoise, 3, "frequent noise"},
    {LeadQuality::IntermittentDisconnect, 4, "intermittent disconnect"},
    {LeadQuality::FrequentDisconnect, 5, "frequent disconnect"},
};

static constexpr CodeEntry<Sex> kSexes[] = {
    {Sex::Unknown, 0, "unknown"},
    {Sex::Male, 1, "male"},
    {Sex::Female, 2, "female"},
};

// Codes 4+ show up in some files but were never defined.
static constexpr CodeEntry<Race> kRaces[] = {
    {Race::Unknown, 0, "unknown"},
    {Race::White, 1, "white"},
    {Race::Black, 2, "black"},
    {Race::Oriental, 3, "oriental"},
};

static constexpr CodeEntry<Pacemaker> kPacemakers[] = {
    {Pacemaker::Absent, -9, "absent"},
    {Pacemaker::None, 0, "none"},
    {Pacemaker::UnknownType, 1, "unknown type"},
    {Pacemaker::SingleChamberUnipolar, 2, "single chamber unipolar"},
    {Pacemaker::DualChamberUnipolar, 3, "dual chamber unipolar"},
    {Pacemaker::SingleChamberBipolar, 4, "single chamber bipolar"},
    {Pacemaker::DualChamberBipolar, 5, "dual chamber bipolar"},
};

template <typename E, std::size_t N>
static E from_code(const CodeEntry<E> (&table)[N], std::int16_t code, E unrecognized) noexcept {
    for (const auto& e : table) {
        if (e.code == code) return e.value;
    }
    return unrecognized;
}

template <typename E, std::size_t N>
static std::int16_t code_of(const CodeEntry<E> (&table)[N], E v, const char* what) {
    for (const auto& e : table) {
        if (e.value == v) return e.code;
    }
    throw IshneError(ErrorKind::InvalidRecord, std::string("unrecognized ") + what + " has no code; keep the raw value instead");
}

template <typename E, std::size_t N>
static std::string name_of(const CodeEntry<E> (&table)[N], E v) {
    for (const auto& e : table) {
        if (e.value == v) return e.name;
    }
    return "unrecognized";
}

template <typename E, std::size_t N>
static E from_name(const CodeEntry<E> (&table)[N], const std::string& s, E unrecognized) {
    const std::string key = lower(s);
    for (const auto& e : table) {
        if (lower(e.name) == key) return e.value;
    }
    return unrecognized;
}

LeadSpec lead_spec_from_code(std::int16_t code) noexcept { return from_code(kLeadSpecs, code, LeadSpec::Unrecognized); }
LeadQuality lead_quality_from_code(std::int16_t code) noexcept { return from_code(kLeadQualities, code, LeadQuality::Unrecognized); }
Sex sex_from_code(std::int16_t code) noexcept { return from_code(kSexes, code, Sex::Unrecognized); }
Race race_from_code(std::int16_t code) noexcept { return from_code(kRaces, code, Race::Unrecognized); }
Pacemaker pacemaker_from_code(std::int16_t code) noexcept { return from_code(kPacemakers, code, Pacemaker::Unrecognized); }

RecorderKind recorder_kind_from_string(const std::string& s) {
    const std::string key = lower(s);
    if (key == "analog") return RecorderKind::Analog;
    if (key == "digital") return RecorderKind::Digital;
    return RecorderKind::Other;
}

std::int16_t to_code(LeadSpec v) { return code_of(kLeadSpecs, v, "lead spec"); }
std::int16_t to_code(LeadQuality v) { return code_of(kLeadQualities, v, "lead quality"); }
std::int16_t to_code(Sex v) { return code_of(kSexes, v, "sex"); }
std::int16_t to_code(Race v) { return code_of(kRaces, v, "race"); }
std::int16_t to_code(Pacemaker v) { return code_of(kPacemakers, v, "pacemaker"); }

std::string to_string(LeadSpec v) { return name_of(kLeadSpecs, v); }
std::string to_string(LeadQuality v) { return name_of(kLeadQualities, v); }
std::string to_string(Sex v) { return name_of(kSexes, v); }
std::string to_string(Race v) { return name_of(kRaces, v); }
std::string to_string(Pacemaker v) { return name_of(kPacemakers, v); }

std::string to_string(RecorderKind v) {
    switch (v) {
        case RecorderKind::Analog: return "analog";
        case RecorderKind::Digital: return "digital";
        case RecorderKind::Other: return "other";
    }
    return "other";
}

LeadSpec lead_spec_from_string(const std::string& s) { return from_name(kLeadSpecs, s, LeadSpec::Unrecognized); }
LeadQuality lead_quality_from_string(const std::string& s) { return from_name(kLeadQualities, s, LeadQuality::Unrecognized); }

// ------------------------------
// Data model
// ------------------------------

static bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool is_valid(const Date& d) noexcept {
    static constexpr int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (d.year < 1 || d.year > 9999) return false;
    if (d.month < 1 || d.month > 12) return false;
    int days = kDaysInMonth[d.month - 1];
    if (d.month == 2 && is_leap_year(d.year)) days = 29;
    return d.day >= 1 && d.day <= days;
}

bool is_valid(const TimeOfDay& t) noexcept {
    return t.hour >= 0 && t.hour <= 23 && t.minute >= 0 && t.minute <= 59 && t.second >= 0 && t.second <= 59;
}

bool operator==(const Date& a, const Date& b) noexcept {
    return a.day == b.day && a.month == b.month && a.year == b.year;
}
bool operator!=(const Date& a, const Date& b) noexcept { return !(a == b); }

bool operator==(const TimeOfDay& a, const TimeOfDay& b) noexcept {
    return a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}
bool operator!=(const TimeOfDay& a, const TimeOfDay& b) noexcept { return !(a == b); }

LeadSpec Lead::spec() const noexcept { return lead_spec_from_code(spec_code); }
LeadQuality Lead::quality() const noexcept { return lead_quality_from_code(quality_code); }

bool operator==(const Lead& a, const Lead& b) {
    return a.spec_code == b.spec_code && a.quality_code == b.quality_code &&
           a.resolution_nv == b.resolution_nv && a.samples == b.samples;
}
bool operator!=(const Lead& a, const Lead& b) { return !(a == b); }

Sex Record::sex() const noexcept { return sex_from_code(sex_code); }
Race Record::race() const noexcept { return race_from_code(race_code); }
Pacemaker Record::pacemaker() const noexcept { return pacemaker_from_code(pacemaker_code); }
RecorderKind Record::recorder_kind() const { return recorder_kind_from_string(recorder_type); }

std::size_t Record::samples_per_lead() const noexcept {
    return leads.empty() ? 0 : leads.front().samples.size();
}

bool operator==(const Record& a, const Record& b) {
    return a.file_version == b.file_version &&
           a.first_name == b.first_name && a.last_name == b.last_name && a.id == b.id &&
           a.sex_code == b.sex_code && a.race_code == b.race_code &&
           a.birth_date == b.birth_date && a.record_date == b.record_date &&
           a.file_date == b.file_date && a.start_time == b.start_time &&
           a.pacemaker_code == b.pacemaker_code && a.recorder_type == b.recorder_type &&
           a.sample_rate == b.sample_rate &&
           a.proprietary == b.proprietary && a.copyright == b.copyright && a.reserved == b.reserved &&
           a.var_block == b.var_block && a.leads == b.leads;
}
bool operator!=(const Record& a, const Record& b) { return !(a == b); }

// ------------------------------
// Field codecs
// ------------------------------

// Trailing NUL/space padding is dropped; everything before it is kept as-is.
static std::string read_text(const std::uint8_t* header, const TextField& f) {
    const char* p = reinterpret_cast<const char*>(header + f.offset);
    std::size_t n = f.width;
    while (n > 0 && (p[n - 1] == '\0' || p[n - 1] == ' ')) --n;
    return std::string(p, n);
}

static void write_text(std::uint8_t* header, const TextField& f, const std::string& s, bool truncate) {
    if (s.size() > f.width && !truncate) {
        std::ostringstream oss;
        oss << f.name << " is " << s.size() << " bytes, the field at offset " << f.offset << " holds " << f.width;
        throw IshneError(ErrorKind::InvalidRecord, oss.str());
    }
    std::memcpy(header + f.offset, s.data(), std::min(s.size(), f.width));
}

static std::optional<Date> read_date(const std::uint8_t* header, std::size_t off) {
    Date d;
    d.day = read_i16_le_from(header + off);
    d.month = read_i16_le_from(header + off + 2);
    d.year = read_i16_le_from(header + off + 4);
    if (!is_valid(d)) return std::nullopt;  // 0/0/0, -9/-9/-9 and garbage alike
    return d;
}

static std::optional<TimeOfDay> read_time(const std::uint8_t* header, std::size_t off) {
    TimeOfDay t;
    t.hour = read_i16_le_from(header + off);
    t.minute = read_i16_le_from(header + off + 2);
    t.second = read_i16_le_from(header + off + 4);
    // Absent times are stored as zeros, so 00:00:00 reads back as absent too.
    if (t == TimeOfDay{} || !is_valid(t)) return std::nullopt;
    return t;
}

static void write_date(std::uint8_t* header, std::size_t off, const std::optional<Date>& d, const char* name) {
    if (!d) return;  // absent stays 0/0/0
    if (!is_valid(*d)) {
        std::ostringstream oss;
        oss << name << " " << d->day << "/" << d->month << "/" << d->year << " is not a calendar date";
        throw IshneError(ErrorKind::InvalidRecord, oss.str());
    }
    write_i16_le_to(header + off, static_cast<std::int16_t>(d->day));
    write_i16_le_to(header + off + 2, static_cast<std::int16_t>(d->month));
    write_i16_le_to(header + off + 4, static_cast<std::int16_t>(d->year));
}

static void write_time(std::uint8_t* header, std::size_t off, const std::optional<TimeOfDay>& t, const char* name) {
    if (!t) return;
    if (!is_valid(*t)) {
        std::ostringstream oss;
        oss << name << " " << t->hour << ":" << t->minute << ":" << t->second << " is not a time of day";
        throw IshneError(ErrorKind::InvalidRecord, oss.str());
    }
    write_i16_le_to(header + off, static_cast<std::int16_t>(t->hour));
    write_i16_le_to(header + off + 2, static_cast<std::int16_t>(t->minute));
    write_i16_le_to(header + off + 4, static_cast<std::int16_t>(t->second));
}

static Date today() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    return Date{tm.tm_mday, tm.tm_mon + 1, tm.tm_year + 1900};
}

// ------------------------------
// Checksum
// ------------------------------

std::uint16_t crc16(const std::uint8_t* data, std::size_t len, std::uint16_t crc) noexcept {
    for (std::size_t i = 0; i < len; ++i) {
        crc = static_cast<std::uint16_t>(crc ^ (static_cast<std::uint16_t>(data[i]) << 8));
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000u) {
                crc = static_cast<std::uint16_t>((crc << 1) ^ 0x1021u);
            } else {
                crc = static_cast<std::uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

// [begin, end) of the checksummed bytes in a file of `size` bytes.
static std::pair<std::size_t, std::size_t> checksum_region(std::size_t size, std::int32_t ecg_block_offset, ChecksumScope scope) {
    if (scope == ChecksumScope::HeaderAndData) {
        return {kHeaderBlockOffset, size};
    }
    std::size_t end = kFixedHeaderSize;
    if (ecg_block_offset > static_cast<std::int32_t>(kFixedHeaderSize)) {
        end = std::min(static_cast<std::size_t>(ecg_block_offset), size);
    }
    return {kHeaderBlockOffset, end};
}

std::uint16_t compute_checksum(const std::vector<std::uint8_t>& file_bytes, ChecksumScope scope) {
    if (file_bytes.size() < kFixedHeaderSize) {
        throw IshneError(ErrorKind::Truncated, "buffer too small to hold an ISHNE header");
    }
    auto [begin, end] = checksum_region(file_bytes.size(), read_i32_le_from(file_bytes.data() + kOffEcgBlockOffset), scope);
    return crc16(file_bytes.data() + begin, end - begin);
}

bool validate(const std::vector<std::uint8_t>& file_bytes, ChecksumScope scope) {
    std::uint16_t computed = compute_checksum(file_bytes, scope);
    return computed == read_u16_le_from(file_bytes.data() + kChecksumOffset);
}

static void apply_checksum_policy(Layout& layout, std::uint16_t computed, const ReadOptions& opts) {
    layout.checksum_ok = (computed == layout.checksum);
    if (!layout.checksum_ok && opts.checksum_policy == ChecksumPolicy::Strict) {
        std::ostringstream oss;
        oss << "checksum mismatch: stored " << upper_hex4(layout.checksum) << ", computed " << upper_hex4(computed);
        throw IshneError(ErrorKind::ChecksumMismatch, oss.str());
    }
}

// ------------------------------
// Header codec
// ------------------------------

Layout decode_header(const std::uint8_t* data, std::size_t len, Record& rec) {
    if (len < kFixedHeaderSize) {
        std::ostringstream oss;
        oss << "file is too small to be an ISHNE Holter: " << len << " bytes, fixed header needs " << kFixedHeaderSize;
        throw IshneError(ErrorKind::Truncated, oss.str());
    }

    Layout layout;
    layout.magic.assign(reinterpret_cast<const char*>(data), kMagicSize);
    if (layout.magic == std::string(kMagic, kMagicSize)) {
        layout.kind = FileKind::Ecg;
    } else if (layout.magic == std::string(kAnnMagic, kMagicSize)) {
        layout.kind = FileKind::Annotation;
    } else {
        throw IshneError(ErrorKind::BadMagic, "bad magic: '" + printable(layout.magic) + "'");
    }

    layout.checksum = read_u16_le_from(data + kChecksumOffset);
    layout.var_block_size = read_i32_le_from(data + kOffVarBlockSize);
    layout.ecg_size = read_i32_le_from(data + kOffEcgSize);
    layout.var_block_offset = read_i32_le_from(data + kOffVarBlockOffset);
    layout.ecg_block_offset = read_i32_le_from(data + kOffEcgBlockOffset);
    layout.nleads = read_i16_le_from(data + kOffNleads);

    if (layout.nleads < 1 || layout.nleads > static_cast<std::int16_t>(kMaxLeads)) {
        std::ostringstream oss;
        oss << "nleads at offset " << kOffNleads << " is " << layout.nleads << ", expected 1.." << kMaxLeads;
        throw IshneError(ErrorKind::InvalidHeader, oss.str());
    }
    if (layout.var_block_size < 0) {
        std::ostringstream oss;
        oss << "variable block size at offset " << kOffVarBlockSize << " is negative (" << layout.var_block_size << ")";
        throw IshneError(ErrorKind::InvalidHeader, oss.str());
    }
    if (layout.ecg_block_offset < static_cast<std::int32_t>(kFixedHeaderSize)) {
        std::ostringstream oss;
        oss << "ECG block offset " << layout.ecg_block_offset << " points inside the fixed header";
        throw IshneError(ErrorKind::InvalidHeader, oss.str());
    }
    if (layout.var_block_size > 0) {
        const std::int64_t var_end = static_cast<std::int64_t>(layout.var_block_offset) + layout.var_block_size;
        if (layout.var_block_offset < static_cast<std::int32_t>(kFixedHeaderSize) || var_end > layout.ecg_block_offset) {
            std::ostringstream oss;
            oss << "variable block [" << layout.var_block_offset << ", " << var_end
                << ") does not lie between the fixed header and the ECG block at " << layout.ecg_block_offset;
            throw IshneError(ErrorKind::InvalidHeader, oss.str());
        }
    }

    rec = Record{};
    rec.file_version = read_i16_le_from(data + kOffFileVersion);
    rec.first_name = read_text(data, kFirstName);
    rec.last_name = read_text(data, kLastName);
    rec.id = read_text(data, kId);
    rec.sex_code = read_i16_le_from(data + kOffSex);
    rec.race_code = read_i16_le_from(data + kOffRace);
    rec.birth_date = read_date(data, kOffBirthDate);
    rec.record_date = read_date(data, kOffRecordDate);
    rec.file_date = read_date(data, kOffFileDate);
    rec.start_time = read_time(data, kOffStartTime);
    rec.pacemaker_code = read_i16_le_from(data + kOffPacemaker);
    rec.recorder_type = read_text(data, kRecorderType);
    rec.sample_rate = read_i16_le_from(data + kOffSampleRate);
    rec.proprietary = read_text(data, kProprietary);
    rec.copyright = read_text(data, kCopyright);
    rec.reserved = read_text(data, kReserved);

    rec.leads.resize(static_cast<std::size_t>(layout.nleads));
    for (std::size_t i = 0; i < rec.leads.size(); ++i) {
        Lead& l = rec.leads[i];
        l.spec_code = read_i16_le_from(data + kOffLeadSpec + 2 * i);
        l.quality_code = read_i16_le_from(data + kOffLeadQuality + 2 * i);
        l.resolution_nv = read_i16_le_from(data + kOffResolution + 2 * i);
    }

    return layout;
}

void encode_header(const Record& rec, const Layout& layout, const WriteOptions& opts, std::uint8_t* out) {
    if (rec.leads.size() != static_cast<std::size_t>(layout.nleads)) {
        std::ostringstream oss;
        oss << "layout was planned for " << layout.nleads << " leads, record has " << rec.leads.size();
        throw IshneError(ErrorKind::InvalidRecord, oss.str());
    }

    std::memset(out, 0, kFixedHeaderSize);
    std::memcpy(out, kMagic, kMagicSize);
    write_u16_le_to(out + kChecksumOffset, layout.checksum);

    write_i32_le_to(out + kOffVarBlockSize, layout.var_block_size);
    write_i32_le_to(out + kOffEcgSize, layout.ecg_size);
    write_i32_le_to(out + kOffVarBlockOffset, layout.var_block_offset);
    write_i32_le_to(out + kOffEcgBlockOffset, layout.ecg_block_offset);
    write_i16_le_to(out + kOffFileVersion, rec.file_version);

    write_text(out, kFirstName, rec.first_name, opts.truncate_text);
    write_text(out, kLastName, rec.last_name, opts.truncate_text);
    write_text(out, kId, rec.id, opts.truncate_text);

    write_i16_le_to(out + kOffSex, rec.sex_code);
    write_i16_le_to(out + kOffRace, rec.race_code);
    write_date(out, kOffBirthDate, rec.birth_date, "birth_date");
    write_date(out, kOffRecordDate, rec.record_date, "record_date");
    write_date(out, kOffFileDate, opts.stamp_file_date ? std::optional<Date>(today()) : rec.file_date, "file_date");
    write_time(out, kOffStartTime, rec.start_time, "start_time");

    write_i16_le_to(out + kOffNleads, layout.nleads);
    for (std::size_t i = 0; i < kMaxLeads; ++i) {
        const bool used = i < rec.leads.size();
        write_i16_le_to(out + kOffLeadSpec + 2 * i, used ? rec.leads[i].spec_code : kAbsentCode);
        write_i16_le_to(out + kOffLeadQuality + 2 * i, used ? rec.leads[i].quality_code : kAbsentCode);
        write_i16_le_to(out + kOffResolution + 2 * i, used ? rec.leads[i].resolution_nv : kAbsentCode);
    }

    write_i16_le_to(out + kOffPacemaker, rec.pacemaker_code);
    write_text(out, kRecorderType, rec.recorder_type, opts.truncate_text);
    write_i16_le_to(out + kOffSampleRate, rec.sample_rate);
    write_text(out, kProprietary, rec.proprietary, opts.truncate_text);
    write_text(out, kCopyright, rec.copyright, opts.truncate_text);
    write_text(out, kReserved, rec.reserved, opts.truncate_text);
}

// ------------------------------
// Variable block
// ------------------------------

static std::string decode_var_block(const std::uint8_t* data, std::size_t len, const Layout& layout) {
    if (layout.var_block_size == 0) return {};
    const std::size_t begin = static_cast<std::size_t>(layout.var_block_offset);
    const std::size_t n = static_cast<std::size_t>(layout.var_block_size);
    if (begin + n > len) {
        throw IshneError(ErrorKind::Truncated, "file ends inside the variable block");
    }
    const char* p = reinterpret_cast<const char*>(data + begin);
    std::size_t keep = n;
    while (keep > 0 && p[keep - 1] == '\0') --keep;
    return std::string(p, keep);
}

// ------------------------------
// Sample codec
// ------------------------------

static void finish_layout(Layout& layout) {
    const std::uint64_t frame = 2ull * static_cast<std::uint64_t>(layout.nleads);
    layout.samples_per_lead = layout.data_bytes / frame;
    layout.trailing_bytes = layout.data_bytes - layout.samples_per_lead * frame;

    // Writers disagree on whether ecg_size counts one lead or all of them; accept either.
    layout.size_ok = true;
    if (layout.kind == FileKind::Ecg) {
        const std::uint64_t declared = layout.ecg_size < 0 ? 0 : static_cast<std::uint64_t>(layout.ecg_size);
        layout.size_ok = layout.ecg_size >= 0 &&
                         (layout.data_bytes == declared * frame || layout.data_bytes == 2 * declared);
    }
}

static void require_ecg(const Layout& layout) {
    if (layout.kind != FileKind::Ecg) {
        throw IshneError(ErrorKind::InvalidRecord,
                         "'" + printable(layout.magic) + "' is an annotation file and carries no ECG samples");
    }
}

// Copy `frames` interleaved frames starting at sample index `t0` into the leads.
static void scatter_frames(const std::uint8_t* data, std::size_t frames, std::size_t t0, std::vector<Lead>& leads) {
    const std::size_t n = leads.size();
    for (std::size_t t = 0; t < frames; ++t) {
        const std::uint8_t* frame = data + 2 * n * t;
        for (std::size_t i = 0; i < n; ++i) {
            leads[i].samples[t0 + t] = read_i16_le_from(frame + 2 * i);
        }
    }
}

static void interleave_into(const std::vector<Lead>& leads, std::uint8_t* out) {
    const std::size_t n = leads.size();
    const std::size_t spl = leads.empty() ? 0 : leads.front().samples.size();
    for (std::size_t t = 0; t < spl; ++t) {
        for (std::size_t i = 0; i < n; ++i) {
            write_i16_le_to(out, leads[i].samples[t]);
            out += 2;
        }
    }
}

Layout plan_layout(const Record& rec, const WriteOptions& opts) {
    const std::size_t n = rec.leads.size();
    if (n < 1 || n > kMaxLeads) {
        std::ostringstream oss;
        oss << "record has " << n << " leads, an ISHNE file holds 1.." << kMaxLeads;
        throw IshneError(ErrorKind::InvalidRecord, oss.str());
    }
    const std::size_t spl = rec.leads.front().samples.size();
    for (std::size_t i = 1; i < n; ++i) {
        if (rec.leads[i].samples.size() != spl) {
            std::ostringstream oss;
            oss << "lead " << i << " has " << rec.leads[i].samples.size() << " samples, lead 0 has " << spl
                << "; every lead must have the same length";
            throw IshneError(ErrorKind::InvalidRecord, oss.str());
        }
    }

    constexpr std::uint64_t kInt32Max = static_cast<std::uint64_t>((std::numeric_limits<std::int32_t>::max)());
    if (rec.var_block.size() > kInt32Max - kFixedHeaderSize) {
        throw IshneError(ErrorKind::InvalidRecord, "variable block too large for the 32-bit offset fields");
    }

    std::uint64_t total_samples = 0;
    std::uint64_t data_bytes = 0;
    if (!checked_mul_u64(spl, n, total_samples) || !checked_mul_u64(total_samples, 2, data_bytes)) {
        throw IshneError(ErrorKind::InvalidRecord, "sample block size overflow");
    }
    const std::uint64_t ecg_size = opts.ecg_size_convention == EcgSizeConvention::PerLead ? spl : total_samples;
    if (ecg_size > kInt32Max) {
        throw IshneError(ErrorKind::InvalidRecord, "sample count does not fit the 32-bit ecg_size field");
    }

    Layout layout;
    layout.magic.assign(kMagic, kMagicSize);
    layout.checksum = 0;
    layout.var_block_size = static_cast<std::int32_t>(rec.var_block.size());
    layout.ecg_size = static_cast<std::int32_t>(ecg_size);
    layout.var_block_offset = static_cast<std::int32_t>(kFixedHeaderSize);
    layout.ecg_block_offset = static_cast<std::int32_t>(kFixedHeaderSize + rec.var_block.size());
    layout.nleads = static_cast<std::int16_t>(n);
    layout.data_bytes = data_bytes;
    layout.samples_per_lead = spl;
    layout.trailing_bytes = 0;
    layout.file_size = static_cast<std::uint64_t>(layout.ecg_block_offset) + data_bytes;
    layout.checksum_ok = true;
    return layout;
}

std::vector<std::uint8_t> interleave(const std::vector<Lead>& leads) {
    Record shape;
    shape.leads.resize(leads.size());
    for (std::size_t i = 0; i < leads.size(); ++i) {
        shape.leads[i].samples.resize(leads[i].samples.size());
    }
    const Layout layout = plan_layout(shape);  // count and length checks only

    std::vector<std::uint8_t> out(static_cast<std::size_t>(layout.data_bytes));
    interleave_into(leads, out.data());
    return out;
}

std::size_t deinterleave(const std::uint8_t* data, std::size_t len, std::vector<Lead>& leads) {
    if (leads.empty()) {
        throw IshneError(ErrorKind::InvalidRecord, "cannot de-interleave into zero leads");
    }
    const std::size_t frame = 2 * leads.size();
    const std::size_t spl = len / frame;
    for (auto& l : leads) l.samples.assign(spl, 0);
    scatter_frames(data, spl, 0, leads);
    return len - spl * frame;
}

// ------------------------------
// Unit conversion
// ------------------------------

bool convertible(const Lead& lead) noexcept { return lead.resolution_nv > 0; }

static void require_resolution(std::int16_t resolution_nv) {
    if (resolution_nv <= 0) {
        throw IshneError(ErrorKind::InvalidRecord,
                         "amplitude resolution " + std::to_string(resolution_nv) + " nV has no millivolt scale");
    }
}

double to_millivolts(std::int16_t raw, std::int16_t resolution_nv) {
    require_resolution(resolution_nv);
    return static_cast<double>(raw) * static_cast<double>(resolution_nv) / 1e6;
}

std::vector<double> to_millivolts(const Lead& lead) {
    require_resolution(lead.resolution_nv);
    std::vector<double> out;
    out.reserve(lead.samples.size());
    const double scale = static_cast<double>(lead.resolution_nv) / 1e6;
    for (std::int16_t v : lead.samples) out.push_back(static_cast<double>(v) * scale);
    return out;
}

std::int16_t from_millivolts(double mv, std::int16_t resolution_nv) {
    require_resolution(resolution_nv);
    if (std::isnan(mv)) {
        throw IshneError(ErrorKind::InvalidRecord, "cannot store NaN as a sample");
    }
    double raw = std::round(mv * 1e6 / static_cast<double>(resolution_nv));
    raw = std::clamp(raw,
                     static_cast<double>((std::numeric_limits<std::int16_t>::min)()),
                     static_cast<double>((std::numeric_limits<std::int16_t>::max)()));
    return static_cast<std::int16_t>(raw);
}

// ------------------------------
// Buffer API
// ------------------------------

std::tuple<Record, Layout> inspect(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts) {
    Record rec;
    Layout layout = decode_header(bytes.data(), bytes.size(), rec);
    layout.file_size = bytes.size();

    if (static_cast<std::uint64_t>(layout.ecg_block_offset) > layout.file_size) {
        std::ostringstream oss;
        oss << "ECG block offset " << layout.ecg_block_offset << " lies beyond the end of the file (" << layout.file_size << " bytes)";
        throw IshneError(ErrorKind::Truncated, oss.str());
    }
    rec.var_block = decode_var_block(bytes.data(), bytes.size(), layout);

    layout.data_bytes = layout.file_size - static_cast<std::uint64_t>(layout.ecg_block_offset);
    finish_layout(layout);

    apply_checksum_policy(layout, compute_checksum(bytes, opts.checksum_scope), opts);
    return {rec, layout};
}

Record decode(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts) {
    auto [rec, layout] = inspect(bytes, opts);
    require_ecg(layout);
    deinterleave(bytes.data() + layout.ecg_block_offset, static_cast<std::size_t>(layout.data_bytes), rec.leads);
    return rec;
}

std::vector<std::uint8_t> encode(const Record& rec, const WriteOptions& opts) {
    // Sizes first: the header needs every offset before any byte is written.
    const Layout layout = plan_layout(rec, opts);
    if (layout.file_size > static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max)())) {
        throw IshneError(ErrorKind::InvalidRecord, "encoded file does not fit in memory");
    }

    std::vector<std::uint8_t> out(static_cast<std::size_t>(layout.file_size), 0);
    encode_header(rec, layout, opts, out.data());
    if (!rec.var_block.empty()) {
        std::memcpy(out.data() + layout.var_block_offset, rec.var_block.data(), rec.var_block.size());
    }
    interleave_into(rec.leads, out.data() + layout.ecg_block_offset);

    // Checksum last, over the final bytes.
    write_u16_le_to(out.data() + kChecksumOffset, compute_checksum(out, opts.checksum_scope));
    return out;
}

// ------------------------------
// File I/O (zlib gz streams: plain files pass through untouched)
// ------------------------------

struct GzCloser {
    void operator()(gzFile_s* f) const noexcept {
        if (f) ::gzclose(f);
    }
};

using GzHandle = std::unique_ptr<gzFile_s, GzCloser>;

static GzHandle open_gz(const std::filesystem::path& file, const std::string& mode) {
    gzFile f = ::gzopen(file.string().c_str(), mode.c_str());
    if (!f) {
        throw IshneError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    return GzHandle(f);
}

static std::string gz_error_message(gzFile f) {
    int errnum = 0;
    const char* msg = ::gzerror(f, &errnum);
    return msg ? std::string(msg) : std::string("zlib error ") + std::to_string(errnum);
}

// Reads up to `len` bytes; a short count means end of file.
static std::size_t gz_read_some(gzFile f, std::uint8_t* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        const unsigned want = static_cast<unsigned>(std::min<std::size_t>(len - total, INT_MAX));
        const int got = ::gzread(f, buf + total, want);
        if (got < 0) {
            throw IshneError(ErrorKind::Io, "read failed: " + gz_error_message(f));
        }
        if (got == 0) break;
        total += static_cast<std::size_t>(got);
    }
    return total;
}

static std::vector<std::uint8_t> read_all(const std::filesystem::path& file) {
    GzHandle gz = open_gz(file, "rb");
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> chunk(kIoChunk);
    while (true) {
        const std::size_t got = gz_read_some(gz.get(), chunk.data(), chunk.size());
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));
        if (got < chunk.size()) break;
    }
    return out;
}

Record read_file(const std::filesystem::path& file, const ReadOptions& opts) {
    return decode(read_all(file), opts);
}

void write_file(const std::filesystem::path& file, const Record& rec, const WriteOptions& opts) {
    std::error_code ec;
    if (std::filesystem::exists(file, ec) && !opts.overwrite) {
        throw IshneError(ErrorKind::AlreadyExists, "destination exists and overwrite is off: " + file.string());
    }
    if (opts.gzip && (opts.zlib_level < 0 || opts.zlib_level > 9)) {
        throw IshneError(ErrorKind::InvalidRecord, "zlib level must be 0..9, got " + std::to_string(opts.zlib_level));
    }

    // Encode before touching the destination so a bad record never clobbers it.
    const std::vector<std::uint8_t> bytes = encode(rec, opts);

    const std::string mode = opts.gzip ? "wb" + std::to_string(opts.zlib_level) : std::string("wbT");
    GzHandle gz = open_gz(file, mode);

    std::size_t written = 0;
    while (written < bytes.size()) {
        const unsigned want = static_cast<unsigned>(std::min<std::size_t>(bytes.size() - written, kIoChunk));
        const int n = ::gzwrite(gz.get(), bytes.data() + written, want);
        if (n <= 0) {
            throw IshneError(ErrorKind::Io, "write failed for " + file.string() + ": " + gz_error_message(gz.get()));
        }
        written += static_cast<std::size_t>(n);
    }

    const int rc = ::gzclose(gz.release());
    if (rc != Z_OK) {
        throw IshneError(ErrorKind::Io, "failed to finish writing " + file.string());
    }
}

// ------------------------------
// HolterReader
// ------------------------------

HolterReader::HolterReader(std::filesystem::path file, const ReadOptions& opts)
    : file_(std::move(file)) {
    GzHandle gz = open_gz(file_, "rb");
    compressed_ = ::gzdirect(gz.get()) == 0;

    std::vector<std::uint8_t> head(kFixedHeaderSize);
    head.resize(gz_read_some(gz.get(), head.data(), head.size()));
    layout_ = decode_header(head.data(), head.size(), record_);

    // Pull in the rest of the header block (variable block and any padding).
    // Grow by chunks so a bogus offset costs no more memory than the file holds.
    const std::size_t header_end = static_cast<std::size_t>(layout_.ecg_block_offset);
    std::size_t have = kFixedHeaderSize;
    while (have < header_end) {
        const std::size_t want = std::min(header_end - have, kIoChunk);
        head.resize(have + want);
        if (gz_read_some(gz.get(), head.data() + have, want) != want) {
            throw IshneError(ErrorKind::Truncated, "file ends before the ECG block offset " + std::to_string(header_end));
        }
        have += want;
    }
    record_.var_block = decode_var_block(head.data(), head.size(), layout_);

    std::uint16_t crc = crc16(head.data() + kHeaderBlockOffset, header_end - kHeaderBlockOffset);

    if (compressed_ || opts.checksum_scope == ChecksumScope::HeaderAndData) {
        // Size of a compressed stream is only known after inflating it.
        std::vector<std::uint8_t> chunk(kIoChunk);
        std::uint64_t n = 0;
        while (true) {
            const std::size_t got = gz_read_some(gz.get(), chunk.data(), chunk.size());
            if (opts.checksum_scope == ChecksumScope::HeaderAndData) {
                crc = crc16(chunk.data(), got, crc);
            }
            n += got;
            if (got < chunk.size()) break;
        }
        layout_.data_bytes = n;
    } else {
        std::error_code ec;
        const std::uintmax_t size = std::filesystem::file_size(file_, ec);
        if (ec) {
            throw IshneError(ErrorKind::Io, "cannot stat " + file_.string() + ": " + ec.message());
        }
        layout_.data_bytes = static_cast<std::uint64_t>(size) - header_end;
    }
    layout_.file_size = header_end + layout_.data_bytes;
    finish_layout(layout_);

    apply_checksum_policy(layout_, crc, opts);
}

// Streams whole frames of the sample block to `fn(frames_ptr, frame_count, first_sample_index)`.
template <typename Fn>
static void for_each_frame_chunk(const std::filesystem::path& file, const Layout& layout, Fn&& fn) {
    GzHandle gz = open_gz(file, "rb");
    if (::gzseek(gz.get(), static_cast<z_off_t>(layout.ecg_block_offset), SEEK_SET) < 0) {
        throw IshneError(ErrorKind::Io, "seek to the ECG block failed: " + gz_error_message(gz.get()));
    }

    const std::size_t frame = 2 * static_cast<std::size_t>(layout.nleads);
    const std::size_t frames_per_chunk = std::max<std::size_t>(1, kIoChunk / frame);
    std::vector<std::uint8_t> buf(frames_per_chunk * frame);

    std::uint64_t t0 = 0;
    while (t0 < layout.samples_per_lead) {
        const std::size_t frames = static_cast<std::size_t>(
            std::min<std::uint64_t>(frames_per_chunk, layout.samples_per_lead - t0));
        const std::size_t want = frames * frame;
        if (gz_read_some(gz.get(), buf.data(), want) != want) {
            throw IshneError(ErrorKind::Truncated, "file ended inside the ECG block; was it modified since it was opened?");
        }
        fn(buf.data(), frames, static_cast<std::size_t>(t0));
        t0 += frames;
    }
}

static void check_lead_index(std::size_t lead, std::size_t count) {
    if (lead >= count) {
        std::ostringstream oss;
        oss << "lead index " << lead << " out of range, file has " << count << " leads";
        throw IshneError(ErrorKind::LeadOutOfRange, oss.str());
    }
}

std::vector<std::int16_t> HolterReader::read_lead(std::size_t lead) const {
    check_lead_index(lead, lead_count());
    require_ecg(layout_);

    const std::size_t n = lead_count();
    std::vector<std::int16_t> out;
    out.reserve(static_cast<std::size_t>(layout_.samples_per_lead));
    for_each_frame_chunk(file_, layout_, [&](const std::uint8_t* data, std::size_t frames, std::size_t) {
        for (std::size_t t = 0; t < frames; ++t) {
            out.push_back(read_i16_le_from(data + 2 * (t * n + lead)));
        }
    });
    return out;
}

std::vector<double> HolterReader::read_lead_mv(std::size_t lead) const {
    check_lead_index(lead, lead_count());
    // Check the scale before touching the disk.
    Lead l;
    l.resolution_nv = record_.leads[lead].resolution_nv;
    require_resolution(l.resolution_nv);
    l.samples = read_lead(lead);
    return to_millivolts(l);
}

Record HolterReader::load_samples() const {
    require_ecg(layout_);
    Record rec = record_;
    for (auto& l : rec.leads) {
        l.samples.assign(static_cast<std::size_t>(layout_.samples_per_lead), 0);
    }
    for_each_frame_chunk(file_, layout_, [&](const std::uint8_t* data, std::size_t frames, std::size_t t0) {
        scatter_frames(data, frames, t0, rec.leads);
    });
    return rec;
}

} // namespace ishne
