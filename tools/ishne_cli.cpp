#include "ishne/ishne.hpp"
#include "ishne/ishne_easy.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex4(std::uint16_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << v;
    return oss.str();
}

static std::string fmt_date(const std::optional<ishne::Date>& d) {
    if (!d) return "-";
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << d->year << '-' << std::setw(2) << d->month << '-' << std::setw(2) << d->day;
    return oss.str();
}

static std::string fmt_time(const std::optional<ishne::TimeOfDay>& t) {
    if (!t) return "-";
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << t->hour << ':' << std::setw(2) << t->minute << ':' << std::setw(2) << t->second;
    return oss.str();
}

// Name plus raw code, e.g. "V2 (12)".
template <typename E>
static std::string fmt_code(E v, std::int16_t code) {
    return ishne::to_string(v) + " (" + std::to_string(code) + ")";
}

static void usage() {
    std::cerr <<
        "ishne - ISHNE Holter ECG inspector\n"
        "\n"
        "Usage:\n"
        "  ishne header <FILE> [--scope header|all] [--no-color]\n"
        "  ishne leads  <FILE> [--details] [--no-color]\n"
        "  ishne show   <FILE> [--max-elems N] [--mv]\n"
        "  ishne subset <IN> <OUT> --keep SPEC[,SPEC...] [--overwrite] [--gzip]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string out;
    std::string scope{"header"};
    std::string keep;
    bool details{false};
    bool no_color{false};
    bool mv{false};
    bool overwrite{false};
    bool gzip{false};
    std::size_t max_elems{20};
};

// Digits only: stoull alone would accept "-1" (wrapping) and "12abc".
static bool parse_count(const std::string& s, std::size_t& out) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    if (a.cmd == "subset") {
        if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) return false;
        a.out = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--details") a.details = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--mv") a.mv = true;
        else if (opt == "--overwrite") a.overwrite = true;
        else if (opt == "--gzip") a.gzip = true;
        else if (opt == "--scope" && i < argc) a.scope = argv[i++];
        else if (opt == "--keep" && i < argc) a.keep = argv[i++];
        else if (opt == "--max-elems" && i < argc) {
            const std::string v = argv[i++];
            if (!parse_count(v, a.max_elems)) {
                std::cerr << "Invalid number for --max-elems: " << v << "\n";
                return false;
            }
        }
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "header" && a.cmd != "leads" && a.cmd != "show" && a.cmd != "subset") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    if (a.scope != "header" && a.scope != "all") {
        std::cerr << "Unknown checksum scope: " << a.scope << "\n";
        return false;
    }
    if (a.cmd == "subset" && a.keep.empty()) {
        std::cerr << "subset needs --keep\n";
        return false;
    }
    return true;
}

static bool parse_keep(const std::string& list, std::vector<ishne::LeadSpec>& out) {
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, ',')) {
        ishne::LeadSpec s = ishne::lead_spec_from_string(item);
        if (s == ishne::LeadSpec::Unrecognized || s == ishne::LeadSpec::Absent) {
            std::cerr << "Unknown lead: " << item << "\n";
            return false;
        }
        out.push_back(s);
    }
    return !out.empty();
}

static void print_kv(const Ansi& ansi, const char* k, const std::string& v) {
    std::cout << ansi.bold() << k << ansi.reset() << ": " << v << "\n";
}

// ----------------- Lead preview -----------------

static std::string lead_preview(const ishne::HolterReader& reader, std::size_t lead, std::size_t max_elems, bool mv) {
    std::ostringstream oss;
    const ishne::Lead& meta = reader.record().leads[lead];
    std::vector<std::int16_t> raw = reader.read_lead(lead);

    oss << "samples:\n";
    oss << "  count=" << raw.size() << "\n";
    if (!raw.empty()) {
        auto [lo, hi] = std::minmax_element(raw.begin(), raw.end());
        oss << "  min=" << *lo << "\n";
        oss << "  max=" << *hi << "\n";
    }
    if (mv && !ishne::convertible(meta)) {
        oss << "  unit=raw (resolution " << meta.resolution_nv << " nV is not convertible)\n";
        mv = false;
    }

    oss << "preview:\n";
    const std::size_t n = std::min(max_elems, raw.size());
    for (std::size_t t = 0; t < n; ++t) {
        oss << "  [" << t << "]=";
        if (mv) {
            oss << std::fixed << std::setprecision(4) << ishne::to_millivolts(raw[t], meta.resolution_nv) << " mV";
        } else {
            oss << raw[t];
        }
        oss << "\n";
    }
    if (raw.size() > n) oss << "  ...\n";
    return oss.str();
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) out.push_back(line);
    return out;
}

static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(press Enter to load samples)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());
    for (const auto& line : lines) {
        if (!line.empty() && line.back() == ':' && line.rfind("  ", 0) != 0) {
            els.push_back(text(line) | bold | color(Color::Magenta));
            continue;
        }
        if (line.rfind("  ", 0) == 0) {
            std::string rest = line.substr(2);
            auto eq = rest.find('=');
            if (eq != std::string::npos) {
                els.push_back(hbox({
                    text("  "),
                    text(rest.substr(0, eq)) | bold | color(Color::Yellow),
                    text("=") | color(Color::GrayDark),
                    text(rest.substr(eq + 1)) | color(Color::GrayLight) | flex,
                }));
                continue;
            }
        }
        els.push_back(text(line) | color(Color::White));
    }
    return vbox(std::move(els));
}

// ----------------- Commands -----------------

static int cmd_header(const Args& a, const Ansi& ansi) {
    ishne::ReadOptions ro;
    ro.checksum_policy = ishne::ChecksumPolicy::Report;
    ro.checksum_scope = a.scope == "all" ? ishne::ChecksumScope::HeaderAndData : ishne::ChecksumScope::Header;

    ishne::HolterReader reader(a.file, ro);
    const ishne::Record& rec = reader.record();
    const ishne::Layout& lay = reader.layout();

    print_kv(ansi, "File", a.file + (reader.compressed() ? " (gzip)" : ""));
    print_kv(ansi, "Magic", lay.magic + (lay.kind == ishne::FileKind::Annotation ? " (annotations)" : ""));
    print_kv(ansi, "File size", std::to_string(lay.file_size));
    print_kv(ansi, "Var block", std::to_string(lay.var_block_size) + " bytes @ " + std::to_string(lay.var_block_offset));
    print_kv(ansi, "ECG block", std::to_string(lay.data_bytes) + " bytes @ " + std::to_string(lay.ecg_block_offset));
    print_kv(ansi, "ecg_size", std::to_string(lay.ecg_size));
    print_kv(ansi, "Leads", std::to_string(lay.nleads));
    print_kv(ansi, "Samples/lead", std::to_string(lay.samples_per_lead));
    if (lay.trailing_bytes) {
        std::cout << ansi.yellow() << "Warning" << ansi.reset() << ": " << lay.trailing_bytes
                  << " trailing bytes do not form a whole frame\n";
    }

    print_kv(ansi, "Version", std::to_string(rec.file_version));
    print_kv(ansi, "Name", rec.first_name + " " + rec.last_name);
    print_kv(ansi, "ID", rec.id);
    print_kv(ansi, "Sex", fmt_code(rec.sex(), rec.sex_code));
    print_kv(ansi, "Race", fmt_code(rec.race(), rec.race_code));
    print_kv(ansi, "Birth date", fmt_date(rec.birth_date));
    print_kv(ansi, "Record date", fmt_date(rec.record_date));
    print_kv(ansi, "File date", fmt_date(rec.file_date));
    print_kv(ansi, "Start time", fmt_time(rec.start_time));
    print_kv(ansi, "Pacemaker", fmt_code(rec.pacemaker(), rec.pacemaker_code));
    print_kv(ansi, "Recorder", rec.recorder_type + " [" + ishne::to_string(rec.recorder_kind()) + "]");
    print_kv(ansi, "Sample rate", std::to_string(rec.sample_rate) + " Hz");
    if (rec.sample_rate > 0 && lay.kind == ishne::FileKind::Ecg) {
        std::ostringstream dur;
        dur << std::fixed << std::setprecision(1) << ishne::easy::duration_seconds(rec, lay) << " s";
        print_kv(ansi, "Duration", dur.str());
    }
    if (!rec.var_block.empty()) print_kv(ansi, "Var text", rec.var_block);

    std::cout << ansi.bold() << "Size" << ansi.reset() << ": ";
    if (lay.size_ok) {
        std::cout << ansi.green() << "ok" << ansi.reset() << "\n";
    } else {
        std::cout << ansi.red() << "MISMATCH" << ansi.reset() << " (ecg_size " << lay.ecg_size << ", block holds "
                  << lay.samples_per_lead << " samples per lead)\n";
    }

    std::cout << ansi.bold() << "Checksum" << ansi.reset() << ": " << hex4(lay.checksum) << " ";
    if (lay.checksum_ok) {
        std::cout << ansi.green() << "ok" << ansi.reset() << "\n";
    } else {
        std::cout << ansi.red() << "MISMATCH" << ansi.reset() << " (scope " << a.scope << ")\n";
    }
    return lay.checksum_ok && lay.size_ok ? 0 : 1;
}

static int cmd_leads(const Args& a, const Ansi& ansi) {
    ishne::HolterReader reader(a.file);
    const auto& leads = reader.record().leads;

    std::cout << ansi.bold() << "Leads" << ansi.reset() << ": " << a.file << "\n";
    for (std::size_t i = 0; i < leads.size(); ++i) {
        const ishne::Lead& l = leads[i];
        std::cout << "  " << ansi.cyan() << std::setw(2) << i << "  " << std::left << std::setw(6)
                  << ishne::to_string(l.spec()) << std::right << ansi.reset()
                  << ansi.yellow() << std::setw(7) << l.resolution_nv << " nV" << ansi.reset()
                  << "  " << ishne::to_string(l.quality());
        if (a.details) {
            std::cout << ansi.dim() << "  spec=" << l.spec_code << " quality=" << l.quality_code
                      << " samples=" << reader.layout().samples_per_lead << ansi.reset();
        }
        std::cout << "\n";
    }
    return 0;
}

static int cmd_subset(const Args& a, const Ansi& ansi) {
    std::vector<ishne::LeadSpec> keep;
    if (!parse_keep(a.keep, keep)) return 2;

    ishne::Record rec = ishne::read_file(a.file);
    ishne::easy::retain_leads(rec, keep);

    ishne::WriteOptions wo;
    wo.overwrite = a.overwrite;
    wo.gzip = a.gzip;
    ishne::write_file(a.out, rec, wo);

    std::cout << ansi.green() << "Wrote" << ansi.reset() << " " << a.out << ": " << rec.leads.size()
              << " lead(s), " << rec.samples_per_lead() << " samples each\n";
    return 0;
}

static int cmd_show(const Args& a) {
    ishne::HolterReader reader(a.file);
    const auto& leads = reader.record().leads;

    using namespace ftxui;

    int selected = 0;
    std::string preview;
    std::vector<std::pair<std::string, std::string>> status_kv;

    auto load_preview_for_selected = [&]() {
        const std::size_t i = static_cast<std::size_t>(selected);
        const ishne::Lead& l = leads[i];
        status_kv.clear();
        status_kv.push_back({"spec", fmt_code(l.spec(), l.spec_code)});
        status_kv.push_back({"quality", fmt_code(l.quality(), l.quality_code)});
        status_kv.push_back({"resolution", std::to_string(l.resolution_nv) + " nV"});
        status_kv.push_back({"samples", std::to_string(reader.layout().samples_per_lead)});
        try {
            preview = lead_preview(reader, i, a.max_elems, a.mv);
        } catch (const ishne::IshneError& e) {
            preview.clear();
            status_kv.push_back({"error", e.what()});
        }
    };

    auto left_pane = Renderer([&] {
        std::vector<Element> items;
        items.reserve(leads.size());
        for (std::size_t i = 0; i < leads.size(); ++i) {
            const ishne::Lead& l = leads[i];
            Element line = hbox({
                text(std::to_string(i) + "  " + ishne::to_string(l.spec())) | color(Color::Cyan) | flex,
                text(std::to_string(l.resolution_nv) + " nV") | color(Color::Yellow),
            });
            if (static_cast<int>(i) == selected) line = line | inverted;
            items.push_back(line);
        }

        auto header = hbox({
            text("ISHNE") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" load") | color(Color::GrayDark),
        });

        return vbox({header, separator(), vbox(std::move(items)) | flex}) | flex | border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        for (const auto& kv : status_kv) {
            meta_lines.push_back(hbox({
                text(kv.first) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(kv.second) | color(Color::GrayLight) | flex,
            }));
        }
        if (meta_lines.empty()) {
            meta_lines.push_back(text("(no lead loaded)") | color(Color::GrayDark));
        }

        Element top = vbox({
            text("lead " + std::to_string(selected)) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)),
        });
        Element body = vbox({
            render_preview_colored(preview) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) | flex | border;
    });

    auto layout = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        return hbox({
                   left_pane->Render() | size(WIDTH, EQUAL, 48),
                   right_pane->Render() | flex,
               }) |
               size(WIDTH, EQUAL, term_w) | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    const int last = static_cast<int>(leads.size()) - 1;
    auto app = CatchEvent(layout, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected < last) selected++;
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 1);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min(last, selected + 1);
                return true;
            }
        }
        if (e == Event::Return) {
            load_preview_for_selected();
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "header") return cmd_header(a, ansi);
        if (a.cmd == "leads") return cmd_leads(a, ansi);
        if (a.cmd == "subset") return cmd_subset(a, ansi);
        if (a.cmd == "show") return cmd_show(a);
    } catch (const ishne::IshneError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << ishne::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
