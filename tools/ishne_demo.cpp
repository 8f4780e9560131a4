#include "ishne/ishne_easy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>


// Two seconds of a crude 1 Hz "beat" at 200 Hz.
static std::vector<double> make_trace_mv(double amplitude) {
    std::vector<double> v(400);
    for (std::size_t t = 0; t < v.size(); ++t) {
        const double phase = static_cast<double>(t % 200) / 200.0;
        v[t] = phase < 0.05 ? amplitude * std::sin(phase * 20.0 * 3.14159265358979) : 0.0;
    }
    return v;
}

int main() {
    try {
        using namespace ishne;

        Record rec;
        rec.file_version = 1;
        rec.first_name = "Jane";
        rec.last_name = "Doe";
        rec.id = "DEMO-0001";
        rec.sex_code = to_code(Sex::Female);
        rec.race_code = to_code(Race::Unknown);
        rec.birth_date = Date{14, 3, 1971};
        rec.record_date = Date{2, 9, 2024};
        rec.start_time = TimeOfDay{8, 30, 0};
        rec.pacemaker_code = to_code(Pacemaker::None);
        rec.recorder_type = "digital";
        rec.sample_rate = 200;
        rec.var_block = "demo recording";

        rec.leads.push_back(easy::make_lead_mv(LeadSpec::II, 2500, make_trace_mv(1.2)));
        rec.leads.push_back(easy::make_lead_mv(LeadSpec::V2, 2500, make_trace_mv(0.8)));
        rec.leads.push_back(easy::make_lead_mv(LeadSpec::V5, 2500, make_trace_mv(1.5)));

        // Write
        WriteOptions wo;
        wo.overwrite = true;
        wo.stamp_file_date = true;

        std::string file = "demo_out.ecg";
        write_file(file, rec, wo);

        std::cout << "Wrote: " << file << "\n";

        // Header first, samples on demand.
        HolterReader reader(file);
        std::cout << "Leads: " << reader.lead_count()
                  << " samples/lead=" << reader.layout().samples_per_lead
                  << " duration=" << easy::duration_seconds(reader.record(), reader.layout()) << " s\n";

        if (auto v2 = easy::find_lead(reader.record(), LeadSpec::V2)) {
            std::vector<double> mv = reader.read_lead_mv(*v2);
            std::cout << "V2 peak: " << *std::max_element(mv.begin(), mv.end()) << " mV\n";
        }

        std::cout << "OK\n";
        return 0;

    } catch (const ishne::IshneError& e) {
        std::cerr << "ISHNE error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
