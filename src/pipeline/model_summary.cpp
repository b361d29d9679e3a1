#include <pipeline/model_summary.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace FemCanon {

namespace {

void write_values(std::ostream& os, std::vector<double>::const_iterator first,
                  std::vector<double>::const_iterator last) {
    os << "[";
    for (auto it = first; it != last; ++it) {
        if (it != first) os << ", ";
        os << std::setw(9) << std::fixed << std::setprecision(3) << *it;
    }
    os << "]";
}

void write_groups(std::ostream& os, const char* title, const std::vector<ChannelGroup>& groups) {
    os << title << ":\n";
    size_t total = 0;
    for (size_t k = 0; k < groups.size(); ++k) {
        os << " #" << std::setw(2) << std::setfill('0') << k << std::setfill(' ')
           << " " << groups[k].name << ": [" << std::setw(5) << groups[k].entries.size() << "]\n";
        total += groups[k].entries.size();
    }
    os << std::setw(29) << "Total" << ": [" << std::setw(5) << total << "]\n";
}

} // namespace

std::string format_summary(const CanonicalModel& model, const std::string& label) {
    std::ostringstream os;
    os << "FEM (" << label << ")\n";
    os << "  - description: " << model.model_description << "\n";
    os << "  - variant: " << to_string(model.variant) << "\n";

    if (model.variant == ModelVariant::Modal) {
        const auto& nu = model.modal.eigenfrequencies;
        size_t head = std::min<size_t>(5, nu.size());

        os << "  - # of modes: " << model.n_modes() << "\n";
        os << "  - first " << head << " eigen frequencies: ";
        write_values(os, nu.begin(), nu.begin() + head);
        os << "\n  - last " << head << " eigen frequencies: ";
        write_values(os, nu.end() - head, nu.end());
        os << "\n";

        const auto& damping = model.modal.proportional_damping_vector;
        if (!damping.empty()) {
            auto [lo, hi] = std::minmax_element(damping.begin(), damping.end());
            os << "  - damping coefficients [min;max]: [" << std::fixed << std::setprecision(4)
               << *lo << ";" << *hi << "]\n";
        }
    } else {
        size_t expected = model.n_inputs() * model.n_outputs();
        size_t actual = model.static_gain.gain_matrix.size();
        os << "  - static gain: " << actual << " coefficients";
        if (actual == expected) {
            os << " (" << model.n_outputs() << " outputs x " << model.n_inputs() << " inputs)\n";
        } else {
            os << ", expected " << expected << " for " << model.n_outputs() << " outputs x "
               << model.n_inputs() << " inputs\n";
        }
    }

    write_groups(os, "INPUTS", model.inputs);
    write_groups(os, "OUTPUTS", model.outputs);
    return os.str();
}

} // namespace FemCanon
