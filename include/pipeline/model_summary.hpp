#pragma once

#include <model/canonical_model.hpp>
#include <string>

namespace FemCanon {

/**
 * @brief Human-readable overview of a canonical model.
 *
 * Mode count, first and last five eigenfrequencies, damping range, the
 * channel count of every group with totals, and for static reductions
 * whether the gain matrix spans outputs x inputs.
 */
std::string format_summary(const CanonicalModel& model, const std::string& label);

} // namespace FemCanon
