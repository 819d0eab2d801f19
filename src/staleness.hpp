#ifndef RETIREPLAN_STALENESS_HPP
#define RETIREPLAN_STALENESS_HPP

#include "projection_input.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace retireplan {

// One tracked field whose value differs between two inputs
struct FieldChange {
    std::string field;              // JSON key, e.g. "expectedReturn"
    nlohmann::json previous;        // null when absent
    nlohmann::json current;
};

struct StalenessResult {
    bool is_stale;
    std::vector<std::string> changed_fields;    // Tracked-field order
    std::vector<FieldChange> changes;

    StalenessResult();
};

// Every ProjectionInput field compared, by JSON key, in declaration order
const std::vector<std::string>& tracked_input_fields();

// Field-by-field comparison of a stored input against a freshly built one.
// Scalars compare exactly. Income streams are compared as a set keyed by id,
// and a disabled spending-phase config equals an absent one.
StalenessResult check_projection_staleness(const ProjectionInput& stored, const ProjectionInput& current);

} // namespace retireplan

#endif // RETIREPLAN_STALENESS_HPP
