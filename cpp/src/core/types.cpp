#include "hillmaker/core/types.hpp"

namespace hillmaker {

const char* relationship_name(RecordRelationship rel) {
    switch (rel) {
        case RecordRelationship::INNER: return "inner";
        case RecordRelationship::LEFT: return "left";
        case RecordRelationship::RIGHT: return "right";
        case RecordRelationship::OUTER: return "outer";
        case RecordRelationship::BACKWARDS: return "backwards";
        case RecordRelationship::NONE: return "none";
        default: return "unknown";
    }
}

const char* measure_name(Measure measure) {
    switch (measure) {
        case Measure::ARRIVALS: return "arrivals";
        case Measure::DEPARTURES: return "departures";
        case Measure::OCCUPANCY: return "occupancy";
        default: return "unknown";
    }
}

} // namespace hillmaker
