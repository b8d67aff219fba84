#include "hillmaker/processing/record_classifier.hpp"

namespace hillmaker {

RecordRelationship RecordClassifier::classify(Timestamp entry, Timestamp exit,
                                              const AnalysisWindow& window) {
    if (exit < entry) {
        return RecordRelationship::BACKWARDS;
    }

    const bool entry_inside = window.contains(entry);
    const bool exit_inside = window.contains(exit);

    if (entry_inside && exit_inside) {
        return RecordRelationship::INNER;
    }
    if (entry_inside && exit >= window.end) {
        return RecordRelationship::RIGHT;
    }
    if (entry < window.start && exit_inside) {
        return RecordRelationship::LEFT;
    }
    if (entry < window.start && exit >= window.end) {
        return RecordRelationship::OUTER;
    }
    return RecordRelationship::NONE;
}

RelationshipCounts RecordClassifier::count(const std::vector<StopRecord>& records,
                                           const AnalysisWindow& window) {
    RelationshipCounts counts;
    for (const auto& rec : records) {
        ++counts[classify(rec, window)];
    }
    return counts;
}

} // namespace hillmaker
