#pragma once

/**
 * @file record_classifier.hpp
 * @brief Classification of a stop interval against the analysis window
 */

#include "hillmaker/core/types.hpp"

namespace hillmaker {

class RecordClassifier {
public:
    RecordClassifier() = delete;  // Static class, no instances

    /**
     * @brief Six-way classification against [window.start, window.end)
     *
     * BACKWARDS takes precedence over every other outcome. An entry exactly
     * at window.end is outside the window (NONE).
     */
    static RecordRelationship classify(Timestamp entry, Timestamp exit,
                                       const AnalysisWindow& window);

    static RecordRelationship classify(const StopRecord& record,
                                       const AnalysisWindow& window) {
        return classify(record.entry, record.exit, window);
    }

    /// Count records by relationship type
    static RelationshipCounts count(const std::vector<StopRecord>& records,
                                    const AnalysisWindow& window);
};

} // namespace hillmaker
