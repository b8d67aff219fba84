#include "hillmaker/core/diagnostics.hpp"
#include <ostream>
#include <sstream>

namespace hillmaker {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        default: return "UNKNOWN";
    }
}

void Diagnostics::debug(const std::string& message, const std::string& category) {
    add(LogLevel::DEBUG, message, category);
}

void Diagnostics::info(const std::string& message, const std::string& category) {
    add(LogLevel::INFO, message, category);
}

void Diagnostics::warning(const std::string& message, const std::string& category) {
    add(LogLevel::WARNING, message, category);
}

void Diagnostics::add(LogLevel level, const std::string& message, const std::string& category) {
    events_.push_back(DiagnosticEvent{level, category, message});
}

void Diagnostics::add_relationship_counts(const std::string& category,
                                          const RelationshipCounts& counts) {
    auto& target = relationship_counts_[category];
    for (const auto& [rel, n] : counts) {
        target[rel] += n;
    }
}

void Diagnostics::add_conservation(ConservationReport report) {
    conservation_.push_back(std::move(report));
}

void Diagnostics::merge(const Diagnostics& other) {
    events_.insert(events_.end(), other.events_.begin(), other.events_.end());
    for (const auto& [cat, counts] : other.relationship_counts_) {
        add_relationship_counts(cat, counts);
    }
    conservation_.insert(conservation_.end(), other.conservation_.begin(),
                         other.conservation_.end());
}

std::vector<std::string> Diagnostics::warnings() const {
    std::vector<std::string> out;
    for (const auto& e : events_) {
        if (e.level == LogLevel::WARNING) {
            out.push_back(e.message);
        }
    }
    return out;
}

size_t Diagnostics::count(LogLevel level) const {
    size_t n = 0;
    for (const auto& e : events_) {
        if (e.level == level) ++n;
    }
    return n;
}

RelationshipCounts Diagnostics::total_relationship_counts() const {
    RelationshipCounts total;
    for (const auto& [cat, counts] : relationship_counts_) {
        for (const auto& [rel, n] : counts) {
            total[rel] += n;
        }
    }
    return total;
}

void Diagnostics::emit(std::ostream& os, LogLevel min_level) const {
    for (const auto& e : events_) {
        if (static_cast<int>(e.level) < static_cast<int>(min_level)) {
            continue;
        }
        os << "[hillmaker] " << log_level_name(e.level);
        if (!e.category.empty()) {
            os << " cat=" << e.category;
        }
        os << " " << e.message << std::endl;
    }
}

LogLevel Diagnostics::level_for_verbosity(int verbosity) {
    if (verbosity <= 0) return LogLevel::WARNING;
    if (verbosity == 1) return LogLevel::INFO;
    return LogLevel::DEBUG;
}

std::string format_relationship_counts(const RelationshipCounts& counts) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [rel, n] : counts) {
        if (n == 0) continue;
        if (!first) oss << " ";
        oss << relationship_name(rel) << "=" << n;
        first = false;
    }
    return oss.str();
}

} // namespace hillmaker
