#pragma once

namespace hillmaker {

/// Version information
struct Version {
    static constexpr int MAJOR = HM_VERSION_MAJOR;
    static constexpr int MINOR = HM_VERSION_MINOR;
    static constexpr int PATCH = HM_VERSION_PATCH;
    
    static const char* get_version_string();
};

} // namespace hillmaker
