/**
 * Arrow Utilities - zero-copy bridge between sample vectors and Arrow Compute
 */

#pragma once

#include <memory>
#include <span>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace hillmaker {
namespace arrow_utils {

/// Sample count from which the Arrow Compute path pays for its overhead
constexpr size_t ARROW_THRESHOLD = 10000;

#ifdef HAVE_ARROW

/**
 * Wrap a span of doubles as an Arrow array (zero-copy)
 *
 * The referenced memory MUST stay alive while the Arrow array is used.
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_span_as_arrow(std::span<const double> data) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        static_cast<int64_t>(data.size() * sizeof(double))
    );

    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        static_cast<int64_t>(data.size()),
        {nullptr, buffer},   // Buffers: [null_bitmap, data]
        0                    // null_count
    );

    return std::make_shared<arrow::DoubleArray>(array_data);
}

inline std::shared_ptr<arrow::DoubleArray> wrap_vector_as_arrow(const std::vector<double>& data) {
    return wrap_span_as_arrow(std::span<const double>(data.data(), data.size()));
}

#endif  // HAVE_ARROW

/// True when the library was built against Arrow Compute
inline bool is_arrow_available() {
#ifdef HAVE_ARROW
    return true;
#else
    return false;
#endif
}

}  // namespace arrow_utils
}  // namespace hillmaker
