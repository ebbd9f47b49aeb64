/**
 * Arrow Utilities - bridge between plain value buffers and Arrow compute
 */

#pragma once

#include <memory>
#include <cstddef>
#include <cstdint>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace pvperf {
namespace arrow_utils {

/// Inputs shorter than this are cheaper to reduce natively
constexpr size_t ARROW_MIN_LENGTH = 10000;

#ifdef HAVE_ARROW

/**
 * Wrap a raw buffer as an Arrow array (zero-copy)
 *
 * The buffer MUST outlive the returned array.
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_buffer_as_arrow(
    const double* data,
    size_t length
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data),
        static_cast<int64_t>(length * sizeof(double))
    );

    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        static_cast<int64_t>(length),
        {nullptr, buffer},
        0
    );

    return std::make_shared<arrow::DoubleArray>(array_data);
}

inline bool is_arrow_available() {
    return true;
}

#else  // HAVE_ARROW not defined

inline bool is_arrow_available() {
    return false;
}

#endif  // HAVE_ARROW

}  // namespace arrow_utils
}  // namespace pvperf
