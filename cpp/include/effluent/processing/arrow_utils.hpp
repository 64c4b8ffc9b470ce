/**
 * Arrow Utilities - zero-copy bridge between engine columns and Arrow compute
 *
 * Only compiled against Arrow when the build defines HAVE_ARROW; callers keep
 * a scalar path for builds without it.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <span>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace effluent {
namespace arrow_utils {

/// Inputs shorter than this stay on the scalar path (Arrow call overhead)
inline constexpr size_t ARROW_THRESHOLD = 10000;

#ifdef HAVE_ARROW

/**
 * Wrap std::span as Arrow array (zero-copy!)
 *
 * CRITICAL: The viewed memory MUST stay alive while the Arrow array is used!
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_span_as_arrow(
    std::span<const double> data
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        static_cast<int64_t>(data.size() * sizeof(double))
    );

    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        static_cast<int64_t>(data.size()),
        {nullptr, buffer},
        0
    );

    return std::make_shared<arrow::DoubleArray>(array_data);
}

/**
 * Min/max through Arrow compute ("min_max" kernel, NaN ignored)
 *
 * @return false if the kernel failed or found no finite-ordered values;
 *         outputs are untouched in that case
 */
inline bool min_max_arrow(std::span<const double> data, double& min, double& max) {
    auto array = wrap_span_as_arrow(data);
    arrow::compute::ExecContext ctx;
    auto result = arrow::compute::CallFunction("min_max", {array}, &ctx);
    if (!result.ok()) {
        return false;
    }
    const auto& pair = result.ValueOrDie().scalar_as<arrow::StructScalar>();
    auto lo = std::static_pointer_cast<arrow::DoubleScalar>(pair.value[0]);
    auto hi = std::static_pointer_cast<arrow::DoubleScalar>(pair.value[1]);
    if (!lo->is_valid || !hi->is_valid || lo->value > hi->value) {
        return false;
    }
    min = lo->value;
    max = hi->value;
    return true;
}

/**
 * Mean through Arrow compute ("mean" kernel)
 *
 * Only valid for NaN-free input: Arrow treats NaN as a value, not a null.
 */
inline bool mean_arrow(std::span<const double> data, double& mean) {
    auto array = wrap_span_as_arrow(data);
    arrow::compute::ExecContext ctx;
    auto result = arrow::compute::CallFunction("mean", {array}, &ctx);
    if (!result.ok()) {
        return false;
    }
    mean = result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
    return true;
}

/// Check if Arrow is available at runtime
inline bool is_arrow_available() {
    return true;
}

#else  // HAVE_ARROW not defined

inline bool is_arrow_available() {
    return false;
}

#endif  // HAVE_ARROW

}  // namespace arrow_utils
}  // namespace effluent
