#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cst {

// Fatal: stacks or slices disagree on their spatial dimensions.
// sliceIndex() is -1 when a whole stack is at fault.
class ShapeMismatch : public std::runtime_error {
public:
    ShapeMismatch(std::string axis, long sliceIndex, const std::string& detail)
        : std::runtime_error(formatMessage(axis, sliceIndex, detail))
        , axis_(std::move(axis))
        , slice_(sliceIndex)
    {
    }

    const std::string& axis() const noexcept { return axis_; }
    long sliceIndex() const noexcept { return slice_; }

private:
    static std::string formatMessage(const std::string& axis, long slice, const std::string& detail)
    {
        std::string msg = "shape mismatch on axis " + axis;
        if (slice >= 0)
            msg += " at slice " + std::to_string(slice);
        return msg + ": " + detail;
    }

    std::string axis_;
    long slice_;
};

} // namespace cst
