#include "core/piecewise_linear.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace encgen {

PiecewiseLinear::PiecewiseLinear(std::vector<double> times, std::vector<double> values)
    : times_(std::move(times))
    , values_(std::move(values)) {
    if (times_.empty() || times_.size() != values_.size()) {
        throw std::invalid_argument("Piecewise-linear function needs matching, non-empty knots");
    }
    if (!std::is_sorted(times_.begin(), times_.end())) {
        throw std::invalid_argument("Piecewise-linear knot times must be non-decreasing");
    }
}

PiecewiseLinear PiecewiseLinear::constant(double value) {
    return PiecewiseLinear({0.0}, {value});
}

double PiecewiseLinear::evaluate(double t) const {
    // First knot strictly after t
    auto upper = std::upper_bound(times_.begin(), times_.end(), t);
    if (upper == times_.begin()) {
        return values_.front();
    }
    if (upper == times_.end()) {
        return values_.back();
    }

    size_t i1 = static_cast<size_t>(upper - times_.begin());
    size_t i0 = i1 - 1;
    double f = (t - times_[i0]) / (times_[i1] - times_[i0]);
    return values_[i0] + f * (values_[i1] - values_[i0]);
}

} // namespace encgen
