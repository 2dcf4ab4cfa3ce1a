#ifndef ENCGEN_PIECEWISE_LINEAR_H
#define ENCGEN_PIECEWISE_LINEAR_H

#include <cstddef>
#include <vector>

namespace encgen {

// Scalar function of time defined by knots (t_i, v_i) with non-decreasing t_i.
// Linear between knots, held at the first/last value outside them.
class PiecewiseLinear {
public:
    PiecewiseLinear(std::vector<double> times, std::vector<double> values);

    static PiecewiseLinear constant(double value);

    double evaluate(double t) const;

    const std::vector<double>& getTimes() const { return times_; }
    const std::vector<double>& getValues() const { return values_; }
    size_t size() const { return times_.size(); }

private:
    std::vector<double> times_;
    std::vector<double> values_;
};

} // namespace encgen

#endif // ENCGEN_PIECEWISE_LINEAR_H
