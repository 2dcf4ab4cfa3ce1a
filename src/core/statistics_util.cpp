#include "core/statistics_util.h"
#include "core/piecewise_linear.h"
#include "common/constants.h"
#include "common/errors.h"
#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <vector>

namespace encgen {
namespace stats {

namespace {

// Out-of-range probabilities produce inf/NaN instead of throwing
using NonThrowingPolicy = boost::math::policies::policy<
    boost::math::policies::domain_error<boost::math::policies::ignore_error>,
    boost::math::policies::overflow_error<boost::math::policies::ignore_error>>;

double twoSidedQuantile(double p_containment) {
    return probit(1 - (1 - p_containment) / 2);
}

const PiecewiseLinear& caffeinationCurve() {
    static const PiecewiseLinear curve = [] {
        std::vector<double> fractions;
        std::vector<double> ks;
        for (const auto& entry : constants::CAFFEINATION_TABLE) {
            fractions.push_back(entry.first);
            ks.push_back(entry.second);
        }
        return PiecewiseLinear(fractions, ks);
    }();
    return curve;
}

} // namespace

double probit(double p) {
    static const boost::math::normal_distribution<double, NonThrowingPolicy> standard_normal(0.0, 1.0);
    return boost::math::quantile(standard_normal, p);
}

double computeSigma(double volume_size, double p_containment) {
    return volume_size / 2 / twoSidedQuantile(p_containment);
}

double computeVolumeSize(double sigma, double p_containment) {
    return 2 * sigma * twoSidedQuantile(p_containment);
}

double inferCaffeination(double fraction_inside_bound,
                         double average_speed_at_bound_exit,
                         double bound_size) {
    double k = caffeinationCurve().evaluate(fraction_inside_bound);
    return k * bound_size / average_speed_at_bound_exit;
}

void requireContainmentFraction(double p, const std::string& name) {
    if (!(p > 0.0 && p < 1.0)) {
        throw NumericDomainError(name + " must lie strictly between 0 and 1, got " +
                                 std::to_string(p));
    }
}

} // namespace stats
} // namespace encgen
