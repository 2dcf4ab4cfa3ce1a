#ifndef ENCGEN_STATISTICS_UTIL_H
#define ENCGEN_STATISTICS_UTIL_H

#include <string>

namespace encgen {
namespace stats {

/**
 * Standard deviation of a zero-mean normal distribution that places
 * p_containment of its mass inside [-volume_size/2, +volume_size/2].
 *
 * Not guarded: p_containment outside (0, 1) yields a non-finite or
 * meaningless result. Validate upstream with requireContainmentFraction.
 */
double computeSigma(double volume_size, double p_containment);

/**
 * Size of the mean-centred interval holding p_containment of the mass of a
 * zero-mean normal distribution with the given sigma. Inverse of computeSigma.
 */
double computeVolumeSize(double sigma, double p_containment);

/**
 * Re-sampling interval at which independent per-step deviations keep
 * fraction_inside_bound of an aircraft's time inside a bound of bound_size,
 * when the aircraft leaves the bound at average_speed_at_bound_exit.
 * The proportionality constant comes from an empirical calibration table.
 */
double inferCaffeination(double fraction_inside_bound,
                         double average_speed_at_bound_exit,
                         double bound_size);

// Standard normal inverse CDF
double probit(double p);

// Throws NumericDomainError unless 0 < p < 1
void requireContainmentFraction(double p, const std::string& name);

} // namespace stats
} // namespace encgen

#endif // ENCGEN_STATISTICS_UTIL_H
