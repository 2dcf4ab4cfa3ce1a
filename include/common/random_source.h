#ifndef ENCGEN_RANDOM_SOURCE_H
#define ENCGEN_RANDOM_SOURCE_H

#include <cstdint>
#include <random>

namespace encgen {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Normal deviate; consumes the source even when sigma is 0
    virtual double gauss(double mu, double sigma) = 0;

    // Uniform deviate in [a, b)
    virtual double uniform(double a, double b) = 0;
};

class MersenneRandomSource : public RandomSource {
public:
    explicit MersenneRandomSource(uint64_t seed);

    double gauss(double mu, double sigma) override;
    double uniform(double a, double b) override;

    void reseed(uint64_t seed);
    uint64_t getSeed() const { return seed_; }

private:
    std::mt19937_64 engine_;
    std::normal_distribution<double> normal_;
    std::uniform_real_distribution<double> unit_;
    uint64_t seed_;
};

// Process-wide source seeded from std::random_device. Only for call sites that
// do not care about reproducibility; generators always take a RandomSource&.
RandomSource& defaultRandomSource();

} // namespace encgen

#endif // ENCGEN_RANDOM_SOURCE_H
