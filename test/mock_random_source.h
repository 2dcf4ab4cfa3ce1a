#ifndef ENCGEN_MOCK_RANDOM_SOURCE_H
#define ENCGEN_MOCK_RANDOM_SOURCE_H

#include "common/random_source.h"
#include <gmock/gmock.h>

namespace encgen {
namespace test {

class MockRandomSource : public RandomSource {
public:
    MOCK_METHOD(double, gauss, (double mu, double sigma), (override));
    MOCK_METHOD(double, uniform, (double a, double b), (override));

    // Every draw returns its mean (gauss) or the interval midpoint (uniform)
    void returnCentres() {
        ON_CALL(*this, gauss(testing::_, testing::_))
            .WillByDefault(testing::ReturnArg<0>());
        ON_CALL(*this, uniform(testing::_, testing::_))
            .WillByDefault([](double a, double b) { return (a + b) / 2; });
    }
};

} // namespace test
} // namespace encgen

#endif // ENCGEN_MOCK_RANDOM_SOURCE_H
