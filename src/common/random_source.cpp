#include "common/random_source.h"
#include "common/logger.h"

namespace encgen {

MersenneRandomSource::MersenneRandomSource(uint64_t seed)
    : engine_(seed)
    , normal_(0.0, 1.0)
    , unit_(0.0, 1.0)
    , seed_(seed) {
}

double MersenneRandomSource::gauss(double mu, double sigma) {
    return mu + sigma * normal_(engine_);
}

double MersenneRandomSource::uniform(double a, double b) {
    return a + (b - a) * unit_(engine_);
}

void MersenneRandomSource::reseed(uint64_t seed) {
    engine_.seed(seed);
    normal_.reset();
    unit_.reset();
    seed_ = seed;
}

RandomSource& defaultRandomSource() {
    static MersenneRandomSource instance([] {
        std::random_device rd;
        uint64_t seed = (static_cast<uint64_t>(rd()) << 32) | rd();
        Logger::getInstance().log(LogLevel::DEBUG,
            "Default random source seeded with " + std::to_string(seed));
        return seed;
    }());
    return instance;
}

} // namespace encgen
