#include "math/Random.hpp"

namespace FreeFly {

std::mt19937& Random::GetEngine() {
    static std::mt19937 engine(std::random_device{}());
    return engine;
}

std::mutex& Random::GetMutex() {
    static std::mutex mutex;
    return mutex;
}

void Random::Seed(unsigned int seed) {
    std::lock_guard lock(GetMutex());
    GetEngine().seed(seed);
}

float Random::Value() {
    std::lock_guard lock(GetMutex());
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(GetEngine());
}

float SeededRandomSource::Value() {
    return m_dist(m_engine);
}

std::shared_ptr<IRandomSource> MakeDefaultRandomSource() {
    return std::make_shared<GlobalRandomSource>();
}

} // namespace FreeFly
