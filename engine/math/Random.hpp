#pragma once

#include <memory>
#include <mutex>
#include <random>

namespace FreeFly {

/**
 * @brief Process-wide random number generation
 */
class Random {
public:
    /**
     * @brief Seed the random number generator
     */
    static void Seed(unsigned int seed);

    /**
     * @brief Get a random float in range [0, 1]
     */
    static float Value();

private:
    static std::mt19937& GetEngine();
    static std::mutex& GetMutex();
};

/**
 * @brief Injectable source of uniform [0, 1] values
 *
 * Simulation code never calls Random directly; it draws from the source it
 * was handed so tests can fix or neutralise perturbations.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    [[nodiscard]] virtual float Value() = 0;

    /**
     * @brief Value() recentred to [-0.5, 0.5]
     */
    [[nodiscard]] float Centered() { return Value() - 0.5f; }
};

/**
 * @brief Draws from the process-wide Random engine
 */
class GlobalRandomSource final : public IRandomSource {
public:
    [[nodiscard]] float Value() override { return Random::Value(); }
};

/**
 * @brief Owns its own deterministic engine
 */
class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(unsigned int seed) : m_engine(seed) {}

    [[nodiscard]] float Value() override;

private:
    std::mt19937 m_engine;
    std::uniform_real_distribution<float> m_dist{0.0f, 1.0f};
};

/**
 * @brief Always returns 0.5, so every centred perturbation is zero
 */
class NeutralRandomSource final : public IRandomSource {
public:
    [[nodiscard]] float Value() override { return 0.5f; }
};

[[nodiscard]] std::shared_ptr<IRandomSource> MakeDefaultRandomSource();

} // namespace FreeFly
