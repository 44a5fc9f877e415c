#pragma once

#include "PostureConfig.hpp"

namespace core {

/**
 * Squat quality composite: 50% depth, 25% tempo, 25% stability.
 * Every sub-score and the composite are clamped to [0, 1].
 */
class SquatQuality {
public:
    struct Scores {
        float depth = 0.0f;
        float tempo = 0.0f;
        float stability = 0.0f;
        float composite = 0.0f;
    };

    explicit SquatQuality(const ClassifierConfig& config);

    /**
     * Depth score is the normalized depth itself.
     */
    [[nodiscard]] float depthScore(float depthNorm) const;

    /**
     * Tempo score from descent time (s): 1 inside the tempo window,
     * linear ramp from 0 when faster, linear falloff when slower.
     */
    [[nodiscard]] float tempoScore(float descentTime) const;

    /**
     * Stability score: 1 at rest, 0 at or above the velocity limit.
     */
    [[nodiscard]] float stabilityScore(float velocity) const;

    /**
     * Score the current tick. Tempo and stability only count in bottom.
     */
    [[nodiscard]] Scores evaluate(float depthNorm, float descentTime, float velocity, bool inBottom) const;

    [[nodiscard]] bool isPerfect(float composite) const { return composite >= perfectThreshold_; }
    [[nodiscard]] bool isValid(float composite) const { return composite >= validThreshold_; }

private:
    float tempoMin_;
    float tempoMax_;
    float velocityLimit_;
    float perfectThreshold_;
    float validThreshold_;
};

} // namespace core
