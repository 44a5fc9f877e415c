#include "core/SquatQuality.hpp"
#include <algorithm>
#include <cmath>

namespace core {

namespace {
float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}
} // namespace

SquatQuality::SquatQuality(const ClassifierConfig& config)
    : tempoMin_(config.tempoWindowMin),
      tempoMax_(config.tempoWindowMax),
      velocityLimit_(config.stabilityVelocityLimit),
      perfectThreshold_(config.perfectSquatThreshold),
      validThreshold_(config.validSquatThreshold) {
}

float SquatQuality::depthScore(float depthNorm) const {
    return clamp01(depthNorm);
}

float SquatQuality::tempoScore(float descentTime) const {
    if (!std::isfinite(descentTime) || descentTime <= 0.0f) {
        return 0.0f;
    }
    if (descentTime < tempoMin_) {
        // Dropping into the squat too fast
        return clamp01(descentTime / tempoMin_);
    }
    if (descentTime > tempoMax_) {
        return clamp01(1.0f - (descentTime - tempoMax_) / tempoMax_);
    }
    return 1.0f;
}

float SquatQuality::stabilityScore(float velocity) const {
    return clamp01(1.0f - std::abs(velocity) / velocityLimit_);
}

SquatQuality::Scores SquatQuality::evaluate(float depthNorm, float descentTime,
                                            float velocity, bool inBottom) const {
    Scores s;
    s.depth = depthScore(depthNorm);
    if (inBottom) {
        s.tempo = tempoScore(descentTime);
        s.stability = stabilityScore(velocity);
    }
    s.composite = clamp01(QUALITY_WEIGHT_DEPTH * s.depth +
                          QUALITY_WEIGHT_TEMPO * s.tempo +
                          QUALITY_WEIGHT_STABILITY * s.stability);
    return s;
}

} // namespace core
