#include "accretion/core/settings.hpp"

#include <cmath>
#include <sstream>

std::string collisionModeName(CollisionMode mode) {
    return mode == CollisionMode::Elastic ? "elastic" : "absorb";
}

std::optional<CollisionMode> collisionModeFromName(const std::string& name) {
    if (name == "absorb") {
        return CollisionMode::Absorb;
    }
    if (name == "elastic") {
        return CollisionMode::Elastic;
    }
    return std::nullopt;
}

namespace {
    bool isFiniteValue(double v) {
        return std::isfinite(v);
    }
}

std::string validateSettings(const SimSettings& s) {
    std::ostringstream why;

    if (!isFiniteValue(s.theta) || s.theta <= 0.0) {
        why << "theta must be > 0 (got " << s.theta << ")";
    } else if (!isFiniteValue(s.dt) || s.dt <= 0.0) {
        why << "dt must be > 0 (got " << s.dt << ")";
    } else if (!isFiniteValue(s.softening) || s.softening < 0.0) {
        why << "softening must be >= 0 (got " << s.softening << ")";
    } else if (!isFiniteValue(s.restitution) || s.restitution < 0.0 || s.restitution > 1.0) {
        why << "restitution must be in [0, 1] (got " << s.restitution << ")";
    } else if (!isFiniteValue(s.gravitationalConstant) || s.gravitationalConstant <= 0.0) {
        why << "gravitational constant must be > 0 (got " << s.gravitationalConstant << ")";
    } else if (!isFiniteValue(s.maxSpeed) || s.maxSpeed < 0.0) {
        why << "max speed must be >= 0 (got " << s.maxSpeed << ")";
    } else if (s.leafCapacity < 1) {
        why << "leaf capacity must be >= 1";
    } else if (s.adaptiveTheta &&
               (!isFiniteValue(s.thetaMin) || !isFiniteValue(s.thetaMax) || s.thetaMin <= 0.0 || s.thetaMin > s.thetaMax)) {
        why << "adaptive theta range must satisfy 0 < min <= max (got ["
            << s.thetaMin << ", " << s.thetaMax << "])";
    } else if (s.adaptiveSoftening &&
               (!isFiniteValue(s.softeningMin) || !isFiniteValue(s.softeningMax) || s.softeningMin < 0.0 ||
                s.softeningMin > s.softeningMax)) {
        why << "adaptive softening range must satisfy 0 <= min <= max (got ["
            << s.softeningMin << ", " << s.softeningMax << "])";
    }

    return why.str();
}
