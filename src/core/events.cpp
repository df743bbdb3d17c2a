#include "accretion/core/events.hpp"

std::string eventTypeName(EventType type) {
    switch (type) {
        case EventType::Spawned:  return "spawned";
        case EventType::Absorbed: return "absorbed";
        case EventType::Collided: return "collided";
        case EventType::Died:     return "died";
        case EventType::Evolved:  return "evolved";
        case EventType::Reset:    return "reset";
    }
    return "unknown";
}

bool SimEvent::operator==(const SimEvent& other) const {
    return type == other.type &&
           bodyId == other.bodyId &&
           otherId == other.otherId &&
           mass == other.mass &&
           speed == other.speed &&
           impulse == other.impulse &&
           bodyClass == other.bodyClass &&
           previousClass == other.previousClass &&
           isHazard == other.isHazard &&
           hazardKind == other.hazardKind &&
           playerInvolved == other.playerInvolved;
}

bool EventLog::operator==(const EventLog& other) const {
    return tick == other.tick && dt == other.dt && events == other.events;
}

IntentEvent IntentEvent::reset() {
    IntentEvent e;
    e.type = IntentType::Reset;
    return e;
}

IntentEvent IntentEvent::spawnBurst(const Position& center, double radius, std::size_t count,
                                    double baseMass, double speed) {
    IntentEvent e;
    e.type = IntentType::SpawnBurst;
    e.center = center;
    e.radius = radius;
    e.count = count;
    e.baseMass = baseMass;
    e.speed = speed;
    return e;
}

IntentEvent IntentEvent::spawnBody(const Position& pos, const Vector& vel, double mass,
                                   double radius, bool asPlayer) {
    IntentEvent e;
    e.type = IntentType::SpawnBody;
    e.center = pos;
    e.velocity = vel;
    e.baseMass = mass;
    e.bodyRadius = radius;
    e.asPlayer = asPlayer;
    return e;
}

IntentEvent IntentEvent::thrust(const Vector& direction, bool boost) {
    IntentEvent e;
    e.type = IntentType::PlayerThrust;
    e.direction = direction;
    e.boost = boost;
    return e;
}
