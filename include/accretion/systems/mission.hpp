/**
 * @file mission.hpp
 * @brief Mission objective, progress and the reducer advancing it from event logs
 */

#pragma once

#include <optional>
#include <string>

#include "accretion/core/body_class.hpp"
#include "accretion/core/events.hpp"

/**
 * @enum ObjectiveKind
 * @brief What the player has to achieve
 */
enum class ObjectiveKind {
    SurviveDuration,  ///< target = seconds of simulated time
    AbsorbCount,      ///< target = number of bodies absorbed by the player
    EvolveToClass     ///< target = class ordinal (BodyClass cast to double)
};

enum class MissionStatus {
    InProgress,
    Won,
    Lost
};

std::string objectiveKindName(ObjectiveKind kind);
std::optional<ObjectiveKind> objectiveKindFromName(const std::string& name);
std::string missionStatusName(MissionStatus status);

/**
 * @struct MissionSpec
 * @brief Objective of a scenario
 */
struct MissionSpec {
    ObjectiveKind kind = ObjectiveKind::SurviveDuration;
    double target = 60.0;

    static MissionSpec survive(double seconds);
    static MissionSpec absorb(unsigned int count);
    static MissionSpec evolveTo(BodyClass bodyClass);

    bool operator==(const MissionSpec& other) const {
        return kind == other.kind && target == other.target;
    }
};

/**
 * @struct MissionState
 * @brief Objective plus its progress. Won and Lost are terminal.
 */
struct MissionState {
    MissionSpec spec;
    double progress = 0.0;
    MissionStatus status = MissionStatus::InProgress;

    MissionState() = default;
    explicit MissionState(const MissionSpec& s) : spec(s) {}

    bool terminal() const { return status != MissionStatus::InProgress; }
};

namespace Systems {

/**
 * @brief Advances a mission by one tick's event log
 *
 * Events are applied in order. A Died event for the player loses the mission
 * whatever the objective; once terminal, nothing changes. Survival time is
 * added after the events, so dying and reaching the duration in the same
 * tick is a loss.
 */
MissionState reduceMission(MissionState state, const EventLog& log);

/**
 * @brief Initial state for a run whose player starts as playerClass
 *
 * An evolve objective the starting class already meets is won at once.
 */
MissionState startMission(const MissionSpec& spec, std::optional<BodyClass> playerClass);

} // namespace Systems
