#include "accretion/systems/mission.hpp"

namespace Systems {

MissionState reduceMission(MissionState state, const EventLog& log) {
    if (state.terminal()) {
        return state;
    }
    // Class already reached when the run started
    if (state.spec.kind == ObjectiveKind::EvolveToClass && state.progress >= state.spec.target) {
        state.status = MissionStatus::Won;
        return state;
    }

    for (const auto& e : log.events) {
        if (e.type == EventType::Died && e.playerInvolved) {
            state.status = MissionStatus::Lost;
            return state;
        }

        switch (state.spec.kind) {
            case ObjectiveKind::AbsorbCount:
                if (e.type == EventType::Absorbed && e.playerInvolved) {
                    state.progress += 1.0;
                    if (state.progress >= state.spec.target) {
                        state.status = MissionStatus::Won;
                        return state;
                    }
                }
                break;
            case ObjectiveKind::EvolveToClass:
                if (e.type == EventType::Evolved && e.playerInvolved) {
                    double reached = static_cast<double>(e.bodyClass);
                    if (reached > state.progress) {
                        state.progress = reached;
                    }
                    if (state.progress >= state.spec.target) {
                        state.status = MissionStatus::Won;
                        return state;
                    }
                }
                break;
            case ObjectiveKind::SurviveDuration:
                break;
        }
    }

    if (state.spec.kind == ObjectiveKind::SurviveDuration) {
        state.progress += log.dt;
        if (state.progress >= state.spec.target) {
            state.status = MissionStatus::Won;
        }
    }

    return state;
}

MissionState startMission(const MissionSpec& spec, std::optional<BodyClass> playerClass) {
    MissionState state(spec);
    if (spec.kind == ObjectiveKind::EvolveToClass && playerClass) {
        state.progress = static_cast<double>(*playerClass);
        if (state.progress >= spec.target) {
            state.status = MissionStatus::Won;
        }
    }
    return state;
}

} // namespace Systems

std::string objectiveKindName(ObjectiveKind kind) {
    switch (kind) {
        case ObjectiveKind::SurviveDuration: return "survive";
        case ObjectiveKind::AbsorbCount:     return "absorb";
        case ObjectiveKind::EvolveToClass:   return "evolve";
    }
    return "survive";
}

std::optional<ObjectiveKind> objectiveKindFromName(const std::string& name) {
    if (name == "survive") return ObjectiveKind::SurviveDuration;
    if (name == "absorb")  return ObjectiveKind::AbsorbCount;
    if (name == "evolve")  return ObjectiveKind::EvolveToClass;
    return std::nullopt;
}

std::string missionStatusName(MissionStatus status) {
    switch (status) {
        case MissionStatus::InProgress: return "in_progress";
        case MissionStatus::Won:        return "won";
        case MissionStatus::Lost:       return "lost";
    }
    return "in_progress";
}

MissionSpec MissionSpec::survive(double seconds) {
    MissionSpec spec;
    spec.kind = ObjectiveKind::SurviveDuration;
    spec.target = seconds;
    return spec;
}

MissionSpec MissionSpec::absorb(unsigned int count) {
    MissionSpec spec;
    spec.kind = ObjectiveKind::AbsorbCount;
    spec.target = static_cast<double>(count);
    return spec;
}

MissionSpec MissionSpec::evolveTo(BodyClass bodyClass) {
    MissionSpec spec;
    spec.kind = ObjectiveKind::EvolveToClass;
    spec.target = static_cast<double>(bodyClass);
    return spec;
}
