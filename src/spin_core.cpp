#include "spin_core.hpp"

const char* toString(CoreStatus status) {
    switch (status) {
        case CoreStatus::IDLE: return "IDLE";
        case CoreStatus::ACCELERATING: return "ACCELERATING";
        case CoreStatus::RUNNING: return "RUNNING";
        case CoreStatus::DECELERATING: return "DECELERATING";
        case CoreStatus::EMERGENCY_STOPPED: return "EMERGENCY_STOPPED";
    }
    return "UNKNOWN";
}

const char* toString(SafetyLevel level) {
    switch (level) {
        case SafetyLevel::GREEN: return "green";
        case SafetyLevel::YELLOW: return "yellow";
        case SafetyLevel::ORANGE: return "orange";
        case SafetyLevel::RED: return "red";
    }
    return "unknown";
}

const char* toString(SimError error) {
    switch (error) {
        case SimError::None: return "None";
        case SimError::UnknownScenario: return "UnknownScenario";
        case SimError::AlreadyRunning: return "AlreadyRunning";
        case SimError::NotRunning: return "NotRunning";
        case SimError::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}
