#include "sync/model/RetryState.hpp"

using namespace ferry::sync::model;

std::string RetryState::phaseToString() const {
    switch (phase) {
    case Phase::Pending: return "pending";
    case Phase::Attempting: return "attempting";
    case Phase::Waiting: return "waiting";
    case Phase::Succeeded: return "succeeded";
    case Phase::Exhausted: return "exhausted";
    }
    return "unknown";
}
