#include "soakmon/errors.hpp"

namespace soakmon {

QString errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::Configuration:
        return "configuration_error";
    case ErrorCode::AlreadyRunning:
        return "already_running_error";
    case ErrorCode::NoActiveSession:
        return "no_active_session_error";
    case ErrorCode::SnapshotCollection:
        return "snapshot_collection_error";
    case ErrorCode::Analysis:
        return "analysis_error";
    case ErrorCode::Subscriber:
        return "subscriber_error";
    }
    return "unknown";
}

QJsonObject Error::toJson() const {
    return {
        {"code", errorCodeName(code)},
        {"message", message},
    };
}

}  // namespace soakmon
