#pragma once

#include <QJsonObject>
#include <QString>

namespace soakmon {

enum class ErrorCode {
    None,
    Configuration,
    AlreadyRunning,
    NoActiveSession,
    SnapshotCollection,
    Analysis,
    Subscriber,
};

QString errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    QString message;

    [[nodiscard]] bool isError() const { return code != ErrorCode::None; }
    [[nodiscard]] QJsonObject toJson() const;
};

}  // namespace soakmon
