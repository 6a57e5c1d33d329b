#pragma once

#include <QMutex>
#include <QString>

namespace soakmon {

// Admits at most one active session among the orchestrators sharing it.
class SessionRegistry final {
public:
    [[nodiscard]] bool acquire(const QString& sessionId);
    void release(const QString& sessionId);

    [[nodiscard]] QString activeSessionId() const;
    [[nodiscard]] bool hasActiveSession() const;

private:
    mutable QMutex mutex_;
    QString activeId_;
};

}  // namespace soakmon
