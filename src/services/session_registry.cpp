#include "soakmon/session_registry.hpp"

#include <QMutexLocker>

namespace soakmon {

bool SessionRegistry::acquire(const QString& sessionId) {
    QMutexLocker lock(&mutex_);
    if (!activeId_.isEmpty() || sessionId.isEmpty()) {
        return false;
    }
    activeId_ = sessionId;
    return true;
}

void SessionRegistry::release(const QString& sessionId) {
    QMutexLocker lock(&mutex_);
    if (activeId_ == sessionId) {
        activeId_.clear();
    }
}

QString SessionRegistry::activeSessionId() const {
    QMutexLocker lock(&mutex_);
    return activeId_;
}

bool SessionRegistry::hasActiveSession() const {
    QMutexLocker lock(&mutex_);
    return !activeId_.isEmpty();
}

}  // namespace soakmon
