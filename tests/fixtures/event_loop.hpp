#pragma once
#include <QCoreApplication>
#include <QElapsedTimer>
#include <chrono>
#include <thread>

namespace fixtures {

/// Deliver everything queued on the test thread (dispatches, provider completions)
inline void drainEvents() {
    for (int i = 0; i < 3; ++i) {
        QCoreApplication::sendPostedEvents();
        QCoreApplication::processEvents();
    }
}

/// Spin the event loop until pred() holds or the timeout expires
template <typename Pred>
bool waitUntil(Pred pred, int timeoutMs = 3000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}
