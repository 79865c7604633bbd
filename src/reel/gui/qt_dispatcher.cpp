// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/gui/qt_dispatcher.hpp>
#include <QMetaObject>
#include <QObject>
#include <QTimer>

namespace reel::gui {

QtDispatcher::QtDispatcher(QObject* context) noexcept
    : context_(context) {}

void QtDispatcher::schedule(core::UiTask task, std::chrono::milliseconds delay) {
    if (!task) return;

    // Timers must be started from the context's own thread
    QObject* context = context_;
    QMetaObject::invokeMethod(context, [context, task = std::move(task), delay]() mutable {
        if (delay.count() <= 0) {
            task();
            return;
        }
        QTimer::singleShot(delay, context, std::move(task));
    }, Qt::QueuedConnection);
}

} // namespace reel::gui
