// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/dispatcher.hpp>

class QObject;

namespace reel::gui {

// Runs tasks on the thread of `context` through the Qt event loop.
// `context` must outlive the dispatcher; tasks still queued when it is
// destroyed are dropped by Qt.
class QtDispatcher : public core::UiDispatcher {
public:
    explicit QtDispatcher(QObject* context) noexcept;

    void schedule(core::UiTask task, std::chrono::milliseconds delay = std::chrono::milliseconds{0}) override;

private:
    QObject* context_;
};

} // namespace reel::gui
