// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/session.hpp>
#include <string_view>

namespace reel::core {

// Optional out-of-window notification surface (tray, desktop notifications).
// Called on the UI thread.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void progress(const ProgressSnapshot& snapshot) = 0;
    virtual void finished(SessionState outcome, std::string_view message) = 0;
};

} // namespace reel::core
