// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/notification.hpp>
#include <QObject>
#include <QString>

class QSystemTrayIcon;
class QMenu;
class QAction;

namespace reel::gui {

// System tray icon showing live progress and the final outcome
class TrayNotifier : public QObject, public core::NotificationSink {
    Q_OBJECT

public:
    explicit TrayNotifier(QObject* parent = nullptr);
    ~TrayNotifier() override;

    void progress(const core::ProgressSnapshot& snapshot) override;
    void finished(core::SessionState outcome, std::string_view message) override;

    void show();
    void hide();

    [[nodiscard]] bool available() const noexcept;

signals:
    void show_window();
    void quit();

private:
    void setup_menu();
    [[nodiscard]] QString format_tooltip() const;

    QSystemTrayIcon* tray_icon_{nullptr};
    QMenu* menu_{nullptr};
    QAction* action_show_{nullptr};
    QAction* action_quit_{nullptr};

    QString current_item_;
    QString speed_text_;
    double percent_{-1.0};
};

} // namespace reel::gui
