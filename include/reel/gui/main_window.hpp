// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/cleanup_service.hpp>
#include <reel/core/session.hpp>
#include <QMainWindow>
#include <memory>
#include <string_view>

class QLineEdit;
class QPushButton;
class QComboBox;
class QCheckBox;
class QProgressBar;
class QLabel;
class QCloseEvent;

namespace reel::core {
class DirectoryStorage;
class SessionController;
}

namespace reel::engine {
class YtDlpEngine;
}

namespace reel::gui {

class QtDispatcher;
class TrayNotifier;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void on_download();
    void on_paste();
    void on_pause();
    void on_resume();
    void on_cancel();
    void on_audio_toggled(bool checked);

private:
    void setup_ui();
    void setup_session();
    void setup_tray();
    void load_preferences();
    void save_preferences() const;

    void on_state(core::SessionState state);
    void on_snapshot(const core::ProgressSnapshot& snapshot);
    void on_message(std::string_view message, bool is_error);
    void update_controls(core::SessionState state);
    void reset_progress();

    // Cancels a running session and purges its partial files synchronously
    void shutdown_session();

    // UI
    QLineEdit* url_edit_{nullptr};
    QPushButton* btn_paste_{nullptr};
    QComboBox* quality_combo_{nullptr};
    QCheckBox* audio_check_{nullptr};
    QPushButton* btn_download_{nullptr};
    QPushButton* btn_pause_{nullptr};
    QPushButton* btn_resume_{nullptr};
    QPushButton* btn_cancel_{nullptr};
    QProgressBar* progress_bar_{nullptr};
    QLabel* stage_label_{nullptr};
    QLabel* item_label_{nullptr};
    QLabel* size_label_{nullptr};
    QLabel* speed_label_{nullptr};
    QLabel* message_label_{nullptr};
    TrayNotifier* tray_{nullptr};

    // Session, destroyed in reverse order
    core::CleanupService cleanup_;
    std::unique_ptr<core::DirectoryStorage> storage_;
    std::unique_ptr<engine::YtDlpEngine> engine_;
    std::unique_ptr<QtDispatcher> dispatcher_;
    std::unique_ptr<core::SessionController> controller_;
};

} // namespace reel::gui
