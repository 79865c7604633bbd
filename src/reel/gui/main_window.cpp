// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/gui/main_window.hpp>
#include <reel/gui/qt_dispatcher.hpp>
#include <reel/gui/tray_notifier.hpp>
#include <reel/core/error.hpp>
#include <reel/core/session_controller.hpp>
#include <reel/core/settings.hpp>
#include <reel/core/storage.hpp>
#include <reel/engine/ytdlp_engine.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>

#include <QApplication>
#include <QCheckBox>
#include <QClipboard>
#include <QCloseEvent>
#include <QComboBox>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QSettings>
#include <QVBoxLayout>
#include <QWidget>

using namespace reel::core;

namespace reel::gui {

namespace {

constexpr int PROGRESS_SCALE = 10;   // Progress bar steps per percent

QString modern_button_style() {
    return R"(
        QPushButton {
            background-color: #3a3a3a;
            border: 1px solid #555;
            border-radius: 4px;
            padding: 6px 16px;
            color: #eee;
            font-weight: 500;
        }
        QPushButton:hover {
            background-color: #4a4a4a;
            border-color: #666;
        }
        QPushButton:pressed {
            background-color: #2a2a2a;
        }
        QPushButton:disabled {
            background-color: #2a2a2a;
            color: #666;
            border-color: #333;
        }
    )";
}

QString primary_button_style() {
    return R"(
        QPushButton {
            background-color: #0078d4;
            border: 1px solid #0078d4;
            border-radius: 4px;
            padding: 6px 20px;
            color: white;
            font-weight: 600;
        }
        QPushButton:hover {
            background-color: #1a88e0;
        }
        QPushButton:pressed {
            background-color: #006cbe;
        }
        QPushButton:disabled {
            background-color: #2a2a2a;
            color: #666;
            border-color: #333;
        }
    )";
}

QString to_qstring(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QString stage_text(Stage stage) {
    switch (stage) {
        case Stage::fetching_metadata: return "Fetching info...";
        case Stage::downloading:       return "Downloading";
        case Stage::finishing:         return "Finishing...";
    }
    return {};
}

struct QualityChoice {
    const char* label;
    QualityTier tier;
};

constexpr QualityChoice QUALITY_CHOICES[] = {
    {"Best available", QualityTier::max},
    {"1080p", QualityTier::p1080},
    {"720p", QualityTier::p720},
    {"480p", QualityTier::p480},
    {"360p", QualityTier::p360},
};

} // namespace

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent) {

    setWindowTitle(to_qstring(reel::APP_NAME) + " " + QString::fromStdString(reel::version.to_string()));
    setMinimumSize(560, 300);

    setup_ui();
    setup_session();
    setup_tray();
    load_preferences();

    update_controls(SessionState::idle);
}

MainWindow::~MainWindow() {
    shutdown_session();
}

//=============================================================================
// Setup
//=============================================================================

void MainWindow::setup_ui() {
    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);
    layout->setContentsMargins(16, 16, 16, 16);
    layout->setSpacing(10);

    // URL row
    auto* url_row = new QHBoxLayout();
    url_edit_ = new QLineEdit(central);
    url_edit_->setPlaceholderText("https://www.youtube.com/watch?v=...");
    url_edit_->setClearButtonEnabled(true);
    connect(url_edit_, &QLineEdit::returnPressed, this, &MainWindow::on_download);
    url_row->addWidget(url_edit_, 1);

    btn_paste_ = new QPushButton("Paste", central);
    btn_paste_->setStyleSheet(modern_button_style());
    connect(btn_paste_, &QPushButton::clicked, this, &MainWindow::on_paste);
    url_row->addWidget(btn_paste_);
    layout->addLayout(url_row);

    // Options row
    auto* options_row = new QHBoxLayout();
    options_row->addWidget(new QLabel("Quality:", central));
    quality_combo_ = new QComboBox(central);
    for (const auto& choice : QUALITY_CHOICES) {
        quality_combo_->addItem(choice.label, static_cast<int>(choice.tier));
    }
    options_row->addWidget(quality_combo_);

    audio_check_ = new QCheckBox("Audio only", central);
    connect(audio_check_, &QCheckBox::toggled, this, &MainWindow::on_audio_toggled);
    options_row->addWidget(audio_check_);
    options_row->addStretch();
    layout->addLayout(options_row);

    // Control buttons
    auto* button_row = new QHBoxLayout();
    btn_download_ = new QPushButton("Download", central);
    btn_download_->setStyleSheet(primary_button_style());
    connect(btn_download_, &QPushButton::clicked, this, &MainWindow::on_download);
    button_row->addWidget(btn_download_);

    btn_pause_ = new QPushButton("Pause", central);
    btn_pause_->setStyleSheet(modern_button_style());
    connect(btn_pause_, &QPushButton::clicked, this, &MainWindow::on_pause);
    button_row->addWidget(btn_pause_);

    btn_resume_ = new QPushButton("Resume", central);
    btn_resume_->setStyleSheet(modern_button_style());
    connect(btn_resume_, &QPushButton::clicked, this, &MainWindow::on_resume);
    button_row->addWidget(btn_resume_);

    btn_cancel_ = new QPushButton("Cancel", central);
    btn_cancel_->setStyleSheet(modern_button_style());
    connect(btn_cancel_, &QPushButton::clicked, this, &MainWindow::on_cancel);
    button_row->addWidget(btn_cancel_);
    button_row->addStretch();
    layout->addLayout(button_row);

    // Progress
    progress_bar_ = new QProgressBar(central);
    progress_bar_->setRange(0, 100 * PROGRESS_SCALE);
    progress_bar_->setTextVisible(true);
    layout->addWidget(progress_bar_);

    auto* details = new QGridLayout();
    stage_label_ = new QLabel(central);
    item_label_ = new QLabel(central);
    size_label_ = new QLabel(central);
    speed_label_ = new QLabel(central);
    item_label_->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    speed_label_->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    details->addWidget(stage_label_, 0, 0);
    details->addWidget(item_label_, 0, 1);
    details->addWidget(size_label_, 1, 0);
    details->addWidget(speed_label_, 1, 1);
    layout->addLayout(details);

    message_label_ = new QLabel(central);
    message_label_->setWordWrap(true);
    layout->addWidget(message_label_);
    layout->addStretch();

    setCentralWidget(central);
    reset_progress();
}

void MainWindow::setup_session() {
    auto& settings = Settings::instance();
    const auto& data = settings.data();

    storage_ = std::make_unique<DirectoryStorage>(data.audio_dir, data.video_dir);

    engine::YtDlpOptions engine_options;
    engine_options.audio_format = data.audio_format;
    engine_options.audio_quality = data.audio_quality;
    engine_ = std::make_unique<engine::YtDlpEngine>(
        [] { return Settings::instance().ytdlp_executable(); }, engine_options);

    dispatcher_ = std::make_unique<QtDispatcher>(this);
    controller_ = std::make_unique<SessionController>(*engine_, *dispatcher_, *storage_, cleanup_,
                                                      settings.session_options());

    SessionCallbacks callbacks;
    callbacks.on_state = [this](SessionHandle, SessionState state) { on_state(state); };
    callbacks.on_snapshot = [this](const ProgressSnapshot& snapshot) { on_snapshot(snapshot); };
    callbacks.on_message = [this](std::string_view message, bool is_error) { on_message(message, is_error); };
    controller_->callbacks(std::move(callbacks));
}

void MainWindow::setup_tray() {
    tray_ = new TrayNotifier(this);
    if (!tray_->available()) {
        spdlog::debug("System tray not available");
        return;
    }

    connect(tray_, &TrayNotifier::show_window, this, [this]() {
        showNormal();
        raise();
        activateWindow();
    });
    connect(tray_, &TrayNotifier::quit, this, &QWidget::close);

    controller_->notifier(tray_);
    tray_->show();
}

void MainWindow::load_preferences() {
    QSettings settings("changcheng967", "Reel");

    auto tier = parse_quality(settings.value("download/quality", "max").toString().toStdString())
        .value_or(QualityTier::max);
    int index = quality_combo_->findData(static_cast<int>(tier));
    quality_combo_->setCurrentIndex(index >= 0 ? index : 0);

    audio_check_->setChecked(settings.value("download/audio_only", false).toBool());
    on_audio_toggled(audio_check_->isChecked());
}

void MainWindow::save_preferences() const {
    QSettings settings("changcheng967", "Reel");

    auto tier = static_cast<QualityTier>(quality_combo_->currentData().toInt());
    settings.setValue("download/quality", to_qstring(to_string(tier)));
    settings.setValue("download/audio_only", audio_check_->isChecked());
}

//=============================================================================
// User actions
//=============================================================================

void MainWindow::on_download() {
    auto mode = audio_check_->isChecked() ? MediaMode::audio : MediaMode::video;
    auto tier = static_cast<QualityTier>(quality_combo_->currentData().toInt());
    auto url = url_edit_->text().trimmed().toStdString();

    auto handle = controller_->start(url, mode, tier);
    if (!handle) {
        on_message(user_message(handle.error()), true);
        return;
    }

    save_preferences();
    spdlog::info("Started session {} ({}, {})", handle->id, to_string(mode), to_string(tier));
}

void MainWindow::on_paste() {
    auto text = QApplication::clipboard()->text().trimmed();
    if (!text.isEmpty()) {
        url_edit_->setText(text);
    }
}

void MainWindow::on_pause() {
    controller_->pause();
}

void MainWindow::on_resume() {
    controller_->resume();
}

void MainWindow::on_cancel() {
    controller_->cancel();
}

void MainWindow::on_audio_toggled(bool checked) {
    quality_combo_->setEnabled(!checked && !(controller_ && is_busy(controller_->state())));
}

void MainWindow::closeEvent(QCloseEvent* event) {
    shutdown_session();
    if (tray_) {
        tray_->hide();
    }
    event->accept();
}

//=============================================================================
// Session observers
//=============================================================================

void MainWindow::on_state(SessionState state) {
    update_controls(state);

    switch (state) {
        case SessionState::resolving:
            reset_progress();
            stage_label_->setText(stage_text(Stage::fetching_metadata));
            break;
        case SessionState::paused:
            stage_label_->setText("Paused");
            break;
        case SessionState::cancelling:
            stage_label_->setText("Cancelling...");
            break;
        case SessionState::cancelled:
            reset_progress();
            on_message("Download cancelled", false);
            break;
        case SessionState::completed:
            reset_progress();
            url_edit_->clear();
            break;
        case SessionState::idle:
            reset_progress();
            break;
        default:
            break;
    }
}

void MainWindow::on_snapshot(const ProgressSnapshot& snapshot) {
    auto state = controller_->state();
    if (state == SessionState::idle || is_terminal(state)) {
        return;
    }

    if (snapshot.indeterminate()) {
        progress_bar_->setRange(0, 0);
    } else {
        progress_bar_->setRange(0, 100 * PROGRESS_SCALE);
        progress_bar_->setValue(static_cast<int>(snapshot.percent * PROGRESS_SCALE));
        progress_bar_->setFormat(QString("%1%").arg(snapshot.percent, 0, 'f', 1));
    }

    if (state != SessionState::paused && state != SessionState::cancelling) {
        QString stage = stage_text(snapshot.stage);
        if (!snapshot.current_item_name.empty()) {
            stage += ": " + QString::fromStdString(snapshot.current_item_name);
        }
        stage_label_->setText(stage);
    }

    if (snapshot.item_total > 1) {
        item_label_->setText(QString("Item %1 of %2").arg(snapshot.item_index).arg(snapshot.item_total));
    } else {
        item_label_->clear();
    }
    size_label_->setText(QString::fromStdString(snapshot.size_text));
    speed_label_->setText(QString::fromStdString(snapshot.speed_text));
}

void MainWindow::on_message(std::string_view message, bool is_error) {
    if (message.empty()) {
        message_label_->clear();
        return;
    }
    message_label_->setStyleSheet(is_error ? "color: #e05252;" : "color: #4caf50;");
    message_label_->setText(to_qstring(message));
}

void MainWindow::update_controls(SessionState state) {
    bool busy = is_busy(state);

    url_edit_->setEnabled(!busy);
    btn_paste_->setEnabled(!busy);
    audio_check_->setEnabled(!busy);
    quality_combo_->setEnabled(!busy && !audio_check_->isChecked());
    btn_download_->setEnabled(!busy);

    btn_pause_->setEnabled(state == SessionState::active);
    btn_resume_->setEnabled(state == SessionState::paused);
    btn_cancel_->setEnabled(state == SessionState::resolving || state == SessionState::active ||
                            state == SessionState::paused);
}

void MainWindow::reset_progress() {
    progress_bar_->setRange(0, 100 * PROGRESS_SCALE);
    progress_bar_->setValue(0);
    progress_bar_->setFormat("%p%");
    stage_label_->clear();
    item_label_->clear();
    size_label_->clear();
    speed_label_->clear();
}

void MainWindow::shutdown_session() {
    if (!controller_) return;

    // Cancels and joins a busy worker; its files are ours to remove
    auto info = controller_->stop();
    controller_.reset();

    if (info) {
        spdlog::info("Window closed during a download, removing partial files");
        cleanup_.purge(info->output_dir, info->artifact_stems);
    }
}

} // namespace reel::gui
