// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/gui/tray_notifier.hpp>
#include <reel/version.hpp>
#include <QAction>
#include <QColor>
#include <QIcon>
#include <QMenu>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QPixmap>
#include <QSystemTrayIcon>

namespace reel::gui {

namespace {

constexpr int MESSAGE_TIMEOUT_MS = 4000;

// Film reel drawn programmatically
QIcon make_icon() {
    QPixmap pixmap(32, 32);
    pixmap.fill(Qt::transparent);
    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);

    QPen pen(QColor(0x00, 0x78, 0xd4), 2);
    painter.setPen(pen);
    painter.setBrush(QColor(0x00, 0xbc, 0xf2));
    painter.drawEllipse(QPointF(16, 16), 14, 14);

    painter.setBrush(QColor(0x1e, 0x1e, 0x1e));
    painter.setPen(Qt::NoPen);
    for (const QPointF& hole : {QPointF(16, 8), QPointF(24, 16), QPointF(16, 24), QPointF(8, 16)}) {
        painter.drawEllipse(hole, 3.5, 3.5);
    }
    painter.drawEllipse(QPointF(16, 16), 2, 2);

    painter.end();
    return QIcon(pixmap);
}

} // namespace

TrayNotifier::TrayNotifier(QObject* parent)
    : QObject(parent) {

    tray_icon_ = new QSystemTrayIcon(this);
    tray_icon_->setIcon(make_icon());
    tray_icon_->setToolTip(QString::fromUtf8(reel::APP_NAME.data(), static_cast<qsizetype>(reel::APP_NAME.size())));

    connect(tray_icon_, &QSystemTrayIcon::activated, this, [this](QSystemTrayIcon::ActivationReason reason) {
        if (reason == QSystemTrayIcon::Trigger) {
            emit show_window();
        }
    });

    setup_menu();
}

TrayNotifier::~TrayNotifier() {
    delete menu_;
}

void TrayNotifier::setup_menu() {
    menu_ = new QMenu();

    action_show_ = menu_->addAction("Show Window");
    connect(action_show_, &QAction::triggered, this, &TrayNotifier::show_window);

    menu_->addSeparator();

    action_quit_ = menu_->addAction("Quit");
    connect(action_quit_, &QAction::triggered, this, &TrayNotifier::quit);

    tray_icon_->setContextMenu(menu_);
}

void TrayNotifier::progress(const core::ProgressSnapshot& snapshot) {
    current_item_ = QString::fromStdString(snapshot.current_item_name);
    speed_text_ = QString::fromStdString(snapshot.speed_text);
    percent_ = snapshot.percent;
    tray_icon_->setToolTip(format_tooltip());
}

void TrayNotifier::finished(core::SessionState outcome, std::string_view message) {
    percent_ = -1.0;
    speed_text_.clear();
    current_item_.clear();
    tray_icon_->setToolTip(format_tooltip());

    if (!tray_icon_->isVisible() || !QSystemTrayIcon::supportsMessages()) {
        return;
    }

    auto text = QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size()));
    switch (outcome) {
        case core::SessionState::completed:
            tray_icon_->showMessage("Download finished", text, QSystemTrayIcon::Information, MESSAGE_TIMEOUT_MS);
            break;
        case core::SessionState::failed:
            tray_icon_->showMessage("Download failed", text, QSystemTrayIcon::Warning, MESSAGE_TIMEOUT_MS);
            break;
        default:
            break;
    }
}

void TrayNotifier::show() {
    tray_icon_->show();
}

void TrayNotifier::hide() {
    tray_icon_->hide();
}

bool TrayNotifier::available() const noexcept {
    return QSystemTrayIcon::isSystemTrayAvailable();
}

QString TrayNotifier::format_tooltip() const {
    QString tooltip = QString::fromUtf8(reel::APP_NAME.data(), static_cast<qsizetype>(reel::APP_NAME.size()));
    if (percent_ < 0.0 && current_item_.isEmpty()) {
        return tooltip;
    }

    if (!current_item_.isEmpty()) {
        tooltip += "\n" + current_item_;
    }
    if (percent_ >= 0.0) {
        tooltip += QString("\n%1%").arg(percent_, 0, 'f', 1);
    }
    if (!speed_text_.isEmpty()) {
        tooltip += "  " + speed_text_;
    }
    return tooltip;
}

} // namespace reel::gui
