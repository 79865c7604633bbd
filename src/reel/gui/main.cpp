// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/gui/main_window.hpp>
#include <reel/core/error.hpp>
#include <reel/core/logging.hpp>
#include <reel/core/settings.hpp>
#include <reel/version.hpp>

#include <QApplication>
#include <QMessageBox>
#include <QStyleFactory>

namespace {

void apply_default_style() {
    QApplication::setStyle(QStyleFactory::create("Fusion"));

    // Dark palette
    QPalette dark;
    dark.setColor(QPalette::Window, QColor(30, 30, 30));
    dark.setColor(QPalette::WindowText, QColor(220, 220, 220));
    dark.setColor(QPalette::Base, QColor(25, 25, 25));
    dark.setColor(QPalette::AlternateBase, QColor(45, 45, 45));
    dark.setColor(QPalette::ToolTipBase, QColor(30, 30, 30));
    dark.setColor(QPalette::ToolTipText, QColor(220, 220, 220));
    dark.setColor(QPalette::Text, QColor(220, 220, 220));
    dark.setColor(QPalette::Button, QColor(45, 45, 45));
    dark.setColor(QPalette::ButtonText, QColor(220, 220, 220));
    dark.setColor(QPalette::BrightText, QColor(255, 0, 0));
    dark.setColor(QPalette::Link, QColor(42, 130, 218));
    dark.setColor(QPalette::Highlight, QColor(42, 130, 218));
    dark.setColor(QPalette::HighlightedText, QColor(30, 30, 30));

    QApplication::setPalette(dark);
}

} // namespace

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);

    app.setApplicationName("Reel");
    app.setApplicationDisplayName("Reel");
    app.setApplicationVersion(reel::version.to_string().c_str());
    app.setOrganizationName("changcheng967");

    apply_default_style();

    auto& settings = reel::core::Settings::instance();
    auto settings_file = reel::core::Settings::default_file();
    auto settings_error = settings.load(settings_file);

    if (auto ec = reel::core::init_logging(settings.data().log_level)) {
        QMessageBox::warning(nullptr, "Reel", QString("Logging setup failed: %1").arg(ec.message().c_str()));
    }

    if (settings_error) {
        // Continue with defaults
        auto text = reel::core::user_message(settings_error, "cannot use " + settings_file.string());
        QMessageBox::warning(nullptr, "Reel", QString::fromStdString(text));
    }

    reel::gui::MainWindow window;
    window.show();

    return app.exec();
}
