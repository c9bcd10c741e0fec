/*
 * src/main_qt.cpp - Main entry point for the Qt application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <QApplication>
#include <QMessageBox>
#include <memory>
#include "gamesentry/common.h"
#include "gamesentry/database.h"
#include "gamesentry/instance_lock.h"
#include "gui/main_window_qt.h"

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    app.setApplicationName("Game Sentry");
    app.setApplicationVersion("1.0.0");
    app.setQuitOnLastWindowClosed(false);

    gamesentry::InstanceLock lock(gamesentry::INSTANCE_LOCK_NAME);
    if (!lock.try_acquire()) {
        QMessageBox::critical(nullptr, "Game Sentry", QString::fromStdString(lock.last_error()));
        return 1;
    }

    std::unique_ptr<gamesentry::Database> db;
    try {
        db = std::make_unique<gamesentry::Database>(gamesentry::DEFAULT_DB_PATH);
    } catch (const std::exception& e) {
        QMessageBox::critical(nullptr, "Game Sentry", e.what());
        return 1;
    }
    if (!db->initialize()) {
        QMessageBox::critical(nullptr, "Game Sentry",
                              "Failed to initialize database: " + QString::fromStdString(db->get_last_error()));
        return 1;
    }

    gamesentry::MainWindow window(*db);
    window.show();

    return app.exec();
}
