/*
 * src/gui/main_window_qt.h - Main window class for the Qt GUI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef GAMESENTRY_MAIN_WINDOW_QT_H
#define GAMESENTRY_MAIN_WINDOW_QT_H

#include <QMainWindow>
#include <QWidget>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QComboBox>
#include <QProgressBar>
#include <QLabel>
#include <QPushButton>
#include <QPlainTextEdit>
#include <QGroupBox>
#include <QGridLayout>
#include <QTableWidget>
#include <QTimer>
#include <QMutex>
#include <QCheckBox>
#include <QCloseEvent>
#include <QSystemTrayIcon>
#include <QMenu>
#include <memory>
#include <string>

#include "gamesentry/clock.h"
#include "gamesentry/database.h"
#include "gamesentry/enforcer.h"
#include "gamesentry/notifier.h"
#include "gamesentry/settings.h"

namespace gamesentry {

// Log verbosity levels
enum class LogLevel {
    QUIET,    // Errors and limit events only
    NORMAL,   // + Session start/stop, notifications
    VERBOSE,  // + Engine diagnostics
    DEBUG     // Everything
};

// Log channels (can be filtered independently)
enum class LogChannel {
    SYSTEM,   // App lifecycle, errors
    SESSION,  // Enforcement activity
    NOTIFY,   // Tray, sound and email delivery
    DEBUG     // Internal debugging
};

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(Database& db, QWidget* parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent* event) override;

public slots:
    void onStartStopClicked();
    void onChildChanged(int index);
    void onDeleteEntryClicked();
    void onTick();

signals:
    void logMessageReceived(int level, int channel, const QString& message);
    void eventReceived(const QString& title, const QString& body, const QString& sound,
                       int type);

private slots:
    void appendLog(int level, int channel, const QString& message);
    void handleEvent(const QString& title, const QString& body, const QString& sound, int type);
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);
    void flushPendingLogs();

private:
    void setupUi();
    void setupTray();
    void loadChildren();
    void refreshStatus();
    void refreshLogTable();
    QString currentChildId() const;
    RoutineAnswers askRoutine(RoutineStep step);
    void updateProgressBar(QProgressBar* bar, int value);
    void updateLabel(QLabel* label, const QString& text);

    // Settings persistence
    void loadSettings();
    void saveSettings();

    // Leveled logging with channels
    void log(LogLevel level, LogChannel channel, const QString& message);
    void logQuiet(LogChannel channel, const QString& message);
    void logNormal(LogChannel channel, const QString& message);
    void logVerbose(LogChannel channel, const QString& message);
    void logDebug(LogChannel channel, const QString& message);
    bool shouldLog(LogLevel level, LogChannel channel) const;

    // UI components
    QWidget* centralWidget_;
    QVBoxLayout* mainLayout_;

    QComboBox* childCombo_;

    // Session display
    QGroupBox* sessionGroup_;
    QLabel* stateLabel_;
    QLabel* timerLabel_;
    QLabel* timeLeftLabel_;
    QProgressBar* usageProgress_;
    QLabel* usageLabel_;

    // Today's logs
    QGroupBox* logsGroup_;
    QTableWidget* logTable_;
    QPushButton* deleteEntryButton_;

    // Log verbosity control
    QComboBox* logVerbosityCombo_;
    QCheckBox* logSystemCheck_;
    QCheckBox* logSessionCheck_;
    QCheckBox* logNotifyCheck_;
    QCheckBox* logDebugCheck_;
    QCheckBox* closeToTrayCheck_;

    // Log view - using QPlainTextEdit for performance
    QGroupBox* logGroup_;
    QPlainTextEdit* logView_;

    QPushButton* startStopButton_;

    // Tray
    QSystemTrayIcon* trayIcon_;
    QMenu* trayMenu_;
    bool quitting_;

    // Engine
    Database& db_;
    AppSettings settings_;
    SystemClock clock_;
    std::unique_ptr<NotificationDispatcher> dispatcher_;
    std::unique_ptr<SessionEnforcer> enforcer_;

    // Timers
    QTimer* tickTimer_;
    QTimer* logFlushTimer_;

    LogLevel logLevel_;
    QString lastChildId_;
    EnforcementPhase lastPhase_;

    // Log batching
    QMutex logMutex_;
    QStringList pendingLogs_;
    static constexpr int MAX_LOG_LINES = 500;
    static constexpr int LOG_FLUSH_INTERVAL_MS = 100;
};

} // namespace gamesentry

#endif // GAMESENTRY_MAIN_WINDOW_QT_H
