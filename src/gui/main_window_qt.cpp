#include "main_window_qt.h"
#include <QDateTime>
#include <QScrollBar>
#include <QApplication>
#include <QHeaderView>
#include <QMessageBox>
#include <QSettings>
#include <QStatusBar>
#include <QStyle>
#include <QAction>
#include <QSignalBlocker>
#include "gamesentry/email_notifier.h"

namespace gamesentry {

namespace {

QString toQString(const std::string& s) {
    return QString::fromStdString(s);
}

QString bandColor(Seconds remaining) {
    switch (time_band(remaining)) {
        case TimeBand::PLENTY: return "#28a745";
        case TimeBand::LOW: return "#ffc107";
        case TimeBand::CRITICAL: return "#dc3545";
    }
    return "#dc3545";
}

} // namespace

MainWindow::MainWindow(Database& db, QWidget* parent)
    : QMainWindow(parent)
    , trayIcon_(nullptr)
    , trayMenu_(nullptr)
    , quitting_(false)
    , db_(db)
    , logLevel_(LogLevel::NORMAL)
    , lastPhase_(EnforcementPhase::IDLE)
{
    setWindowTitle("Game Sentry");
    resize(720, 640);

    setupUi();
    setupTray();

    // Engine callbacks and notifications arrive from other threads
    connect(this, &MainWindow::logMessageReceived, this, &MainWindow::appendLog, Qt::QueuedConnection);
    connect(this, &MainWindow::eventReceived, this, &MainWindow::handleEvent, Qt::QueuedConnection);

    std::vector<std::string> warnings;
    settings_ = AppSettings::load(db_, &warnings);
    for (const auto& warning : warnings) {
        logQuiet(LogChannel::SYSTEM, "Ignoring stored setting: " + toQString(warning));
    }

    int recovered = db_.close_interrupted_sessions();
    if (recovered > 0) {
        logNormal(LogChannel::SYSTEM, QString("Closed %1 session(s) interrupted by a crash").arg(recovered));
    } else if (recovered < 0) {
        logQuiet(LogChannel::SYSTEM, "Failed to close interrupted sessions: " + toQString(db_.get_last_error()));
    }

    auto lookup = [this](const std::string& id) {
        auto child = db_.get_child(id);
        return child && !child->display_name.empty() ? child->display_name : id;
    };

    dispatcher_ = std::make_unique<NotificationDispatcher>();
    dispatcher_->set_error_callback([this](const std::string& error) {
        emit logMessageReceived(static_cast<int>(LogLevel::QUIET), static_cast<int>(LogChannel::NOTIFY),
                                toQString(error));
    });
    dispatcher_->add_sink(std::make_shared<CallbackNotifier>(
        [this, lookup](const EnforcementEvent& event, const std::string& child_id) {
            NotificationMessage msg = describe_event(event, lookup(child_id));
            emit eventReceived(toQString(msg.title), toQString(msg.body), toQString(msg.sound),
                               static_cast<int>(event.type));
        }));
    if (settings_.email.is_complete()) {
        dispatcher_->add_sink(std::make_shared<EmailNotifier>(settings_.email, lookup));
        logNormal(LogChannel::NOTIFY, "Email notifications to " +
                  toQString(join_list(settings_.email.recipients, ", ")));
    }

    EnforcerOptions options;
    options.warning_threshold = settings_.warning_threshold();
    enforcer_ = std::make_unique<SessionEnforcer>(db_, *dispatcher_, clock_, options);

    EnforcerCallbacks callbacks;
    callbacks.on_log_message = [this](const std::string& message) {
        emit logMessageReceived(static_cast<int>(LogLevel::VERBOSE), static_cast<int>(LogChannel::SESSION),
                                toQString(message));
    };
    callbacks.on_error = [this](const std::string& error) {
        emit logMessageReceived(static_cast<int>(LogLevel::QUIET), static_cast<int>(LogChannel::SYSTEM),
                                toQString(error));
    };
    enforcer_->set_callbacks(callbacks);

    loadSettings();
    loadChildren();

    // Tick driver
    tickTimer_ = new QTimer(this);
    tickTimer_->setTimerType(Qt::PreciseTimer);
    connect(tickTimer_, &QTimer::timeout, this, &MainWindow::onTick);
    tickTimer_->start(settings_.tick_interval_ms);

    // Log flush timer for batched log updates
    logFlushTimer_ = new QTimer(this);
    logFlushTimer_->setTimerType(Qt::CoarseTimer);
    connect(logFlushTimer_, &QTimer::timeout, this, &MainWindow::flushPendingLogs);
    logFlushTimer_->start(LOG_FLUSH_INTERVAL_MS);

    refreshStatus();
    refreshLogTable();
}

MainWindow::~MainWindow() {
    tickTimer_->stop();
    if (dispatcher_) {
        dispatcher_->shutdown();
    }
}

void MainWindow::setupUi() {
    centralWidget_ = new QWidget(this);
    setCentralWidget(centralWidget_);

    mainLayout_ = new QVBoxLayout(centralWidget_);
    mainLayout_->setContentsMargins(6, 6, 6, 6);
    mainLayout_->setSpacing(8);

    // Child selector
    QHBoxLayout* childLayout = new QHBoxLayout();
    childLayout->addWidget(new QLabel("Child:"));
    childCombo_ = new QComboBox();
    childCombo_->setMinimumWidth(200);
    connect(childCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onChildChanged);
    childLayout->addWidget(childCombo_);
    childLayout->addStretch();
    mainLayout_->addLayout(childLayout);

    // Session display
    sessionGroup_ = new QGroupBox("Session");
    QGridLayout* sessionGrid = new QGridLayout(sessionGroup_);

    sessionGrid->addWidget(new QLabel("State:"), 0, 0);
    stateLabel_ = new QLabel("Idle");
    sessionGrid->addWidget(stateLabel_, 0, 1);

    sessionGrid->addWidget(new QLabel("Session time:"), 1, 0);
    timerLabel_ = new QLabel("00:00:00");
    timerLabel_->setFont(QFont("Monospace", 20, QFont::Bold));
    sessionGrid->addWidget(timerLabel_, 1, 1);

    sessionGrid->addWidget(new QLabel("Time left today:"), 2, 0);
    timeLeftLabel_ = new QLabel("Unlimited");
    timeLeftLabel_->setFont(QFont("Monospace", 14, QFont::Bold));
    sessionGrid->addWidget(timeLeftLabel_, 2, 1);

    usageProgress_ = new QProgressBar();
    usageProgress_->setRange(0, 100);
    usageProgress_->setValue(0);
    usageProgress_->setTextVisible(true);
    sessionGrid->addWidget(usageProgress_, 3, 0, 1, 2);
    usageLabel_ = new QLabel("00:00:00 played today");
    sessionGrid->addWidget(usageLabel_, 4, 0, 1, 2);

    mainLayout_->addWidget(sessionGroup_);

    // Control button
    QHBoxLayout* controlsLayout = new QHBoxLayout();
    controlsLayout->addStretch();
    startStopButton_ = new QPushButton("Start");
    startStopButton_->setStyleSheet("background-color: #4CAF50; color: white; padding: 8px 24px;");
    connect(startStopButton_, &QPushButton::clicked, this, &MainWindow::onStartStopClicked);
    controlsLayout->addWidget(startStopButton_);
    controlsLayout->addStretch();
    mainLayout_->addLayout(controlsLayout);

    // Today's sessions
    logsGroup_ = new QGroupBox("Today's Sessions");
    QVBoxLayout* logsLayout = new QVBoxLayout(logsGroup_);
    logTable_ = new QTableWidget(0, 4);
    logTable_->setHorizontalHeaderLabels({"ID", "Start", "Stop", "Duration"});
    logTable_->horizontalHeader()->setStretchLastSection(true);
    logTable_->verticalHeader()->setVisible(false);
    logTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    logTable_->setSelectionMode(QAbstractItemView::SingleSelection);
    logTable_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    logTable_->setMinimumHeight(120);
    logsLayout->addWidget(logTable_);

    QHBoxLayout* entryLayout = new QHBoxLayout();
    entryLayout->addStretch();
    deleteEntryButton_ = new QPushButton("Delete Entry");
    connect(deleteEntryButton_, &QPushButton::clicked, this, &MainWindow::onDeleteEntryClicked);
    entryLayout->addWidget(deleteEntryButton_);
    logsLayout->addLayout(entryLayout);
    mainLayout_->addWidget(logsGroup_);

    // Log controls
    QHBoxLayout* logControls = new QHBoxLayout();
    logControls->addWidget(new QLabel("Log:"));
    logVerbosityCombo_ = new QComboBox();
    logVerbosityCombo_->addItem("Quiet", static_cast<int>(LogLevel::QUIET));
    logVerbosityCombo_->addItem("Normal", static_cast<int>(LogLevel::NORMAL));
    logVerbosityCombo_->addItem("Verbose", static_cast<int>(LogLevel::VERBOSE));
    logVerbosityCombo_->addItem("Debug", static_cast<int>(LogLevel::DEBUG));
    logVerbosityCombo_->setCurrentIndex(1);
    connect(logVerbosityCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        logLevel_ = static_cast<LogLevel>(logVerbosityCombo_->itemData(index).toInt());
    });
    logControls->addWidget(logVerbosityCombo_);

    logSystemCheck_ = new QCheckBox("System");
    logSystemCheck_->setChecked(true);
    logControls->addWidget(logSystemCheck_);
    logSessionCheck_ = new QCheckBox("Session");
    logSessionCheck_->setChecked(true);
    logControls->addWidget(logSessionCheck_);
    logNotifyCheck_ = new QCheckBox("Notify");
    logNotifyCheck_->setChecked(true);
    logControls->addWidget(logNotifyCheck_);
    logDebugCheck_ = new QCheckBox("Debug");
    logDebugCheck_->setChecked(false);
    logControls->addWidget(logDebugCheck_);
    logControls->addStretch();

    closeToTrayCheck_ = new QCheckBox("Close to tray");
    closeToTrayCheck_->setChecked(true);
    logControls->addWidget(closeToTrayCheck_);
    mainLayout_->addLayout(logControls);

    // Log view - using QPlainTextEdit for better performance
    logGroup_ = new QGroupBox("Activity");
    QVBoxLayout* logLayout = new QVBoxLayout(logGroup_);
    logView_ = new QPlainTextEdit();
    logView_->setReadOnly(true);
    logView_->setFont(QFont("Monospace", 9));
    logView_->setMaximumBlockCount(MAX_LOG_LINES);
    logView_->setLineWrapMode(QPlainTextEdit::NoWrap);
    logView_->setMinimumHeight(100);
    logLayout->addWidget(logView_);
    mainLayout_->addWidget(logGroup_);

    statusBar()->showMessage("Ready");
}

void MainWindow::setupTray() {
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        return;
    }

    trayMenu_ = new QMenu(this);
    QAction* showAction = trayMenu_->addAction("Show Game Sentry");
    connect(showAction, &QAction::triggered, this, [this]() {
        showNormal();
        raise();
        activateWindow();
    });
    trayMenu_->addSeparator();
    QAction* quitAction = trayMenu_->addAction("Quit");
    connect(quitAction, &QAction::triggered, this, [this]() {
        quitting_ = true;
        close();
    });

    trayIcon_ = new QSystemTrayIcon(style()->standardIcon(QStyle::SP_ComputerIcon), this);
    trayIcon_->setToolTip("Game Sentry");
    trayIcon_->setContextMenu(trayMenu_);
    connect(trayIcon_, &QSystemTrayIcon::activated, this, &MainWindow::onTrayActivated);
    trayIcon_->show();
}

void MainWindow::onTrayActivated(QSystemTrayIcon::ActivationReason reason) {
    if (reason == QSystemTrayIcon::Trigger || reason == QSystemTrayIcon::DoubleClick) {
        if (isVisible()) {
            hide();
        } else {
            showNormal();
            raise();
            activateWindow();
        }
    }
}

void MainWindow::loadChildren() {
    QSignalBlocker blocker(childCombo_);
    childCombo_->clear();
    for (const auto& child : db_.list_children()) {
        QString name = toQString(child.display_name.empty() ? child.id : child.display_name);
        childCombo_->addItem(name, toQString(child.id));
    }

    if (childCombo_->count() == 0) {
        startStopButton_->setEnabled(false);
        statusBar()->showMessage("No children configured. Add one with: gamesentry-cli --child ID set-limits");
        return;
    }

    int index = childCombo_->findData(lastChildId_);
    childCombo_->setCurrentIndex(index >= 0 ? index : 0);
    lastChildId_ = currentChildId();
}

QString MainWindow::currentChildId() const {
    return childCombo_->currentData().toString();
}

void MainWindow::onChildChanged(int index) {
    Q_UNUSED(index);
    lastChildId_ = currentChildId();
    logDebug(LogChannel::DEBUG, "Selected child " + lastChildId_);
    refreshStatus();
    refreshLogTable();
}

void MainWindow::onStartStopClicked() {
    QString childId = currentChildId();
    if (childId.isEmpty()) return;
    std::string id = childId.toStdString();

    EnforcementSnapshot snap = enforcer_->snapshot(id);
    CommandResult result;
    if (snap.phase == EnforcementPhase::ACTIVE) {
        result = enforcer_->stop(id, StopReason::CHILD_REQUEST);
    } else {
        RoutineStep step = enforcer_->routine_step(id);
        result = step == RoutineStep::NONE ? enforcer_->start(id)
                                           : enforcer_->start(id, askRoutine(step));
    }

    if (!result.success) {
        QString message = toQString(result.message);
        logQuiet(LogChannel::SESSION, message);
        statusBar()->showMessage(message, 5000);
    }

    refreshStatus();
    refreshLogTable();
}

RoutineAnswers MainWindow::askRoutine(RoutineStep step) {
    RoutineAnswers answers;
    if (step == RoutineStep::ASK_LUNCH) {
        answers.had_lunch = QMessageBox::question(this, "Lunch Time!", "Have you had lunch yet?")
                            == QMessageBox::Yes;
        if (!answers.had_lunch) return answers;
    }
    answers.brushed_teeth = QMessageBox::question(this, "Brush Your Teeth!", "Have you brushed your teeth?")
                            == QMessageBox::Yes;
    return answers;
}

void MainWindow::onDeleteEntryClicked() {
    int row = logTable_->currentRow();
    if (row < 0) {
        statusBar()->showMessage("Select a session to delete", 3000);
        return;
    }

    int64_t id = logTable_->item(row, 0)->text().toLongLong();
    if (!db_.delete_session_log(id)) {
        logQuiet(LogChannel::SYSTEM, QString("Cannot delete session #%1: %2")
            .arg(id).arg(toQString(db_.get_last_error())));
        return;
    }

    Seconds total = enforcer_->recompute_accumulated(currentChildId().toStdString(),
                                                     local_date(clock_.now()));
    logNormal(LogChannel::SESSION, QString("Deleted session #%1, played today: %2")
        .arg(id).arg(toQString(format_duration(total))));
    refreshStatus();
    refreshLogTable();
}

void MainWindow::onTick() {
    enforcer_->evaluate();
    refreshStatus();
}

void MainWindow::refreshStatus() {
    QString childId = currentChildId();
    if (childId.isEmpty()) return;

    EnforcementSnapshot snap = enforcer_->snapshot(childId.toStdString());

    QString state;
    switch (snap.phase) {
        case EnforcementPhase::IDLE:
            state = "Idle";
            break;
        case EnforcementPhase::ACTIVE:
            state = "Playing";
            break;
        case EnforcementPhase::ON_BREAK:
            state = QString("On break (%1 left)").arg(toQString(format_time_remaining(snap.break_remaining)));
            break;
        case EnforcementPhase::LOCKED:
            state = "Daily limit reached";
            break;
    }
    updateLabel(stateLabel_, state);
    updateLabel(timerLabel_, toQString(format_duration(snap.session_elapsed)));
    updateLabel(usageLabel_, toQString(format_duration(snap.accumulated)) + " played today");

    if (snap.remaining) {
        updateLabel(timeLeftLabel_, toQString(format_time_remaining(*snap.remaining)));
        timeLeftLabel_->setStyleSheet("color: " + bandColor(*snap.remaining) + ";");
        int64_t daily = snap.daily_allowance->count();
        int pct = daily > 0 ? static_cast<int>(100 * snap.accumulated.count() / daily) : 100;
        updateProgressBar(usageProgress_, pct > 100 ? 100 : pct);
    } else {
        updateLabel(timeLeftLabel_, "Unlimited");
        timeLeftLabel_->setStyleSheet("");
        updateProgressBar(usageProgress_, 0);
    }

    bool active = snap.phase == EnforcementPhase::ACTIVE;
    startStopButton_->setText(active ? "Stop" : "Start");
    startStopButton_->setStyleSheet(active
        ? "background-color: #f44336; color: white; padding: 8px 24px;"
        : "background-color: #4CAF50; color: white; padding: 8px 24px;");
    startStopButton_->setEnabled(snap.phase == EnforcementPhase::IDLE || active);
    childCombo_->setEnabled(!active);

    if (trayIcon_) {
        trayIcon_->setToolTip("Game Sentry - " + childCombo_->currentText() + ": " + state);
    }

    if (snap.phase != lastPhase_) {
        logDebug(LogChannel::DEBUG, QString("Phase %1 -> %2")
            .arg(phase_to_string(lastPhase_)).arg(phase_to_string(snap.phase)));
        lastPhase_ = snap.phase;
        refreshLogTable();
    }
}

void MainWindow::refreshLogTable() {
    QString childId = currentChildId();
    logTable_->setRowCount(0);
    if (childId.isEmpty()) return;

    Timestamp now = clock_.now();
    auto logs = db_.get_session_logs_for_day(childId.toStdString(), local_date(now));
    logTable_->setRowCount(static_cast<int>(logs.size()));

    int row = 0;
    for (const auto& entry : logs) {
        logTable_->setItem(row, 0, new QTableWidgetItem(QString::number(entry.id)));
        logTable_->setItem(row, 1, new QTableWidgetItem(toQString(format_timestamp(entry.start))));
        logTable_->setItem(row, 2, new QTableWidgetItem(
            entry.stop ? toQString(format_timestamp(*entry.stop)) : QString("running")));
        logTable_->setItem(row, 3, new QTableWidgetItem(toQString(format_duration(entry.duration(now)))));
        ++row;
    }
}

void MainWindow::handleEvent(const QString& title, const QString& body, const QString& sound, int type) {
    QString oneLine = body;
    oneLine.replace('\n', ' ');
    logNormal(LogChannel::SESSION, title + ": " + oneLine);

    if (trayIcon_ && trayIcon_->isVisible()) {
        QSystemTrayIcon::MessageIcon icon = sound == "over" || sound == "warning"
            ? QSystemTrayIcon::Warning : QSystemTrayIcon::Information;
        trayIcon_->showMessage(title, body, icon, 5000);
        logDebug(LogChannel::NOTIFY, "Tray message: " + title);
    }

    if (settings_.sound_notifications && !sound.isEmpty()) {
        QApplication::beep();
        logDebug(LogChannel::NOTIFY, "Sound cue: " + sound);
    }

    auto eventType = static_cast<EventType>(type);
    if (eventType != EventType::WARNING_THRESHOLD) {
        refreshStatus();
        refreshLogTable();
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (!quitting_ && trayIcon_ && closeToTrayCheck_->isChecked()) {
        hide();
        trayIcon_->showMessage("Game Sentry", "Still running in the tray", QSystemTrayIcon::Information, 3000);
        event->ignore();
        return;
    }

    tickTimer_->stop();
    enforcer_->stop_all(StopReason::CHILD_REQUEST);
    dispatcher_->flush();
    saveSettings();
    event->accept();
    QApplication::quit();
}

void MainWindow::loadSettings() {
    QSettings settings("GameSentry", "GameSentry");
    restoreGeometry(settings.value("window/geometry").toByteArray());
    closeToTrayCheck_->setChecked(settings.value("window/closeToTray", true).toBool());
    lastChildId_ = settings.value("session/lastChild").toString();

    int level = settings.value("log/level", static_cast<int>(LogLevel::NORMAL)).toInt();
    int index = logVerbosityCombo_->findData(level);
    if (index >= 0) {
        logVerbosityCombo_->setCurrentIndex(index);
    }
    logDebugCheck_->setChecked(settings.value("log/debug", false).toBool());
}

void MainWindow::saveSettings() {
    QSettings settings("GameSentry", "GameSentry");
    settings.setValue("window/geometry", saveGeometry());
    settings.setValue("window/closeToTray", closeToTrayCheck_->isChecked());
    settings.setValue("session/lastChild", lastChildId_);
    settings.setValue("log/level", static_cast<int>(logLevel_));
    settings.setValue("log/debug", logDebugCheck_->isChecked());
}

bool MainWindow::shouldLog(LogLevel level, LogChannel channel) const {
    if (static_cast<int>(level) > static_cast<int>(logLevel_)) {
        return false;
    }
    switch (channel) {
        case LogChannel::SYSTEM: return logSystemCheck_->isChecked();
        case LogChannel::SESSION: return logSessionCheck_->isChecked();
        case LogChannel::NOTIFY: return logNotifyCheck_->isChecked();
        case LogChannel::DEBUG: return logDebugCheck_->isChecked();
    }
    return true;
}

void MainWindow::log(LogLevel level, LogChannel channel, const QString& message) {
    if (!shouldLog(level, channel)) return;

    static const char* channelNames[] = {"SYS", "SES", "NTF", "DBG"};
    QString timestamp = QDateTime::currentDateTime().toString("[HH:mm:ss] ");
    QString line = timestamp + QString("[%1] ").arg(channelNames[static_cast<int>(channel)]) + message;

    QMutexLocker locker(&logMutex_);
    pendingLogs_.append(line);
}

void MainWindow::logQuiet(LogChannel channel, const QString& message) {
    log(LogLevel::QUIET, channel, message);
}

void MainWindow::logNormal(LogChannel channel, const QString& message) {
    log(LogLevel::NORMAL, channel, message);
}

void MainWindow::logVerbose(LogChannel channel, const QString& message) {
    log(LogLevel::VERBOSE, channel, message);
}

void MainWindow::logDebug(LogChannel channel, const QString& message) {
    log(LogLevel::DEBUG, channel, message);
}

void MainWindow::appendLog(int level, int channel, const QString& message) {
    log(static_cast<LogLevel>(level), static_cast<LogChannel>(channel), message);
}

void MainWindow::flushPendingLogs() {
    QStringList logs;
    {
        QMutexLocker locker(&logMutex_);
        if (pendingLogs_.isEmpty()) return;
        logs.swap(pendingLogs_);
    }

    // Batch append all logs at once
    logView_->setUpdatesEnabled(false);
    for (const QString& line : logs) {
        logView_->appendPlainText(line);
    }
    logView_->setUpdatesEnabled(true);

    // Scroll to bottom
    QScrollBar* scrollBar = logView_->verticalScrollBar();
    scrollBar->setValue(scrollBar->maximum());
}

void MainWindow::updateProgressBar(QProgressBar* bar, int value) {
    if (bar->value() != value) {
        bar->setValue(value);
    }
}

void MainWindow::updateLabel(QLabel* label, const QString& text) {
    if (label->text() != text) {
        label->setText(text);
    }
}

} // namespace gamesentry
