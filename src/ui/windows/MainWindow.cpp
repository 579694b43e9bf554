#include "ui/windows/MainWindow.hpp"

#include "app/Application.hpp"
#include "ui/widgets/Palette.hpp"
#include "ui/windows/CustomDnsDialog.hpp"

#include <QCloseEvent>
#include <QFile>
#include <QFormLayout>
#include <QGroupBox>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>

namespace nettune::ui {

namespace {

constexpr int kPollIntervalMs = 50;

} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle("NetTune");
    setMinimumSize(250, 420);

    setupUi();
    setupMenuBar();
    setupToolBar();
    setupConnections();

    auto& config = app::Application::instance().config().config();
    loadTheme(QString::fromStdString(config.theme));

    updateStatusCard();
    updateStateLine();
    updateButtons();

    pollTimer_ = new QTimer(this);
    connect(pollTimer_, &QTimer::timeout, this, &MainWindow::onPollTick);
    pollTimer_->start(kPollIntervalMs);
}

MainWindow::~MainWindow() {
    saveWindowState();
}

void MainWindow::setupUi() {
    auto* centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    auto* mainLayout = new QVBoxLayout(centralWidget);

    // Status card
    auto* statusBox = new QGroupBox("Status", centralWidget);
    auto* statusLayout = new QFormLayout(statusBox);
    adapterLabel_ = new QLabel("-", statusBox);
    dnsStateLabel_ = new QLabel("-", statusBox);
    serversLabel_ = new QLabel("-", statusBox);
    serversLabel_->setWordWrap(true);
    stateLabel_ = new QLabel(statusBox);
    stateLabel_->setWordWrap(true);
    statusLayout->addRow("Adapter:", adapterLabel_);
    statusLayout->addRow("DNS:", dnsStateLabel_);
    statusLayout->addRow("Servers:", serversLabel_);
    statusLayout->addRow(stateLabel_);
    mainLayout->addWidget(statusBox);

    // Preset selection
    auto* presetBox = new QGroupBox("DNS List", centralWidget);
    auto* presetLayout = new QVBoxLayout(presetBox);
    providerCombo_ = new QComboBox(presetBox);
    for (const auto& provider : core::builtinProviders()) {
        providerCombo_->addItem(QString::fromStdString(provider.displayName()),
                                static_cast<int>(provider.kind));
    }
    presetLayout->addWidget(providerCombo_);

    customButton_ = new QPushButton("Custom DNS...", presetBox);
    presetLayout->addWidget(customButton_);
    mainLayout->addWidget(presetBox);

    setButton_ = new QPushButton(centralWidget);
    clearButton_ = new QPushButton("Clear DNS", centralWidget);
    testButton_ = new QPushButton("Test DNS", centralWidget);
    mainLayout->addWidget(setButton_);
    mainLayout->addWidget(clearButton_);
    mainLayout->addWidget(testButton_);
    mainLayout->addStretch();

    // Restore the last selection
    auto& app = app::Application::instance();
    const auto& config = app.config().config();
    auto& vm = app.dnsViewModel();
    vm.setCustomServers(config.customPrimary, config.customSecondary);
    if (auto kind = core::providerKindFromString(config.lastProvider)) {
        vm.setSelectedProvider(*kind);
        providerCombo_->setCurrentIndex(providerCombo_->findData(static_cast<int>(*kind)));
    }
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");
    quitAction_ = fileMenu->addAction("&Quit", this, &QMainWindow::close);
    quitAction_->setShortcut(QKeySequence::Quit);

    auto* toolsMenu = menuBar()->addMenu("&Tools");

    pingAction_ = toolsMenu->addAction("&Ping", this, &MainWindow::pingMonitorRequested);
    pingAction_->setShortcut(QKeySequence("Ctrl+P"));
    pingAction_->setToolTip("Open the ping monitor");

    refreshAction_ = toolsMenu->addAction("&Refresh Status", this, [this]() {
        app::Application::instance().dnsViewModel().refreshStatus();
    });
    refreshAction_->setShortcut(QKeySequence::Refresh);

    auto* helpMenu = menuBar()->addMenu("&Help");
    helpMenu->addAction("&About NetTune", this, &MainWindow::onAbout);
}

void MainWindow::setupToolBar() {
    auto* toolBar = addToolBar("Main");
    toolBar->setMovable(false);

    toolBar->addAction(pingAction_);
    toolBar->addAction(refreshAction_);
}

void MainWindow::setupConnections() {
    auto& vm = app::Application::instance().dnsViewModel();

    connect(providerCombo_, &QComboBox::currentIndexChanged, this,
            &MainWindow::onProviderSelected);
    connect(setButton_, &QPushButton::clicked, this, &MainWindow::onSetDns);
    connect(clearButton_, &QPushButton::clicked, this, &MainWindow::onClearDns);
    connect(testButton_, &QPushButton::clicked, this, &MainWindow::onTestDns);
    connect(customButton_, &QPushButton::clicked, this, &MainWindow::onEditCustomDns);

    connect(&vm, &viewmodels::DnsViewModel::statusChanged, this, &MainWindow::updateStatusCard);
    connect(&vm, &viewmodels::DnsViewModel::stateChanged, this, &MainWindow::updateStateLine);
    connect(&vm, &viewmodels::DnsViewModel::stateChanged, this, &MainWindow::updateButtons);
    connect(&vm, &viewmodels::DnsViewModel::selectionChanged, this, &MainWindow::updateButtons);
}

void MainWindow::onProviderSelected(int index) {
    if (index < 0) {
        return;
    }

    auto kind = static_cast<core::DnsProviderKind>(providerCombo_->itemData(index).toInt());
    auto& vm = app::Application::instance().dnsViewModel();
    vm.setSelectedProvider(kind);

    if (kind == core::DnsProviderKind::Custom && !vm.provider().hasValidServers()) {
        onEditCustomDns();
    }
}

void MainWindow::onSetDns() {
    auto& vm = app::Application::instance().dnsViewModel();
    vm.requestOperation(core::DnsOperation::set(vm.provider()));
}

void MainWindow::onClearDns() {
    auto answer = QMessageBox::question(
        this, "Clear DNS", "Reset the DNS servers of this adapter to automatic (DHCP)?");
    if (answer != QMessageBox::Yes) {
        return;
    }
    app::Application::instance().dnsViewModel().requestOperation(core::DnsOperation::clear());
}

void MainWindow::onTestDns() {
    app::Application::instance().dnsViewModel().requestOperation(core::DnsOperation::test());
}

void MainWindow::onEditCustomDns() {
    auto& app = app::Application::instance();
    auto& vm = app.dnsViewModel();

    CustomDnsDialog dialog(QString::fromStdString(vm.customPrimary()),
                           QString::fromStdString(vm.customSecondary()), this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    vm.setCustomServers(dialog.primary().toStdString(), dialog.secondary().toStdString());

    auto& config = app.config().config();
    config.customPrimary = vm.customPrimary();
    config.customSecondary = vm.customSecondary();
    app.config().save();
}

void MainWindow::onAbout() {
    QMessageBox::about(this, "About NetTune",
                       "<h2>NetTune</h2>"
                       "<p>Version 1.0.0</p>"
                       "<p>Switches the system DNS between presets and shows live ping "
                       "latency.</p>");
}

void MainWindow::onPollTick() {
    app::Application::instance().dnsViewModel().poll();
}

void MainWindow::updateStatusCard() {
    auto& vm = app::Application::instance().dnsViewModel();
    const auto& status = vm.status();

    if (status.adapter) {
        adapterLabel_->setText(QString::fromStdString(*status.adapter));
    } else {
        adapterLabel_->setText("No Internet Connection Found");
    }

    auto state = vm.dnsState();
    switch (state.kind) {
    case core::DnsState::Kind::Static:
        dnsStateLabel_->setText("Static");
        break;
    case core::DnsState::Kind::Dhcp:
        dnsStateLabel_->setText("DHCP");
        break;
    case core::DnsState::Kind::None:
        dnsStateLabel_->setText("None");
        break;
    }
    dnsStateLabel_->setStyleSheet(colorStyle(dnsStateColor(state.kind)));

    QStringList servers;
    for (const auto& server : status.servers) {
        servers << QString::fromStdString(server);
    }
    serversLabel_->setText(servers.isEmpty() ? QString("-") : servers.join(", "));
}

void MainWindow::updateStateLine() {
    const auto& state = app::Application::instance().dnsViewModel().state();

    switch (state.kind) {
    case core::AppState::Kind::Idle:
        stateLabel_->clear();
        break;
    case core::AppState::Kind::Processing:
        stateLabel_->setText("Processing...");
        break;
    default:
        stateLabel_->setText(QString::fromStdString(state.message));
        break;
    }
    stateLabel_->setStyleSheet(colorStyle(appStateColor(state.kind)));
    statusBar()->showMessage(stateLabel_->text(), 5000);
}

void MainWindow::updateButtons() {
    auto& vm = app::Application::instance().dnsViewModel();
    auto provider = vm.provider();
    bool idle = !vm.isProcessing();

    setButton_->setText(QString("Set %1 DNS").arg(QString::fromStdString(provider.displayName())));
    setButton_->setEnabled(idle && (!provider.isCustom() || provider.hasValidServers()));
    clearButton_->setEnabled(idle);
    testButton_->setEnabled(idle);
    customButton_->setVisible(provider.isCustom());
    providerCombo_->setEnabled(idle);
}

void MainWindow::closeEvent(QCloseEvent* event) {
    saveWindowState();
    event->accept();
}

void MainWindow::loadTheme(const QString& themeName) {
    QString name = themeName.toLower();
    if (name.isEmpty()) {
        return;
    }
    name[0] = name[0].toUpper();

    QFile file(QString(":/themes/%1Theme.qss").arg(name));
    if (file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setStyleSheet(file.readAll());
    }
}

void MainWindow::saveWindowState() {
    auto& app = app::Application::instance();
    auto& config = app.config().config();

    auto geom = geometry();
    config.windowX = geom.x();
    config.windowY = geom.y();
    config.windowWidth = geom.width();
    config.windowHeight = geom.height();
    config.lastProvider = core::providerKindToString(app.dnsViewModel().selectedProvider());

    app.config().save();
}

} // namespace nettune::ui
