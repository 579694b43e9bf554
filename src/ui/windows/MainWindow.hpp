#pragma once

#include <QAction>
#include <QComboBox>
#include <QLabel>
#include <QMainWindow>
#include <QPushButton>
#include <QTimer>

namespace nettune::ui {

/**
 * @brief The DNS preset tool window.
 *
 * Shows the adapter and its DNS configuration, lets the user pick a preset
 * and apply or clear it. The "Ping" toolbar action asks the application to
 * open the ping monitor.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

signals:
    void pingMonitorRequested();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onProviderSelected(int index);
    void onSetDns();
    void onClearDns();
    void onTestDns();
    void onEditCustomDns();
    void onAbout();
    void onPollTick();

    void updateStatusCard();
    void updateStateLine();
    void updateButtons();

private:
    void setupUi();
    void setupMenuBar();
    void setupToolBar();
    void setupConnections();

    void loadTheme(const QString& themeName);
    void saveWindowState();

    // Status card
    QLabel* adapterLabel_{nullptr};
    QLabel* dnsStateLabel_{nullptr};
    QLabel* serversLabel_{nullptr};
    QLabel* stateLabel_{nullptr};

    // Controls
    QComboBox* providerCombo_{nullptr};
    QPushButton* setButton_{nullptr};
    QPushButton* clearButton_{nullptr};
    QPushButton* testButton_{nullptr};
    QPushButton* customButton_{nullptr};

    // Actions
    QAction* pingAction_{nullptr};
    QAction* refreshAction_{nullptr};
    QAction* quitAction_{nullptr};

    QTimer* pollTimer_{nullptr};
};

} // namespace nettune::ui
