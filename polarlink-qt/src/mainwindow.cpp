/**
 * @file mainwindow.cpp
 * @brief Main window implementation
 */

#include "mainwindow.h"
#include "ui_mainwindow.h"

#include <QCloseEvent>
#include <QMessageBox>

#include <polarlink/polarlink.h>

MainWindow::MainWindow(const polarlink::MonitorConfig &config,
                       QWidget *parent)
    : QMainWindow(parent), ui(std::make_unique<Ui::MainWindow>()),
      bridge_(std::make_unique<PolarBridge>(config, this)) {

  ui->setupUi(this);
  ui->chart->setMaxPoints(config.display_points);
  setupUi();
  setupConnections();

  bridge_->initialize();
}

MainWindow::~MainWindow() = default;

// ============================================================================
// Setup
// ============================================================================

void MainWindow::setupUi() {
  setWindowTitle("PolarLink");
  setMinimumSize(480, 360);

  QFont bpm_font = ui->bpmLabel->font();
  bpm_font.setPointSize(32);
  bpm_font.setBold(true);
  ui->bpmLabel->setFont(bpm_font);

  // Initial state
  updateConnectionState(polarlink::ConnectionState::Disconnected);
}

void MainWindow::setupConnections() {
  // UI buttons
  connect(ui->connectButton, &QPushButton::clicked, this,
          &MainWindow::onConnectClicked);

  connect(ui->disconnectButton, &QPushButton::clicked, this,
          &MainWindow::onDisconnectClicked);

  connect(ui->clearButton, &QPushButton::clicked, ui->chart,
          &HeartRateChart::clear);

  connect(ui->actionQuit, &QAction::triggered, this, &MainWindow::close);

  connect(ui->actionAbout, &QAction::triggered, this,
          &MainWindow::onAboutClicked);

  // Bridge signals
  connect(bridge_.get(), &PolarBridge::connectionStateChanged, this,
          &MainWindow::onConnectionStateChanged);

  connect(bridge_.get(), &PolarBridge::connected, this,
          &MainWindow::onConnected);

  connect(bridge_.get(), &PolarBridge::heartRateReceived, this,
          &MainWindow::onHeartRate);

  connect(bridge_.get(), &PolarBridge::errorOccurred, this,
          &MainWindow::onErrorOccurred);
}

// ============================================================================
// UI Actions
// ============================================================================

void MainWindow::onConnectClicked() {
  ui->connectButton->setEnabled(false);
  ui->statusBar->showMessage("Searching for Polar H10...");
  bridge_->connectToDevice();
}

void MainWindow::onDisconnectClicked() {
  ui->statusBar->showMessage("Disconnecting...");
  bridge_->disconnect();
}

void MainWindow::onAboutClicked() {
  polarlink::VersionInfo v = polarlink::get_version();
  QMessageBox::about(
      this, "About PolarLink",
      QString("<h2>PolarLink</h2>"
              "<p>Version %1</p>"
              "<p>Heart rate and ECG monitor for the Polar H10.</p>"
              "<p>Bluetooth backend: %2</p>")
          .arg(v.version_string)
          .arg(v.bluetooth_backend ? "BlueZ" : "none"));
}

// ============================================================================
// Bridge Signal Handlers
// ============================================================================

void MainWindow::onConnectionStateChanged(polarlink::ConnectionState state) {
  updateConnectionState(state);
  ui->statusBar->showMessage(
      QString("State: %1").arg(polarlink::connection_state_name(state)));
}

void MainWindow::onConnected(const QString &name, const QString &address) {
  ui->statusBar->showMessage(
      QString("Connected to %1 (%2)")
          .arg(name.isEmpty() ? QString("Polar H10") : name, address));
}

void MainWindow::onHeartRate(int bpm, double signalQuality) {
  ui->bpmLabel->setText(QString("%1 BPM").arg(bpm));
  if (signalQuality >= 0.0) {
    ui->qualityLabel->setText(
        QString("Signal quality: %1%").arg(signalQuality, 0, 'f', 0));
  }
  ui->chart->addValue(bpm);
}

void MainWindow::onErrorOccurred(const QString &title,
                                 const QString &message) {
  ui->statusBar->showMessage(QString("%1: %2").arg(title, message));
  updateConnectionState(bridge_->connectionState());
}

// ============================================================================
// Window Events
// ============================================================================

void MainWindow::closeEvent(QCloseEvent *event) {
  bridge_->disconnect();
  event->accept();
}

// ============================================================================
// Helpers
// ============================================================================

void MainWindow::updateConnectionState(polarlink::ConnectionState state) {
  bool connected = (state == polarlink::ConnectionState::Connected);
  bool idle = (state == polarlink::ConnectionState::Disconnected ||
               state == polarlink::ConnectionState::Error);

  ui->connectButton->setEnabled(idle && !bridge_->isBusy());
  ui->disconnectButton->setEnabled(!idle || connected);

  if (idle) {
    ui->bpmLabel->setText("-- BPM");
  }
}
