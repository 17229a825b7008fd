/**
 * @file mainwindow.h
 * @brief Main application window
 */

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "polarbridge.h"
#include <QMainWindow>
#include <memory>

QT_BEGIN_NAMESPACE
namespace Ui {
class MainWindow;
}
QT_END_NAMESPACE

class MainWindow : public QMainWindow {
  Q_OBJECT

public:
  explicit MainWindow(const polarlink::MonitorConfig &config,
                      QWidget *parent = nullptr);
  ~MainWindow();

protected:
  void closeEvent(QCloseEvent *event) override;

private slots:
  // UI Actions
  void onConnectClicked();
  void onDisconnectClicked();
  void onAboutClicked();

  // Bridge signals
  void onConnectionStateChanged(polarlink::ConnectionState state);
  void onConnected(const QString &name, const QString &address);
  void onHeartRate(int bpm, double signalQuality);
  void onErrorOccurred(const QString &title, const QString &message);

private:
  std::unique_ptr<Ui::MainWindow> ui;
  std::unique_ptr<PolarBridge> bridge_;

  void setupUi();
  void setupConnections();
  void updateConnectionState(polarlink::ConnectionState state);
};

#endif // MAINWINDOW_H
