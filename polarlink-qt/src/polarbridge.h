/**
 * @file polarbridge.h
 * @brief Bridge between the Qt UI and libpolarlink
 *
 * Wraps a PolarH10 session and exposes it via Qt signals. Connecting
 * blocks for several seconds, so it runs on a worker thread; device
 * callbacks are re-emitted on the UI thread.
 */

#ifndef POLARBRIDGE_H
#define POLARBRIDGE_H

#include <QObject>
#include <QString>
#include <memory>

#include <polarlink/config.h>
#include <polarlink/state_machine.h>

class PolarBridge : public QObject {
  Q_OBJECT
  Q_PROPERTY(bool isConnected READ isConnected NOTIFY connectionStateChanged)

public:
  explicit PolarBridge(const polarlink::MonitorConfig &config,
                       QObject *parent = nullptr);
  ~PolarBridge();

  /**
   * @brief Create the Bluetooth transport and device session
   *
   * Call after the UI has connected to the signals; failures are
   * reported through errorOccurred().
   */
  void initialize();

  bool isConnected() const;
  bool isBusy() const;
  polarlink::ConnectionState connectionState() const;

  // ========================================================================
  // Connection
  // ========================================================================

  Q_INVOKABLE void connectToDevice();
  Q_INVOKABLE void disconnect();

signals:
  void connectionStateChanged(polarlink::ConnectionState state);
  void connected(const QString &name, const QString &address);
  void disconnected();

  /// @param signalQuality 0-100, or negative before any score exists
  void heartRateReceived(int bpm, double signalQuality);

  void errorOccurred(const QString &title, const QString &message);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;

  void setupCallbacks();
  void runConnect();
};

#endif // POLARBRIDGE_H
