/**
 * @file polarbridge.cpp
 * @brief PolarLink Bridge Implementation
 */

#include "polarbridge.h"
#include <QDebug>
#include <QMetaObject>

#include <atomic>
#include <thread>

#include <polarlink/polarlink.h>

// ============================================================================
// PolarBridge Implementation
// ============================================================================

class PolarBridge::Impl {
public:
  explicit Impl(const polarlink::MonitorConfig &cfg) : config(cfg) {}

  polarlink::MonitorConfig config;
  std::unique_ptr<polarlink::PolarH10> device;

  std::thread worker;
  std::atomic<bool> busy{false};

  void join_worker() {
    if (worker.joinable()) {
      worker.join();
    }
  }
};

PolarBridge::PolarBridge(const polarlink::MonitorConfig &config,
                         QObject *parent)
    : QObject(parent), impl_(std::make_unique<Impl>(config)) {}

PolarBridge::~PolarBridge() {
  impl_->join_worker();
  if (impl_->device) {
    auto result = impl_->device->disconnect();
    if (result.is_error()) {
      qWarning() << "Disconnect on shutdown failed:"
                 << QString::fromStdString(result.error().message);
    }
    impl_->device.reset();
  }
}

// ============================================================================
// Properties
// ============================================================================

bool PolarBridge::isConnected() const {
  return impl_->device && impl_->device->is_connected();
}

bool PolarBridge::isBusy() const { return impl_->busy; }

polarlink::ConnectionState PolarBridge::connectionState() const {
  return impl_->device ? impl_->device->connection_state()
                       : polarlink::ConnectionState::Disconnected;
}

// ============================================================================
// Initialization
// ============================================================================

void PolarBridge::initialize() {
  if (impl_->device) {
    return;
  }

  auto transport = polarlink::create_default_transport();
  if (transport.is_error()) {
    qWarning() << "Failed to initialize Bluetooth:"
               << QString::fromStdString(transport.error().message);
    emit errorOccurred("Initialization Error",
                       QString::fromStdString(transport.error().message));
    return;
  }

  std::shared_ptr<polarlink::GattTransport> shared =
      std::move(transport.value());
  impl_->device = std::make_unique<polarlink::PolarH10>(
      std::move(shared), impl_->config.to_device_config());

  setupCallbacks();
}

void PolarBridge::setupCallbacks() {
  // State changes arrive on worker or supervisor threads
  impl_->device->on_state_changed([this](polarlink::ConnectionState state) {
    QMetaObject::invokeMethod(
        this,
        [this, state]() {
          emit connectionStateChanged(state);
          if (state == polarlink::ConnectionState::Disconnected) {
            emit disconnected();
          }
        },
        Qt::QueuedConnection);
  });

  impl_->device->on_error([this](const polarlink::Error &err) {
    QString message = QString::fromStdString(err.message);
    QMetaObject::invokeMethod(
        this, [this, message]() { emit errorOccurred("Connection", message); },
        Qt::QueuedConnection);
  });
}

// ============================================================================
// Connection
// ============================================================================

void PolarBridge::connectToDevice() {
  if (!impl_->device) {
    emit errorOccurred("Not Ready", "Bluetooth is not available");
    return;
  }
  if (impl_->busy.exchange(true)) {
    return;
  }

  impl_->join_worker();
  impl_->worker = std::thread([this]() { runConnect(); });
}

void PolarBridge::runConnect() {
  auto &device = *impl_->device;

  auto result = device.connect();
  if (result.is_ok()) {
    result = device.start_hr_monitoring(
        [this](const polarlink::HeartRateReading &reading) {
          int bpm = reading.measurement.bpm;
          double quality =
              reading.quality ? reading.quality->signal_quality : -1.0;
          QMetaObject::invokeMethod(
              this, [this, bpm, quality]() {
                emit heartRateReceived(bpm, quality);
              },
              Qt::QueuedConnection);
        });
  }

  // Cleared before notifying so the UI sees the bridge as idle
  impl_->busy = false;

  if (result.is_error()) {
    QString message = QString::fromStdString(result.error().message);
    auto dropped = device.disconnect();
    if (dropped.is_error()) {
      qWarning() << "Cleanup after failed connect:"
                 << QString::fromStdString(dropped.error().message);
    }
    QMetaObject::invokeMethod(
        this,
        [this, message]() { emit errorOccurred("Connection Failed", message); },
        Qt::QueuedConnection);
  } else {
    auto info = device.device_info();
    QString name = info ? QString::fromStdString(info->name) : QString();
    QString address =
        info ? QString::fromStdString(info->address) : QString();
    QMetaObject::invokeMethod(
        this, [this, name, address]() { emit connected(name, address); },
        Qt::QueuedConnection);
  }
}

void PolarBridge::disconnect() {
  if (!impl_->device) {
    return;
  }

  // A connect in flight finishes first; its retries are bounded
  impl_->join_worker();

  auto result = impl_->device->disconnect();
  if (result.is_error()) {
    emit errorOccurred("Disconnect Error",
                       QString::fromStdString(result.error().message));
  }
}
