/**
 * @file main.cpp
 * @brief PolarLink Qt Application Entry Point
 */

#include "mainwindow.h"
#include <QApplication>
#include <QDebug>
#include <QStyleFactory>

#include <polarlink/polarlink.h>

namespace {

/// Forward library log records to Qt's message handler
void route_log_to_qt(const polarlink::LogRecord &record) {
  QString text = QString("[%1] %2")
                     .arg(QString::fromStdString(record.module),
                          QString::fromStdString(record.message));

  switch (record.level) {
  case polarlink::LogLevel::Trace:
  case polarlink::LogLevel::Debug:
    qDebug().noquote() << text;
    break;
  case polarlink::LogLevel::Info:
    qInfo().noquote() << text;
    break;
  case polarlink::LogLevel::Warn:
    qWarning().noquote() << text;
    break;
  default:
    qCritical().noquote() << text;
    break;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  QApplication app(argc, argv);

  // Application metadata
  app.setApplicationName("PolarLink");
  app.setApplicationVersion(polarlink::VERSION_STRING);
  app.setOrganizationName("PolarLink");

  // Use Fusion style for consistent look across desktops
  app.setStyle(QStyleFactory::create("Fusion"));

  auto &logger = polarlink::Logger::instance();
  logger.clear_sinks();
  logger.add_sink(std::make_shared<polarlink::CallbackSink>(route_log_to_qt));

  polarlink::ConfigManager config_manager;
  auto loaded = config_manager.init();
  if (loaded.is_error()) {
    qWarning().noquote() << "Using default configuration:"
                         << QString::fromStdString(
                                loaded.error().to_string());
    config_manager.reset_defaults();
  }
  logger.set_level(config_manager.get().log_level);

  // Create and show main window
  MainWindow window(config_manager.get());
  window.show();

  return app.exec();
}
