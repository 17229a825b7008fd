/**
 * @file heartratechart.h
 * @brief Live heart rate plot widget
 */

#ifndef HEARTRATECHART_H
#define HEARTRATECHART_H

#include <QWidget>

#include <polarlink/hr_series.h>

/**
 * @brief Paints a HeartRateSeries as a line plot
 *
 * The x axis starts as a fixed window and then follows the newest
 * points; the y axis covers the display range and widens when a value
 * falls outside it.
 */
class HeartRateChart : public QWidget {
  Q_OBJECT

public:
  explicit HeartRateChart(QWidget *parent = nullptr);

  void addValue(int bpm);
  void clear();

  /// Points kept on screen
  void setMaxPoints(size_t maxPoints);

  const polarlink::HeartRateSeries &series() const { return series_; }

  QSize sizeHint() const override { return QSize(640, 360); }

protected:
  void paintEvent(QPaintEvent *event) override;

private:
  polarlink::HeartRateSeries series_;
};

#endif // HEARTRATECHART_H
