/**
 * @file heartratechart.cpp
 * @brief Heart rate plot implementation
 */

#include "heartratechart.h"

#include <QFontMetrics>
#include <QPainter>
#include <QPainterPath>

#include <algorithm>
#include <cmath>

namespace {

constexpr int MARGIN_LEFT = 60;
constexpr int MARGIN_RIGHT = 20;
constexpr int MARGIN_TOP = 36;
constexpr int MARGIN_BOTTOM = 44;

constexpr int Y_GRID_STEP = 20;
constexpr int X_GRID_STEP = 5;

const QColor LINE_COLOR(31, 119, 180);

} // namespace

HeartRateChart::HeartRateChart(QWidget *parent) : QWidget(parent) {
  setMinimumSize(320, 200);
  setAutoFillBackground(true);
  setBackgroundRole(QPalette::Base);
}

void HeartRateChart::addValue(int bpm) {
  series_.update(bpm);
  update();
}

void HeartRateChart::clear() {
  series_.clear();
  update();
}

void HeartRateChart::setMaxPoints(size_t maxPoints) {
  series_.set_max_points(maxPoints);
  update();
}

void HeartRateChart::paintEvent(QPaintEvent *event) {
  Q_UNUSED(event);

  QPainter painter(this);
  painter.setRenderHint(QPainter::Antialiasing);

  const QRect plot(MARGIN_LEFT, MARGIN_TOP,
                   width() - MARGIN_LEFT - MARGIN_RIGHT,
                   height() - MARGIN_TOP - MARGIN_BOTTOM);
  if (plot.width() <= 0 || plot.height() <= 0) {
    return;
  }

  // ---- Ranges ----
  int y_min = polarlink::HR_PLOT_MIN_BPM;
  int y_max = polarlink::HR_PLOT_MAX_BPM;
  if (auto lo = series_.min_bpm()) {
    y_min = std::min(y_min, *lo - 10);
  }
  if (auto hi = series_.max_bpm()) {
    y_max = std::max(y_max, *hi + 10);
  }

  double x_min = 0.0;
  double x_max = polarlink::HR_PLOT_INITIAL_WINDOW_S;
  if (series_.last_x() > x_max) {
    x_min = series_.first_x();
    x_max = series_.last_x();
  }
  if (x_max - x_min < 1.0) {
    x_max = x_min + 1.0;
  }

  auto map_x = [&](double x) {
    return plot.left() + (x - x_min) / (x_max - x_min) * plot.width();
  };
  auto map_y = [&](double y) {
    return plot.bottom() -
           (y - y_min) / static_cast<double>(y_max - y_min) * plot.height();
  };

  const QFontMetrics metrics(painter.font());

  // ---- Grid ----
  painter.setPen(QPen(palette().color(QPalette::Mid), 1, Qt::DotLine));
  int first_y = static_cast<int>(std::ceil(y_min / double(Y_GRID_STEP))) *
                Y_GRID_STEP;
  for (int y = first_y; y <= y_max; y += Y_GRID_STEP) {
    double py = map_y(y);
    painter.drawLine(QPointF(plot.left(), py), QPointF(plot.right(), py));
  }
  int first_x = static_cast<int>(std::ceil(x_min / X_GRID_STEP)) * X_GRID_STEP;
  for (int x = first_x; x <= x_max; x += X_GRID_STEP) {
    double px = map_x(x);
    painter.drawLine(QPointF(px, plot.top()), QPointF(px, plot.bottom()));
  }

  // ---- Axes and tick labels ----
  painter.setPen(palette().color(QPalette::Text));
  painter.drawRect(plot);

  for (int y = first_y; y <= y_max; y += Y_GRID_STEP) {
    QString label = QString::number(y);
    double py = map_y(y);
    painter.drawText(
        QPointF(plot.left() - metrics.horizontalAdvance(label) - 6,
                py + metrics.ascent() / 2.0),
        label);
  }
  for (int x = first_x; x <= x_max; x += X_GRID_STEP) {
    QString label = QString::number(x);
    double px = map_x(x);
    painter.drawText(
        QPointF(px - metrics.horizontalAdvance(label) / 2.0,
                plot.bottom() + metrics.height() + 2),
        label);
  }

  // ---- Titles ----
  QFont title_font = painter.font();
  title_font.setBold(true);
  painter.save();
  painter.setFont(title_font);
  painter.drawText(QRect(0, 0, width(), MARGIN_TOP), Qt::AlignCenter,
                   polarlink::HR_PLOT_TITLE);
  painter.restore();

  painter.drawText(QRect(plot.left(), height() - metrics.height() - 4,
                         plot.width(), metrics.height()),
                   Qt::AlignCenter, polarlink::HR_PLOT_X_LABEL);

  painter.save();
  painter.translate(metrics.height(), plot.center().y());
  painter.rotate(-90);
  painter.drawText(QRect(-plot.height() / 2, -metrics.height(),
                         plot.height(), metrics.height()),
                   Qt::AlignCenter, polarlink::HR_PLOT_Y_LABEL);
  painter.restore();

  // ---- Data ----
  auto xs = series_.timestamps();
  auto ys = series_.heart_rates();
  if (!xs.empty()) {
    QPainterPath path;
    path.moveTo(map_x(xs[0]), map_y(ys[0]));
    for (size_t i = 1; i < xs.size(); ++i) {
      path.lineTo(map_x(xs[i]), map_y(ys[i]));
    }

    painter.save();
    painter.setClipRect(plot);
    painter.setPen(QPen(LINE_COLOR, 2));
    painter.drawPath(path);
    painter.restore();
  }

  // ---- Legend ----
  const QString legend = "Heart Rate";
  const int legend_w = metrics.horizontalAdvance(legend) + 36;
  const int legend_h = metrics.height() + 8;
  QRect box(plot.right() - legend_w - 8, plot.top() + 8, legend_w, legend_h);
  painter.setPen(palette().color(QPalette::Mid));
  painter.setBrush(palette().color(QPalette::Base));
  painter.drawRect(box);
  painter.setPen(QPen(LINE_COLOR, 2));
  int ly = box.center().y();
  painter.drawLine(box.left() + 6, ly, box.left() + 24, ly);
  painter.setPen(palette().color(QPalette::Text));
  painter.drawText(QPointF(box.left() + 30, ly + metrics.ascent() / 2.0 - 1),
                   legend);
}
