#include "cs/viewport/Viewport.hpp"
#include <cmath>

namespace cs {

void Viewport::setDataRange(double xMin, double xMax, double yMin, double yMax) {
  data_.xMin = xMin;
  data_.xMax = xMax;
  data_.yMin = yMin;
  data_.yMax = yMax;
}

void Viewport::setPlotRect(const PlotRect& rect) {
  plot_ = rect;
}

void Viewport::setPixelViewport(int fbWidth, int fbHeight) {
  double insetRight = static_cast<double>(fbW_) - plot_.right();
  double insetBottom = static_cast<double>(fbH_) - plot_.bottom();
  fbW_ = fbWidth;
  fbH_ = fbHeight;
  plot_.width = static_cast<double>(fbW_) - plot_.left - insetRight;
  plot_.height = static_cast<double>(fbH_) - plot_.top - insetBottom;
  if (plot_.width < 0) plot_.width = 0;
  if (plot_.height < 0) plot_.height = 0;
}

double Viewport::timeToPixelX(double t) const {
  double tx = (t - data_.xMin) / (data_.xMax - data_.xMin);
  return plot_.left + tx * plot_.width;
}

double Viewport::priceToPixelY(double p) const {
  double ty = (p - data_.yMin) / (data_.yMax - data_.yMin);
  return plot_.bottom() - ty * plot_.height; // Y flipped
}

double Viewport::pixelXToTime(double px) const {
  double tx = (px - plot_.left) / plot_.width;
  return data_.xMin + tx * (data_.xMax - data_.xMin);
}

double Viewport::pixelYToPrice(double py) const {
  double ty = (plot_.bottom() - py) / plot_.height;
  return data_.yMin + ty * (data_.yMax - data_.yMin);
}

void Viewport::pixelToData(double px, double py, double& dx, double& dy) const {
  dx = pixelXToTime(px);
  dy = pixelYToPrice(py);
}

void Viewport::dataToPixel(double dx, double dy, double& px, double& py) const {
  px = timeToPixelX(dx);
  py = priceToPixelY(dy);
}

bool Viewport::isValid() const {
  return data_.xMax > data_.xMin && data_.yMax > data_.yMin &&
         plot_.width > 0 && plot_.height > 0 &&
         std::isfinite(data_.xMin) && std::isfinite(data_.xMax) &&
         std::isfinite(data_.yMin) && std::isfinite(data_.yMax);
}

void Viewport::pan(double dxPixels, double dyPixels) {
  if (!isValid()) return;
  double dataDx = dxPixels / plot_.width * (data_.xMax - data_.xMin);
  double dataDy = dyPixels / plot_.height * (data_.yMax - data_.yMin);

  // Dragging right reveals earlier times; dragging down reveals higher prices.
  data_.xMin -= dataDx;
  data_.xMax -= dataDx;
  data_.yMin += dataDy;
  data_.yMax += dataDy;
}

void Viewport::zoom(double factor, double pivotPx, double pivotPy) {
  if (!isValid()) return;
  double pivotDx, pivotDy;
  pixelToData(pivotPx, pivotPy, pivotDx, pivotDy);

  double scale = 1.0 / (1.0 + factor); // factor > 0 = zoom in = smaller range

  data_.xMin = pivotDx + (data_.xMin - pivotDx) * scale;
  data_.xMax = pivotDx + (data_.xMax - pivotDx) * scale;
  data_.yMin = pivotDy + (data_.yMin - pivotDy) * scale;
  data_.yMax = pivotDy + (data_.yMax - pivotDy) * scale;
}

bool Viewport::containsPixel(double px, double py) const {
  return px >= plot_.left && px <= plot_.right() &&
         py >= plot_.top && py <= plot_.bottom();
}

double Viewport::visibleDataWidth() const {
  return data_.xMax - data_.xMin;
}

double Viewport::pixelsPerDataUnitX() const {
  double dataW = data_.xMax - data_.xMin;
  if (dataW <= 0.0) return 0.0;
  return plot_.width / dataW;
}

double Viewport::pixelsPerDataUnitY() const {
  double dataH = data_.yMax - data_.yMin;
  if (dataH <= 0.0) return 0.0;
  return plot_.height / dataH;
}

} // namespace cs
