#pragma once

namespace cs {

// Visible domain window: x = time, y = price.
struct DataRange {
  double xMin{0}, xMax{1}, yMin{0}, yMax{1};
};

// Plot area inside the host framebuffer, in pixels (origin top-left).
struct PlotRect {
  double left{0}, top{0};
  double width{800}, height{600};

  double right() const { return left + width; }
  double bottom() const { return top + height; }
};

class Viewport {
public:
  void setDataRange(double xMin, double xMax, double yMin, double yMax);
  void setPlotRect(const PlotRect& rect);

  // Resize the framebuffer; the plot rect follows it, keeping its insets.
  void setPixelViewport(int fbWidth, int fbHeight);

  // Coordinate mapping. Price grows upward, pixels grow downward.
  double timeToPixelX(double t) const;
  double priceToPixelY(double p) const;
  double pixelXToTime(double px) const;
  double pixelYToPrice(double py) const;
  void pixelToData(double px, double py, double& dx, double& dy) const;
  void dataToPixel(double dx, double dy, double& px, double& py) const;

  // False when the data range or plot rect is degenerate.
  bool isValid() const;

  // Pan/zoom
  void pan(double dxPixels, double dyPixels);
  void zoom(double factor, double pivotPx, double pivotPy);

  bool containsPixel(double px, double py) const;

  // Zoom metrics
  double visibleDataWidth() const;
  double pixelsPerDataUnitX() const;
  double pixelsPerDataUnitY() const;

  const DataRange& dataRange() const { return data_; }
  const PlotRect& plotRect() const { return plot_; }
  int fbWidth() const { return fbW_; }
  int fbHeight() const { return fbH_; }

private:
  DataRange data_{0, 1, 0, 1};
  PlotRect plot_{0, 0, 800, 600};
  int fbW_{800};
  int fbH_{600};
};

} // namespace cs
