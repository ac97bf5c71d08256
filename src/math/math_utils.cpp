#include "planar/math/math_utils.hpp"

#include "planar/core/errors.hpp"

namespace MathUtils {

double clip(double val, double minVal, double maxVal) {
  if (val < minVal) {
    return minVal;
  }
  if (val > maxVal) {
    return maxVal;
  }
  return val;
}

double sign(double val) {
  return val >= 0.0 ? 1.0 : -1.0;
}

double interp1d(double a, double b, double factor, bool limit) {
  if (limit) {
    factor = clip(factor, 0.0, 1.0);
  }
  return a + factor * (b - a);
}

Vector interp2d(const Vector& p0, const Vector& p1, double factor) {
  return {interp1d(p0.x, p1.x, factor), interp1d(p0.y, p1.y, factor)};
}

double mapper1d(double value, double srcA, double srcB, double tarA, double tarB) {
  if (srcA == srcB) {
    throw Errors::DivideByZero("mapper1d() with an empty source range");
  }
  double const factor = (value - srcA) / (srcB - srcA);
  return tarA + factor * (tarB - tarA);
}

std::vector<Vector> quadraticBezier(const Vector& p0, const Vector& p1, const Vector& p2, int segments) {
  if (segments < 1) {
    throw Errors::InvalidArgument("quadraticBezier() needs at least one segment");
  }
  std::vector<Vector> points;
  points.reserve(static_cast<size_t>(segments) + 1);
  for (int i = 0; i <= segments; ++i) {
    double const t = static_cast<double>(i) / segments;
    Vector const l0 = interp2d(p0, p1, t);
    Vector const l1 = interp2d(p1, p2, t);
    points.push_back(interp2d(l0, l1, t));
  }
  return points;
}

std::vector<Vector> cubicBezier(const Vector& p0, const Vector& p1, const Vector& p2, const Vector& p3,
                                int segments) {
  if (segments < 1) {
    throw Errors::InvalidArgument("cubicBezier() needs at least one segment");
  }
  std::vector<Vector> points;
  points.reserve(static_cast<size_t>(segments) + 1);
  for (int i = 0; i <= segments; ++i) {
    double const t = static_cast<double>(i) / segments;
    Vector const l0 = interp2d(p0, p1, t);
    Vector const l1 = interp2d(p1, p2, t);
    Vector const l2 = interp2d(p2, p3, t);
    points.push_back(interp2d(interp2d(l0, l1, t), interp2d(l1, l2, t), t));
  }
  return points;
}

} // namespace MathUtils
