#include "planar/math/vector_math.hpp"

#include <cmath>
#include <iomanip>

#include "planar/core/errors.hpp"
#include "planar/math/constants.hpp"
#include "planar/math/math_utils.hpp"

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

bool nearlyEqual(const Vector& a, const Vector& b, double epsilon) {
  return nearlyEqual(a.x, b.x, epsilon) && nearlyEqual(a.y, b.y, epsilon);
}

double deg2rad(double degrees) {
  return (degrees * MathConstants::PI) / 180.0;
}

double rad2deg(double radians) {
  return (radians * 180.0) / MathConstants::PI;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return this->divide(scalar, false);
}

Vector Vector::divide(double scalar, bool ignoreZeroDivisor) const {
  if (scalar == 0.0) {
    if (ignoreZeroDivisor) {
      return {0, 0};
    }
    throw Errors::DivideByZero("Vector divided by zero scalar");
  }
  return {this->x / scalar, this->y / scalar};
}

double Vector::mag() const {
	return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::magSquare() const {
	return this->x * this->x + this->y * this->y;
}

Vector Vector::normalize(bool ignoreZeroMagnitude) const {
  double const len = this->mag();
  if (len == 0.0) {
    if (ignoreZeroMagnitude) {
      return {0, 0};
    }
    throw Errors::DivideByZero("normalize() on a zero-magnitude vector");
  }
  return {this->x / len, this->y / len};
}

double Vector::dot(const Vector& v) const {
	return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector &other) const {
  return this->x * other.y - this->y * other.x;
}

double Vector::angle(const Vector &other) const {
  double const lenProduct = this->mag() * other.mag();
  if (lenProduct == 0.0) {
    throw Errors::DivideByZero("angle() with a zero-magnitude vector");
  }
  // clamp: rounding can push the cosine just outside acos's domain
  double const cosTheta = MathUtils::clip(this->dot(other) / lenProduct, -1.0, 1.0);
  return std::acos(cosTheta) * MathUtils::sign(this->cross(other));
}

Vector Vector::rotate(double theta, const Vector &pivot) const {
  double const c = std::cos(theta);
  double const s = std::sin(theta);
  double const dx = this->x - pivot.x;
  double const dy = this->y - pivot.y;
  return {pivot.x + dx*c - dy*s, pivot.y + dx*s + dy*c};
}

Vector Vector::componentParallel(const Vector &other) const {
  Vector const dir = other.normalize(false);
  return dir * this->dot(dir);
}

Vector Vector::componentPerpendicular(const Vector &other) const {
  return *this - this->componentParallel(other);
}

double Vector::dist(const Vector &other) const {
  return (*this - other).mag();
}

Vector Vector::clip(double minMag, double maxMag) const {
  Vector const dir = this->normalize(false);
  return dir * MathUtils::clip(this->mag(), minMag, maxMag);
}

Vector Vector::origin() { return {0, 0}; }
Vector Vector::left(double mag) { return {-mag, 0}; }
Vector Vector::right(double mag) { return {mag, 0}; }
Vector Vector::up(double mag) { return {0, mag}; }
Vector Vector::down(double mag) { return {0, -mag}; }

// Vector operators
Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}

std::ostream& operator<<(std::ostream& os, const Vector& v) {
  auto const flags = os.flags();
  auto const precision = os.precision();
  os << "V2(" << std::fixed << std::setprecision(2) << v.x << ", " << v.y << ")";
  os.flags(flags);
  os.precision(precision);
  return os;
}
