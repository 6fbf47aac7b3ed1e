#include "discsim/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

Vector2D::Vector2D() : x(0), y(0) {}
Vector2D::Vector2D(double x, double y) : x(x), y(y) {}

Vector2D Vector2D::operator-() const {
  return {-this->x, -this->y};
}

Vector2D Vector2D::operator+(const Vector2D& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector2D Vector2D::operator-(const Vector2D& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector2D Vector2D::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector2D Vector2D::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

Vector2D& Vector2D::operator+=(const Vector2D& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector2D& Vector2D::operator-=(const Vector2D& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

double Vector2D::length() const {
  return std::sqrt(lengthSquared());
}

double Vector2D::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector2D::dotProduct(const Vector2D& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector2D::dist(const Vector2D& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

Vector2D Vector2D::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

bool Vector2D::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}

Vector2D operator*(double scalar, const Vector2D& v) {
  return v * scalar;
}
