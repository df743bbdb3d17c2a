#include "accretion/math/vector_math.hpp"

#include <cmath>

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Position Position::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

double Position::dist(const Position& p) const {
  return std::sqrt(this->distSquared(p));
}

double Position::distSquared(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return dx * dx + dy * dy;
}

Position& Position::operator+=(const Position& p) {
    this->x += p.x;
    this->y += p.y;
    return *this;
}

Position& Position::operator-=(const Position& p) {
    this->x -= p.x;
    this->y -= p.y;
    return *this;
}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

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
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
  return std::sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector &other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

Vector Vector::normalizedOrZero() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  return {0.0, 0.0};
}

Vector Vector::clampLength(double maxLength) const {
  double const lenSq = this->lengthSquared();
  if (lenSq <= maxLength * maxLength) {
    return *this;
  }
  double const factor = maxLength / std::sqrt(lenSq);
  return {this->x * factor, this->y * factor};
}

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
  return {v.x * scalar, v.y * scalar};
}
