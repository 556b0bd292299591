#ifndef NAVL_LINEAR_ALGEBRA_HPP
#define NAVL_LINEAR_ALGEBRA_HPP

#include <cmath>
#include <optional>

namespace navl
{

/**
 * @brief 3D vector used for positions, velocities and innovations
 *
 * Coordinate System: ROS standard (x forward, y left, z up)
 */
struct Vec3
{
  double x{0.0};
  double y{0.0};
  double z{0.0};

  constexpr Vec3() = default;
  constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  Vec3 operator+(const Vec3 & rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
  Vec3 operator-(const Vec3 & rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
  Vec3 operator-() const { return {-x, -y, -z}; }
  Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }

  Vec3 & operator+=(const Vec3 & rhs) { x += rhs.x; y += rhs.y; z += rhs.z; return *this; }
  Vec3 & operator-=(const Vec3 & rhs) { x -= rhs.x; y -= rhs.y; z -= rhs.z; return *this; }
  Vec3 & operator*=(double s) { x *= s; y *= s; z *= s; return *this; }

  double dot(const Vec3 & rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }
  double normSquared() const { return dot(*this); }
  double norm() const { return std::sqrt(normSquared()); }

  bool isFinite() const
  {
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
  }
};

inline double distance(const Vec3 & a, const Vec3 & b)
{
  return (a - b).norm();
}

/**
 * @brief Fixed-size 3x3 matrix for covariance propagation
 *
 * Replaces a general 4x4 transform type: only the operations the estimator
 * needs are provided, and inversion reports failure instead of producing
 * NaN/Inf on singular input.
 */
class Mat3
{
public:
  Mat3() = default;

  static Mat3 zeros() { return Mat3(); }
  static Mat3 identity() { return diagonal(Vec3(1.0, 1.0, 1.0)); }
  static Mat3 diagonal(const Vec3 & d);

  double & operator()(int r, int c) { return m_[r][c]; }
  double operator()(int r, int c) const { return m_[r][c]; }

  Mat3 operator+(const Mat3 & rhs) const;
  Mat3 operator-(const Mat3 & rhs) const;
  Mat3 operator*(double s) const;
  Mat3 operator*(const Mat3 & rhs) const;
  Vec3 operator*(const Vec3 & v) const;

  Mat3 transposed() const;
  double trace() const { return m_[0][0] + m_[1][1] + m_[2][2]; }
  double determinant() const;

  /**
   * @brief Invert the matrix
   * @param singularity_tolerance Minimum |det| accepted as invertible, relative
   *        to the product of the row norms (|det| never exceeds that product)
   * @return Inverse, or std::nullopt if near-singular or non-finite
   */
  std::optional<Mat3> inverse(double singularity_tolerance = kSingularityTolerance) const;

  // P = (P + P^T) / 2
  void forceSymmetric();

  bool isFinite() const;

  static constexpr double kSingularityTolerance = 1e-12;

private:
  double m_[3][3]{};
};

}  // namespace navl

#endif  // NAVL_LINEAR_ALGEBRA_HPP
