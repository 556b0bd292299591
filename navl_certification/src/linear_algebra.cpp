#include "linear_algebra.hpp"

namespace navl
{

Mat3 Mat3::diagonal(const Vec3 & d)
{
  Mat3 result;
  result.m_[0][0] = d.x;
  result.m_[1][1] = d.y;
  result.m_[2][2] = d.z;
  return result;
}

Mat3 Mat3::operator+(const Mat3 & rhs) const
{
  Mat3 result;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      result.m_[r][c] = m_[r][c] + rhs.m_[r][c];
    }
  }
  return result;
}

Mat3 Mat3::operator-(const Mat3 & rhs) const
{
  Mat3 result;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      result.m_[r][c] = m_[r][c] - rhs.m_[r][c];
    }
  }
  return result;
}

Mat3 Mat3::operator*(double s) const
{
  Mat3 result;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      result.m_[r][c] = m_[r][c] * s;
    }
  }
  return result;
}

Mat3 Mat3::operator*(const Mat3 & rhs) const
{
  Mat3 result;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      double sum = 0.0;
      for (int k = 0; k < 3; ++k) {
        sum += m_[r][k] * rhs.m_[k][c];
      }
      result.m_[r][c] = sum;
    }
  }
  return result;
}

Vec3 Mat3::operator*(const Vec3 & v) const
{
  return {
    m_[0][0] * v.x + m_[0][1] * v.y + m_[0][2] * v.z,
    m_[1][0] * v.x + m_[1][1] * v.y + m_[1][2] * v.z,
    m_[2][0] * v.x + m_[2][1] * v.y + m_[2][2] * v.z};
}

Mat3 Mat3::transposed() const
{
  Mat3 result;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      result.m_[c][r] = m_[r][c];
    }
  }
  return result;
}

double Mat3::determinant() const
{
  return m_[0][0] * (m_[1][1] * m_[2][2] - m_[1][2] * m_[2][1]) -
         m_[0][1] * (m_[1][0] * m_[2][2] - m_[1][2] * m_[2][0]) +
         m_[0][2] * (m_[1][0] * m_[2][1] - m_[1][1] * m_[2][0]);
}

std::optional<Mat3> Mat3::inverse(double singularity_tolerance) const
{
  if (!isFinite()) {
    return std::nullopt;
  }

  double row_norm_product = 1.0;
  for (int r = 0; r < 3; ++r) {
    row_norm_product *= std::sqrt(m_[r][0] * m_[r][0] + m_[r][1] * m_[r][1] + m_[r][2] * m_[r][2]);
  }

  // Relative to the Hadamard bound, so uniformly small matrices still invert
  const double det = determinant();
  if (!std::isfinite(det) || !std::isfinite(row_norm_product) ||
    std::abs(det) <= singularity_tolerance * row_norm_product)
  {
    return std::nullopt;
  }

  // Adjugate / determinant
  const double inv_det = 1.0 / det;
  Mat3 inv;
  inv.m_[0][0] = (m_[1][1] * m_[2][2] - m_[1][2] * m_[2][1]) * inv_det;
  inv.m_[0][1] = (m_[0][2] * m_[2][1] - m_[0][1] * m_[2][2]) * inv_det;
  inv.m_[0][2] = (m_[0][1] * m_[1][2] - m_[0][2] * m_[1][1]) * inv_det;
  inv.m_[1][0] = (m_[1][2] * m_[2][0] - m_[1][0] * m_[2][2]) * inv_det;
  inv.m_[1][1] = (m_[0][0] * m_[2][2] - m_[0][2] * m_[2][0]) * inv_det;
  inv.m_[1][2] = (m_[0][2] * m_[1][0] - m_[0][0] * m_[1][2]) * inv_det;
  inv.m_[2][0] = (m_[1][0] * m_[2][1] - m_[1][1] * m_[2][0]) * inv_det;
  inv.m_[2][1] = (m_[0][1] * m_[2][0] - m_[0][0] * m_[2][1]) * inv_det;
  inv.m_[2][2] = (m_[0][0] * m_[1][1] - m_[0][1] * m_[1][0]) * inv_det;

  if (!inv.isFinite()) {
    return std::nullopt;
  }
  return inv;
}

void Mat3::forceSymmetric()
{
  for (int r = 0; r < 3; ++r) {
    for (int c = r + 1; c < 3; ++c) {
      const double avg = (m_[r][c] + m_[c][r]) * 0.5;
      m_[r][c] = avg;
      m_[c][r] = avg;
    }
  }
}

bool Mat3::isFinite() const
{
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      if (!std::isfinite(m_[r][c])) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace navl
