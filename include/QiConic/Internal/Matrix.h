#pragma once

/**
 * @file Matrix.h
 * @brief Small fixed-size real vectors and matrices for QiConic
 *
 * This module provides:
 * - Fixed-size vectors: Vec<2>, Vec<3>, Vec<4>
 * - Fixed-size matrices: Mat<2,2>, Mat<3,3>
 * - Vector projection for Gram-Schmidt orthogonalization
 * - 2D homogeneous transform factories (rotation, translation, scaling)
 *
 * Used by:
 * - Solver.h (2x2 singular values and linear solve)
 * - RealSolutions.h (4D gradient basis construction)
 * - Conic/Conic2d.h (ellipse conic matrices)
 *
 * Design principles:
 * - Stack memory only, no heap allocation
 * - Row-major storage
 * - Double precision only
 */

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <type_traits>

namespace Qi::Conic::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Tolerance for matrix singularity detection
constexpr double MATRIX_SINGULAR_THRESHOLD = 1e-10;

// =============================================================================
// Fixed-Size Vector: Vec<N>
// =============================================================================

/**
 * @brief Fixed-size vector template
 * @tparam N Vector dimension (2, 3, or 4)
 */
template<int N>
class Vec {
    static_assert(N >= 1 && N <= 4, "Vec dimension must be between 1 and 4");

public:
    /// Default constructor (zero vector)
    Vec() {
        std::fill(data_, data_ + N, 0.0);
    }

    /// Construct from initializer list, missing entries are zero
    Vec(std::initializer_list<double> init) {
        std::fill(data_, data_ + N, 0.0);
        int i = 0;
        for (auto val : init) {
            if (i >= N) break;
            data_[i++] = val;
        }
    }

    double& operator[](int i) { return data_[i]; }
    const double& operator[](int i) const { return data_[i]; }

    // =========================================================================
    // Vector Operations
    // =========================================================================

    Vec operator+(const Vec& v) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] + v.data_[i];
        return result;
    }

    Vec operator-(const Vec& v) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] - v.data_[i];
        return result;
    }

    Vec operator*(double s) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] * s;
        return result;
    }

    Vec operator-() const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = -data_[i];
        return result;
    }

    // =========================================================================
    // Vector Properties
    // =========================================================================

    /// Dot product
    double Dot(const Vec& v) const {
        double sum = 0.0;
        for (int i = 0; i < N; ++i) sum += data_[i] * v.data_[i];
        return sum;
    }

    /// L2 norm (Euclidean length)
    double Norm() const {
        return std::sqrt(NormSquared());
    }

    /// L2 norm squared
    double NormSquared() const {
        return Dot(*this);
    }

    static Vec Zero() { return Vec(); }

private:
    double data_[N];
};

template<int N>
inline Vec<N> operator*(double s, const Vec<N>& v) {
    return v * s;
}

/**
 * @brief Projection of v onto u: u * (v.u / u.u)
 *
 * No guard for a zero u; the caller must pass a nonzero direction.
 */
template<int N>
inline Vec<N> Project(const Vec<N>& v, const Vec<N>& u) {
    return u * (v.Dot(u) / u.Dot(u));
}

using Vec2 = Vec<2>;
using Vec3 = Vec<3>;
using Vec4 = Vec<4>;

// =============================================================================
// Fixed-Size Matrix: Mat<M,N>
// =============================================================================

/**
 * @brief Fixed-size matrix template, row-major
 * @tparam M Number of rows
 * @tparam N Number of columns
 */
template<int M, int N>
class Mat {
    static_assert(M >= 1 && M <= 4, "Mat rows must be between 1 and 4");
    static_assert(N >= 1 && N <= 4, "Mat cols must be between 1 and 4");

public:
    /// Default constructor (zero matrix)
    Mat() {
        std::fill(data_, data_ + M * N, 0.0);
    }

    /// Construct from initializer list (row-major order)
    Mat(std::initializer_list<double> init) {
        std::fill(data_, data_ + M * N, 0.0);
        int i = 0;
        for (auto val : init) {
            if (i >= M * N) break;
            data_[i++] = val;
        }
    }

    double& operator()(int row, int col) { return data_[row * N + col]; }
    const double& operator()(int row, int col) const { return data_[row * N + col]; }

    Vec<N> Row(int i) const {
        Vec<N> result;
        for (int j = 0; j < N; ++j) result[j] = data_[i * N + j];
        return result;
    }

    Vec<M> Col(int j) const {
        Vec<M> result;
        for (int i = 0; i < M; ++i) result[i] = data_[i * N + j];
        return result;
    }

    // =========================================================================
    // Matrix Arithmetic
    // =========================================================================

    Mat operator+(const Mat& m) const {
        Mat result;
        for (int i = 0; i < M * N; ++i) result.data_[i] = data_[i] + m.data_[i];
        return result;
    }

    Mat operator-(const Mat& m) const {
        Mat result;
        for (int i = 0; i < M * N; ++i) result.data_[i] = data_[i] - m.data_[i];
        return result;
    }

    Mat operator*(double s) const {
        Mat result;
        for (int i = 0; i < M * N; ++i) result.data_[i] = data_[i] * s;
        return result;
    }

    /// Matrix-matrix multiplication: this (M x N) * other (N x P) = result (M x P)
    template<int P>
    Mat<M, P> operator*(const Mat<N, P>& other) const {
        Mat<M, P> result;
        for (int i = 0; i < M; ++i) {
            for (int j = 0; j < P; ++j) {
                double sum = 0.0;
                for (int k = 0; k < N; ++k) {
                    sum += data_[i * N + k] * other(k, j);
                }
                result(i, j) = sum;
            }
        }
        return result;
    }

    /// Matrix-vector multiplication
    Vec<M> operator*(const Vec<N>& v) const {
        Vec<M> result;
        for (int i = 0; i < M; ++i) {
            double sum = 0.0;
            for (int j = 0; j < N; ++j) {
                sum += data_[i * N + j] * v[j];
            }
            result[i] = sum;
        }
        return result;
    }

    Mat<N, M> Transpose() const {
        Mat<N, M> result;
        for (int i = 0; i < M; ++i) {
            for (int j = 0; j < N; ++j) {
                result(j, i) = data_[i * N + j];
            }
        }
        return result;
    }

    // =========================================================================
    // Factories / Square Matrix Operations
    // =========================================================================

    static Mat Zero() { return Mat(); }

    /// Identity matrix (only for square matrices)
    template<int M2 = M, int N2 = N>
    static typename std::enable_if<M2 == N2, Mat>::type Identity() {
        Mat result;
        for (int i = 0; i < M; ++i) result(i, i) = 1.0;
        return result;
    }

    /// Determinant - implemented via specialization for 2x2, 3x3
    template<int M2 = M, int N2 = N>
    typename std::enable_if<M2 == N2, double>::type Determinant() const;

    /// Inverse - implemented via specialization for 3x3 (zero if singular)
    template<int M2 = M, int N2 = N>
    typename std::enable_if<M2 == N2, Mat>::type Inverse() const;

private:
    double data_[M * N];
};

template<int M, int N>
inline Mat<M, N> operator*(double s, const Mat<M, N>& m) {
    return m * s;
}

// =============================================================================
// Mat<2,2> Specializations
// =============================================================================

template<>
template<>
inline double Mat<2, 2>::Determinant<2, 2>() const {
    return data_[0] * data_[3] - data_[1] * data_[2];
}

// =============================================================================
// Mat<3,3> Specializations
// =============================================================================

template<>
template<>
inline double Mat<3, 3>::Determinant<3, 3>() const {
    // Expansion by first row
    double a = data_[0], b = data_[1], c = data_[2];
    double d = data_[3], e = data_[4], f = data_[5];
    double g = data_[6], h = data_[7], i = data_[8];
    return a * (e * i - f * h) - b * (d * i - f * g) + c * (d * h - e * g);
}

template<>
template<>
inline Mat<3, 3> Mat<3, 3>::Inverse<3, 3>() const {
    double det = Determinant();
    if (std::abs(det) < MATRIX_SINGULAR_THRESHOLD) {
        return Mat<3, 3>::Zero();
    }
    double invDet = 1.0 / det;

    double a = data_[0], b = data_[1], c = data_[2];
    double d = data_[3], e = data_[4], f = data_[5];
    double g = data_[6], h = data_[7], i = data_[8];

    // Adjugate / det
    Mat<3, 3> result;
    result(0, 0) = (e * i - f * h) * invDet;
    result(0, 1) = (c * h - b * i) * invDet;
    result(0, 2) = (b * f - c * e) * invDet;
    result(1, 0) = (f * g - d * i) * invDet;
    result(1, 1) = (a * i - c * g) * invDet;
    result(1, 2) = (c * d - a * f) * invDet;
    result(2, 0) = (d * h - e * g) * invDet;
    result(2, 1) = (b * g - a * h) * invDet;
    result(2, 2) = (a * e - b * d) * invDet;

    return result;
}

using Mat22 = Mat<2, 2>;
using Mat33 = Mat<3, 3>;

// =============================================================================
// 2D Homogeneous Transform Factories
// =============================================================================

/// Counter-clockwise rotation about the origin
Mat33 Rotation2D(double angle);

Mat33 Translation2D(double tx, double ty);

Mat33 Scaling2D(double sx, double sy);

} // namespace Qi::Conic::Internal
