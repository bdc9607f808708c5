/**
 * @file Complex.cpp
 * @brief Implementation of the complex number type
 */

#include <QiConic/Core/Complex.h>
#include <QiConic/Core/Constants.h>

#include <algorithm>
#include <ostream>

namespace Qi::Conic {

Complex Complex::Polar(double magnitude, double phase) {
    return {magnitude * std::cos(phase), magnitude * std::sin(phase)};
}

Complex Complex::operator/(const Complex& c) const {
    double cMag = c.MagnitudeSquared();
    return {(re * c.re + im * c.im) / cMag,
            (im * c.re - re * c.im) / cMag};
}

Complex Complex::Sqrt() const {
    double mag = Magnitude();
    double sign = im >= 0.0 ? 1.0 : -1.0;
    // Clamp rounding noise so a (nearly) real input never produces NaN
    return {std::sqrt(std::max(0.0, (mag + re) / 2.0)),
            sign * std::sqrt(std::max(0.0, (mag - re) / 2.0))};
}

Complex Complex::Exponentiated() const {
    return Polar(std::exp(re), im);
}

std::array<Complex, 3> Complex::CubeRoots() const {
    double arg3 = Argument() / 3.0;
    Complex really = Real(std::cbrt(Magnitude()));

    return {
        really * Imaginary(arg3).Exponentiated(),
        really * Imaginary(arg3 + TWO_PI / 3.0).Exponentiated(),
        really * Imaginary(arg3 - TWO_PI / 3.0).Exponentiated()
    };
}

std::ostream& operator<<(std::ostream& os, const Complex& c) {
    return os << "Complex(" << c.re << ", " << c.im << ")";
}

} // namespace Qi::Conic
