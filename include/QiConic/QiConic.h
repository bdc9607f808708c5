#pragma once

/**
 * @file QiConic.h
 * @brief Main header file for QiConic library
 *
 * QiConic computes the real intersection points of two conic sections
 * (circles, ellipses, general conics) using the pencil of conics.
 *
 * @author QiConic Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <QiConic/QiConicConfig.h>
#include <QiConic/Core/Export.h>

// Core types and utilities
#include <QiConic/Core/Types.h>
#include <QiConic/Core/Constants.h>
#include <QiConic/Core/Exception.h>
#include <QiConic/Core/Complex.h>
#include <QiConic/Core/Trace.h>

// Conic module
#include <QiConic/Conic/Conic2d.h>
#include <QiConic/Conic/ConicIntersection.h>

namespace Qi::Conic {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return QICONIC_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = QICONIC_VERSION_MAJOR;
    minor = QICONIC_VERSION_MINOR;
    patch = QICONIC_VERSION_PATCH;
}

} // namespace Qi::Conic
