//
// Created by gregorian on 02/03/2026.
//

#ifndef CILENS_VERSION_H
#define CILENS_VERSION_H

/**
 * @file version.h
 * @brief CILens version information.
 */

namespace cilens {

    /**
     * Major version number.
     * Incremented for breaking changes to the insights format.
     */
    constexpr int VERSION_MAJOR = 0;

    constexpr int VERSION_MINOR = 3;

    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "CILens";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "cilens";

}  // namespace cilens

#endif //CILENS_VERSION_H
