//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_VERSION_HPP
#define XCDB_VERSION_HPP

/**
 * @file version.hpp
 * @brief xcdb version information.
 */

namespace xcdb {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Xcode Compilation Database Generator";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "xcdb";

}  // namespace xcdb

#endif //XCDB_VERSION_HPP
