//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_XCDB_HPP
#define XCDB_XCDB_HPP

/**
 * @file xcdb.hpp
 * @brief Main include file for the xcdb library.
 *
 * Pulls in the core types plus the conversion entry point. Include the
 * individual headers under xcdb/command, xcdb/log and xcdb/exporters to
 * drive the pipeline stages directly.
 */

#include "xcdb/version.hpp"
#include "xcdb/error.hpp"
#include "xcdb/result.hpp"
#include "xcdb/types.hpp"
#include "xcdb/config.hpp"
#include "xcdb/converter.hpp"

#endif //XCDB_XCDB_HPP
