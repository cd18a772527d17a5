//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/logger.hpp"

#include "evnorm/test/test.hpp"

using namespace evnorm;

TEST("log level names") {
  CHECK_EQUAL(loglevel_to_int("quiet"), EVNORM_LOG_LEVEL_QUIET);
  CHECK_EQUAL(loglevel_to_int("warning"), EVNORM_LOG_LEVEL_WARNING);
  CHECK_EQUAL(loglevel_to_int("Verbose"), EVNORM_LOG_LEVEL_VERBOSE);
  CHECK_EQUAL(loglevel_to_int("TRACE"), EVNORM_LOG_LEVEL_TRACE);
  CHECK_EQUAL(loglevel_to_int("loud"), EVNORM_LOG_LEVEL_QUIET);
  CHECK_EQUAL(loglevel_to_int("loud", -1), -1);
}
