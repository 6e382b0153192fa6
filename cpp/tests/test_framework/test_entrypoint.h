// tests/test_framework/test_entrypoint.h
#pragma once

#include "hsh_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Provides an API for registering worker scenario dispatchers.
 */

// Path of the running test executable, used by worker-spawning tests.
extern std::string g_self_exe_path;

/**
 * @brief Type definition for a worker scenario dispatcher function.
 *
 * A dispatcher takes the same arguments as `main()`. It returns -1 when the
 * "module.scenario" argument is not one of its own, otherwise the worker's exit code.
 */
using WorkerDispatchFn = int (*)(int argc, char **argv);

/**
 * @brief Registers a worker scenario dispatcher with the test entry point.
 *
 * Each worker .cpp file calls this from a static registrar object, so a test
 * executable only links the worker files it actually uses.
 */
void register_worker_dispatcher(WorkerDispatchFn fn);
