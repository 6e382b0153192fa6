#pragma once
/**
 * @file hsh_access.hpp
 * @brief Layer 3: concurrency-safe HDF5 access built on hsh_service.
 *
 * Provides the File negotiator (plain and SWMR sharing, locking policy), Item
 * handles and the item locator that waits for records a writer has not finished.
 * Include this when you read or write HDF5 files shared between processes.
 */
#include "hsh_service.hpp"

#include "h5/errors.hpp"
#include "h5/file_options.hpp"
#include "h5/item.hpp"
#include "h5/file.hpp"
#include "h5/item_locator.hpp"
