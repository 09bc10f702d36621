/*
 * @file  logging.h
 * @brief glog wrapper and verbosity levels used by the bridge
 *
 * @date   Oct 19, 2026
 */

#ifndef COMMON_LOGGING_H_
#define COMMON_LOGGING_H_

// This is the only place glog is pulled in from. Everything else includes this file.
#include <glog/logging.h>
#include <gflags/gflags.h>

/** Verbosity levels:
 *  1 - connection lifecycle (connect / disconnect)
 *  2 - per-path file operations (copy, move, delete...)
 */
#define VLOG_CONNECTION VLOG(1)
#define VLOG_FILE       VLOG(2)

namespace dfsbridge {

/**
 * Initialize glog. Safe to call more than once and from several threads,
 * only the first call has an effect.
 *
 * @param arg - program name, used by glog to name log files
 */
void InitGoogleLoggingSafe(const char* arg);

/** Dump all gflags with their current values to the INFO log */
void LogCommandLineFlags();

}

#endif /* COMMON_LOGGING_H_ */
