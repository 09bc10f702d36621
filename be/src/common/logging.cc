/*
 * @file  logging.cc
 * @brief glog initialization
 *
 * @date   Oct 19, 2026
 */

#include "common/logging.h"

#include <boost/thread/mutex.hpp>

namespace dfsbridge {

static boost::mutex logging_mutex;
static bool logging_initialized = false;

void InitGoogleLoggingSafe(const char* arg) {
	boost::mutex::scoped_lock lock(logging_mutex);
	if (logging_initialized)
		return;

	// log to stderr when no log directory was configured
	if (FLAGS_log_dir.empty())
		FLAGS_logtostderr = true;

	google::InitGoogleLogging(arg);
	google::InstallFailureSignalHandler();

	logging_initialized = true;
	LOG (INFO)<< "Logging is initialized for \"" << arg << "\".";
}

void LogCommandLineFlags() {
	LOG (INFO)<< "Flags:" << "\n"
			<< google::CommandlineFlagsIntoString();
}

}
