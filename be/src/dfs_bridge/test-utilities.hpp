/*
 * @file test-utilities.hpp
 * @brief utilities for testing purposes
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_TEST_UTILITIES_HPP_
#define DFS_BRIDGE_TEST_UTILITIES_HPP_

#include <atomic>
#include <set>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/thread/mutex.hpp>

#include "dfs_bridge/native-adaptor.hpp"

namespace dfsbridge{
namespace constants{
	/** scheme served by SandboxAdaptor in tests */
	extern const std::string TEST_SANDBOX_SCHEME;

	/** target file system for transfer tests */
	extern const std::string TEST_TARGET_FS_URI;

	/** local file system uri */
	extern const std::string TEST_LOCAL_FS_URI;

	/** environment variable to find hadoop jars in, libhdfs starts JVM with it */
	extern const std::string HADOOP_CLASSPATH_ENV_VARIABLE_NAME;
}

/**
 * Native adaptor emulating the native library on the local disk.
 * Local file system maps to "/", any other file system maps to "<sandbox root>/<host>".
 * Counts native calls so that tests can check whether the boundary was crossed.
 */
class SandboxAdaptor : public NativeAdaptor{
private:
	/** emulated native connection */
	struct SandboxFs{
		boost::filesystem::path root;
	};

	boost::filesystem::path m_root;      /**< sandbox root */

	boost::mutex            m_mux;
	std::set<SandboxFs*>    m_connections;  /**< live connections */

	boost::filesystem::path resolve(fsBridge fs, const char* path);

public:
	std::atomic<int>  connects;       /**< successful connects */
	std::atomic<int>  disconnects;    /**< disconnects */
	std::atomic<int>  transfers;      /**< copy and move native calls */
	std::atomic<int>  transferResult; /**< if non-zero, returned by copy and move without doing anything */
	std::atomic<bool> refuseConnect;  /**< if set, connect fails */

	explicit SandboxAdaptor(const boost::filesystem::path& root);
	~SandboxAdaptor();

	/** number of connections not disconnected yet */
	int liveConnections();

	fsBridge connect(const FileSystemDescriptor& fsDescriptor);
	int disconnect(fsBridge fs);
	int pathExists(fsBridge fs, const char* path);
	int createFile(fsBridge fs, const char* path);
	int pathDelete(fsBridge fs, const char* path, int recursive);
	int createDirectory(fsBridge fs, const char* path);
	int rename(fsBridge fs, const char* oldPath, const char* newPath);
	int copy(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst);
	int move(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst);
};

/**
 * Create an empty file with unique name within @a directory
 *
 * @param directory - existing directory
 *
 * @return absolute path of created file
 */
std::string createTemporaryFile(const boost::filesystem::path& directory);

}

#endif /* DFS_BRIDGE_TEST_UTILITIES_HPP_ */
