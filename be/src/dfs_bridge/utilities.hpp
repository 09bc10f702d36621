/*
 * @file utilities.hpp
 * @brief define filesystem URI resolution and misc utilities used by the bridge
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_UTILITIES_HPP_
#define DFS_BRIDGE_UTILITIES_HPP_

#include <string>

#include "dfs_bridge/common-include.hpp"

/** URI split into the parts the bridge cares about */
struct Uri {
public:
	std::string Protocol, UserInfo, Host, Port, Path;
	bool        HasAuthority;   /**< flag, indicates "scheme://" form */

	Uri() : HasAuthority(false) {}

	/**
	 * Split the @a uri. Recognizes "scheme://[user@]host[:port]/path",
	 * hadoop-style "scheme:/path" and unqualified "/path".
	 */
	static Uri Parse(const std::string &uri);
};

namespace dfsbridge {

namespace utilities {

/**
 * Resolve the filesystem and the path within it from a filesystem URI.
 *
 * "hdfs://nn:8020/data/a" gives {HDFS, "nn", 8020} and "/data/a";
 * "file:///tmp/a" gives {LOCAL} and "/tmp/a";
 * "default", "" or "/data/a" give {DEFAULT_FROM_CONFIG}.
 *
 * @param [in]  uri        - uri to resolve
 * @param [out] descriptor - resolved filesystem descriptor
 * @param [out] path       - path within the resolved filesystem, "/" when none is given
 *
 * @return OK or INVALID_FILESYSTEM_URI
 */
status::StatusInternal resolveFileSystem(const std::string& uri, FileSystemDescriptor& descriptor,
		std::string& path);

/**
 * Build the address the native library should connect to.
 *
 * @param descriptor - filesystem descriptor
 *
 * @return "scheme://host[:port]", constants::DEFAULT_FS for default fs,
 * or empty string for the local file system
 */
std::string fsAddress(const FileSystemDescriptor& descriptor);

}
}

#endif /* DFS_BRIDGE_UTILITIES_HPP_ */
