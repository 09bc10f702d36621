/*
 * @file  common-include.hpp
 * @brief statuses, descriptors and constants shared by the bridge modules
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_COMMON_INCLUDE_HPP_
#define DFS_BRIDGE_COMMON_INCLUDE_HPP_

#include <ostream>
#include <string>

#include <boost/shared_ptr.hpp>

#include "common/logging.h"
#include "dfs_bridge/hadoop-fs-definitions.h"

namespace dfsbridge {

namespace constants
{
    /** default filesystem address as understood by the native library.
     * Resolved from core-site.xml:
     *
     * <property>
 	 *	  <name>fs.defaultFS</name>
 	 *	  <value>hdfs://namenode:8020</value>
	 * </property>
    */
    extern const std::string DEFAULT_FS;

    /** scheme of local file system */
    extern const std::string LOCAL_FS_SCHEME;
}

namespace status {
/**
 * Internal operation status
 */
typedef enum {
	OK,

	PATH_ENCODING_FAILURE,          /**< path can't be passed as null-terminated bytes */
	NATIVE_CALL_FAILED,             /**< native entry point reported non-zero status */

	FILESYSTEM_IS_NOT_CONNECTED,    /**< handle holds no native connection */
	FILESYSTEM_CONNECTION_FAILED,   /**< native connect gave no handle */
	INVALID_FILESYSTEM_URI,

	DFS_ADAPTOR_IS_NOT_CONFIGURED,
	FILESYSTEM_ADAPTOR_MISMATCH,    /**< handles were connected through different native adaptors */
} StatusInternal;
}

/** Formatters for enumerations */
extern std::ostream& operator<<(std::ostream& out, const status::StatusInternal value);
extern std::ostream& operator<<(std::ostream& out, const DFS_TYPE value);

/**
 * Connection details as resolved from filesystem URI
 */
struct FileSystemDescriptor{
	DFS_TYPE      dfs_type;
	std::string   scheme;     /**< scheme as given, lower-cased. Empty for default fs */
	std::string   host;       /**< authority host, empty for local fs */
	int           port;       /**< 0 when not specified */
	std::string   user;       /**< user to connect as, empty - from configuration */

	bool          valid;      /** an object with "valid" = false should be treated as non-usable (nullptr, NULL) */

	FileSystemDescriptor() : dfs_type(NON_SPECIFIED), port(0), valid(true) {}

	static FileSystemDescriptor getNull() {
		FileSystemDescriptor descriptor;
		descriptor.valid = false;
		return descriptor;
	}
};

extern std::ostream& operator<<(std::ostream& out, const FileSystemDescriptor& descriptor);

class NativeAdaptor;
typedef boost::shared_ptr<NativeAdaptor> NativeAdaptorPtr;

}
#endif /* DFS_BRIDGE_COMMON_INCLUDE_HPP_ */
