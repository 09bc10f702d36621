/*
 * @file  native-adaptor.hpp
 * @brief abstract boundary to the native filesystem client library
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_NATIVE_ADAPTOR_HPP_
#define DFS_BRIDGE_NATIVE_ADAPTOR_HPP_

#include "dfs_bridge/common-include.hpp"

namespace dfsbridge {

/**
 * Adaptor to the native filesystem client. This is the only place native entry points are invoked.
 *
 * All integer results follow the native convention: 0 on success, non-zero on failure.
 * No detail beyond pass/fail is available from this boundary.
 * Paths are null-terminated and only valid for the duration of the call.
 */
class NativeAdaptor{
public:
	virtual ~NativeAdaptor() {}

	/**
	 * Connect to the file system described by @a fsDescriptor
	 *
	 * @param fsDescriptor - file system connection details
	 *
	 * @return native file system handle, NULL on failure
	 */
	virtual fsBridge connect(const FileSystemDescriptor& fsDescriptor) = 0;

	/**
	 * Disconnect from file system. Native resources of @a fs are released even on failure.
	 *
	 * @param fs - native file system handle
	 */
	virtual int disconnect(fsBridge fs) = 0;

	/** check that @a path exists, 0 if so */
	virtual int pathExists(fsBridge fs, const char* path) = 0;

	/** create an empty file, or truncate an existing one */
	virtual int createFile(fsBridge fs, const char* path) = 0;

	/**
	 * Delete the @a path
	 *
	 * @param fs        - native file system handle
	 * @param path      - path to delete
	 * @param recursive - if path is a directory and set to non-zero, the directory is
	 * 					  deleted with its content, fails otherwise.
	 */
	virtual int pathDelete(fsBridge fs, const char* path, int recursive) = 0;

	/** make the given directory and all non-existent parents */
	virtual int createDirectory(fsBridge fs, const char* path) = 0;

	/** rename @a oldPath to @a newPath within single file system */
	virtual int rename(fsBridge fs, const char* oldPath, const char* newPath) = 0;

	/**
	 * Copy file from one filesystem to another.
	 *
	 * @param srcFS - handle to source filesystem.
	 * @param src   - path of source file.
	 * @param dstFS - handle to destination filesystem.
	 * @param dst   - path of destination file.
	 */
	virtual int copy(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst) = 0;

	/**
	 * Move file from one filesystem to another.
	 *
	 * @param srcFS - handle to source filesystem.
	 * @param src   - path of source file.
	 * @param dstFS - handle to destination filesystem.
	 * @param dst   - path of destination file.
	 */
	virtual int move(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst) = 0;
};

}

#endif /* DFS_BRIDGE_NATIVE_ADAPTOR_HPP_ */
