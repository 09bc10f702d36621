/*
 * @file  filesystem-handle.hpp
 * @brief define raii file system connection
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_FILESYSTEM_HANDLE_HPP_
#define DFS_BRIDGE_FILESYSTEM_HANDLE_HPP_

#include <string>

#include "dfs_bridge/common-include.hpp"
#include "dfs_bridge/native-adaptor.hpp"

DECLARE_string(dfs_default_fs);

namespace dfsbridge{

/**
 * Exclusive owner of a single native file system connection.
 * Disconnects when closed, destroyed or overwritten by move assignment.
 *
 * The handle is not synchronized. If it is shared by concurrent callers, they are responsible
 * for synchronization; whether the native library supports concurrent calls on one connection
 * is a property of the native library.
 */
class FileSystemHandle{
private:
	fsBridge             m_fs;          /**< native connection, NULL if not connected */
	NativeAdaptorPtr     m_adaptor;     /**< adaptor the connection was established with */
	FileSystemDescriptor m_descriptor;  /**< file system connection details */

	FileSystemHandle(const FileSystemHandle&) = delete;           // prevent copy constructor to be used so that operation conn1 = conn2 is impossible
	FileSystemHandle& operator=(const FileSystemHandle&) = delete; // prevent copy assignment to be used so that operation conn1(conn2) is avoided

	FileSystemHandle(const NativeAdaptorPtr& adaptor, fsBridge fs, const FileSystemDescriptor& descriptor) :
		m_fs(fs), m_adaptor(adaptor), m_descriptor(descriptor) {}

public:
	/** not connected handle */
	FileSystemHandle() : m_fs(NULL), m_descriptor(FileSystemDescriptor::getNull()) {}

	~FileSystemHandle();

	/**
	 * Move constructor
	 */
	FileSystemHandle(FileSystemHandle&& other);

	/**
	 * Move assignment. Connection held by this handle before is closed.
	 */
	FileSystemHandle& operator=(FileSystemHandle&& other);

	void swap(FileSystemHandle& other) throw();

	/**
	 * Connect to the file system the @a uri belongs to.
	 * Path component of @a uri, if any, is not used.
	 *
	 * @param [In]  uri    - file system uri, e.g. "hdfs://namenode:8020", "file:///".
	 *                       Empty uri means --dfs_default_fs
	 * @param [Out] handle - connected handle. Not changed on failure.
	 *
	 * @return Operation status
	 */
	static status::StatusInternal connect(const std::string& uri, FileSystemHandle& handle);

	/**
	 * Connect to the file system described by @a fsDescriptor
	 * via native adaptor registered for its type.
	 *
	 * @param [In]  fsDescriptor - file system connection details
	 * @param [Out] handle       - connected handle. Not changed on failure.
	 *
	 * @return Operation status
	 */
	static status::StatusInternal connect(const FileSystemDescriptor& fsDescriptor, FileSystemHandle& handle);

	/** flag, indicates whether the handle holds a connection */
	bool valid() const { return m_fs != NULL; }

	/** native connection, to be passed to a single native call and not kept */
	fsBridge raw() const { return m_fs; }

	/** adaptor the connection belongs to */
	const NativeAdaptorPtr& adaptor() const { return m_adaptor; }

	/** connection details */
	const FileSystemDescriptor& descriptor() const { return m_descriptor; }

	/**
	 * Disconnect. No-op for not connected handle.
	 * Native resources are released even if the native library reports failure.
	 *
	 * @return Operation status
	 */
	status::StatusInternal close();

	/**
	 * Check whether @a path exists
	 *
	 * @param [In]  path   - path to check
	 * @param [Out] exists - flag, indicates whether the path exists
	 *
	 * @return Operation status
	 */
	status::StatusInternal exists(const std::string& path, bool* exists) const;

	/** Create an empty file at @a path, truncating existing one */
	status::StatusInternal create(const std::string& path) const;

	/**
	 * Delete file or directory.
	 *
	 * @param path      - path of the file/folder.
	 * @param recursive - required to delete non-empty directory
	 *
	 * @return Operation status
	 */
	status::StatusInternal remove(const std::string& path, bool recursive) const;

	/** Make the given directory and all non-existent parents */
	status::StatusInternal createDirectory(const std::string& path) const;

	/** Rename @a oldPath to @a newPath */
	status::StatusInternal rename(const std::string& oldPath, const std::string& newPath) const;
};

}

#endif /* DFS_BRIDGE_FILESYSTEM_HANDLE_HPP_ */
