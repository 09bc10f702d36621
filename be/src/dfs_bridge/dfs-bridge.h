/** @file dfs-bridge.h
 *  @brief dfs-bridge API.
 *
 *  Cross-filesystem copy and move over the native Hadoop filesystem client (libhdfs).
 *  The actual I/O, the protocol and the consistency guarantees belong to the native library;
 *  this layer converts arguments for the native boundary and maps native return codes to
 *  status::StatusInternal.
 *
 *  Facilities:
 *  1. Library lifecycle and native adaptors configuration (prefixed with "dfs", see dfsInit()).
 *  2. Transfer of paths between file systems (dfsCopy(), dfsMove()).
 *  3. File system handles, see FileSystemHandle.
 *
 *  @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_H_
#define DFS_BRIDGE_H_

#include <string>

#include "dfs_bridge/common-include.hpp"
#include "dfs_bridge/filesystem-handle.hpp"
#include "dfs_bridge/native-adaptor.hpp"

/** @namespace dfsbridge */
namespace dfsbridge {

/**
 * @fn status::StatusInternal dfsInit(const char* program)
 * @brief Initialize logging and register libhdfs adaptor as the default one.
 * Repeated calls keep the adaptors configured so far.
 *
 * @param program - program name for the log files
 *
 * @return Operation status
 */
status::StatusInternal dfsInit(const char* program = "dfs-bridge");

/**
 * @fn status::StatusInternal dfsConfigureAdaptor(DFS_TYPE dfsType, const NativeAdaptorPtr& adaptor)
 * @brief Use @a adaptor for all file systems of type @a dfsType connected from now on.
 * Already connected handles keep their adaptor.
 *
 * @param dfsType - file system type
 * @param adaptor - native adaptor
 *
 * @return Operation status, DFS_ADAPTOR_IS_NOT_CONFIGURED if dfsInit() was not called
 */
status::StatusInternal dfsConfigureAdaptor(DFS_TYPE dfsType, const NativeAdaptorPtr& adaptor);

/**
 * @fn status::StatusInternal dfsConfigureDefaultAdaptor(const NativeAdaptorPtr& adaptor)
 * @brief Use @a adaptor for file system types that have no adaptor of their own.
 *
 * @param adaptor - native adaptor
 *
 * @return Operation status, DFS_ADAPTOR_IS_NOT_CONFIGURED if dfsInit() was not called
 */
status::StatusInternal dfsConfigureDefaultAdaptor(const NativeAdaptorPtr& adaptor);

/**
 * @fn status::StatusInternal dfsShutdown()
 * @brief Drop all configured adaptors. Connected handles stay usable till closed.
 * Should not run concurrently with FileSystemHandle::connect().
 *
 * @return Operation status
 */
status::StatusInternal dfsShutdown();

/**
 * Copy file from one filesystem to another.
 * The source is kept. A single blocking native call, no retries.
 *
 * Callers sharing a handle between threads should synchronize on their own.
 *
 * @param srcFs - handle to source filesystem.
 * @param src   - path of source file.
 * @param dstFs - handle to destination filesystem.
 * @param dst   - path of destination file.
 *
 * @return Operation status:
 * OK                          - copied;
 * FILESYSTEM_IS_NOT_CONNECTED - either handle is not connected, nothing is called;
 * FILESYSTEM_ADAPTOR_MISMATCH - handles were connected through different native adaptors
 *                               (see dfsConfigureAdaptor()), nothing is called;
 * PATH_ENCODING_FAILURE       - either path contains null byte, nothing is called;
 * NATIVE_CALL_FAILED          - native library reported failure.
 */
status::StatusInternal dfsCopy(const FileSystemHandle& srcFs, const std::string& src,
		const FileSystemHandle& dstFs, const std::string& dst);

/**
 * Move file from one filesystem to another.
 * The source does not exist after success. Statuses are the ones of dfsCopy().
 *
 * @param srcFs - handle to source filesystem.
 * @param src   - path of source file.
 * @param dstFs - handle to destination filesystem.
 * @param dst   - path of destination file.
 *
 * @return Operation status
 */
status::StatusInternal dfsMove(const FileSystemHandle& srcFs, const std::string& src,
		const FileSystemHandle& dstFs, const std::string& dst);

}
#endif /* DFS_BRIDGE_H_ */
