/*
 * @file  libhdfs-adaptor.hpp
 * @brief native adaptor over libhdfs (hdfs.h)
 *
 * Hadoop sources used:
 * - libhdfs
 * https://svn.apache.org/repos/asf/hadoop/common/tags/release-2.3.0/hadoop-hdfs-project/hadoop-hdfs/src/main/native/libhdfs/hdfs.h
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_LIBHDFS_ADAPTOR_HPP_
#define DFS_BRIDGE_LIBHDFS_ADAPTOR_HPP_

#include "dfs_bridge/native-adaptor.hpp"

DECLARE_string(dfs_user);
DECLARE_string(dfs_kerb_ticket_cache_path);
DECLARE_bool(dfs_force_new_instance);

namespace dfsbridge {

/**
 * Adaptor to org.apache.hadoop.fs.FileSystem via libhdfs.
 * Whatever filesystem Hadoop is configured for (hdfs, local, s3a...) is reachable.
 *
 * Whether libhdfs tolerates concurrent calls on the same handle is up to libhdfs,
 * this adaptor adds no locking.
 */
class LibHdfsAdaptor : public NativeAdaptor{
public:
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

}

#endif /* DFS_BRIDGE_LIBHDFS_ADAPTOR_HPP_ */
