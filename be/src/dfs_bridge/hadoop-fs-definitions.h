/*
 * @file  hadoop-fs-definitions.h
 * @brief types that are passed through the native Hadoop FileSystem boundary
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_HADOOP_FS_DEFINITIONS_H_
#define DFS_BRIDGE_HADOOP_FS_DEFINITIONS_H_

#ifdef __cplusplus
extern "C" {
#endif

/** supported / configured DFS types */
enum _DFS_TYPE {
	HDFS,
	S3,
	LOCAL,
	DEFAULT_FROM_CONFIG,
	OTHER,               // any scheme the native library may know about
	NON_SPECIFIED,
};

typedef enum _DFS_TYPE DFS_TYPE;

/** resolve fs type from given scheme, case-insensitive
 *
 * @param scheme - string scheme, may be NULL or empty
 * @return resolved file system type
 * */
extern DFS_TYPE fsTypeFromScheme(const char* scheme);

/** bridge to abstract org.apache.hadoop.fs.FileSystem.
 *  Opaque, owned by the native library; for libhdfs this is a hdfsFS. */
typedef void* fsBridge;

#ifdef __cplusplus
}
#endif

#endif /* DFS_BRIDGE_HADOOP_FS_DEFINITIONS_H_ */
