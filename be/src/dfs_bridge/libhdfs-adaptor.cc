/*
 * @file  libhdfs-adaptor.cc
 * @brief native adaptor over libhdfs, implementation
 *
 * @date   Oct 19, 2026
 */

#include <fcntl.h>
#include <hdfs.h>

#include "dfs_bridge/libhdfs-adaptor.hpp"
#include "dfs_bridge/utilities.hpp"

DEFINE_string(dfs_user, "", "user to connect to file systems as. Empty - the current user");
DEFINE_string(dfs_kerb_ticket_cache_path, "", "Kerberos ticket cache to authenticate with. Empty - none");
DEFINE_bool(dfs_force_new_instance, true, "request a new FileSystem instance for every connection "
		"instead of a shared cached one");

namespace dfsbridge {

fsBridge LibHdfsAdaptor::connect(const FileSystemDescriptor& fsDescriptor){
	hdfsBuilder* fs_builder = hdfsNewBuilder();
	if(fs_builder == NULL){
		LOG (ERROR)<< "Unable to allocate connection builder for file system \"" << fsDescriptor << "\"." << "\n";
		return NULL;
	}

	// the builder keeps shallow copies of the strings, they should survive till connect.
	std::string address = utilities::fsAddress(fsDescriptor);
	if(fsDescriptor.dfs_type == LOCAL)
		hdfsBuilderSetNameNode(fs_builder, NULL);   // LocalFileSystem is created for NULL
	else
		hdfsBuilderSetNameNode(fs_builder, address.c_str());

	const std::string& user = !fsDescriptor.user.empty() ? fsDescriptor.user : FLAGS_dfs_user;
	if(!user.empty())
		hdfsBuilderSetUserName(fs_builder, user.c_str());

	if(!FLAGS_dfs_kerb_ticket_cache_path.empty())
		hdfsBuilderSetKerbTicketCachePath(fs_builder, FLAGS_dfs_kerb_ticket_cache_path.c_str());

	if(FLAGS_dfs_force_new_instance)
		hdfsBuilderSetForceNewInstance(fs_builder);

	// builder is freed by connect whatever the result
	hdfsFS fs = hdfsBuilderConnect(fs_builder);
	if(fs == NULL)
		LOG (ERROR)<< "Unable to connect to file system \"" << fsDescriptor << "\"." << "\n";
	return fs;
}

int LibHdfsAdaptor::disconnect(fsBridge fs){
	return hdfsDisconnect(static_cast<hdfsFS>(fs));
}

int LibHdfsAdaptor::pathExists(fsBridge fs, const char* path){
	return hdfsExists(static_cast<hdfsFS>(fs), path);
}

int LibHdfsAdaptor::createFile(fsBridge fs, const char* path){
	hdfsFile file = hdfsOpenFile(static_cast<hdfsFS>(fs), path, O_WRONLY | O_CREAT, 0, 0, 0);
	if(file == NULL)
		return -1;
	return hdfsCloseFile(static_cast<hdfsFS>(fs), file);
}

int LibHdfsAdaptor::pathDelete(fsBridge fs, const char* path, int recursive){
	return hdfsDelete(static_cast<hdfsFS>(fs), path, recursive);
}

int LibHdfsAdaptor::createDirectory(fsBridge fs, const char* path){
	return hdfsCreateDirectory(static_cast<hdfsFS>(fs), path);
}

int LibHdfsAdaptor::rename(fsBridge fs, const char* oldPath, const char* newPath){
	return hdfsRename(static_cast<hdfsFS>(fs), oldPath, newPath);
}

int LibHdfsAdaptor::copy(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst){
	return hdfsCopy(static_cast<hdfsFS>(srcFS), src, static_cast<hdfsFS>(dstFS), dst);
}

int LibHdfsAdaptor::move(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst){
	return hdfsMove(static_cast<hdfsFS>(srcFS), src, static_cast<hdfsFS>(dstFS), dst);
}

}
