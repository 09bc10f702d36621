/*
 * @file  filesystem-handle.cc
 * @brief raii file system connection, implementation
 *
 * @date   Oct 19, 2026
 */

#include <utility>

#include "dfs_bridge/filesystem-handle.hpp"
#include "dfs_bridge/adaptor-registry.hpp"
#include "dfs_bridge/native-path.hpp"
#include "dfs_bridge/utilities.hpp"

DEFINE_string(dfs_default_fs, "default", "file system to connect to when no uri is given. "
		"\"default\" is fs.defaultFS from Hadoop configuration");

namespace dfsbridge{

FileSystemHandle::~FileSystemHandle(){
	// disconnect failure is logged by close()
	close();
}

FileSystemHandle::FileSystemHandle(FileSystemHandle&& other) :
		m_fs(NULL), m_descriptor(FileSystemDescriptor::getNull()){
	// take over the connection from "other"
	swap(other);
}

FileSystemHandle& FileSystemHandle::operator=(FileSystemHandle&& other){
	if (this == &other)
		return *this;

	// own connection goes to temp and is closed with it
	FileSystemHandle temp(std::move(other));
	swap(temp);
	return *this;
}

void FileSystemHandle::swap(FileSystemHandle& other) throw(){
	std::swap(m_fs, other.m_fs);
	m_adaptor.swap(other.m_adaptor);
	std::swap(m_descriptor, other.m_descriptor);
}

status::StatusInternal FileSystemHandle::connect(const std::string& uri, FileSystemHandle& handle){
	const std::string& effective = uri.empty() ? FLAGS_dfs_default_fs : uri;

	FileSystemDescriptor descriptor;
	std::string path;
	status::StatusInternal status = utilities::resolveFileSystem(effective, descriptor, path);
	if(status != status::OK){
		LOG (ERROR)<< "Unable to resolve file system from \"" << effective << "\"." << "\n";
		return status;
	}
	return connect(descriptor, handle);
}

status::StatusInternal FileSystemHandle::connect(const FileSystemDescriptor& fsDescriptor, FileSystemHandle& handle){
	if(!fsDescriptor.valid)
		return status::INVALID_FILESYSTEM_URI;

	NativeAdaptorPtr adaptor;
	AdaptorRegistry* registry = AdaptorRegistry::instance();
	if(registry == NULL || registry->getAdaptor(fsDescriptor.dfs_type, adaptor) != AdaptorRegistry::INITIALIZED){
		LOG (ERROR)<< "No adaptor is configured for file system \"" << fsDescriptor << "\"." << "\n";
		return status::DFS_ADAPTOR_IS_NOT_CONFIGURED;
	}

	VLOG_CONNECTION << "Connecting to file system \"" << fsDescriptor << "\".";
	fsBridge fs = adaptor->connect(fsDescriptor);
	if(fs == NULL){
		LOG (ERROR)<< "Unable to connect to file system \"" << fsDescriptor << "\"." << "\n";
		return status::FILESYSTEM_CONNECTION_FAILED;
	}

	FileSystemHandle connected(adaptor, fs, fsDescriptor);
	handle = std::move(connected);
	VLOG_CONNECTION << "Connected to file system \"" << fsDescriptor << "\".";
	return status::OK;
}

status::StatusInternal FileSystemHandle::close(){
	if(m_fs == NULL)
		return status::OK;

	VLOG_CONNECTION << "Disconnecting from file system \"" << m_descriptor << "\".";
	int ret = m_adaptor->disconnect(m_fs);

	// resources are released by the native library whatever the result
	m_fs = NULL;
	m_adaptor.reset();

	if(ret != 0){
		LOG (WARNING)<< "Disconnect from file system \"" << m_descriptor << "\" reported failure." << "\n";
		return status::NATIVE_CALL_FAILED;
	}
	return status::OK;
}

status::StatusInternal FileSystemHandle::exists(const std::string& path, bool* exists) const{
	if(!valid())
		return status::FILESYSTEM_IS_NOT_CONNECTED;

	NativePath nativePath(path);
	if(!nativePath.valid()){
		LOG (ERROR)<< "Path of " << path.length() << " bytes contains null byte." << "\n";
		return status::PATH_ENCODING_FAILURE;
	}
	*exists = m_adaptor->pathExists(m_fs, nativePath.c_str()) == 0;
	return status::OK;
}

status::StatusInternal FileSystemHandle::create(const std::string& path) const{
	if(!valid())
		return status::FILESYSTEM_IS_NOT_CONNECTED;

	NativePath nativePath(path);
	if(!nativePath.valid()){
		LOG (ERROR)<< "Path of " << path.length() << " bytes contains null byte." << "\n";
		return status::PATH_ENCODING_FAILURE;
	}

	VLOG_FILE << "Create \"" << path << "\" on \"" << m_descriptor << "\".";
	if(m_adaptor->createFile(m_fs, nativePath.c_str()) != 0){
		LOG (ERROR)<< "Failed to create \"" << path << "\" on \"" << m_descriptor << "\"." << "\n";
		return status::NATIVE_CALL_FAILED;
	}
	return status::OK;
}

status::StatusInternal FileSystemHandle::remove(const std::string& path, bool recursive) const{
	if(!valid())
		return status::FILESYSTEM_IS_NOT_CONNECTED;

	NativePath nativePath(path);
	if(!nativePath.valid()){
		LOG (ERROR)<< "Path of " << path.length() << " bytes contains null byte." << "\n";
		return status::PATH_ENCODING_FAILURE;
	}

	VLOG_FILE << "Delete \"" << path << "\" on \"" << m_descriptor << "\", recursive = " << recursive << ".";
	if(m_adaptor->pathDelete(m_fs, nativePath.c_str(), recursive ? 1 : 0) != 0){
		LOG (ERROR)<< "Failed to delete \"" << path << "\" on \"" << m_descriptor << "\"." << "\n";
		return status::NATIVE_CALL_FAILED;
	}
	return status::OK;
}

status::StatusInternal FileSystemHandle::createDirectory(const std::string& path) const{
	if(!valid())
		return status::FILESYSTEM_IS_NOT_CONNECTED;

	NativePath nativePath(path);
	if(!nativePath.valid()){
		LOG (ERROR)<< "Path of " << path.length() << " bytes contains null byte." << "\n";
		return status::PATH_ENCODING_FAILURE;
	}

	VLOG_FILE << "Create directory \"" << path << "\" on \"" << m_descriptor << "\".";
	if(m_adaptor->createDirectory(m_fs, nativePath.c_str()) != 0){
		LOG (ERROR)<< "Failed to create directory \"" << path << "\" on \"" << m_descriptor << "\"." << "\n";
		return status::NATIVE_CALL_FAILED;
	}
	return status::OK;
}

status::StatusInternal FileSystemHandle::rename(const std::string& oldPath, const std::string& newPath) const{
	if(!valid())
		return status::FILESYSTEM_IS_NOT_CONNECTED;

	NativePath nativeOld(oldPath);
	NativePath nativeNew(newPath);
	if(!nativeOld.valid() || !nativeNew.valid()){
		LOG (ERROR)<< "Rename path contains null byte." << "\n";
		return status::PATH_ENCODING_FAILURE;
	}

	VLOG_FILE << "Rename \"" << oldPath << "\" to \"" << newPath << "\" on \"" << m_descriptor << "\".";
	if(m_adaptor->rename(m_fs, nativeOld.c_str(), nativeNew.c_str()) != 0){
		LOG (ERROR)<< "Failed to rename \"" << oldPath << "\" to \"" << newPath << "\" on \""
				<< m_descriptor << "\"." << "\n";
		return status::NATIVE_CALL_FAILED;
	}
	return status::OK;
}

}
