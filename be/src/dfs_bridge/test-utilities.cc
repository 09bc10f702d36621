/*
 * @file test-utilities.cc
 * @brief testing-purposes implementations
 *
 * @date   Oct 19, 2026
 */

#include <fstream>

#include "dfs_bridge/test-utilities.hpp"

namespace dfsbridge{

namespace constants{
	const std::string TEST_SANDBOX_SCHEME = "sandbox";

	const std::string TEST_TARGET_FS_URI = "sandbox://cluster";

	const std::string TEST_LOCAL_FS_URI = "file:///";

	const std::string HADOOP_CLASSPATH_ENV_VARIABLE_NAME = "CLASSPATH";
}

namespace fs = boost::filesystem;

SandboxAdaptor::SandboxAdaptor(const fs::path& root) : m_root(root),
		connects(0), disconnects(0), transfers(0), transferResult(0), refuseConnect(false) {}

SandboxAdaptor::~SandboxAdaptor(){
	for(SandboxFs* connection : m_connections)
		delete connection;
}

int SandboxAdaptor::liveConnections(){
	boost::mutex::scoped_lock lock(m_mux);
	return m_connections.size();
}

fs::path SandboxAdaptor::resolve(fsBridge filesystem, const char* path){
	SandboxFs* connection = static_cast<SandboxFs*>(filesystem);
	if(connection->root == "/")
		return fs::path(path);
	return connection->root / fs::path(path).relative_path();
}

fsBridge SandboxAdaptor::connect(const FileSystemDescriptor& fsDescriptor){
	if(refuseConnect)
		return NULL;

	SandboxFs* connection = new SandboxFs();
	if(fsDescriptor.dfs_type == LOCAL)
		connection->root = "/";
	else
		connection->root = m_root / (fsDescriptor.host.empty() ? std::string("default") : fsDescriptor.host);

	boost::system::error_code ec;
	fs::create_directories(connection->root, ec);
	if(ec){
		delete connection;
		return NULL;
	}

	boost::mutex::scoped_lock lock(m_mux);
	m_connections.insert(connection);
	connects++;
	return connection;
}

int SandboxAdaptor::disconnect(fsBridge filesystem){
	SandboxFs* connection = static_cast<SandboxFs*>(filesystem);

	boost::mutex::scoped_lock lock(m_mux);
	if(m_connections.erase(connection) == 0)
		return -1;
	delete connection;
	disconnects++;
	return 0;
}

int SandboxAdaptor::pathExists(fsBridge filesystem, const char* path){
	boost::system::error_code ec;
	return fs::exists(resolve(filesystem, path), ec) ? 0 : -1;
}

int SandboxAdaptor::createFile(fsBridge filesystem, const char* path){
	fs::path target = resolve(filesystem, path);

	boost::system::error_code ec;
	fs::create_directories(target.parent_path(), ec);
	if(ec)
		return -1;

	std::ofstream file(target.string().c_str(), std::ios::out | std::ios::trunc);
	return file.good() ? 0 : -1;
}

int SandboxAdaptor::pathDelete(fsBridge filesystem, const char* path, int recursive){
	fs::path target = resolve(filesystem, path);

	boost::system::error_code ec;
	if(!fs::exists(target, ec))
		return -1;
	if(fs::is_directory(target, ec) && !recursive && !fs::is_empty(target, ec))
		return -1;

	fs::remove_all(target, ec);
	return ec ? -1 : 0;
}

int SandboxAdaptor::createDirectory(fsBridge filesystem, const char* path){
	boost::system::error_code ec;
	fs::create_directories(resolve(filesystem, path), ec);
	return ec ? -1 : 0;
}

int SandboxAdaptor::rename(fsBridge filesystem, const char* oldPath, const char* newPath){
	fs::path from = resolve(filesystem, oldPath);
	fs::path to   = resolve(filesystem, newPath);

	boost::system::error_code ec;
	if(!fs::exists(from, ec) || fs::exists(to, ec))
		return -1;
	fs::rename(from, to, ec);
	return ec ? -1 : 0;
}

int SandboxAdaptor::copy(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst){
	transfers++;
	if(transferResult != 0)
		return transferResult;

	fs::path from = resolve(srcFS, src);
	fs::path to   = resolve(dstFS, dst);

	boost::system::error_code ec;
	if(!fs::is_regular_file(from, ec))
		return -1;

	// destination is overwritten, its parents are created
	fs::create_directories(to.parent_path(), ec);
	if(ec)
		return -1;
	fs::remove(to, ec);
	fs::copy_file(from, to, ec);
	return ec ? -1 : 0;
}

int SandboxAdaptor::move(fsBridge srcFS, const char* src, fsBridge dstFS, const char* dst){
	int ret = copy(srcFS, src, dstFS, dst);
	if(ret != 0)
		return ret;

	// copy() counted the call already
	boost::system::error_code ec;
	fs::remove(resolve(srcFS, src), ec);
	return ec ? -1 : 0;
}

std::string createTemporaryFile(const fs::path& directory){
	fs::path file = directory / fs::unique_path("dfs-bridge-%%%%-%%%%-%%%%");
	std::ofstream stream(file.string().c_str());
	stream << "dfs-bridge test data";
	return fs::absolute(file).string();
}

}
