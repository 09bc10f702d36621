/** @file dfs-bridge.cc
 *  @brief dfs-bridge API implementation.
 *
 *  AdaptorRegistry holds the native adaptors, FileSystemHandle owns connections established
 *  through them. Transfers are forwarded to the adaptor of the source handle.
 *
 *  @date   Oct 19, 2026
 */

#include <boost/make_shared.hpp>
#include <boost/thread/mutex.hpp>

#include "dfs_bridge/dfs-bridge.h"
#include "dfs_bridge/adaptor-registry.hpp"
#include "dfs_bridge/libhdfs-adaptor.hpp"
#include "dfs_bridge/native-path.hpp"

namespace dfsbridge {

static boost::mutex init_mutex;

/** native transfer entry point, NativeAdaptor::copy or NativeAdaptor::move */
typedef int (NativeAdaptor::*TransferCall)(fsBridge, const char*, fsBridge, const char*);

/**
 * Check the handles share one adaptor and convert the paths, then run a single native transfer.
 * Paths buffers live till the native call returns.
 */
static status::StatusInternal transfer(const char* operation, TransferCall call,
		const FileSystemHandle& srcFs, const std::string& src,
		const FileSystemHandle& dstFs, const std::string& dst){
	if(!srcFs.valid() || !dstFs.valid()){
		LOG (ERROR)<< operation << "() : " << (srcFs.valid() ? "destination" : "source") <<
				" file system is not connected." << "\n";
		return status::FILESYSTEM_IS_NOT_CONNECTED;
	}

	// each native handle is only meaningful to the adaptor that created it
	if(srcFs.adaptor() != dstFs.adaptor()){
		LOG (ERROR)<< operation << "() : source fs \"" << srcFs.descriptor() << "\" and dest fs \""
				<< dstFs.descriptor() << "\" are connected through different native adaptors." << "\n";
		return status::FILESYSTEM_ADAPTOR_MISMATCH;
	}

	NativePath nativeSrc(src);
	NativePath nativeDst(dst);
	if(!nativeSrc.valid() || !nativeDst.valid()){
		LOG (ERROR)<< operation << "() : " << (nativeSrc.valid() ? "destination" : "source") <<
				" path contains null byte." << "\n";
		return status::PATH_ENCODING_FAILURE;
	}

	VLOG_FILE << operation << "() for source fs \"" << srcFs.descriptor() << "\", file \"" << src << "\"; "
			<< "dest fs \"" << dstFs.descriptor() << "\", file \"" << dst << "\".";

	int ret = (srcFs.adaptor().get()->*call)(srcFs.raw(), nativeSrc.c_str(), dstFs.raw(), nativeDst.c_str());
	if(ret != 0){
		LOG (ERROR)<< operation << "() failed for source fs \"" << srcFs.descriptor() << "\", file \"" << src
				<< "\"; dest fs \"" << dstFs.descriptor() << "\", file \"" << dst << "\"." << "\n";
		return status::NATIVE_CALL_FAILED;
	}
	return status::OK;
}

status::StatusInternal dfsInit(const char* program){
	boost::mutex::scoped_lock lock(init_mutex);

	InitGoogleLoggingSafe(program);
	AdaptorRegistry::init();

	// keep the default adaptor if one is set already
	if(AdaptorRegistry::instance()->setDefaultAdaptor(boost::make_shared<LibHdfsAdaptor>()) ==
			AdaptorRegistry::INITIALIZED){
		LOG (INFO)<< "libhdfs adaptor is configured as default." << "\n";
		LogCommandLineFlags();
	}
	return status::OK;
}

status::StatusInternal dfsConfigureAdaptor(DFS_TYPE dfsType, const NativeAdaptorPtr& adaptor){
	boost::mutex::scoped_lock lock(init_mutex);
	if(AdaptorRegistry::instance() == NULL)
		return status::DFS_ADAPTOR_IS_NOT_CONFIGURED;

	if(AdaptorRegistry::instance()->addAdaptor(dfsType, adaptor, true) != AdaptorRegistry::INITIALIZED)
		return status::DFS_ADAPTOR_IS_NOT_CONFIGURED;
	return status::OK;
}

status::StatusInternal dfsConfigureDefaultAdaptor(const NativeAdaptorPtr& adaptor){
	boost::mutex::scoped_lock lock(init_mutex);
	if(AdaptorRegistry::instance() == NULL)
		return status::DFS_ADAPTOR_IS_NOT_CONFIGURED;

	if(AdaptorRegistry::instance()->setDefaultAdaptor(adaptor, true) != AdaptorRegistry::INITIALIZED)
		return status::DFS_ADAPTOR_IS_NOT_CONFIGURED;
	return status::OK;
}

status::StatusInternal dfsShutdown(){
	boost::mutex::scoped_lock lock(init_mutex);
	AdaptorRegistry::shutdown();
	return status::OK;
}

status::StatusInternal dfsCopy(const FileSystemHandle& srcFs, const std::string& src,
		const FileSystemHandle& dstFs, const std::string& dst){
	return transfer("dfsCopy", &NativeAdaptor::copy, srcFs, src, dstFs, dst);
}

status::StatusInternal dfsMove(const FileSystemHandle& srcFs, const std::string& src,
		const FileSystemHandle& dstFs, const std::string& dst){
	return transfer("dfsMove", &NativeAdaptor::move, srcFs, src, dstFs, dst);
}

}
