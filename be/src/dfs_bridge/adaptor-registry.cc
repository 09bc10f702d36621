/*
 * @file adaptor-registry.cc
 * @brief implementation of native adaptors registry.
 *
 * @date   Oct 19, 2026
 */

#include "dfs_bridge/adaptor-registry.hpp"

namespace dfsbridge{

boost::scoped_ptr<AdaptorRegistry> AdaptorRegistry::instance_;

void AdaptorRegistry::init(){
	if(AdaptorRegistry::instance_.get() == NULL)
		AdaptorRegistry::instance_.reset(new AdaptorRegistry());
}

void AdaptorRegistry::shutdown(){
	AdaptorRegistry::instance_.reset();
}

AdaptorRegistry::AdaptorState AdaptorRegistry::addAdaptor(DFS_TYPE dfsType, const NativeAdaptorPtr& adaptor,
		bool force){
	boost::mutex::scoped_lock lock(m_mux);
	if(m_adaptors.count(dfsType) > 0){
		if(!force){ // skip redefinition if this was not an intention
			LOG (WARNING)<< "Adaptor for \"" << dfsType << "\" is already registered." << "\n";
			return ALREADY_DEFINED;
		}
		// old adaptor is released when last handle created through it disconnects
		LOG (INFO)<< "Adaptor for \"" << dfsType << "\" is replaced." << "\n";
	}
	m_adaptors[dfsType] = adaptor;
	return INITIALIZED;
}

AdaptorRegistry::AdaptorState AdaptorRegistry::setDefaultAdaptor(const NativeAdaptorPtr& adaptor, bool force){
	boost::mutex::scoped_lock lock(m_mux);
	if(m_default && !force)
		return ALREADY_DEFINED;
	m_default = adaptor;
	return INITIALIZED;
}

AdaptorRegistry::AdaptorState AdaptorRegistry::getAdaptor(DFS_TYPE dfsType, NativeAdaptorPtr& adaptor){
	boost::mutex::scoped_lock lock(m_mux);
	std::map<DFS_TYPE, NativeAdaptorPtr>::iterator it = m_adaptors.find(dfsType);
	if(it != m_adaptors.end()){
		adaptor = it->second;
		return INITIALIZED;
	}
	adaptor = m_default;
	return adaptor ? INITIALIZED : NON_CONFIGURED;
}

void AdaptorRegistry::reset(){
	boost::mutex::scoped_lock lock(m_mux);
	m_adaptors.clear();
	m_default.reset();
}

}
