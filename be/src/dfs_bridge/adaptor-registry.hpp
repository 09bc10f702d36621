/*
 * @file  adaptor-registry.hpp
 * @brief registry of native adaptors, provides them according to the filesystem type
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_ADAPTOR_REGISTRY_HPP_
#define DFS_BRIDGE_ADAPTOR_REGISTRY_HPP_

#include <map>

#include <boost/scoped_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include "dfs_bridge/native-adaptor.hpp"

namespace dfsbridge{

/**
 * Holds native adaptors and provides them according to the specified filesystem type.
 * The default adaptor serves every type that has no adaptor of its own.
 */
class AdaptorRegistry{
private:
	/** Singleton instance. Instantiated in init(). */
	static boost::scoped_ptr<AdaptorRegistry> instance_;

	std::map<DFS_TYPE, NativeAdaptorPtr> m_adaptors;   /**< adaptors registered per filesystem type */
	NativeAdaptorPtr                     m_default;    /**< adaptor for types with no own adaptor */

	boost::mutex m_mux;

	AdaptorRegistry() {}

	AdaptorRegistry(AdaptorRegistry const& l);            // disable copy constructor
	AdaptorRegistry& operator=(AdaptorRegistry const& l); // disable assignment operator

public:
	enum AdaptorState{
		INITIALIZED,
		ALREADY_DEFINED,
		NON_CONFIGURED,
	};

	/** create the registry if it does not exist yet */
	static void init();

	/** destroy the registry with all adaptors it holds */
	static void shutdown();

	/** registry instance, NULL until init() */
	static AdaptorRegistry* instance() { return AdaptorRegistry::instance_.get(); }

	/**
	 * Add the adaptor for one of filesystem types.
	 *
	 * @param dfsType - filesystem type
	 * @param adaptor - native adaptor
	 * @param force   - flag, indicates whether force registration is required.
	 * If specified, adaptor will be added even if another one exists for the same type already
	 *
	 * @return INITIALIZED if registered, ALREADY_DEFINED if skipped
	 */
	AdaptorState addAdaptor(DFS_TYPE dfsType, const NativeAdaptorPtr& adaptor, bool force = false);

	/**
	 * Set the adaptor for all filesystem types that have no adaptor of their own
	 *
	 * @param adaptor - native adaptor
	 * @param force   - flag, indicates whether the existing default adaptor should be replaced
	 *
	 * @return INITIALIZED if set, ALREADY_DEFINED if skipped
	 */
	AdaptorState setDefaultAdaptor(const NativeAdaptorPtr& adaptor, bool force = false);

	/**
	 * Get adaptor for specified filesystem type
	 *
	 * @param [In]  dfsType - filesystem type
	 * @param [Out] adaptor - adaptor for filesystem type, reset if none
	 *
	 * @return INITIALIZED or NON_CONFIGURED
	 */
	AdaptorState getAdaptor(DFS_TYPE dfsType, NativeAdaptorPtr& adaptor);

	/** forget all registered adaptors, default included */
	void reset();
};

}
#endif /* DFS_BRIDGE_ADAPTOR_REGISTRY_HPP_ */
