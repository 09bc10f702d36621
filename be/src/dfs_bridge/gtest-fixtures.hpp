/**
 * @file gtest-fixtures.hpp
 * @brief contains fixtures for dfs-bridge tests
 *
 * @date Oct 19, 2026
 */

#ifndef DFS_BRIDGE_GTEST_FIXTURES_HPP_
#define DFS_BRIDGE_GTEST_FIXTURES_HPP_

#include <boost/filesystem.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <gtest/gtest.h>

#include "dfs_bridge/dfs-bridge.h"
#include "dfs_bridge/test-utilities.hpp"

namespace dfsbridge{

/**
 * Fixture for tests running against SandboxAdaptor.
 * Local file system and "sandbox://" file systems are both served by the sandbox adaptor.
 */
class DfsBridgeTest : public ::testing::Test {
 protected:
	boost::filesystem::path           m_sandbox;  /**< sandbox root, removed on tear down */
	boost::filesystem::path           m_local;    /**< local directory for local files */
	boost::shared_ptr<SandboxAdaptor> m_adaptor;  /**< native boundary emulation */

	static void SetUpTestCase() {
		InitGoogleLoggingSafe("Test_dfs_bridge");
	}

	virtual void SetUp() {
		boost::system::error_code ec;

		m_sandbox = boost::filesystem::temp_directory_path(ec) /
				boost::filesystem::unique_path("dfs-bridge-test-%%%%-%%%%");
		ASSERT_TRUE(!ec);
		m_local = m_sandbox / "local";

		boost::filesystem::create_directories(m_local, ec);
		SCOPED_TRACE(ec.message());
		ASSERT_TRUE(!ec);

		ASSERT_EQ(dfsInit("Test_dfs_bridge"), status::OK);

		m_adaptor = boost::make_shared<SandboxAdaptor>(m_sandbox / "filesystems");
		ASSERT_EQ(dfsConfigureAdaptor(LOCAL, m_adaptor), status::OK);
		ASSERT_EQ(dfsConfigureAdaptor(OTHER, m_adaptor), status::OK);
	}

	virtual void TearDown() {
		EXPECT_EQ(dfsShutdown(), status::OK);

		boost::system::error_code ec;
		boost::filesystem::remove_all(m_sandbox, ec);
		ASSERT_TRUE(!ec);
	}
};
}

#endif /* DFS_BRIDGE_GTEST_FIXTURES_HPP_ */
