/*
 * @file test-adaptor-registry.cc
 * @brief tests of native adaptors registry
 *
 * @date   Oct 19, 2026
 */

#include <boost/make_shared.hpp>
#include <gtest/gtest.h>

#include "dfs_bridge/adaptor-registry.hpp"
#include "dfs_bridge/test-utilities.hpp"

namespace dfsbridge{

class AdaptorRegistryTest : public ::testing::Test {
 protected:
	NativeAdaptorPtr m_first;
	NativeAdaptorPtr m_second;

	virtual void SetUp() {
		AdaptorRegistry::init();
		m_first  = boost::make_shared<SandboxAdaptor>(boost::filesystem::temp_directory_path() / "first");
		m_second = boost::make_shared<SandboxAdaptor>(boost::filesystem::temp_directory_path() / "second");
	}

	virtual void TearDown() {
		AdaptorRegistry::shutdown();
	}
};

TEST_F(AdaptorRegistryTest, InitIsIdempotent) {
	AdaptorRegistry* registry = AdaptorRegistry::instance();
	ASSERT_TRUE(registry != NULL);
	ASSERT_EQ(registry->addAdaptor(HDFS, m_first), AdaptorRegistry::INITIALIZED);

	AdaptorRegistry::init();
	EXPECT_EQ(AdaptorRegistry::instance(), registry);

	NativeAdaptorPtr adaptor;
	EXPECT_EQ(registry->getAdaptor(HDFS, adaptor), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(adaptor, m_first);

	AdaptorRegistry::shutdown();
	EXPECT_TRUE(AdaptorRegistry::instance() == NULL);
}

TEST_F(AdaptorRegistryTest, NotConfiguredType) {
	NativeAdaptorPtr adaptor = m_first;
	EXPECT_EQ(AdaptorRegistry::instance()->getAdaptor(S3, adaptor), AdaptorRegistry::NON_CONFIGURED);
	EXPECT_FALSE(adaptor);
}

TEST_F(AdaptorRegistryTest, RedefinitionRequiresForce) {
	AdaptorRegistry* registry = AdaptorRegistry::instance();
	ASSERT_EQ(registry->addAdaptor(HDFS, m_first), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(registry->addAdaptor(HDFS, m_second), AdaptorRegistry::ALREADY_DEFINED);

	NativeAdaptorPtr adaptor;
	ASSERT_EQ(registry->getAdaptor(HDFS, adaptor), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(adaptor, m_first);

	EXPECT_EQ(registry->addAdaptor(HDFS, m_second, true), AdaptorRegistry::INITIALIZED);
	ASSERT_EQ(registry->getAdaptor(HDFS, adaptor), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(adaptor, m_second);
}

TEST_F(AdaptorRegistryTest, DefaultAdaptorServesUnregisteredTypes) {
	AdaptorRegistry* registry = AdaptorRegistry::instance();
	ASSERT_EQ(registry->setDefaultAdaptor(m_first), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(registry->setDefaultAdaptor(m_second), AdaptorRegistry::ALREADY_DEFINED);
	ASSERT_EQ(registry->addAdaptor(LOCAL, m_second), AdaptorRegistry::INITIALIZED);

	NativeAdaptorPtr adaptor;
	ASSERT_EQ(registry->getAdaptor(HDFS, adaptor), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(adaptor, m_first);
	ASSERT_EQ(registry->getAdaptor(LOCAL, adaptor), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(adaptor, m_second);

	EXPECT_EQ(registry->setDefaultAdaptor(m_second, true), AdaptorRegistry::INITIALIZED);
	ASSERT_EQ(registry->getAdaptor(DEFAULT_FROM_CONFIG, adaptor), AdaptorRegistry::INITIALIZED);
	EXPECT_EQ(adaptor, m_second);

	registry->reset();
	EXPECT_EQ(registry->getAdaptor(LOCAL, adaptor), AdaptorRegistry::NON_CONFIGURED);
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
