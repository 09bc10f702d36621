/*
 * @file test-filesystem-handle.cc
 * @brief tests of file system handles lifecycle and file operations
 *
 * @date   Oct 19, 2026
 */

#include <string>
#include <utility>
#include <gtest/gtest.h>

#include "dfs_bridge/dfs-bridge.h"
#include "dfs_bridge/gtest-fixtures.hpp"

namespace dfsbridge{

TEST_F(DfsBridgeTest, ConnectResolvesFileSystemType) {
	FileSystemHandle local;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, local), status::OK);
	EXPECT_TRUE(local.valid());
	EXPECT_EQ(local.descriptor().dfs_type, LOCAL);

	FileSystemHandle remote;
	ASSERT_EQ(FileSystemHandle::connect("sandbox://cluster:9000/ignored/path", remote), status::OK);
	EXPECT_TRUE(remote.valid());
	EXPECT_EQ(remote.descriptor().dfs_type, OTHER);
	EXPECT_EQ(remote.descriptor().host, "cluster");
	EXPECT_EQ(remote.descriptor().port, 9000);
	EXPECT_EQ(remote.adaptor(), m_adaptor);

	EXPECT_EQ(m_adaptor->connects.load(), 2);
	EXPECT_EQ(m_adaptor->liveConnections(), 2);
}

TEST_F(DfsBridgeTest, ConnectFailures) {
	FileSystemHandle handle;

	EXPECT_EQ(FileSystemHandle::connect("sandbox:/no/authority", handle), status::INVALID_FILESYSTEM_URI);
	EXPECT_EQ(FileSystemHandle::connect("sandbox://cluster:port", handle), status::INVALID_FILESYSTEM_URI);
	EXPECT_EQ(FileSystemHandle::connect("file://remotehost/tmp", handle), status::INVALID_FILESYSTEM_URI);
	EXPECT_EQ(FileSystemHandle::connect(FileSystemDescriptor::getNull(), handle), status::INVALID_FILESYSTEM_URI);
	EXPECT_FALSE(handle.valid());

	m_adaptor->refuseConnect = true;
	EXPECT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, handle), status::FILESYSTEM_CONNECTION_FAILED);
	EXPECT_FALSE(handle.valid());
	m_adaptor->refuseConnect = false;

	ASSERT_EQ(dfsShutdown(), status::OK);
	EXPECT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, handle), status::DFS_ADAPTOR_IS_NOT_CONFIGURED);
	EXPECT_FALSE(handle.valid());
	EXPECT_EQ(m_adaptor->connects.load(), 0);
}

/** Handles connected before shutdown keep their adaptor */
TEST_F(DfsBridgeTest, HandleOutlivesShutdown) {
	FileSystemHandle handle;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, handle), status::OK);
	ASSERT_EQ(dfsShutdown(), status::OK);

	EXPECT_EQ(handle.create("/after_shutdown"), status::OK);
	EXPECT_EQ(handle.close(), status::OK);
	EXPECT_EQ(m_adaptor->disconnects.load(), 1);
}

TEST_F(DfsBridgeTest, FailedConnectKeepsHandle) {
	FileSystemHandle handle;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, handle), status::OK);
	fsBridge raw = handle.raw();

	EXPECT_EQ(FileSystemHandle::connect("sandbox:/no/authority", handle), status::INVALID_FILESYSTEM_URI);
	EXPECT_EQ(handle.raw(), raw);
	EXPECT_EQ(m_adaptor->disconnects.load(), 0);
}

TEST_F(DfsBridgeTest, MovedHandleDisconnectsOnce) {
	{
		FileSystemHandle first;
		ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, first), status::OK);
		fsBridge raw = first.raw();

		FileSystemHandle second(std::move(first));
		EXPECT_FALSE(first.valid());
		EXPECT_TRUE(second.valid());
		EXPECT_EQ(second.raw(), raw);

		FileSystemHandle third;
		third = std::move(second);
		EXPECT_FALSE(second.valid());
		EXPECT_EQ(third.raw(), raw);

		// closing an empty handle is a no-op
		EXPECT_EQ(first.close(), status::OK);
		EXPECT_EQ(m_adaptor->disconnects.load(), 0);
	}
	EXPECT_EQ(m_adaptor->connects.load(), 1);
	EXPECT_EQ(m_adaptor->disconnects.load(), 1);
	EXPECT_EQ(m_adaptor->liveConnections(), 0);
}

TEST_F(DfsBridgeTest, MoveAssignmentClosesPreviousConnection) {
	FileSystemHandle target;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, target), status::OK);
	FileSystemHandle source;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, source), status::OK);
	fsBridge raw = source.raw();

	target = std::move(source);
	EXPECT_EQ(m_adaptor->disconnects.load(), 1);
	EXPECT_EQ(target.raw(), raw);
	EXPECT_EQ(target.descriptor().dfs_type, LOCAL);

	EXPECT_EQ(target.close(), status::OK);
	EXPECT_EQ(target.close(), status::OK);
	EXPECT_EQ(m_adaptor->disconnects.load(), 2);
	EXPECT_EQ(m_adaptor->liveConnections(), 0);
}

TEST_F(DfsBridgeTest, FileOperations) {
	FileSystemHandle fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, fs), status::OK);

	bool exists = true;
	ASSERT_EQ(fs.exists("/dir/file", &exists), status::OK);
	EXPECT_FALSE(exists);

	ASSERT_EQ(fs.createDirectory("/dir/nested"), status::OK);
	ASSERT_EQ(fs.create("/dir/file"), status::OK);
	ASSERT_EQ(fs.exists("/dir/file", &exists), status::OK);
	EXPECT_TRUE(exists);

	ASSERT_EQ(fs.rename("/dir/file", "/dir/renamed"), status::OK);
	ASSERT_EQ(fs.exists("/dir/file", &exists), status::OK);
	EXPECT_FALSE(exists);
	ASSERT_EQ(fs.exists("/dir/renamed", &exists), status::OK);
	EXPECT_TRUE(exists);
	EXPECT_EQ(fs.rename("/dir/file", "/dir/other"), status::NATIVE_CALL_FAILED);

	// non-empty directory requires recursive delete
	EXPECT_EQ(fs.remove("/dir", false), status::NATIVE_CALL_FAILED);
	ASSERT_EQ(fs.remove("/dir", true), status::OK);
	ASSERT_EQ(fs.exists("/dir", &exists), status::OK);
	EXPECT_FALSE(exists);
	EXPECT_EQ(fs.remove("/dir", true), status::NATIVE_CALL_FAILED);
}

TEST_F(DfsBridgeTest, FileOperationsRequireConnection) {
	FileSystemHandle fs;
	bool exists = false;

	EXPECT_EQ(fs.exists("/a", &exists), status::FILESYSTEM_IS_NOT_CONNECTED);
	EXPECT_EQ(fs.create("/a"), status::FILESYSTEM_IS_NOT_CONNECTED);
	EXPECT_EQ(fs.remove("/a", true), status::FILESYSTEM_IS_NOT_CONNECTED);
	EXPECT_EQ(fs.createDirectory("/a"), status::FILESYSTEM_IS_NOT_CONNECTED);
	EXPECT_EQ(fs.rename("/a", "/b"), status::FILESYSTEM_IS_NOT_CONNECTED);
}

TEST_F(DfsBridgeTest, FileOperationsRejectNullByte) {
	FileSystemHandle fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, fs), status::OK);

	std::string bad_path("/a\0b", 4);
	bool exists = false;
	EXPECT_EQ(fs.exists(bad_path, &exists), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(fs.create(bad_path), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(fs.remove(bad_path, false), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(fs.createDirectory(bad_path), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(fs.rename("/a", bad_path), status::PATH_ENCODING_FAILURE);

	ASSERT_EQ(fs.exists("/a", &exists), status::OK);
	EXPECT_FALSE(exists);
}

TEST_F(DfsBridgeTest, EmptyUriUsesDefaultFileSystemFlag) {
	google::FlagSaver saver;
	FLAGS_dfs_default_fs = constants::TEST_TARGET_FS_URI;

	FileSystemHandle fs;
	ASSERT_EQ(FileSystemHandle::connect("", fs), status::OK);
	EXPECT_EQ(fs.descriptor().dfs_type, OTHER);
	EXPECT_EQ(fs.descriptor().host, "cluster");
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
