/*
 * @file test-dfs-bridge.cc
 * @brief tests of cross file system copy and move
 *
 * @date   Oct 19, 2026
 */

#include <string>
#include <utility>
#include <gtest/gtest.h>

#include "dfs_bridge/dfs-bridge.h"
#include "dfs_bridge/gtest-fixtures.hpp"

namespace dfsbridge{

/**
 * Local file "A" is copied to "/A" on target file system, then moved there.
 * Copy should keep the local file, move should remove it.
 */
TEST_F(DfsBridgeTest, CopyThenMoveFromLocal) {
	std::string src_file = createTemporaryFile(m_local);
	std::string dst_file = "/" + boost::filesystem::path(src_file).filename().string();

	FileSystemHandle src_fs;
	ASSERT_EQ(FileSystemHandle::connect("file://" + src_file, src_fs), status::OK);
	FileSystemHandle dst_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, dst_fs), status::OK);

	bool exists = false;
	ASSERT_EQ(dfsCopy(src_fs, src_file, dst_fs, dst_file), status::OK);
	ASSERT_EQ(dst_fs.exists(dst_file, &exists), status::OK);
	EXPECT_TRUE(exists);
	EXPECT_TRUE(boost::filesystem::exists(src_file));

	ASSERT_EQ(dst_fs.remove(dst_file, false), status::OK);
	ASSERT_EQ(dst_fs.exists(dst_file, &exists), status::OK);
	ASSERT_FALSE(exists);

	ASSERT_EQ(dfsMove(src_fs, src_file, dst_fs, dst_file), status::OK);
	ASSERT_EQ(dst_fs.exists(dst_file, &exists), status::OK);
	EXPECT_TRUE(exists);
	EXPECT_FALSE(boost::filesystem::exists(src_file));

	EXPECT_EQ(m_adaptor->transfers.load(), 2);
}

/** Same as above in the opposite direction: from target file system to local one */
TEST_F(DfsBridgeTest, CopyThenMoveToLocal) {
	std::string src_file = "/test.txt";
	std::string dst_file = (m_local / "test.txt").string();

	FileSystemHandle src_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, src_fs), status::OK);
	ASSERT_EQ(src_fs.create(src_file), status::OK);

	FileSystemHandle dst_fs;
	ASSERT_EQ(FileSystemHandle::connect("file://" + dst_file, dst_fs), status::OK);

	bool exists = false;
	ASSERT_EQ(dfsCopy(src_fs, src_file, dst_fs, dst_file), status::OK);
	ASSERT_EQ(src_fs.exists(src_file, &exists), status::OK);
	EXPECT_TRUE(exists);
	EXPECT_TRUE(boost::filesystem::exists(dst_file));

	boost::filesystem::remove(dst_file);

	ASSERT_EQ(dfsMove(src_fs, src_file, dst_fs, dst_file), status::OK);
	ASSERT_EQ(src_fs.exists(src_file, &exists), status::OK);
	EXPECT_FALSE(exists);
	EXPECT_TRUE(boost::filesystem::exists(dst_file));
}

/** Both ends on the same non-local file system */
TEST_F(DfsBridgeTest, MoveWithinSameFileSystem) {
	FileSystemHandle fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, fs), status::OK);
	ASSERT_EQ(fs.create("/in/part-0"), status::OK);

	ASSERT_EQ(dfsMove(fs, "/in/part-0", fs, "/out/part-0"), status::OK);

	bool exists = true;
	ASSERT_EQ(fs.exists("/in/part-0", &exists), status::OK);
	EXPECT_FALSE(exists);
	ASSERT_EQ(fs.exists("/out/part-0", &exists), status::OK);
	EXPECT_TRUE(exists);
}

TEST_F(DfsBridgeTest, NullByteInPathIsRejectedBeforeNativeCall) {
	std::string src_file = createTemporaryFile(m_local);
	std::string bad_path("/A\0B", 4);

	FileSystemHandle src_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, src_fs), status::OK);
	FileSystemHandle dst_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, dst_fs), status::OK);

	EXPECT_EQ(dfsCopy(src_fs, src_file, dst_fs, bad_path), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(dfsCopy(src_fs, bad_path, dst_fs, "/A"), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(dfsMove(src_fs, src_file, dst_fs, bad_path), status::PATH_ENCODING_FAILURE);
	EXPECT_EQ(dfsMove(src_fs, bad_path, dst_fs, "/A"), status::PATH_ENCODING_FAILURE);

	// nothing reached the native library, nothing was truncated to "/A"
	EXPECT_EQ(m_adaptor->transfers.load(), 0);
	bool exists = true;
	ASSERT_EQ(dst_fs.exists("/A", &exists), status::OK);
	EXPECT_FALSE(exists);
	EXPECT_TRUE(boost::filesystem::exists(src_file));
}

TEST_F(DfsBridgeTest, NonZeroNativeResultIsFailure) {
	std::string src_file = createTemporaryFile(m_local);

	FileSystemHandle src_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, src_fs), status::OK);
	FileSystemHandle dst_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, dst_fs), status::OK);

	// any non-zero value, not only -1
	m_adaptor->transferResult = 1;
	EXPECT_EQ(dfsCopy(src_fs, src_file, dst_fs, "/A"), status::NATIVE_CALL_FAILED);
	m_adaptor->transferResult = -1;
	EXPECT_EQ(dfsMove(src_fs, src_file, dst_fs, "/A"), status::NATIVE_CALL_FAILED);
	EXPECT_EQ(m_adaptor->transfers.load(), 2);

	// source is untouched by a failed move
	EXPECT_TRUE(boost::filesystem::exists(src_file));
}

TEST_F(DfsBridgeTest, MissingSourceIsFailure) {
	FileSystemHandle src_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, src_fs), status::OK);
	FileSystemHandle dst_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, dst_fs), status::OK);

	std::string dst_file = (m_local / "never").string();
	EXPECT_EQ(dfsCopy(src_fs, "/no_existent_file", dst_fs, dst_file), status::NATIVE_CALL_FAILED);
	EXPECT_EQ(dfsMove(src_fs, "/no_existent_file", dst_fs, dst_file), status::NATIVE_CALL_FAILED);
	EXPECT_FALSE(boost::filesystem::exists(dst_file));
}

TEST_F(DfsBridgeTest, NotConnectedHandleIsRejectedBeforeNativeCall) {
	FileSystemHandle connected;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, connected), status::OK);
	ASSERT_EQ(connected.create("/A"), status::OK);

	FileSystemHandle never_connected;
	EXPECT_EQ(dfsCopy(never_connected, "/A", connected, "/B"), status::FILESYSTEM_IS_NOT_CONNECTED);
	EXPECT_EQ(dfsMove(connected, "/A", never_connected, "/B"), status::FILESYSTEM_IS_NOT_CONNECTED);

	FileSystemHandle closed;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, closed), status::OK);
	ASSERT_EQ(closed.close(), status::OK);
	EXPECT_EQ(dfsCopy(connected, "/A", closed, "/B"), status::FILESYSTEM_IS_NOT_CONNECTED);

	FileSystemHandle moved_from;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_TARGET_FS_URI, moved_from), status::OK);
	FileSystemHandle owner(std::move(moved_from));
	EXPECT_EQ(dfsMove(moved_from, "/A", owner, "/B"), status::FILESYSTEM_IS_NOT_CONNECTED);

	EXPECT_EQ(m_adaptor->transfers.load(), 0);
}

/** Handles connected through different adaptors can't be mixed in one transfer */
TEST_F(DfsBridgeTest, HandlesOfDifferentAdaptorsAreRejectedBeforeNativeCall) {
	boost::shared_ptr<SandboxAdaptor> other = boost::make_shared<SandboxAdaptor>(m_sandbox / "other");
	ASSERT_EQ(dfsConfigureAdaptor(HDFS, other), status::OK);

	std::string src_file = createTemporaryFile(m_local);

	FileSystemHandle local_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, local_fs), status::OK);
	FileSystemHandle hdfs_fs;
	ASSERT_EQ(FileSystemHandle::connect("hdfs://namenode:8020", hdfs_fs), status::OK);
	ASSERT_EQ(hdfs_fs.adaptor(), other);
	ASSERT_EQ(hdfs_fs.create("/B"), status::OK);

	EXPECT_EQ(dfsCopy(local_fs, src_file, hdfs_fs, "/A"), status::FILESYSTEM_ADAPTOR_MISMATCH);
	EXPECT_EQ(dfsMove(local_fs, src_file, hdfs_fs, "/A"), status::FILESYSTEM_ADAPTOR_MISMATCH);
	EXPECT_EQ(dfsCopy(hdfs_fs, "/B", local_fs, (m_local / "B").string()), status::FILESYSTEM_ADAPTOR_MISMATCH);
	EXPECT_EQ(dfsMove(hdfs_fs, "/B", local_fs, (m_local / "B").string()), status::FILESYSTEM_ADAPTOR_MISMATCH);

	EXPECT_EQ(m_adaptor->transfers.load(), 0);
	EXPECT_EQ(other->transfers.load(), 0);

	bool exists = true;
	ASSERT_EQ(hdfs_fs.exists("/A", &exists), status::OK);
	EXPECT_FALSE(exists);
	ASSERT_EQ(hdfs_fs.exists("/B", &exists), status::OK);
	EXPECT_TRUE(exists);
	EXPECT_TRUE(boost::filesystem::exists(src_file));
	EXPECT_FALSE(boost::filesystem::exists(m_local / "B"));
}

TEST_F(DfsBridgeTest, ConfigureAdaptorRequiresInit) {
	ASSERT_EQ(dfsShutdown(), status::OK);
	EXPECT_EQ(dfsConfigureAdaptor(HDFS, m_adaptor), status::DFS_ADAPTOR_IS_NOT_CONFIGURED);
	EXPECT_EQ(dfsConfigureDefaultAdaptor(m_adaptor), status::DFS_ADAPTOR_IS_NOT_CONFIGURED);

	ASSERT_EQ(dfsInit("Test_dfs_bridge"), status::OK);
	EXPECT_EQ(dfsConfigureAdaptor(HDFS, m_adaptor), status::OK);
	EXPECT_EQ(dfsConfigureDefaultAdaptor(m_adaptor), status::OK);
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
