/*
 * @file test-libhdfs-adaptor.cc
 * @brief integration tests of libhdfs adaptor against the local file system.
 * Require hadoop jars in CLASSPATH, skipped otherwise.
 *
 * @date   Oct 19, 2026
 */

#include <cstdlib>
#include <string>
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include "dfs_bridge/dfs-bridge.h"
#include "dfs_bridge/test-utilities.hpp"

namespace dfsbridge{

class LibHdfsAdaptorTest : public ::testing::Test {
 protected:
	boost::filesystem::path m_sandbox;

	virtual void SetUp() {
		const char* classpath = std::getenv(constants::HADOOP_CLASSPATH_ENV_VARIABLE_NAME.c_str());
		if(classpath == NULL || std::string(classpath).find("hadoop") == std::string::npos)
			GTEST_SKIP() << "No hadoop jars in " << constants::HADOOP_CLASSPATH_ENV_VARIABLE_NAME;

		// libhdfs adaptor is the default one, local file system has no adaptor of its own
		ASSERT_EQ(dfsInit("Test_libhdfs_adaptor"), status::OK);

		m_sandbox = boost::filesystem::temp_directory_path() /
				boost::filesystem::unique_path("libhdfs-test-%%%%-%%%%");
		ASSERT_TRUE(boost::filesystem::create_directories(m_sandbox));
	}

	virtual void TearDown() {
		if(m_sandbox.empty())
			return;
		EXPECT_EQ(dfsShutdown(), status::OK);
		boost::system::error_code ec;
		boost::filesystem::remove_all(m_sandbox, ec);
	}
};

TEST_F(LibHdfsAdaptorTest, CopyAndMoveOnLocalFileSystem) {
	std::string src_file = createTemporaryFile(m_sandbox);
	std::string dst_file = (m_sandbox / "copy" / "dst.txt").string();

	FileSystemHandle src_fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, src_fs), status::OK);
	FileSystemHandle dst_fs;
	ASSERT_EQ(FileSystemHandle::connect("file:" + dst_file, dst_fs), status::OK);

	bool exists = false;
	ASSERT_EQ(dfsCopy(src_fs, src_file, dst_fs, dst_file), status::OK);
	ASSERT_EQ(dst_fs.exists(dst_file, &exists), status::OK);
	EXPECT_TRUE(exists);
	ASSERT_EQ(src_fs.exists(src_file, &exists), status::OK);
	EXPECT_TRUE(exists);

	ASSERT_EQ(dst_fs.remove(dst_file, false), status::OK);
	ASSERT_EQ(dfsMove(src_fs, src_file, dst_fs, dst_file), status::OK);
	ASSERT_EQ(dst_fs.exists(dst_file, &exists), status::OK);
	EXPECT_TRUE(exists);
	ASSERT_EQ(src_fs.exists(src_file, &exists), status::OK);
	EXPECT_FALSE(exists);
}

TEST_F(LibHdfsAdaptorTest, MissingSourceIsFailure) {
	FileSystemHandle fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, fs), status::OK);

	std::string missing = (m_sandbox / "no_existent_file").string();
	EXPECT_EQ(dfsCopy(fs, missing, fs, (m_sandbox / "dst").string()), status::NATIVE_CALL_FAILED);
}

TEST_F(LibHdfsAdaptorTest, FileOperations) {
	FileSystemHandle fs;
	ASSERT_EQ(FileSystemHandle::connect(constants::TEST_LOCAL_FS_URI, fs), status::OK);

	std::string dir  = (m_sandbox / "dir").string();
	std::string file = (m_sandbox / "dir" / "file").string();

	ASSERT_EQ(fs.createDirectory(dir), status::OK);
	ASSERT_EQ(fs.create(file), status::OK);
	EXPECT_TRUE(boost::filesystem::exists(file));

	ASSERT_EQ(fs.rename(file, file + ".renamed"), status::OK);
	EXPECT_TRUE(boost::filesystem::exists(file + ".renamed"));

	ASSERT_EQ(fs.remove(dir, true), status::OK);
	EXPECT_FALSE(boost::filesystem::exists(dir));
	EXPECT_EQ(fs.close(), status::OK);
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
