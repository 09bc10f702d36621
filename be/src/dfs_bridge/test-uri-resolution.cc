/*
 * @file test-uri-resolution.cc
 * @brief tests of file system uri resolution and formatters
 *
 * @date   Oct 19, 2026
 */

#include <sstream>
#include <string>
#include <boost/bind/bind.hpp>
#include <boost/thread/thread.hpp>
#include <gtest/gtest.h>

#include "dfs_bridge/utilities.hpp"

namespace dfsbridge{

TEST(UriResolution, QualifiedHdfsUri) {
	FileSystemDescriptor descriptor;
	std::string path;

	ASSERT_EQ(utilities::resolveFileSystem("hdfs://nn:8020/data/a", descriptor, path), status::OK);
	EXPECT_TRUE(descriptor.valid);
	EXPECT_EQ(descriptor.dfs_type, HDFS);
	EXPECT_EQ(descriptor.scheme, "hdfs");
	EXPECT_EQ(descriptor.host, "nn");
	EXPECT_EQ(descriptor.port, 8020);
	EXPECT_EQ(path, "/data/a");
	EXPECT_EQ(utilities::fsAddress(descriptor), "hdfs://nn:8020");
}

TEST(UriResolution, UserInfoAndNoPort) {
	FileSystemDescriptor descriptor;
	std::string path;

	ASSERT_EQ(utilities::resolveFileSystem("S3A://impala@bucket", descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, S3);
	EXPECT_EQ(descriptor.scheme, "s3a");
	EXPECT_EQ(descriptor.user, "impala");
	EXPECT_EQ(descriptor.host, "bucket");
	EXPECT_EQ(descriptor.port, 0);
	EXPECT_EQ(path, "/");
	EXPECT_EQ(utilities::fsAddress(descriptor), "s3a://bucket");
}

TEST(UriResolution, LocalFileSystem) {
	FileSystemDescriptor descriptor;
	std::string path;

	ASSERT_EQ(utilities::resolveFileSystem("file:///tmp/a", descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, LOCAL);
	EXPECT_TRUE(descriptor.host.empty());
	EXPECT_EQ(path, "/tmp/a");
	EXPECT_EQ(utilities::fsAddress(descriptor), "");

	ASSERT_EQ(utilities::resolveFileSystem("file:/tmp/b", descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, LOCAL);
	EXPECT_EQ(path, "/tmp/b");

	ASSERT_EQ(utilities::resolveFileSystem("file://localhost/tmp/c", descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, LOCAL);
	EXPECT_EQ(path, "/tmp/c");
}

TEST(UriResolution, DefaultFileSystem) {
	FileSystemDescriptor descriptor;
	std::string path;

	ASSERT_EQ(utilities::resolveFileSystem("", descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, DEFAULT_FROM_CONFIG);
	EXPECT_EQ(path, "/");

	ASSERT_EQ(utilities::resolveFileSystem(constants::DEFAULT_FS, descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, DEFAULT_FROM_CONFIG);
	EXPECT_EQ(utilities::fsAddress(descriptor), constants::DEFAULT_FS);

	ASSERT_EQ(utilities::resolveFileSystem("/user/data:2014", descriptor, path), status::OK);
	EXPECT_EQ(descriptor.dfs_type, DEFAULT_FROM_CONFIG);
	EXPECT_EQ(path, "/user/data:2014");
}

TEST(UriResolution, InvalidUris) {
	const char* invalid[] = {
		"hdfs://:8020/",
		"hdfs://nn:port/",
		"hdfs://nn:0/",
		"hdfs://nn:65536/",
		"hdfs:/no/authority",
		"file://remotehost/tmp",
		"file://localhost:80/tmp",
	};

	for(const char* uri : invalid){
		SCOPED_TRACE(uri);
		FileSystemDescriptor descriptor;
		std::string path;
		EXPECT_EQ(utilities::resolveFileSystem(uri, descriptor, path), status::INVALID_FILESYSTEM_URI);
		EXPECT_FALSE(descriptor.valid);
	}
}

TEST(UriResolution, FileSystemTypeFromScheme) {
	EXPECT_EQ(fsTypeFromScheme("hdfs"), HDFS);
	EXPECT_EQ(fsTypeFromScheme("HDFS"), HDFS);
	EXPECT_EQ(fsTypeFromScheme("s3"), S3);
	EXPECT_EQ(fsTypeFromScheme("s3n"), S3);
	EXPECT_EQ(fsTypeFromScheme("s3a"), S3);
	EXPECT_EQ(fsTypeFromScheme("file"), LOCAL);
	EXPECT_EQ(fsTypeFromScheme(""), DEFAULT_FROM_CONFIG);
	EXPECT_EQ(fsTypeFromScheme(NULL), DEFAULT_FROM_CONFIG);
	EXPECT_EQ(fsTypeFromScheme("tachyon"), OTHER);
}

namespace {
/** format one status and one type many times, record whether any name came out wrong */
void formatRepeatedly(status::StatusInternal value, DFS_TYPE type, const std::string& expected, bool* mismatch){
	for(int i = 0; i < 1000; i++){
		std::ostringstream out;
		out << value << " " << type;
		if(out.str() != expected)
			*mismatch = true;
	}
}
}

/** Formatters are used by concurrent loggers; runs before any other formatter test */
TEST(Formatters, ConcurrentFormatting) {
	const status::StatusInternal statuses[] = {
		status::PATH_ENCODING_FAILURE,
		status::NATIVE_CALL_FAILED,
		status::FILESYSTEM_IS_NOT_CONNECTED,
		status::INVALID_FILESYSTEM_URI,
	};
	const DFS_TYPE types[] = { HDFS, S3, OTHER, NON_SPECIFIED };
	const char* expected[] = {
		"status::PATH_ENCODING_FAILURE HDFS",
		"status::NATIVE_CALL_FAILED S3",
		"status::FILESYSTEM_IS_NOT_CONNECTED OTHER",
		"status::INVALID_FILESYSTEM_URI NON_SPECIFIED",
	};

	bool mismatch[4] = { false, false, false, false };
	boost::thread_group workers;
	for(int i = 0; i < 4; i++)
		workers.create_thread(boost::bind(&formatRepeatedly, statuses[i], types[i], std::string(expected[i]), &mismatch[i]));
	workers.join_all();

	for(int i = 0; i < 4; i++){
		SCOPED_TRACE(expected[i]);
		EXPECT_FALSE(mismatch[i]);
	}
}

TEST(Formatters, StatusesAndTypesArePrintedByName) {
	std::ostringstream out;
	out << status::NATIVE_CALL_FAILED << " " << status::OK << " " << LOCAL << " "
			<< status::FILESYSTEM_ADAPTOR_MISMATCH;
	EXPECT_EQ(out.str(), "status::NATIVE_CALL_FAILED status::OK LOCAL status::FILESYSTEM_ADAPTOR_MISMATCH");

	std::ostringstream descriptor;
	FileSystemDescriptor hdfs;
	hdfs.dfs_type = HDFS;
	hdfs.scheme   = "hdfs";
	hdfs.host     = "nn";
	descriptor << hdfs << " " << FileSystemDescriptor::getNull();
	EXPECT_EQ(descriptor.str(), "HDFS:hdfs://nn <invalid filesystem>");
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
