/*
 * @file test-native-path.cc
 * @brief tests of scoped native path conversion
 *
 * @date   Oct 19, 2026
 */

#include <cstring>
#include <string>
#include <gtest/gtest.h>

#include "dfs_bridge/native-path.hpp"

namespace dfsbridge{

TEST(NativePath, ConvertsWithTerminator) {
	std::string path = "/user/impala/data.csv";
	NativePath native(path);

	ASSERT_TRUE(native.valid());
	EXPECT_EQ(native.length(), path.length());
	EXPECT_STREQ(native.c_str(), path.c_str());
	EXPECT_EQ(native.c_str()[native.length()], '\0');

	// the buffer is a copy, not the string storage
	EXPECT_NE(static_cast<const void*>(native.c_str()), static_cast<const void*>(path.c_str()));
}

TEST(NativePath, EmptyPath) {
	NativePath native("");
	ASSERT_TRUE(native.valid());
	EXPECT_EQ(native.length(), 0u);
	EXPECT_STREQ(native.c_str(), "");
}

TEST(NativePath, NonAsciiBytesAreKept) {
	std::string path = "/data/\xd0\xb4\xd0\xb0\xd0\xbd\xd0\xbd\xd1\x8b\xd0\xb5";
	NativePath native(path);
	ASSERT_TRUE(native.valid());
	EXPECT_EQ(std::memcmp(native.c_str(), path.data(), path.length()), 0);
}

TEST(NativePath, NullByteIsRejected) {
	const std::string paths[] = {
		std::string("/A\0B", 4),
		std::string("\0/A", 3),
		std::string("/A\0", 3),
	};
	for(const std::string& path : paths){
		NativePath native(path);
		EXPECT_FALSE(native.valid());
		EXPECT_TRUE(native.c_str() == NULL);
	}
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
