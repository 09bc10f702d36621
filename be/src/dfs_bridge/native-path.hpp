/*
 * @file  native-path.hpp
 * @brief scoped conversion of a path to a null-terminated native buffer
 *
 * @date   Oct 19, 2026
 */

#ifndef DFS_BRIDGE_NATIVE_PATH_HPP_
#define DFS_BRIDGE_NATIVE_PATH_HPP_

#include <string>
#include <cstring>

namespace dfsbridge {

/**
 * Null-terminated copy of a path, alive as long as the object is.
 * Should be created right before the native call and go out of scope right after it.
 *
 * A path with embedded '\0' can't be passed through the native boundary without being truncated,
 * such a path is rejected: the object is invalid and holds no buffer.
 */
class NativePath{
private:
	char*       m_buffer;  /**< null-terminated path bytes */
	std::size_t m_length;  /**< path length, terminator excluded */

	NativePath(const NativePath&) = delete;
	NativePath& operator=(const NativePath&) = delete;

public:
	explicit NativePath(const std::string& path) : m_buffer(NULL), m_length(0){
		if(path.find('\0') != std::string::npos)
			return;

		m_length = path.length();
		m_buffer = new char[m_length + 1];
		std::memcpy(m_buffer, path.data(), m_length);
		m_buffer[m_length] = '\0';
	}

	~NativePath(){
		delete [] m_buffer;
		m_buffer = NULL;
	}

	/** flag, indicates whether the path was converted */
	bool valid() const { return m_buffer != NULL; }

	/** null-terminated path, NULL if invalid */
	const char* c_str() const { return m_buffer; }

	/** path length, terminator excluded */
	std::size_t length() const { return m_length; }
};

}

#endif /* DFS_BRIDGE_NATIVE_PATH_HPP_ */
