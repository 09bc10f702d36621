/*
 * @file  utilities.cc
 * @brief filesystem URI resolution and enumeration formatters
 *
 * @date   Oct 19, 2026
 */

#include <map>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "dfs_bridge/utilities.hpp"

DFS_TYPE fsTypeFromScheme(const char* scheme){
	if(scheme == NULL || *scheme == '\0')
		return DEFAULT_FROM_CONFIG;

	std::string value = boost::algorithm::to_lower_copy(std::string(scheme));
	if(value == "hdfs")
		return HDFS;
	if(value == "s3" || value == "s3n" || value == "s3a")
		return S3;
	if(value == dfsbridge::constants::LOCAL_FS_SCHEME)
		return LOCAL;
	return OTHER;
}

Uri Uri::Parse(const std::string &uri) {
	Uri result;

	if (uri.length() == 0)
		return result;

	// "scheme:" is only a scheme if no path separator precedes the colon
	size_t protocolEnd = uri.find(':');
	if (protocolEnd == std::string::npos || protocolEnd == 0 || uri.find('/') < protocolEnd) {
		result.Path = uri;
		return result;
	}

	result.Protocol = uri.substr(0, protocolEnd);

	if (uri.compare(protocolEnd, 3, "://") != 0) {
		// hadoop Path routines strip consecutive /'s, so "file:/blah" is legal
		result.Path = uri.substr(protocolEnd + 1);
		return result;
	}
	result.HasAuthority = true;

	size_t authorityStart = protocolEnd + 3;
	size_t pathStart = uri.find('/', authorityStart);

	std::string authority = pathStart == std::string::npos ?
			uri.substr(authorityStart) : uri.substr(authorityStart, pathStart - authorityStart);
	if (pathStart != std::string::npos)
		result.Path = uri.substr(pathStart);

	// user info
	size_t at = authority.rfind('@');
	if (at != std::string::npos) {
		result.UserInfo = authority.substr(0, at);
		authority = authority.substr(at + 1);
	}

	// host and port
	size_t portStart = authority.find(':');
	result.Host = authority.substr(0, portStart);
	if (portStart != std::string::npos)
		result.Port = authority.substr(portStart + 1);

	return result;
}

namespace dfsbridge {

namespace constants {
	const std::string DEFAULT_FS      = "default";
	const std::string LOCAL_FS_SCHEME = "file";
}

#define INSERT_ELEMENT(p) strings[p] = #p

static std::map<status::StatusInternal, std::string> statusNames(){
	std::map<status::StatusInternal, std::string> strings;
	INSERT_ELEMENT(status::OK);
	INSERT_ELEMENT(status::PATH_ENCODING_FAILURE);
	INSERT_ELEMENT(status::NATIVE_CALL_FAILED);
	INSERT_ELEMENT(status::FILESYSTEM_IS_NOT_CONNECTED);
	INSERT_ELEMENT(status::FILESYSTEM_CONNECTION_FAILED);
	INSERT_ELEMENT(status::INVALID_FILESYSTEM_URI);
	INSERT_ELEMENT(status::DFS_ADAPTOR_IS_NOT_CONFIGURED);
	INSERT_ELEMENT(status::FILESYSTEM_ADAPTOR_MISMATCH);
	return strings;
}

static std::map<DFS_TYPE, std::string> dfsTypeNames(){
	std::map<DFS_TYPE, std::string> strings;
	INSERT_ELEMENT(HDFS);
	INSERT_ELEMENT(S3);
	INSERT_ELEMENT(LOCAL);
	INSERT_ELEMENT(DEFAULT_FROM_CONFIG);
	INSERT_ELEMENT(OTHER);
	INSERT_ELEMENT(NON_SPECIFIED);
	return strings;
}

#undef INSERT_ELEMENT

// read-only after thread-safe static initialization, shared by concurrent loggers
std::ostream& operator<<(std::ostream& out, const status::StatusInternal value){
	static const std::map<status::StatusInternal, std::string> strings = statusNames();
	std::map<status::StatusInternal, std::string>::const_iterator it = strings.find(value);
	if(it == strings.end())
		return out << "status::<unknown " << static_cast<int>(value) << ">";
	return out << it->second;
}

std::ostream& operator<<(std::ostream& out, const DFS_TYPE value){
	static const std::map<DFS_TYPE, std::string> strings = dfsTypeNames();
	std::map<DFS_TYPE, std::string>::const_iterator it = strings.find(value);
	if(it == strings.end())
		return out << "<unknown filesystem type " << static_cast<int>(value) << ">";
	return out << it->second;
}

std::ostream& operator<<(std::ostream& out, const FileSystemDescriptor& descriptor){
	if(!descriptor.valid)
		return out << "<invalid filesystem>";
	return out << descriptor.dfs_type << ":" << utilities::fsAddress(descriptor);
}

namespace utilities {

status::StatusInternal resolveFileSystem(const std::string& uri, FileSystemDescriptor& descriptor,
		std::string& path){
	descriptor = FileSystemDescriptor();
	path = "/";

	if(uri.empty() || uri == constants::DEFAULT_FS){
		descriptor.dfs_type = DEFAULT_FROM_CONFIG;
		return status::OK;
	}

	Uri parsed = Uri::Parse(uri);
	descriptor.scheme   = boost::algorithm::to_lower_copy(parsed.Protocol);
	descriptor.dfs_type = fsTypeFromScheme(descriptor.scheme.c_str());
	descriptor.user     = parsed.UserInfo;
	if(!parsed.Path.empty())
		path = parsed.Path;

	// unqualified path belongs to default file system
	if(descriptor.scheme.empty())
		return status::OK;

	if(descriptor.dfs_type == LOCAL){
		if((!parsed.Host.empty() && parsed.Host != "localhost") || !parsed.Port.empty()){
			LOG (WARNING)<< "Local file system URI \"" << uri << "\" should not have an authority." << "\n";
			descriptor = FileSystemDescriptor::getNull();
			return status::INVALID_FILESYSTEM_URI;
		}
		return status::OK;
	}

	if(!parsed.HasAuthority || parsed.Host.empty()){
		LOG (WARNING)<< "No host in file system URI \"" << uri << "\"." << "\n";
		descriptor = FileSystemDescriptor::getNull();
		return status::INVALID_FILESYSTEM_URI;
	}
	descriptor.host = parsed.Host;

	if(parsed.Port.empty())
		return status::OK;

	try{
		descriptor.port = boost::lexical_cast<int>(parsed.Port);
	}
	catch(const boost::bad_lexical_cast&){
		descriptor.port = -1;
	}
	if(descriptor.port <= 0 || descriptor.port > 65535){
		LOG (WARNING)<< "Invalid port \"" << parsed.Port << "\" in file system URI \"" << uri << "\"." << "\n";
		descriptor = FileSystemDescriptor::getNull();
		return status::INVALID_FILESYSTEM_URI;
	}
	return status::OK;
}

std::string fsAddress(const FileSystemDescriptor& descriptor){
	switch(descriptor.dfs_type){
	case LOCAL:
		return "";
	case DEFAULT_FROM_CONFIG:
	case NON_SPECIFIED:
		return constants::DEFAULT_FS;
	default:
		break;
	}
	std::string address = descriptor.scheme + "://" + descriptor.host;
	if(descriptor.port > 0)
		address += ":" + std::to_string(descriptor.port);
	return address;
}

}
}
