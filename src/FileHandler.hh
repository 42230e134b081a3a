
// Static file handler: maps request paths onto a document root and
// serves files, index pages and directory listings from it.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <ctime>
#include <boost/filesystem.hpp>

namespace httplib {
	struct Request;
	struct Response;
}

class FileHandler {
	public:
		FileHandler(const std::string& root);

		/// Handle a GET or HEAD request. Never throws; failures end up
		/// as an HTTP error status on the response.
		void handle(const httplib::Request& request, httplib::Response& response) const;

		/// Split a decoded URL path into its components, resolving '.' and
		/// '..' the way a normalised absolute path would. The result never
		/// refers to anything above the root.
		static std::vector<std::string> split_path(const std::string& url_path);

		/// Map a decoded URL path onto the filesystem below the document root.
		boost::filesystem::path translate_path(const std::string& url_path) const;

		/// Content type for a file, by extension; application/octet-stream
		/// when unknown.
		static std::string guess_type(const boost::filesystem::path&);

		/// Fill the response with the standard HTML error page.
		static void send_error(httplib::Response& response, int status, const std::string& message="");

		const boost::filesystem::path& root() const;

		static const char *index_files[];

	private:
		void send_file(const httplib::Request& request, httplib::Response& response,
							const boost::filesystem::path&) const;
		void send_directory(const httplib::Request& request, httplib::Response& response,
								  const boost::filesystem::path&) const;
		void redirect_to_directory(const httplib::Request& request, httplib::Response& response) const;

		// Check If-Modified-Since against the file time.
		bool not_modified(const httplib::Request& request, std::time_t mtime) const;

		boost::filesystem::path document_root;

		class FileStream {
			public:
				FileStream(const std::string&);

				static const size_t chunk_size=64*1024;

				std::string       filename;
				std::ifstream     in;
				std::vector<char> data;
		};
};
