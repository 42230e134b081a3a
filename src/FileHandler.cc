
#include "FileHandler.hh"
#include "Utility.hh"
#include "httplib.h"

#include <algorithm>
#include <map>

namespace fs = boost::filesystem;

const char *FileHandler::index_files[] = { "index.html", "index.htm", 0 };

const size_t FileHandler::FileStream::chunk_size;

FileHandler::FileStream::FileStream(const std::string& fn)
	: filename(fn)
	, in(filename, std::ios::binary)
	{
	data.resize(chunk_size);
	}

FileHandler::FileHandler(const std::string& root)
	: document_root(fs::absolute(root))
	{
	}

const fs::path& FileHandler::root() const
	{
	return document_root;
	}

std::vector<std::string> FileHandler::split_path(const std::string& url_path)
	{
	std::vector<std::string> parts;
	size_t pos=0;
	while(pos<=url_path.size()) {
		size_t next=url_path.find('/', pos);
		if(next==std::string::npos)
			next=url_path.size();
		std::string word=url_path.substr(pos, next-pos);
		pos=next+1;

		if(word.empty() || word==".")
			continue;
		if(word=="..") {
			if(!parts.empty())
				parts.pop_back();
			continue;
			}
		parts.push_back(word);
		}
	return parts;
	}

fs::path FileHandler::translate_path(const std::string& url_path) const
	{
	fs::path path(document_root);
	for(const auto& word: split_path(url_path))
		path/=word;
	return path;
	}

std::string FileHandler::guess_type(const fs::path& path)
	{
	static const std::map<std::string, std::string> types = {
		{ ".html",  "text/html" },
		{ ".htm",   "text/html" },
		{ ".txt",   "text/plain" },
		{ ".css",   "text/css" },
		{ ".csv",   "text/csv" },
		{ ".md",    "text/markdown" },
		{ ".xml",   "text/xml" },
		{ ".js",    "text/javascript" },
		{ ".mjs",   "text/javascript" },
		{ ".json",  "application/json" },
		{ ".pdf",   "application/pdf" },
		{ ".wasm",  "application/wasm" },
		{ ".zip",   "application/zip" },
		{ ".tar",   "application/x-tar" },
		{ ".gz",    "application/gzip" },
		{ ".bz2",   "application/x-bzip2" },
		{ ".xz",    "application/x-xz" },
		{ ".Z",     "application/octet-stream" },
		{ ".sh",    "application/x-sh" },
		{ ".png",   "image/png" },
		{ ".jpg",   "image/jpeg" },
		{ ".jpeg",  "image/jpeg" },
		{ ".gif",   "image/gif" },
		{ ".svg",   "image/svg+xml" },
		{ ".webp",  "image/webp" },
		{ ".ico",   "image/vnd.microsoft.icon" },
		{ ".mp3",   "audio/mpeg" },
		{ ".wav",   "audio/x-wav" },
		{ ".ogg",   "audio/ogg" },
		{ ".mp4",   "video/mp4" },
		{ ".webm",  "video/webm" },
		{ ".woff",  "font/woff" },
		{ ".woff2", "font/woff2" },
		{ ".ttf",   "font/ttf" }
		};

	std::string ext=path.extension().string();
	auto it=types.find(ext);
	if(it==types.end())
		it=types.find(to_lower(ext));
	if(it==types.end())
		return "application/octet-stream";
	return it->second;
	}

namespace {
	struct StatusText {
		const char *reason;
		const char *explain;
	};

	StatusText status_text(int status)
		{
		switch(status) {
			case 400: return { "Bad Request",           "Bad request syntax or unsupported method" };
			case 403: return { "Forbidden",             "Request forbidden -- authorization will not help" };
			case 404: return { "Not Found",             "Nothing matches the given URI" };
			case 405: return { "Method Not Allowed",    "Specified method is invalid for this resource" };
			case 413: return { "Payload Too Large",     "Entity is too large" };
			case 414: return { "URI Too Long",          "URI is too long" };
			case 416: return { "Range Not Satisfiable", "Cannot satisfy request range" };
			case 500: return { "Internal Server Error", "Server got itself in trouble" };
			case 501: return { "Not Implemented",       "Server does not support this operation" };
			case 503: return { "Service Unavailable",   "The server cannot process the request due to a high load" };
			default:  return { "Error",                 "" };
			}
		}
}

void FileHandler::send_error(httplib::Response& response, int status, const std::string& message)
	{
	StatusText text=status_text(status);
	std::string msg = message.empty()?text.reason:message;

	std::ostringstream ss;
	ss << "<!DOCTYPE HTML>\n"
		<< "<html lang=\"en\">\n"
		<< "    <head>\n"
		<< "        <meta charset=\"utf-8\">\n"
		<< "        <title>Error response</title>\n"
		<< "    </head>\n"
		<< "    <body>\n"
		<< "        <h1>Error response</h1>\n"
		<< "        <p>Error code: " << status << "</p>\n"
		<< "        <p>Message: " << html_escape(msg) << ".</p>\n"
		<< "        <p>Error code explanation: " << status << " - " << text.explain << ".</p>\n"
		<< "    </body>\n"
		<< "</html>\n";

	response.status=status;
	response.set_header("Connection", "close");
	response.set_content(ss.str(), "text/html;charset=utf-8");
	}

void FileHandler::handle(const httplib::Request& request, httplib::Response& response) const
	{
	try {
		if(request.path.find('\0')!=std::string::npos) {
			terr << logstamp(&request) << "refusing path with NUL byte" << std::endl;
			send_error(response, 400, "Bad request path");
			return;
			}

		fs::path path=translate_path(request.path);
		bool trailing_slash=ends_with(request.path, "/");

		boost::system::error_code ec;
		fs::file_status st=fs::status(path, ec);

		if(fs::is_directory(st)) {
			if(!trailing_slash) {
				redirect_to_directory(request, response);
				return;
				}
			for(const char **index=index_files; *index!=0; ++index) {
				fs::path index_path=path / *index;
				if(fs::is_regular_file(index_path, ec)) {
					send_file(request, response, index_path);
					return;
					}
				}
			send_directory(request, response, path);
			return;
			}

		// A trailing slash only makes sense for directories.
		if(trailing_slash || !fs::exists(st)) {
			send_error(response, 404, "File not found");
			return;
			}

		send_file(request, response, path);
		}
	catch(std::exception& ex) {
		terr << logstamp(&request) << "failure serving " << request.path << ": " << ex.what() << std::endl;
		send_error(response, 500);
		}
	}

void FileHandler::redirect_to_directory(const httplib::Request& request, httplib::Response& response) const
	{
	// A Location starting with '//' would be taken as a different host.
	std::string path=request.path;
	size_t first=path.find_first_not_of('/');
	if(first==std::string::npos)
		path="";
	else if(first>1)
		path=path.substr(first-1);

	std::string location=url_quote(path)+"/";
	size_t query=request.target.find('?');
	if(query!=std::string::npos)
		location+=request.target.substr(query);

	response.status=301;
	response.set_header("Location", location);
	}

bool FileHandler::not_modified(const httplib::Request& request, std::time_t mtime) const
	{
	// If-None-Match takes precedence, and we do not produce ETags.
	if(!request.has_header("If-Modified-Since") || request.has_header("If-None-Match"))
		return false;

	std::time_t since;
	if(!parse_http_date(request.get_header_value("If-Modified-Since"), since))
		return false;

	return mtime <= since;
	}

void FileHandler::send_file(const httplib::Request& request, httplib::Response& response,
									 const fs::path& path) const
	{
	boost::system::error_code ec;
	uintmax_t size=fs::file_size(path, ec);
	if(ec) {
		send_error(response, 404, "File not found");
		return;
		}
	std::time_t mtime=fs::last_write_time(path, ec);
	if(ec) {
		send_error(response, 404, "File not found");
		return;
		}

	if(not_modified(request, mtime)) {
		response.status=304;
		return;
		}

	auto handler = new FileStream(path.string());
	if(!handler->in) {
		delete handler;
		terr << logstamp(&request) << "cannot open " << path.string() << std::endl;
		send_error(response, 404, "File not found");
		return;
		}

	std::string ctype=guess_type(path);
	// An explicit 200 makes httplib send the whole file even when a Range
	// header was given.
	response.status=200;
	response.set_header("Last-Modified", http_date(mtime));

	if(size==0) {
		delete handler;
		response.set_content(std::string(), ctype);
		return;
		}

	auto chunk_size = handler->chunk_size;
	response.set_content_provider(
		size,
		ctype,
		[handler,chunk_size](size_t offset, size_t length, httplib::DataSink& sink) {
			// Serve a chunk of data, of maximal size chunk_size.
			handler->in.clear();
			handler->in.seekg(offset, std::ios::beg);
			handler->in.read(handler->data.data(), std::min(chunk_size, length));
			std::streamsize num=handler->in.gcount();
			if(num<=0) {
				// File shrunk underneath us; give up on this connection.
				terr << logstamp() << "short read on " << handler->filename << std::endl;
				return false;
				}
			return sink.write(handler->data.data(), num);
			},
		[handler](bool) {
			delete handler;
			});
	}

void FileHandler::send_directory(const httplib::Request& request, httplib::Response& response,
											const fs::path& path) const
	{
	struct Entry {
		std::string name;
		std::string display;
		std::string link;
	};
	std::vector<Entry> entries;

	boost::system::error_code ec;
	fs::directory_iterator it(path, ec), end;
	if(ec) {
		terr << logstamp(&request) << "cannot list " << path.string() << ": " << ec.message() << std::endl;
		send_error(response, 404, "No permission to list directory");
		return;
		}

	for(; it!=end; it.increment(ec)) {
		if(ec)
			break;
		Entry entry;
		entry.name=it->path().filename().string();
		entry.display=entry.name;
		entry.link=entry.name;

		boost::system::error_code sec;
		if(fs::is_directory(it->path(), sec)) {
			entry.display+="/";
			entry.link+="/";
			}
		if(fs::is_symlink(it->symlink_status(sec)))
			entry.display=entry.name+"@";
		entries.push_back(entry);
		}
	if(ec) {
		terr << logstamp(&request) << "error while listing " << path.string() << ": " << ec.message() << std::endl;
		send_error(response, 404, "No permission to list directory");
		return;
		}

	std::sort(entries.begin(), entries.end(),
				 [](const Entry& a, const Entry& b) { return to_lower(a.name) < to_lower(b.name); });

	std::string title="Directory listing for "+html_escape(request.path);

	std::ostringstream ss;
	ss << "<!DOCTYPE HTML>\n"
		<< "<html lang=\"en\">\n"
		<< "<head>\n"
		<< "<meta charset=\"utf-8\">\n"
		<< "<title>" << title << "</title>\n"
		<< "</head>\n"
		<< "<body>\n"
		<< "<h1>" << title << "</h1>\n"
		<< "<hr>\n"
		<< "<ul>\n";
	for(const auto& entry: entries)
		ss << "<li><a href=\"" << url_quote(entry.link) << "\">" << html_escape(entry.display) << "</a></li>\n";
	ss << "</ul>\n"
		<< "<hr>\n"
		<< "</body>\n"
		<< "</html>\n";

	response.status=200;
	response.set_content(ss.str(), "text/html; charset=utf-8");
	}
