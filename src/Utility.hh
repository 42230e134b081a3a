
#pragma once

#include <string>
#include <sstream>
#include <ctime>

namespace httplib {
	struct Request;
}

// Line-buffered, thread-safe log stream on top of std::cerr. Each
// statement of the form `terr << a << b << std::endl;` is collected
// in a LogLine and written out in one go when the statement ends, so
// that lines from different worker threads do not interleave.

class LogLine {
	public:
		LogLine();
		LogLine(LogLine&&);
		~LogLine();

		template<class T>
		LogLine& operator<<(const T& val)
			{
			str << val;
			return *this;
			}
		LogLine& operator<<(std::ostream& (*manip)(std::ostream&));

	private:
		std::ostringstream str;
		bool               active;
};

class LogStream {
	public:
		template<class T>
		LogLine operator<<(const T& val)
			{
			LogLine line;
			line << val;
			return line;
			}
};

extern LogStream terr;

std::string logstamp(const httplib::Request *request=0);

bool        ends_with(const std::string& str, const std::string& suffix);
std::string to_lower(std::string str);

// Escape &, <, >, and double quotes for inclusion in HTML text or attributes.
std::string html_escape(const std::string& str);

// Percent-encode everything except unreserved characters and '/'.
std::string url_quote(const std::string& str);

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string http_date(std::time_t t);

// Parse an IMF-fixdate; returns false if the string is not one.
bool        parse_http_date(const std::string& str, std::time_t& t);
