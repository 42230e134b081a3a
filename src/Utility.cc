
#include "Utility.hh"
#include <iostream>
#include <iomanip>
#include <mutex>
#include <thread>
#include <algorithm>
#include <cctype>
#include "httplib.h"

LogStream terr;

namespace {
	std::mutex log_mutex;
}

LogLine::LogLine()
	: active(true)
	{
	}

LogLine::LogLine(LogLine&& other)
	: str(std::move(other.str)), active(other.active)
	{
	other.active=false;
	}

LogLine::~LogLine()
	{
	if(!active)
		return;

	std::lock_guard<std::mutex> lock(log_mutex);
	std::cerr << str.str();
	std::cerr.flush();
	}

LogLine& LogLine::operator<<(std::ostream& (*manip)(std::ostream&))
	{
	manip(str);
	return *this;
	}

std::string logstamp(const httplib::Request *request)
	{
	static std::mutex mx;

	std::lock_guard<std::mutex> lock(mx);

	std::ostringstream str;
	std::time_t time_now = std::time(nullptr);
	std::tm local;
	localtime_r(&time_now, &local);
	str << std::put_time(&local, "%y-%m-%d %OH:%OM:%OS") << ", " << std::this_thread::get_id() << ", ";
	if(request!=0)
		str << std::setw(16) << request->remote_addr << ", " << std::setw(16) << request->get_header_value("X-Forwarded-For") << ": ";
	else
		str << std::setw(16) << "0.0.0.0" << ", " << std::setw(16) << " " << ": ";
	return str.str();
	}

bool ends_with(const std::string& str, const std::string& suffix)
	{
	return str.size() >= suffix.size() && 0 == str.compare(str.size()-suffix.size(), suffix.size(), suffix);
	}

std::string to_lower(std::string str)
	{
	std::transform(str.begin(), str.end(), str.begin(),
						[](unsigned char c) { return std::tolower(c); });
	return str;
	}

std::string html_escape(const std::string& str)
	{
	std::string ret;
	ret.reserve(str.size());
	for(char c: str) {
		switch(c) {
			case '&': ret += "&amp;";  break;
			case '<': ret += "&lt;";   break;
			case '>': ret += "&gt;";   break;
			case '"': ret += "&quot;"; break;
			default:  ret += c;
			}
		}
	return ret;
	}

std::string url_quote(const std::string& str)
	{
	static const char hex[] = "0123456789ABCDEF";

	std::string ret;
	for(unsigned char c: str) {
		if(std::isalnum(c) || c=='-' || c=='_' || c=='.' || c=='~' || c=='/') {
			ret += c;
			}
		else {
			ret += '%';
			ret += hex[c >> 4];
			ret += hex[c & 0x0f];
			}
		}
	return ret;
	}

static const char *http_date_format = "%a, %d %b %Y %H:%M:%S GMT";

std::string http_date(std::time_t t)
	{
	std::tm gmt;
	gmtime_r(&t, &gmt);
	char buf[64];
	size_t len = std::strftime(buf, sizeof(buf), http_date_format, &gmt);
	return std::string(buf, len);
	}

bool parse_http_date(const std::string& str, std::time_t& t)
	{
	std::tm gmt = {};
	const char *end = strptime(str.c_str(), http_date_format, &gmt);
	if(end==0 || *end!='\0')
		return false;
	t = timegm(&gmt);
	return t!=-1;
	}
