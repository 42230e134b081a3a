
#include "Server.hh"
#include "Utility.hh"

#include <stdexcept>
#include <sys/socket.h>

using json = nlohmann::json;

json Server::default_config()
	{
	return json {
		{ "address",       "0.0.0.0" },
		{ "port",          8000 },
		{ "root",          "." },
		{ "threads",       8 },
		{ "read_timeout",  5 },
		{ "write_timeout", 5 },
		{ "access_log",    true }
		};
	}

Server::Server(const nlohmann::json& cfg)
	: config(cfg),
	  bind_address(config.value("address", std::string("0.0.0.0"))),
	  bind_port(config.value("port", 8000)),
	  file_handler(config.value("root", std::string(".")))
	{
	int threads = config.value("threads", 8);
	if(threads<1)
		throw std::invalid_argument("Server::Server: need at least one worker thread");

	new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
	set_read_timeout(config.value("read_timeout", 5), 0);
	set_write_timeout(config.value("write_timeout", 5), 0);

	// Plain SO_REUSEADDR: restarting right after a shutdown works, but a
	// port which another process is listening on stays unavailable.
	set_socket_options(
		[](httplib::socket_t sock) {
			int yes = 1;
			if(setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes))!=0)
				terr << logstamp() << "failed to set SO_REUSEADDR" << std::endl;
			}
		);

	Get("/.*",
		 [&](const httplib::Request& request, httplib::Response& response) {
			 handle_default(request, response);
			 }
		 );

	auto unsupported = [&](const httplib::Request& request, httplib::Response& response) {
		handle_unsupported(request, response);
		};
	Post("/.*",    unsupported);
	Put("/.*",     unsupported);
	Patch("/.*",   unsupported);
	Delete("/.*",  unsupported);
	Options("/.*", unsupported);

	// Statuses which httplib produces itself (malformed requests and the
	// like) get the same error page as ours.
	set_error_handler(
		[](const httplib::Request&, httplib::Response& response) {
			if(response.body.empty())
				FileHandler::send_error(response, response.status);
			}
		);

	if(config.value("access_log", true)) {
		set_logger(
			[this](const httplib::Request& request, const httplib::Response& response) {
				log_access(request, response);
				}
			);
		}
	}

Server::~Server()
	{
	}

void Server::handle_default(const httplib::Request& request, httplib::Response& response)
	{
	file_handler.handle(request, response);
	}

void Server::handle_unsupported(const httplib::Request& request, httplib::Response& response)
	{
	FileHandler::send_error(response, 501, "Unsupported method ('"+request.method+"')");
	}

void Server::log_access(const httplib::Request& request, const httplib::Response& response) const
	{
	std::string length = response.get_header_value("Content-Length");
	if(length.empty())
		length = "-";
	terr << logstamp(&request) << "\"" << request.method << " " << request.target << " " << request.version << "\" "
		  << response.status << " " << length << std::endl;
	}

bool Server::bind()
	{
	if(bind_port==0) {
		int port = bind_to_any_port(bind_address);
		if(port<0) {
			terr << logstamp() << "failed to bind to an ephemeral port on " << bind_address << std::endl;
			return false;
			}
		bind_port=port;
		}
	else if(bind_to_port(bind_address, bind_port)==false) {
		terr << logstamp() << "failed to bind to " << bind_address << ":" << bind_port << std::endl;
		return false;
		}

	terr << logstamp() << "serving " << file_handler.root().string()
		  << " on " << bind_address << ":" << bind_port << std::endl;
	return true;
	}

bool Server::serve()
	{
	bool ret = listen_after_bind();
	if(ret)
		terr << logstamp() << "server on port " << bind_port << " stopped" << std::endl;
	else
		terr << logstamp() << "accept loop on port " << bind_port << " failed" << std::endl;
	return ret;
	}

int Server::port() const
	{
	return bind_port;
	}

const std::string& Server::address() const
	{
	return bind_address;
	}

const FileHandler& Server::files() const
	{
	return file_handler;
	}
