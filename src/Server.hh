
// Http server serving a directory tree of static files.

#pragma once

// https://github.com/yhirose/cpp-httplib
#include "httplib.h"

// https://github.com/nlohmann/json
#include <nlohmann/json.hpp>

#include "FileHandler.hh"

#include <string>

class Server : public httplib::Server {
	public:
		/// Configuration keys: address, port, root, threads,
		/// read_timeout, write_timeout, access_log. Missing keys take the
		/// same values as in default_config().
		Server(const nlohmann::json& config);
		virtual ~Server();

		static nlohmann::json default_config();

		/// Bind the listening socket. Returns false (after logging why) if
		/// the address cannot be bound. A port of 0 binds an ephemeral
		/// port, which port() reports afterwards.
		bool bind();

		/// Run the accept loop on the bound socket until stop() is called.
		/// Returns false if the loop ended because of a socket error.
		bool serve();

		int                port() const;
		const std::string& address() const;
		const FileHandler& files() const;

	private:
		void handle_default(const httplib::Request& request, httplib::Response& response);
		void handle_unsupported(const httplib::Request& request, httplib::Response& response);
		void log_access(const httplib::Request& request, const httplib::Response& response) const;

		// Configuration details.
		nlohmann::json config;

		std::string    bind_address;
		int            bind_port;
		FileHandler    file_handler;
};
