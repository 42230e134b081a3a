
#include "Server.hh"
#include "Utility.hh"
#include <gtest/gtest.h>
#include <fstream>
#include <memory>
#include <thread>
#include <chrono>

namespace fs = boost::filesystem;
using json = nlohmann::json;

// Runs a server on an ephemeral port of the loopback interface, serving
// a freshly created temporary directory.

class ServerTest : public ::testing::Test {
	protected:
		void SetUp() override
			{
			base = fs::temp_directory_path() / fs::unique_path("dirserve-server-%%%%-%%%%-%%%%");
			root = base / "www";
			fs::create_directories(root / "sub" / "nested");
			write(base / "secret.txt", "outside the document root\n");
			write(root / "index.html", "<html><body>good morning</body></html>\n");
			write(root / "sub" / "apple.txt", "apple\n");
			write(root / "sub" / "Banana.txt", "banana\n");
			write(root / "empty.txt", "");

			std::string blob;
			for(int i=0; i<200*1024; ++i)
				blob += static_cast<char>(i % 251);
			write(root / "blob.bin", blob);

			start();
			}

		void TearDown() override
			{
			stop();
			boost::system::error_code ec;
			fs::remove_all(base, ec);
			}

		json config() const
			{
			json cfg = Server::default_config();
			cfg["address"]    = "127.0.0.1";
			cfg["port"]       = 0;
			cfg["root"]       = root.string();
			cfg["access_log"] = false;
			return cfg;
			}

		void start()
			{
			server.reset(new Server(config()));
			ASSERT_TRUE(server->bind());
			ASSERT_GT(server->port(), 0);
			runner = std::thread([this]() { server->serve(); });
			while(!server->is_running())
				std::this_thread::sleep_for(std::chrono::milliseconds(1));
			}

		void stop()
			{
			if(!server)
				return;
			server->stop();
			if(runner.joinable())
				runner.join();
			server.reset();
			}

		void write(const fs::path& path, const std::string& content)
			{
			std::ofstream out(path.string(), std::ios::binary);
			out << content;
			}

		std::string read(const fs::path& path)
			{
			std::ifstream in(path.string(), std::ios::binary);
			return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
			}

		httplib::Client client()
			{
			return httplib::Client("127.0.0.1", server->port());
			}

		fs::path                base, root;
		std::unique_ptr<Server> server;
		std::thread             runner;
};

TEST_F(ServerTest, RootServesIndexByteForByte)
	{
	auto cli = client();
	auto res = cli.Get("/");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	EXPECT_EQ(res->body, read(root / "index.html"));
	EXPECT_EQ(res->get_header_value("Content-Type"), "text/html");
	}

TEST_F(ServerTest, BinaryFileRoundTrip)
	{
	auto cli = client();
	auto res = cli.Get("/blob.bin");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	EXPECT_EQ(res->get_header_value("Content-Type"), "application/octet-stream");
	EXPECT_EQ(res->body.size(), 200u*1024u);
	EXPECT_EQ(res->body, read(root / "blob.bin"));
	}

TEST_F(ServerTest, RangeIsIgnored)
	{
	auto cli = client();
	auto res = cli.Get("/blob.bin", httplib::Headers{ { "Range", "bytes=0-3" } });
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	EXPECT_TRUE(res->get_header_value("Content-Range").empty());
	EXPECT_EQ(res->body, read(root / "blob.bin"));
	}

TEST_F(ServerTest, EmptyFile)
	{
	auto cli = client();
	auto res = cli.Get("/empty.txt");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	EXPECT_TRUE(res->body.empty());
	}

TEST_F(ServerTest, MissingFileIsNotFound)
	{
	auto cli = client();
	auto res = cli.Get("/does-not-exist.html");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 404);
	}

TEST_F(ServerTest, TraversalDoesNotEscapeRoot)
	{
	auto cli = client();
	for(const std::string path: { "/../secret.txt", "/sub/../../secret.txt", "/sub/nested/../../../secret.txt" }) {
		auto res = cli.Get(path.c_str());
		ASSERT_TRUE(res) << path;
		EXPECT_TRUE(res->status==404 || res->status==400) << path << " gave " << res->status;
		EXPECT_EQ(res->body.find("outside the document root"), std::string::npos) << path;
		}
	}

TEST_F(ServerTest, DirectoryListing)
	{
	auto cli = client();
	auto res = cli.Get("/sub/");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	EXPECT_EQ(res->get_header_value("Content-Type"), "text/html; charset=utf-8");

	size_t apple  = res->body.find(">apple.txt<");
	size_t banana = res->body.find(">Banana.txt<");
	size_t nested = res->body.find(">nested/<");
	ASSERT_NE(apple,  std::string::npos);
	ASSERT_NE(banana, std::string::npos);
	ASSERT_NE(nested, std::string::npos);
	EXPECT_LT(apple, banana);
	EXPECT_LT(banana, nested);
	EXPECT_EQ(res->body.find("index.html"), std::string::npos);
	}

TEST_F(ServerTest, DirectoryWithoutSlashRedirects)
	{
	auto cli = client();
	auto res = cli.Get("/sub");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 301);
	EXPECT_EQ(res->get_header_value("Location"), "/sub/");
	}

TEST_F(ServerTest, RepeatedRequestsAreIdentical)
	{
	auto cli = client();
	auto first  = cli.Get("/sub/apple.txt");
	auto second = cli.Get("/sub/apple.txt");
	ASSERT_TRUE(first);
	ASSERT_TRUE(second);
	EXPECT_EQ(first->status, 200);
	EXPECT_EQ(first->body, second->body);
	EXPECT_EQ(first->get_header_value("Content-Length"), second->get_header_value("Content-Length"));
	EXPECT_EQ(first->get_header_value("Content-Length"), "6");
	}

TEST_F(ServerTest, HeadHasHeadersButNoBody)
	{
	auto cli = client();
	auto res = cli.Head("/index.html");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	EXPECT_TRUE(res->body.empty());
	EXPECT_EQ(res->get_header_value("Content-Length"), std::to_string(read(root / "index.html").size()));
	}

TEST_F(ServerTest, PostIsNotImplemented)
	{
	auto cli = client();
	auto res = cli.Post("/index.html", "payload", "text/plain");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 501);
	EXPECT_NE(res->body.find("Unsupported method ('POST')"), std::string::npos);
	}

TEST_F(ServerTest, ConditionalGet)
	{
	auto cli = client();
	auto res = cli.Get("/index.html");
	ASSERT_TRUE(res);
	std::string last_modified = res->get_header_value("Last-Modified");
	ASSERT_FALSE(last_modified.empty());

	auto cached = cli.Get("/index.html", httplib::Headers{ { "If-Modified-Since", last_modified } });
	ASSERT_TRUE(cached);
	EXPECT_EQ(cached->status, 304);
	EXPECT_TRUE(cached->body.empty());

	auto stale = cli.Get("/index.html", httplib::Headers{ { "If-Modified-Since", http_date(0) } });
	ASSERT_TRUE(stale);
	EXPECT_EQ(stale->status, 200);
	}

TEST_F(ServerTest, SurvivesBadRequests)
	{
	auto cli = client();
	auto missing = cli.Get("/nothing/here/");
	ASSERT_TRUE(missing);
	EXPECT_EQ(missing->status, 404);

	auto res = cli.Get("/");
	ASSERT_TRUE(res);
	EXPECT_EQ(res->status, 200);
	}

TEST_F(ServerTest, PortInUseFailsToBind)
	{
	json cfg = config();
	cfg["port"] = server->port();
	Server second(cfg);
	EXPECT_FALSE(second.bind());
	}

TEST_F(ServerTest, PortIsFreeAfterStop)
	{
	int port = server->port();
	stop();

	json cfg = config();
	cfg["port"] = port;
	Server again(cfg);
	EXPECT_TRUE(again.bind());
	EXPECT_EQ(again.port(), port);
	}

TEST(ServerConfig, Defaults)
	{
	json cfg = Server::default_config();
	EXPECT_EQ(cfg["port"].get<int>(), 8000);
	EXPECT_EQ(cfg["address"].get<std::string>(), "0.0.0.0");
	EXPECT_EQ(cfg["root"].get<std::string>(), ".");

	Server server(json::object());
	EXPECT_EQ(server.port(), 8000);
	EXPECT_EQ(server.address(), "0.0.0.0");
	EXPECT_EQ(server.files().root(), fs::absolute("."));
	}

TEST(ServerConfig, RejectsBadValues)
	{
	json no_threads = { { "threads", 0 } };
	EXPECT_THROW(Server server(no_threads), std::invalid_argument);

	json bad_port = { { "port", "eighty" } };
	EXPECT_THROW(Server server(bad_port), nlohmann::json::exception);
	}
