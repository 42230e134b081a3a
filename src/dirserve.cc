
#include "Server.hh"
#include "Utility.hh"
#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <csignal>
#include <pthread.h>

int main(int argc, char **argv)
	{
	if(argc!=1) {
		std::cerr << "Usage: dirserve" << std::endl
					 << "Serves the current directory on port 8000." << std::endl;
		return 1;
		}

	// Interrupts are picked up by a dedicated thread instead of a
	// handler, so that stopping the server happens outside signal context.
	// The mask has to be in place before any worker thread is started.
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	if(pthread_sigmask(SIG_BLOCK, &signals, 0)!=0) {
		std::cerr << logstamp() << "dirserve failure: cannot block signals" << std::endl;
		return 1;
		}

	try {
		Server server(Server::default_config());

		if(!server.bind()) {
			std::cerr << logstamp() << "dirserve failure: cannot listen on port " << server.port() << std::endl;
			return 1;
			}

		std::cout << "good morning" << std::endl;

		std::atomic<bool> serving_done(false);
		std::thread waiter(
			[&server, &serving_done, signals]() {
				int signo=0;
				if(sigwait(&signals, &signo)==0)
					terr << logstamp() << "received signal " << signo << ", shutting down" << std::endl;
				// stop() is a no-op until the accept loop runs, so an early
				// interrupt has to wait for it.
				while(!server.is_running() && !serving_done)
					std::this_thread::sleep_for(std::chrono::milliseconds(1));
				server.stop();
				}
			);

		bool ok=server.serve();
		serving_done=true;
		if(!ok) {
			// The waiter is still blocked in sigwait; wake it so it can be joined.
			pthread_kill(waiter.native_handle(), SIGTERM);
			}
		waiter.join();
		return ok?0:1;
		}
	catch(std::exception& ex) {
		std::cerr << logstamp() << "dirserve failure: " << ex.what() << std::endl;
		}
	return 1;
	}
