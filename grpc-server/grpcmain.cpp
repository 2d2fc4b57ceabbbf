/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is OpenRedukti (https://github.com/redukti/OpenRedukti).
 * The Initial Developer of the Original Software is REDUKTI LIMITED (http://redukti.com).
 * Authors: Dibyendu Majumdar
 *
 * Copyright 2017-2019 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 3 (https://www.gnu.org/licenses/gpl.txt).
 */

#include <grpcpp/grpcpp.h>

#include "services.grpc.pb.h"

#include <holidays.h>
#include <request_processor.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <memory>
#include <string>

#include <logger.h>

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

namespace jpholidays
{

void do_shutdown(void *p)
{
	if (!p)
		return;
	grpc::Server *server = reinterpret_cast<grpc::Server *>(p);
	inform("Shutting down server\n");
	server->Shutdown();
}

// Logic and data behind the server's behavior.
class JpHolidaysServiceImpl final : public JpHolidaysServices::Service
{
	private:
	std::unique_ptr<RequestProcessor> request_processor_;

	public:
	JpHolidaysServiceImpl(std::unique_ptr<RequestProcessor> request_processor)
	    : request_processor_(std::move(request_processor))
	{
	}

	Status serve(ServerContext *context, const Request *request, Response *response) override
	{
		request_processor_->process(request, response);
		return Status::OK;
	}

	void set_shutdown_handler(grpc::Server *server)
	{
		request_processor_->set_shutdown_handler(reinterpret_cast<void *>(server), do_shutdown);
	}
};

int RunServer(const char *address, JpHolidaysServiceImpl &service)
{
	std::string server_address(address);

	ServerBuilder builder;
	// Listen on the given address without any authentication mechanism.
	builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
	// Register "service" as the instance through which we'll communicate with
	// clients. In this case it corresponds to an *synchronous* service.
	builder.RegisterService(&service);
	std::unique_ptr<Server> server(builder.BuildAndStart());
	if (!server) {
		error("Unable to start server on %s\n", address);
		return 1;
	}
	inform("Server listening on %s\n", address);

	service.set_shutdown_handler(server.get());

	// Wait for the server to shutdown. Note that some other thread must be
	// responsible for shutting down the server for this call to ever return.
	server->Wait();
	return 0;
}

} // namespace jpholidays

using namespace jpholidays;

static void usage(const char *progname)
{
	fprintf(stderr,
		"%s: [-a <address, default 0.0.0.0>] [-p <port, default 9002>] "
		"[-loglevel <d|t>]\n",
		progname);
}

int main(int argc, char **argv)
{
	const char *progname = argv[0];
	char ip_address[80];
	int port = 9002;

	/* Default server address */
	strcpy(ip_address, "0.0.0.0");

	for (int i = 1; i + 1 < argc; i += 2) {
		const char *opt = argv[i];
		const char *arg = argv[i + 1];
		if (strcmp(opt, "-a") == 0) {
			strncpy(ip_address, arg, sizeof ip_address);
			ip_address[sizeof ip_address - 1] = 0; /* safety */
		} else if (strcmp(opt, "-p") == 0) {
			port = atoi(arg);
			if (port <= 0 || port > 65535) {
				error("Error: invalid port '%s'\n", arg);
				usage(progname);
				return 1;
			}
		} else if (strcmp(opt, "-loglevel") == 0) {
			if (!jpholidays_set_log_level(arg)) {
				error("Error: unrecognized log level '%s'\n", arg);
				usage(progname);
				return 1;
			}
		} else {
			error("Error: unrecognized option '%s'\n", opt);
			usage(progname);
			return 1;
		}
	}

	char server_address[120];
	snprintf(server_address, sizeof server_address, "%s:%d", ip_address, port);

	std::unique_ptr<RequestProcessor> request_processor = get_request_processor(get_japanese_holiday_calendar());
	jpholidays::JpHolidaysServiceImpl service(std::move(request_processor));
	return jpholidays::RunServer(server_address, service);
}
