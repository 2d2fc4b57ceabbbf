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
#ifndef _JPHOLIDAYS_REQUEST_PROCESSOR_H
#define _JPHOLIDAYS_REQUEST_PROCESSOR_H

#include <holidays.h>

#include <services.pb.h>

#include <memory>

namespace jpholidays
{

/* This is the API that the request processor must implement.
The processor fills in the supplied response; if the response
was allocated in an Arena then so are the messages the processor
adds to it.
*/
class RequestProcessor
{
	public:
	virtual ~RequestProcessor() {}
	virtual Response *process(const Request *request, Response *response) = 0;
	// The function is invoked on a separate thread when a
	// shutdown request is received
	virtual void set_shutdown_handler(void *p, void (*funcptr)(void *)) = 0;
};

std::unique_ptr<RequestProcessor> get_request_processor(const HolidayCalendar *calendar);

extern int test_request_processor();

} // namespace jpholidays

#endif
