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
#include <holidays.h>
#include <request_processor.h>
#include <status.h>

#include <inttypes.h>
#include <stdio.h>
#include <string.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <logger.h>

namespace jpholidays
{

// The request processor is just a gateway
// it checks the arguments and passes the queries
// on to the holiday calendar
class RequestProcessorImpl : public RequestProcessor
{
	private:
	const HolidayCalendar *calendar_;
	void *shutdown_data_;
	void (*shutdown_func_)(void *);

	public:
	RequestProcessorImpl(const HolidayCalendar *calendar)
	    : calendar_(calendar), shutdown_data_(nullptr), shutdown_func_(nullptr)
	{
	}
	Response *process(const Request *request, Response *response) override;

	void set_shutdown_handler(void *p, void (*funcptr)(void *)) override
	{
		shutdown_data_ = p;
		shutdown_func_ = funcptr;
	}

	private:
	Response *make_response(const ReplyHeader &reply_header, Response *response);
	Response *handle_hello_request(const Request *request, Response *response);
	Response *handle_shutdown_request(const Request *request, Response *response);
	Response *handle_unknown_request(const Request *request, Response *response);
	IsHolidayReply *handle_is_holiday_request(const IsHolidayRequest *request, IsHolidayReply *reply);
	GetHolidayReply *handle_get_holiday_request(const GetHolidayRequest *request, GetHolidayReply *reply);
	ExistsHolidayReply *handle_exists_holiday_request(const ExistsHolidayRequest *request,
							  ExistsHolidayReply *reply);
	GetHolidaysReply *handle_get_holidays_request(const GetHolidaysRequest *request, GetHolidaysReply *reply);
};

std::unique_ptr<RequestProcessor> get_request_processor(const HolidayCalendar *calendar)
{
	return std::make_unique<RequestProcessorImpl>(calendar);
}

static void set_error(ReplyHeader *header, StatusCode status, Date value)
{
	char buf[160];
	header->set_response_code(StandardResponseCode::SRC_ERROR);
	header->set_response_sub_code(status);
	header->set_response_message(error_message(buf, sizeof buf, status, ": got %d", (int)value));
}

static void copy_holiday(const Holiday &holiday, HolidayRecord *record)
{
	record->set_date(holiday.date);
	record->set_name(holiday.name);
	record->set_category(holiday.category);
}

// A range is checked for valid end points only; end < start
// is answered with an empty result
static bool validate_range(ReplyHeader *header, Date start, Date end)
{
	if (!is_valid_date(start)) {
		set_error(header, StatusCode::kHOL_BadStartDate, start);
		return false;
	}
	if (!is_valid_date(end)) {
		set_error(header, StatusCode::kHOL_BadEndDate, end);
		return false;
	}
	return true;
}

IsHolidayReply *RequestProcessorImpl::handle_is_holiday_request(const IsHolidayRequest *request,
								IsHolidayReply *reply)
{
	ReplyHeader *header = reply->mutable_header();
	if (!is_valid_date(request->date())) {
		set_error(header, StatusCode::kHOL_BadDate, request->date());
		return reply;
	}
	reply->set_is_holiday(calendar_->is_holiday(request->date()));
	header->set_response_code(StandardResponseCode::SRC_OK);
	return reply;
}

GetHolidayReply *RequestProcessorImpl::handle_get_holiday_request(const GetHolidayRequest *request,
								  GetHolidayReply *reply)
{
	ReplyHeader *header = reply->mutable_header();
	if (!is_valid_date(request->date())) {
		set_error(header, StatusCode::kHOL_BadDate, request->date());
		return reply;
	}
	Holiday holiday;
	if (calendar_->get_holiday(request->date(), &holiday))
		copy_holiday(holiday, reply->mutable_holiday());
	header->set_response_code(StandardResponseCode::SRC_OK);
	return reply;
}

ExistsHolidayReply *RequestProcessorImpl::handle_exists_holiday_request(const ExistsHolidayRequest *request,
									ExistsHolidayReply *reply)
{
	ReplyHeader *header = reply->mutable_header();
	if (!validate_range(header, request->start_date(), request->end_date()))
		return reply;
	reply->set_exists(calendar_->exists_holiday(request->start_date(), request->end_date()));
	header->set_response_code(StandardResponseCode::SRC_OK);
	return reply;
}

GetHolidaysReply *RequestProcessorImpl::handle_get_holidays_request(const GetHolidaysRequest *request,
								    GetHolidaysReply *reply)
{
	ReplyHeader *header = reply->mutable_header();
	if (!validate_range(header, request->start_date(), request->end_date()))
		return reply;
	auto holidays = calendar_->get_holidays(request->start_date(), request->end_date());
	for (auto &holiday : holidays)
		copy_holiday(holiday, reply->add_holidays());
	header->set_response_code(StandardResponseCode::SRC_OK);
	return reply;
}

Response *RequestProcessorImpl::handle_hello_request(const Request *request, Response *response)
{
	HelloReply *helloReply = response->mutable_hello_reply();
	helloReply->set_message(request->hello_request().name());
	ResponseHeader *header = response->mutable_header();
	header->set_response_code(StandardResponseCode::SRC_OK);
	int32_t delayfor = request->hello_request().delay_for();
	if (delayfor > 0) {
		inform("Sleeping for %d milliseconds\n", delayfor);
		std::this_thread::sleep_for(std::chrono::milliseconds(delayfor));
	}
	return response;
}

// This handler simply returns a success response
// The actual shutdown is initiated on a separate thread
Response *RequestProcessorImpl::handle_shutdown_request(const Request *request, Response *response)
{
	inform("Received shutdown request\n");
	response->mutable_shutdown_reply();
	ResponseHeader *header = response->mutable_header();
	if (shutdown_func_) {
		header->set_response_code(StandardResponseCode::SRC_OK);
		std::thread shutdown_thread(shutdown_func_, shutdown_data_);
		shutdown_thread.detach();
	} else {
		warn("No shutdown hook registered, do not know how to shutdown\n");
		header->set_response_code(StandardResponseCode::SRC_ERROR);
		header->set_response_sub_code(StatusCode::kNotAvailable);
		header->set_response_message("No shutdown hook registered, do not know how to shutdown");
	}
	return response;
}

Response *RequestProcessorImpl::handle_unknown_request(const Request *request, Response *response)
{
	ResponseHeader *header = response->mutable_header();
	header->set_response_code(StandardResponseCode::SRC_UNKNOWN_REQUEST);
	header->set_response_message("Unknown request type");
	return response;
}

Response *RequestProcessorImpl::make_response(const ReplyHeader &reply_header, Response *response)
{
	ResponseHeader *header = response->mutable_header();
	header->set_response_code(reply_header.response_code());
	header->set_response_sub_code(reply_header.response_sub_code());
	header->set_response_message(reply_header.response_message());
	return response;
}

Response *RequestProcessorImpl::process(const Request *request, Response *response)
{
	auto start = std::chrono::high_resolution_clock::now();
	switch (request->request_case()) {
	case Request::RequestCase::kHelloRequest: {
		response = handle_hello_request(request, response);
		break;
	}
	case Request::RequestCase::kShutdownRequest: {
		response = handle_shutdown_request(request, response);
		break;
	}
	case Request::RequestCase::kIsHolidayRequest: {
		auto reply =
		    handle_is_holiday_request(&request->is_holiday_request(), response->mutable_is_holiday_reply());
		response = make_response(reply->header(), response);
		break;
	}
	case Request::RequestCase::kGetHolidayRequest: {
		auto reply =
		    handle_get_holiday_request(&request->get_holiday_request(), response->mutable_get_holiday_reply());
		response = make_response(reply->header(), response);
		break;
	}
	case Request::RequestCase::kExistsHolidayRequest: {
		auto reply = handle_exists_holiday_request(&request->exists_holiday_request(),
							   response->mutable_exists_holiday_reply());
		response = make_response(reply->header(), response);
		break;
	}
	case Request::RequestCase::kGetHolidaysRequest: {
		auto reply = handle_get_holidays_request(&request->get_holidays_request(),
							 response->mutable_get_holidays_reply());
		response = make_response(reply->header(), response);
		break;
	}
	default: {
		response = handle_unknown_request(request, response);
		break;
	}
	}
	auto end = std::chrono::high_resolution_clock::now();
	auto duration = std::chrono::duration<int64_t, std::nano>(end - start);
	if (response && response->has_header()) {
		response->mutable_header()->set_elapsed_time(duration.count());
	}
	trace("Request completed in %lld nanosecs\n", (long long)duration.count());
	trace("Response %s\n", response->DebugString().c_str());
	return response;
}

//////////////////////////////// TESTS

static int test_holiday_queries(RequestProcessor *processor)
{
	int failure_count = 0;
	{
		Request request;
		Response response;
		request.mutable_is_holiday_request()->set_date(make_date(11, 2, 2024));
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK ||
		    !response.has_is_holiday_reply() || !response.is_holiday_reply().is_holiday())
			failure_count++;
	}
	{
		Request request;
		Response response;
		request.mutable_get_holiday_request()->set_date(make_date(6, 5, 2025));
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK ||
		    !response.get_holiday_reply().has_holiday() ||
		    response.get_holiday_reply().holiday().name() != u8"振替休日" ||
		    response.get_holiday_reply().holiday().category() != HolidayCategory::SUBSTITUTE_HOLIDAY ||
		    response.get_holiday_reply().holiday().date() != make_date(6, 5, 2025))
			failure_count++;
	}
	{
		// not a holiday
		Request request;
		Response response;
		request.mutable_get_holiday_request()->set_date(make_date(7, 5, 2025));
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK ||
		    response.get_holiday_reply().has_holiday())
			failure_count++;
	}
	{
		Request request;
		Response response;
		request.mutable_exists_holiday_request()->set_start_date(make_date(1, 6, 2024));
		request.mutable_exists_holiday_request()->set_end_date(make_date(30, 6, 2024));
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK ||
		    response.exists_holiday_reply().exists())
			failure_count++;
	}
	{
		Request request;
		Response response;
		request.mutable_get_holidays_request()->set_start_date(make_date(1, 1, 2020));
		request.mutable_get_holidays_request()->set_end_date(make_date(31, 12, 2020));
		processor->process(&request, &response);
		auto &reply = response.get_holidays_reply();
		if (response.header().response_code() != StandardResponseCode::SRC_OK || reply.holidays_size() != 18 ||
		    reply.holidays(0).name() != u8"元日" || reply.holidays(17).date() != make_date(23, 11, 2020))
			failure_count++;
	}
	{
		// reversed range is not an error
		Request request;
		Response response;
		request.mutable_get_holidays_request()->set_start_date(make_date(31, 12, 2020));
		request.mutable_get_holidays_request()->set_end_date(make_date(1, 1, 2020));
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK ||
		    response.get_holidays_reply().holidays_size() != 0)
			failure_count++;
	}
	return failure_count;
}

static int test_bad_requests(RequestProcessor *processor)
{
	int failure_count = 0;
	{
		// date not set
		Request request;
		Response response;
		request.mutable_is_holiday_request();
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_ERROR ||
		    response.header().response_sub_code() != StatusCode::kHOL_BadDate ||
		    response.header().response_message() !=
			std::string(error_message(StatusCode::kHOL_BadDate)) + ": got 0")
			failure_count++;
	}
	{
		Request request;
		Response response;
		request.mutable_get_holiday_request()->set_date(maximum_date() + 1);
		processor->process(&request, &response);
		if (response.header().response_sub_code() != StatusCode::kHOL_BadDate)
			failure_count++;
	}
	{
		Request request;
		Response response;
		request.mutable_exists_holiday_request()->set_start_date(0);
		request.mutable_exists_holiday_request()->set_end_date(make_date(1, 1, 2020));
		processor->process(&request, &response);
		if (response.header().response_sub_code() != StatusCode::kHOL_BadStartDate)
			failure_count++;
	}
	{
		Request request;
		Response response;
		request.mutable_get_holidays_request()->set_start_date(make_date(1, 1, 2020));
		request.mutable_get_holidays_request()->set_end_date(-5);
		processor->process(&request, &response);
		if (response.header().response_sub_code() != StatusCode::kHOL_BadEndDate ||
		    response.header().response_message() != "HOL1503: Bad end date: got -5" ||
		    response.get_holidays_reply().holidays_size() != 0)
			failure_count++;
	}
	{
		Request request;
		Response response;
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_UNKNOWN_REQUEST)
			failure_count++;
	}
	return failure_count;
}

static std::atomic<int> shutdown_calls(0);

static void count_shutdown(void *p)
{
	auto counter = reinterpret_cast<std::atomic<int> *>(p);
	(*counter)++;
}

static int test_hello_and_shutdown(RequestProcessor *processor)
{
	int failure_count = 0;
	{
		Request request;
		Response response;
		request.mutable_hello_request()->set_name("ping");
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK ||
		    response.hello_reply().message() != "ping")
			failure_count++;
	}
	{
		// no hook registered yet
		Request request;
		Response response;
		request.mutable_shutdown_request();
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_ERROR)
			failure_count++;
	}
	processor->set_shutdown_handler(&shutdown_calls, count_shutdown);
	{
		Request request;
		Response response;
		request.mutable_shutdown_request();
		processor->process(&request, &response);
		if (response.header().response_code() != StandardResponseCode::SRC_OK)
			failure_count++;
	}
	// the hook runs on its own thread
	for (int i = 0; i < 100 && shutdown_calls.load() == 0; i++)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	if (shutdown_calls.load() != 1)
		failure_count++;
	return failure_count;
}

int test_request_processor()
{
	int failure_count = 0;
	auto processor = get_request_processor(get_japanese_holiday_calendar());
	failure_count += test_holiday_queries(processor.get());
	failure_count += test_bad_requests(processor.get());
	failure_count += test_hello_and_shutdown(processor.get());
	if (failure_count == 0)
		printf("Request Processor Tests OK\n");
	else
		printf("Request Processor Tests FAILED\n");
	return failure_count;
}

} // namespace jpholidays
