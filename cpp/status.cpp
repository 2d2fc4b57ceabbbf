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

#include <status.h>

#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>
#include <string.h>

namespace jpholidays
{

const char *error_message(StatusCode code)
{
	switch (code) {
	case StatusCode::kOk:
		return "";
	case StatusCode::kNotAvailable:
		return "ERR0004: Requested service is not available";

	case StatusCode::kHOL_BadDate:
		return "HOL1501: Bad date, dates must lie between 1901/01/01 and 2199/12/31";
	case StatusCode::kHOL_BadStartDate:
		return "HOL1502: Bad start date";
	case StatusCode::kHOL_BadEndDate:
		return "HOL1503: Bad end date";

	case StatusCode::kREF_FileNotFound:
		return "REF1601: Reference data file could not be opened";
	case StatusCode::kREF_BadDate:
		return "REF1602: Reference data contains an invalid date";
	case StatusCode::kREF_MissingName:
		return "REF1603: Reference data row is missing the holiday name";
	case StatusCode::kREF_DuplicateDate:
		return "REF1604: Reference data lists the same date twice";

	default:
		return "ERR0000: unexpected error";
	}
}

const char *error_message(char *buf, size_t buflen, StatusCode status_code, const char *format, ...)
{
	const char *status_msg = error_message(status_code);
	int n = snprintf(buf, buflen, "%s", status_msg);
	if (n < 0 || (size_t)n >= buflen) {
		return buf;
	}
	char *buf2 = buf + n;
	buflen -= n;
	va_list args;
	va_start(args, format);
	vsnprintf(buf2, buflen, format, args);
	va_end(args);
	return buf;
}

int test_status()
{
	int failure_count = 0;
	char buf[128];
	const char *msg = error_message(buf, sizeof buf, StatusCode::kREF_BadDate, ": line %d, [%s]", 5, "2019/13/1");
	if (strcmp(msg, "REF1602: Reference data contains an invalid date: line 5, [2019/13/1]") != 0)
		failure_count++;
	if (strcmp(error_message(StatusCode::kOk), "") != 0)
		failure_count++;
	if (strncmp(error_message(StatusCode::kHOL_BadDate), "HOL1501", 7) != 0)
		failure_count++;
	// truncation must still leave a terminated string
	char small[8];
	msg = error_message(small, sizeof small, StatusCode::kHOL_BadEndDate, ": %d", 42);
	if (strlen(msg) != sizeof small - 1)
		failure_count++;
	if (failure_count == 0)
		printf("Test Status OK\n");
	else
		printf("Test Status FAILED\n");
	return failure_count;
}
} // namespace jpholidays
