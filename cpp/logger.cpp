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
#include <assert.h>
#include <inttypes.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

#include <sstream>
#include <thread>

#include <logger.h>

unsigned volatile Jpholidays_log_mask = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_FATAL_ERROR;

static const char *level_name(int log_level)
{
	switch (log_level) {
	case LOG_TRACE:
		return "TRACE ";
	case LOG_DEBUG:
		return "DEBUG ";
	case LOG_WARN:
		return "WARN ";
	case LOG_INFO:
		return "INFO ";
	case LOG_FATAL_ERROR:
		return "FATAL ERROR ";
	default:
		return "ERROR ";
	}
}

void jpholidays_log_message(int log_level, const char *filename, int line_number, const char *function, FILE *file,
			    const char *format, ...)
{
	assert(file);

	if (!(log_level & Jpholidays_log_mask))
		return;

	fputs(level_name(log_level), file);

	std::stringbuf buf;
	std::ostream os(&buf);

	os << std::this_thread::get_id();
	fprintf(file, "tid(%s) ", buf.str().c_str());

	if (filename && function) {
		fprintf(file, "%s:%d (%s) ", filename, line_number, function);
	}
	va_list args;
	va_start(args, format);
	vfprintf(file, format, args);
	va_end(args);
	if (log_level == LOG_FATAL_ERROR)
		exit(1);
}

int jpholidays_set_log_level(const char *option_value)
{
	if (option_value == nullptr || !option_value[0])
		return 0;
	switch (option_value[0]) {
	case 'd':
	case 'D':
		Jpholidays_log_mask |= LOG_DEBUG;
		inform("Log level set to DEBUG\n");
		return 1;
	case 't':
	case 'T':
		Jpholidays_log_mask |= (LOG_DEBUG | LOG_TRACE);
		inform("Log level set to TRACE\n");
		return 1;
	case 'q':
	case 'Q':
		Jpholidays_log_mask = LOG_ERROR | LOG_FATAL_ERROR;
		return 1;
	default:
		return 0;
	}
}
