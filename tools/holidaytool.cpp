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

#include <converters.h>
#include <date.h>
#include <holidays.h>
#include <reference_data.h>
#include <status.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

#include <logger.h>

using namespace jpholidays;

static void usage(const char *progname)
{
	fprintf(stderr,
		"%s: [-d <date>] [-from <date> -to <date>] [-c <Holiday|SubstituteHoliday|NationalHoliday>] "
		"[-verify <csvfile>] [-loglevel <d|t>]\n"
		"dates may be given as yyyy/mm/dd, yyyy-mm-dd, dd/mm/yyyy or dd-mm-yyyy\n",
		progname);
}

static void print_holiday(const Holiday &holiday)
{
	char buf[16];
	auto converter = get_default_converter();
	Weekday wd = (Weekday)weekday(holiday.date);
	printf("%s %s(%s) %s %s\n", format_date(holiday.date, buf, sizeof buf), converter->weekday_to_string(wd),
	       converter->weekday_to_japanese_string(wd), holiday.name,
	       converter->holiday_category_to_string(holiday.category));
}

static bool get_date_option(const char *opt, const char *arg, Date *date)
{
	if (!parse_date(arg, date) || !is_valid_date(*date)) {
		error("Error: invalid date '%s' for option %s\n", arg, opt);
		return false;
	}
	return true;
}

int main(int argc, const char *argv[])
{
	const char *progname = argv[0];
	Date on_date = 0;
	Date from_date = 0;
	Date to_date = 0;
	bool filter_category = false;
	HolidayCategory category = HolidayCategory::HOLIDAY;
	std::string reference_file;

	if (argc < 3) {
		usage(progname);
		return 1;
	}
	for (int i = 1; i + 1 < argc; i += 2) {
		const char *opt = argv[i];
		const char *arg = argv[i + 1];
		if (strcmp(opt, "-d") == 0) {
			if (!get_date_option(opt, arg, &on_date))
				return 1;
		} else if (strcmp(opt, "-from") == 0) {
			if (!get_date_option(opt, arg, &from_date))
				return 1;
		} else if (strcmp(opt, "-to") == 0) {
			if (!get_date_option(opt, arg, &to_date))
				return 1;
		} else if (strcmp(opt, "-c") == 0) {
			if (!get_default_converter()->holiday_category_from_string(arg, &category)) {
				error("Error: unknown holiday category '%s'\n", arg);
				usage(progname);
				return 1;
			}
			filter_category = true;
		} else if (strcmp(opt, "-verify") == 0) {
			reference_file = arg;
		} else if (strcmp(opt, "-loglevel") == 0) {
			if (!jpholidays_set_log_level(arg)) {
				error("Error: unrecognized log level '%s'\n", arg);
				return 1;
			}
		} else {
			error("Error: unrecognized option '%s'\n", opt);
			usage(progname);
			return 1;
		}
	}
	if (argc % 2 == 0) {
		error("Error: option '%s' requires a value\n", argv[argc - 1]);
		usage(progname);
		return 1;
	}
	if ((from_date != 0) != (to_date != 0)) {
		error("Error: -from and -to must be given together\n");
		usage(progname);
		return 1;
	}

	auto calendar = get_japanese_holiday_calendar();

	if (!reference_file.empty()) {
		std::vector<ReferenceHoliday> reference;
		StatusCode status = load_reference_holidays(reference_file.c_str(), reference);
		if (status != StatusCode::kOk) {
			char buf[1200];
			error("%s\n", error_message(buf, sizeof buf, status, ": %s", reference_file.c_str()));
			return 1;
		}
		if (reference.empty()) {
			error("Error: no holidays found in %s\n", reference_file.c_str());
			return 1;
		}
		// default window covers whole years of the reference data
		if (from_date == 0) {
			from_date = make_date(1, January, date_components(reference.front().date).y);
			to_date = make_date(31, December, date_components(reference.back().date).y);
		}
		auto result = check_reference_holidays(calendar, reference, from_date, to_date);
		printf("Checked %d days, %d months, %d years: %d mismatches\n", result.days_checked,
		       result.months_checked, result.years_checked, result.mismatches());
		return result.mismatches() == 0 ? 0 : 2;
	}

	if (on_date != 0) {
		Holiday holiday;
		char buf[16];
		if (!calendar->get_holiday(on_date, &holiday)) {
			printf("%s is not a holiday\n", format_date(on_date, buf, sizeof buf));
		} else if (filter_category && holiday.category != category) {
			auto converter = get_default_converter();
			printf("%s is %s (%s), not a %s\n", format_date(on_date, buf, sizeof buf), holiday.name,
			       converter->holiday_category_to_string(holiday.category),
			       converter->holiday_category_to_string(category));
		} else {
			print_holiday(holiday);
		}
	}
	if (from_date != 0) {
		auto holidays = calendar->get_holidays(from_date, to_date);
		int count = 0;
		for (auto &holiday : holidays) {
			if (filter_category && holiday.category != category)
				continue;
			print_holiday(holiday);
			count++;
		}
		debug("Listed %d holidays\n", count);
	}
	if (on_date == 0 && from_date == 0) {
		usage(progname);
		return 1;
	}
	return 0;
}
