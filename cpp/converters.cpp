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

#include <algorithm>
#include <cstring>
#include <stdio.h>
#include <strings.h>
#include <utility>

#include <logger.h>

#ifdef _MSC_VER
#define strcasecmp _stricmp
#endif

namespace jpholidays
{

static std::pair<const char *, HolidayCategory> holiday_categories[] = {
    {"Holiday", HolidayCategory::HOLIDAY},
    {"SubstituteHoliday", HolidayCategory::SUBSTITUTE_HOLIDAY},
    {"NationalHoliday", HolidayCategory::NATIONAL_HOLIDAY}};

static std::pair<const char *, Weekday> weekdays[] = {{"Sun", Sunday},   {"Mon", Monday}, {"Tue", Tuesday},
						      {"Wed", Wednesday}, {"Thu", Thursday}, {"Fri", Friday},
						      {"Sat", Saturday}};

static const char *japanese_weekdays[] = {u8"日", u8"月", u8"火", u8"水", u8"木", u8"金", u8"土"};

class ValueConverter : public Converter
{
	public:
	bool holiday_category_from_string(const char *value, HolidayCategory *category) const override final
	{
		auto iter = std::find_if(std::begin(holiday_categories), std::end(holiday_categories),
					 [value](const std::pair<const char *, HolidayCategory> &v) {
						 return strcasecmp(value, v.first) == 0;
					 });
		if (iter == std::end(holiday_categories)) {
			debug("Unknown holiday category %s\n", value);
			return false;
		}
		*category = iter->second;
		return true;
	}

	const char *holiday_category_to_string(HolidayCategory value) const override final
	{
		auto iter = std::find_if(
		    std::begin(holiday_categories), std::end(holiday_categories),
		    [value](const std::pair<const char *, HolidayCategory> &v) { return value == v.second; });
		if (iter == std::end(holiday_categories))
			return "Unknown";
		else
			return iter->first;
	}

	const char *weekday_to_string(Weekday value) const override final
	{
		if (value < Sunday || value > Saturday)
			return "Unknown";
		return weekdays[value].first;
	}

	const char *weekday_to_japanese_string(Weekday value) const override final
	{
		if (value < Sunday || value > Saturday)
			return "?";
		return japanese_weekdays[value];
	}
};

static ValueConverter default_converter;

const Converter *get_default_converter() { return &default_converter; }

/////////////////////////// Tests

int test_conversions()
{
	int failure_count = 0;
	auto converter = get_default_converter();

	HolidayCategory category = HolidayCategory::HOLIDAY;
	if (!converter->holiday_category_from_string("SubstituteHoliday", &category) ||
	    category != HolidayCategory::SUBSTITUTE_HOLIDAY)
		failure_count++;
	if (!converter->holiday_category_from_string("nationalholiday", &category) ||
	    category != HolidayCategory::NATIONAL_HOLIDAY)
		failure_count++;
	if (converter->holiday_category_from_string("Weekend", &category) ||
	    category != HolidayCategory::NATIONAL_HOLIDAY)
		failure_count++;
	if (strcmp(converter->holiday_category_to_string(HolidayCategory::HOLIDAY), "Holiday") != 0)
		failure_count++;
	if (strcmp(converter->holiday_category_to_string((HolidayCategory)99), "Unknown") != 0)
		failure_count++;

	if (strcmp(converter->weekday_to_string(Saturday), "Sat") != 0 ||
	    strcmp(converter->weekday_to_string((Weekday)7), "Unknown") != 0)
		failure_count++;
	if (strcmp(converter->weekday_to_japanese_string(Monday), u8"月") != 0)
		failure_count++;
	// 1 January 2024 was a Monday
	if (strcmp(converter->weekday_to_string((Weekday)weekday(make_date(1, 1, 2024))), "Mon") != 0)
		failure_count++;
	if (failure_count == 0)
		printf("Conversion Tests OK\n");
	else
		printf("Conversion Tests FAILED\n");
	return failure_count;
}

} // namespace jpholidays
