/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is OpenRedukti (https://github.com/redukti/OpenRedukti).
 * The Initial Developer of the Original Software is REDUKTI LIMITED (http://redukti.com).
 * Authors: Dibyendu Majumdar
 *
 * Copyright 2017 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 3 (https://www.gnu.org/licenses/gpl.txt).
 */
/**
 * Portions derived from:
 * http://howardhinnant.github.io/date_algorithms.html
 * The MIT License (MIT)
 *
 * Copyright (c) 2015, 2016, 2017 Howard Hinnant
 * Copyright (c) 2016 Adrian Colomitchi
 * Copyright (c) 2017 Florian Dang
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * Portions derived from Quantlib.
 * License: http://quantlib.org/license.shtml
 */
#include <date.h>

#include <assert.h>
#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>

#include <cstring>
#include <type_traits>

#include <logger.h>

namespace jpholidays
{

static_assert(std::is_standard_layout<YearMonthDay>::value, "YearMonthDay is not standard layout");
static_assert(std::is_standard_layout<Date>::value, "Date is not standard layout");

Date nth_weekday(unsigned n, unsigned wd, unsigned month, int year) noexcept
{
	assert(n >= 1);
	assert(wd <= 6);
	assert(1 <= month && month <= 12);
	const Date first = make_date(1, month, year);
	return first + (Date)((n - 1) * 7 + weekday_difference(wd, weekday(first)));
}

static bool is_number(const char *s) noexcept
{
	if (!*s)
		return false;
	for (; *s; s++) {
		if (!isdigit((unsigned char)*s))
			return false;
	}
	return true;
}

// Parse a string representation of date
// It will detect seperator character '/' or '-'.
// The formats acceptable are yyyy/mm/dd, dd/mm/yyyy, yyyy-mm-dd, or dd-mm-yyyy
bool parse_date(const char *s, Date *d) noexcept
{
	char temp[11];
	strncpy(temp, s, sizeof temp);
	temp[sizeof temp - 1] = 0;
	if (strlen(s) >= sizeof temp) {
		debug("failed to parse date [%s]: too long\n", s);
		return false;
	}
	const char *limit = temp + strlen(temp);

	char *start = temp;
	char *end = start;

	int year = -1;
	int month = -1;
	int day = -1;

	const char *parts[3] = {0};

	int i = 0;
	while (end < limit) {
		if (*end == '/' || *end == '-') {
			*end = 0;
			if (i == 3) {
				debug("failed to parse date [%s]: too many components\n", s);
				return false;
			}
			parts[i++] = start;
			start = end + 1;
		}
		end++;
	}
	if (start < end) {
		if (i == 3) {
			debug("failed to parse date [%s]: too many components\n", s);
			return false;
		}
		parts[i++] = start;
	}
	if (i < 3 || !is_number(parts[0]) || !is_number(parts[1]) || !is_number(parts[2])) {
		debug("failed to parse date [%s]: invalid date\n", s);
		return false;
	}
	if (strlen(parts[0]) == 4) {
		year = atoi(parts[0]);
		month = atoi(parts[1]);
		day = atoi(parts[2]);
	} else if (strlen(parts[2]) == 4) {
		day = atoi(parts[0]);
		month = atoi(parts[1]);
		year = atoi(parts[2]);
	} else {
		debug("failed to parse date [%s]: year must have 4 digits\n", s);
		return false;
	}
	if (!is_valid_ymd(year, month, day)) {
		debug("failed to parse date [%s]: no such day\n", s);
		return false;
	}
	*d = make_date(day, month, year);
	return true;
}

const char *format_date(Date d, char *buf, size_t buflen) noexcept
{
	YearMonthDay ymd = date_components(d);
	snprintf(buf, buflen, "%04d/%02d/%02d", (int)ymd.y, (int)ymd.m, (int)ymd.d);
	return buf;
}

///////////////////////////////////// TESTS

static int test_consistency()
{
	Date minDate = make_date(1, 1, 1900), maxDate = make_date(30, 12, 2199);
	YearMonthDay minDateMinusOne = date_components(minDate - 1);
	int dold = minDateMinusOne.d, mold = minDateMinusOne.m, yold = minDateMinusOne.y, wdold = weekday(minDate - 1);

	int failure_count = 0;
	for (Date t = minDate; t <= maxDate; t++) {
		YearMonthDay t_ymd = date_components(t);
		int d = t_ymd.d, m = t_ymd.m, y = t_ymd.y, wd = weekday(t);

		// check if skipping any date
		if (!((d == dold + 1 && m == mold && y == yold) || (d == 1 && m == mold + 1 && y == yold) ||
		      (d == 1 && m == 1 && y == yold + 1))) {
			failure_count++;
		}
		dold = d;
		mold = m;
		yold = y;

		if (!is_valid_ymd(y, m, d)) {
			failure_count++;
		}
		// check weekday definition
		if (!((int(wd) == int(wdold + 1)) || (int(wd) == 0 && int(wdold) == 6))) {
			failure_count++;
		}
		wdold = wd;

		// create the same date with a different constructor
		Date s = make_date(d, m, y);
		// check serial number consistency
		if (s != t) {
			failure_count++;
		}
	}
	return failure_count;
}

static int test_parsing()
{
	int failure_count = 0;
	Date dt0 = make_date(5, Month::Feb, 2013);
	const char *str1 = "2013/2/5";
	const char *str2 = "05/02/2013";
	const char *str3 = "2013-02-05";

	Date dt1 = 0, dt2 = 0, dt3 = 0;
	if (!parse_date(str1, &dt1) || !parse_date(str2, &dt2) || !parse_date(str3, &dt3))
		failure_count++;

	if (weekday(dt1) != Tuesday)
		failure_count++;

	auto ymd = date_components(dt2);

	if (dt0 != dt1 || dt2 != dt1 || dt3 != dt1) {
		failure_count++;
	}
	if (ymd.d != 5 || ymd.m != 2 || ymd.y != 2013) {
		failure_count++;
	}

	// invalid calendar days are rejected
	Date bad = 0;
	const char *invalid[] = {"2019/13/01", "2019/02/29", "2019/04/31", "32/01/2019", "2019/1", "20x9/01/01",
				 "", "1/1/2019/1", "19/01/01"};
	for (auto s : invalid) {
		if (parse_date(s, &bad)) {
			fprintf(stderr, "parse_date accepted invalid date [%s]\n", s);
			failure_count++;
		}
	}
	if (bad != 0)
		failure_count++;
	if (!parse_date("2020/02/29", &bad) || bad != make_date(29, 2, 2020))
		failure_count++;
	return failure_count;
}

static int test_formatting()
{
	int failure_count = 0;
	char buf[16];
	if (strcmp(format_date(make_date(12, 11, 1990), buf, sizeof buf), "1990/11/12") != 0)
		failure_count++;
	Date d = 0;
	if (!parse_date(format_date(make_date(31, 12, 2199), buf, sizeof buf), &d) || d != maximum_date())
		failure_count++;
	return failure_count;
}

static int test_basics()
{
	// For us 1 is 31/Dec/1899
	auto d0 = make_date(1, 1, 1900);
	if (d0 <= 0)
		return 1;
	// Check Excel compatibility
	d0 = make_date(1, 3, 1900);
	if (d0 != 61)
		return 1;
	if (make_date(1, 1, 1901) != minimum_date())
		return 1;
	if (make_date(31, 12, 2199) != maximum_date())
		return 1;
	if (is_valid_date(0) || !is_valid_date(make_date(1, 1, 2024)))
		return 1;
	auto d1 = make_date(5, 7, 2017);
	if (d1 != 42921)
		return 1;
	auto ymd1 = date_components(d1);
	if (ymd1.d != 5 || ymd1.m != 7 || ymd1.y != 2017)
		return 1;
	if (weekday(d1) != Wednesday)
		return 1;
	if (weekday(make_date(1, 1, 2024)) != Monday)
		return 1;
	if (weekday(make_date(12, 11, 1990)) != Monday)
		return 1;
	// dates before 1900 still work
	if (weekday(make_date(20, 7, 1948)) != Tuesday)
		return 1;
	if (nth_weekday(1, Wednesday, 7, 2017) != make_date(5, 7, 2017))
		return 1;
	if (nth_weekday(2, Wednesday, 7, 2017) != make_date(12, 7, 2017))
		return 1;
	if (nth_weekday(4, Wednesday, 7, 2017) != make_date(26, 7, 2017))
		return 1;
	// 1st of July 2017 is a Saturday, so the first Monday wraps to the 3rd
	if (nth_weekday(1, Monday, 7, 2017) != make_date(3, 7, 2017))
		return 1;
	// a 5th Monday that does not exist in the month spills into the next
	if (nth_weekday(5, Monday, 2, 2021) != make_date(1, 3, 2021))
		return 1;
	if (!is_leap(2000) || is_leap(2100) || !is_leap(2024) || is_leap(2023))
		return 1;
	return 0;
}

int test_date()
{
	int failure_count = 0;

	failure_count += test_basics();
	failure_count += test_parsing();
	failure_count += test_formatting();
	failure_count += test_consistency();
	if (failure_count == 0)
		printf("Date Tests OK\n");
	else
		printf("Date Tests FAILED\n");
	return failure_count;
}

} // namespace jpholidays
