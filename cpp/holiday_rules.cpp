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
#include <holiday_rules.h>

#include <assert.h>
#include <stdio.h>

namespace jpholidays
{

bool DayRule::eval(Date date, YearMonthDay ymd) const noexcept
{
	switch (kind) {
	case DAY_OF_MONTH:
		return ymd.d == day;
	case WEEKDAY_OF_MONTH: {
		// The n-th occurrence may spill into the following month
		// in which case no day of this month matches
		YearMonthDay target = date_components(nth_weekday(week, wd, ymd.m, ymd.y));
		return ymd.m == target.m && ymd.d == target.d;
	}
	case COMPUTED:
		return predicate != nullptr && predicate(date);
	default:
		assert(false);
		return false;
	}
}

//////////////////////////////// TESTS

static int test_year_rules()
{
	int failure_count = 0;
	auto y = [](int year) { return YearMonthDay{(short)year, 1, 1}; };

	// after() and before() include the boundary year
	const int boundaries[] = {1948, 1949, 1973, 1986, 1989, 2000, 2003, 2007, 2016, 2019, 2020, 2021, 2022};
	for (int year : boundaries) {
		if (!YearRule::after(year).eval(y(year)) || !YearRule::after(year).eval(y(year + 1)) ||
		    YearRule::after(year).eval(y(year - 1))) {
			fprintf(stderr, "YearRule::after(%d) failed at boundary\n", year);
			failure_count++;
		}
		if (!YearRule::before(year).eval(y(year)) || !YearRule::before(year).eval(y(year - 1)) ||
		    YearRule::before(year).eval(y(year + 1))) {
			fprintf(stderr, "YearRule::before(%d) failed at boundary\n", year);
			failure_count++;
		}
		if (!YearRule::just(year).eval(y(year)) || YearRule::just(year).eval(y(year - 1)) ||
		    YearRule::just(year).eval(y(year + 1))) {
			fprintf(stderr, "YearRule::just(%d) failed at boundary\n", year);
			failure_count++;
		}
	}
	auto r = YearRule::range(1989, 2006);
	if (!r.eval(y(1989)) || !r.eval(y(2006)) || r.eval(y(1988)) || r.eval(y(2007)))
		failure_count++;
	if (!YearRule::any().eval(y(1)) || !YearRule::any().eval(y(9999)))
		failure_count++;
	return failure_count;
}

static int test_month_rules()
{
	int failure_count = 0;
	for (int m = 1; m <= 12; m++) {
		YearMonthDay ymd{2024, (unsigned char)m, 1};
		if (!MonthRule::any().eval(ymd))
			failure_count++;
		if (MonthRule::just(5).eval(ymd) != (m == 5))
			failure_count++;
		if (MonthRule::range(3, 9).eval(ymd) != (m >= 3 && m <= 9))
			failure_count++;
		if (MonthRule::before(4).eval(ymd) != (m <= 4))
			failure_count++;
		if (MonthRule::after(11).eval(ymd) != (m >= 11))
			failure_count++;
	}
	return failure_count;
}

static bool is_leap_day(Date date) { return date_components(date).m == 2 && date_components(date).d == 29; }

static int test_day_rules()
{
	int failure_count = 0;

	auto check = [&failure_count](const DayRule &rule, Date date, bool expected) {
		if (rule.eval(date, date_components(date)) != expected) {
			char buf[16];
			fprintf(stderr, "day rule gave wrong answer for %s\n", format_date(date, buf, sizeof buf));
			failure_count++;
		}
	};

	check(DayRule::just(15), make_date(15, 1, 1999), true);
	check(DayRule::just(15), make_date(16, 1, 1999), false);

	// January 2024 starts on a Monday
	check(DayRule::week_day(2, Monday), make_date(8, 1, 2024), true);
	check(DayRule::week_day(2, Monday), make_date(1, 1, 2024), false);
	check(DayRule::week_day(1, Monday), make_date(1, 1, 2024), true);
	// September 2019 starts on a Sunday
	check(DayRule::week_day(3, Monday), make_date(16, 9, 2019), true);
	// October 2019 starts on a Tuesday so the first Monday wraps to the 7th
	check(DayRule::week_day(2, Monday), make_date(14, 10, 2019), true);
	check(DayRule::week_day(2, Monday), make_date(7, 10, 2019), false);
	// First Sunday when the month starts on a Saturday (June 2024)
	check(DayRule::week_day(1, Sunday), make_date(2, 6, 2024), true);
	// First Saturday when the month starts on a Sunday (September 2019)
	check(DayRule::week_day(1, Saturday), make_date(7, 9, 2019), true);
	// February 2021 has four Mondays; the 5th would be 1st March
	for (Date d = make_date(1, 2, 2021); d <= make_date(28, 2, 2021); d++)
		check(DayRule::week_day(5, Monday), d, false);
	check(DayRule::week_day(5, Monday), make_date(1, 3, 2021), false);
	check(DayRule::week_day(5, Monday), make_date(29, 3, 2021), true);
	// December 2020 has four Mondays; the 5th falls in January 2021
	for (Date d = make_date(1, 12, 2020); d <= make_date(31, 12, 2020); d++)
		check(DayRule::week_day(5, Monday), d, false);

	check(DayRule::computed(is_leap_day), make_date(29, 2, 2024), true);
	check(DayRule::computed(is_leap_day), make_date(28, 2, 2024), false);
	check(DayRule::computed(nullptr), make_date(28, 2, 2024), false);
	return failure_count;
}

static int test_rule_conjunction()
{
	int failure_count = 0;
	auto rule = HolidayRule::holiday("test", YearRule::range(1990, 1992), MonthRule::just(11), DayRule::just(12));
	if (!rule.eval(make_date(12, 11, 1990)) || !rule.eval(make_date(12, 11, 1992)))
		failure_count++;
	if (rule.eval(make_date(12, 11, 1989)) || rule.eval(make_date(12, 11, 1993)))
		failure_count++;
	if (rule.eval(make_date(12, 10, 1990)) || rule.eval(make_date(13, 11, 1990)))
		failure_count++;
	if (rule.category != HolidayCategory::HOLIDAY)
		failure_count++;
	auto sub = HolidayRule::substitute_holiday("sub", YearRule::any(), MonthRule::any(), DayRule::just(1));
	if (sub.category != HolidayCategory::SUBSTITUTE_HOLIDAY || !sub.eval(make_date(1, 7, 1850)))
		failure_count++;
	auto nat = HolidayRule::national_holiday("nat", YearRule::any(), MonthRule::any(), DayRule::just(1));
	if (nat.category != HolidayCategory::NATIONAL_HOLIDAY)
		failure_count++;
	return failure_count;
}

int test_holiday_rules()
{
	int failure_count = 0;
	failure_count += test_year_rules();
	failure_count += test_month_rules();
	failure_count += test_day_rules();
	failure_count += test_rule_conjunction();
	if (failure_count == 0)
		printf("Holiday Rule Tests OK\n");
	else
		printf("Holiday Rule Tests FAILED\n");
	return failure_count;
}

} // namespace jpholidays
