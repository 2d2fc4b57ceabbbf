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
#ifndef _JPHOLIDAYS_HOLIDAY_RULES_H
#define _JPHOLIDAYS_HOLIDAY_RULES_H

#include <date.h>
#include <enums.pb.h>

#include <limits>

namespace jpholidays
{

enum RangeComponent { YEAR_COMPONENT, MONTH_COMPONENT };

// A closed interval [start, end] over one component of a date.
// Open ended intervals use the int limits as sentinels.
// Note that before() and after() both include the boundary value,
// so after(1949) matches 1949.
template <RangeComponent component> struct RangeRule {
	int start;
	int end;

	constexpr bool eval(YearMonthDay ymd) const noexcept
	{
		const int value = component == YEAR_COMPONENT ? (int)ymd.y : (int)ymd.m;
		return value >= start && value <= end;
	}

	static constexpr RangeRule just(int value) noexcept { return RangeRule{value, value}; }
	static constexpr RangeRule before(int value) noexcept
	{
		return RangeRule{std::numeric_limits<int>::min(), value};
	}
	static constexpr RangeRule after(int value) noexcept
	{
		return RangeRule{value, std::numeric_limits<int>::max()};
	}
	static constexpr RangeRule range(int start, int end) noexcept { return RangeRule{start, end}; }
	static constexpr RangeRule any() noexcept
	{
		return RangeRule{std::numeric_limits<int>::min(), std::numeric_limits<int>::max()};
	}
};

typedef RangeRule<YEAR_COMPONENT> YearRule;
typedef RangeRule<MONTH_COMPONENT> MonthRule;

// Arbitrary test of a date; used for equinoxes
// and for rules that depend on neighbouring days
typedef bool (*DatePredicate)(Date date);

// Selects the day within a month. One of three kinds:
// DAY_OF_MONTH - fixed day such as the 3rd
// WEEKDAY_OF_MONTH - n-th occurrence of a weekday, e.g. 2nd Monday
// COMPUTED - delegates to a predicate over the full date
struct DayRule {
	enum Kind { DAY_OF_MONTH, WEEKDAY_OF_MONTH, COMPUTED };

	Kind kind;
	// DAY_OF_MONTH
	unsigned char day;
	// WEEKDAY_OF_MONTH
	unsigned char week;
	unsigned char wd;
	// COMPUTED
	DatePredicate predicate;

	bool eval(Date date, YearMonthDay ymd) const noexcept;

	static constexpr DayRule just(unsigned day) noexcept
	{
		return DayRule{DAY_OF_MONTH, (unsigned char)day, 0, 0, nullptr};
	}
	static constexpr DayRule week_day(unsigned week, Weekday wd) noexcept
	{
		return DayRule{WEEKDAY_OF_MONTH, 0, (unsigned char)week, (unsigned char)wd, nullptr};
	}
	static constexpr DayRule computed(DatePredicate predicate) noexcept
	{
		return DayRule{COMPUTED, 0, 0, 0, predicate};
	}
};

// A named holiday: the date matches when the year, month
// and day rules all hold. Rules are plain constant data so
// that a table of them can be shared by all threads.
struct HolidayRule {
	const char *name;
	HolidayCategory category;
	YearRule year;
	MonthRule month;
	DayRule day;

	bool eval(Date date, YearMonthDay ymd) const noexcept
	{
		if (!year.eval(ymd))
			return false;
		if (!month.eval(ymd))
			return false;
		return day.eval(date, ymd);
	}
	bool eval(Date date) const noexcept { return eval(date, date_components(date)); }

	static constexpr HolidayRule holiday(const char *name, YearRule year, MonthRule month, DayRule day) noexcept
	{
		return HolidayRule{name, HolidayCategory::HOLIDAY, year, month, day};
	}
	static constexpr HolidayRule substitute_holiday(const char *name, YearRule year, MonthRule month,
							DayRule day) noexcept
	{
		return HolidayRule{name, HolidayCategory::SUBSTITUTE_HOLIDAY, year, month, day};
	}
	static constexpr HolidayRule national_holiday(const char *name, YearRule year, MonthRule month,
						      DayRule day) noexcept
	{
		return HolidayRule{name, HolidayCategory::NATIONAL_HOLIDAY, year, month, day};
	}
};

extern int test_holiday_rules();

} // namespace jpholidays

#endif
