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
#ifndef _JPHOLIDAYS_HOLIDAYS_H
#define _JPHOLIDAYS_HOLIDAYS_H

#include <date.h>
#include <enums.pb.h>

#include <vector>

namespace jpholidays
{

// A holiday found on a date.
// The name is the official Japanese name (UTF-8) and
// points to static storage; it is never freed.
struct Holiday {
	const char *name;
	Date date;
	HolidayCategory category;
};

// The HolidayCalendar interface answers whether a date
// is a public holiday, and which one.
// Immutable for thread safety.
class HolidayCalendar
{
	public:
	virtual ~HolidayCalendar() noexcept {}

	// Looks up the holiday on the given date, including
	// substitute and national holidays.
	// Returns false if the date is not a holiday, in which case
	// holiday is left untouched. holiday may be null.
	virtual bool get_holiday(Date d, Holiday *holiday) const noexcept = 0;

	bool is_holiday(Date d) const noexcept { return get_holiday(d, nullptr); }

	// True if any date in [start, end] is a holiday.
	// Returns false if end < start.
	bool exists_holiday(Date start, Date end) const noexcept;

	// All holidays in [start, end] in date order.
	// Returns an empty list if end < start.
	std::vector<Holiday> get_holidays(Date start, Date end) const;
};

// Scans the holiday rules in order and reports the first one matching the
// date. Substitute and national holiday rules are only considered when
// requested; rules that look at neighbouring days always query them
// with both flags off.
extern bool resolve_holiday(Date date, bool include_substitute, bool include_national, Holiday *holiday) noexcept;

// Day of March on which the vernal equinox holiday falls, or 0 if
// the year is outside the range covered by the published formulas.
extern int vernal_equinox_day(int year) noexcept;

// Day of September on which the autumnal equinox holiday falls, or 0 if
// the year is outside the range covered by the published formulas.
extern int autumnal_equinox_day(int year) noexcept;

// The calendar of Japanese public holidays as defined by
// the Act on National Holidays and its amendments.
// Memory is managed by the library, the caller must not delete.
extern const HolidayCalendar *get_japanese_holiday_calendar() noexcept;

extern int test_holidays();

} // namespace jpholidays

#endif
