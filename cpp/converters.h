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
#ifndef _JPHOLIDAYS_CONVERTERS_H
#define _JPHOLIDAYS_CONVERTERS_H

#include <date.h>
#include <enums.pb.h>

namespace jpholidays
{

// Mapping between enum values and the names used on
// the command line and in output.
// Category lookups from string are case insensitive; unknown
// names give false.
class Converter
{
	public:
	virtual ~Converter() {}
	virtual bool holiday_category_from_string(const char *value, HolidayCategory *category) const = 0;
	virtual const char *holiday_category_to_string(HolidayCategory value) const = 0;
	virtual const char *weekday_to_string(Weekday value) const = 0;
	// Japanese single character name, e.g. 月 for Monday
	virtual const char *weekday_to_japanese_string(Weekday value) const = 0;
};

extern const Converter *get_default_converter();
extern int test_conversions();

} // namespace jpholidays

#endif
