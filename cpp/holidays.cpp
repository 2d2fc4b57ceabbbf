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
#include <enums.pb.h>

#include <holiday_rules.h>
#include <holidays.h>

#include <stdio.h>
#include <string.h>

#include <iterator>

#include <logger.h>

namespace jpholidays
{

// Published approximation of the equinox day for a year.
// Both terms are truncated separately.
static int equinox_day(double base_day, int year, int leap_year_base) noexcept
{
	return (int)(base_day + 0.242194 * (year - 1980)) - (int)((year - leap_year_base) / 4.0);
}

static bool vernal_equinox_1949_1979(Date date)
{
	auto ymd = date_components(date);
	return ymd.d == equinox_day(20.8357, ymd.y, 1983);
}

static bool vernal_equinox_1980_2099(Date date)
{
	auto ymd = date_components(date);
	return ymd.d == equinox_day(20.8431, ymd.y, 1980);
}

static bool vernal_equinox_2100_2150(Date date)
{
	auto ymd = date_components(date);
	return ymd.d == equinox_day(21.8510, ymd.y, 1980);
}

static bool autumnal_equinox_1948_1979(Date date)
{
	auto ymd = date_components(date);
	return ymd.d == equinox_day(23.2588, ymd.y, 1983);
}

static bool autumnal_equinox_1980_2099(Date date)
{
	auto ymd = date_components(date);
	return ymd.d == equinox_day(23.2488, ymd.y, 1980);
}

static bool autumnal_equinox_2100_2150(Date date)
{
	auto ymd = date_components(date);
	return ymd.d == equinox_day(24.2488, ymd.y, 1980);
}

int vernal_equinox_day(int year) noexcept
{
	if (year >= 1949 && year <= 1979)
		return equinox_day(20.8357, year, 1983);
	if (year >= 1980 && year <= 2099)
		return equinox_day(20.8431, year, 1980);
	if (year >= 2100 && year <= 2150)
		return equinox_day(21.8510, year, 1980);
	return 0;
}

int autumnal_equinox_day(int year) noexcept
{
	if (year >= 1948 && year <= 1979)
		return equinox_day(23.2588, year, 1983);
	if (year >= 1980 && year <= 2099)
		return equinox_day(23.2488, year, 1980);
	if (year >= 2100 && year <= 2150)
		return equinox_day(24.2488, year, 1980);
	return 0;
}

// Substitute and national holiday rules look at neighbouring days
// through resolve_holiday() with substitute and national rules
// excluded, so they can never re-enter each other.
// While the flag is set resolve_holiday() refuses to evaluate
// derived rules in any build.
static thread_local bool evaluating_adjacent_rule = false;

class AdjacentRuleGuard
{
	public:
	AdjacentRuleGuard() noexcept { evaluating_adjacent_rule = true; }
	~AdjacentRuleGuard() noexcept { evaluating_adjacent_rule = false; }

	private:
	AdjacentRuleGuard(const AdjacentRuleGuard &) = delete;
	AdjacentRuleGuard &operator=(const AdjacentRuleGuard &) = delete;
};

static bool is_proper_holiday(Date date) noexcept { return resolve_holiday(date, false, false, nullptr); }

// From 2007 a holiday on Sunday moves to the first following
// day that is not itself a holiday.
static bool substitute_holiday_from_2007(Date date)
{
	AdjacentRuleGuard guard;
	for (Date d = date - 1; is_proper_holiday(d); d--) {
		if (weekday(d) == Sunday)
			return true;
	}
	return false;
}

// Substitute holidays started on 12 April 1973; until 2006 only
// the Monday after a Sunday holiday qualified.
static constexpr Date substitute_holiday_start_date = make_date(12, April, 1973);

static bool substitute_holiday_from_1973(Date date)
{
	if (date < substitute_holiday_start_date)
		return false;
	AdjacentRuleGuard guard;
	Date previous = date - 1;
	return weekday(previous) == Sunday && is_proper_holiday(previous);
}

// A day other than Sunday sandwiched between two holidays
static bool national_holiday_from_1986(Date date)
{
	if (weekday(date) == Sunday)
		return false;
	AdjacentRuleGuard guard;
	return is_proper_holiday(date - 1) && is_proper_holiday(date + 1);
}

// The rules of the Act on National Holidays (国民の祝日に関する法律)
// and the special acts for one-off holidays, one entry per revision.
// Order matters: the first matching rule names the holiday.
// clang-format off
static const HolidayRule holiday_rules[] = {
    // New Year's Day
    HolidayRule::holiday(u8"元日", YearRule::after(1949), MonthRule::just(January), DayRule::just(1)),
    // Coming of Age Day, 2nd Monday of January since 2000, was January 15th
    HolidayRule::holiday(u8"成人の日", YearRule::after(2000), MonthRule::just(January), DayRule::week_day(2, Monday)),
    HolidayRule::holiday(u8"成人の日", YearRule::range(1949, 1999), MonthRule::just(January), DayRule::just(15)),
    // National Foundation Day
    HolidayRule::holiday(u8"建国記念の日", YearRule::after(1967), MonthRule::just(February), DayRule::just(11)),
    // Showa Day
    HolidayRule::holiday(u8"昭和の日", YearRule::after(2007), MonthRule::just(April), DayRule::just(29)),
    // Constitution Memorial Day
    HolidayRule::holiday(u8"憲法記念日", YearRule::after(1949), MonthRule::just(May), DayRule::just(3)),
    // Greenery Day, moved from April 29th in 2007
    HolidayRule::holiday(u8"みどりの日", YearRule::after(2007), MonthRule::just(May), DayRule::just(4)),
    HolidayRule::holiday(u8"みどりの日", YearRule::range(1989, 2006), MonthRule::just(April), DayRule::just(29)),
    // Children's Day
    HolidayRule::holiday(u8"こどもの日", YearRule::after(1949), MonthRule::just(May), DayRule::just(5)),
    // Marine Day, 3rd Monday of July since 2003, was July 20th;
    // moved for the Tokyo Olympics in 2020 and 2021
    HolidayRule::holiday(u8"海の日", YearRule::after(2022), MonthRule::just(July), DayRule::week_day(3, Monday)),
    HolidayRule::holiday(u8"海の日", YearRule::just(2021), MonthRule::just(July), DayRule::just(22)),
    HolidayRule::holiday(u8"海の日", YearRule::just(2020), MonthRule::just(July), DayRule::just(23)),
    HolidayRule::holiday(u8"海の日", YearRule::range(2003, 2019), MonthRule::just(July), DayRule::week_day(3, Monday)),
    HolidayRule::holiday(u8"海の日", YearRule::range(1996, 2002), MonthRule::just(July), DayRule::just(20)),
    // Mountain Day, moved for the Tokyo Olympics in 2020 and 2021
    HolidayRule::holiday(u8"山の日", YearRule::after(2022), MonthRule::just(August), DayRule::just(11)),
    HolidayRule::holiday(u8"山の日", YearRule::just(2021), MonthRule::just(August), DayRule::just(8)),
    HolidayRule::holiday(u8"山の日", YearRule::just(2020), MonthRule::just(August), DayRule::just(10)),
    HolidayRule::holiday(u8"山の日", YearRule::range(2016, 2019), MonthRule::just(August), DayRule::just(11)),
    // Respect for the Aged Day, 3rd Monday of September since 2003, was September 15th
    HolidayRule::holiday(u8"敬老の日", YearRule::after(2003), MonthRule::just(September), DayRule::week_day(3, Monday)),
    HolidayRule::holiday(u8"敬老の日", YearRule::range(1966, 2002), MonthRule::just(September), DayRule::just(15)),
    // Health and Sports Day, 2nd Monday of October since 2000, was October 10th
    HolidayRule::holiday(u8"体育の日", YearRule::range(2000, 2019), MonthRule::just(October), DayRule::week_day(2, Monday)),
    HolidayRule::holiday(u8"体育の日", YearRule::range(1966, 1999), MonthRule::just(October), DayRule::just(10)),
    // Sports Day, renamed from Health and Sports Day in 2020
    HolidayRule::holiday(u8"スポーツの日", YearRule::after(2022), MonthRule::just(October), DayRule::week_day(2, Monday)),
    HolidayRule::holiday(u8"スポーツの日", YearRule::just(2021), MonthRule::just(July), DayRule::just(23)),
    HolidayRule::holiday(u8"スポーツの日", YearRule::just(2020), MonthRule::just(July), DayRule::just(24)),
    // Culture Day
    HolidayRule::holiday(u8"文化の日", YearRule::after(1948), MonthRule::just(November), DayRule::just(3)),
    // Labour Thanksgiving Day
    HolidayRule::holiday(u8"勤労感謝の日", YearRule::after(1948), MonthRule::just(November), DayRule::just(23)),
    // Emperor's Birthday, follows the reigning emperor;
    // no Emperor's Birthday in 2019
    HolidayRule::holiday(u8"天皇誕生日", YearRule::after(2020), MonthRule::just(February), DayRule::just(23)),
    HolidayRule::holiday(u8"天皇誕生日", YearRule::range(1989, 2018), MonthRule::just(December), DayRule::just(23)),
    HolidayRule::holiday(u8"天皇誕生日", YearRule::range(1949, 1988), MonthRule::just(April), DayRule::just(29)),
    // Vernal Equinox Day
    HolidayRule::holiday(u8"春分の日", YearRule::range(1949, 1979), MonthRule::just(March), DayRule::computed(vernal_equinox_1949_1979)),
    HolidayRule::holiday(u8"春分の日", YearRule::range(1980, 2099), MonthRule::just(March), DayRule::computed(vernal_equinox_1980_2099)),
    HolidayRule::holiday(u8"春分の日", YearRule::range(2100, 2150), MonthRule::just(March), DayRule::computed(vernal_equinox_2100_2150)),
    // Autumnal Equinox Day
    HolidayRule::holiday(u8"秋分の日", YearRule::range(1948, 1979), MonthRule::just(September), DayRule::computed(autumnal_equinox_1948_1979)),
    HolidayRule::holiday(u8"秋分の日", YearRule::range(1980, 2099), MonthRule::just(September), DayRule::computed(autumnal_equinox_1980_2099)),
    HolidayRule::holiday(u8"秋分の日", YearRule::range(2100, 2150), MonthRule::just(September), DayRule::computed(autumnal_equinox_2100_2150)),
    // one-shot holidays
    // Enthronement Ceremony
    HolidayRule::holiday(u8"即位礼正殿の儀", YearRule::just(2019), MonthRule::just(October), DayRule::just(22)),
    HolidayRule::holiday(u8"即位礼正殿の儀", YearRule::just(1990), MonthRule::just(November), DayRule::just(12)),
    // Accession of the Emperor
    HolidayRule::holiday(u8"天皇の即位の日", YearRule::just(2019), MonthRule::just(May), DayRule::just(1)),
    // Marriage of Prince Naruhito
    HolidayRule::holiday(u8"皇太子徳仁親王の結婚の儀", YearRule::just(1993), MonthRule::just(June), DayRule::just(9)),
    // Rites of Imperial Funeral
    HolidayRule::holiday(u8"昭和天皇の大喪の礼", YearRule::just(1989), MonthRule::just(February), DayRule::just(24)),
    // Marriage of Prince Akihito
    HolidayRule::holiday(u8"皇太子明仁親王の結婚の儀", YearRule::just(1959), MonthRule::just(April), DayRule::just(10)),
    // Substitute Holiday
    HolidayRule::substitute_holiday(u8"振替休日", YearRule::after(2007), MonthRule::any(), DayRule::computed(substitute_holiday_from_2007)),
    HolidayRule::substitute_holiday(u8"振替休日", YearRule::range(1973, 2006), MonthRule::any(), DayRule::computed(substitute_holiday_from_1973)),
    // Citizens' Holiday
    HolidayRule::national_holiday(u8"国民の休日", YearRule::after(1986), MonthRule::any(), DayRule::computed(national_holiday_from_1986)),
};
// clang-format on

bool resolve_holiday(Date date, bool include_substitute, bool include_national, Holiday *holiday) noexcept
{
	if (evaluating_adjacent_rule && (include_substitute || include_national)) {
		error("Derived holiday rules cannot be evaluated from within a derived rule\n");
		include_substitute = false;
		include_national = false;
	}
	const YearMonthDay ymd = date_components(date);
	for (const HolidayRule &rule : holiday_rules) {
		if (!include_substitute && rule.category == HolidayCategory::SUBSTITUTE_HOLIDAY)
			continue;
		if (!include_national && rule.category == HolidayCategory::NATIONAL_HOLIDAY)
			continue;
		if (rule.eval(date, ymd)) {
			trace("%04d/%02d/%02d is %s\n", (int)ymd.y, (int)ymd.m, (int)ymd.d, rule.name);
			if (holiday != nullptr) {
				holiday->name = rule.name;
				holiday->date = date;
				holiday->category = rule.category;
			}
			return true;
		}
	}
	return false;
}

bool HolidayCalendar::exists_holiday(Date start, Date end) const noexcept
{
	for (Date d = start; d <= end; d++) {
		if (is_holiday(d))
			return true;
	}
	return false;
}

std::vector<Holiday> HolidayCalendar::get_holidays(Date start, Date end) const
{
	std::vector<Holiday> holidays;
	Holiday holiday;
	for (Date d = start; d <= end; d++) {
		if (get_holiday(d, &holiday))
			holidays.push_back(holiday);
	}
	debug("Found %d holidays in %d days\n", (int)holidays.size(), end >= start ? (int)(end - start + 1) : 0);
	return holidays;
}

class JapaneseHolidayCalendarImpl : public HolidayCalendar
{
	public:
	JapaneseHolidayCalendarImpl() noexcept {}
	virtual bool get_holiday(Date d, Holiday *holiday) const noexcept override
	{
		return resolve_holiday(d, true, true, holiday);
	}

	private:
	JapaneseHolidayCalendarImpl(const JapaneseHolidayCalendarImpl &) = delete;
	JapaneseHolidayCalendarImpl &operator=(const JapaneseHolidayCalendarImpl &) = delete;
};

static JapaneseHolidayCalendarImpl japanese_holiday_calendar;

const HolidayCalendar *get_japanese_holiday_calendar() noexcept { return &japanese_holiday_calendar; }

//////////////////////////////// TESTS

static int expect_holiday(const HolidayCalendar *calendar, Date date, const char *name, HolidayCategory category)
{
	Holiday holiday;
	char buf[16];
	if (!calendar->get_holiday(date, &holiday)) {
		fprintf(stderr, "%s: expected %s, found no holiday\n", format_date(date, buf, sizeof buf), name);
		return 1;
	}
	if (strcmp(holiday.name, name) != 0 || holiday.category != category || holiday.date != date) {
		fprintf(stderr, "%s: expected %s, found %s\n", format_date(date, buf, sizeof buf), name, holiday.name);
		return 1;
	}
	return 0;
}

static int expect_no_holiday(const HolidayCalendar *calendar, Date date)
{
	Holiday holiday;
	char buf[16];
	if (calendar->get_holiday(date, &holiday)) {
		fprintf(stderr, "%s: expected no holiday, found %s\n", format_date(date, buf, sizeof buf), holiday.name);
		return 1;
	}
	return 0;
}

static int test_fixed_and_floating_holidays()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();

	failure_count += expect_holiday(calendar, make_date(1, 1, 2024), u8"元日", HOLIDAY);
	// 2nd Monday of January
	failure_count += expect_holiday(calendar, make_date(8, 1, 2024), u8"成人の日", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(15, 1, 2024));
	failure_count += expect_holiday(calendar, make_date(21, 3, 2023), u8"春分の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(23, 9, 2019), u8"秋分の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(16, 9, 2019), u8"敬老の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(14, 10, 2019), u8"体育の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(13, 10, 2025), u8"スポーツの日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(21, 7, 2025), u8"海の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(23, 2, 2024), u8"天皇誕生日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(23, 12, 2018), u8"天皇誕生日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(29, 4, 1988), u8"天皇誕生日", HOLIDAY);
	// no Emperor's Birthday in 2019
	failure_count += expect_no_holiday(calendar, make_date(23, 12, 2019));
	failure_count += expect_no_holiday(calendar, make_date(23, 2, 2019));
	// Olympic moves
	failure_count += expect_holiday(calendar, make_date(23, 7, 2020), u8"海の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(24, 7, 2020), u8"スポーツの日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(10, 8, 2020), u8"山の日", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(12, 10, 2020));
	failure_count += expect_holiday(calendar, make_date(22, 7, 2021), u8"海の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(23, 7, 2021), u8"スポーツの日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(8, 8, 2021), u8"山の日", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(19, 7, 2021));
	failure_count += expect_no_holiday(calendar, make_date(11, 10, 2021));
	failure_count += expect_no_holiday(calendar, make_date(11, 8, 2015));
	return failure_count;
}

static int test_boundary_years()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();

	// 1949 is included in after(1949)
	failure_count += expect_holiday(calendar, make_date(1, 1, 1949), u8"元日", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(1, 1, 1948));
	failure_count += expect_holiday(calendar, make_date(21, 3, 1949), u8"春分の日", HOLIDAY);
	// rules that already applied in 1948
	failure_count += expect_holiday(calendar, make_date(23, 9, 1948), u8"秋分の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(3, 11, 1948), u8"文化の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(23, 11, 1948), u8"勤労感謝の日", HOLIDAY);
	// 2000 switches Coming of Age Day to the 2nd Monday
	failure_count += expect_holiday(calendar, make_date(15, 1, 1999), u8"成人の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(10, 1, 2000), u8"成人の日", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(15, 1, 2000));
	// 2007 moves Greenery Day and introduces Showa Day
	failure_count += expect_holiday(calendar, make_date(29, 4, 2006), u8"みどりの日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(4, 5, 2006), u8"国民の休日", NATIONAL_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(29, 4, 2007), u8"昭和の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(4, 5, 2007), u8"みどりの日", HOLIDAY);
	// 1967 introduces National Foundation Day
	failure_count += expect_no_holiday(calendar, make_date(11, 2, 1966));
	failure_count += expect_holiday(calendar, make_date(11, 2, 1967), u8"建国記念の日", HOLIDAY);
	// formula ranges
	failure_count += expect_holiday(calendar, make_date(20, 3, 2099), u8"春分の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(23, 9, 2100), u8"秋分の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(21, 3, 2150), u8"春分の日", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(21, 3, 2151));
	return failure_count;
}

static int test_one_off_holidays()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();

	failure_count += expect_holiday(calendar, make_date(12, 11, 1990), u8"即位礼正殿の儀", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(12, 11, 1989));
	failure_count += expect_no_holiday(calendar, make_date(12, 11, 1991));
	failure_count += expect_holiday(calendar, make_date(22, 10, 2019), u8"即位礼正殿の儀", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(1, 5, 2019), u8"天皇の即位の日", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(9, 6, 1993), u8"皇太子徳仁親王の結婚の儀", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(24, 2, 1989), u8"昭和天皇の大喪の礼", HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(10, 4, 1959), u8"皇太子明仁親王の結婚の儀", HOLIDAY);
	failure_count += expect_no_holiday(calendar, make_date(10, 4, 1960));
	return failure_count;
}

static int test_substitute_holidays()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();

	// Mountain Day on Sunday 11 August 2019
	failure_count += expect_holiday(calendar, make_date(12, 8, 2019), u8"振替休日", SUBSTITUTE_HOLIDAY);
	// Culture Day on Sunday 3 November 2019
	failure_count += expect_holiday(calendar, make_date(4, 11, 2019), u8"振替休日", SUBSTITUTE_HOLIDAY);
	// Sunday 3 May 2020 carries over the following holidays to Wednesday
	failure_count += expect_holiday(calendar, make_date(6, 5, 2020), u8"振替休日", SUBSTITUTE_HOLIDAY);
	// Sunday 4 May 2025 is in the middle of the run, Tuesday is the substitute
	failure_count += expect_holiday(calendar, make_date(6, 5, 2025), u8"振替休日", SUBSTITUTE_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(6, 5, 2008), u8"振替休日", SUBSTITUTE_HOLIDAY);
	// Monday after a Sunday holiday when Monday is a holiday itself
	failure_count += expect_holiday(calendar, make_date(5, 5, 2025), u8"こどもの日", HOLIDAY);
	// Saturday holidays are not substituted
	failure_count += expect_no_holiday(calendar, make_date(13, 7, 2020));
	failure_count += expect_no_holiday(calendar, make_date(25, 2, 2019));
	// 1973 rule: only the Monday immediately after, from 12 April 1973
	failure_count += expect_holiday(calendar, make_date(30, 4, 1973), u8"振替休日", SUBSTITUTE_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(24, 9, 1973), u8"振替休日", SUBSTITUTE_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(24, 12, 1990), u8"振替休日", SUBSTITUTE_HOLIDAY);
	// Sunday 11 February 1973 precedes the start date
	failure_count += expect_no_holiday(calendar, make_date(12, 2, 1973));
	// When Sunday and the substitute rule compete with the national rule
	// the substitute holiday comes first in the table
	failure_count += expect_holiday(calendar, make_date(4, 5, 1987), u8"振替休日", SUBSTITUTE_HOLIDAY);
	return failure_count;
}

static int test_national_holidays()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();

	// Tuesday between Respect for the Aged Day and the Autumnal Equinox
	failure_count += expect_holiday(calendar, make_date(22, 9, 2009), u8"国民の休日", NATIONAL_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(22, 9, 2015), u8"国民の休日", NATIONAL_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(22, 9, 2026), u8"国民の休日", NATIONAL_HOLIDAY);
	// Accession of the Emperor, 2019
	failure_count += expect_holiday(calendar, make_date(30, 4, 2019), u8"国民の休日", NATIONAL_HOLIDAY);
	failure_count += expect_holiday(calendar, make_date(2, 5, 2019), u8"国民の休日", NATIONAL_HOLIDAY);
	// 4th of May before Greenery Day moved
	failure_count += expect_holiday(calendar, make_date(4, 5, 1988), u8"国民の休日", NATIONAL_HOLIDAY);
	// Sundays are never national holidays
	failure_count += expect_no_holiday(calendar, make_date(4, 5, 1986));
	// not before 1986
	failure_count += expect_no_holiday(calendar, make_date(4, 5, 1985));
	return failure_count;
}

static int test_resolution_filters()
{
	int failure_count = 0;
	Holiday holiday;

	// a national holiday is only visible when national rules are included
	Date d = make_date(30, 4, 2019);
	if (resolve_holiday(d, false, false, &holiday) || resolve_holiday(d, true, false, &holiday))
		failure_count++;
	if (!resolve_holiday(d, false, true, &holiday) || holiday.category != NATIONAL_HOLIDAY)
		failure_count++;
	// likewise substitute holidays
	d = make_date(12, 8, 2019);
	if (resolve_holiday(d, false, true, &holiday))
		failure_count++;
	if (!resolve_holiday(d, true, false, &holiday) || holiday.category != SUBSTITUTE_HOLIDAY)
		failure_count++;
	// 4 May 1987 matches both, the filter selects which one is seen
	d = make_date(4, 5, 1987);
	if (!resolve_holiday(d, false, true, &holiday) || holiday.category != NATIONAL_HOLIDAY)
		failure_count++;
	if (!resolve_holiday(d, true, true, &holiday) || holiday.category != SUBSTITUTE_HOLIDAY)
		failure_count++;
	// null output is allowed
	if (!resolve_holiday(make_date(1, 1, 2000), true, true, nullptr))
		failure_count++;
	// Holiday-only resolution never reports a derived category and
	// leaves the recursion guard clear
	for (Date t = make_date(1, 1, 1985); t <= make_date(31, 12, 2030); t++) {
		if (resolve_holiday(t, false, false, &holiday) && holiday.category != HOLIDAY) {
			failure_count++;
			break;
		}
	}
	if (evaluating_adjacent_rule)
		failure_count++;
	// inside a derived rule only Holiday rules are evaluated
	{
		AdjacentRuleGuard guard;
		if (!evaluating_adjacent_rule)
			failure_count++;
		if (resolve_holiday(make_date(12, 8, 2019), true, true, &holiday))
			failure_count++;
		if (resolve_holiday(make_date(30, 4, 2019), false, true, &holiday))
			failure_count++;
		if (!resolve_holiday(make_date(11, 8, 2019), true, true, &holiday) || holiday.category != HOLIDAY)
			failure_count++;
	}
	if (evaluating_adjacent_rule)
		failure_count++;
	if (!resolve_holiday(make_date(12, 8, 2019), true, true, &holiday) ||
	    holiday.category != SUBSTITUTE_HOLIDAY)
		failure_count++;
	return failure_count;
}

static int test_equinox_days()
{
	int failure_count = 0;
	struct {
		int year;
		int vernal;
		int autumnal;
	} expected[] = {{1949, 21, 23}, {1960, 20, 23}, {1979, 21, 24}, {1980, 20, 23}, {2000, 20, 23},
			{2023, 21, 23}, {2024, 20, 22}, {2099, 20, 23}, {2100, 20, 23}, {2150, 21, 23}};
	for (auto &e : expected) {
		if (vernal_equinox_day(e.year) != e.vernal || autumnal_equinox_day(e.year) != e.autumnal) {
			fprintf(stderr, "equinox days for %d: got %d/%d, expected %d/%d\n", e.year,
				vernal_equinox_day(e.year), autumnal_equinox_day(e.year), e.vernal, e.autumnal);
			failure_count++;
		}
	}
	if (vernal_equinox_day(1948) != 0 || autumnal_equinox_day(1948) != 23 || vernal_equinox_day(2151) != 0)
		failure_count++;
	// the holiday table and the helpers agree
	auto calendar = get_japanese_holiday_calendar();
	for (int y = 1949; y <= 2150; y++) {
		if (!calendar->is_holiday(make_date(vernal_equinox_day(y), March, y)) ||
		    !calendar->is_holiday(make_date(autumnal_equinox_day(y), September, y))) {
			fprintf(stderr, "equinox holiday missing in %d\n", y);
			failure_count++;
		}
	}
	return failure_count;
}

static int test_year_counts()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();
	struct {
		int year;
		size_t count;
	} expected[] = {{1948, 3},  {1949, 9},  {1966, 11}, {1967, 12}, {1973, 14}, {1990, 19},
			{2009, 17}, {2019, 22}, {2020, 18}, {2021, 17}, {2025, 19}};
	for (auto &e : expected) {
		auto holidays = calendar->get_holidays(make_date(1, 1, e.year), make_date(31, 12, e.year));
		if (holidays.size() != e.count) {
			fprintf(stderr, "%d: expected %d holidays, found %d\n", e.year, (int)e.count,
				(int)holidays.size());
			failure_count++;
		}
	}
	auto holidays = calendar->get_holidays(make_date(1, 5, 2019), make_date(6, 5, 2019));
	const char *names[] = {u8"天皇の即位の日", u8"国民の休日", u8"憲法記念日",
			       u8"みどりの日",     u8"こどもの日", u8"振替休日"};
	if (holidays.size() != std::size(names)) {
		failure_count++;
	} else {
		for (size_t i = 0; i < holidays.size(); i++) {
			if (strcmp(holidays[i].name, names[i]) != 0 || holidays[i].date != make_date(1, 5, 2019) + (Date)i)
				failure_count++;
		}
	}
	return failure_count;
}

// Relationships that must hold between the query operations
static int test_consistency()
{
	int failure_count = 0;
	auto calendar = get_japanese_holiday_calendar();
	Holiday holiday;

	for (Date d = make_date(1, 1, 1940); d <= make_date(31, 12, 2160); d++) {
		bool found = calendar->get_holiday(d, &holiday);
		if (found != calendar->is_holiday(d)) {
			failure_count++;
			break;
		}
		auto single = calendar->get_holidays(d, d);
		if (single.size() != (found ? 1u : 0u) || (found && single[0].date != d) ||
		    (found && strcmp(single[0].name, holiday.name) != 0)) {
			failure_count++;
			break;
		}
		if (calendar->exists_holiday(d, d) != found) {
			failure_count++;
			break;
		}
		// before 1948 there are no holidays
		if (found && date_components(d).y < 1948) {
			failure_count++;
			break;
		}
	}
	for (int y = 1945; y <= 2155; y++) {
		for (int m = 1; m <= 12; m++) {
			Date start = make_date(1, m, y);
			Date end = make_date(last_day_of_month(y, m), m, y);
			if (calendar->exists_holiday(start, end) != !calendar->get_holidays(start, end).empty())
				failure_count++;
		}
	}
	// reversed ranges are empty, not errors
	if (calendar->exists_holiday(make_date(31, 12, 2024), make_date(1, 1, 2024)))
		failure_count++;
	if (!calendar->get_holidays(make_date(31, 12, 2024), make_date(1, 1, 2024)).empty())
		failure_count++;
	// repeated queries give identical answers
	auto first = calendar->get_holidays(make_date(1, 1, 2019), make_date(31, 12, 2019));
	auto second = calendar->get_holidays(make_date(1, 1, 2019), make_date(31, 12, 2019));
	if (first.size() != second.size())
		failure_count++;
	for (size_t i = 0; i < first.size() && i < second.size(); i++) {
		if (first[i].date != second[i].date || first[i].name != second[i].name)
			failure_count++;
	}
	return failure_count;
}

int test_holidays()
{
	int failure_count = 0;
	failure_count += test_fixed_and_floating_holidays();
	failure_count += test_boundary_years();
	failure_count += test_one_off_holidays();
	failure_count += test_substitute_holidays();
	failure_count += test_national_holidays();
	failure_count += test_resolution_filters();
	failure_count += test_equinox_days();
	failure_count += test_year_counts();
	failure_count += test_consistency();
	if (failure_count == 0)
		printf("Holiday Tests OK\n");
	else
		printf("Holiday Tests FAILED\n");
	return failure_count;
}

} // namespace jpholidays
