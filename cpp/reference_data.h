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
#ifndef _JPHOLIDAYS_REFERENCE_DATA_H_
#define _JPHOLIDAYS_REFERENCE_DATA_H_

#include <date.h>
#include <holidays.h>
#include <status.h>

#include <memory>
#include <string>
#include <vector>

namespace jpholidays
{

/**
 * Tokenizer that takes as input a string, and returns
 * tokens. Token are identified using delimiters COMMA,
 * TAB, LF, or CRLF. Tokens can be surrounded in double quotes
 * which would then allow anything in quotes to be treated
 * as a token, the double quote character itself can be
 * escaped by using two consecutive double quotes.
 * The start and end must point to beginning and end of the
 * input as per STL rules. The tokens point into buf which
 * must be larger than the input.
 */
extern bool parse_delimited(const char *start, const char *end, std::vector<const char *> &out_tokens,
			    std::vector<char> &buf, const char *delims = nullptr) noexcept;

struct Line {
	/**
	 * Buffer that holds the current line
	 */
	std::vector<char> line_buf;
	/**
	 * The fields point to offsets in the line_buf
	 */
	std::vector<const char *> fields;

	Line(size_t n) : line_buf(n) {}
};

class CSVDataSourceImpl;
class CSVDataSource
{
	private:
	std::unique_ptr<CSVDataSourceImpl> impl;

	public:
	CSVDataSource(std::string filename) noexcept;
	~CSVDataSource() noexcept;
	bool is_valid() const noexcept;
	/**
	 * Retrieve the next line, and return false if EOF.
	 */
	bool next(Line *line) noexcept;
	/**
	 * One based number of the line last returned by next()
	 */
	int line_number() const noexcept;
};

// A row of a reference list of holidays
struct ReferenceHoliday {
	Date date;
	std::string name;
};

// Reads date,name rows from a CSV file. A first line whose date does not
// parse is taken as the heading. Blank lines are skipped.
// On success the holidays are returned sorted by date.
extern StatusCode load_reference_holidays(const char *filename, std::vector<ReferenceHoliday> &holidays) noexcept;

struct ReferenceCheckResult {
	int days_checked;
	int day_mismatches;
	int months_checked;
	int month_mismatches;
	int years_checked;
	int year_mismatches;

	int mismatches() const noexcept { return day_mismatches + month_mismatches + year_mismatches; }
};

// Compares the calendar with the reference list over [start, end].
// Each day is checked with is_holiday() and get_holiday(), each month
// (clipped to the window) with exists_holiday() and each year with
// get_holidays(). Every mismatch is logged as an error.
// Reference entries outside the window are ignored.
extern ReferenceCheckResult check_reference_holidays(const HolidayCalendar *calendar,
						     const std::vector<ReferenceHoliday> &reference, Date start,
						     Date end);

extern int test_reference_data();

} // namespace jpholidays

#endif
