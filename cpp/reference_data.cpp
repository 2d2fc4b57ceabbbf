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
#include <reference_data.h>

#include <stddef.h>
#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <string>

#include <logger.h>

#ifndef JPHOLIDAYS_TESTDATA_DIR
#define JPHOLIDAYS_TESTDATA_DIR "testdata"
#endif

namespace jpholidays
{

bool parse_delimited(const char *input_start, const char *input_end, std::vector<const char *> &out_tokens,
		     std::vector<char> &buf, const char *delimiters) noexcept
{
	out_tokens.clear();

	if (input_end <= input_start) {
		return false;
	}
	auto input_size = input_end - input_start;
	if (input_size >= (ptrdiff_t)buf.size()) {
		error("Input size %d is bigger than buffer size %d\n", (int)input_size, (int)buf.size());
		return false;
	}
	const char *input_ptr = input_start;
	char *wordp = buf.data();

	while (*input_ptr && input_ptr != input_end) {
		char *word = wordp;
		*wordp = 0;

		bool inquote = false;
		while (*input_ptr && input_ptr != input_end) {
			if (word == wordp) {
				// at the beginning of a word, so look
				// for potential quote
				if (*input_ptr == '"' && !inquote) {
					inquote = true;
					input_ptr++;
					continue;
				}
			}
			if (inquote) {
				if (*input_ptr == '"') {
					// Check if it is an escape - i.e.
					// double quote
					if (input_ptr + 1 < input_end && *(input_ptr + 1) == '"') {
						*wordp++ = '"';
						input_ptr += 2;
						continue;
					} else {
						// the quoted word ends here
						inquote = false;
						*wordp++ = 0;
						input_ptr++;
						if (input_ptr < input_end &&
						    (*input_ptr == ',' || *input_ptr == '\t' ||
						     (delimiters && strchr(delimiters, *input_ptr)))) {
							// Skip delimiter
							// following quote
							input_ptr++;
						}
						break;
					}
				} else {
					*wordp++ = *input_ptr++;
					continue;
				}
			} else {
				if (*input_ptr == ',' || *input_ptr == '\t' ||
				    (delimiters && strchr(delimiters, *input_ptr))) {
					// word ends due to delimiter
					*wordp++ = 0;
					input_ptr++;
					break;
				} else if (*input_ptr == '\r' || *input_ptr == '\n') {
					// skip line feed or CRLF
					*wordp++ = 0;
					if (*input_ptr == '\r' && input_ptr + 1 < input_end &&
					    *(input_ptr + 1) == '\n') {
						input_ptr++;
					}
					input_ptr++;
					break;
				} else {
					*wordp++ = *input_ptr++;
				}
			}
		}
		// input ended without a delimiter
		if (word == wordp || *(wordp - 1) != 0)
			*wordp++ = 0;
		out_tokens.push_back(word);
	}
	return true;
}

class CSVDataSourceImpl
{
	private:
	FILE *fp;
	std::string _name;
	int _line_number;
	std::vector<char> _line_buf;

	public:
	CSVDataSourceImpl(const std::string &name) noexcept;
	~CSVDataSourceImpl() noexcept;
	bool next(Line *line) noexcept;
	bool read_next_line() noexcept;
	bool is_valid() const noexcept { return fp != nullptr; }
	int line_number() const noexcept { return _line_number; }

	private:
	CSVDataSourceImpl(const CSVDataSourceImpl &) = delete;
	CSVDataSourceImpl &operator=(const CSVDataSourceImpl &) = delete;
};

CSVDataSourceImpl::CSVDataSourceImpl(const std::string &name) noexcept
    : _name(name), _line_number(0), _line_buf(4 * 1024)
{
	fp = fopen(name.c_str(), "r");
	if (fp == nullptr) {
		error("Unable to open file %s\n", name.c_str());
	}
}

CSVDataSourceImpl::~CSVDataSourceImpl() noexcept
{
	if (fp != nullptr)
		fclose(fp);
	fp = nullptr;
}

bool CSVDataSourceImpl::read_next_line() noexcept
{
	char *p = fgets(_line_buf.data(), (int)_line_buf.size(), fp);
	if (p == nullptr) {
		return false;
	}
	_line_number++;
	auto len = strlen(p);
	if (len == 0) {
		error("Line %d of %s is empty\n", _line_number, _name.c_str());
		return false;
	}
	if (p[len - 1] != '\n' && !feof(fp)) {
		error("Line %d of %s exceeds the size of the buffer\n", _line_number, _name.c_str());
		return false;
	}
	return true;
}

bool CSVDataSourceImpl::next(Line *line) noexcept
{
	if (fp == nullptr)
		return false;
	if (!read_next_line())
		return false;
	const char *start = _line_buf.data();
	// UTF-8 byte order mark
	if (_line_number == 1 && strncmp(start, "\xEF\xBB\xBF", 3) == 0)
		start += 3;
	if (line->line_buf.size() < _line_buf.size())
		line->line_buf.resize(_line_buf.size());
	parse_delimited(start, start + strlen(start), line->fields, line->line_buf);
	return true;
}

CSVDataSource::CSVDataSource(std::string filename) noexcept
{
	impl = std::unique_ptr<CSVDataSourceImpl>(new CSVDataSourceImpl(filename));
}

CSVDataSource::~CSVDataSource() noexcept {}

bool CSVDataSource::next(Line *line) noexcept { return impl->next(line); }

bool CSVDataSource::is_valid() const noexcept { return impl->is_valid(); }

int CSVDataSource::line_number() const noexcept { return impl->line_number(); }

StatusCode load_reference_holidays(const char *filename, std::vector<ReferenceHoliday> &holidays) noexcept
{
	holidays.clear();
	CSVDataSource source(filename);
	if (!source.is_valid())
		return StatusCode::kREF_FileNotFound;

	Line line(1024);
	while (source.next(&line)) {
		if (line.fields.empty() || (line.fields.size() == 1 && line.fields[0][0] == 0))
			continue;
		Date date = 0;
		if (!parse_date(line.fields[0], &date) || !is_valid_date(date)) {
			if (source.line_number() == 1) {
				debug("Skipping heading line in %s\n", filename);
				continue;
			}
			error("Invalid date '%s' at line %d of %s\n", line.fields[0], source.line_number(), filename);
			return StatusCode::kREF_BadDate;
		}
		if (line.fields.size() < 2 || line.fields[1][0] == 0) {
			error("Holiday name missing at line %d of %s\n", source.line_number(), filename);
			return StatusCode::kREF_MissingName;
		}
		holidays.push_back(ReferenceHoliday{date, line.fields[1]});
	}
	std::stable_sort(holidays.begin(), holidays.end(),
			 [](const ReferenceHoliday &a, const ReferenceHoliday &b) { return a.date < b.date; });
	for (size_t i = 1; i < holidays.size(); i++) {
		if (holidays[i].date == holidays[i - 1].date) {
			char buf[16];
			error("Date %s appears more than once in %s\n", format_date(holidays[i].date, buf, sizeof buf),
			      filename);
			holidays.clear();
			return StatusCode::kREF_DuplicateDate;
		}
	}
	debug("Loaded %d reference holidays from %s\n", (int)holidays.size(), filename);
	return StatusCode::kOk;
}

ReferenceCheckResult check_reference_holidays(const HolidayCalendar *calendar,
					      const std::vector<ReferenceHoliday> &reference, Date start, Date end)
{
	ReferenceCheckResult result = {};
	std::map<Date, const ReferenceHoliday *> expected;
	for (auto &h : reference) {
		if (h.date >= start && h.date <= end)
			expected[h.date] = &h;
	}
	char buf[16];

	Holiday holiday;
	for (Date d = start; d <= end; d++) {
		result.days_checked++;
		auto iter = expected.find(d);
		bool found = calendar->get_holiday(d, &holiday);
		if (found != calendar->is_holiday(d)) {
			error("%s: is_holiday() and get_holiday() disagree\n", format_date(d, buf, sizeof buf));
			result.day_mismatches++;
		} else if (iter == expected.end() && found) {
			error("%s: %s is not in the reference data\n", format_date(d, buf, sizeof buf), holiday.name);
			result.day_mismatches++;
		} else if (iter != expected.end() && !found) {
			error("%s: reference holiday %s not found\n", format_date(d, buf, sizeof buf),
			      iter->second->name.c_str());
			result.day_mismatches++;
		} else if (iter != expected.end() && iter->second->name != holiday.name) {
			error("%s: expected %s, found %s\n", format_date(d, buf, sizeof buf),
			      iter->second->name.c_str(), holiday.name);
			result.day_mismatches++;
		}
	}

	if (end < start)
		return result;

	// months clipped to the window
	YearMonthDay first = date_components(start);
	YearMonthDay last = date_components(end);
	for (int y = first.y, m = first.m; y < last.y || (y == last.y && m <= last.m);) {
		Date month_start = std::max(start, make_date(1, m, y));
		Date month_end = std::min(end, make_date(last_day_of_month(y, m), m, y));
		result.months_checked++;
		bool want = expected.lower_bound(month_start) != expected.upper_bound(month_end);
		if (calendar->exists_holiday(month_start, month_end) != want) {
			error("%04d/%02d: exists_holiday() should be %s\n", y, m, want ? "true" : "false");
			result.month_mismatches++;
		}
		if (++m > 12) {
			m = 1;
			y++;
		}
	}

	for (int y = first.y; y <= last.y; y++) {
		Date year_start = std::max(start, make_date(1, January, y));
		Date year_end = std::min(end, make_date(31, December, y));
		result.years_checked++;
		auto holidays = calendar->get_holidays(year_start, year_end);
		auto lo = expected.lower_bound(year_start);
		auto hi = expected.upper_bound(year_end);
		bool same = (size_t)std::distance(lo, hi) == holidays.size();
		for (size_t i = 0; same && i < holidays.size(); i++, lo++) {
			same = holidays[i].date == lo->first && lo->second->name == holidays[i].name;
		}
		if (!same) {
			error("%04d: get_holidays() does not match the reference data\n", y);
			result.year_mismatches++;
		}
	}
	return result;
}

//////////////////////////////// TESTS

static int test_tokenizer()
{
	int failure_count = 0;
	char data[] = {"This,is,test,,data,\"embedded,\"\"data\",final\n"};
	const char *expected[] = {"This", "is", "test", "", "data", "embedded,\"data", "final"};

	std::vector<char> buf(1024);
	std::vector<const char *> tokens;
	parse_delimited(std::begin(data), std::end(data), tokens, buf);
	if (tokens.size() != std::size(expected))
		return 1;
	int n = 0;
	for (auto word : tokens) {
		if (strcmp(word, expected[n]) != 0) {
			fprintf(stderr, "tok = [%s], expected = [%s]\n", word, expected[n]);
			failure_count++;
		}
		n++;
	}

	// last token without a line feed
	const char *row = u8"2019/05/01,天皇の即位の日";
	parse_delimited(row, row + strlen(row), tokens, buf);
	if (tokens.size() != 2 || strcmp(tokens[0], "2019/05/01") != 0 || strcmp(tokens[1], u8"天皇の即位の日") != 0)
		failure_count++;
	return failure_count;
}

static bool write_file(const char *filename, const char *contents)
{
	FILE *fp = fopen(filename, "w");
	if (fp == nullptr)
		return false;
	fputs(contents, fp);
	fclose(fp);
	return true;
}

static int expect_load_status(const char *contents, StatusCode expected)
{
	const char *filename = "jpholidays_reference_test.csv";
	if (!write_file(filename, contents)) {
		fprintf(stderr, "Unable to create %s\n", filename);
		return 1;
	}
	std::vector<ReferenceHoliday> holidays;
	StatusCode status = load_reference_holidays(filename, holidays);
	remove(filename);
	if (status != expected) {
		fprintf(stderr, "Expected status %d, got %d for [%s]\n", (int)expected, (int)status, contents);
		return 1;
	}
	return 0;
}

static int test_load_errors()
{
	int failure_count = 0;
	std::vector<ReferenceHoliday> holidays;
	if (load_reference_holidays("does_not_exist.csv", holidays) != StatusCode::kREF_FileNotFound)
		failure_count++;
	failure_count += expect_load_status(u8"2019/01/01,元日\n2019/02/30,bad\n", StatusCode::kREF_BadDate);
	failure_count += expect_load_status(u8"date,name\n2019/01/01,元日\nnot a date,x\n", StatusCode::kREF_BadDate);
	failure_count += expect_load_status(u8"2019/01/01\n", StatusCode::kREF_MissingName);
	failure_count += expect_load_status(u8"2019/01/01,\n", StatusCode::kREF_MissingName);
	failure_count +=
	    expect_load_status(u8"2019/01/01,元日\n2019-01-14,成人の日\n01/01/2019,元日\n", StatusCode::kREF_DuplicateDate);
	// no heading, unsorted, blank line, no trailing newline
	failure_count += expect_load_status(u8"2019/01/14,成人の日\n\n2019/01/01,元日", StatusCode::kOk);
	return failure_count;
}

static int test_reference_check()
{
	int failure_count = 0;
	std::vector<ReferenceHoliday> reference;
	const char *filename = JPHOLIDAYS_TESTDATA_DIR "/holidays_2019_2021.csv";
	if (load_reference_holidays(filename, reference) != StatusCode::kOk) {
		fprintf(stderr, "Unable to load %s\n", filename);
		return 1;
	}
	if (reference.size() != 57) {
		fprintf(stderr, "Expected 57 reference holidays, got %d\n", (int)reference.size());
		failure_count++;
	}
	auto calendar = get_japanese_holiday_calendar();
	auto result = check_reference_holidays(calendar, reference, make_date(1, 1, 2019), make_date(31, 12, 2021));
	if (result.mismatches() != 0 || result.days_checked != 1096 || result.months_checked != 36 ||
	    result.years_checked != 3)
		failure_count++;

	// window cutting across months and years
	result = check_reference_holidays(calendar, reference, make_date(15, 12, 2019), make_date(10, 1, 2020));
	if (result.mismatches() != 0 || result.days_checked != 27 || result.months_checked != 2 ||
	    result.years_checked != 2)
		failure_count++;

	// drop the substitute holiday of 6 May 2019 and misname Sports Day 2020
	auto altered = reference;
	altered.erase(std::remove_if(altered.begin(), altered.end(),
				     [](const ReferenceHoliday &h) { return h.date == make_date(6, 5, 2019); }),
		      altered.end());
	for (auto &h : altered) {
		if (h.date == make_date(24, 7, 2020))
			h.name = u8"体育の日";
	}
	result = check_reference_holidays(calendar, altered, make_date(1, 1, 2019), make_date(31, 12, 2021));
	if (result.day_mismatches != 2 || result.month_mismatches != 0 || result.year_mismatches != 2)
		failure_count++;

	// a month with no reference holidays at all
	std::vector<ReferenceHoliday> empty;
	result = check_reference_holidays(calendar, empty, make_date(1, 6, 2019), make_date(31, 7, 2019));
	if (result.day_mismatches != 1 || result.month_mismatches != 1 || result.year_mismatches != 1)
		failure_count++;

	// reversed window checks nothing
	result = check_reference_holidays(calendar, reference, make_date(31, 12, 2021), make_date(1, 1, 2019));
	if (result.days_checked != 0 || result.months_checked != 0 || result.mismatches() != 0)
		failure_count++;
	return failure_count;
}

int test_reference_data()
{
	int failure_count = 0;
	failure_count += test_tokenizer();
	failure_count += test_load_errors();
	failure_count += test_reference_check();
	if (failure_count == 0)
		printf("Reference Data Tests OK\n");
	else
		printf("Reference Data Tests FAILED\n");
	return failure_count;
}

} // namespace jpholidays
