/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is OpenRedukti.
 * The Initial Developer of the Original Software is REDUKTI LIMITED.
 *
 * Portions Copyright 2016-2017 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 2 (http://www.gnu.org/licenses/old-licenses/gpl-2.0.html).
 */
#include <converters.h>
#include <date.h>
#include <holiday_rules.h>
#include <holidays.h>
#include <reference_data.h>
#include <request_processor.h>
#include <status.h>

#include <stdio.h>

using namespace jpholidays;

int main() {
	int rc = 0;
	rc += test_date();
	rc += test_status();
	rc += test_holiday_rules();
	rc += test_holidays();
	rc += test_conversions();
	rc += test_reference_data();
	rc += test_request_processor();
	if (rc != 0)
		printf("FAILED\n");
	else
		printf("OK\n");
	return rc != 0 ? 1 : 0;
}
