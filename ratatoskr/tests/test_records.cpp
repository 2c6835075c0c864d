/* Copyright (c) 2010-2011 Benjamin Dobell, Glass Echidna
   Copyright (c) 2012 Marsh Ray
 
 Permission is hereby granted, free of charge, to any person obtaining a copy
 of this software and associated documentation files (the "Software"), to deal
 in the Software without restriction, including without limitation the rights
 to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 copies of the Software, and to permit persons to whom the Software is
 furnished to do so, subject to the following conditions:
 
 The above copyright notice and this permission notice shall be included in
 all copies or substantial portions of the Software.
 
 THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 THE SOFTWARE.*/

#include "test_support.h"

#include <unistd.h>

#include <ArduinoJson.h>

#include "AuditSink.h"
#include "Authorizer.h"
#include "FakeDevices.h"
#include "ResultCache.h"
#include "TextFile.h"

using namespace Ratatoskr;

namespace
{
	std::string MakeTempPath(const char *contents)
	{
		char path[] = "/tmp/ratatoskr-records-XXXXXX";
		int fd = mkstemp(path);
		TEST_ASSERT(fd >= 0);

		size_t length = strlen(contents);
		TEST_ASSERT(write(fd, contents, length) == static_cast<ssize_t>(length));
		TEST_ASSERT(close(fd) == 0);

		return (path);
	}
}

static void test_cache_entries_expire()
{
	FakeClockValue() = 1000000;
	MemoryResultCache cache(60, 16, FakeClockNow);

	cache.Store("A", "M1", kAttemptSuccess);

	AttemptStatus status;
	TEST_ASSERT(cache.Lookup("A", "M1", &status));
	TEST_ASSERT_EQ_INT(status, kAttemptSuccess);
	TEST_ASSERT(!cache.Lookup("B", "M1", &status));

	FakeClockValue() += 59999;
	TEST_ASSERT(cache.Lookup("A", "M1", &status));

	FakeClockValue() += 1;
	TEST_ASSERT(!cache.Lookup("A", "M1", &status));
	TEST_ASSERT_EQ_INT(cache.GetSize(), 0);
}

static void test_cache_overwrites_and_evicts_oldest()
{
	FakeClockValue() = 5000;
	MemoryResultCache cache(3600, 2, FakeClockNow);

	cache.Store("A", "M1", kAttemptFailed);
	FakeClockValue() += 10;
	cache.Store("A", "M2", kAttemptSuccess);
	FakeClockValue() += 10;

	// Same key replaces in place without evicting.
	cache.Store("A", "M1", kAttemptSuccess);
	TEST_ASSERT_EQ_INT(cache.GetSize(), 2);

	AttemptStatus status;
	TEST_ASSERT(cache.Lookup("A", "M1", &status));
	TEST_ASSERT_EQ_INT(status, kAttemptSuccess);

	FakeClockValue() += 10;
	cache.Store("B", "M1", kAttemptError);

	TEST_ASSERT_EQ_INT(cache.GetSize(), 2);
	TEST_ASSERT(!cache.Lookup("A", "M2", &status));
	TEST_ASSERT(cache.Lookup("A", "M1", &status));
	TEST_ASSERT(cache.Lookup("B", "M1", &status));
	TEST_ASSERT_EQ_INT(status, kAttemptError);
}

static void test_cache_remove_expired()
{
	FakeClockValue() = 0;
	MemoryResultCache cache(1, 16, FakeClockNow);

	cache.Store("A", "M1", kAttemptSuccess);
	cache.Store("A", "M2", kAttemptFailed);
	FakeClockValue() = 500;
	cache.Store("A", "M3", kAttemptSuccess);

	FakeClockValue() = 1200;
	TEST_ASSERT_EQ_INT(cache.RemoveExpired(), 2);
	TEST_ASSERT_EQ_INT(cache.GetSize(), 1);

	FakeClockValue() = 1500;
	TEST_ASSERT_EQ_INT(cache.RemoveExpired(), 1);
	TEST_ASSERT_EQ_INT(cache.RemoveExpired(), 0);
}

static void test_authorizer_reads_serial_list()
{
	std::string path = MakeTempPath("# bench devices\nR58M123\n\n   8XV7N18  \n#ce0916094b9a2f1c03\n");

	FileAuthorizer authorizer;
	TEST_ASSERT(authorizer.LoadFile(path));

	TEST_ASSERT(authorizer.CheckAuthorized("R58M123"));
	TEST_ASSERT(authorizer.CheckAuthorized("8XV7N18"));
	TEST_ASSERT(!authorizer.CheckAuthorized("ce0916094b9a2f1c03"));
	TEST_ASSERT(!authorizer.CheckAuthorized(""));

	authorizer.Add("ce0916094b9a2f1c03");
	TEST_ASSERT(authorizer.CheckAuthorized("ce0916094b9a2f1c03"));

	FileAuthorizer missing;
	TEST_ASSERT(!missing.LoadFile("/nonexistent/authorized.txt"));
	TEST_ASSERT(!missing.CheckAuthorized("R58M123"));

	unlink(path.c_str());
}

static void test_audit_sink_appends_json_lines()
{
	std::string path = MakeTempPath("");

	AuditRecord record;
	record.timestamp = 1714566896789ULL;
	record.sessionId = "session_1714566896_R58M123_1";
	record.deviceSerial = "R58M123";
	record.methodName = "M1";
	record.fromState = "executing";
	record.toState = "verifying";
	record.detail = "quote \" and newline \n";

	FileAuditSink sink(path);
	TEST_ASSERT(sink.Append(record));

	record.methodName = "";
	record.fromState = "running";
	record.toState = "success";
	TEST_ASSERT(sink.Append(record));

	std::vector<std::string> lines;
	TEST_ASSERT(TextFile::ReadLines(path, &lines));
	TEST_ASSERT_EQ_INT(lines.size(), 2);

	JsonDocument document;
	TEST_ASSERT(!deserializeJson(document, lines[0]));
	TEST_ASSERT_EQ_STR(document["timestamp"].as<const char *>(), "2024-05-01T12:34:56.789Z");
	TEST_ASSERT_EQ_STR(document["session_id"].as<const char *>(), "session_1714566896_R58M123_1");
	TEST_ASSERT_EQ_STR(document["device_serial"].as<const char *>(), "R58M123");
	TEST_ASSERT_EQ_STR(document["method"].as<const char *>(), "M1");
	TEST_ASSERT_EQ_STR(document["from"].as<const char *>(), "executing");
	TEST_ASSERT_EQ_STR(document["to"].as<const char *>(), "verifying");
	TEST_ASSERT_EQ_STR(document["detail"].as<const char *>(), "quote \" and newline \n");

	TEST_ASSERT(!deserializeJson(document, lines[1]));
	TEST_ASSERT_EQ_STR(document["to"].as<const char *>(), "success");

	unlink(path.c_str());

	FileAuditSink unwritable("/nonexistent/dir/audit.log");
	TEST_ASSERT(!unwritable.Append(record));
}

int main()
{
	printf("=== Result cache, authorization and audit ===\n");

	RUN_TEST(test_cache_entries_expire);
	RUN_TEST(test_cache_overwrites_and_evicts_oldest);
	RUN_TEST(test_cache_remove_expired);
	RUN_TEST(test_authorizer_reads_serial_list);
	RUN_TEST(test_audit_sink_appends_json_lines);

	return (0);
}
