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

#include <ArduinoJson.h>

#include "Arguments.h"
#include "FakeDevices.h"
#include "JsonOutput.h"

using namespace Ratatoskr;

namespace
{
	std::map<std::string, ArgumentType> MakeArgumentTypes(void)
	{
		std::map<std::string, ArgumentType> argumentTypes;
		argumentTypes["verbose"] = kArgumentTypeFlag;
		argumentTypes["serial"] = kArgumentTypeString;
		argumentTypes["command-timeout"] = kArgumentTypeUnsignedInteger;

		return (argumentTypes);
	}

	std::map<std::string, std::string> MakeAliases(void)
	{
		std::map<std::string, std::string> aliases;
		aliases["v"] = "verbose";
		aliases["s"] = "serial";

		return (aliases);
	}

	bool Parse(Arguments *arguments, const char *words[], int count)
	{
		return (arguments->ParseArguments(count, const_cast<char **>(words), 2));
	}
}

static void test_arguments_parse_long_and_short_forms()
{
	const char *words[] = { "ratatoskr", "bypass", "-v", "--serial", "R58M123", "--command-timeout", "0x10" };

	Arguments arguments(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(Parse(&arguments, words, 7));

	TEST_ASSERT(arguments.HasFlag("verbose"));
	TEST_ASSERT_EQ_STR(arguments.GetString("serial"), "R58M123");
	TEST_ASSERT_EQ_INT(arguments.GetUnsignedInteger("command-timeout", 0), 16);
	TEST_ASSERT_EQ_INT(arguments.GetArguments().size(), 3);

	// Type mismatches and absent arguments fall back to the default.
	TEST_ASSERT_EQ_STR(arguments.GetString("verbose", "none"), "none");
	TEST_ASSERT_EQ_INT(arguments.GetUnsignedInteger("missing", 7), 7);
	TEST_ASSERT(!arguments.HasFlag("serial"));
}

static void test_arguments_reject_bad_input()
{
	const char *unknown[] = { "ratatoskr", "detect", "--colour" };
	Arguments first(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(!Parse(&first, unknown, 3));

	const char *duplicate[] = { "ratatoskr", "detect", "-s", "A", "--serial", "B" };
	Arguments second(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(!Parse(&second, duplicate, 6));

	const char *missingValue[] = { "ratatoskr", "detect", "--serial" };
	Arguments third(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(!Parse(&third, missingValue, 3));

	const char *negative[] = { "ratatoskr", "detect", "--command-timeout", "-5" };
	Arguments fourth(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(!Parse(&fourth, negative, 4));

	const char *bare[] = { "ratatoskr", "detect", "serial" };
	Arguments fifth(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(!Parse(&fifth, bare, 3));

	const char *unknownAlias[] = { "ratatoskr", "detect", "-x" };
	Arguments sixth(MakeArgumentTypes(), MakeAliases());
	TEST_ASSERT(!Parse(&sixth, unknownAlias, 3));
}

static void test_snapshot_json()
{
	std::vector<DeviceSnapshot> devices;
	devices.push_back(MakeSnapshot("R58M123", kManufacturerSamsung, kModeDebugBridge, 0x04E8, 0x6860)
		.WithDetails("SM-G930F", "8.0.0", 26, kLockStateLocked));
	devices.push_back(MakeSnapshot("usb-001-009", kManufacturerUnknown, kModeEmergencyDownload, 0x05C6, 0x9008));

	JsonDocument document;
	TEST_ASSERT(!deserializeJson(document, JsonOutput::SerializeSnapshots(devices)));

	JsonArray array = document.as<JsonArray>();
	TEST_ASSERT_EQ_INT(array.size(), 2);

	JsonObject first = array[0];
	TEST_ASSERT_EQ_STR(first["serial"].as<const char *>(), "R58M123");
	TEST_ASSERT_EQ_STR(first["vendor_id"].as<const char *>(), "04e8");
	TEST_ASSERT_EQ_STR(first["mode"].as<const char *>(), "debug-bridge");
	TEST_ASSERT_EQ_STR(first["lock_state"].as<const char *>(), "locked");
	TEST_ASSERT_EQ_STR(first["device_id"].as<const char *>(), "samsung_SM-G930F_R58M123");
	TEST_ASSERT_EQ_INT(first["api_level"].as<int>(), 26);

	JsonObject second = array[1];
	TEST_ASSERT_EQ_STR(second["manufacturer"].as<const char *>(), "unknown");
	TEST_ASSERT(second["api_level"].isNull());
	TEST_ASSERT(second["model"].isNull());
}

static void test_device_info_json()
{
	DeviceProfile profile;
	profile.manufacturer = kManufacturerGoogle;
	profile.modelName = "Pixel";
	profile.supportedMethodNames.push_back("oem_unlock");
	profile.declaredSuccessRates["oem_unlock"] = 60;
	profile.minApiLevel = 25;
	profile.maxApiLevel = 29;

	JsonDocument document;
	TEST_ASSERT(!deserializeJson(document, JsonOutput::SerializeDeviceInfo(MakeSnapshot("8XV7N18",
		kManufacturerGoogle, kModeBootLoader, 0x18D1, 0x4EE0), profile, true)));

	TEST_ASSERT(document["catalog_match"].as<bool>());
	TEST_ASSERT_EQ_STR(document["device"]["mode"].as<const char *>(), "boot-loader");
	TEST_ASSERT_EQ_STR(document["profile"]["model"].as<const char *>(), "Pixel");
	TEST_ASSERT_EQ_STR(document["profile"]["supported_methods"][0].as<const char *>(), "oem_unlock");
	TEST_ASSERT_EQ_INT(document["profile"]["method_success_rates"]["oem_unlock"].as<int>(), 60);
	TEST_ASSERT_EQ_INT(document["profile"]["max_api_level"].as<int>(), 29);
	TEST_ASSERT(!document["profile"]["generic"].as<bool>());
}

static void test_empty_session_list_json()
{
	JsonDocument document;
	TEST_ASSERT(!deserializeJson(document, JsonOutput::SerializeSessions(std::vector<BypassSession>())));
	TEST_ASSERT(document.is<JsonArray>());
	TEST_ASSERT_EQ_INT(document.as<JsonArray>().size(), 0);
}

int main()
{
	printf("=== Arguments and output ===\n");

	RUN_TEST(test_arguments_parse_long_and_short_forms);
	RUN_TEST(test_arguments_reject_bad_input);
	RUN_TEST(test_snapshot_json);
	RUN_TEST(test_device_info_json);
	RUN_TEST(test_empty_session_list_json);

	return (0);
}
