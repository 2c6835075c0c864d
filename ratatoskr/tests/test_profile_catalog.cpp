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

#include "FakeDevices.h"
#include "JsonProfileCatalog.h"
#include "MethodRegistry.h"
#include "ProfileResolver.h"

using namespace Ratatoskr;

namespace
{
	const char *catalogJson =
		"{\n"
		"  \"version\": \"2024.05\",\n"
		"  \"manufacturers\": {\n"
		"    \"samsung\": {\n"
		"      \"vendor_id\": \"04e8\",\n"
		"      \"series\": {\n"
		"        \"galaxy_s\": { \"models\": [\n"
		"          { \"name\": \"SM-G930F\", \"codename\": \"herolte\", \"product_ids\": [\"0x6860\", 26720],\n"
		"            \"android_versions\": [\"7.0\", \"8.0\"], \"api_levels\": [24, 26],\n"
		"            \"supported_methods\": [\"talkback\", \"download_reset\", \"talkback\"],\n"
		"            \"method_success_rates\": { \"talkback\": 85, \"download_reset\": 70 },\n"
		"            \"success_rate\": 80, \"frp_bypass_difficulty\": \"hard\" }\n"
		"        ] }\n"
		"      }\n"
		"    },\n"
		"    \"google\": {\n"
		"      \"vendor_id\": \"18D1\",\n"
		"      \"series\": {\n"
		"        \"pixel\": { \"models\": [\n"
		"          { \"name\": \"Pixel\", \"codename\": \"sailfish\", \"product_ids\": [\"4ee7\"],\n"
		"            \"supported_methods\": [\"oem_unlock\"], \"success_rate\": 60,\n"
		"            \"frp_bypass_difficulty\": \"legendary\" }\n"
		"        ] }\n"
		"      }\n"
		"    }\n"
		"  }\n"
		"}\n";

	const char *methodsJson =
		"{\n"
		"  \"methods\": [\n"
		"    { \"name\": \"talkback\", \"kind\": \"debug_bridge_exploit\", \"risk\": \"low\", \"base_weight\": 0.4,\n"
		"      \"steps\": [ { \"id\": \"open\", \"command\": \"shell am start -n com.android.settings/.Settings\",\n"
		"                   \"expect\": \"Starting\" },\n"
		"                 { \"command\": \"shell input keyevent 3\", \"timeout_ms\": 5000 } ] },\n"
		"    { \"name\": \"download_reset\", \"kind\": \"manufacturer_download\", \"risk\": \"high\",\n"
		"      \"manufacturers\": [\"samsung\"],\n"
		"      \"steps\": [ { \"id\": \"hello\", \"command\": \"handshake ODIN LOKE\" } ] },\n"
		"    { \"name\": \"oem_unlock\", \"kind\": \"boot_loader_manipulation\", \"risk\": \"medium\",\n"
		"      \"steps\": [ { \"id\": \"unlock\", \"command\": \"flashing unlock\" },\n"
		"                 { \"id\": \"back\", \"command\": \"shell settings get global device_provisioned\",\n"
		"                   \"mode\": \"adb\" } ] },\n"
		"    { \"name\": \"combo\", \"kind\": \"chained\", \"chain\": [\"oem_unlock\", \"download_reset\"],\n"
		"      \"base_weight\": 0.2 }\n"
		"  ],\n"
		"  \"lock_queries\": {\n"
		"    \"fastboot\": { \"command\": \"getvar unlocked\", \"locked_pattern\": \"unlocked: no\",\n"
		"                  \"unlocked_pattern\": \"unlocked: yes\" }\n"
		"  }\n"
		"}\n";
}

static void test_catalog_load_and_lookup()
{
	JsonProfileCatalog catalog;
	TEST_ASSERT(catalog.Load(catalogJson));

	TEST_ASSERT_EQ_STR(catalog.GetVersion(), "2024.05");
	TEST_ASSERT_EQ_INT(catalog.GetModelCount(), 2);
	TEST_ASSERT_NEAR(catalog.GetAverageSuccessRate(), 70.0);
	TEST_ASSERT_EQ_INT(catalog.GetManufacturerNames().size(), 2);
	TEST_ASSERT_EQ_INT(catalog.GetMethodNames().size(), 3);

	DeviceProfile profile;
	TEST_ASSERT_EQ_INT(catalog.FindProfile(0x04E8, 0x6860, "", &profile), ProfileCatalog::kProfileFound);
	TEST_ASSERT_EQ_STR(profile.modelName, "SM-G930F");
	TEST_ASSERT_EQ_STR(profile.codename, "herolte");
	TEST_ASSERT_EQ_STR(profile.series, "galaxy_s");
	TEST_ASSERT_EQ_INT(profile.manufacturer, kManufacturerSamsung);
	TEST_ASSERT_EQ_INT(profile.productIds.size(), 2);
	TEST_ASSERT_EQ_INT(profile.supportedMethodNames.size(), 2);
	TEST_ASSERT_EQ_INT(profile.GetDeclaredSuccessRate("talkback"), 85);
	TEST_ASSERT_EQ_INT(profile.GetDeclaredSuccessRate("oem_unlock"), -1);
	TEST_ASSERT_EQ_INT(profile.difficulty, kDifficultyHard);
	TEST_ASSERT_EQ_INT(profile.minApiLevel, 24);
	TEST_ASSERT_EQ_INT(profile.maxApiLevel, 26);
	TEST_ASSERT(profile.IsApiLevelCompatible(25));
	TEST_ASSERT(!profile.IsApiLevelCompatible(29));
	TEST_ASSERT(profile.IsApiLevelCompatible(DeviceSnapshot::kApiLevelUnknown));
	TEST_ASSERT(profile.IsAndroidVersionCompatible("8.0.0"));
	TEST_ASSERT(!profile.IsAndroidVersionCompatible("8.1"));
	TEST_ASSERT(!profile.generic);

	// The model name or codename identifies a device whose product id is not listed.
	TEST_ASSERT_EQ_INT(catalog.FindProfile(0x18D1, 0x4EE0, "SAILFISH", &profile), ProfileCatalog::kProfileFound);
	TEST_ASSERT_EQ_STR(profile.modelName, "Pixel");
	TEST_ASSERT_EQ_INT(profile.difficulty, kDifficultyMedium);

	TEST_ASSERT_EQ_INT(catalog.FindProfile(0x18D1, 0x4EE0, "", &profile), ProfileCatalog::kProfileNotFound);
	TEST_ASSERT_EQ_INT(catalog.FindProfile(0x2717, 0xFF40, "unknown", &profile), ProfileCatalog::kProfileNotFound);
}

static void test_catalog_rejects_bad_documents()
{
	JsonProfileCatalog catalog;

	TEST_ASSERT(!catalog.Load("{ \"manufacturers\": "));
	TEST_ASSERT(!catalog.Load("{ \"version\": \"1\" }"));
	TEST_ASSERT(!catalog.Load("{ \"manufacturers\": { \"lg\": { \"vendor_id\": \"zz\" } } }"));
	TEST_ASSERT(!catalog.Load("{ \"manufacturers\": { \"lg\": { \"vendor_id\": \"1004\", \"series\": { \"g\": { "
		"\"models\": [ { \"name\": \"G6\", \"method_success_rates\": { \"x\": 140 } } ] } } } } }"));
	TEST_ASSERT(!catalog.LoadFile("/nonexistent/catalog.json"));
}

static void test_registry_loads_methods()
{
	MethodRegistry registry;
	TEST_ASSERT(registry.Load(methodsJson));
	TEST_ASSERT_EQ_INT(registry.GetDescriptors().size(), 4);

	const BypassMethodDescriptor *talkback = registry.Find("talkback");
	TEST_ASSERT(talkback != nullptr);
	TEST_ASSERT_EQ_INT(talkback->requiredMode, kModeDebugBridge);
	TEST_ASSERT_EQ_INT(talkback->risk, kRiskLow);
	TEST_ASSERT_NEAR(talkback->baseWeight, 0.4);
	TEST_ASSERT_EQ_INT(talkback->steps.size(), 2);
	TEST_ASSERT_EQ_STR(talkback->steps[0].expect, "Starting");
	TEST_ASSERT_EQ_STR(talkback->steps[1].id, "step2");
	TEST_ASSERT_EQ_INT(talkback->steps[1].timeoutMs, 5000);
	TEST_ASSERT(talkback->SupportsManufacturer(kManufacturerXiaomi));

	const BypassMethodDescriptor *download = registry.Find("download_reset");
	TEST_ASSERT_EQ_INT(download->requiredMode, kModeManufacturerDownload);
	TEST_ASSERT(download->SupportsManufacturer(kManufacturerSamsung));
	TEST_ASSERT(!download->SupportsManufacturer(kManufacturerLG));
	TEST_ASSERT_NEAR(download->baseWeight, 0.5);

	const BypassMethodDescriptor *unlock = registry.Find("oem_unlock");
	TEST_ASSERT_EQ_INT(unlock->steps[0].mode, kModeBootLoader);
	TEST_ASSERT_EQ_INT(unlock->steps[1].mode, kModeDebugBridge);

	const BypassMethodDescriptor *combo = registry.Find("combo");
	TEST_ASSERT_EQ_INT(combo->kind, kMethodChained);
	TEST_ASSERT_EQ_INT(combo->requiredMode, kModeBootLoader);
	TEST_ASSERT_EQ_INT(combo->risk, kRiskHigh);
	TEST_ASSERT_EQ_INT(combo->steps.size(), 3);
	TEST_ASSERT_EQ_STR(combo->steps[0].id, "oem_unlock/unlock");
	TEST_ASSERT_EQ_STR(combo->steps[2].id, "download_reset/hello");
	TEST_ASSERT_EQ_INT(combo->steps[2].mode, kModeManufacturerDownload);
	TEST_ASSERT_EQ_INT(combo->declarationIndex, 3);

	TEST_ASSERT_EQ_STR(registry.GetLockQuery(kModeBootLoader).command, "getvar unlocked");
	TEST_ASSERT_EQ_STR(registry.GetLockQuery(kModeDebugBridge).command, "shell dumpsys account");
	TEST_ASSERT(!registry.GetLockQuery(kModeEmergencyDownload).IsDefined());

	TEST_ASSERT(registry.Find("missing") == nullptr);
}

static void test_registry_rejects_invalid_methods()
{
	MethodRegistry registry;

	BypassMethodDescriptor empty;
	empty.name = "empty";
	TEST_ASSERT(!registry.Register(empty));

	BypassMethodDescriptor valid;
	valid.name = "valid";
	valid.steps.push_back(MethodStep("a", "shell true", kModeDebugBridge));
	TEST_ASSERT(registry.Register(valid));
	TEST_ASSERT(!registry.Register(valid));

	BypassMethodDescriptor heavy = valid;
	heavy.name = "heavy";
	heavy.baseWeight = 1.5;
	TEST_ASSERT(!registry.Register(heavy));

	BypassMethodDescriptor blank = valid;
	blank.name = "blank";
	blank.steps[0].command = "";
	TEST_ASSERT(!registry.Register(blank));

	std::vector<std::string> links;
	links.push_back("valid");
	links.push_back("undeclared");
	TEST_ASSERT(!registry.RegisterChain("broken", links, 0.5, std::vector<Manufacturer>()));
	TEST_ASSERT(!registry.RegisterChain("nothing", std::vector<std::string>(), 0.5, std::vector<Manufacturer>()));

	TEST_ASSERT(!registry.Load("{ \"methods\": [ { \"name\": \"x\", \"kind\": \"magic\", \"steps\": [] } ] }"));
	TEST_ASSERT(!registry.Load("{ \"methods\": [], \"lock_queries\": { \"sideways\": { \"command\": \"x\" } } }"));
	TEST_ASSERT(!registry.Load("not json"));

	TEST_ASSERT_EQ_INT(registry.GetDescriptors().size(), 1);
}

static void test_resolver_generic_profile()
{
	MethodRegistry registry;
	TEST_ASSERT(registry.Load(methodsJson));

	JsonProfileCatalog catalog;
	TEST_ASSERT(catalog.Load(catalogJson));

	ProfileResolver resolver(&catalog, &registry);
	DeviceProfile profile;

	TEST_ASSERT(resolver.Resolve(MakeSnapshot("A", kManufacturerSamsung, kModeDebugBridge, 0x04E8, 0x6860), &profile));
	TEST_ASSERT_EQ_STR(profile.modelName, "SM-G930F");

	// Unknown product in boot-loader mode: oem_unlock (medium) and combo (high) are native, only the lower stays.
	TEST_ASSERT(!resolver.Resolve(MakeSnapshot("B", kManufacturerXiaomi, kModeBootLoader, 0x2717, 0x1234), &profile));
	TEST_ASSERT(profile.generic);
	TEST_ASSERT_EQ_INT(profile.supportedMethodNames.size(), 1);
	TEST_ASSERT_EQ_STR(profile.supportedMethodNames[0], "oem_unlock");
	TEST_ASSERT(profile.declaredSuccessRates.empty());

	// Manufacturer restrictions apply to the generic profile.
	DeviceProfile download = ProfileResolver::BuildGenericProfile(MakeSnapshot("C", kManufacturerLG,
		kModeManufacturerDownload, 0x1004, 0x6000), registry);
	TEST_ASSERT(download.supportedMethodNames.empty());

	ProfileResolver withoutCatalog(nullptr, &registry);
	TEST_ASSERT(!withoutCatalog.Resolve(MakeSnapshot("A", kManufacturerSamsung, kModeDebugBridge, 0x04E8, 0x6860),
		&profile));
	TEST_ASSERT_EQ_INT(profile.supportedMethodNames.size(), 1);
	TEST_ASSERT_EQ_STR(profile.supportedMethodNames[0], "talkback");
}

static void test_tier_names()
{
	RiskTier risk;
	TEST_ASSERT(ParseRiskTier("very_high", &risk));
	TEST_ASSERT_EQ_INT(risk, kRiskVeryHigh);
	TEST_ASSERT_EQ_STR(GetRiskTierName(kRiskLow), "low");
	TEST_ASSERT(!ParseRiskTier("extreme", &risk));

	DifficultyTier difficulty;
	TEST_ASSERT(ParseDifficultyTier("extremely_hard", &difficulty));
	TEST_ASSERT_EQ_INT(difficulty, kDifficultyExtremelyHard);

	MethodKind kind;
	TEST_ASSERT(ParseMethodKind("emergency_download", &kind));
	TEST_ASSERT_EQ_INT(GetMethodKindMode(kind), kModeEmergencyDownload);
	TEST_ASSERT_EQ_STR(GetMethodKindName(kMethodChained), "chained");
}

int main()
{
	printf("=== Profiles and methods ===\n");

	RUN_TEST(test_catalog_load_and_lookup);
	RUN_TEST(test_catalog_rejects_bad_documents);
	RUN_TEST(test_registry_loads_methods);
	RUN_TEST(test_registry_rejects_invalid_methods);
	RUN_TEST(test_resolver_generic_profile);
	RUN_TEST(test_tier_names);

	return (0);
}
