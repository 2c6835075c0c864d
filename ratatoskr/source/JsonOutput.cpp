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

// C Standard Library
#include <stdio.h>

// Ratatoskr
#include "JsonOutput.h"
#include "Timing.h"

using namespace Ratatoskr;

namespace
{
	std::string FormatId(int id)
	{
		char text[8];
		snprintf(text, sizeof(text), "%04x", id & 0xFFFF);

		return (text);
	}
}

namespace Ratatoskr
{
	namespace JsonOutput
	{
		void WriteSnapshot(JsonObject object, const DeviceSnapshot& device)
		{
			object["serial"] = device.GetSerial();
			object["device_id"] = device.GetDeviceId();
			object["vendor_id"] = FormatId(device.GetVendorId());
			object["product_id"] = FormatId(device.GetProductId());
			object["manufacturer"] = GetManufacturerName(device.GetManufacturer());
			object["mode"] = GetModeName(device.GetMode());
			object["lock_state"] = GetLockStateName(device.GetLockState());

			if (!device.GetModelName().empty())
				object["model"] = device.GetModelName();

			if (device.HasAndroidVersion())
				object["android_version"] = device.GetAndroidVersion();

			if (device.HasApiLevel())
				object["api_level"] = device.GetApiLevel();

			object["bus"] = device.GetBusNumber();
			object["address"] = device.GetDeviceAddress();

			if (!device.GetPortPath().empty())
				object["port"] = device.GetPortPath();

			object["detected_at"] = Timing::FormatTimestamp(device.GetDetectedAt());
		}

		void WriteProfile(JsonObject object, const DeviceProfile& profile)
		{
			object["manufacturer"] = GetManufacturerName(profile.manufacturer);
			object["model"] = profile.modelName;

			if (!profile.codename.empty())
				object["codename"] = profile.codename;

			if (!profile.series.empty())
				object["series"] = profile.series;

			object["generic"] = profile.generic;
			object["difficulty"] = GetDifficultyTierName(profile.difficulty);
			object["success_rate"] = profile.overallSuccessRate;

			JsonArray methods = object["supported_methods"].to<JsonArray>();
			for (size_t i = 0; i < profile.supportedMethodNames.size(); i++)
				methods.add(profile.supportedMethodNames[i]);

			JsonObject rates = object["method_success_rates"].to<JsonObject>();
			for (std::map<std::string, int>::const_iterator rate = profile.declaredSuccessRates.begin();
				rate != profile.declaredSuccessRates.end(); ++rate)
			{
				rates[rate->first] = rate->second;
			}

			JsonArray versions = object["android_versions"].to<JsonArray>();
			for (size_t i = 0; i < profile.androidVersions.size(); i++)
				versions.add(profile.androidVersions[i]);

			if (profile.minApiLevel != DeviceProfile::kApiLevelUnbounded)
				object["min_api_level"] = profile.minApiLevel;

			if (profile.maxApiLevel != DeviceProfile::kApiLevelUnbounded)
				object["max_api_level"] = profile.maxApiLevel;
		}

		void WriteSession(JsonObject object, const BypassSession& session)
		{
			object["session_id"] = session.GetSessionId();
			object["device_serial"] = session.GetDeviceSerial();
			object["dry_run"] = session.IsDryRun();
			object["started_at"] = Timing::FormatTimestamp(session.GetStartedAt());

			if (session.IsClosed())
				object["ended_at"] = Timing::FormatTimestamp(session.GetEndedAt());

			object["final_status"] = GetSessionStatusName(session.GetFinalStatus());
			object["summary"] = session.GetSummary();

			if (!session.GetLastError().empty())
				object["last_error"] = session.GetLastError();

			WriteSnapshot(object["device"].to<JsonObject>(), session.GetDevice());

			JsonArray plan = object["plan"].to<JsonArray>();
			for (size_t i = 0; i < session.GetPlan().size(); i++)
			{
				const PlanEntry& entry = session.GetPlan()[i];

				JsonObject planObject = plan.add<JsonObject>();
				planObject["method"] = entry.methodName;
				planObject["weight"] = entry.weight;
				planObject["risk"] = GetRiskTierName(entry.risk);
				planObject["required_mode"] = GetModeName(entry.requiredMode);
				planObject["requires_mode_switch"] = entry.requiresModeSwitch;
				planObject["status"] = GetAttemptStatusName(entry.status);

				if (session.IsDryRun())
				{
					planObject["applicable"] = entry.applicable;
					planObject["verdict"] = entry.verdict;
				}
			}

			JsonArray attempts = object["attempts"].to<JsonArray>();
			for (size_t i = 0; i < session.GetAttempts().size(); i++)
			{
				const BypassAttempt& attempt = session.GetAttempts()[i];

				JsonObject attemptObject = attempts.add<JsonObject>();
				attemptObject["method"] = attempt.GetMethodName();
				attemptObject["status"] = GetAttemptStatusName(attempt.GetStatus());
				attemptObject["retry"] = attempt.IsRetry();
				attemptObject["execution_duration_ms"] = attempt.GetExecutionDurationMs();

				if (attempt.HasError())
					attemptObject["error"] = attempt.GetErrorMessage();

				if (attempt.GetErrorClass() != kErrorNone)
					attemptObject["error_class"] = GetErrorClassName(attempt.GetErrorClass());

				JsonArray steps = attemptObject["completed_steps"].to<JsonArray>();
				for (size_t j = 0; j < attempt.GetCompletedSteps().size(); j++)
					steps.add(attempt.GetCompletedSteps()[j]);

				JsonArray log = attemptObject["log"].to<JsonArray>();
				for (size_t j = 0; j < attempt.GetLogEntries().size(); j++)
				{
					const LogEntry& entry = attempt.GetLogEntries()[j];

					JsonObject logObject = log.add<JsonObject>();
					logObject["timestamp"] = Timing::FormatTimestamp(entry.timestamp);
					logObject["message"] = entry.message;
				}
			}
		}

		std::string SerializeSnapshots(const std::vector<DeviceSnapshot>& devices)
		{
			JsonDocument document;
			JsonArray array = document.to<JsonArray>();

			for (size_t i = 0; i < devices.size(); i++)
				WriteSnapshot(array.add<JsonObject>(), devices[i]);

			std::string text;
			serializeJsonPretty(document, text);

			return (text);
		}

		std::string SerializeDeviceInfo(const DeviceSnapshot& device, const DeviceProfile& profile, bool catalogMatch)
		{
			JsonDocument document;

			WriteSnapshot(document["device"].to<JsonObject>(), device);
			document["catalog_match"] = catalogMatch;
			WriteProfile(document["profile"].to<JsonObject>(), profile);

			std::string text;
			serializeJsonPretty(document, text);

			return (text);
		}

		std::string SerializeSessions(const std::vector<BypassSession>& sessions)
		{
			JsonDocument document;
			JsonArray array = document.to<JsonArray>();

			for (size_t i = 0; i < sessions.size(); i++)
				WriteSession(array.add<JsonObject>(), sessions[i]);

			std::string text;
			serializeJsonPretty(document, text);

			return (text);
		}
	}
}
