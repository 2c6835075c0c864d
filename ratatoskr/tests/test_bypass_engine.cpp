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

#include <thread>

#include "BypassEngine.h"
#include "FakeDevices.h"
#include "JsonOutput.h"
#include "ResultCache.h"

using namespace Ratatoskr;

namespace
{
	const char *kSerial = "R58M123";

	BypassMethodDescriptor MakeMethod(const std::string& name, DeviceMode mode, RiskTier risk)
	{
		BypassMethodDescriptor descriptor;
		descriptor.name = name;
		descriptor.kind = (mode == kModeBootLoader) ? kMethodBootLoaderManipulation : kMethodDebugBridgeExploit;
		descriptor.requiredMode = mode;
		descriptor.risk = risk;
		descriptor.steps.push_back(MethodStep("run", "shell " + name + "-step", mode));

		return (descriptor);
	}

	class RecordingObserver : public SessionObserver
	{
		public:

			std::vector<TransitionEvent> events;

			// Cancels the token once any attempt reaches this status.
			CancelToken *cancelToken;
			AttemptStatus cancelOn;

			RecordingObserver() :
				cancelToken(nullptr),
				cancelOn(kAttemptPending)
			{
			}

			void OnTransition(const TransitionEvent& event)
			{
				events.push_back(event);

				if (cancelToken && event.toStatus == cancelOn)
					cancelToken->Cancel();
			}
	};

	// Samsung device in debug-bridge mode with a catalog profile declaring M1 at 90% and M2 at 60%.
	struct EngineFixture
	{
		FakeDeviceScript script;
		FakeChannelFactory factory;
		FakeLocator locator;
		CommunicationManager manager;

		MethodRegistry registry;
		FakeProfileCatalog catalog;
		ProfileResolver resolver;
		StaticAuthorizer authorizer;
		RecordingAuditSink auditSink;

		EngineConfig config;
		DeviceSnapshot device;

		EngineFixture() :
			manager(&factory, &locator),
			resolver(&catalog, &registry),
			device(MakeSnapshot(kSerial, kManufacturerSamsung, kModeDebugBridge, 0x04E8, 0x6860)
				.WithDetails("SM-G930F", "8.0.0", 26, kLockStateLocked))
		{
			factory.scripts[kSerial] = &script;
			locator.Add(device);

			TEST_ASSERT(registry.Register(MakeMethod("M1", kModeDebugBridge, kRiskLow)));
			TEST_ASSERT(registry.Register(MakeMethod("M2", kModeDebugBridge, kRiskMedium)));

			DeviceProfile profile;
			profile.manufacturer = kManufacturerSamsung;
			profile.modelName = "SM-G930F";
			profile.vendorId = 0x04E8;
			profile.productIds.push_back(0x6860);
			profile.supportedMethodNames.push_back("M2");
			profile.supportedMethodNames.push_back("M1");
			profile.declaredSuccessRates["M1"] = 90;
			profile.declaredSuccessRates["M2"] = 60;
			catalog.profiles.push_back(profile);

			config.commandTimeoutMs = 1000;
			config.acquireTimeoutMs = 2000;
			config.modeSwitchTimeoutMs = 1000;
		}

		void PushLockAnswer(bool locked)
		{
			script.Push("shell dumpsys account", MakeResult(kCommandSucceeded, locked
				? "Accounts: 1\n  Account {name=someone@gmail.com, type=com.google}\n" : "Accounts: 0\n"));
		}

		int Run(BypassEngine *engine, BypassSession *session, bool dryRun = false, SessionObserver *observer = nullptr,
			CancelToken *cancelToken = nullptr)
		{
			BypassRequest request;
			request.device = device;
			request.dryRun = dryRun;
			request.observer = observer;
			request.cancelToken = cancelToken;

			return (engine->Run(request, session));
		}
	};
}

static void test_failed_verification_moves_to_next_method()
{
	EngineFixture fixture;
	fixture.PushLockAnswer(true);
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &session), BypassEngine::kRunCompleted);

	TEST_ASSERT_EQ_INT(session.GetPlan().size(), 2);
	TEST_ASSERT_EQ_STR(session.GetPlan()[0].methodName, "M1");
	TEST_ASSERT_EQ_STR(session.GetPlan()[1].methodName, "M2");
	TEST_ASSERT_NEAR(session.GetPlan()[0].weight, 0.9);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 2);

	const BypassAttempt& first = session.GetAttempts()[0];
	TEST_ASSERT_EQ_STR(first.GetMethodName(), "M1");
	TEST_ASSERT_EQ_INT(first.GetStatus(), kAttemptFailed);
	TEST_ASSERT_EQ_STR(first.GetErrorMessage(), "procedure completed but the lock persists");
	TEST_ASSERT_EQ_INT(first.GetCompletedSteps().size(), 1);
	TEST_ASSERT(first.HasLogEntryContaining("executing -> verifying"));

	const BypassAttempt& second = session.GetAttempts()[1];
	TEST_ASSERT_EQ_STR(second.GetMethodName(), "M2");
	TEST_ASSERT_EQ_INT(second.GetStatus(), kAttemptSuccess);
	TEST_ASSERT(!second.IsRetry());

	TEST_ASSERT_EQ_INT(session.GetPlan()[0].status, kAttemptFailed);
	TEST_ASSERT_EQ_INT(session.GetPlan()[1].status, kAttemptSuccess);
	TEST_ASSERT(session.IsClosed());
	TEST_ASSERT(session.GetEndedAt() >= session.GetStartedAt());
	TEST_ASSERT(session.GetSessionId().find("session_") == 0);
	TEST_ASSERT(session.GetSessionId().find(kSerial) != std::string::npos);

	// Four transitions per attempt plus the session close.
	TEST_ASSERT_EQ_INT(fixture.auditSink.records.size(), 9);
	TEST_ASSERT_EQ_STR(fixture.auditSink.records.back().toState, "success");
	TEST_ASSERT(fixture.auditSink.records.back().methodName.empty());
	TEST_ASSERT(!fixture.manager.IsHeld(kSerial));
}

static void test_unknown_device_uses_generic_profile()
{
	EngineFixture fixture;
	fixture.device = MakeSnapshot(kSerial, kManufacturerSamsung, kModeDebugBridge, 0x04E8, 0x1234);
	TEST_ASSERT(fixture.registry.Register(MakeMethod("M3", kModeBootLoader, kRiskVeryLow)));
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &session, true), BypassEngine::kRunCompleted);

	// M3 is lower risk but not native to debug-bridge mode; M2 is native but riskier than M1.
	TEST_ASSERT_EQ_INT(session.GetPlan().size(), 1);
	TEST_ASSERT_EQ_STR(session.GetPlan()[0].methodName, "M1");
	TEST_ASSERT_NEAR(session.GetPlan()[0].weight, 0.5);
	TEST_ASSERT(!session.GetPlan()[0].requiresModeSwitch);
}

static void test_dry_run_reports_switch_without_attempts()
{
	EngineFixture fixture;

	fixture.device = MakeSnapshot("8XV7N18", kManufacturerGoogle, kModeDebugBridge, 0x18D1, 0x4EE7);
	fixture.factory.scripts["8XV7N18"] = &fixture.script;
	fixture.locator.Add(fixture.device);

	TEST_ASSERT(fixture.registry.Register(MakeMethod("M3", kModeBootLoader, kRiskVeryLow)));

	DeviceProfile profile;
	profile.manufacturer = kManufacturerGoogle;
	profile.vendorId = 0x18D1;
	profile.productIds.push_back(0x4EE7);
	profile.supportedMethodNames.push_back("M1");
	profile.supportedMethodNames.push_back("M3");
	profile.declaredSuccessRates["M1"] = 60;
	profile.declaredSuccessRates["M3"] = 100;
	fixture.catalog.profiles.push_back(profile);

	RecordingObserver observer;
	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &session, true, &observer), BypassEngine::kRunCompleted);

	TEST_ASSERT(session.IsDryRun());
	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionPlanned);
	TEST_ASSERT(session.GetAttempts().empty());
	TEST_ASSERT_EQ_INT(session.GetPlan().size(), 2);

	const PlanEntry& top = session.GetPlan()[0];
	TEST_ASSERT_EQ_STR(top.methodName, "M3");
	TEST_ASSERT_NEAR(top.weight, 0.75);
	TEST_ASSERT(top.requiresModeSwitch);
	TEST_ASSERT(top.applicable);
	TEST_ASSERT_EQ_STR(top.verdict, "requires switch from debug-bridge to boot-loader mode");
	TEST_ASSERT_EQ_STR(session.GetPlan()[1].verdict, "ready");

	for (size_t i = 0; i < session.GetPlan().size(); i++)
		TEST_ASSERT_EQ_INT(session.GetPlan()[i].status, kAttemptPreparing);

	// Nothing beyond Preparing reached the device or the observer.
	TEST_ASSERT(fixture.script.switchRequests.empty());
	TEST_ASSERT(fixture.script.executed.empty());
	TEST_ASSERT_EQ_INT(observer.events.size(), 2);

	for (size_t i = 0; i < observer.events.size(); i++)
	{
		TEST_ASSERT(observer.events[i].dryRun);
		TEST_ASSERT_EQ_INT(observer.events[i].toStatus, kAttemptPreparing);
	}

	TEST_ASSERT_EQ_INT(engine.GetStatistics().planned, 1);

	std::vector<BypassSession> sessions(1, session);
	JsonDocument document;
	TEST_ASSERT(!deserializeJson(document, JsonOutput::SerializeSessions(sessions)));
	TEST_ASSERT_EQ_STR(document[0]["final_status"].as<const char *>(), "planned");
	TEST_ASSERT_EQ_STR(document[0]["plan"][0]["verdict"].as<const char *>(), top.verdict);
	TEST_ASSERT_EQ_INT(document[0]["attempts"].size(), 0);
}

static void test_disconnect_during_execution_aborts()
{
	EngineFixture fixture;
	fixture.script.Push("shell M1-step", MakeResult(kCommandDeviceDisconnected, "", "error: device 'R58M123' not found"));

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &session), BypassEngine::kRunCompleted);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 1);
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetStatus(), kAttemptError);
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetErrorClass(), kErrorDeviceDisconnected);
	TEST_ASSERT(session.GetLastError().find("device-disconnected in M1") == 0);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M2-step"), 0);
	TEST_ASSERT_EQ_INT(session.GetPlan()[1].status, kAttemptPending);
}

static void test_timeout_is_retried_once()
{
	EngineFixture fixture;
	fixture.script.Push("shell M1-step", MakeResult(kCommandTimedOut, "", "timed out"));
	fixture.PushLockAnswer(false);

	RecordingObserver observer;
	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session, false, &observer);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 2);
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetErrorClass(), kErrorTimeout);
	TEST_ASSERT(!session.GetAttempts()[0].IsRetry());
	TEST_ASSERT(session.GetAttempts()[1].IsRetry());
	TEST_ASSERT_EQ_STR(session.GetAttempts()[1].GetMethodName(), "M1");
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M1-step"), 2);
	TEST_ASSERT(observer.events.back().retry);
}

static void test_second_timeout_aborts()
{
	EngineFixture fixture;
	fixture.script.Push("shell M1-step", MakeResult(kCommandTimedOut, "", "timed out"));
	fixture.script.Push("shell M1-step", MakeResult(kCommandTimedOut, "", "timed out again"));

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 2);
	TEST_ASSERT(session.GetLastError().find("communication-timeout in M1") == 0);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M2-step"), 0);
}

static void test_channel_loss_during_execution_is_not_retried()
{
	EngineFixture fixture;
	fixture.script.Push("shell M1-step", MakeResult(kCommandChannelUnavailable, "", "no transport"));

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 1);
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetStatus(), kAttemptError);
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetErrorClass(), kErrorChannelUnavailable);
	TEST_ASSERT(!session.GetAttempts()[0].IsRetry());
	TEST_ASSERT(session.GetLastError().find("channel-unavailable in M1") == 0);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M1-step"), 1);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M2-step"), 0);
}

static void test_unexpected_state_during_verification_is_not_retried()
{
	EngineFixture fixture;
	fixture.script.Push("shell dumpsys account", MakeResult(kCommandUnexpectedState, "", "device offline"));

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 1);

	const BypassAttempt& attempt = session.GetAttempts()[0];
	TEST_ASSERT_EQ_INT(attempt.GetStatus(), kAttemptError);
	TEST_ASSERT_EQ_INT(attempt.GetErrorClass(), kErrorUnexpectedState);
	TEST_ASSERT(!attempt.IsRetry());
	TEST_ASSERT_EQ_INT(attempt.GetCompletedSteps().size(), 1);
	TEST_ASSERT(attempt.HasLogEntryContaining("executing -> verifying"));

	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M1-step"), 1);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M2-step"), 0);
	TEST_ASSERT_EQ_INT(session.GetPlan()[1].status, kAttemptPending);
}

static void test_failed_retry_moves_to_next_method()
{
	EngineFixture fixture;
	fixture.script.Push("shell M1-step", MakeResult(kCommandTimedOut, "", "timed out"));
	fixture.PushLockAnswer(true);
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 3);

	TEST_ASSERT_EQ_STR(session.GetAttempts()[0].GetMethodName(), "M1");
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetStatus(), kAttemptError);
	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetErrorClass(), kErrorTimeout);
	TEST_ASSERT(!session.GetAttempts()[0].IsRetry());

	TEST_ASSERT_EQ_STR(session.GetAttempts()[1].GetMethodName(), "M1");
	TEST_ASSERT_EQ_INT(session.GetAttempts()[1].GetStatus(), kAttemptFailed);
	TEST_ASSERT(session.GetAttempts()[1].IsRetry());

	TEST_ASSERT_EQ_STR(session.GetAttempts()[2].GetMethodName(), "M2");
	TEST_ASSERT_EQ_INT(session.GetAttempts()[2].GetStatus(), kAttemptSuccess);
	TEST_ASSERT(!session.GetAttempts()[2].IsRetry());

	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M1-step"), 2);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M2-step"), 1);
}

static void test_exhausted_summary_mentions_timeout_retry()
{
	EngineFixture fixture;
	fixture.script.Push("shell M1-step", MakeResult(kCommandTimedOut, "", "timed out"));
	fixture.PushLockAnswer(true);
	fixture.PushLockAnswer(true);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionExhaustedAllMethods);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 3);
	TEST_ASSERT(session.GetSummary().find("2 methods failed, 1 of them after a timeout retry") != std::string::npos);
}

static void test_authorization_denied()
{
	EngineFixture fixture;
	fixture.authorizer.allowAll = false;

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &session), BypassEngine::kRunAuthorizationDenied);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_STR(session.GetSummary(), "aborted: authorization denied");
	TEST_ASSERT(session.GetAttempts().empty());
	TEST_ASSERT(session.GetPlan().empty());
	TEST_ASSERT_EQ_INT(fixture.factory.created.load(), 0);
	TEST_ASSERT_EQ_INT(fixture.catalog.lookups, 0);
	TEST_ASSERT_EQ_INT(fixture.auditSink.CountTransitionsTo("authorization-denied"), 1);
	TEST_ASSERT_EQ_INT(engine.GetStatistics().denied, 1);

	fixture.authorizer.serials.insert(kSerial);
	fixture.PushLockAnswer(false);
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &session), BypassEngine::kRunCompleted);
	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
}

static void test_cancel_between_attempts()
{
	EngineFixture fixture;
	fixture.PushLockAnswer(true);

	CancelToken cancelToken;
	RecordingObserver observer;
	observer.cancelToken = &cancelToken;
	observer.cancelOn = kAttemptFailed;

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session, false, &observer, &cancelToken);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_STR(session.GetLastError(), "cancelled by user");
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 1);
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M2-step"), 0);

	// Already cancelled before the first attempt.
	BypassSession second;
	fixture.Run(&engine, &second, false, nullptr, &cancelToken);
	TEST_ASSERT_EQ_INT(second.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT(second.GetAttempts().empty());
}

static void test_probe_failure_fails_in_preparing()
{
	EngineFixture fixture;
	fixture.script.probeResult = MakeResult(kCommandFailed, "unauthorized\n");

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionExhaustedAllMethods);
	TEST_ASSERT_EQ_INT(session.GetAttempts().size(), 2);

	for (size_t i = 0; i < session.GetAttempts().size(); i++)
	{
		const BypassAttempt& attempt = session.GetAttempts()[i];

		TEST_ASSERT_EQ_INT(attempt.GetStatus(), kAttemptFailed);
		TEST_ASSERT(!attempt.HasLogEntryContaining("executing"));
		TEST_ASSERT(attempt.GetCompletedSteps().empty());
	}

	TEST_ASSERT(fixture.script.executed.empty());
	TEST_ASSERT_EQ_INT(fixture.auditSink.CountTransitionsTo("executing"), 0);
}

static void test_manufacturer_mismatch_fails_in_preparing()
{
	EngineFixture fixture;

	BypassMethodDescriptor lgOnly = MakeMethod("LG1", kModeDebugBridge, kRiskVeryLow);
	lgOnly.manufacturers.push_back(kManufacturerLG);
	TEST_ASSERT(fixture.registry.Register(lgOnly));

	fixture.catalog.profiles[0].supportedMethodNames.push_back("LG1");
	fixture.catalog.profiles[0].declaredSuccessRates["LG1"] = 99;
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_STR(session.GetAttempts()[0].GetMethodName(), "LG1");
	TEST_ASSERT_EQ_STR(session.GetAttempts()[0].GetErrorMessage(), "method does not apply to samsung devices");
	TEST_ASSERT_EQ_STR(session.GetAttempts()[1].GetMethodName(), "M1");
}

static void test_expected_text_missing_fails_attempt()
{
	EngineFixture fixture;

	BypassMethodDescriptor expecting = MakeMethod("E1", kModeDebugBridge, kRiskLow);
	expecting.steps[0].expect = "Success";
	TEST_ASSERT(fixture.registry.Register(expecting));
	fixture.catalog.profiles[0].supportedMethodNames.push_back("E1");
	fixture.catalog.profiles[0].declaredSuccessRates["E1"] = 95;

	fixture.script.Push("shell E1-step", MakeResult(kCommandSucceeded, "Failure [DELETE_FAILED]\n"));
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetAttempts()[0].GetStatus(), kAttemptFailed);
	TEST_ASSERT_EQ_STR(session.GetAttempts()[0].GetErrorMessage(), "step run did not report \"Success\"");
	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
}

static void test_mode_switch_before_method()
{
	EngineFixture fixture;

	fixture.device = MakeSnapshot("8XV7N18", kManufacturerGoogle, kModeDebugBridge, 0x18D1, 0x4EE7);
	fixture.factory.scripts["8XV7N18"] = &fixture.script;
	fixture.locator.Add(fixture.device);

	TEST_ASSERT(fixture.registry.Register(MakeMethod("M3", kModeBootLoader, kRiskVeryLow)));

	LockQuery bootLoaderQuery;
	bootLoaderQuery.command = "getvar unlocked";
	bootLoaderQuery.lockedPattern = "unlocked: no";
	bootLoaderQuery.unlockedPattern = "unlocked: yes";
	fixture.registry.SetLockQuery(kModeBootLoader, bootLoaderQuery);
	fixture.script.Push("getvar unlocked", MakeResult(kCommandSucceeded, "", "unlocked: yes\n"));

	DeviceProfile profile;
	profile.manufacturer = kManufacturerGoogle;
	profile.vendorId = 0x18D1;
	profile.productIds.push_back(0x4EE7);
	profile.supportedMethodNames.push_back("M3");
	fixture.catalog.profiles.push_back(profile);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_INT(fixture.script.switchRequests.size(), 1);
	TEST_ASSERT_EQ_INT(fixture.script.switchRequests[0], kModeBootLoader);
	TEST_ASSERT(session.GetAttempts()[0].HasLogEntryContaining("switching from debug-bridge to boot-loader mode"));

	// Re-enumeration that never happens is fatal.
	fixture.locator.absentSerials.insert("8XV7N18");

	BypassSession lost;
	fixture.Run(&engine, &lost);

	TEST_ASSERT_EQ_INT(lost.GetFinalStatus(), kSessionAborted);
	TEST_ASSERT_EQ_INT(lost.GetAttempts()[0].GetErrorClass(), kErrorDeviceDisconnected);
}

static void test_audit_failure_does_not_stop_session()
{
	EngineFixture fixture;
	fixture.auditSink.failing = true;
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_INT(fixture.auditSink.records.size(), 5);
}

static void test_cache_boost_reorders_plan()
{
	EngineFixture fixture;
	fixture.catalog.profiles[0].declaredSuccessRates["M1"] = 62;
	fixture.catalog.profiles[0].declaredSuccessRates["M2"] = 60;

	MemoryResultCache cache(3600);
	cache.Store(kSerial, "M2", kAttemptSuccess);
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, &cache);

	BypassSession session;
	fixture.Run(&engine, &session);

	TEST_ASSERT_EQ_STR(session.GetPlan()[0].methodName, "M2");
	TEST_ASSERT_NEAR(session.GetPlan()[0].weight, 0.65);
	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionSuccess);

	AttemptStatus cached;
	TEST_ASSERT(cache.Lookup(kSerial, "M2", &cached));
	TEST_ASSERT_EQ_INT(cached, kAttemptSuccess);
	TEST_ASSERT(!cache.Lookup(kSerial, "M1", &cached));
}

static void test_unknown_method_and_no_candidates()
{
	EngineFixture fixture;

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassRequest request;
	request.device = fixture.device;
	request.methodName = "does-not-exist";

	BypassSession session;
	TEST_ASSERT_EQ_INT(engine.Run(request, &session), BypassEngine::kRunUnknownMethod);
	TEST_ASSERT_EQ_INT(session.GetFinalStatus(), kSessionAborted);

	fixture.catalog.profiles[0].supportedMethodNames.clear();
	fixture.catalog.profiles[0].supportedMethodNames.push_back("unregistered");

	BypassSession empty;
	TEST_ASSERT_EQ_INT(fixture.Run(&engine, &empty), BypassEngine::kRunNoCandidates);
	TEST_ASSERT_EQ_INT(empty.GetFinalStatus(), kSessionExhaustedAllMethods);
	TEST_ASSERT_EQ_INT(fixture.factory.created.load(), 0);

	EngineStatistics statistics = engine.GetStatistics();
	TEST_ASSERT_EQ_INT(statistics.aborted, 1);
	TEST_ASSERT_EQ_INT(statistics.exhausted, 1);
	TEST_ASSERT_EQ_INT(statistics.GetTotal(), 2);
}

static void test_single_method_request()
{
	EngineFixture fixture;
	fixture.PushLockAnswer(false);

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	BypassRequest request;
	request.device = fixture.device;
	request.methodName = "M2";

	BypassSession session;
	TEST_ASSERT_EQ_INT(engine.Run(request, &session), BypassEngine::kRunCompleted);
	TEST_ASSERT_EQ_INT(session.GetPlan().size(), 1);
	TEST_ASSERT_EQ_STR(session.GetAttempts()[0].GetMethodName(), "M2");
	TEST_ASSERT_EQ_INT(fixture.script.CountExecuted("shell M1-step"), 0);
}

static void test_sessions_on_one_device_are_exclusive()
{
	EngineFixture fixture;
	fixture.script.executeDelayMs = 20;
	fixture.config.acquireTimeoutMs = 10000;

	BypassEngine engine(fixture.config, &fixture.manager, &fixture.registry, &fixture.resolver, &fixture.authorizer,
		&fixture.auditSink, nullptr);

	// Empty account listings read as unlocked, so every session succeeds on its first method.
	BypassSession first;
	BypassSession second;

	std::thread one([&fixture, &engine, &first]() { fixture.Run(&engine, &first); });
	std::thread two([&fixture, &engine, &second]() { fixture.Run(&engine, &second); });

	one.join();
	two.join();

	TEST_ASSERT_EQ_INT(first.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT_EQ_INT(second.GetFinalStatus(), kSessionSuccess);
	TEST_ASSERT(first.GetSessionId() != second.GetSessionId());
	TEST_ASSERT_EQ_INT(fixture.script.maxActiveChannels.load(), 1);
	TEST_ASSERT_EQ_INT(fixture.script.maxActiveCommands.load(), 1);
	TEST_ASSERT_EQ_INT(engine.GetStatistics().succeeded, 2);
}

int main()
{
	printf("=== Bypass engine ===\n");

	RUN_TEST(test_failed_verification_moves_to_next_method);
	RUN_TEST(test_unknown_device_uses_generic_profile);
	RUN_TEST(test_dry_run_reports_switch_without_attempts);
	RUN_TEST(test_disconnect_during_execution_aborts);
	RUN_TEST(test_timeout_is_retried_once);
	RUN_TEST(test_second_timeout_aborts);
	RUN_TEST(test_channel_loss_during_execution_is_not_retried);
	RUN_TEST(test_unexpected_state_during_verification_is_not_retried);
	RUN_TEST(test_failed_retry_moves_to_next_method);
	RUN_TEST(test_exhausted_summary_mentions_timeout_retry);
	RUN_TEST(test_authorization_denied);
	RUN_TEST(test_cancel_between_attempts);
	RUN_TEST(test_probe_failure_fails_in_preparing);
	RUN_TEST(test_manufacturer_mismatch_fails_in_preparing);
	RUN_TEST(test_expected_text_missing_fails_attempt);
	RUN_TEST(test_mode_switch_before_method);
	RUN_TEST(test_audit_failure_does_not_stop_session);
	RUN_TEST(test_cache_boost_reorders_plan);
	RUN_TEST(test_unknown_method_and_no_candidates);
	RUN_TEST(test_single_method_request);
	RUN_TEST(test_sessions_on_one_device_are_exclusive);

	return (0);
}
