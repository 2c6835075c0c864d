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
#include <stdarg.h>
#include <stdio.h>

// Ratatoskr
#include "BypassEngine.h"
#include "Interface.h"
#include "Timing.h"

using namespace Ratatoskr;

namespace
{
	std::string Format(const char *format, ...)
	{
		char buffer[512];

		va_list args;
		va_start(args, format);
		vsnprintf(buffer, sizeof(buffer), format, args);
		va_end(args);

		return (buffer);
	}

	std::string FirstLine(const std::string& text)
	{
		size_t start = text.find_first_not_of(" \t\r\n");

		if (start == std::string::npos)
			return ("");

		size_t end = text.find_first_of("\r\n", start);
		return (text.substr(start, end == std::string::npos ? std::string::npos : end - start));
	}

	std::string DescribeFailure(const CommandResult& result)
	{
		std::string detail = FirstLine(result.standardError);

		if (detail.empty())
			detail = FirstLine(result.standardOutput);

		if (detail.empty())
			detail = GetCommandStatusName(result.status);

		return (detail);
	}

	bool IsCancelled(const BypassRequest& request)
	{
		return (request.cancelToken && request.cancelToken->IsCancelled());
	}
}

EngineConfig::EngineConfig() :
	commandTimeoutMs(kDefaultCommandTimeoutMs),
	acquireTimeoutMs(kDefaultAcquireTimeoutMs),
	modeSwitchTimeoutMs(kDefaultModeSwitchTimeoutMs),
	modeSwitchPenalty(0.75),
	cacheSuccessBoost(0.05),
	cacheTtlSeconds(kDefaultCacheTtlSeconds)
{
}

BypassRequest::BypassRequest() :
	dryRun(false),
	observer(nullptr),
	cancelToken(nullptr)
{
}

EngineStatistics::EngineStatistics() :
	succeeded(0),
	exhausted(0),
	aborted(0),
	planned(0),
	denied(0)
{
}

BypassEngine::BypassEngine(const EngineConfig& config, CommunicationManager *communicationManager,
	const MethodRegistry *registry, ProfileResolver *profileResolver, Authorizer *authorizer, AuditSink *auditSink,
	ResultCache *resultCache) :
	config(config),
	communicationManager(communicationManager),
	registry(registry),
	profileResolver(profileResolver),
	authorizer(authorizer),
	auditSink(auditSink),
	resultCache(resultCache),
	planner(config.modeSwitchPenalty, config.cacheSuccessBoost, resultCache),
	sessionCounter(0)
{
}

std::string BypassEngine::NextSessionId(const DeviceSnapshot& device)
{
	unsigned int sequence = ++sessionCounter;

	return (Format("session_%llu_%s_%u", static_cast<unsigned long long>(Timing::GetWallClockMs() / 1000),
		device.GetSerial().c_str(), sequence));
}

void BypassEngine::Audit(const BypassSession *session, const std::string& methodName, const std::string& fromState,
	const std::string& toState, const std::string& detail)
{
	if (!auditSink)
		return;

	AuditRecord record;
	record.timestamp = Timing::GetWallClockMs();
	record.sessionId = session->GetSessionId();
	record.deviceSerial = session->GetDeviceSerial();
	record.methodName = methodName;
	record.fromState = fromState;
	record.toState = toState;
	record.detail = detail;

	if (!auditSink->Append(record))
	{
		Interface::PrintWarning("Audit record %s -> %s for session %s was not delivered\n", fromState.c_str(),
			toState.c_str(), session->GetSessionId().c_str());
	}
}

bool BypassEngine::Transition(const BypassRequest& request, BypassSession *session, BypassAttempt *attempt,
	AttemptStatus newStatus, const std::string& detail)
{
	AttemptStatus oldStatus = attempt->GetStatus();

	if (!attempt->Transition(newStatus))
	{
		Interface::PrintError("Invalid transition %s -> %s for %s\n", GetAttemptStatusName(oldStatus),
			GetAttemptStatusName(newStatus), attempt->GetMethodName().c_str());
		return (false);
	}

	attempt->Log(std::string(GetAttemptStatusName(oldStatus)) + " -> " + GetAttemptStatusName(newStatus)
		+ (detail.empty() ? "" : ": " + detail));

	Audit(session, attempt->GetMethodName(), GetAttemptStatusName(oldStatus), GetAttemptStatusName(newStatus), detail);

	if (request.observer)
	{
		TransitionEvent event;
		event.sessionId = session->GetSessionId();
		event.deviceSerial = session->GetDeviceSerial();
		event.methodName = attempt->GetMethodName();
		event.fromStatus = oldStatus;
		event.toStatus = newStatus;
		event.detail = detail;
		event.retry = attempt->IsRetry();
		event.dryRun = session->IsDryRun();

		request.observer->OnTransition(event);
	}

	return (true);
}

void BypassEngine::Fail(const BypassRequest& request, BypassSession *session, BypassAttempt *attempt,
	const std::string& reason)
{
	attempt->errorMessage = reason;
	Transition(request, session, attempt, kAttemptFailed, reason);
}

void BypassEngine::RaiseError(const BypassRequest& request, BypassSession *session, BypassAttempt *attempt,
	CommandStatus status, const std::string& reason)
{
	attempt->errorClass = GetErrorClass(status);
	attempt->errorMessage = reason;
	Transition(request, session, attempt, kAttemptError, std::string(GetErrorClassName(attempt->errorClass)) + ": "
		+ reason);
}

bool BypassEngine::Prepare(const BypassRequest& request, const BypassMethodDescriptor& descriptor, ChannelLease *lease,
	BypassSession *session, BypassAttempt *attempt)
{
	const DeviceSnapshot& device = lease->GetSnapshot();

	if (!descriptor.SupportsManufacturer(device.GetManufacturer()))
	{
		Fail(request, session, attempt, Format("method does not apply to %s devices",
			GetManufacturerName(device.GetManufacturer())));
		return (false);
	}

	if (lease->GetMode() != descriptor.requiredMode)
	{
		if (!IsModeSwitchSupported(device.GetManufacturer(), lease->GetMode(), descriptor.requiredMode))
		{
			Fail(request, session, attempt, Format("%s mode cannot be reached from %s mode",
				GetModeName(descriptor.requiredMode), GetModeName(lease->GetMode())));
			return (false);
		}

		attempt->Log(Format("switching from %s to %s mode", GetModeName(lease->GetMode()),
			GetModeName(descriptor.requiredMode)));

		CommandStatus status = lease->SwitchMode(descriptor.requiredMode, config.commandTimeoutMs,
			config.modeSwitchTimeoutMs);

		if (status == kCommandDeviceDisconnected || status == kCommandUnexpectedState)
		{
			RaiseError(request, session, attempt, status, Format("mode switch to %s left the device %s",
				GetModeName(descriptor.requiredMode), status == kCommandDeviceDisconnected ? "missing"
				: (std::string("in ") + GetModeName(lease->GetMode()) + " mode").c_str()));
			return (false);
		}

		if (status != kCommandSucceeded)
		{
			Fail(request, session, attempt, Format("mode switch to %s failed: %s", GetModeName(descriptor.requiredMode),
				GetCommandStatusName(status)));
			return (false);
		}
	}

	CommandResult probe = lease->Probe(config.commandTimeoutMs);

	if (probe.status == kCommandDeviceDisconnected || probe.status == kCommandUnexpectedState)
	{
		RaiseError(request, session, attempt, probe.status, "connectivity probe: " + DescribeFailure(probe));
		return (false);
	}

	if (!probe.success)
	{
		Fail(request, session, attempt, "connectivity probe failed: " + DescribeFailure(probe));
		return (false);
	}

	return (true);
}

bool BypassEngine::ExecuteSteps(const BypassRequest& request, const BypassMethodDescriptor& descriptor,
	ChannelLease *lease, BypassSession *session, BypassAttempt *attempt)
{
	for (size_t i = 0; i < descriptor.steps.size(); i++)
	{
		const MethodStep& step = descriptor.steps[i];

		if (lease->GetMode() != step.mode)
		{
			CommandStatus status = lease->SwitchMode(step.mode, config.commandTimeoutMs, config.modeSwitchTimeoutMs);

			if (IsCommunicationFailure(status))
			{
				RaiseError(request, session, attempt, status, Format("switch to %s mode before step %s",
					GetModeName(step.mode), step.id.c_str()));
				return (false);
			}

			if (status != kCommandSucceeded)
			{
				Fail(request, session, attempt, Format("could not switch to %s mode before step %s",
					GetModeName(step.mode), step.id.c_str()));
				return (false);
			}
		}

		int timeoutMs = (step.timeoutMs > 0) ? step.timeoutMs : config.commandTimeoutMs;

		CommandResult result = lease->Execute(step.command, timeoutMs);

		attempt->Log(Format("step %s: %s (%u ms)", step.id.c_str(), GetCommandStatusName(result.status),
			result.durationMs));

		if (IsCommunicationFailure(result.status))
		{
			RaiseError(request, session, attempt, result.status, Format("step %s: %s", step.id.c_str(),
				DescribeFailure(result).c_str()));
			return (false);
		}

		if (!result.success)
		{
			Fail(request, session, attempt, Format("step %s failed: %s", step.id.c_str(),
				DescribeFailure(result).c_str()));
			return (false);
		}

		if (!step.expect.empty() && result.standardOutput.find(step.expect) == std::string::npos
			&& result.standardError.find(step.expect) == std::string::npos)
		{
			Fail(request, session, attempt, Format("step %s did not report \"%s\"", step.id.c_str(),
				step.expect.c_str()));
			return (false);
		}

		attempt->completedSteps.push_back(step.id);
	}

	return (true);
}

void BypassEngine::Verify(const BypassRequest& request, ChannelLease *lease, BypassSession *session,
	BypassAttempt *attempt)
{
	LockStateResult result = lease->QueryLockState(registry->GetLockQuery(lease->GetMode()), config.commandTimeoutMs);

	attempt->Log(Format("verification in %s mode: %s, lock state %s", GetModeName(lease->GetMode()),
		GetCommandStatusName(result.status), GetLockStateName(result.lockState)));

	if (IsCommunicationFailure(result.status))
	{
		RaiseError(request, session, attempt, result.status, "verification: " + result.detail);
		return;
	}

	if (result.status != kCommandSucceeded)
	{
		Fail(request, session, attempt, "verification could not read the lock state: " + result.detail);
		return;
	}

	switch (result.lockState)
	{
		case kLockStateUnlocked:
			Transition(request, session, attempt, kAttemptSuccess, "lock cleared");
			break;

		case kLockStateLocked:
			Fail(request, session, attempt, "procedure completed but the lock persists");
			break;

		default:
			Fail(request, session, attempt, "procedure completed but the lock state is unknown: " + result.detail);
			break;
	}
}

AttemptStatus BypassEngine::RunAttempt(const BypassRequest& request, const BypassMethodDescriptor& descriptor,
	bool retry, ChannelLease *lease, BypassSession *session)
{
	BypassAttempt attempt(descriptor.name, retry);

	Interface::Print("%s: %s %s\n", session->GetDeviceSerial().c_str(), retry ? "retrying" : "trying",
		descriptor.name.c_str());

	if (Transition(request, session, &attempt, kAttemptPreparing, retry ? "retry after communication timeout" : ""))
	{
		uint64_t executionStarted = 0;

		if (Prepare(request, descriptor, lease, session, &attempt)
			&& Transition(request, session, &attempt, kAttemptExecuting, Format("%u steps",
				static_cast<unsigned int>(descriptor.steps.size()))))
		{
			executionStarted = Timing::GetMonotonicMs();

			bool executed = ExecuteSteps(request, descriptor, lease, session, &attempt);

			attempt.executionDurationMs = static_cast<unsigned int>(Timing::GetMonotonicMs() - executionStarted);

			if (executed && Transition(request, session, &attempt, kAttemptVerifying, ""))
				Verify(request, lease, session, &attempt);
		}
	}

	AttemptStatus outcome = attempt.GetStatus();

	if (!IsTerminalStatus(outcome))
	{
		// Only reachable through an invalid transition, which has already been reported.
		attempt.errorClass = kErrorUnexpectedState;
		attempt.errorMessage = "attempt left in " + std::string(GetAttemptStatusName(outcome)) + " state";
		attempt.status = kAttemptError;
		outcome = kAttemptError;
	}

	if (resultCache)
		resultCache->Store(session->GetDeviceSerial(), descriptor.name, outcome);

	if (outcome == kAttemptSuccess)
		Interface::Print("%s: %s succeeded\n", session->GetDeviceSerial().c_str(), descriptor.name.c_str());
	else
		Interface::PrintWarning("%s: %s %s: %s\n", session->GetDeviceSerial().c_str(), descriptor.name.c_str(),
			GetAttemptStatusName(outcome), attempt.GetErrorMessage().c_str());

	session->attempts.push_back(attempt);

	for (size_t i = 0; i < session->plan.size(); i++)
	{
		if (session->plan[i].methodName == descriptor.name)
			session->plan[i].status = outcome;
	}

	return (outcome);
}

void BypassEngine::PlanDryRun(const BypassRequest& request, const std::vector<RankedCandidate>& candidates,
	ChannelLease *lease, BypassSession *session)
{
	const DeviceSnapshot& device = lease->GetSnapshot();

	CommandResult probe = lease->Probe(config.commandTimeoutMs);

	for (size_t i = 0; i < candidates.size(); i++)
	{
		const BypassMethodDescriptor& descriptor = *candidates[i].descriptor;
		PlanEntry& entry = session->plan[i];

		// Only the transition into Preparing is recorded; the attempt itself is discarded.
		BypassAttempt attempt(descriptor.name, false);
		Transition(request, session, &attempt, kAttemptPreparing, "dry run");

		entry.status = kAttemptPreparing;

		if (!descriptor.SupportsManufacturer(device.GetManufacturer()))
		{
			entry.applicable = false;
			entry.verdict = Format("does not apply to %s devices", GetManufacturerName(device.GetManufacturer()));
		}
		else if (!probe.success)
		{
			entry.applicable = false;
			entry.verdict = "connectivity probe failed: " + DescribeFailure(probe);
		}
		else if (entry.requiresModeSwitch)
		{
			entry.applicable = true;
			entry.verdict = Format("requires switch from %s to %s mode", GetModeName(device.GetMode()),
				GetModeName(descriptor.requiredMode));
		}
		else
		{
			entry.applicable = true;
			entry.verdict = "ready";
		}
	}
}

void BypassEngine::CloseSession(BypassSession *session, SessionStatus finalStatus, const std::string& detail)
{
	session->finalStatus = finalStatus;
	session->endedAt = Timing::GetWallClockMs();
	session->summary = std::string(GetSessionStatusName(finalStatus)) + (detail.empty() ? "" : ": " + detail);

	Audit(session, "", GetSessionStatusName(kSessionRunning), GetSessionStatusName(finalStatus), detail);

	std::lock_guard<std::mutex> lock(statisticsMutex);

	switch (finalStatus)
	{
		case kSessionSuccess:
			statistics.succeeded++;
			break;

		case kSessionExhaustedAllMethods:
			statistics.exhausted++;
			break;

		case kSessionPlanned:
			statistics.planned++;
			break;

		default:
			statistics.aborted++;
			break;
	}
}

int BypassEngine::Run(const BypassRequest& request, BypassSession *session)
{
	const DeviceSnapshot& device = request.device;

	*session = BypassSession(NextSessionId(device), device, Timing::GetWallClockMs(), request.dryRun);

	if (!authorizer->CheckAuthorized(device.GetSerial()))
	{
		Interface::PrintError("%s is not authorized for bypass\n", device.GetSerial().c_str());

		session->finalStatus = kSessionAborted;
		session->endedAt = Timing::GetWallClockMs();
		session->lastError = "authorization denied";
		session->summary = "aborted: authorization denied";

		Audit(session, "", GetSessionStatusName(kSessionRunning), "authorization-denied", "");

		std::lock_guard<std::mutex> lock(statisticsMutex);
		statistics.denied++;

		return (kRunAuthorizationDenied);
	}

	if (!request.methodName.empty() && !registry->Find(request.methodName))
	{
		Interface::PrintError("Unknown method \"%s\"\n", request.methodName.c_str());

		session->lastError = "unknown method " + request.methodName;
		CloseSession(session, kSessionAborted, session->lastError);

		return (kRunUnknownMethod);
	}

	// The profile is a copy, fixed for the rest of the session.
	DeviceProfile profile;
	profileResolver->Resolve(device, &profile);

	std::vector<RankedCandidate> ranked = planner.Rank(device, profile, *registry);
	std::vector<RankedCandidate> candidates;

	for (size_t i = 0; i < ranked.size(); i++)
	{
		if (request.methodName.empty() || ranked[i].descriptor->name == request.methodName)
			candidates.push_back(ranked[i]);
	}

	for (size_t i = 0; i < candidates.size(); i++)
	{
		PlanEntry entry;
		entry.methodName = candidates[i].descriptor->name;
		entry.weight = candidates[i].weight;
		entry.risk = candidates[i].descriptor->risk;
		entry.requiredMode = candidates[i].descriptor->requiredMode;
		entry.requiresModeSwitch = candidates[i].requiresModeSwitch;

		session->plan.push_back(entry);

		Interface::PrintVerbose("  %u. %s weight %.3f risk %s%s\n", static_cast<unsigned int>(i + 1),
			entry.methodName.c_str(), entry.weight, GetRiskTierName(entry.risk),
			entry.requiresModeSwitch ? " (mode switch)" : "");
	}

	if (candidates.empty())
	{
		Interface::PrintError("No candidate methods for %s in %s mode\n", device.GetSerial().c_str(),
			GetModeName(device.GetMode()));

		session->lastError = "no candidate methods";
		CloseSession(session, kSessionExhaustedAllMethods, session->lastError);

		return (kRunNoCandidates);
	}

	ChannelLease lease;

	if (communicationManager->Acquire(device, config.acquireTimeoutMs, &lease) != CommunicationManager::kAcquireSucceeded)
	{
		session->lastError = Format("%s: no exclusive access within %d ms", GetErrorClassName(kErrorTimeout),
			config.acquireTimeoutMs);
		CloseSession(session, kSessionAborted, session->lastError);

		return (kRunCompleted);
	}

	if (request.dryRun)
	{
		PlanDryRun(request, candidates, &lease, session);

		const PlanEntry& top = session->plan.front();
		CloseSession(session, kSessionPlanned, Format("%u candidates, first %s (%s)",
			static_cast<unsigned int>(candidates.size()), top.methodName.c_str(), top.verdict.c_str()));

		return (kRunCompleted);
	}

	unsigned int failedRetries = 0;

	for (size_t i = 0; i < candidates.size(); i++)
	{
		if (IsCancelled(request))
		{
			session->lastError = "cancelled by user";
			CloseSession(session, kSessionAborted, session->lastError);
			return (kRunCompleted);
		}

		const BypassMethodDescriptor& descriptor = *candidates[i].descriptor;

		AttemptStatus outcome = RunAttempt(request, descriptor, false, &lease, session);

		if (outcome == kAttemptError && session->attempts.back().GetErrorClass() == kErrorTimeout)
		{
			if (IsCancelled(request))
			{
				session->lastError = "cancelled by user";
				CloseSession(session, kSessionAborted, session->lastError);
				return (kRunCompleted);
			}

			outcome = RunAttempt(request, descriptor, true, &lease, session);
		}

		const BypassAttempt& last = session->attempts.back();

		if (outcome == kAttemptSuccess)
		{
			CloseSession(session, kSessionSuccess, Format("%s cleared the lock after %u attempts",
				descriptor.name.c_str(), static_cast<unsigned int>(session->attempts.size())));
			return (kRunCompleted);
		}

		if (outcome == kAttemptError)
		{
			session->lastError = Format("%s in %s: %s", GetErrorClassName(last.GetErrorClass()),
				descriptor.name.c_str(), last.GetErrorMessage().c_str());
			CloseSession(session, kSessionAborted, session->lastError);
			return (kRunCompleted);
		}

		if (last.IsRetry())
			failedRetries++;

		session->lastError = descriptor.name + ": " + last.GetErrorMessage();
	}

	//	A method whose timeout was retried still ended Failed, so the session counts as exhausted;
	//	the summary says so rather than hiding the timeout.
	std::string detail = Format("%u methods failed", static_cast<unsigned int>(candidates.size()));

	if (failedRetries > 0)
		detail += Format(", %u of them after a timeout retry", failedRetries);

	CloseSession(session, kSessionExhaustedAllMethods, detail + ", last error " + session->lastError);

	return (kRunCompleted);
}

EngineStatistics BypassEngine::GetStatistics(void)
{
	std::lock_guard<std::mutex> lock(statisticsMutex);
	return (statistics);
}
