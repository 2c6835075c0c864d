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

#ifndef RATATOSKR_BYPASSENGINE_H
#define RATATOSKR_BYPASSENGINE_H

// C++ Standard Library
#include <atomic>
#include <mutex>

// Ratatoskr
#include "AuditSink.h"
#include "Authorizer.h"
#include "BypassSession.h"
#include "CommunicationManager.h"
#include "ProfileResolver.h"
#include "SessionObserver.h"
#include "StrategyPlanner.h"

namespace Ratatoskr
{
	struct EngineConfig
	{
		enum
		{
			kDefaultCommandTimeoutMs = 30000,
			kDefaultAcquireTimeoutMs = 60000,
			kDefaultModeSwitchTimeoutMs = 60000,
			kDefaultCacheTtlSeconds = 3600
		};

		int commandTimeoutMs;
		int acquireTimeoutMs;

		// How long a device may take to re-enumerate after a mode switch.
		int modeSwitchTimeoutMs;

		double modeSwitchPenalty;
		double cacheSuccessBoost;
		unsigned int cacheTtlSeconds;

		EngineConfig();
	};

	struct BypassRequest
	{
		DeviceSnapshot device;

		// Restricts the plan to this one method when not empty.
		std::string methodName;

		bool dryRun;

		// Both may be null.
		SessionObserver *observer;
		CancelToken *cancelToken;

		BypassRequest();
	};

	struct EngineStatistics
	{
		unsigned int succeeded;
		unsigned int exhausted;
		unsigned int aborted;
		unsigned int planned;
		unsigned int denied;

		EngineStatistics();

		unsigned int GetTotal(void) const
		{
			return (succeeded + exhausted + aborted + planned + denied);
		}
	};

	// Runs one session per call. Calls for different serials may run concurrently; calls for the
	// same serial serialize on the device's lease.
	class BypassEngine
	{
		public:

			enum
			{
				kRunCompleted = 0,
				kRunAuthorizationDenied,
				kRunNoCandidates,
				kRunUnknownMethod
			};

		private:

			EngineConfig config;

			CommunicationManager *communicationManager;
			const MethodRegistry *registry;
			ProfileResolver *profileResolver;
			Authorizer *authorizer;
			AuditSink *auditSink;
			ResultCache *resultCache;

			StrategyPlanner planner;

			std::atomic<unsigned int> sessionCounter;

			std::mutex statisticsMutex;
			EngineStatistics statistics;

			std::string NextSessionId(const DeviceSnapshot& device);

			void Audit(const BypassSession *session, const std::string& methodName, const std::string& fromState,
				const std::string& toState, const std::string& detail);
			bool Transition(const BypassRequest& request, BypassSession *session, BypassAttempt *attempt,
				AttemptStatus newStatus, const std::string& detail);

			void Fail(const BypassRequest& request, BypassSession *session, BypassAttempt *attempt,
				const std::string& reason);
			void RaiseError(const BypassRequest& request, BypassSession *session, BypassAttempt *attempt,
				CommandStatus status, const std::string& reason);

			bool Prepare(const BypassRequest& request, const BypassMethodDescriptor& descriptor, ChannelLease *lease,
				BypassSession *session, BypassAttempt *attempt);
			bool ExecuteSteps(const BypassRequest& request, const BypassMethodDescriptor& descriptor,
				ChannelLease *lease, BypassSession *session, BypassAttempt *attempt);
			void Verify(const BypassRequest& request, ChannelLease *lease, BypassSession *session,
				BypassAttempt *attempt);

			AttemptStatus RunAttempt(const BypassRequest& request, const BypassMethodDescriptor& descriptor, bool retry,
				ChannelLease *lease, BypassSession *session);

			void PlanDryRun(const BypassRequest& request, const std::vector<RankedCandidate>& candidates,
				ChannelLease *lease, BypassSession *session);

			void CloseSession(BypassSession *session, SessionStatus finalStatus, const std::string& detail);

		public:

			// Every collaborator but resultCache is required. auditSink may be null only when no
			// audit log is configured.
			BypassEngine(const EngineConfig& config, CommunicationManager *communicationManager,
				const MethodRegistry *registry, ProfileResolver *profileResolver, Authorizer *authorizer,
				AuditSink *auditSink, ResultCache *resultCache);

			// Always leaves a closed session in *session, including on authorization denial.
			int Run(const BypassRequest& request, BypassSession *session);

			EngineStatistics GetStatistics(void);

			const EngineConfig& GetConfig(void) const
			{
				return (config);
			}
	};
}

#endif
