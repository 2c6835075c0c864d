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

#ifndef RATATOSKR_SESSIONOBSERVER_H
#define RATATOSKR_SESSIONOBSERVER_H

// C++ Standard Library
#include <atomic>

// Ratatoskr
#include "BypassSession.h"

namespace Ratatoskr
{
	struct TransitionEvent
	{
		std::string sessionId;
		std::string deviceSerial;
		std::string methodName;
		AttemptStatus fromStatus;
		AttemptStatus toStatus;
		std::string detail;
		bool retry;
		bool dryRun;
	};

	// Called synchronously, on the session's own thread, for every attempt state transition.
	class SessionObserver
	{
		public:

			virtual ~SessionObserver()
			{
			}

			virtual void OnTransition(const TransitionEvent& event) = 0;
	};

	// Checked between attempts. An in-flight command always runs to completion or timeout first.
	class CancelToken
	{
		private:

			std::atomic<bool> cancelled;

		public:

			CancelToken() :
				cancelled(false)
			{
			}

			void Cancel(void)
			{
				cancelled.store(true);
			}

			bool IsCancelled(void) const
			{
				return (cancelled.load());
			}
	};
}

#endif
