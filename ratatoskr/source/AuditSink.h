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

#ifndef RATATOSKR_AUDITSINK_H
#define RATATOSKR_AUDITSINK_H

// C++ Standard Library
#include <mutex>

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	struct AuditRecord
	{
		uint64_t timestamp;
		std::string sessionId;
		std::string deviceSerial;

		// Empty for records about the session as a whole.
		std::string methodName;

		std::string fromState;
		std::string toState;
		std::string detail;

		AuditRecord();
	};

	// Append-only. Returns false when the record could not be delivered.
	class AuditSink
	{
		public:

			virtual ~AuditSink()
			{
			}

			virtual bool Append(const AuditRecord& record) = 0;
	};

	// One JSON object per line.
	class FileAuditSink : public AuditSink
	{
		private:

			std::string path;
			std::mutex appendMutex;

		public:

			explicit FileAuditSink(const std::string& path);

			bool Append(const AuditRecord& record);

			static std::string Serialize(const AuditRecord& record);
	};
}

#endif
