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

// ArduinoJson
#include <ArduinoJson.h>

// Ratatoskr
#include "AuditSink.h"
#include "Interface.h"
#include "TextFile.h"
#include "Timing.h"

using namespace Ratatoskr;

AuditRecord::AuditRecord() :
	timestamp(0)
{
}

FileAuditSink::FileAuditSink(const std::string& path) :
	path(path)
{
}

std::string FileAuditSink::Serialize(const AuditRecord& record)
{
	JsonDocument document;
	document["timestamp"] = Timing::FormatTimestamp(record.timestamp);
	document["session_id"] = record.sessionId;
	document["device_serial"] = record.deviceSerial;
	document["method"] = record.methodName;
	document["from"] = record.fromState;
	document["to"] = record.toState;
	document["detail"] = record.detail;

	std::string line;
	serializeJson(document, line);

	return (line);
}

bool FileAuditSink::Append(const AuditRecord& record)
{
	std::string line = Serialize(record);

	std::lock_guard<std::mutex> lock(appendMutex);

	if (!TextFile::AppendLine(path, line))
	{
		Interface::PrintWarning("Failed to append audit record to \"%s\"\n", path.c_str());
		return (false);
	}

	return (true);
}
