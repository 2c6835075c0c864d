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
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

// Ratatoskr
#include "Interface.h"
#include "ProcessRunner.h"
#include "Timing.h"

using namespace Ratatoskr;

namespace
{
	void CloseIfOpen(int& fd)
	{
		if (fd >= 0)
		{
			close(fd);
			fd = -1;
		}
	}

}

bool ProcessRunner::OpenPipe(int fds[2])
{
	//	Close-on-exec must be set atomically: a child forked by another session's thread
	//	would otherwise inherit the write end and hold off EOF until it exits.
	return (pipe2(fds, O_CLOEXEC) == 0);
}

ProcessRunner::Result ProcessRunner::Run(const std::vector<std::string>& arguments, int timeoutMs)
{
	Result result;
	result.status = kRunFailedToStart;
	result.exitCode = -1;
	result.durationMs = 0;

	if (arguments.empty())
	{
		result.standardError = "empty command line";
		return (result);
	}

	int outPipe[2] = { -1, -1 };
	int errPipe[2] = { -1, -1 };
	int execPipe[2] = { -1, -1 };

	if (!OpenPipe(outPipe) || !OpenPipe(errPipe) || !OpenPipe(execPipe))
	{
		result.standardError = std::string("pipe: ") + strerror(errno);
		CloseIfOpen(outPipe[0]); CloseIfOpen(outPipe[1]);
		CloseIfOpen(errPipe[0]); CloseIfOpen(errPipe[1]);
		CloseIfOpen(execPipe[0]); CloseIfOpen(execPipe[1]);
		return (result);
	}

	std::vector<char *> argv;
	for (size_t i = 0; i < arguments.size(); i++)
		argv.push_back(const_cast<char *>(arguments[i].c_str()));
	argv.push_back(nullptr);

	uint64_t startTime = Timing::GetMonotonicMs();

	pid_t child = fork();
	if (child < 0)
	{
		result.standardError = std::string("fork: ") + strerror(errno);
		CloseIfOpen(outPipe[0]); CloseIfOpen(outPipe[1]);
		CloseIfOpen(errPipe[0]); CloseIfOpen(errPipe[1]);
		CloseIfOpen(execPipe[0]); CloseIfOpen(execPipe[1]);
		return (result);
	}

	if (child == 0)
	{
		dup2(outPipe[1], STDOUT_FILENO);
		dup2(errPipe[1], STDERR_FILENO);

		int devNull = open("/dev/null", O_RDONLY);
		if (devNull >= 0)
			dup2(devNull, STDIN_FILENO);

		execvp(argv[0], &argv[0]);

		//	Only reached when exec failed; report errno through the close-on-exec pipe.
		int execError = errno;
		ssize_t ignored = write(execPipe[1], &execError, sizeof(execError));
		(void)ignored;
		_exit(127);
	}

	CloseIfOpen(outPipe[1]);
	CloseIfOpen(errPipe[1]);
	CloseIfOpen(execPipe[1]);

	int execError = 0;
	ssize_t execBytes = read(execPipe[0], &execError, sizeof(execError));
	CloseIfOpen(execPipe[0]);

	if (execBytes == sizeof(execError))
	{
		waitpid(child, nullptr, 0);
		CloseIfOpen(outPipe[0]);
		CloseIfOpen(errPipe[0]);

		result.standardError = arguments[0] + ": " + strerror(execError);
		result.durationMs = static_cast<unsigned int>(Timing::GetMonotonicMs() - startTime);
		return (result);
	}

	bool timedOut = false;
	char buffer[kReadBufferSize];

	while (outPipe[0] >= 0 || errPipe[0] >= 0)
	{
		int64_t remaining = static_cast<int64_t>(startTime) + timeoutMs - static_cast<int64_t>(Timing::GetMonotonicMs());
		if (remaining <= 0)
		{
			timedOut = true;
			break;
		}

		pollfd fds[2];
		int fdCount = 0;

		if (outPipe[0] >= 0)
		{
			fds[fdCount].fd = outPipe[0];
			fds[fdCount].events = POLLIN;
			fds[fdCount].revents = 0;
			fdCount++;
		}

		if (errPipe[0] >= 0)
		{
			fds[fdCount].fd = errPipe[0];
			fds[fdCount].events = POLLIN;
			fds[fdCount].revents = 0;
			fdCount++;
		}

		int pollResult = poll(fds, fdCount, static_cast<int>(remaining));
		if (pollResult < 0)
		{
			if (errno == EINTR)
				continue;

			Interface::PrintWarning("poll failed while running %s: %s\n", arguments[0].c_str(), strerror(errno));
			break;
		}

		for (int i = 0; i < fdCount; i++)
		{
			if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
				continue;

			bool isOut = (fds[i].fd == outPipe[0]);
			ssize_t count = read(fds[i].fd, buffer, sizeof(buffer));

			if (count > 0)
			{
				(isOut ? result.standardOutput : result.standardError).append(buffer, count);
			}
			else if (count == 0 || errno != EINTR)
			{
				CloseIfOpen(isOut ? outPipe[0] : errPipe[0]);
			}
		}
	}

	if (timedOut)
		kill(child, SIGKILL);

	CloseIfOpen(outPipe[0]);
	CloseIfOpen(errPipe[0]);

	int waitStatus = 0;
	while (waitpid(child, &waitStatus, 0) < 0 && errno == EINTR)
	{
	}

	result.durationMs = static_cast<unsigned int>(Timing::GetMonotonicMs() - startTime);

	if (timedOut)
	{
		result.status = kRunTimedOut;
		return (result);
	}

	result.status = kRunCompleted;
	result.exitCode = WIFEXITED(waitStatus) ? WEXITSTATUS(waitStatus) : -1;
	return (result);
}

std::vector<std::string> ProcessRunner::SplitCommandLine(const std::string& commandLine)
{
	std::vector<std::string> arguments;
	std::string current;
	bool inToken = false;
	char quote = 0;

	for (size_t i = 0; i < commandLine.size(); i++)
	{
		char c = commandLine[i];

		if (quote)
		{
			if (c == quote)
				quote = 0;
			else
				current += c;
		}
		else if (c == '"' || c == '\'')
		{
			quote = c;
			inToken = true;
		}
		else if (c == ' ' || c == '\t' || c == '\n')
		{
			if (inToken)
			{
				arguments.push_back(current);
				current.clear();
				inToken = false;
			}
		}
		else
		{
			current += c;
			inToken = true;
		}
	}

	if (inToken)
		arguments.push_back(current);

	return (arguments);
}
