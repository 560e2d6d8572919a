/*
Copyright 2025 The goARRG Authors.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

	http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
*/

#include "spvmsl/spvmsl.h"  // IWYU pragma: associated

#include <stdio.h>
#include <stdlib.h>

#include "stdlib.hpp"

namespace spvmsl::std {
namespace internal {
static void stderrLogger(size_t sz, char* msg) {
	fprintf(stderr, "%.*s\n", static_cast<int>(sz), msg);
}

static loggerCallback callbackAbort = stderrLogger;

loggerCallback callbackV = stderrLogger;
loggerCallback callbackI = stderrLogger;
loggerCallback callbackW = stderrLogger;
loggerCallback callbackE = stderrLogger;
}  // namespace internal
void abort(const char* msg, sourceLocation loc) noexcept {
	if (msg != nullptr) {
		size_t sz = 0;
		for (; msg[sz] != '\0'; ++sz) {
		}
		internal::callbackE(sz, const_cast<char*>(msg));
	}

	{
		static constexpr const char* locFmt = "Fatal Error At: %s %s:%d";
		char buf[1024];	 // NOLINT(modernize-avoid-c-arrays)
		const int locSz = snprintf(buf, sizeof(buf), locFmt, loc.func, loc.file, loc.line);
		internal::callbackAbort(locSz, buf);
	}

	::abort();
}

void installLoggers(const loggers& l) noexcept {
	auto pick = [](internal::loggerCallback cb) { return cb != nullptr ? cb : internal::stderrLogger; };

	internal::callbackAbort = pick(l.abort);

	internal::callbackV = pick(l.verbose);
	internal::callbackI = pick(l.info);
	internal::callbackW = pick(l.warn);
	internal::callbackE = pick(l.error);
}
}  // namespace spvmsl::std
extern "C" {
SPVMSL_FN void spvmsl_stdlib_init(spvmsl_loggerCallback callbackAbort, spvmsl_loggerCallback callbackV,
								  spvmsl_loggerCallback callbackI, spvmsl_loggerCallback callbackW,
								  spvmsl_loggerCallback callbackE) {
	spvmsl::std::installLoggers(spvmsl::std::loggers{
		.abort = callbackAbort,
		.verbose = callbackV,
		.info = callbackI,
		.warn = callbackW,
		.error = callbackE,
	});
}
}
