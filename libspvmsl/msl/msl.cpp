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

#include <stddef.h>
#include <stdint.h>
#include <new>

#include "std/stdlib.hpp"
#include "std/log.hpp"
#include "std/string.hpp"
#include "std/utility.hpp"
#include "std/vector.hpp"

#include "msl/error.hpp"
#include "msl/session.hpp"

namespace spvmsl::msl {
struct compileResult {
	spvmsl::std::string<char> source;

	[[nodiscard]] spvmsl_msl_compileResult handle() noexcept { return reinterpret_cast<spvmsl_msl_compileResult>(this); }
	[[nodiscard]] static compileResult* fromHandle(spvmsl_msl_compileResult handle) noexcept {
		return reinterpret_cast<compileResult*>(handle);
	}
};
}  // namespace spvmsl::msl

static spvmsl_error report(const char* fn, const spvmsl_error& err) noexcept {
	spvmsl::std::vPrintf("%s: %s error, native code %d", fn, spvmsl::msl::errorKindStr(err.kind), err.nativeCode);
	return err;
}

extern "C" {
SPVMSL_FN spvmsl_error spvmsl_msl_createSession(size_t numWords, const uint32_t* words, spvmsl_msl_session* sessionHandle) {
	*sessionHandle = nullptr;

	auto created = spvmsl::msl::session::create(numWords, words);
	if (!created) {
		return report(__func__, created.error());
	}
	*sessionHandle = created.value().release()->handle();
	return spvmsl_error{};
}
SPVMSL_FN void spvmsl_msl_destroySession(spvmsl_msl_session handle) {
	auto* session = spvmsl::msl::session::fromHandle(handle);
	delete session;
}
SPVMSL_FN spvmsl_error spvmsl_msl_session_configure(spvmsl_msl_session handle, const spvmsl_compilerOptions* options,
													uint32_t numVertexAttributes, const spvmsl_vertexAttribute* vertexAttributes,
													uint32_t numResourceBindings, const spvmsl_resourceBinding* resourceBindings) {
	auto* session = spvmsl::msl::session::fromHandle(handle);

	spvmsl::std::vector<spvmsl_vertexAttribute> va(0, numVertexAttributes);
	for (uint32_t i = 0; i < numVertexAttributes; i++) {
		va.pushBack(vertexAttributes[i]);
	}
	spvmsl::std::vector<spvmsl_resourceBinding> rb(0, numResourceBindings);
	for (uint32_t i = 0; i < numResourceBindings; i++) {
		rb.pushBack(resourceBindings[i]);
	}

	auto configured = session->configure(*options, spvmsl::std::move(va), spvmsl::std::move(rb));
	if (!configured) {
		return report(__func__, configured.error());
	}
	return spvmsl_error{};
}
SPVMSL_FN spvmsl_error spvmsl_msl_session_compile(spvmsl_msl_session handle, spvmsl_msl_compileResult* resultHandle) {
	auto* session = spvmsl::msl::session::fromHandle(handle);
	*resultHandle = nullptr;

	auto compiled = session->compile();
	if (!compiled) {
		return report(__func__, compiled.error());
	}

	auto* result = new (::std::nothrow) spvmsl::msl::compileResult{spvmsl::std::move(compiled.value())};
	if (result == nullptr) {
		spvmsl::std::ePrintf("Failed to allocate compile result");
		return report(__func__, spvmsl_error{spvmsl_errorKind_compilation, SPVC_ERROR_OUT_OF_MEMORY});
	}
	*resultHandle = result->handle();
	return spvmsl_error{};
}
SPVMSL_FN spvmsl_error spvmsl_msl_session_isRasterizationEnabled(spvmsl_msl_session handle, spvmsl_bool* enabled) {
	auto* session = spvmsl::msl::session::fromHandle(handle);

	auto queried = session->isRasterizationEnabled();
	if (!queried) {
		return report(__func__, queried.error());
	}
	*enabled = queried.value() ? SPVMSL_TRUE : SPVMSL_FALSE;
	return spvmsl_error{};
}
SPVMSL_FN void spvmsl_msl_session_getLastErrorString(spvmsl_msl_session handle, size_t* sz, const char** str) {
	auto* session = spvmsl::msl::session::fromHandle(handle);
	*str = session->getLastErrorString();
	*sz = spvmsl::std::strlen(*str);
}
SPVMSL_FN void spvmsl_msl_compileResult_getSource(spvmsl_msl_compileResult handle, size_t* sz, const char** source) {
	auto* result = spvmsl::msl::compileResult::fromHandle(handle);
	*sz = result->source.size();
	*source = result->source.cStr();
}
SPVMSL_FN void spvmsl_msl_destroyCompileResult(spvmsl_msl_compileResult handle) {
	auto* result = spvmsl::msl::compileResult::fromHandle(handle);
	delete result;
}
}
