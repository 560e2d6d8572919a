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

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <atomic>
#include <new>

#include <spirv_cross/spirv.h>
#include <spirv_cross/spirv_cross_c.h>

#include "std/stdlib.hpp"
#include "std/defer.hpp"
#include "std/log.hpp"
#include "std/memory.hpp"
#include "std/string.hpp"
#include "std/utility.hpp"
#include "std/vector.hpp"

#include "spvmsl/spvmsl.h"
#include "msl/error.hpp"
#include "msl/format.hpp"
#include "msl/options.hpp"
#include "msl/session.hpp"

static constexpr spvc_bool toSpvcBool(spvmsl_bool b) noexcept {
	return b != SPVMSL_FALSE ? SPVC_TRUE : SPVC_FALSE;
}

static ::std::atomic<size_t> numLiveContexts{0};

namespace spvmsl::msl {
session::~session() noexcept {
	releaseContext(this->spvcContext);
}

size_t session::liveContexts() noexcept {
	return numLiveContexts.load();
}

void session::onSpvcError(void* userdata, const char* error) {
	auto* s = static_cast<session*>(userdata);
	s->lastError = error;
	spvmsl::std::vPrintf("spvc: %s", error);
}

void session::releaseContext(spvc_context context) noexcept {
	if (context == nullptr) {
		return;
	}
	spvc_context_destroy(context);
	numLiveContexts--;
}

result<void> session::createContext(spvmsl_errorKind kind, spvc_context* outContext, spvc_compiler* outCompiler) noexcept {
	spvc_context context = nullptr;
	auto ret = spvc_context_create(&context);
	if (ret != SPVC_SUCCESS) {
		spvmsl::std::ePrintf("Failed to create spvc context: %s", spvcResultStr(ret));
		return fail(kind, ret);
	}
	numLiveContexts++;

	bool keep = false;
	DEFER([&] {
		if (!keep) {
			releaseContext(context);
		}
	});
	spvc_context_set_error_callback(context, onSpvcError, this);

	spvc_parsed_ir ir = nullptr;
	ret = spvc_context_parse_spirv(context, reinterpret_cast<const SpvId*>(this->words.get()), this->words.size(), &ir);
	if (ret != SPVC_SUCCESS) {
		spvmsl::std::ePrintf("Failed to parse spv (%s): %s", spvcResultStr(ret), getLastErrorString());
		return fail(kind, ret);
	}

	spvc_compiler compiler = nullptr;
	ret = spvc_context_create_compiler(context, SPVC_BACKEND_MSL, ir, SPVC_CAPTURE_MODE_TAKE_OWNERSHIP, &compiler);
	if (ret != SPVC_SUCCESS) {
		spvmsl::std::ePrintf("Failed to create spvc msl compiler (%s): %s", spvcResultStr(ret), getLastErrorString());
		return fail(kind, ret);
	}

	keep = true;
	*outContext = context;
	*outCompiler = compiler;
	return {};
}

result<spvmsl::std::smartPtr<session>> session::create(size_t numWords, const uint32_t* words) noexcept {
	spvmsl::std::smartPtr<session> s(new (::std::nothrow) session());
	if (!s) {
		spvmsl::std::ePrintf("Failed to allocate msl session");
		return fail(spvmsl_errorKind_construction, SPVC_ERROR_OUT_OF_MEMORY);
	}

	// Kept so every configure can parse into a context of its own.
	s->words.resize(numWords);
	if (numWords > 0) {
		memcpy(s->words.get(), words, numWords * sizeof(uint32_t));
	}

	if (auto created = s->createContext(spvmsl_errorKind_construction, &s->spvcContext, &s->spvcCompiler); !created) {
		return fail(created.error().kind, created.error().nativeCode);
	}

	spvmsl::std::iPrintf("Created msl session from %zu spv words", numWords);
	return s;
}

result<void> session::installOptions(spvc_compiler compiler, const spvmsl_compilerOptions& flat) const noexcept {
	spvc_compiler_options spvcOptions;
	auto ret = spvc_compiler_create_compiler_options(compiler, &spvcOptions);
	if (ret != SPVC_SUCCESS) {
		spvmsl::std::ePrintf("Failed to create spvc compiler options (%s): %s", spvcResultStr(ret), getLastErrorString());
		return fail(spvmsl_errorKind_configuration, ret);
	}

	struct boolOption {
		spvc_compiler_option option;
		spvmsl_bool value;
		const char* name;
	};
	const boolOption bools[] = {  // NOLINT(modernize-avoid-c-arrays)
		{SPVC_COMPILER_OPTION_FLIP_VERTEX_Y, flat.vertexInvertY, "vertexInvertY"},
		{SPVC_COMPILER_OPTION_FIXUP_DEPTH_CONVENTION, flat.vertexTransformClipSpace, "vertexTransformClipSpace"},
		{SPVC_COMPILER_OPTION_MSL_ENABLE_POINT_SIZE_BUILTIN, flat.enablePointSizeBuiltin, "enablePointSizeBuiltin"},
		{SPVC_COMPILER_OPTION_MSL_DISABLE_RASTERIZATION, flat.disableRasterization, "disableRasterization"},
		{SPVC_COMPILER_OPTION_MSL_CAPTURE_OUTPUT_TO_BUFFER, flat.captureOutputToBuffer, "captureOutputToBuffer"},
		{SPVC_COMPILER_OPTION_MSL_SWIZZLE_TEXTURE_SAMPLES, flat.swizzleTextureSamples, "swizzleTextureSamples"},
		{SPVC_COMPILER_OPTION_MSL_TESS_DOMAIN_ORIGIN_LOWER_LEFT, flat.tessDomainOriginLowerLeft, "tessDomainOriginLowerLeft"},
		{SPVC_COMPILER_OPTION_MSL_ARGUMENT_BUFFERS, flat.argumentBuffers, "argumentBuffers"},
		{SPVC_COMPILER_OPTION_MSL_PAD_FRAGMENT_OUTPUT_COMPONENTS, flat.padFragmentOutputComponents,
		 "padFragmentOutputComponents"},
	};
	for (const auto& o : bools) {
		ret = spvc_compiler_options_set_bool(spvcOptions, o.option, toSpvcBool(o.value));
		if (ret != SPVC_SUCCESS) {
			spvmsl::std::ePrintf("Failed to set %s (%s): %s", o.name, spvcResultStr(ret), getLastErrorString());
			return fail(spvmsl_errorKind_configuration, ret);
		}
	}

	struct uintOption {
		spvc_compiler_option option;
		uint32_t value;
		const char* name;
	};
	const uintOption uints[] = {	// NOLINT(modernize-avoid-c-arrays)
		{SPVC_COMPILER_OPTION_MSL_PLATFORM, flat.platform, "platform"},
		{SPVC_COMPILER_OPTION_MSL_VERSION, flat.version, "version"},
		{SPVC_COMPILER_OPTION_MSL_SWIZZLE_BUFFER_INDEX, flat.swizzleBufferIndex, "swizzleBufferIndex"},
		{SPVC_COMPILER_OPTION_MSL_INDIRECT_PARAMS_BUFFER_INDEX, flat.indirectParamsBufferIndex, "indirectParamsBufferIndex"},
		{SPVC_COMPILER_OPTION_MSL_SHADER_OUTPUT_BUFFER_INDEX, flat.shaderOutputBufferIndex, "shaderOutputBufferIndex"},
		{SPVC_COMPILER_OPTION_MSL_SHADER_PATCH_OUTPUT_BUFFER_INDEX, flat.shaderPatchOutputBufferIndex,
		 "shaderPatchOutputBufferIndex"},
		{SPVC_COMPILER_OPTION_MSL_SHADER_TESS_FACTOR_OUTPUT_BUFFER_INDEX, flat.shaderTessFactorBufferIndex,
		 "shaderTessFactorBufferIndex"},
		{SPVC_COMPILER_OPTION_MSL_BUFFER_SIZE_BUFFER_INDEX, flat.bufferSizeBufferIndex, "bufferSizeBufferIndex"},
	};
	for (const auto& o : uints) {
		ret = spvc_compiler_options_set_uint(spvcOptions, o.option, o.value);
		if (ret != SPVC_SUCCESS) {
			spvmsl::std::ePrintf("Failed to set %s = %u (%s): %s", o.name, o.value, spvcResultStr(ret),
								 getLastErrorString());
			return fail(spvmsl_errorKind_configuration, ret);
		}
	}

	ret = spvc_compiler_install_compiler_options(compiler, spvcOptions);
	if (ret != SPVC_SUCCESS) {
		spvmsl::std::ePrintf("Failed to install spvc compiler options (%s): %s", spvcResultStr(ret),
							 getLastErrorString());
		return fail(spvmsl_errorKind_configuration, ret);
	}
	return {};
}

result<void> session::configure(const compilerOptions& options) noexcept {
	return configure(options.translate(), options.translateVertexAttributes(), options.translateResourceBindings());
}

result<void> session::configure(const spvmsl_compilerOptions& flat,
								spvmsl::std::vector<spvmsl_vertexAttribute>&& vertexAttributes,
								spvmsl::std::vector<spvmsl_resourceBinding>&& resourceBindings) noexcept {
	if (!isKnownPlatform(flat.platform)) {
		spvmsl::std::ePrintf("Unknown msl platform: %u", flat.platform);
		return fail(spvmsl_errorKind_configuration, SPVC_ERROR_INVALID_ARGUMENT);
	}
	if (!isKnownVersion(flat.version)) {
		spvmsl::std::ePrintf("Unknown msl version: %u", flat.version);
		return fail(spvmsl_errorKind_configuration, SPVC_ERROR_INVALID_ARGUMENT);
	}
	if (flat.argumentBuffers != SPVMSL_FALSE && !versionAtLeast(flat.version, 2, 0)) {
		spvmsl::std::ePrintf("Argument buffers require msl 2.0 or newer, got msl %s", nameOf(flat.version, knownVersions));
		return fail(spvmsl_errorKind_configuration, SPVC_ERROR_INVALID_ARGUMENT);
	}

	// A fresh context drops the compiler and overrides of the previous configuration.
	spvc_context context = nullptr;
	spvc_compiler compiler = nullptr;
	if (auto created = createContext(spvmsl_errorKind_configuration, &context, &compiler); !created) {
		return created;
	}
	if (auto installed = installOptions(compiler, flat); !installed) {
		releaseContext(context);
		return installed;
	}

	releaseContext(this->spvcContext);
	this->spvcContext = context;
	this->spvcCompiler = compiler;
	this->compiledSinceConfigure = false;
	this->options = flat;
	this->configured = true;
	this->vertexAttributes = spvmsl::std::move(vertexAttributes);
	this->resourceBindings = spvmsl::std::move(resourceBindings);

	spvmsl::std::iPrintf("Configured msl session: %s msl %s, %zu vertex attribute and %zu resource binding overrides",
						 nameOf(flat.platform, knownPlatforms), nameOf(flat.version, knownVersions),
						 this->vertexAttributes.size(), this->resourceBindings.size());
	spvmsl::std::debugRun([&] {
		for (const auto& va : this->vertexAttributes) {
			spvmsl::std::vPrintf("  vertex attribute %u: buffer %u offset %u stride %u step %s format %s builtin %s",
								 va.location, va.buffer, va.offset, va.stride,
								 toString(va.perInstance != SPVMSL_FALSE ? vertexStep::instance : vertexStep::vertex),
								 nameOf(va.format, knownVertexFormats), nameOf(va.builtin, knownBuiltIns));
		}
		for (const auto& rb : this->resourceBindings) {
			spvmsl::std::vPrintf("  resource %s set %u binding %u: buffer %u texture %u sampler %u",
								 nameOf(rb.stage, knownStages), rb.descSet, rb.binding, rb.buffer, rb.texture, rb.sampler);
		}
	});
	return {};
}

result<void> session::submitOverrides() const noexcept {
	for (const auto& va : this->vertexAttributes) {
		spvc_msl_vertex_attribute attr;
		spvc_msl_vertex_attribute_init(&attr);
		attr.location = va.location;
		attr.msl_buffer = va.buffer;
		attr.msl_offset = va.offset;
		attr.msl_stride = va.stride;
		attr.per_instance = toSpvcBool(va.perInstance);
		attr.format = static_cast<spvc_msl_vertex_format>(va.format);
		attr.builtin = static_cast<SpvBuiltIn>(va.builtin);

		const auto ret = spvc_compiler_msl_add_vertex_attribute(this->spvcCompiler, &attr);
		if (ret != SPVC_SUCCESS) {
			spvmsl::std::ePrintf("Failed to add vertex attribute override at location %u (%s): %s", va.location,
								 spvcResultStr(ret), getLastErrorString());
			return fail(spvmsl_errorKind_compilation, ret);
		}
	}

	for (const auto& rb : this->resourceBindings) {
		spvc_msl_resource_binding binding;
		spvc_msl_resource_binding_init(&binding);
		binding.stage = static_cast<SpvExecutionModel>(rb.stage);
		binding.desc_set = rb.descSet;
		binding.binding = rb.binding;
		binding.msl_buffer = rb.buffer;
		binding.msl_texture = rb.texture;
		binding.msl_sampler = rb.sampler;

		const auto ret = spvc_compiler_msl_add_resource_binding(this->spvcCompiler, &binding);
		if (ret != SPVC_SUCCESS) {
			spvmsl::std::ePrintf("Failed to add resource binding override for %s set %u binding %u (%s): %s",
								 nameOf(rb.stage, knownStages), rb.descSet, rb.binding, spvcResultStr(ret),
								 getLastErrorString());
			return fail(spvmsl_errorKind_compilation, ret);
		}
	}
	return {};
}

result<spvmsl::std::string<char>> session::compile() noexcept {
	if (auto submitted = submitOverrides(); !submitted) {
		return fail(submitted.error().kind, submitted.error().nativeCode);
	}

	// Owned by the context, released with it.
	const char* source = nullptr;
	const auto ret = spvc_compiler_compile(this->spvcCompiler, &source);
	if (ret != SPVC_SUCCESS) {
		spvmsl::std::ePrintf("Failed to compile msl (%s): %s", spvcResultStr(ret), getLastErrorString());
		return fail(spvmsl_errorKind_compilation, ret);
	}

	const size_t sz = spvmsl::std::strlen(source);
	if (!spvmsl::std::validUTF8(source, sz)) {
		spvmsl::std::ePrintf("Generated msl is not valid utf-8");
		return fail(spvmsl_errorKind_encoding, 0);
	}

	this->compiledSinceConfigure = true;
	spvmsl::std::vPrintf("Compiled msl: %zu bytes", sz);
	return spvmsl::std::string<char>(sz, source);
}

result<bool> session::isRasterizationEnabled() const noexcept {
	if (spvc_compiler_get_backend(this->spvcCompiler) != SPVC_BACKEND_MSL) {
		spvmsl::std::ePrintf("Rasterization state queried on a non msl compiler");
		return fail(spvmsl_errorKind_query, SPVC_ERROR_INVALID_ARGUMENT);
	}
	// SPIRV-Cross derives the flag during compile.
	if (!this->compiledSinceConfigure) {
		spvmsl::std::wPrintf("Rasterization state queried before compiling, the result reflects defaults");
	}
	return spvc_compiler_msl_is_rasterization_disabled(this->spvcCompiler) == SPVC_FALSE;
}
}  // namespace spvmsl::msl
