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

#include <stdint.h>
#include <string.h>

#include <gtest/gtest.h>
#include <spirv_cross/spirv_cross_c.h>

#include "spvmsl/spvmsl.h"
#include "msl/format.hpp"
#include "msl/options.hpp"

using namespace spvmsl::msl;

TEST(CompilerOptions, DefaultsTranslateToDocumentedRecord) {
	const compilerOptions options{};
	const auto flat = options.translate();

	EXPECT_EQ(flat.vertexInvertY, SPVMSL_FALSE);
	EXPECT_EQ(flat.vertexTransformClipSpace, SPVMSL_FALSE);
	EXPECT_EQ(flat.platform, static_cast<uint32_t>(SPVC_MSL_PLATFORM_MACOS));
	EXPECT_EQ(flat.version, 10200u);
	EXPECT_EQ(flat.enablePointSizeBuiltin, SPVMSL_TRUE);
	EXPECT_EQ(flat.disableRasterization, SPVMSL_FALSE);
	EXPECT_EQ(flat.swizzleBufferIndex, 30u);
	EXPECT_EQ(flat.indirectParamsBufferIndex, 29u);
	EXPECT_EQ(flat.shaderOutputBufferIndex, 28u);
	EXPECT_EQ(flat.shaderPatchOutputBufferIndex, 27u);
	EXPECT_EQ(flat.shaderTessFactorBufferIndex, 26u);
	EXPECT_EQ(flat.bufferSizeBufferIndex, 25u);
	EXPECT_EQ(flat.captureOutputToBuffer, SPVMSL_FALSE);
	EXPECT_EQ(flat.swizzleTextureSamples, SPVMSL_FALSE);
	EXPECT_EQ(flat.tessDomainOriginLowerLeft, SPVMSL_FALSE);
	EXPECT_EQ(flat.argumentBuffers, SPVMSL_FALSE);
	EXPECT_EQ(flat.padFragmentOutputComponents, SPVMSL_FALSE);

	EXPECT_EQ(options.translateVertexAttributes().size(), 0u);
	EXPECT_EQ(options.translateResourceBindings().size(), 0u);
}

TEST(CompilerOptions, RasterizationFlagIsInverted) {
	compilerOptions options;
	options.enableRasterization = false;
	EXPECT_EQ(options.translate().disableRasterization, SPVMSL_TRUE);

	options.enableRasterization = true;
	EXPECT_EQ(options.translate().disableRasterization, SPVMSL_FALSE);
}

TEST(CompilerOptions, ScalarFieldsMirrorTypedOptions) {
	compilerOptions options;
	options.platform = platform::iOS;
	options.version = version::v2_1;
	options.vertex = {.invertY = true, .transformClipSpace = true};
	options.swizzleBufferIndex = 1;
	options.indirectParamsBufferIndex = 2;
	options.outputBufferIndex = 3;
	options.patchOutputBufferIndex = 4;
	options.tessellationFactorBufferIndex = 5;
	options.bufferSizeBufferIndex = 6;
	options.enablePointSizeBuiltin = false;
	options.captureOutputToBuffer = true;
	options.swizzleTextureSamples = true;
	options.tessellationDomainOriginLowerLeft = true;
	options.enableArgumentBuffers = true;
	options.padFragmentOutputComponents = true;

	const auto flat = options.translate();
	EXPECT_EQ(flat.platform, static_cast<uint32_t>(SPVC_MSL_PLATFORM_IOS));
	EXPECT_EQ(flat.version, 20100u);
	EXPECT_EQ(flat.vertexInvertY, SPVMSL_TRUE);
	EXPECT_EQ(flat.vertexTransformClipSpace, SPVMSL_TRUE);
	EXPECT_EQ(flat.swizzleBufferIndex, 1u);
	EXPECT_EQ(flat.indirectParamsBufferIndex, 2u);
	EXPECT_EQ(flat.shaderOutputBufferIndex, 3u);
	EXPECT_EQ(flat.shaderPatchOutputBufferIndex, 4u);
	EXPECT_EQ(flat.shaderTessFactorBufferIndex, 5u);
	EXPECT_EQ(flat.bufferSizeBufferIndex, 6u);
	EXPECT_EQ(flat.enablePointSizeBuiltin, SPVMSL_FALSE);
	EXPECT_EQ(flat.captureOutputToBuffer, SPVMSL_TRUE);
	EXPECT_EQ(flat.swizzleTextureSamples, SPVMSL_TRUE);
	EXPECT_EQ(flat.tessDomainOriginLowerLeft, SPVMSL_TRUE);
	EXPECT_EQ(flat.argumentBuffers, SPVMSL_TRUE);
	EXPECT_EQ(flat.padFragmentOutputComponents, SPVMSL_TRUE);
}

TEST(CompilerOptions, TranslateIsRepeatable) {
	compilerOptions options;
	options.version = version::v2_0;
	options.vertexAttributes.insert({1}, vertexAttribute{.bufferID = 2, .stride = 12});
	options.resourceBindings.insert({executionStage::fragment, 0, 0}, resourceBinding{.bufferID = 3});

	const auto a = options.translate();
	const auto b = options.translate();
	EXPECT_EQ(memcmp(&a, &b, sizeof(a)), 0);

	const auto va0 = options.translateVertexAttributes();
	const auto va1 = options.translateVertexAttributes();
	ASSERT_EQ(va0.size(), va1.size());
	EXPECT_EQ(memcmp(va0.get(), va1.get(), va0.size() * sizeof(spvmsl_vertexAttribute)), 0);

	const auto rb0 = options.translateResourceBindings();
	const auto rb1 = options.translateResourceBindings();
	ASSERT_EQ(rb0.size(), rb1.size());
	EXPECT_EQ(memcmp(rb0.get(), rb1.get(), rb0.size() * sizeof(spvmsl_resourceBinding)), 0);
}

TEST(CompilerOptions, CApiDefaultsMatchTypedDefaults) {
	spvmsl_compilerOptions fromC;
	spvmsl_msl_getDefaultCompilerOptions(&fromC);
	const auto typed = compilerOptions().translate();
	EXPECT_EQ(memcmp(&fromC, &typed, sizeof(fromC)), 0);
}
