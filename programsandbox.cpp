//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2025 The ledbetter authors
//
//  This file is part of ledbetter.
//
//  ledbetter is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  ledbetter is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with ledbetter. If not, see <http://www.gnu.org/licenses/>.
//

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "programsandbox.hpp"

using namespace lb;


ProgramSandbox::ProgramSandbox(const SandboxParams &aParams) :
  mParams(aParams),
  mFrameOffset(0),
  mPixelCount(0),
  mGeneration(0),
  mConsecutiveFaults(0)
{
}


string ProgramSandbox::logContextPrefix()
{
  return string_format("sandbox gen %llu", (unsigned long long)mGeneration);
}


ErrorPtr ProgramSandbox::compile(const string &aBinary, const SandboxParams &aParams, WasmModulePtr &aModule)
{
  WasmLimits limits;
  limits.maxMemoryPages = (uint32_t)((uint64_t)aParams.memoryLimitKb*1024/WasmPageSize);
  if (limits.maxMemoryPages<1) limits.maxMemoryPages = 1;
  return WasmModule::compile(aBinary, limits, aModule);
}


static const uint32_t MinInitTimeMs = 100;

WasmBudget ProgramSandbox::initBudget() const
{
  uint32_t fuelPerMs = mParams.fuelPerMs>0 ? mParams.fuelPerMs : 1;
  uint64_t ms = mParams.initFuel/fuelPerMs;
  return WasmBudget(mParams.initFuel, ms<MinInitTimeMs ? MinInitTimeMs : (uint32_t)ms);
}


ErrorPtr ProgramSandbox::instantiateAndInit(WasmModulePtr aModule, size_t aPixelCount, WasmInstancePtr &aInstance, uint32_t &aFrameOffset)
{
  WasmInstancePtr inst;
  ErrorPtr err = WasmInstance::instantiate(aModule, initBudget(), inst);
  if (Error::notOK(err)) return err;
  int32_t offset;
  err = inst->callI32("init", (int32_t)aPixelCount, offset, initBudget());
  if (Error::notOK(err)) return err->withPrefix("init: ");
  FOCUSOLOG("init(%zu) used %llu instructions", aPixelCount, (unsigned long long)inst->fuelUsed());
  // memory never shrinks, so the frame area stays valid once checked
  if ((uint64_t)(uint32_t)offset+aPixelCount*3>inst->memorySize()) {
    return Error::err<SandboxError>(SandboxError::InvalidOutput,
      "init returned frame offset %u, %zu pixels do not fit into %zu bytes of memory",
      (uint32_t)offset, aPixelCount, inst->memorySize()
    );
  }
  aInstance = inst;
  aFrameOffset = (uint32_t)offset;
  return ErrorPtr();
}


ErrorPtr ProgramSandbox::load(WasmModulePtr aModule, size_t aPixelCount)
{
  if (!aModule) return Error::err<SandboxError>(SandboxError::NoProgram, "no program to load");
  WasmInstancePtr inst;
  uint32_t offset;
  ErrorPtr err = instantiateAndInit(aModule, aPixelCount, inst, offset);
  if (Error::notOK(err)) {
    OLOG(LOG_ERR, "new program failed to initialize, keeping current program: %s", err->text());
    return err;
  }
  mModule = aModule;
  mInstance = inst;
  mFrameOffset = offset;
  mPixelCount = aPixelCount;
  mGeneration++;
  mConsecutiveFaults = 0;
  OLOG(LOG_NOTICE, "program loaded for %zu pixels, frame at offset %u", aPixelCount, offset);
  return ErrorPtr();
}


ErrorPtr ProgramSandbox::reinit(size_t aPixelCount)
{
  if (!mModule) {
    mPixelCount = aPixelCount;
    return ErrorPtr();
  }
  WasmInstancePtr inst;
  uint32_t offset;
  ErrorPtr err = instantiateAndInit(mModule, aPixelCount, inst, offset);
  if (Error::notOK(err)) {
    OLOG(LOG_ERR, "program failed to reinitialize for %zu pixels, unloading: %s", aPixelCount, err->text());
    unload();
    mPixelCount = aPixelCount;
    return err;
  }
  mInstance = inst;
  mFrameOffset = offset;
  mPixelCount = aPixelCount;
  mConsecutiveFaults = 0;
  OLOG(LOG_INFO, "program reinitialized for %zu pixels", aPixelCount);
  return ErrorPtr();
}


void ProgramSandbox::unload()
{
  if (mInstance) {
    OLOG(LOG_WARNING, "program unloaded");
  }
  mInstance.reset();
  mModule.reset();
  mConsecutiveFaults = 0;
}


ErrorPtr ProgramSandbox::render(uint64_t aFrameIndex, uint32_t aTimeMs, size_t aPixelCount, uint32_t aFramePeriodMs, RawFrame &aFrame)
{
  if (!mInstance) return Error::err<SandboxError>(SandboxError::NoProgram, "no program loaded");
  if (aPixelCount!=mPixelCount) {
    ErrorPtr err = reinit(aPixelCount);
    if (Error::notOK(err)) return err;
  }
  uint32_t periodMs = aFramePeriodMs>0 ? aFramePeriodMs : 1;
  int32_t byteCount;
  ErrorPtr err = mInstance->callI32("render", (int32_t)aTimeMs, byteCount, WasmBudget((uint64_t)periodMs*mParams.fuelPerMs, periodMs));
  if (Error::notOK(err)) {
    err->prefixMessage("frame %llu: ", (unsigned long long)aFrameIndex);
    return err;
  }
  if (byteCount<0 || (size_t)byteCount!=aPixelCount*3) {
    return Error::err<SandboxError>(SandboxError::InvalidOutput,
      "frame %llu: render returned %d bytes, expected %zu",
      (unsigned long long)aFrameIndex, byteCount, aPixelCount*3
    );
  }
  const uint8_t *p = mInstance->memory()+mFrameOffset;
  aFrame.resize(aPixelCount);
  for (size_t i=0; i<aPixelCount; i++) {
    aFrame[i].r = *p++;
    aFrame[i].g = *p++;
    aFrame[i].b = *p++;
  }
  return ErrorPtr();
}


bool ProgramSandbox::noteFault(uint64_t aGeneration)
{
  if (aGeneration!=mGeneration || !mInstance) {
    FOCUSOLOG("ignoring fault report from generation %llu", (unsigned long long)aGeneration);
    return false;
  }
  mConsecutiveFaults++;
  if (mConsecutiveFaults>=mParams.faultThreshold) {
    OLOG(LOG_ERR, "%u consecutive faults, unloading program", mConsecutiveFaults);
    unload();
    return true;
  }
  return false;
}
