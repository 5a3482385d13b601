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

#ifndef __ledbetter__programsandbox__
#define __ledbetter__programsandbox__

#include "ledbetter_common.hpp"
#include "wasmengine.hpp"
#include "colorpipeline.hpp"

using namespace std;

namespace lb {

  /// sandbox tuning
  struct SandboxParams
  {
    uint32_t faultThreshold; ///< consecutive faults after which a program is unloaded
    uint32_t fuelPerMs; ///< instructions per millisecond of frame period, also converts fuel into a time limit
    uint64_t initFuel; ///< instruction budget for start and init
    uint32_t memoryLimitKb; ///< ceiling for program linear memory
    SandboxParams() : faultThreshold(5), fuelPerMs(20000), initFuel(20000000), memoryLimitKb(1024) {};
  };


  /// Runs the active program on the render thread.
  /// Owns the program instance exclusively, a new program replaces it as a whole.
  class ProgramSandbox : public LBLoggingObj
  {
    typedef LBLoggingObj inherited;

    SandboxParams mParams;

    WasmModulePtr mModule;
    WasmInstancePtr mInstance;
    uint32_t mFrameOffset; ///< validated offset of the pixel bytes in program memory
    size_t mPixelCount; ///< pixel count the instance was initialized for

    uint64_t mGeneration;
    uint32_t mConsecutiveFaults;

  public:

    ProgramSandbox(const SandboxParams &aParams = SandboxParams());

    virtual string logContextPrefix() LB_OVERRIDE;

    /// decode and validate a program binary (pure, can be called from any thread)
    /// @return OK or CompileError
    static ErrorPtr compile(const string &aBinary, const SandboxParams &aParams, WasmModulePtr &aModule);

    /// instantiate a program, run its start and init functions and make it the active program
    /// @param aModule a compiled program
    /// @param aPixelCount number of pixels the program must render
    /// @return OK or error. On error, the previously active program keeps running
    ErrorPtr load(WasmModulePtr aModule, size_t aPixelCount);

    /// render one frame
    /// @param aFrameIndex index of the frame (for logging)
    /// @param aTimeMs time passed to the program
    /// @param aPixelCount the active pixel count, changes cause a reinit
    /// @param aFramePeriodMs frame period, determines the instruction budget and the time limit
    /// @param aFrame receives exactly aPixelCount pixels on success
    /// @return OK or SandboxError
    ErrorPtr render(uint64_t aFrameIndex, uint32_t aTimeMs, size_t aPixelCount, uint32_t aFramePeriodMs, RawFrame &aFrame);

    /// report a failed render
    /// @param aGeneration the generation the fault happened in, faults from older generations are ignored
    /// @return true if the fault threshold was reached and the program was unloaded
    bool noteFault(uint64_t aGeneration);

    /// report a successful render
    void noteSuccess() { mConsecutiveFaults = 0; }

    /// re-instantiate the active program for a different pixel count
    /// @return OK or error. On error the program is unloaded
    ErrorPtr reinit(size_t aPixelCount);

    /// unload the active program
    void unload();

    bool hasProgram() const { return mInstance!=NULL; }
    uint64_t generation() const { return mGeneration; }
    uint32_t consecutiveFaults() const { return mConsecutiveFaults; }
    const SandboxParams &params() const { return mParams; }

  private:

    WasmBudget initBudget() const;
    ErrorPtr instantiateAndInit(WasmModulePtr aModule, size_t aPixelCount, WasmInstancePtr &aInstance, uint32_t &aFrameOffset);

  };

} // namespace lb

#endif /* defined(__ledbetter__programsandbox__) */
