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

#ifndef __ledbetter__wasmengine__
#define __ledbetter__wasmengine__

#include "ledbetter_common.hpp"

#include <wasmtime.h>
#include <pthread.h>
#include <atomic>

using namespace std;

namespace lb {

  /// errors detected while validating a program binary
  class CompileError : public Error
  {
  public:
    typedef enum {
      OK,
      Malformed, ///< not a valid WebAssembly binary, or uses a feature the engine has disabled
      Unsupported, ///< valid WebAssembly, but uses an import or ABI version this host does not provide
      Limits, ///< exceeds the host's memory limit
      MissingExport, ///< a required export is missing
      BadSignature, ///< an import or export does not have the required signature
      numErrorCodes
    } ErrorCodes;

    static const char *domain() { return "WasmCompile"; }
    virtual const char *getErrorDomain() const LB_OVERRIDE { return CompileError::domain(); };
    CompileError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const LB_OVERRIDE
    {
      static const char* const errNames[numErrorCodes] = { "OK", "Malformed", "Unsupported", "Limits", "MissingExport", "BadSignature" };
      return getErrorCode()<numErrorCodes ? errNames[getErrorCode()] : NULL;
    }
    #endif // ENABLE_NAMED_ERRORS
  };


  /// errors from running a program
  class SandboxError : public Error
  {
  public:
    typedef enum {
      OK,
      Trap, ///< the program trapped (or called abort)
      ResourceLimitExceeded, ///< instruction budget (fuel) or time slot exhausted
      InvalidOutput, ///< the program returned an invalid frame
      NoProgram, ///< no program loaded
      numErrorCodes
    } ErrorCodes;

    static const char *domain() { return "Sandbox"; }
    virtual const char *getErrorDomain() const LB_OVERRIDE { return SandboxError::domain(); };
    SandboxError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const LB_OVERRIDE
    {
      static const char* const errNames[numErrorCodes] = { "OK", "Trap", "ResourceLimitExceeded", "InvalidOutput", "NoProgram" };
      return getErrorCode()<numErrorCodes ? errNames[getErrorCode()] : NULL;
    }
    #endif // ENABLE_NAMED_ERRORS
  };


  const uint32_t WasmPageSize = 65536;

  /// host imposed limits for programs
  struct WasmLimits
  {
    uint32_t maxMemoryPages; ///< ceiling for initial size and growth of the linear memory
    uint32_t maxTableElements;
    WasmLimits() : maxMemoryPages(16), maxTableElements(4096) {};
  };

  /// execution budget of a single call
  struct WasmBudget
  {
    uint64_t fuel; ///< instructions
    uint32_t timeMs; ///< wall clock limit, enforced in steps of the engine's epoch tick
    WasmBudget(uint64_t aFuel, uint32_t aTimeMs) : fuel(aFuel), timeMs(aTimeMs) {};
  };


  /// The process wide wasmtime engine.
  /// Fuel metering and epoch interruption are enabled, a ticker thread advances the epoch.
  class WasmEngine
  {
    wasm_engine_t *mEngine;
    wasmtime_linker_t *mLinker; ///< provides the host functions
    pthread_t mTicker;
    bool mTickerRunning;
    std::atomic<bool> mStopTicker;

    WasmEngine();
    WasmEngine(const WasmEngine &);
    WasmEngine &operator=(const WasmEngine &);

  public:

    ~WasmEngine();

    static WasmEngine &sharedEngine();

    wasm_engine_t *engine() const { return mEngine; }
    wasmtime_linker_t *linker() const { return mLinker; }

    /// @return number of epoch ticks that fit into aTimeMs, at least 1
    static uint64_t epochTicksFor(uint32_t aTimeMs);

  private:

    static void *tickerThread(void *aEngineP);
    ErrorPtr defineHostFunctions();

  };


  class WasmModule;
  typedef boost::intrusive_ptr<WasmModule> WasmModulePtr;

  /// a compiled and validated, immutable program module
  class WasmModule : public LBObj
  {
    typedef LBObj inherited;

    wasmtime_module_t *mModule;
    WasmLimits mLimits;
    bool mHasAbiVersion;

    WasmModule(wasmtime_module_t *aModule, const WasmLimits &aLimits);

  public:

    virtual ~WasmModule();

    /// compile and validate a program binary
    /// @param aBinary the WebAssembly binary
    /// @param aLimits host limits to check against
    /// @param aModule set to the compiled module on success
    /// @return OK or CompileError
    static ErrorPtr compile(const string &aBinary, const WasmLimits &aLimits, WasmModulePtr &aModule);

    wasmtime_module_t *module() const { return mModule; }
    const WasmLimits &limits() const { return mLimits; }
    bool hasAbiVersion() const { return mHasAbiVersion; }

  private:

    ErrorPtr checkImports();
    ErrorPtr checkExports();

  };


  class WasmInstance;
  typedef boost::intrusive_ptr<WasmInstance> WasmInstancePtr;

  /// an instantiated program in its own store, with its own memory, globals and table
  class WasmInstance : public LBObj
  {
    typedef LBObj inherited;

    WasmModulePtr mModule;
    wasmtime_store_t *mStore;
    wasmtime_context_t *mContext;
    wasmtime_instance_t mInstance;
    wasmtime_memory_t mMemory;
    uint64_t mFuelUsed;

    WasmInstance(WasmModulePtr aModule);

  public:

    virtual ~WasmInstance();

    /// create a new instance: memory, data segments, globals, table, elements, start function
    /// @param aBudget budget for the start function
    static ErrorPtr instantiate(WasmModulePtr aModule, const WasmBudget &aBudget, WasmInstancePtr &aInstance);

    /// call an exported (i32)->i32 function
    /// @return OK or SandboxError
    ErrorPtr callI32(const char *aExportName, int32_t aArg, int32_t &aResult, const WasmBudget &aBudget);

    WasmModulePtr module() const { return mModule; }

    /// @note the memory can move when the program grows it, do not keep the pointer across calls
    const uint8_t *memory() const;
    size_t memorySize() const;

    /// @return instructions executed by the last call
    uint64_t fuelUsed() const { return mFuelUsed; }

  private:

    ErrorPtr prepareCall(const WasmBudget &aBudget);
    void noteFuel(const WasmBudget &aBudget);

  };

} // namespace lb

#endif /* defined(__ledbetter__wasmengine__) */
