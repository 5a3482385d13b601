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

#include "wasmengine.hpp"
#include "colorutils.hpp"

#include <string.h>
#include <unistd.h>

using namespace lb;

#define EPOCH_TICK_MS 5 ///< resolution of the wall clock limit for program calls
#define MAX_WASM_STACK (256*1024) ///< bytes of native stack a program may use


// MARK: - wasmtime helpers

static string nameString(const wasm_name_t *aName)
{
  return string(aName->data, aName->size);
}


/// @note consumes aError
static string wasmtimeErrorText(wasmtime_error_t *aError)
{
  wasm_name_t msg;
  wasmtime_error_message(aError, &msg);
  string s(msg.data, msg.size);
  wasm_byte_vec_delete(&msg);
  wasmtime_error_delete(aError);
  return s;
}


/// @note consumes aTrap
static ErrorPtr trapError(wasm_trap_t *aTrap)
{
  ErrorPtr err;
  wasmtime_trap_code_t code;
  bool hasCode = wasmtime_trap_code(aTrap, &code);
  if (hasCode && code==WASMTIME_TRAP_CODE_OUT_OF_FUEL) {
    err = Error::err<SandboxError>(SandboxError::ResourceLimitExceeded, "instruction budget exhausted");
  }
  else if (hasCode && code==WASMTIME_TRAP_CODE_INTERRUPT) {
    err = Error::err<SandboxError>(SandboxError::ResourceLimitExceeded, "time slot exceeded");
  }
  else {
    wasm_message_t msg;
    wasm_trap_message(aTrap, &msg);
    string s(msg.data, msg.size);
    wasm_byte_vec_delete(&msg);
    while (!s.empty() && s[s.size()-1]=='\0') s.erase(s.size()-1);
    err = Error::err<SandboxError>(SandboxError::Trap, "%s", s.c_str());
  }
  wasm_trap_delete(aTrap);
  return err;
}


static const char *valKindName(wasm_valkind_t aKind)
{
  switch (aKind) {
    case WASM_I32: return "i32";
    case WASM_I64: return "i64";
    case WASM_F32: return "f32";
    case WASM_F64: return "f64";
    default: return "ref";
  }
}


static string signatureText(const wasm_functype_t *aType)
{
  const wasm_valtype_vec_t *params = wasm_functype_params(aType);
  const wasm_valtype_vec_t *results = wasm_functype_results(aType);
  string s = "(";
  for (size_t i=0; i<params->size; i++) {
    if (i>0) s += ",";
    s += valKindName(wasm_valtype_kind(params->data[i]));
  }
  s += ")->(";
  for (size_t i=0; i<results->size; i++) {
    if (i>0) s += ",";
    s += valKindName(wasm_valtype_kind(results->data[i]));
  }
  s += ")";
  return s;
}


/// @return true if aType is a function type with only i32 parameters and results, in the given numbers
static bool isI32Function(const wasm_externtype_t *aType, size_t aNumParams, size_t aNumResults)
{
  if (wasm_externtype_kind(aType)!=WASM_EXTERN_FUNC) return false;
  const wasm_functype_t *ft = wasm_externtype_as_functype_const(aType);
  const wasm_valtype_vec_t *params = wasm_functype_params(ft);
  const wasm_valtype_vec_t *results = wasm_functype_results(ft);
  if (params->size!=aNumParams || results->size!=aNumResults) return false;
  for (size_t i=0; i<params->size; i++) if (wasm_valtype_kind(params->data[i])!=WASM_I32) return false;
  for (size_t i=0; i<results->size; i++) if (wasm_valtype_kind(results->data[i])!=WASM_I32) return false;
  return true;
}


static string externTypeText(const wasm_externtype_t *aType)
{
  if (wasm_externtype_kind(aType)!=WASM_EXTERN_FUNC) return "not a function";
  return signatureText(wasm_externtype_as_functype_const(aType));
}


static wasm_functype_t *newI32FuncType(size_t aNumParams, size_t aNumResults)
{
  wasm_valtype_vec_t params, results;
  wasm_valtype_vec_new_uninitialized(&params, aNumParams);
  for (size_t i=0; i<aNumParams; i++) params.data[i] = wasm_valtype_new(WASM_I32);
  wasm_valtype_vec_new_uninitialized(&results, aNumResults);
  for (size_t i=0; i<aNumResults; i++) results.data[i] = wasm_valtype_new(WASM_I32);
  return wasm_functype_new(&params, &results);
}


// MARK: - host functions

/// read an AssemblyScript style string (UTF-16LE, byte length at aPtr-4) from the caller's memory
/// @return the string (non-ASCII replaced by '?'), empty if out of bounds
static string programString(wasmtime_caller_t *aCaller, uint32_t aPtr)
{
  string s;
  wasmtime_extern_t item;
  if (!wasmtime_caller_export_get(aCaller, "memory", 6, &item) || item.kind!=WASMTIME_EXTERN_MEMORY) return s;
  wasmtime_context_t *ctx = wasmtime_caller_context(aCaller);
  const uint8_t *mem = wasmtime_memory_data(ctx, &item.of.memory);
  size_t size = wasmtime_memory_data_size(ctx, &item.of.memory);
  if (aPtr<4 || (size_t)aPtr>size) return s;
  uint32_t len;
  memcpy(&len, mem+aPtr-4, 4);
  if ((uint64_t)aPtr+len>size) return s;
  for (uint32_t i=0; i+1<len && s.size()<200; i+=2) {
    uint16_t c = mem[aPtr+i] | (mem[aPtr+i+1]<<8);
    s += (c>=0x20 && c<0x7F) ? (char)c : '?';
  }
  return s;
}


/// env.abort(i32 msg, i32 file, i32 line, i32 column)
static wasm_trap_t *hostAbort(void *aEnv, wasmtime_caller_t *aCaller, const wasmtime_val_t *aArgs, size_t aNumArgs, wasmtime_val_t *aResults, size_t aNumResults)
{
  uint32_t msg = (uint32_t)aArgs[0].of.i32;
  uint32_t file = (uint32_t)aArgs[1].of.i32;
  LOG(LOG_WARNING,
    "program aborted: msg=%u '%s', file=%u '%s', line=%d, column=%d",
    msg, programString(aCaller, msg).c_str(), file, programString(aCaller, file).c_str(), aArgs[2].of.i32, aArgs[3].of.i32
  );
  string t = string_format("abort called at line %d, column %d", aArgs[2].of.i32, aArgs[3].of.i32);
  return wasmtime_trap_new(t.c_str(), t.size());
}


/// colorConvert.hsvToRgbEncoded(i32 h, i32 s, i32 v) -> i32 0xFFRRGGBB
static wasm_trap_t *hostHsvToRgbEncoded(void *aEnv, wasmtime_caller_t *aCaller, const wasmtime_val_t *aArgs, size_t aNumArgs, wasmtime_val_t *aResults, size_t aNumResults)
{
  aResults[0].kind = WASMTIME_I32;
  aResults[0].of.i32 = (int32_t)hsvToArgbEncoded((uint32_t)aArgs[0].of.i32, (uint32_t)aArgs[1].of.i32, (uint32_t)aArgs[2].of.i32);
  return NULL;
}


// MARK: - WasmEngine

WasmEngine::WasmEngine() :
  mEngine(NULL),
  mLinker(NULL),
  mTickerRunning(false),
  mStopTicker(false)
{
  wasm_config_t *config = wasm_config_new();
  wasmtime_config_consume_fuel_set(config, true);
  wasmtime_config_epoch_interruption_set(config, true);
  wasmtime_config_max_wasm_stack_set(config, MAX_WASM_STACK);
  wasmtime_config_wasm_relaxed_simd_set(config, false);
  wasmtime_config_wasm_simd_set(config, false);
  mEngine = wasm_engine_new_with_config(config); // takes the config
  mLinker = wasmtime_linker_new(mEngine);
  ErrorPtr err = defineHostFunctions();
  if (Error::notOK(err)) {
    LOG(LOG_ERR, "host functions not available to programs: %s", err->text());
  }
  mTickerRunning = pthread_create(&mTicker, NULL, tickerThread, this)==0;
  if (!mTickerRunning) {
    LOG(LOG_ERR, "cannot start epoch ticker, program calls are limited by fuel only");
  }
}


WasmEngine::~WasmEngine()
{
  if (mTickerRunning) {
    mStopTicker = true;
    pthread_join(mTicker, NULL);
  }
  wasmtime_linker_delete(mLinker);
  wasm_engine_delete(mEngine);
}


WasmEngine &WasmEngine::sharedEngine()
{
  static WasmEngine engine;
  return engine;
}


uint64_t WasmEngine::epochTicksFor(uint32_t aTimeMs)
{
  // the first tick may come right after the deadline is set
  return aTimeMs/EPOCH_TICK_MS+1;
}


void *WasmEngine::tickerThread(void *aEngineP)
{
  WasmEngine *engine = static_cast<WasmEngine *>(aEngineP);
  while (!engine->mStopTicker) {
    usleep(EPOCH_TICK_MS*1000);
    wasm_engine_increment_epoch(engine->mEngine);
  }
  return NULL;
}


ErrorPtr WasmEngine::defineHostFunctions()
{
  wasm_functype_t *ty = newI32FuncType(4, 0);
  wasmtime_error_t *werr = wasmtime_linker_define_func(mLinker, "env", 3, "abort", 5, ty, hostAbort, NULL, NULL);
  wasm_functype_delete(ty);
  if (werr) return TextError::err("env.abort: %s", wasmtimeErrorText(werr).c_str());
  ty = newI32FuncType(3, 1);
  werr = wasmtime_linker_define_func(mLinker, "colorConvert", 12, "hsvToRgbEncoded", 15, ty, hostHsvToRgbEncoded, NULL, NULL);
  wasm_functype_delete(ty);
  if (werr) return TextError::err("colorConvert.hsvToRgbEncoded: %s", wasmtimeErrorText(werr).c_str());
  return ErrorPtr();
}


// MARK: - WasmModule

WasmModule::WasmModule(wasmtime_module_t *aModule, const WasmLimits &aLimits) :
  mModule(aModule),
  mLimits(aLimits),
  mHasAbiVersion(false)
{
}


WasmModule::~WasmModule()
{
  wasmtime_module_delete(mModule);
}


ErrorPtr WasmModule::compile(const string &aBinary, const WasmLimits &aLimits, WasmModulePtr &aModule)
{
  aModule.reset();
  wasmtime_module_t *mod = NULL;
  wasmtime_error_t *werr = wasmtime_module_new(WasmEngine::sharedEngine().engine(), (const uint8_t *)aBinary.data(), aBinary.size(), &mod);
  if (werr) {
    return Error::err<CompileError>(CompileError::Malformed, "%s", wasmtimeErrorText(werr).c_str());
  }
  WasmModulePtr m = WasmModulePtr(new WasmModule(mod, aLimits));
  ErrorPtr err = m->checkImports();
  if (Error::isOK(err)) err = m->checkExports();
  if (Error::notOK(err)) return err;
  FOCUSLOG("compiled %zu byte program", aBinary.size());
  aModule = m;
  return ErrorPtr();
}


ErrorPtr WasmModule::checkImports()
{
  ErrorPtr err;
  wasm_importtype_vec_t imports;
  wasmtime_module_imports(mModule, &imports);
  for (size_t i=0; i<imports.size; i++) {
    const wasm_importtype_t *imp = imports.data[i];
    string modName = nameString(wasm_importtype_module(imp));
    string fieldName = nameString(wasm_importtype_name(imp));
    const wasm_externtype_t *ty = wasm_importtype_type(imp);
    size_t numParams, numResults;
    if (modName=="env" && fieldName=="abort") {
      numParams = 4; numResults = 0;
    }
    else if (modName=="colorConvert" && fieldName=="hsvToRgbEncoded") {
      numParams = 3; numResults = 1;
    }
    else {
      err = Error::err<CompileError>(CompileError::Unsupported, "unknown import %s.%s", modName.c_str(), fieldName.c_str());
      break;
    }
    if (!isI32Function(ty, numParams, numResults)) {
      err = Error::err<CompileError>(CompileError::BadSignature, "import %s.%s has wrong type: %s",
        modName.c_str(), fieldName.c_str(), externTypeText(ty).c_str()
      );
      break;
    }
  }
  wasm_importtype_vec_delete(&imports);
  return err;
}


ErrorPtr WasmModule::checkExports()
{
  ErrorPtr err;
  bool hasInit = false;
  bool hasRender = false;
  bool hasMemory = false;
  wasm_exporttype_vec_t exports;
  wasmtime_module_exports(mModule, &exports);
  for (size_t i=0; i<exports.size; i++) {
    string n = nameString(wasm_exporttype_name(exports.data[i]));
    const wasm_externtype_t *ty = wasm_exporttype_type(exports.data[i]);
    if (n=="init" || n=="render") {
      if (!isI32Function(ty, 1, 1)) {
        err = Error::err<CompileError>(CompileError::BadSignature, "%s must be (i32)->(i32), is %s", n.c_str(), externTypeText(ty).c_str());
        break;
      }
      if (n=="init") hasInit = true; else hasRender = true;
    }
    else if (n=="memory") {
      if (wasm_externtype_kind(ty)!=WASM_EXTERN_MEMORY) {
        err = Error::err<CompileError>(CompileError::BadSignature, "export 'memory' is not a memory");
        break;
      }
      const wasm_limits_t *lim = wasm_memorytype_limits(wasm_externtype_as_memorytype_const(ty));
      if (lim->min>mLimits.maxMemoryPages) {
        err = Error::err<CompileError>(CompileError::Limits, "initial memory of %u pages exceeds the limit of %u pages", lim->min, mLimits.maxMemoryPages);
        break;
      }
      hasMemory = true;
    }
    else if (n=="abi_version") {
      if (
        wasm_externtype_kind(ty)!=WASM_EXTERN_GLOBAL ||
        wasm_valtype_kind(wasm_globaltype_content(wasm_externtype_as_globaltype_const(ty)))!=WASM_I32
      ) {
        err = Error::err<CompileError>(CompileError::BadSignature, "abi_version must be an i32 global");
        break;
      }
      mHasAbiVersion = true;
    }
  }
  wasm_exporttype_vec_delete(&exports);
  if (Error::notOK(err)) return err;
  if (!hasInit) return Error::err<CompileError>(CompileError::MissingExport, "no 'init' export");
  if (!hasRender) return Error::err<CompileError>(CompileError::MissingExport, "no 'render' export");
  if (!hasMemory) return Error::err<CompileError>(CompileError::MissingExport, "linear memory must be exported as 'memory'");
  return ErrorPtr();
}


// MARK: - WasmInstance

WasmInstance::WasmInstance(WasmModulePtr aModule) :
  mModule(aModule),
  mStore(NULL),
  mContext(NULL),
  mFuelUsed(0)
{
  memset(&mInstance, 0, sizeof(mInstance));
  memset(&mMemory, 0, sizeof(mMemory));
  mStore = wasmtime_store_new(WasmEngine::sharedEngine().engine(), NULL, NULL);
  mContext = wasmtime_store_context(mStore);
}


WasmInstance::~WasmInstance()
{
  wasmtime_store_delete(mStore);
}


ErrorPtr WasmInstance::instantiate(WasmModulePtr aModule, const WasmBudget &aBudget, WasmInstancePtr &aInstance)
{
  aInstance.reset();
  if (!aModule) return Error::err<SandboxError>(SandboxError::NoProgram, "no module to instantiate");
  WasmInstancePtr inst = WasmInstancePtr(new WasmInstance(aModule));
  const WasmLimits &limits = aModule->limits();
  wasmtime_store_limiter(inst->mStore, (int64_t)limits.maxMemoryPages*WasmPageSize, limits.maxTableElements, -1, -1, -1);
  ErrorPtr err = inst->prepareCall(aBudget);
  if (Error::notOK(err)) return err;
  wasm_trap_t *trap = NULL;
  wasmtime_error_t *werr = wasmtime_linker_instantiate(WasmEngine::sharedEngine().linker(), inst->mContext, aModule->module(), &inst->mInstance, &trap);
  inst->noteFuel(aBudget);
  if (werr) {
    return Error::err<SandboxError>(SandboxError::Trap, "instantiation failed: %s", wasmtimeErrorText(werr).c_str());
  }
  if (trap) return trapError(trap)->withPrefix("start: ");
  wasmtime_extern_t item;
  if (!wasmtime_instance_export_get(inst->mContext, &inst->mInstance, "memory", 6, &item) || item.kind!=WASMTIME_EXTERN_MEMORY) {
    return Error::err<SandboxError>(SandboxError::Trap, "instance has no exported memory");
  }
  inst->mMemory = item.of.memory;
  if (aModule->hasAbiVersion()) {
    if (wasmtime_instance_export_get(inst->mContext, &inst->mInstance, "abi_version", 11, &item) && item.kind==WASMTIME_EXTERN_GLOBAL) {
      wasmtime_val_t v;
      wasmtime_global_get(inst->mContext, &item.of.global, &v);
      if (v.kind!=WASMTIME_I32 || v.of.i32!=1) {
        return Error::err<CompileError>(CompileError::Unsupported, "program ABI version %d is not supported", v.kind==WASMTIME_I32 ? v.of.i32 : -1);
      }
    }
  }
  aInstance = inst;
  return ErrorPtr();
}


ErrorPtr WasmInstance::prepareCall(const WasmBudget &aBudget)
{
  mFuelUsed = 0;
  wasmtime_error_t *werr = wasmtime_context_set_fuel(mContext, aBudget.fuel);
  if (werr) {
    return Error::err<SandboxError>(SandboxError::Trap, "cannot set instruction budget: %s", wasmtimeErrorText(werr).c_str());
  }
  wasmtime_context_set_epoch_deadline(mContext, WasmEngine::epochTicksFor(aBudget.timeMs));
  return ErrorPtr();
}


void WasmInstance::noteFuel(const WasmBudget &aBudget)
{
  uint64_t remaining = 0;
  wasmtime_error_t *werr = wasmtime_context_get_fuel(mContext, &remaining);
  if (werr) {
    LOG(LOG_WARNING, "cannot read remaining fuel: %s", wasmtimeErrorText(werr).c_str());
    return;
  }
  mFuelUsed = aBudget.fuel-remaining;
}


ErrorPtr WasmInstance::callI32(const char *aExportName, int32_t aArg, int32_t &aResult, const WasmBudget &aBudget)
{
  wasmtime_extern_t item;
  if (!wasmtime_instance_export_get(mContext, &mInstance, aExportName, strlen(aExportName), &item) || item.kind!=WASMTIME_EXTERN_FUNC) {
    return Error::err<SandboxError>(SandboxError::Trap, "no exported function '%s'", aExportName);
  }
  ErrorPtr err = prepareCall(aBudget);
  if (Error::notOK(err)) return err;
  wasmtime_val_t arg;
  arg.kind = WASMTIME_I32;
  arg.of.i32 = aArg;
  wasmtime_val_t result;
  wasm_trap_t *trap = NULL;
  wasmtime_error_t *werr = wasmtime_func_call(mContext, &item.of.func, &arg, 1, &result, 1, &trap);
  noteFuel(aBudget);
  if (werr) {
    return Error::err<SandboxError>(SandboxError::Trap, "%s: %s", aExportName, wasmtimeErrorText(werr).c_str());
  }
  if (trap) return trapError(trap);
  if (result.kind!=WASMTIME_I32) {
    return Error::err<SandboxError>(SandboxError::Trap, "%s did not return an i32", aExportName);
  }
  aResult = result.of.i32;
  return ErrorPtr();
}


const uint8_t *WasmInstance::memory() const
{
  return wasmtime_memory_data(mContext, &mMemory);
}


size_t WasmInstance::memorySize() const
{
  return wasmtime_memory_data_size(mContext, &mMemory);
}
