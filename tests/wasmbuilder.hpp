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

#ifndef __ledbetter__wasmbuilder__
#define __ledbetter__wasmbuilder__

#include <string>
#include <vector>
#include <stdint.h>

// assembles small WebAssembly binaries for tests

namespace wasmtest {

  using std::string;

  inline string uleb(uint64_t aValue)
  {
    string s;
    do {
      uint8_t b = aValue & 0x7F;
      aValue >>= 7;
      if (aValue) b |= 0x80;
      s += (char)b;
    } while (aValue);
    return s;
  }

  inline string sleb(int64_t aValue)
  {
    string s;
    bool more = true;
    while (more) {
      uint8_t b = aValue & 0x7F;
      aValue >>= 7; // arithmetic shift
      if ((aValue==0 && !(b & 0x40)) || (aValue==-1 && (b & 0x40))) more = false;
      else b |= 0x80;
      s += (char)b;
    }
    return s;
  }

  inline string bytes(const char *aData, size_t aLen) { return string(aData, aLen); }
  inline string vec(uint32_t aCount, const string &aItems) { return uleb(aCount)+aItems; }
  inline string name(const string &aName) { return uleb(aName.size())+aName; }

  // value types
  const char I32 = 0x7F;
  const char I64 = 0x7E;
  const char F32 = 0x7D;
  const char F64 = 0x7C;

  // instructions
  inline string i32const(int32_t aV) { return string(1, (char)0x41)+sleb(aV); }
  inline string i64const(int64_t aV) { return string(1, (char)0x42)+sleb(aV); }
  inline string f64const(double aV) { string s(1, (char)0x44); s.append((const char *)&aV, 8); return s; }
  inline string localGet(uint32_t aIdx) { return string(1, (char)0x20)+uleb(aIdx); }
  inline string localSet(uint32_t aIdx) { return string(1, (char)0x21)+uleb(aIdx); }
  inline string localTee(uint32_t aIdx) { return string(1, (char)0x22)+uleb(aIdx); }
  inline string globalGet(uint32_t aIdx) { return string(1, (char)0x23)+uleb(aIdx); }
  inline string globalSet(uint32_t aIdx) { return string(1, (char)0x24)+uleb(aIdx); }
  inline string call(uint32_t aIdx) { return string(1, (char)0x10)+uleb(aIdx); }
  inline string br(uint32_t aDepth) { return string(1, (char)0x0C)+uleb(aDepth); }
  inline string brIf(uint32_t aDepth) { return string(1, (char)0x0D)+uleb(aDepth); }
  inline string op(uint8_t aOpcode) { return string(1, (char)aOpcode); }
  inline string mem(uint8_t aOpcode, uint32_t aAlign, uint32_t aOffset) { return op(aOpcode)+uleb(aAlign)+uleb(aOffset); }
  inline string fc(uint32_t aSubOp) { return op(0xFC)+uleb(aSubOp); }
  const string End = string(1, (char)0x0B);
  const string Unreachable = string(1, (char)0x00);
  const string BlockVoid = bytes("\x02\x40", 2);
  const string LoopVoid = bytes("\x03\x40", 2);
  const string IfVoid = bytes("\x04\x40", 2);

  class ModuleBuilder
  {
    std::vector<string> mTypes;
    std::vector<string> mImports;
    std::vector<uint32_t> mFuncTypes;
    std::vector<string> mBodies;
    std::vector<string> mGlobals;
    std::vector<string> mExports;
    std::vector<string> mData;
    std::vector<string> mElems;
    string mMemory;
    string mTable;
    bool mExportMemory;
    int mStart;

    static string section(uint8_t aId, const std::vector<string> &aItems)
    {
      string c;
      for (size_t i=0; i<aItems.size(); i++) c += aItems[i];
      c = vec((uint32_t)aItems.size(), c);
      return string(1, (char)aId)+uleb(c.size())+c;
    }

  public:

    ModuleBuilder() : mExportMemory(true), mStart(-1) {};

    /// @return the index the next func() will get
    uint32_t nextFunc() const { return (uint32_t)(mImports.size()+mBodies.size()); }

    uint32_t type(const string &aParams, const string &aResults)
    {
      mTypes.push_back(string(1, (char)0x60)+vec((uint32_t)aParams.size(), aParams)+vec((uint32_t)aResults.size(), aResults));
      return (uint32_t)mTypes.size()-1;
    }

    /// @note all imports must be added before the first function
    uint32_t importFunc(const string &aModule, const string &aField, uint32_t aType)
    {
      mImports.push_back(name(aModule)+name(aField)+string(1, (char)0)+uleb(aType));
      return (uint32_t)mImports.size()-1;
    }

    /// @param aLocals encoded local declarations (count, type pairs), without the vector count
    /// @param aNumLocalDecls number of declarations in aLocals
    uint32_t func(uint32_t aType, const string &aBody, const string &aLocals = "", uint32_t aNumLocalDecls = 0)
    {
      string b = vec(aNumLocalDecls, aLocals)+aBody;
      mFuncTypes.push_back(aType);
      mBodies.push_back(uleb(b.size())+b);
      return (uint32_t)(mImports.size()+mBodies.size()-1);
    }

    uint32_t globalI32(int32_t aInit, bool aMutable)
    {
      mGlobals.push_back(string(1, I32)+string(1, (char)(aMutable ? 1 : 0))+i32const(aInit)+End);
      return (uint32_t)mGlobals.size()-1;
    }

    void exportFunc(const string &aName, uint32_t aIdx) { mExports.push_back(name(aName)+string(1, (char)0)+uleb(aIdx)); }
    void exportGlobal(const string &aName, uint32_t aIdx) { mExports.push_back(name(aName)+string(1, (char)3)+uleb(aIdx)); }

    /// @note the memory is exported as "memory" unless keepMemoryPrivate() is called
    void memory(uint32_t aMinPages) { mMemory = string(1, (char)0)+uleb(aMinPages); }
    void memory(uint32_t aMinPages, uint32_t aMaxPages) { mMemory = string(1, (char)1)+uleb(aMinPages)+uleb(aMaxPages); }

    void keepMemoryPrivate() { mExportMemory = false; }

    void table(uint32_t aSize) { mTable = string(1, (char)0x70)+string(1, (char)0)+uleb(aSize); }
    void elem(int32_t aOffset, const std::vector<uint32_t> &aFuncs)
    {
      string f;
      for (size_t i=0; i<aFuncs.size(); i++) f += uleb(aFuncs[i]);
      mElems.push_back(string(1, (char)0)+i32const(aOffset)+End+vec((uint32_t)aFuncs.size(), f));
    }

    void data(int32_t aOffset, const string &aBytes) { mData.push_back(string(1, (char)0)+i32const(aOffset)+End+vec((uint32_t)aBytes.size(), aBytes)); }
    void start(uint32_t aFunc) { mStart = (int)aFunc; }

    string build() const
    {
      string m = bytes("\0asm\x01\0\0\0", 8);
      if (!mTypes.empty()) m += section(1, mTypes);
      if (!mImports.empty()) m += section(2, mImports);
      if (!mFuncTypes.empty()) {
        std::vector<string> f;
        for (size_t i=0; i<mFuncTypes.size(); i++) f.push_back(uleb(mFuncTypes[i]));
        m += section(3, f);
      }
      if (!mTable.empty()) m += section(4, std::vector<string>(1, mTable));
      if (!mMemory.empty()) m += section(5, std::vector<string>(1, mMemory));
      if (!mGlobals.empty()) m += section(6, mGlobals);
      std::vector<string> exports = mExports;
      if (!mMemory.empty() && mExportMemory) exports.push_back(name("memory")+string(1, (char)2)+uleb(0));
      if (!exports.empty()) m += section(7, exports);
      if (mStart>=0) {
        string s = uleb((uint32_t)mStart);
        m += string(1, (char)8)+uleb(s.size())+s;
      }
      if (!mElems.empty()) m += section(9, mElems);
      if (!mBodies.empty()) m += section(10, mBodies);
      if (!mData.empty()) m += section(11, mData);
      return m;
    }

  };


  /// init(n): store n at address 0, frame at offset 16
  inline string initBody()
  {
    return i32const(0)+localGet(0)+mem(0x36, 2, 0)+i32const(16)+End;
  }

  /// fills all n pixels at offset 16 with one color, local 1 is the byte index
  inline string fillBody(uint8_t aR, uint8_t aG, uint8_t aB)
  {
    return
      BlockVoid+LoopVoid+
        localGet(1)+i32const(0)+mem(0x28, 2, 0)+i32const(3)+op(0x6C)+op(0x4F)+brIf(1)+ // i >= n*3
        localGet(1)+i32const(aR)+mem(0x3A, 0, 16)+
        localGet(1)+i32const(aG)+mem(0x3A, 0, 17)+
        localGet(1)+i32const(aB)+mem(0x3A, 0, 18)+
        localGet(1)+i32const(3)+op(0x6A)+localSet(1)+
        br(0)+
      End+End;
  }

  /// render result: n*3
  inline string byteCount()
  {
    return i32const(0)+mem(0x28, 2, 0)+i32const(3)+op(0x6C);
  }

  /// a program rendering a solid color, with optional code run before filling the frame
  inline string solidProgram(uint8_t aR, uint8_t aG, uint8_t aB, const string &aRenderPrefix = "", bool aWithCounter = false)
  {
    ModuleBuilder b;
    uint32_t t = b.type(string(1, I32), string(1, I32));
    b.memory(1);
    if (aWithCounter) b.globalI32(0, true);
    uint32_t init = b.func(t, initBody());
    uint32_t render = b.func(t, aRenderPrefix+fillBody(aR, aG, aB)+byteCount()+End, uleb(1)+string(1, I32), 1);
    b.exportFunc("init", init);
    b.exportFunc("render", render);
    return b.build();
  }

  /// render code that traps on the aCall-th render call (counting from 1), uses global 0
  inline string trapOnCall(int32_t aCall)
  {
    return globalGet(0)+i32const(1)+op(0x6A)+globalSet(0)+globalGet(0)+i32const(aCall)+op(0x46)+IfVoid+Unreachable+End;
  }

  /// render code that traps from aCall-th call on
  inline string trapFromCall(int32_t aCall)
  {
    return globalGet(0)+i32const(1)+op(0x6A)+globalSet(0)+globalGet(0)+i32const(aCall)+op(0x4E)+IfVoid+Unreachable+End;
  }

} // namespace wasmtest

#endif /* defined(__ledbetter__wasmbuilder__) */
