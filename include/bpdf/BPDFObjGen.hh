// Copyright (c) 2024-2026 The bpdf authors
//
// This file is part of bpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BPDFOBJGEN_HH
#define BPDFOBJGEN_HH

#include <set>
#include <string>
#include <tuple>

// Object number and generation of an indirect object. Direct objects have 0, 0.
class BPDFObjGen
{
  public:
    BPDFObjGen() = default;
    BPDFObjGen(int obj, int gen) :
        obj(obj),
        gen(gen)
    {
    }

    int
    getObj() const
    {
        return obj;
    }
    int
    getGen() const
    {
        return gen;
    }
    bool
    isIndirect() const
    {
        return obj != 0;
    }

    // "3 0"
    std::string
    unparse() const
    {
        return std::to_string(obj) + " " + std::to_string(gen);
    }
    // "object 3 0", for error messages
    std::string
    describe() const
    {
        return "object " + unparse();
    }

    friend bool
    operator<(BPDFObjGen const& a, BPDFObjGen const& b)
    {
        return std::tie(a.obj, a.gen) < std::tie(b.obj, b.gen);
    }
    friend bool
    operator==(BPDFObjGen const& a, BPDFObjGen const& b)
    {
        return a.obj == b.obj && a.gen == b.gen;
    }
    friend bool
    operator!=(BPDFObjGen const& a, BPDFObjGen const& b)
    {
        return !(a == b);
    }

    // Tracks indirect objects during a traversal to detect loops. Direct objects (0, 0) are
    // never recorded, so add() always succeeds for them.
    class set
    {
      public:
        // False if og was already present
        bool
        add(BPDFObjGen og)
        {
            return !og.isIndirect() || members.insert(og).second;
        }
        void
        erase(BPDFObjGen og)
        {
            members.erase(og);
        }
        bool
        contains(BPDFObjGen og) const
        {
            return members.count(og) > 0;
        }
        void
        clear()
        {
            members.clear();
        }

      private:
        std::set<BPDFObjGen> members;
    };

  private:
    int obj{0};
    int gen{0};
};

#endif // BPDFOBJGEN_HH
