///////////////////////////////////////////////////////////////////////////////
// FILE:          ParameterSet.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Named, hierarchical camera settings.
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace camdev {

class ParameterError : public std::runtime_error
{
public:
   explicit ParameterError(const std::string& msg) : std::runtime_error(msg) {}
};


/**
 * A tree of named values. Nodes that hold other nodes are sub-sets, named by
 * their key in the parent.
 *
 * A ParameterSet object is a handle: copying it (or calling Get()) yields
 * another view of the same tree, so changes made through one handle are
 * visible through the others. Copy() is the only way to obtain an independent
 * snapshot.
 */
class ParameterSet
{
public:
   explicit ParameterSet(const std::string& name = "");

   /**
    * Build a set from a JSON object (the object is copied).
    */
   static ParameterSet FromJson(const std::string& name,
         const nlohmann::json& tree);
   static ParameterSet Parse(const std::string& name, const std::string& text);

   const std::string& GetName() const { return name_; }

   /**
    * Deep copy. The result shares nothing with this set.
    */
   ParameterSet Copy() const;

   /**
    * Return a view of the sub-set with the given name.
    * Throws ParameterError if there is no such sub-set.
    */
   ParameterSet Get(const std::string& name) const;
   bool HasSubSet(const std::string& name) const;

   /**
    * Add a deep copy of the given set as a sub-set, named after it.
    * An existing sub-set with that name is replaced.
    */
   void AddSubSet(const ParameterSet& subSet);

   bool Has(const std::string& name) const;
   std::vector<std::string> GetNames() const;

   template <typename T>
   T GetValue(const std::string& name) const
   {
      const nlohmann::json& value = ValueNode(name);
      try
      {
         return value.get<T>();
      }
      catch (const nlohmann::json::exception& e)
      {
         throw ParameterError("Parameter " + Describe(name) +
               " has the wrong type (" + e.what() + ")");
      }
   }

   template <typename T>
   void SetValue(const std::string& name, const T& value)
   {
      nlohmann::json& node = Node();
      nlohmann::json::iterator it = node.find(name);
      if (it != node.end() && it->is_object())
         throw ParameterError("Cannot overwrite sub-set " + Describe(name) +
               " with a value");
      node[name] = value;
   }

   /**
    * Copy of the underlying tree.
    */
   nlohmann::json ToJson() const { return Node(); }
   std::string Dump(int indent = -1) const { return Node().dump(indent); }

   /**
    * True if both handles refer to the same node of the same tree.
    */
   bool IsSameSet(const ParameterSet& other) const;

   // Compare contents (not identity); names are not compared.
   bool operator==(const ParameterSet& other) const
   { return Node() == other.Node(); }
   bool operator!=(const ParameterSet& other) const
   { return !(*this == other); }

private:
   ParameterSet(std::shared_ptr<nlohmann::json> root,
         const nlohmann::json::json_pointer& path,
         const std::string& name);

   nlohmann::json& Node();
   const nlohmann::json& Node() const;
   const nlohmann::json& ValueNode(const std::string& name) const;
   std::string Describe(const std::string& child) const;

   std::shared_ptr<nlohmann::json> root_;
   nlohmann::json::json_pointer path_;
   std::string name_;
};

} // namespace camdev
