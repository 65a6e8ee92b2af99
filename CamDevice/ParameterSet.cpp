///////////////////////////////////////////////////////////////////////////////
// FILE:          ParameterSet.cpp
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

#include "ParameterSet.h"

#include <utility>

namespace camdev {

ParameterSet::ParameterSet(const std::string& name) :
   root_(std::make_shared<nlohmann::json>(nlohmann::json::object())),
   name_(name)
{}


ParameterSet::ParameterSet(std::shared_ptr<nlohmann::json> root,
      const nlohmann::json::json_pointer& path,
      const std::string& name) :
   root_(std::move(root)),
   path_(path),
   name_(name)
{}


ParameterSet
ParameterSet::FromJson(const std::string& name, const nlohmann::json& tree)
{
   if (!tree.is_object())
      throw ParameterError("Parameters for \"" + name +
            "\" must be a JSON object, not " + tree.type_name());
   return ParameterSet(std::make_shared<nlohmann::json>(tree),
         nlohmann::json::json_pointer(), name);
}


ParameterSet
ParameterSet::Parse(const std::string& name, const std::string& text)
{
   nlohmann::json tree;
   try
   {
      tree = nlohmann::json::parse(text);
   }
   catch (const nlohmann::json::parse_error& e)
   {
      throw ParameterError("Cannot parse parameters for \"" + name + "\": " +
            e.what());
   }
   return FromJson(name, tree);
}


ParameterSet
ParameterSet::Copy() const
{
   return FromJson(name_, Node());
}


ParameterSet
ParameterSet::Get(const std::string& name) const
{
   if (!HasSubSet(name))
      throw ParameterError("No parameter sub-set " + Describe(name));
   return ParameterSet(root_, path_ / name, name);
}


bool
ParameterSet::HasSubSet(const std::string& name) const
{
   const nlohmann::json& node = Node();
   nlohmann::json::const_iterator it = node.find(name);
   return it != node.end() && it->is_object();
}


void
ParameterSet::AddSubSet(const ParameterSet& subSet)
{
   if (subSet.GetName().empty())
      throw ParameterError("Cannot add an unnamed sub-set to " +
            Describe(""));
   Node()[subSet.GetName()] = subSet.Node();
}


bool
ParameterSet::Has(const std::string& name) const
{
   const nlohmann::json& node = Node();
   nlohmann::json::const_iterator it = node.find(name);
   return it != node.end() && !it->is_object();
}


std::vector<std::string>
ParameterSet::GetNames() const
{
   std::vector<std::string> names;
   const nlohmann::json& node = Node();
   for (nlohmann::json::const_iterator it = node.begin(); it != node.end(); ++it)
      names.push_back(it.key());
   return names;
}


bool
ParameterSet::IsSameSet(const ParameterSet& other) const
{
   return root_ == other.root_ && path_ == other.path_;
}


nlohmann::json&
ParameterSet::Node()
{
   try
   {
      return root_->at(path_);
   }
   catch (const nlohmann::json::out_of_range&)
   {
      throw ParameterError("Parameter sub-set \"" + name_ +
            "\" no longer exists");
   }
}


const nlohmann::json&
ParameterSet::Node() const
{
   try
   {
      return static_cast<const nlohmann::json&>(*root_).at(path_);
   }
   catch (const nlohmann::json::out_of_range&)
   {
      throw ParameterError("Parameter sub-set \"" + name_ +
            "\" no longer exists");
   }
}


const nlohmann::json&
ParameterSet::ValueNode(const std::string& name) const
{
   const nlohmann::json& node = Node();
   nlohmann::json::const_iterator it = node.find(name);
   if (it == node.end())
      throw ParameterError("No parameter " + Describe(name));
   if (it->is_object())
      throw ParameterError(Describe(name) + " is a sub-set, not a value");
   return *it;
}


std::string
ParameterSet::Describe(const std::string& child) const
{
   std::string path = name_.empty() ? "(unnamed)" : name_;
   if (!child.empty())
      path += "." + child;
   return "\"" + path + "\"";
}

} // namespace camdev
