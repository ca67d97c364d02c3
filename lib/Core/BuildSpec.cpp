//===-- BuildSpec.cpp -----------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2025 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "forgeline/Core/BuildSpec.h"

#include "forgeline/Basic/Errors.h"
#include "forgeline/Basic/Hashing.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;

namespace {

const char* const BaseDistros[] = {
  "arch", "debian", "ubuntu", "alpine", "fedora", "opensuse", "void", "gentoo"
};
const char* const Architectures[] = { "x86_64", "aarch64" };
const char* const InitSystems[] = { "systemd", "openrc", "runit", "s6" };
const char* const KernelVersions[] = {
  "linux-lts", "linux-zen", "linux-hardened"
};
const char* const MACFrameworks[] = { "apparmor", "selinux" };

llvm::Error invalid(const Twine& message) {
  return makeError(errc::invalid_spec,
                   "invalid build specification: " + message);
}

/// Read an optional string field restricted to \p allowed.
llvm::Error readEnum(const llvm::json::Value& value, StringRef field,
                     ArrayRef<const char*> allowed, std::string& result) {
  if (value.kind() == llvm::json::Value::Null)
    return llvm::Error::success();

  auto string = value.getAsString();
  if (!string)
    return invalid("'" + field + "' must be a string");
  for (const char* candidate: allowed) {
    if (*string == candidate) {
      result = candidate;
      return llvm::Error::success();
    }
  }

  std::string choices;
  for (const char* candidate: allowed) {
    if (!choices.empty())
      choices += ", ";
    choices += candidate;
  }
  return invalid("'" + field + "' must be one of " + choices + " (got '" +
                 *string + "')");
}

llvm::Error readStringList(const llvm::json::Value& value, StringRef field,
                           std::vector<std::string>& result) {
  const llvm::json::Array* array = value.getAsArray();
  if (!array)
    return invalid("'" + field + "' must be a list of strings");
  for (const llvm::json::Value& element: *array) {
    auto string = element.getAsString();
    if (!string)
      return invalid("'" + field + "' must be a list of strings");
    result.push_back(string->str());
  }
  return llvm::Error::success();
}

/// Read the package list.
///
/// Packages are given as a list, as an object of category to list, or as an
/// object of package name to whether it is wanted.
llvm::Error readPackages(const llvm::json::Value& value,
                         std::vector<std::string>& result) {
  if (value.kind() == llvm::json::Value::Null)
    return llvm::Error::success();
  if (value.getAsArray())
    return readStringList(value, "packages", result);

  const llvm::json::Object* object = value.getAsObject();
  if (!object)
    return invalid("'packages' must be a list or an object");
  for (const auto& entry: *object) {
    StringRef key = entry.first;
    if (entry.second.getAsArray()) {
      if (auto error = readStringList(entry.second, ("packages." + key).str(),
                                      result))
        return error;
    } else if (auto wanted = entry.second.getAsBoolean()) {
      if (*wanted)
        result.push_back(key.str());
    } else {
      return invalid("'packages." + key + "' must be a list or a boolean");
    }
  }
  return llvm::Error::success();
}

void sortUnique(std::vector<std::string>& values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
}

}

llvm::Expected<BuildSpec> BuildSpec::parse(StringRef text) {
  auto value = llvm::json::parse(text);
  if (!value) {
    return invalid("malformed JSON: " + llvm::toString(value.takeError()));
  }
  return fromJSON(*value);
}

llvm::Expected<BuildSpec> BuildSpec::fromJSON(const llvm::json::Value& value) {
  const llvm::json::Object* object = value.getAsObject();
  if (!object)
    return invalid("the document must be an object");

  BuildSpec spec;
  const llvm::json::Value* base = object->get("base");
  if (!base || base->kind() == llvm::json::Value::Null)
    return invalid("missing required field 'base'");

  for (const auto& entry: *object) {
    StringRef key = entry.first;
    const llvm::json::Value& field = entry.second;

    if (key == "base") {
      if (auto error = readEnum(field, key, BaseDistros, spec.base))
        return std::move(error);
    } else if (key == "name") {
      if (field.kind() == llvm::json::Value::Null)
        continue;
      auto name = field.getAsString();
      if (!name)
        return invalid("'name' must be a string");
      spec.name = name->str();
    } else if (key == "architecture") {
      if (auto error = readEnum(field, key, Architectures, spec.architecture))
        return std::move(error);
    } else if (key == "init") {
      if (auto error = readEnum(field, key, InitSystems, spec.init))
        return std::move(error);
    } else if (key == "kernel") {
      if (field.kind() == llvm::json::Value::Null)
        continue;
      const llvm::json::Object* kernel = field.getAsObject();
      if (!kernel)
        return invalid("'kernel' must be an object");
      for (const auto& option: *kernel) {
        if (StringRef(option.first) == "version") {
          if (auto error = readEnum(option.second, "kernel.version",
                                    KernelVersions, spec.kernelVersion))
            return std::move(error);
        } else {
          spec.kernelOptions[option.first] = option.second;
        }
      }
    } else if (key == "packages") {
      if (auto error = readPackages(field, spec.packages))
        return std::move(error);
    } else if (key == "securityFeatures") {
      if (field.kind() == llvm::json::Value::Null)
        continue;
      const llvm::json::Object* security = field.getAsObject();
      if (!security)
        return invalid("'securityFeatures' must be an object");
      for (const auto& option: *security) {
        if (StringRef(option.first) != "mac") {
          spec.securityOptions[option.first] = option.second;
          continue;
        }
        std::vector<std::string> mac;
        if (auto error = readStringList(option.second, "securityFeatures.mac",
                                        mac))
          return std::move(error);
        for (auto& framework: mac) {
          std::string checked;
          if (auto error = readEnum(framework, "securityFeatures.mac",
                                    MACFrameworks, checked))
            return std::move(error);
          spec.macFeatures.push_back(checked);
        }
      }
    } else {
      spec.extra[key.str()] = field;
    }
  }

  sortUnique(spec.packages);
  sortUnique(spec.macFeatures);

  if (llvm::is_contained(spec.macFeatures, "apparmor") &&
      llvm::is_contained(spec.macFeatures, "selinux"))
    return invalid("AppArmor and SELinux cannot be enabled together");

  return std::move(spec);
}

llvm::json::Value BuildSpec::toJSON() const {
  llvm::json::Object result = extra;
  result["base"] = base;
  if (!name.empty())
    result["name"] = name;
  result["architecture"] = architecture;
  result["init"] = init;

  llvm::json::Object kernel = kernelOptions;
  kernel["version"] = kernelVersion;
  result["kernel"] = std::move(kernel);

  result["packages"] = packages;

  llvm::json::Object security = securityOptions;
  security["mac"] = macFeatures;
  result["securityFeatures"] = std::move(security);

  return llvm::json::Value(std::move(result));
}

std::string BuildSpec::canonicalText() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  // Object members are always written in key order.
  os << toJSON();
  os.flush();
  return result;
}

std::string BuildSpec::hash() const {
  return sha256Hex(canonicalText());
}
