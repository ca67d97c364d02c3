//===-- ServiceConfig.cpp -------------------------------------------------===//
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

#include "forgeline/Service/ServiceConfig.h"

#include "forgeline/Basic/Errors.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"
#include "llvm/Support/raw_ostream.h"

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::service;

namespace {

class ConfigParser {
  llvm::SourceMgr sourceMgr;
  ServiceConfig& config;

  /// The diagnostics emitted so far.
  std::string diagnostics;
  llvm::raw_string_ostream diagnosticsStream{diagnostics};

  /// The number of parsing errors.
  int numErrors = 0;

  static void handleDiagnostic(const llvm::SMDiagnostic& diag, void* context) {
    auto parser = static_cast<ConfigParser*>(context);
    diag.print(nullptr, parser->diagnosticsStream, /*ShowColors=*/false);
    ++parser->numErrors;
  }

  std::string stringFromScalarNode(llvm::yaml::ScalarNode* scalar) {
    SmallString<256> storage;
    return scalar->getValue(storage).str();
  }

  /// Emit an error.
  void error(llvm::yaml::Node* node, const Twine& message) {
    if (!node) {
      sourceMgr.PrintMessage(llvm::SMLoc(), llvm::SourceMgr::DK_Error,
                             message);
      return;
    }
    sourceMgr.PrintMessage(node->getSourceRange().Start,
                           llvm::SourceMgr::DK_Error, message,
                           node->getSourceRange());
  }

  llvm::yaml::ScalarNode* getScalar(llvm::yaml::Node* node, StringRef key) {
    if (!node || node->getType() != llvm::yaml::Node::NK_Scalar) {
      error(node, "expected a scalar value for '" + key + "'");
      return nullptr;
    }
    return static_cast<llvm::yaml::ScalarNode*>(node);
  }

  bool parseUnsigned(llvm::yaml::Node* node, StringRef key, unsigned& result) {
    auto scalar = getScalar(node, key);
    if (!scalar)
      return false;
    unsigned value;
    if (StringRef(stringFromScalarNode(scalar)).getAsInteger(10, value)) {
      error(node, "invalid value for '" + key +
            "' (expected a non-negative integer)");
      return false;
    }
    result = value;
    return true;
  }

  bool parseSeconds(llvm::yaml::Node* node, StringRef key, double& result) {
    auto scalar = getScalar(node, key);
    if (!scalar)
      return false;
    double value;
    if (!llvm::to_float(stringFromScalarNode(scalar), value) || value < 0) {
      error(node, "invalid value for '" + key +
            "' (expected a non-negative number of seconds)");
      return false;
    }
    result = value;
    return true;
  }

  /// Iterate the entries of a mapping, calling \p parseEntry with each key
  /// name and value.
  template <typename Fn>
  void parseMapping(llvm::yaml::Node* node, StringRef name, Fn parseEntry) {
    if (!node || node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "expected a mapping for '" + name + "'");
      return;
    }

    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      auto key = entry.getKey();
      if (!key || key->getType() != llvm::yaml::Node::NK_Scalar) {
        error(key ? key : node, "invalid key type in '" + name + "'");
        continue;
      }
      std::string keyName = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(key));
      if (!parseEntry(keyName, entry.getValue()))
        error(key, "unknown key '" + keyName + "' in '" + name + "'");
    }
  }

  /// Parse a queue entry, returning false for unknown keys.
  bool parseQueueEntry(StringRef key, llvm::yaml::Node* value) {
    auto& queue = config.queue;
    if (key == "tenant-quota") {
      parseUnsigned(value, key, queue.tenantQuota);
    } else if (key == "max-attempts") {
      if (parseUnsigned(value, key, queue.maxAttempts) &&
          queue.maxAttempts == 0)
        error(value, "'max-attempts' must be at least 1");
    } else if (key == "backoff-base") {
      parseSeconds(value, key, queue.backoffBase);
    } else if (key == "backoff-cap") {
      parseSeconds(value, key, queue.backoffCap);
    } else if (key == "rate-limit-max") {
      parseUnsigned(value, key, queue.rateLimitMax);
    } else if (key == "rate-limit-window") {
      if (parseSeconds(value, key, queue.rateLimitWindow) &&
          queue.rateLimitWindow == 0)
        error(value, "'rate-limit-window' must be positive");
    } else if (key == "retain-completed") {
      parseUnsigned(value, key, queue.retainCompleted);
    } else if (key == "retain-dead-lettered") {
      parseUnsigned(value, key, queue.retainDeadLettered);
    } else {
      return false;
    }
    return true;
  }

  bool parseSchedulerEntry(StringRef key, llvm::yaml::Node* value) {
    if (key == "max-concurrency") {
      if (parseUnsigned(value, key, config.maxConcurrency) &&
          config.maxConcurrency == 0)
        error(value, "'max-concurrency' must be at least 1");
    } else if (key == "lanes") {
      unsigned lanes;
      if (parseUnsigned(value, key, lanes))
        config.lanes = int(lanes);
    } else if (key == "lane-order") {
      if (auto scalar = getScalar(value, key)) {
        std::string order = stringFromScalarNode(scalar);
        if (order == "fifo")
          config.laneOrder = SchedulerAlgorithm::FIFO;
        else if (order == "name")
          config.laneOrder = SchedulerAlgorithm::NamePriority;
        else
          error(value, "invalid lane order (expected fifo or name)");
      }
    } else {
      return false;
    }
    return true;
  }

  bool parseCacheEntry(StringRef key, llvm::yaml::Node* value) {
    if (key != "ttl")
      return false;
    parseSeconds(value, key, config.cacheTTL);
    return true;
  }

  bool parseStoreEntry(StringRef key, llvm::yaml::Node* value) {
    if (key != "path")
      return false;
    if (auto scalar = getScalar(value, key))
      config.storePath = stringFromScalarNode(scalar);
    return true;
  }

  bool parseRootEntry(StringRef key, llvm::yaml::Node* value) {
    if (key == "workers") {
      if (parseUnsigned(value, key, config.workers) && config.workers == 0)
        error(value, "'workers' must be at least 1");
    } else if (key == "log-level") {
      if (auto scalar = getScalar(value, key)) {
        if (!parseLogLevel(stringFromScalarNode(scalar), &config.logLevel))
          error(value, "invalid log level (expected error, warning, note or "
                "debug)");
      }
    } else if (key == "queue") {
      parseMapping(value, key, [&](StringRef name, llvm::yaml::Node* node) {
          return parseQueueEntry(name, node);
        });
    } else if (key == "scheduler") {
      parseMapping(value, key, [&](StringRef name, llvm::yaml::Node* node) {
          return parseSchedulerEntry(name, node);
        });
    } else if (key == "cache") {
      parseMapping(value, key, [&](StringRef name, llvm::yaml::Node* node) {
          return parseCacheEntry(name, node);
        });
    } else if (key == "store") {
      parseMapping(value, key, [&](StringRef name, llvm::yaml::Node* node) {
          return parseStoreEntry(name, node);
        });
    } else {
      return false;
    }
    return true;
  }

public:
  ConfigParser(ServiceConfig& config) : config(config) {
    sourceMgr.setDiagHandler(&ConfigParser::handleDiagnostic, this);
  }

  llvm::Error parse(StringRef contents, StringRef filename) {
    auto buffer = llvm::MemoryBuffer::getMemBuffer(contents, filename);

    // Create a YAML parser.
    llvm::yaml::Stream stream(buffer->getMemBufferRef(), sourceMgr,
                              /*ShowColors=*/false);

    // Read the stream, an empty stream is the default configuration.
    auto it = stream.begin();
    if (it != stream.end()) {
      auto root = it->getRoot();
      if (root && root->getType() != llvm::yaml::Node::NK_Null) {
        parseMapping(root, "configuration",
                     [&](StringRef name, llvm::yaml::Node* node) {
                       return parseRootEntry(name, node);
                     });
      }

      if (++it != stream.end() && it->getRoot())
        error(it->getRoot(), "unexpected additional document in stream");
    }

    diagnosticsStream.flush();
    if (numErrors != 0 || stream.failed()) {
      return makeError(errc::invalid_config,
                       "invalid configuration:\n" +
                       StringRef(diagnostics).rtrim());
    }
    return llvm::Error::success();
  }
};

}

llvm::Expected<ServiceConfig> ServiceConfig::parse(StringRef contents,
                                                   StringRef filename) {
  ServiceConfig config;
  ConfigParser parser(config);
  if (auto error = parser.parse(contents, filename))
    return std::move(error);
  return config;
}

llvm::Expected<ServiceConfig> ServiceConfig::load(StringRef filename) {
  auto input = llvm::MemoryBuffer::getFile(filename);
  if (!input) {
    return makeError(errc::invalid_config,
                     "unable to open '" + filename + "': " +
                     input.getError().message());
  }
  return parse((*input)->getBuffer(), filename);
}
