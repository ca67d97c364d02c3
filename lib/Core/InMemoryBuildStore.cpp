//===-- InMemoryBuildStore.cpp --------------------------------------------===//
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

#include "forgeline/Core/BuildStore.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/Support/raw_ostream.h"

#include <mutex>

using namespace forgeline;
using namespace forgeline::core;

BuildStore::~BuildStore() { }

namespace {

class InMemoryBuildStore : public BuildStore {
  llvm::StringMap<Job> jobs;
  std::vector<std::string> jobOrder;
  llvm::StringMap<BuildPhase> phases;
  llvm::StringMap<std::vector<std::string>> logs;

  std::mutex storeMutex;

public:
  bool saveBuildPhase(StringRef buildID, BuildPhase phase,
                      std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    phases[buildID] = phase;
    return true;
  }

  bool appendLog(StringRef buildID, StringRef message,
                 std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    logs[buildID].push_back(message.str());
    return true;
  }

  bool saveJobState(const Job& job, std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    auto result = jobs.insert({ job.id, job });
    if (result.second)
      jobOrder.push_back(job.id);
    else
      result.first->second = job;
    return true;
  }

  bool loadJob(StringRef jobID, Job* job_out, std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    auto it = jobs.find(jobID);
    if (it == jobs.end())
      return false;
    *job_out = it->second;
    return true;
  }

  bool loadBuildPhase(StringRef buildID, BuildPhase* phase_out,
                      std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    auto it = phases.find(buildID);
    if (it == phases.end())
      return false;
    *phase_out = it->second;
    return true;
  }

  bool getBuildLog(StringRef buildID, std::vector<std::string>& messages_out,
                   std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    auto it = logs.find(buildID);
    if (it != logs.end())
      messages_out.insert(messages_out.end(), it->second.begin(),
                          it->second.end());
    return true;
  }

  bool getJobIDs(std::vector<std::string>& ids_out, std::string*) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    ids_out.insert(ids_out.end(), jobOrder.begin(), jobOrder.end());
    return true;
  }

  void dump(raw_ostream& os) override {
    std::lock_guard<std::mutex> guard(storeMutex);
    for (const auto& id: jobOrder) {
      const Job& job = jobs[id];
      os << "job " << job.id << ": " << getJobStateName(job.state)
         << " (attempts " << job.attempts << "/" << job.maxAttempts << ")\n";
    }
    for (const auto& entry: phases) {
      os << "build " << entry.getKey() << ": "
         << getBuildPhaseName(entry.getValue()) << "\n";
    }
  }
};

}

std::unique_ptr<BuildStore> core::createInMemoryBuildStore() {
  return std::unique_ptr<BuildStore>(new InMemoryBuildStore());
}
