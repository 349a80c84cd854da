#pragma once

#include <string>
#include <vector>
#include "language.hpp"
#include "process.hpp"
#include "result.hpp"
#include "sandbox.hpp"

namespace runbox {

// Write the source, compile it if the language needs it, then run it.
// Every stage gets a fresh timeout_ms.
class Pipeline {
  public:
    Pipeline(const ProcessRunner& runner, const SandboxPrefix& sandbox, long timeout_ms);

    JobResult run(const LanguageSpec& spec, const std::string& workspace,
        const std::string& code, const std::string& stdin_data) const;

    // command template => argv, placeholders replaced, sandbox prefix applied
    CommandLine build_command(const std::vector<std::string>& cmd, const LanguageSpec& spec,
        const std::string& workspace) const;

  private:
    // returns false and sets result if compilation failed
    bool compile(const LanguageSpec& spec, const std::string& workspace, JobResult& result) const;
    JobResult execute(const LanguageSpec& spec, const std::string& workspace, const std::string& stdin_data) const;

    const ProcessRunner& runner_;
    const SandboxPrefix& sandbox_;
    long timeout_ms_;
};

}
