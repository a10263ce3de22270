#ifndef EXECUTOR_OPTIONS_HPP
#define EXECUTOR_OPTIONS_HPP

#include <kj/main.h>

#include "executor/executor.hpp"

namespace executor {

// Adds the options shared by every command that executes code.
kj::MainBuilder& AddExecutionOptions(kj::MainBuilder& builder);  // NOLINT

// Resolves the interpreter, creates the workspace directory and builds the
// configuration. Returns an error message if any of this fails.
kj::MainBuilder::Validity LoadConfig(kj::Maybe<Config>* config);

}  // namespace executor

#endif
