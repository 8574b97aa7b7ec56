#pragma once

#include "ClassificationService.hpp"
#include "Config.hpp"
#include "ModelLoader.hpp"

namespace tl
{
ModelSource model_source_from(const AppConfig &config);

// Serves `service` on the configured transport. Returns kWorkerBootFailure
// when the listener cannot be set up and EXIT_FAILURE when it fails later,
// so the supervisor replaces the worker instead of halting.
int serve(const AppConfig &config, const ClassificationService &service);

// Body of one worker: load the model, then serve on the configured transport
// until the process is terminated. Returns kWorkerBootFailure when the model
// or the listener could not be set up.
int run_worker(const AppConfig &config);
} // namespace tl
