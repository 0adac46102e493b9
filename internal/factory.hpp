#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/engine/node_dispatcher.hpp"
#include "internal/engine/run_engine.hpp"
#include "internal/store/run_store.hpp"
#include "internal/tags/tag_indexer.hpp"

namespace wfrun::factory {

/*
  Runtime

  Owns every long-lived component of the engine.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<store::RunStore>   store;
  std::shared_ptr<tags::TagIndexer>  tags;
  std::shared_ptr<engine::RunEngine> engine;
};

/*
  BuildRuntime

  Constructs the backend selected by config and applies its schema.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime BuildRuntime(const wfrun::runtime::config::RuntimeConfig& config, std::shared_ptr<engine::NodeDispatcher> dispatcher = nullptr);

} // namespace wfrun::factory
