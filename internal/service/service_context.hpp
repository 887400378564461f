#pragma once

#include <memory>

namespace offsync::engine { class SyncEngine; }

namespace offsync::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<offsync::engine::SyncEngine> engine;
};

}
