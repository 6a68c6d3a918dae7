#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "vellum/vellum.h"
#include "vellum/view/node.hpp"
#include "vellum/view/types.hpp"

namespace vellum::view::resolver::event {
struct resolve;
}  // namespace vellum::view::resolver::event

namespace vellum::view::resolver::action {

struct context {
  template_paths * paths = nullptr;
  template_parser * parser = nullptr;

  std::map<resolution_key, std::shared_ptr<const node>> cache = {};

  const event::resolve * request = nullptr;
  resolution_key pending_key = {};
  std::string pending_identifier = {};
  std::string pending_source = {};
  parsed_source pending_parse = {};

  uint64_t cache_hits = 0;
  uint64_t parses = 0;

  int32_t phase_error = VELLUM_OK;
  int32_t last_error = VELLUM_OK;
};

}  // namespace vellum::view::resolver::action
