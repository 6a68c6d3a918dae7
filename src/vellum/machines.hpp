#pragma once

#include "vellum/view/partial/sm.hpp"
#include "vellum/view/render/sm.hpp"
#include "vellum/view/resolver/sm.hpp"
#include "vellum/view/section/sm.hpp"

namespace vellum {

using PartialRenderer = vellum::view::partial::sm;
using Renderer = vellum::view::render::sm;
using SectionRenderer = vellum::view::section::sm;
using TemplateResolver = vellum::view::resolver::sm;

}  // namespace vellum
