#include "vellum/vellum.h"

extern "C" const char * vellum_status_name(const int32_t status) {
  switch (status) {
    case VELLUM_OK:
      return "ok";
    case VELLUM_ERR_INVALID_ARGUMENT:
      return "invalid argument";
    case VELLUM_ERR_TEMPLATE_NOT_FOUND:
      return "template not found";
    case VELLUM_ERR_CHILD_NOT_FOUND:
      return "child not found";
    case VELLUM_ERR_INVALID_SECTION:
      return "invalid section";
    case VELLUM_ERR_PARSE_FAILED:
      return "parse failed";
    case VELLUM_ERR_EVALUATION:
      return "evaluation failed";
    case VELLUM_ERR_STACK_UNDERFLOW:
      return "rendering stack underflow";
    case VELLUM_ERR_DEPTH_EXCEEDED:
      return "rendering depth exceeded";
    case VELLUM_ERR_BACKEND:
      return "backend error";
    default:
      return "unknown status";
  }
}
