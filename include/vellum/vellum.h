#ifndef VELLUM_VELLUM_H
#define VELLUM_VELLUM_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum vellum_status {
  VELLUM_OK = 0,
  VELLUM_ERR_INVALID_ARGUMENT = 1,
  VELLUM_ERR_TEMPLATE_NOT_FOUND = 2,
  VELLUM_ERR_CHILD_NOT_FOUND = 3,
  VELLUM_ERR_INVALID_SECTION = 4,
  VELLUM_ERR_PARSE_FAILED = 5,
  VELLUM_ERR_EVALUATION = 6,
  VELLUM_ERR_STACK_UNDERFLOW = 7,
  VELLUM_ERR_DEPTH_EXCEEDED = 8,
  VELLUM_ERR_BACKEND = 9
} vellum_status;

// Rendering kinds as seen across the C boundary.
#define VELLUM_RENDERING_TEMPLATE 1u
#define VELLUM_RENDERING_PARTIAL 2u
#define VELLUM_RENDERING_LAYOUT 3u

const char * vellum_status_name(int32_t status);

#ifdef __cplusplus
}
#endif

#endif  // VELLUM_VELLUM_H
