#ifndef HELM_HELM_H
#define HELM_HELM_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum helm_status {
  HELM_OK = 0,
  HELM_ERR_INVALID_ARGUMENT = 1,
  HELM_ERR_INVALID_TRANSITION = 2,
  HELM_ERR_GUARD_REJECTED = 3,
  HELM_ERR_SUPERSEDED = 4,
  HELM_ERR_BUSY = 5,
  HELM_ERR_TIMEOUT = 6,
  HELM_ERR_PAUSED = 7,
  HELM_ERR_ACTION_FAILED = 8,
  HELM_ERR_QUEUE_FULL = 9,
  HELM_ERR_UNAVAILABLE = 10,
  HELM_ERR_BACKEND = 11
} helm_status;

// Component ids carried by telemetry records.
#define HELM_COMPONENT_NONE 0u
#define HELM_COMPONENT_BOT 1u
#define HELM_COMPONENT_RECOVERY 2u
#define HELM_COMPONENT_HEALTH 3u
#define HELM_COMPONENT_LOOP 4u

// Record event ids.
#define HELM_RECORD_TRANSITION 1u
#define HELM_RECORD_REJECTION 2u
#define HELM_RECORD_ERROR_EVENT 3u
#define HELM_RECORD_ESCALATION 4u
#define HELM_RECORD_ALERT 5u
#define HELM_RECORD_DROPPED 6u
#define HELM_RECORD_CHICKEN 7u
#define HELM_RECORD_POTION 8u
#define HELM_RECORD_RUN_FINISHED 9u
#define HELM_RECORD_SUPERSEDED_EVENT 10u

static inline const char * helm_status_name(int32_t status) {
  switch (status) {
    case HELM_OK:
      return "ok";
    case HELM_ERR_INVALID_ARGUMENT:
      return "invalid_argument";
    case HELM_ERR_INVALID_TRANSITION:
      return "invalid_transition";
    case HELM_ERR_GUARD_REJECTED:
      return "guard_rejected";
    case HELM_ERR_SUPERSEDED:
      return "superseded";
    case HELM_ERR_BUSY:
      return "busy";
    case HELM_ERR_TIMEOUT:
      return "timeout";
    case HELM_ERR_PAUSED:
      return "paused";
    case HELM_ERR_ACTION_FAILED:
      return "action_failed";
    case HELM_ERR_QUEUE_FULL:
      return "queue_full";
    case HELM_ERR_UNAVAILABLE:
      return "unavailable";
    case HELM_ERR_BACKEND:
      return "backend";
    default:
      return "unknown";
  }
}

#ifdef __cplusplus
}
#endif

#endif  // HELM_HELM_H
