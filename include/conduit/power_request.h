/**
 * @file power_request.h
 * @brief Prioritized request for power from a sink
 *
 * Requests are created fresh for every query and never stored. Higher
 * priority is served first. A request with no positive amount means "no
 * demand" and is dropped before results are returned.
 */

#ifndef CONDUIT_POWER_REQUEST_H
#define CONDUIT_POWER_REQUEST_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Priorities
 *============================================================================*/

#define CONDUIT_PRIORITY_BACKUP   (-10)  /* Storage that only fills from surplus */
#define CONDUIT_PRIORITY_LOWEST   0
#define CONDUIT_PRIORITY_LOW      25
#define CONDUIT_PRIORITY_MEDIUM   50
#define CONDUIT_PRIORITY_HIGH     75
#define CONDUIT_PRIORITY_HIGHEST  100

/**
 * @brief A sink's request for power
 */
typedef struct Conduit_PowerRequest {
    int32_t priority;       /**< Higher values are served first */
    float amount;           /**< Requested amount (> 0 for real requests) */
    void *target;           /**< Requesting host entity */
    bool external;          /**< Synthesized for a third-party block */
} Conduit_PowerRequest;

/**
 * @brief Build a request
 *
 * Negative amounts are clamped to 0.
 */
Conduit_PowerRequest conduit_power_request_make(int32_t priority, float amount, void *target);

/**
 * @brief The "request nothing" sentinel
 */
Conduit_PowerRequest conduit_power_request_nothing(void);

/**
 * @brief Check whether a request carries no demand
 *
 * @return true for the sentinel and for any request with amount <= 0
 */
bool conduit_power_request_is_nothing(const Conduit_PowerRequest *request);

/**
 * @brief qsort-style comparator, highest priority first
 *
 * @return <0 if a sorts before b, >0 if after, 0 on equal priority
 */
int conduit_power_request_compare(const Conduit_PowerRequest *a, const Conduit_PowerRequest *b);

/**
 * @brief Stable sort by descending priority
 *
 * Requests of equal priority keep their relative order.
 */
void conduit_power_request_sort(Conduit_PowerRequest *requests, int count);

/**
 * @brief Sum of amounts over an array
 */
float conduit_power_request_total(const Conduit_PowerRequest *requests, int count);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_POWER_REQUEST_H */
