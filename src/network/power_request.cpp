/**
 * @file power_request.cpp
 * @brief Power request ordering
 */

#include "conduit/power_request.h"

#include <algorithm>

Conduit_PowerRequest conduit_power_request_make(int32_t priority, float amount, void *target) {
    Conduit_PowerRequest req;
    req.priority = priority;
    req.amount = amount > 0.0f ? amount : 0.0f;
    req.target = target;
    req.external = false;
    return req;
}

Conduit_PowerRequest conduit_power_request_nothing(void) {
    return conduit_power_request_make(CONDUIT_PRIORITY_LOWEST, 0.0f, nullptr);
}

bool conduit_power_request_is_nothing(const Conduit_PowerRequest *request) {
    if (!request) return true;
    return !(request->amount > 0.0f);
}

int conduit_power_request_compare(const Conduit_PowerRequest *a, const Conduit_PowerRequest *b) {
    if (a->priority > b->priority) return -1;
    if (a->priority < b->priority) return 1;
    return 0;
}

void conduit_power_request_sort(Conduit_PowerRequest *requests, int count) {
    if (!requests || count < 2) return;

    std::stable_sort(requests, requests + count,
                     [](const Conduit_PowerRequest &a, const Conduit_PowerRequest &b) {
                         return conduit_power_request_compare(&a, &b) < 0;
                     });
}

float conduit_power_request_total(const Conduit_PowerRequest *requests, int count) {
    if (!requests) return 0.0f;

    float total = 0.0f;
    for (int i = 0; i < count; i++) {
        total += requests[i].amount;
    }
    return total;
}
