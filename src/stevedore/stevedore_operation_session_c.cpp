/**
 * @file stevedore_operation_session_c.cpp
 * @brief Implementation of OperationSession C API and policy conversion
 */

#include "stevedore/stevedore_operation_session.h"
#include "stevedore_c_support.h"

using namespace Stevedore::Core;
using namespace Stevedore::Core::Operations;
using Stevedore::Core::CApi::translate_exception;

namespace Stevedore::Core::CApi {

OperationPolicy to_cpp_policy(const StevedorePolicy* policy) {
    OperationPolicy p;
    if (!policy) return p;
    p.source = static_cast<SourcePolicy>(policy->source);
    p.destination = static_cast<DestinationPolicy>(policy->destination);
    p.estimate = static_cast<EstimatePolicy>(policy->estimate);
    p.rollback = static_cast<RollbackPolicy>(policy->rollback);
    p.cancelOnError = policy->cancel_on_error != STEVEDORE_FALSE;
    p.omitMountedPackages = policy->omit_mounted_packages != STEVEDORE_FALSE;
    p.batchContinueOnError = policy->batch_continue_on_error != STEVEDORE_FALSE;
    p.suppressExceptions = policy->suppress_exceptions != STEVEDORE_FALSE;
    p.logEvents = policy->log_events != STEVEDORE_FALSE;
    p.dispatchEvents = policy->dispatch_events != STEVEDORE_FALSE;
    return p;
}

void to_c_policy(const OperationPolicy& policy, StevedorePolicy* out) {
    out->source = static_cast<StevedoreSourcePolicy>(policy.source);
    out->destination = static_cast<StevedoreDestinationPolicy>(policy.destination);
    out->estimate = static_cast<StevedoreEstimatePolicy>(policy.estimate);
    out->rollback = static_cast<StevedoreRollbackPolicy>(policy.rollback);
    out->cancel_on_error = to_c_bool(policy.cancelOnError);
    out->omit_mounted_packages = to_c_bool(policy.omitMountedPackages);
    out->batch_continue_on_error = to_c_bool(policy.batchContinueOnError);
    out->suppress_exceptions = to_c_bool(policy.suppressExceptions);
    out->log_events = to_c_bool(policy.logEvents);
    out->dispatch_events = to_c_bool(policy.dispatchEvents);
}

} // namespace Stevedore::Core::CApi

extern "C" {

void stevedore_policy_defaults(StevedorePolicy* policy) {
    if (!policy) return;
    CApi::to_c_policy(OperationPolicy::defaults(), policy);
}

stevedore_OperationSession stevedore_operation_session_create(const StevedorePolicy* policy, stevedore_BlockPool pool,
                                                              int64_t progress_interval, StevedoreStatus* status) {
    if (!status) return nullptr;
    if (policy && (policy->source > STEVEDORE_SRC_SKIP || policy->destination > STEVEDORE_DST_OVERWRITE ||
                   policy->estimate > STEVEDORE_ESTIMATE_RE_ESTIMATE_ON_RUN ||
                   policy->rollback > STEVEDORE_ROLLBACK_NEVER)) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        OperationSession::Config cfg;
        if (policy) cfg.defaultPolicy = CApi::to_cpp_policy(policy);
        if (progress_interval >= 0) cfg.progressInterval = progress_interval;

        auto session = std::make_shared<OperationSession>(cfg, pool ? pool->pool : nullptr);
        auto* wrapper = new stevedore_OperationSession_t{std::move(session)};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void stevedore_operation_session_destroy(stevedore_OperationSession session) {
    delete session;
}

void stevedore_operation_session_cancel(stevedore_OperationSession session, StevedoreStatus* status) {
    if (!status) return;
    if (!session) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }
    session->session->cancel();
    *status = STEVEDORE_OK;
}

StevedoreBool stevedore_operation_session_is_cancelled(stevedore_OperationSession session, StevedoreStatus* status) {
    if (!status) return STEVEDORE_FALSE;
    if (!session) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return STEVEDORE_FALSE;
    }
    *status = STEVEDORE_OK;
    return CApi::to_c_bool(session->session->isCancellationRequested());
}

size_t stevedore_operation_session_event_count(stevedore_OperationSession session, StevedoreStatus* status) {
    if (!status) return 0;
    if (!session) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return 0;
    }
    try {
        *status = STEVEDORE_OK;
        return session->session->eventCount();
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

} // extern "C"
