/**
 * @file stevedore_operation_c.cpp
 * @brief Implementation of operations C API
 */

#include "stevedore/stevedore_operation.h"
#include "stevedore_c_support.h"
#include "Logging/CLogger.h"
#include "Operations/CopyFile.h"
#include "Operations/CopyTree.h"
#include "Operations/CreateDirectory.h"
#include "Operations/Delete.h"
#include "Operations/DeleteTree.h"
#include "Operations/Move.h"
#include "Operations/TransferTree.h"

using namespace Stevedore::Core;
using namespace Stevedore::Core::Operations;
using Stevedore::Core::CApi::translate_exception;

namespace {

bool validPolicy(const StevedorePolicy* policy) {
    if (!policy) return true;
    return policy->source <= STEVEDORE_SRC_SKIP && policy->destination <= STEVEDORE_DST_OVERWRITE &&
           policy->estimate <= STEVEDORE_ESTIMATE_RE_ESTIMATE_ON_RUN && policy->rollback <= STEVEDORE_ROLLBACK_NEVER;
}

// Shared argument checks and wrapping for every constructor below
template <typename Factory>
stevedore_Operation createOperation(stevedore_OperationSession session, const StevedorePolicy* policy,
                                    bool argumentsValid, StevedoreStatus* status, Factory&& factory) {
    if (!status) return nullptr;
    if (!session || !argumentsValid || !validPolicy(policy)) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        std::shared_ptr<Operation> op = factory(session->session, CApi::to_cpp_policy(policy));
        auto* wrapper = new stevedore_Operation_t{std::move(op)};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

} // anonymous namespace

extern "C" {

stevedore_Operation stevedore_create_directory_create(stevedore_OperationSession session, stevedore_Backend backend,
                                                      const char* path, const StevedorePolicy* policy,
                                                      StevedoreStatus* status) {
    return createOperation(session, policy, backend && path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<CreateDirectory>(s, backend->backend, path, p);
        });
}

stevedore_Operation stevedore_delete_create(stevedore_OperationSession session, stevedore_Backend backend,
                                            const char* path, StevedoreBool recursive, const StevedorePolicy* policy,
                                            StevedoreStatus* status) {
    return createOperation(session, policy, backend && path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<Delete>(s, backend->backend, path, recursive != STEVEDORE_FALSE, p);
        });
}

stevedore_Operation stevedore_move_create(stevedore_OperationSession session, stevedore_Backend src_backend,
                                          const char* src_path, stevedore_Backend dst_backend, const char* dst_path,
                                          const StevedorePolicy* policy, StevedoreStatus* status) {
    return createOperation(session, policy, src_backend && src_path && dst_backend && dst_path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<Move>(s, src_backend->backend, src_path, dst_backend->backend, dst_path, p);
        });
}

stevedore_Operation stevedore_copy_file_create(stevedore_OperationSession session, stevedore_Backend src_backend,
                                               const char* src_path, stevedore_Backend dst_backend,
                                               const char* dst_path, const StevedorePolicy* policy,
                                               StevedoreStatus* status) {
    return createOperation(session, policy, src_backend && src_path && dst_backend && dst_path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<CopyFile>(s, src_backend->backend, src_path, dst_backend->backend, dst_path, p);
        });
}

stevedore_Operation stevedore_copy_tree_create(stevedore_OperationSession session, stevedore_Backend src_backend,
                                               const char* src_path, stevedore_Backend dst_backend,
                                               const char* dst_path, const StevedorePolicy* policy,
                                               StevedoreStatus* status) {
    return createOperation(session, policy, src_backend && src_path && dst_backend && dst_path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<CopyTree>(s, src_backend->backend, src_path, dst_backend->backend, dst_path, p);
        });
}

stevedore_Operation stevedore_delete_tree_create(stevedore_OperationSession session, stevedore_Backend backend,
                                                 const char* path, const StevedorePolicy* policy,
                                                 StevedoreStatus* status) {
    return createOperation(session, policy, backend && path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<DeleteTree>(s, backend->backend, path, p);
        });
}

stevedore_Operation stevedore_transfer_tree_create(stevedore_OperationSession session, stevedore_Backend src_backend,
                                                   const char* src_path, stevedore_Backend dst_backend,
                                                   const char* dst_path, const StevedorePolicy* policy,
                                                   StevedoreStatus* status) {
    return createOperation(session, policy, src_backend && src_path && dst_backend && dst_path, status,
        [&](const std::shared_ptr<OperationSession>& s, OperationPolicy p) {
            return std::make_shared<TransferTree>(s, src_backend->backend, src_path, dst_backend->backend,
                                                  dst_path, p);
        });
}

void stevedore_operation_destroy(stevedore_Operation op) {
    delete op;
}

void stevedore_operation_estimate(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }
    try {
        op->op->estimate();
        *status = STEVEDORE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void stevedore_operation_run(stevedore_Operation op, StevedoreBool rollback_on_error, StevedoreStatus* status) {
    if (!status) return;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }
    try {
        op->op->run(rollback_on_error != STEVEDORE_FALSE);
        *status = STEVEDORE_OK;
    } catch (...) {
        translate_exception(status);
        STEVEDORE_LOG_DEBUG_CAT_F("CApi", "%s ended with %s", op->op->toString().c_str(),
                                  stevedore_status_to_string(*status));
    }
}

stevedore_Operation stevedore_operation_create_rollback(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return nullptr;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        auto rollback = op->op->createRollback();
        *status = STEVEDORE_OK;
        if (!rollback) return nullptr;
        return new stevedore_Operation_t{std::move(rollback)};
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void stevedore_operation_assert_successful(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }
    try {
        op->op->assertSuccessful();
        *status = STEVEDORE_OK;
    } catch (const AggregateException& e) {
        // Report the underlying failure rather than the wrapper
        try {
            e.rethrowFirst();
            *status = STEVEDORE_ERR_AGGREGATE;
        } catch (...) {
            translate_exception(status);
        }
    } catch (...) {
        translate_exception(status);
    }
}

StevedoreOperationState stevedore_operation_state(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return STEVEDORE_OP_ERROR;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return STEVEDORE_OP_ERROR;
    }
    *status = STEVEDORE_OK;
    return static_cast<StevedoreOperationState>(op->op->state());
}

int64_t stevedore_operation_progress(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return -1;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return -1;
    }
    *status = STEVEDORE_OK;
    return op->op->progress();
}

int64_t stevedore_operation_total_length(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return -1;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return -1;
    }
    *status = STEVEDORE_OK;
    return op->op->totalLength();
}

StevedoreBool stevedore_operation_can_rollback(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return STEVEDORE_FALSE;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return STEVEDORE_FALSE;
    }
    *status = STEVEDORE_OK;
    return CApi::to_c_bool(op->op->canRollback());
}

size_t stevedore_operation_child_count(stevedore_Operation op, StevedoreStatus* status) {
    if (!status) return 0;
    if (!op) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return 0;
    }
    try {
        *status = STEVEDORE_OK;
        return op->op->children().size();
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

const char* stevedore_operation_state_to_string(StevedoreOperationState state) {
    if (state < STEVEDORE_OP_INITIALIZED || state > STEVEDORE_OP_ERROR) return "Unknown";
    return Operations::toString(static_cast<OperationState>(state));
}

} // extern "C"
